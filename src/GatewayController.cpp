#include "GatewayController.h"

#include "PersistentConfig.h"
#include <algorithm>
#include <cstring>
#include <utility>
#include <variant>

namespace silverbp {

namespace {

constexpr size_t kMaxReadings = 5;
constexpr size_t kMaxErrors = 8;

void copyString(const std::string& source, char* dest, size_t capacity) {
    if (capacity == 0) {
        return;
    }
    std::memset(dest, 0, capacity);
    std::strncpy(dest, source.c_str(), capacity - 1);
}

silverbp_gateway_SensorKind toProto(SensorKey key) {
    switch (key) {
        case SensorKey::Systolic:
            return silverbp_gateway_SensorKind_SENSOR_KIND_SYSTOLIC;
        case SensorKey::Diastolic:
            return silverbp_gateway_SensorKind_SENSOR_KIND_DIASTOLIC;
        case SensorKey::Pulse:
            return silverbp_gateway_SensorKind_SENSOR_KIND_PULSE;
        case SensorKey::SignalStrength:
            return silverbp_gateway_SensorKind_SENSOR_KIND_SIGNAL_STRENGTH;
        case SensorKey::Timestamp:
            return silverbp_gateway_SensorKind_SENSOR_KIND_TIMESTAMP;
    }
    return silverbp_gateway_SensorKind_SENSOR_KIND_SYSTOLIC;
}

silverbp_gateway_SessionErrorKind toProto(SessionError error) {
    switch (error) {
        case SessionError::ConnectionError:
            return silverbp_gateway_SessionErrorKind_SESSION_ERROR_CONNECTION;
        case SessionError::SubscriptionError:
            return silverbp_gateway_SessionErrorKind_SESSION_ERROR_SUBSCRIPTION;
        case SessionError::MalformedPayload:
            return silverbp_gateway_SessionErrorKind_SESSION_ERROR_MALFORMED_PAYLOAD;
        case SessionError::InvalidTimestamp:
            return silverbp_gateway_SessionErrorKind_SESSION_ERROR_INVALID_TIMESTAMP;
        case SessionError::NotificationTimeout:
            return silverbp_gateway_SessionErrorKind_SESSION_ERROR_NOTIFICATION_TIMEOUT;
        case SessionError::TeardownError:
            return silverbp_gateway_SessionErrorKind_SESSION_ERROR_TEARDOWN;
    }
    return silverbp_gateway_SessionErrorKind_SESSION_ERROR_CONNECTION;
}

void populateReading(const SensorReading& source, silverbp_gateway_SensorReading& target) {
    target.kind = toProto(source.key);
    copyString(source.unit, target.unit, sizeof(target.unit));
    copyString(source.name, target.name, sizeof(target.name));

    if (const auto* stamp = std::get_if<LocalDateTime>(&source.value)) {
        target.which_value = silverbp_gateway_SensorReading_timestamp_value_tag;
        auto& out = target.value.timestamp_value;
        out.year = stamp->year;
        out.month = stamp->month;
        out.day = stamp->day;
        out.hour = stamp->hour;
        out.minute = stamp->minute;
        out.utc_offset_s = stamp->utcOffsetSeconds;
    } else if (const auto* number = std::get_if<int32_t>(&source.value)) {
        target.which_value = silverbp_gateway_SensorReading_int_value_tag;
        target.value.int_value = *number;
    }
}

}  // namespace

GatewayController::GatewayController(const GatewayConfig& config, Transport& transport, system::LogSink logSink, SendCallback sendFn)
    : defaults_(config),
      config_(config),
      transport_(transport),
      log_(std::move(logSink), "GATEWAY"),
      send_(std::move(sendFn)) {
    PersistentSettings stored;
    if (loadPersistentSettings(stored)) {
        if (stored.hasPollIntervalMs) {
            config_.pollIntervalMs = stored.pollIntervalMs;
        }
        if (stored.hasTargetAddress) {
            config_.targetAddress = stored.targetAddress;
        }
        log_.info("Loaded persistent settings: interval=%lu ms, target=%s",
                  static_cast<unsigned long>(config_.pollIntervalMs),
                  config_.targetAddress.empty() ? "<any>" : config_.targetAddress.c_str());
    }
}

GatewayController::DeviceState& GatewayController::stateForLocked(const std::string& key, uint64_t nowMs) {
    auto it = devices_.find(key);
    if (it != devices_.end()) {
        return it->second;
    }

    if (devices_.size() >= kMaxTrackedDevices) {
        auto oldest = devices_.end();
        for (auto candidate = devices_.begin(); candidate != devices_.end(); ++candidate) {
            if (candidate->second.sessionActive) {
                continue;
            }
            if (oldest == devices_.end() ||
                elapsedMs(candidate->second.lastSeenMs, nowMs) > elapsedMs(oldest->second.lastSeenMs, nowMs)) {
                oldest = candidate;
            }
        }
        if (oldest != devices_.end()) {
            log_.debug("Device table full; forgetting %s", oldest->first.c_str());
            devices_.erase(oldest);
        }
    }

    it = devices_.emplace(key, DeviceState(config_.pollIntervalMs)).first;
    it->second.lastSeenMs = nowMs;
    return it->second;
}

void GatewayController::pruneLocked(uint64_t nowMs) {
    const uint64_t maxSilenceMs = kForgetAfterIntervals * config_.pollIntervalMs;
    for (auto it = devices_.begin(); it != devices_.end();) {
        const DeviceState& state = it->second;
        if (!state.sessionActive && !state.pollRequested && elapsedMs(state.lastSeenMs, nowMs) > maxSilenceMs) {
            log_.debug("Forgetting %s; not heard for %llu ms", it->first.c_str(),
                       static_cast<unsigned long long>(elapsedMs(state.lastSeenMs, nowMs)));
            it = devices_.erase(it);
        } else {
            ++it;
        }
    }
}

bool GatewayController::accepts(const AdvertisementContext& context) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!config_.targetAddress.empty()) {
        return normalizeAddress(context.address) == normalizeAddress(config_.targetAddress);
    }
    if (config_.namePrefix.empty()) {
        return true;
    }
    return context.name.compare(0, config_.namePrefix.size(), config_.namePrefix) == 0;
}

bool GatewayController::handleAdvertisement(const AdvertisementContext& context, uint64_t nowMs) {
    if (!accepts(context)) {
        return false;
    }

    const std::string key = normalizeAddress(context.address);
    SessionRequest request;
    SessionConfig sessionConfig;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pruneLocked(nowMs);
        DeviceState& state = stateForLocked(key, nowMs);
        state.listener.onAdvertisement(context);
        state.lastSeenMs = nowMs;

        if (state.sessionActive) {
            log_.debug("Session already running for %s; metadata refreshed only", key.c_str());
            return false;
        }
        if (!state.pollRequested && !state.listener.isPollDue(state.lastPollMs, nowMs)) {
            return false;
        }

        state.sessionActive = true;
        state.pollRequested = false;
        request.address = context.address;
        request.device = state.listener.device();
        request.rssi = state.listener.lastRssi();

        sessionConfig.characteristicId = config_.characteristicId;
        sessionConfig.notificationTimeoutMs = config_.notificationTimeoutMs;
        sessionConfig.utcOffsetSeconds = config_.utcOffsetSeconds;
    }

    log_.info("Polling %s (%s)", key.c_str(), request.device.name.c_str());
    notifyStatus("polling", nowMs);

    AcquisitionSession session(transport_, sessionConfig, log_.withTag("SESSION"));
    AcquisitionOutcome outcome = session.run(request);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        DeviceState& state = stateForLocked(key, nowMs);
        state.sessionActive = false;
        state.lastPollMs = nowMs;
        lastOutcome_ = outcome;
        ++sessionsRun_;
    }

    if (!outcome.measurementReceived) {
        log_.warn("Poll of %s finished without a measurement (%u errors)",
                  key.c_str(), static_cast<unsigned>(outcome.errors.size()));
    }

    publishOutcome(outcome, nowMs);
    notifyStatus("pollComplete", nowMs);
    return true;
}

void GatewayController::requestPoll(const std::string& address, uint64_t nowMs) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string key = normalizeAddress(address.empty() ? config_.targetAddress : address);
        if (key.empty()) {
            for (auto& entry : devices_) {
                entry.second.pollRequested = true;
            }
        } else {
            stateForLocked(key, nowMs).pollRequested = true;
        }
    }
    notifyStatus("pollRequested", nowMs);
}

bool GatewayController::setPollInterval(uint32_t intervalMs, uint64_t nowMs) {
    if (intervalMs < BP_POLL_INTERVAL_MIN_MS || intervalMs > BP_POLL_INTERVAL_MAX_MS) {
        log_.warn("Rejected poll interval %lu ms", static_cast<unsigned long>(intervalMs));
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.pollIntervalMs = intervalMs;
        for (auto& entry : devices_) {
            entry.second.listener.setPollInterval(intervalMs);
        }
    }
    storePollIntervalMs(intervalMs);
    notifyStatus("intervalUpdated", nowMs);
    return true;
}

void GatewayController::setTargetAddress(const std::string& address, uint64_t nowMs) {
    const std::string normalized = normalizeAddress(address);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.targetAddress = normalized;
    }
    storeTargetAddress(normalized);
    notifyStatus("targetUpdated", nowMs);
}

void GatewayController::factoryReset(uint64_t nowMs) {
    clearPersistentSettings();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = defaults_;
        devices_.clear();
        lastOutcome_.reset();
    }
    notifyStatus("settingsCleared", nowMs);
}

void GatewayController::handleCommand(const silverbp_gateway_GatewayCommand& cmd, uint64_t nowMs) {
    switch (cmd.which_command) {
        case silverbp_gateway_GatewayCommand_set_poll_interval_tag:
            setPollInterval(cmd.command.set_poll_interval.interval_ms, nowMs);
            break;
        case silverbp_gateway_GatewayCommand_set_target_address_tag:
            setTargetAddress(cmd.command.set_target_address.address, nowMs);
            break;
        case silverbp_gateway_GatewayCommand_poll_now_tag:
            requestPoll(cmd.command.poll_now.address, nowMs);
            break;
        case silverbp_gateway_GatewayCommand_factory_reset_tag:
            if (cmd.command.factory_reset.confirm) {
                factoryReset(nowMs);
            } else {
                notifyStatus("factoryResetCancel", nowMs);
            }
            break;
        default:
            log_.warn("Unknown command tag %u", static_cast<unsigned>(cmd.which_command));
            break;
    }
}

void GatewayController::sendBoot(const char* firmwareVersion, uint64_t nowMs) {
    if (!send_) {
        return;
    }

    silverbp_gateway_DeviceEvent evt = silverbp_gateway_DeviceEvent_init_default;
    evt.timestamp_ms = nowMs;
    evt.which_event = silverbp_gateway_DeviceEvent_boot_tag;

    auto& boot = evt.event.boot;
    copyString(firmwareVersion ? firmwareVersion : "", boot.firmware_version, sizeof(boot.firmware_version));
    boot.poll_interval_ms = pollIntervalMs();
    copyString(targetAddress(), boot.target_address, sizeof(boot.target_address));

    send_(evt);
}

uint32_t GatewayController::pollIntervalMs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.pollIntervalMs;
}

std::string GatewayController::targetAddress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.targetAddress;
}

bool GatewayController::sessionActive(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(normalizeAddress(address));
    return it != devices_.end() && it->second.sessionActive;
}

std::optional<uint64_t> GatewayController::lastPollMs(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(normalizeAddress(address));
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second.lastPollMs;
}

std::optional<DeviceInfo> GatewayController::device(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(normalizeAddress(address));
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second.listener.device();
}

std::optional<AcquisitionOutcome> GatewayController::lastOutcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastOutcome_;
}

uint32_t GatewayController::sessionsRun() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessionsRun_;
}

size_t GatewayController::trackedDeviceCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

void GatewayController::publishOutcome(const AcquisitionOutcome& outcome, uint64_t nowMs) {
    if (!send_) {
        return;
    }

    silverbp_gateway_DeviceEvent evt = silverbp_gateway_DeviceEvent_init_default;
    evt.timestamp_ms = nowMs;
    evt.which_event = silverbp_gateway_DeviceEvent_reading_tag;

    auto& reading = evt.event.reading;
    copyString(normalizeAddress(outcome.address), reading.address, sizeof(reading.address));
    copyString(outcome.device.name, reading.device_name, sizeof(reading.device_name));
    copyString(outcome.device.manufacturer, reading.manufacturer, sizeof(reading.manufacturer));
    copyString(outcome.device.model, reading.model, sizeof(reading.model));
    reading.measurement_received = outcome.measurementReceived;

    reading.readings_count = static_cast<pb_size_t>(std::min(outcome.readings.size(), kMaxReadings));
    for (pb_size_t i = 0; i < reading.readings_count; ++i) {
        populateReading(outcome.readings[i], reading.readings[i]);
    }

    reading.errors_count = static_cast<pb_size_t>(std::min(outcome.errors.size(), kMaxErrors));
    for (pb_size_t i = 0; i < reading.errors_count; ++i) {
        reading.errors[i] = toProto(outcome.errors[i]);
    }

    send_(evt);
}

void GatewayController::notifyStatus(const std::string& status, uint64_t nowMs) {
    if (!send_) {
        return;
    }

    silverbp_gateway_DeviceEvent evt = silverbp_gateway_DeviceEvent_init_default;
    evt.timestamp_ms = nowMs;
    evt.which_event = silverbp_gateway_DeviceEvent_status_tag;

    auto& statusMsg = evt.event.status;
    copyString(status, statusMsg.status_label, sizeof(statusMsg.status_label));
    statusMsg.poll_interval_ms = pollIntervalMs();
    copyString(targetAddress(), statusMsg.target_address, sizeof(statusMsg.target_address));

    send_(evt);
}

}  // namespace silverbp
