#include "AcquisitionSession.h"

#include "PayloadDecoder.h"
#include "system/CompletionSignal.h"
#include <algorithm>
#include <cstdio>
#include <mutex>
#include <utility>

namespace silverbp {

namespace {

constexpr size_t kMaxDumpBytes = 20;

std::string hexDump(const uint8_t* data, size_t length) {
    std::string out;
    const size_t shown = std::min(length, kMaxDumpBytes);
    char byteBuf[4];
    for (size_t i = 0; i < shown; ++i) {
        std::snprintf(byteBuf, sizeof(byteBuf), "%02X", data[i]);
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += byteBuf;
    }
    if (shown < length) {
        out += " ..";
    }
    return out;
}

}  // namespace

const char* sessionStateLabel(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::Connecting: return "Connecting";
        case SessionState::Subscribed: return "Subscribed";
        case SessionState::AwaitingNotification: return "AwaitingNotification";
        case SessionState::Finalizing: return "Finalizing";
        case SessionState::Closed: return "Closed";
    }
    return "Unknown";
}

const char* sessionErrorLabel(SessionError error) {
    switch (error) {
        case SessionError::ConnectionError: return "connection-error";
        case SessionError::SubscriptionError: return "subscription-error";
        case SessionError::MalformedPayload: return "malformed-payload";
        case SessionError::InvalidTimestamp: return "invalid-timestamp";
        case SessionError::NotificationTimeout: return "notification-timeout";
        case SessionError::TeardownError: return "teardown-error";
    }
    return "unknown";
}

bool AcquisitionOutcome::hasError(SessionError error) const {
    return std::find(errors.begin(), errors.end(), error) != errors.end();
}

// State shared with the transport callback. Kept alive by the callback so a
// late notification after the session is gone lands in a closed inbox.
struct AcquisitionSession::Inbox {
    explicit Inbox(system::Logger logger, std::optional<int32_t> offset)
        : log(std::move(logger)), utcOffsetSeconds(offset) {}

    void accept(const uint8_t* data, size_t length) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed || consumed) {
                log.debug("Ignoring notification (%u bytes) after the first",
                          static_cast<unsigned>(length));
                return;
            }
            consumed = true;
            decodeLocked(data, length);
        }
        completion.set();
    }

    void decodeLocked(const uint8_t* data, size_t length) {
        if (data != nullptr) {
            log.debug("Raw data received from BLE device: %s", hexDump(data, length).c_str());
        }

        MeasurementRecord record;
        const int32_t offset = utcOffsetSeconds.has_value() ? *utcOffsetSeconds : hostUtcOffsetSeconds();
        DecodeStatus status = decodeMeasurement(data, length, offset, record);
        if (status != DecodeStatus::Ok) {
            errors.push_back(SessionError::MalformedPayload);
            log.error("Unexpected error while handling BLE notification: %s (%u bytes)",
                      decodeStatusLabel(status), static_cast<unsigned>(length));
            return;
        }

        if (record.timestampStatus == TimestampStatus::InvalidTimestamp) {
            errors.push_back(SessionError::InvalidTimestamp);
            log.error("Failed to parse and update Measured Date: %u/%u/%u %u:%02u",
                      static_cast<unsigned>(record.year), static_cast<unsigned>(record.month),
                      static_cast<unsigned>(record.day), static_cast<unsigned>(record.hour),
                      static_cast<unsigned>(record.minute));
        }

        log.info("Parsed data from BPM device (systolic: %u, diastolic: %u, pulse: %u)",
                 static_cast<unsigned>(record.systolic), static_cast<unsigned>(record.diastolic),
                 static_cast<unsigned>(record.pulse));
        sink.recordMeasurement(record);
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
    }

    system::Logger log;
    std::optional<int32_t> utcOffsetSeconds;
    mutable std::mutex mutex;
    system::CompletionSignal completion;
    MeasurementSink sink;
    std::vector<SessionError> errors;
    bool consumed = false;
    bool closed = false;
};

// Owns the connection handle for the duration of one run(). release() tears
// down at most once; the destructor covers any path that skipped it.
class AcquisitionSession::ConnectionGuard {
public:
    ConnectionGuard(Transport& transport, const std::string& characteristicId,
                    const system::Logger& log, std::vector<SessionError>& errors)
        : transport_(transport), characteristicId_(characteristicId), log_(log), errors_(errors) {}

    ~ConnectionGuard() { release(); }

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

    bool open(const std::string& address) {
        connected_ = transport_.connect(address, handle_);
        return connected_;
    }

    bool subscribe(Transport::NotifyCallback callback) {
        if (!connected_) {
            return false;
        }
        return transport_.subscribe(handle_, characteristicId_, std::move(callback));
    }

    void release() {
        if (!connected_) {
            return;
        }
        connected_ = false;

        if (!transport_.unsubscribe(handle_, characteristicId_)) {
            errors_.push_back(SessionError::TeardownError);
            log_.error("Failed to stop notification on BLE device");
        }
        if (!transport_.disconnect(handle_)) {
            errors_.push_back(SessionError::TeardownError);
            log_.error("Failed to disconnect from BLE device");
        }
        log_.debug("Disconnected from active Bluetooth client");
    }

private:
    Transport& transport_;
    const std::string& characteristicId_;
    const system::Logger& log_;
    std::vector<SessionError>& errors_;
    ConnectionHandle handle_;
    bool connected_ = false;
};

AcquisitionSession::AcquisitionSession(Transport& transport, const SessionConfig& config, system::Logger log)
    : transport_(transport),
      config_(config),
      log_(std::move(log)),
      inbox_(std::make_shared<Inbox>(log_, config.utcOffsetSeconds)) {
    history_.push_back(state_);
}

AcquisitionSession::~AcquisitionSession() {
    inbox_->close();
}

void AcquisitionSession::transition(SessionState next) {
    log_.debug("state %s -> %s", sessionStateLabel(state_), sessionStateLabel(next));
    state_ = next;
    history_.push_back(next);
}

void AcquisitionSession::handleNotification(const uint8_t* data, size_t length) {
    inbox_->accept(data, length);
}

std::vector<SensorReading> AcquisitionSession::readings() const {
    std::lock_guard<std::mutex> lock(inbox_->mutex);
    return inbox_->sink.snapshot();
}

AcquisitionOutcome AcquisitionSession::run(const SessionRequest& request) {
    AcquisitionOutcome outcome;
    outcome.address = request.address;
    outcome.device = request.device;

    if (state_ != SessionState::Idle) {
        log_.warn("Session for %s already used (state=%s)", request.address.c_str(), sessionStateLabel(state_));
        outcome.finalState = state_;
        return outcome;
    }

    if (request.rssi.has_value()) {
        std::lock_guard<std::mutex> lock(inbox_->mutex);
        inbox_->sink.recordSignalStrength(*request.rssi);
    }

    {
        ConnectionGuard guard(transport_, config_.characteristicId, log_, errors_);

        transition(SessionState::Connecting);
        log_.debug("Connecting to BLE device: %s", request.address.c_str());

        if (!guard.open(request.address)) {
            errors_.push_back(SessionError::ConnectionError);
            log_.error("Failed to connect to BLE device %s", request.address.c_str());
        } else {
            std::shared_ptr<Inbox> inbox = inbox_;
            bool subscribed = guard.subscribe([inbox](const uint8_t* data, size_t length) {
                inbox->accept(data, length);
            });
            if (subscribed) {
                transition(SessionState::Subscribed);
            } else {
                // Nothing can arrive now; the timeout decides the outcome.
                errors_.push_back(SessionError::SubscriptionError);
                log_.error("Failed to start notify on BLE device %s", request.address.c_str());
            }

            transition(SessionState::AwaitingNotification);
            if (!inbox_->completion.waitFor(config_.notificationTimeoutMs)) {
                errors_.push_back(SessionError::NotificationTimeout);
                log_.warn("Timeout while waiting for command data from BLE device.");
            }
        }

        inbox_->close();
        transition(SessionState::Finalizing);
        guard.release();
    }

    transition(SessionState::Closed);

    {
        std::lock_guard<std::mutex> lock(inbox_->mutex);
        outcome.readings = inbox_->sink.snapshot();
        outcome.measurementReceived = inbox_->sink.hasMeasurement();
        outcome.errors = inbox_->errors;
    }
    outcome.errors.insert(outcome.errors.end(), errors_.begin(), errors_.end());
    outcome.finalState = state_;
    return outcome;
}

}  // namespace silverbp
