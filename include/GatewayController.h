#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "AcquisitionSession.h"
#include "Config.h"
#include "PassiveListener.h"
#include "Transport.h"
#include "proto/gateway.pb.h"
#include "system/Log.h"

namespace silverbp {

struct GatewayConfig {
    uint32_t pollIntervalMs = BP_POLL_INTERVAL_MS;
    uint32_t notificationTimeoutMs = BP_NOTIFICATION_TIMEOUT_MS;
    std::string characteristicId = BP_CHARACTERISTIC_UUID;
    // Pinned cuff address; empty means "any advertiser matching namePrefix".
    std::string targetAddress;
    std::string namePrefix = BP_CUFF_NAME_PREFIX;
    std::optional<int32_t> utcOffsetSeconds;
};

/**
 * @brief Decides when to poll which cuff and publishes what the poll produced.
 *
 * One PassiveListener per advertiser address. At most one AcquisitionSession
 * per address is in flight; advertisements that arrive while it runs (from the
 * scan task, or re-entrantly from inside the session) only refresh metadata.
 *
 * Devices unheard for three poll intervals are forgotten, and at most
 * kMaxTrackedDevices are kept; neither rule touches a device mid-session.
 */
class GatewayController {
public:
    using SendCallback = std::function<void(const silverbp_gateway_DeviceEvent&)>;

    static constexpr size_t kMaxTrackedDevices = 16;
    static constexpr uint64_t kForgetAfterIntervals = 3;

    GatewayController(const GatewayConfig& config, Transport& transport, system::LogSink logSink, SendCallback sendFn);

    /**
     * @brief Feed one advertisement.
     * @return true when it triggered a completed acquisition session.
     */
    bool handleAdvertisement(const AdvertisementContext& context, uint64_t nowMs);

    [[nodiscard]] bool accepts(const AdvertisementContext& context) const;

    // Poll on the next advertisement from @p address regardless of the interval.
    void requestPoll(const std::string& address, uint64_t nowMs);

    bool setPollInterval(uint32_t intervalMs, uint64_t nowMs);
    void setTargetAddress(const std::string& address, uint64_t nowMs);
    void factoryReset(uint64_t nowMs);
    void handleCommand(const silverbp_gateway_GatewayCommand& cmd, uint64_t nowMs);
    void sendBoot(const char* firmwareVersion, uint64_t nowMs);

    uint32_t pollIntervalMs() const;
    std::string targetAddress() const;
    [[nodiscard]] bool sessionActive(const std::string& address) const;
    std::optional<uint64_t> lastPollMs(const std::string& address) const;
    std::optional<DeviceInfo> device(const std::string& address) const;
    std::optional<AcquisitionOutcome> lastOutcome() const;
    uint32_t sessionsRun() const;
    size_t trackedDeviceCount() const;

private:
    struct DeviceState {
        explicit DeviceState(uint32_t intervalMs) : listener(intervalMs) {}

        PassiveListener listener;
        std::optional<uint64_t> lastPollMs;
        uint64_t lastSeenMs = 0;
        bool sessionActive = false;
        bool pollRequested = false;
    };

    DeviceState& stateForLocked(const std::string& key, uint64_t nowMs);
    void pruneLocked(uint64_t nowMs);
    void publishOutcome(const AcquisitionOutcome& outcome, uint64_t nowMs);
    void notifyStatus(const std::string& status, uint64_t nowMs);

    GatewayConfig defaults_;
    GatewayConfig config_;
    Transport& transport_;
    system::Logger log_;
    SendCallback send_;

    mutable std::mutex mutex_;
    std::map<std::string, DeviceState> devices_;
    std::optional<AcquisitionOutcome> lastOutcome_;
    uint32_t sessionsRun_ = 0;
};

}  // namespace silverbp
