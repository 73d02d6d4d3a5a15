#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Config.h"
#include "MeasurementSink.h"
#include "PassiveListener.h"
#include "Transport.h"
#include "system/Log.h"

namespace silverbp {

enum class SessionState { Idle, Connecting, Subscribed, AwaitingNotification, Finalizing, Closed };

enum class SessionError {
    ConnectionError,
    SubscriptionError,
    MalformedPayload,
    InvalidTimestamp,
    NotificationTimeout,
    TeardownError
};

const char* sessionStateLabel(SessionState state);
const char* sessionErrorLabel(SessionError error);

struct SessionConfig {
    std::string characteristicId = BP_CHARACTERISTIC_UUID;
    uint32_t notificationTimeoutMs = BP_NOTIFICATION_TIMEOUT_MS;
    // Unset: stamp readings with the host offset at decode time.
    std::optional<int32_t> utcOffsetSeconds;
};

struct SessionRequest {
    std::string address;
    DeviceInfo device;
    std::optional<int32_t> rssi;
};

struct AcquisitionOutcome {
    std::string address;
    DeviceInfo device;
    std::vector<SensorReading> readings;
    std::vector<SessionError> errors;
    SessionState finalState = SessionState::Idle;
    bool measurementReceived = false;

    [[nodiscard]] bool hasError(SessionError error) const;
};

/**
 * @brief One connect / subscribe / wait / teardown cycle against one cuff.
 *
 * Sessions are single-use. run() blocks for at most the notification timeout
 * plus whatever the transport takes to connect and tear down. The link is
 * released exactly once on every path out of run(), including a failed
 * subscribe and a timeout.
 */
class AcquisitionSession {
public:
    AcquisitionSession(Transport& transport, const SessionConfig& config, system::Logger log);
    ~AcquisitionSession();

    AcquisitionSession(const AcquisitionSession&) = delete;
    AcquisitionSession& operator=(const AcquisitionSession&) = delete;

    AcquisitionOutcome run(const SessionRequest& request);

    // Notify entry point; the transport callback forwards here. Only the first
    // payload before finalization is consumed.
    void handleNotification(const uint8_t* data, size_t length);

    SessionState state() const { return state_; }
    const std::vector<SessionState>& history() const { return history_; }
    std::vector<SensorReading> readings() const;

private:
    struct Inbox;
    class ConnectionGuard;

    void transition(SessionState next);

    Transport& transport_;
    SessionConfig config_;
    system::Logger log_;
    std::shared_ptr<Inbox> inbox_;
    SessionState state_ = SessionState::Idle;
    std::vector<SessionState> history_;
    std::vector<SessionError> errors_;
};

}  // namespace silverbp
