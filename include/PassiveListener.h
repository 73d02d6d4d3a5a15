#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace silverbp {

struct AdvertisementContext {
    std::string address;
    std::string name;
    int32_t rssi = 0;
    uint64_t observedMs = 0;
};

struct DeviceInfo {
    std::string manufacturer;
    std::string model;
    std::string name;
    std::string title;
};

// Last two octets of a MAC address, upper-case and without separators ("AA:BB:CC:DD:EE:FF" -> "EEFF").
std::string shortAddress(const std::string& address);

// Upper-case, ':'-separated form used as the per-device key.
std::string normalizeAddress(const std::string& address);

// Milliseconds from @p sinceMs to @p nowMs. A now behind since means a 32-bit
// millis() counter wrapped in between; the difference is taken modulo 2^32.
uint64_t elapsedMs(uint64_t sinceMs, uint64_t nowMs);

class PassiveListener {
public:
    explicit PassiveListener(uint32_t pollIntervalMs);

    // Refresh identity metadata from an advertisement. Never opens a connection.
    void onAdvertisement(const AdvertisementContext& context);

    [[nodiscard]] bool isPollDue(std::optional<uint64_t> lastPollMs, uint64_t nowMs) const;

    void setPollInterval(uint32_t pollIntervalMs) { pollIntervalMs_ = pollIntervalMs; }
    uint32_t pollIntervalMs() const { return pollIntervalMs_; }

    const DeviceInfo& device() const { return device_; }
    const std::string& address() const { return address_; }
    std::optional<int32_t> lastRssi() const { return lastRssi_; }
    uint64_t lastSeenMs() const { return lastSeenMs_; }

private:
    uint32_t pollIntervalMs_;
    DeviceInfo device_;
    std::string address_;
    std::optional<int32_t> lastRssi_;
    uint64_t lastSeenMs_ = 0;
};

}  // namespace silverbp
