#include "PassiveListener.h"

#include "Config.h"
#include <cctype>

namespace silverbp {

std::string shortAddress(const std::string& address) {
    std::string hex;
    hex.reserve(address.size());
    for (char c : address) {
        if (c == ':' || c == '-') {
            continue;
        }
        hex.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (hex.size() <= 4) {
        return hex;
    }
    return hex.substr(hex.size() - 4);
}

std::string normalizeAddress(const std::string& address) {
    std::string out;
    out.reserve(address.size());
    for (char c : address) {
        if (c == '-') {
            out.push_back(':');
        } else {
            out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

uint64_t elapsedMs(uint64_t sinceMs, uint64_t nowMs) {
    if (nowMs >= sinceMs) {
        return nowMs - sinceMs;
    }
    return static_cast<uint32_t>(static_cast<uint32_t>(nowMs) - static_cast<uint32_t>(sinceMs));
}

PassiveListener::PassiveListener(uint32_t pollIntervalMs)
    : pollIntervalMs_(pollIntervalMs) {}

void PassiveListener::onAdvertisement(const AdvertisementContext& context) {
    address_ = context.address;
    lastRssi_ = context.rssi;
    lastSeenMs_ = context.observedMs;

    device_.manufacturer = BP_MANUFACTURER;
    device_.model = BP_MODEL;
    std::string name = context.name;
    name += ' ';
    name += shortAddress(context.address);
    device_.name = name;
    device_.title = name;
}

bool PassiveListener::isPollDue(std::optional<uint64_t> lastPollMs, uint64_t nowMs) const {
    if (!lastPollMs.has_value()) {
        return true;
    }
    return elapsedMs(*lastPollMs, nowMs) > pollIntervalMs_;
}

}  // namespace silverbp
