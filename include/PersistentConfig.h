#pragma once

#include <cstdint>
#include <string>

namespace silverbp {

struct PersistentSettings {
    bool hasPollIntervalMs = false;
    uint32_t pollIntervalMs = 0;
    bool hasTargetAddress = false;
    std::string targetAddress;
};

bool loadPersistentSettings(PersistentSettings& out);
void storePollIntervalMs(uint32_t value);
void storeTargetAddress(const std::string& address);
void clearPersistentSettings();

}  // namespace silverbp
