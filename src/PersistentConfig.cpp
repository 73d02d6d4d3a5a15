#include "PersistentConfig.h"

#ifdef ARDUINO
#include <Preferences.h>

namespace silverbp {
namespace {
constexpr const char* kNamespace = "bpgwcfg";
constexpr const char* kKeyInterval = "interval";
constexpr const char* kKeyTarget = "target";

bool readUInt(Preferences& prefs, const char* key, uint32_t& out) {
    if (!prefs.isKey(key)) {
        return false;
    }
    out = prefs.getUInt(key, 0U);
    return true;
}

bool readString(Preferences& prefs, const char* key, std::string& out) {
    if (!prefs.isKey(key)) {
        return false;
    }
    out = prefs.getString(key, "").c_str();
    return true;
}

}  // namespace

bool loadPersistentSettings(PersistentSettings& out) {
    Preferences prefs;
    if (!prefs.begin(kNamespace, true)) {
        return false;
    }
    bool any = false;
    if (readUInt(prefs, kKeyInterval, out.pollIntervalMs)) {
        out.hasPollIntervalMs = true;
        any = true;
    }
    if (readString(prefs, kKeyTarget, out.targetAddress)) {
        out.hasTargetAddress = true;
        any = true;
    }
    prefs.end();
    return any;
}

void storePollIntervalMs(uint32_t value) {
    Preferences prefs;
    prefs.begin(kNamespace, false);
    prefs.putUInt(kKeyInterval, value);
    prefs.end();
}

void storeTargetAddress(const std::string& address) {
    Preferences prefs;
    prefs.begin(kNamespace, false);
    prefs.putString(kKeyTarget, address.c_str());
    prefs.end();
}

void clearPersistentSettings() {
    Preferences prefs;
    prefs.begin(kNamespace, false);
    prefs.clear();
    prefs.end();
}

}  // namespace silverbp
#else

namespace silverbp {
namespace {
PersistentSettings g_settings;
}

bool loadPersistentSettings(PersistentSettings& out) {
    out = g_settings;
    return g_settings.hasPollIntervalMs || g_settings.hasTargetAddress;
}

void storePollIntervalMs(uint32_t value) {
    g_settings.pollIntervalMs = value;
    g_settings.hasPollIntervalMs = true;
}

void storeTargetAddress(const std::string& address) {
    g_settings.targetAddress = address;
    g_settings.hasTargetAddress = true;
}

void clearPersistentSettings() {
    g_settings = PersistentSettings{};
}

}  // namespace silverbp

#endif  // ARDUINO
