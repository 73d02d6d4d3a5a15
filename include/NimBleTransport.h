#pragma once

#include <map>
#include <string>

#include <NimBLEDevice.h>

#include "Transport.h"
#include "system/Log.h"

namespace silverbp {

/**
 * @brief Transport over a NimBLE central client. Holds at most one link.
 *
 * Scanning is paused while connecting; the caller restarts it after the
 * session. Subscribes with indications when the characteristic does not
 * offer notifications (0x2A35 is indicate-only on most cuffs).
 */
class NimBleTransport : public Transport {
public:
    explicit NimBleTransport(system::Logger log, uint32_t connectTimeoutMs = 10000);
    ~NimBleTransport() override;

    // Remember the address type seen in an advertisement for a later connect().
    void noteAdvertised(const NimBLEAddress& address);

    bool connect(const std::string& address, ConnectionHandle& handle) override;
    bool subscribe(const ConnectionHandle& handle, const std::string& characteristicId, NotifyCallback callback) override;
    bool unsubscribe(const ConnectionHandle& handle, const std::string& characteristicId) override;
    bool disconnect(const ConnectionHandle& handle) override;

private:
    NimBLERemoteCharacteristic* findCharacteristic(const std::string& characteristicId);
    bool owns(const ConnectionHandle& handle) const;
    void dropClient();

    system::Logger log_;
    uint32_t connectTimeoutMs_;
    NimBLEClient* client_ = nullptr;
    ConnectionHandle active_;
    uint32_t nextId_ = 0;
    std::map<std::string, NimBLEAddress> advertised_;
};

}  // namespace silverbp
