#include "NimBleTransport.h"

#include "PassiveListener.h"
#include <utility>

namespace silverbp {

NimBleTransport::NimBleTransport(system::Logger log, uint32_t connectTimeoutMs)
    : log_(std::move(log)), connectTimeoutMs_(connectTimeoutMs) {}

NimBleTransport::~NimBleTransport() {
    dropClient();
}

void NimBleTransport::noteAdvertised(const NimBLEAddress& address) {
    advertised_.insert_or_assign(normalizeAddress(address.toString()), address);
}

bool NimBleTransport::owns(const ConnectionHandle& handle) const {
    return client_ != nullptr && handle.id != 0 && handle.id == active_.id;
}

void NimBleTransport::dropClient() {
    if (client_ == nullptr) {
        return;
    }
    if (client_->isConnected()) {
        client_->disconnect();
    }
    NimBLEDevice::deleteClient(client_);
    client_ = nullptr;
    active_ = ConnectionHandle{};
}

bool NimBleTransport::connect(const std::string& address, ConnectionHandle& handle) {
    if (client_ != nullptr) {
        log_.warn("Dropping stale client before connecting to %s", address.c_str());
        dropClient();
    }

    // Stop scanning before connecting; the controller cannot do both reliably.
    if (NimBLEDevice::getScan()->isScanning()) {
        NimBLEDevice::getScan()->stop();
    }

    client_ = NimBLEDevice::createClient();
    if (client_ == nullptr) {
        log_.error("createClient failed (client limit reached?)");
        return false;
    }
    client_->setConnectTimeout(connectTimeoutMs_);

    auto known = advertised_.find(normalizeAddress(address));
    NimBLEAddress target = (known != advertised_.end()) ? known->second : NimBLEAddress(address, BLE_ADDR_PUBLIC);

    const unsigned long startMs = millis();
    const bool connected = client_->connect(target);
    log_.debug("connect(%s) returned %s after %lums", address.c_str(), connected ? "true" : "false",
               millis() - startMs);
    if (!connected) {
        NimBLEDevice::deleteClient(client_);
        client_ = nullptr;
        return false;
    }

    active_.id = ++nextId_;
    if (active_.id == 0) {
        active_.id = ++nextId_;
    }
    handle = active_;
    return true;
}

NimBLERemoteCharacteristic* NimBleTransport::findCharacteristic(const std::string& characteristicId) {
    if (client_ == nullptr) {
        return nullptr;
    }
    const NimBLEUUID uuid(characteristicId);
    const auto& services = client_->getServices(true);
    for (NimBLERemoteService* service : services) {
        if (service == nullptr) {
            continue;
        }
        NimBLERemoteCharacteristic* characteristic = service->getCharacteristic(uuid);
        if (characteristic != nullptr) {
            return characteristic;
        }
    }
    return nullptr;
}

bool NimBleTransport::subscribe(const ConnectionHandle& handle, const std::string& characteristicId, NotifyCallback callback) {
    if (!owns(handle)) {
        return false;
    }
    NimBLERemoteCharacteristic* characteristic = findCharacteristic(characteristicId);
    if (characteristic == nullptr) {
        log_.error("Characteristic %s not found", characteristicId.c_str());
        return false;
    }

    const bool notifications = characteristic->canNotify();
    if (!notifications && !characteristic->canIndicate()) {
        log_.error("Characteristic %s supports neither notify nor indicate", characteristicId.c_str());
        return false;
    }

    return characteristic->subscribe(
        notifications,
        [callback](NimBLERemoteCharacteristic*, uint8_t* data, size_t length, bool) {
            if (callback) {
                callback(data, length);
            }
        });
}

bool NimBleTransport::unsubscribe(const ConnectionHandle& handle, const std::string& characteristicId) {
    if (!owns(handle) || !client_->isConnected()) {
        return false;
    }
    NimBLERemoteCharacteristic* characteristic = findCharacteristic(characteristicId);
    if (characteristic == nullptr) {
        return false;
    }
    return characteristic->unsubscribe();
}

bool NimBleTransport::disconnect(const ConnectionHandle& handle) {
    if (!owns(handle)) {
        return false;
    }
    bool ok = true;
    if (client_->isConnected()) {
        ok = client_->disconnect();
    }
    NimBLEDevice::deleteClient(client_);
    client_ = nullptr;
    active_ = ConnectionHandle{};
    return ok;
}

}  // namespace silverbp
