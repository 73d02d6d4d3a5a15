#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace silverbp {

struct ConnectionHandle {
    uint32_t id = 0;
};

/**
 * @brief Link to a single cuff. Every call may fail independently; callers
 * inspect each result and never assume the previous step succeeded.
 *
 * The notify callback may run on a different task than the caller
 * (NimBLE host task on hardware).
 */
class Transport {
public:
    using NotifyCallback = std::function<void(const uint8_t* data, size_t length)>;

    virtual ~Transport() = default;

    virtual bool connect(const std::string& address, ConnectionHandle& handle) = 0;
    virtual bool subscribe(const ConnectionHandle& handle, const std::string& characteristicId, NotifyCallback callback) = 0;
    virtual bool unsubscribe(const ConnectionHandle& handle, const std::string& characteristicId) = 0;
    virtual bool disconnect(const ConnectionHandle& handle) = 0;
};

}  // namespace silverbp
