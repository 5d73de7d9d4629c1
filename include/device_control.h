#ifndef DEVICE_CONTROL_H
#define DEVICE_CONTROL_H

#include <string>

struct CommandResult {
    bool ok = false;
    std::string output;
    std::string error;
};

// One query or command against a tuner device, addressed by vendor id or
// host/IP. Implementations must be safe to call from several threads.
class DeviceControl {
public:
    virtual ~DeviceControl() = default;

    virtual CommandResult get(const std::string& device, const std::string& path, int timeoutMs) = 0;
    virtual CommandResult set(const std::string& device,
                              const std::string& path,
                              const std::string& value,
                              int timeoutMs) = 0;
    virtual CommandResult scan(const std::string& device,
                               int tuner,
                               const std::string& channelMap,
                               int timeoutMs) = 0;
    // Unicast discovery of a single host; used to recover its vendor id.
    virtual CommandResult discover(const std::string& host, int timeoutMs) = 0;
};

#endif
