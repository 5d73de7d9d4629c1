#ifndef HDHR_CONFIG_TOOL_H
#define HDHR_CONFIG_TOOL_H

#include <atomic>
#include <string>
#include <vector>

#include "device_control.h"

// DeviceControl backed by the vendor's hdhomerun_config command line tool,
// one subprocess per query.
class HdhrConfigTool : public DeviceControl {
public:
    explicit HdhrConfigTool(const std::string& toolPath = "hdhomerun_config");

    void setVerboseLogging(bool enabled);

    CommandResult get(const std::string& device, const std::string& path, int timeoutMs) override;
    CommandResult set(const std::string& device,
                      const std::string& path,
                      const std::string& value,
                      int timeoutMs) override;
    CommandResult scan(const std::string& device,
                       int tuner,
                       const std::string& channelMap,
                       int timeoutMs) override;
    CommandResult discover(const std::string& host, int timeoutMs) override;

private:
    CommandResult run(const std::vector<std::string>& args, int timeoutMs);

    std::string m_toolPath;
    std::atomic<bool> m_verboseLogging;
};

#endif
