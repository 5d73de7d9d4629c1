#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <vector>

struct Config {
  struct DeviceSection {
    std::string config_tool = "hdhomerun_config";
    int command_timeout_ms = 5000;
    int status_timeout_ms = 750;
    int scan_timeout_ms = 60000;
  } device;

  struct DiscoverySection {
    bool auto_discovery = true;
    std::vector<std::string> manual_hosts;
    std::string cloud_url = "https://api.hdhomerun.com/discover";
    int broadcast_timeout_ms = 1500;
    int cloud_timeout_ms = 10000;
    int cache_ttl_seconds = 300;
  } discovery;

  struct MonitorSection {
    int poll_interval_ms = 1000;
    int program_retries = 3;
  } monitor;

  struct DebugSection {
    int log_level = 1;
  } debug;

  bool loadFromFile(const std::string &filename);
  void loadDefaults();
};

// Splits a manual host list on commas, semicolons and whitespace.
std::vector<std::string> splitHostList(const std::string &value);

#endif
