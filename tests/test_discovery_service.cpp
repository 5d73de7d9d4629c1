#include <catch2/catch_test_macros.hpp>

#include <chrono>

#include "discovery_service.h"
#include "fake_device_control.h"

namespace {
DiscoveredDevice found(const std::string& id, const std::string& ip) {
    DiscoveredDevice device;
    device.id = id;
    device.ip = ip;
    return device;
}

// Counts calls and returns a fixed result.
struct ScriptedDiscovery {
    DiscoveryResult result;
    int calls = 0;

    DiscoveryService::DiscoverCallback callback() {
        return [this]() {
            calls++;
            return result;
        };
    }
};

DiscoveryResult succeeded(std::vector<DiscoveredDevice> devices) {
    DiscoveryResult result;
    result.ok = true;
    result.devices = std::move(devices);
    return result;
}

struct FakeClock {
    std::chrono::steady_clock::time_point now{};

    DiscoveryService::Clock callback() {
        return [this]() { return now; };
    }
};
}  // namespace

TEST_CASE("Broadcast results bypass the cloud", "[discovery]") {
    FakeDeviceControl control;
    control.respond("192.168.1.50", "/sys/model", "HDHR5-4K");
    ScriptedDiscovery broadcast;
    broadcast.result = succeeded({found("1040ABCD", "192.168.1.50"), found("10A1B2C3", "192.168.1.51")});
    ScriptedDiscovery cloud;
    DiscoveryService service(control, broadcast.callback(), cloud.callback());

    const std::vector<Device> devices = service.discoverDevices();
    REQUIRE(devices.size() == 2);
    REQUIRE(devices[0].id == "1040ABCD");
    REQUIRE(devices[0].ip == "192.168.1.50");
    REQUIRE(devices[0].name == "HDHomeRun 1040ABCD (HDHR5-4K)");
    REQUIRE(devices[0].online);
    // Model lookup failed for the second device.
    REQUIRE(devices[1].name == "HDHomeRun 10A1B2C3");
    REQUIRE(cloud.calls == 0);
    REQUIRE_FALSE(service.hasCloudCache());
    REQUIRE(service.devices().size() == 2);
}

TEST_CASE("Cloud fallback is cached until a forced refresh", "[discovery]") {
    FakeDeviceControl control;
    control.respond("10.0.0.5", "/sys/model", "HDHR4-2US");
    ScriptedDiscovery broadcast;
    broadcast.result = succeeded({});
    ScriptedDiscovery cloud;
    cloud.result = succeeded({found("10CAFE00", "10.0.0.5")});
    DiscoveryService service(control, broadcast.callback(), cloud.callback());

    const std::vector<Device> first = service.discoverDevices(false);
    REQUIRE(first.size() == 1);
    REQUIRE(first[0].name == "HDHomeRun 10CAFE00 (HDHR4-2US)");
    REQUIRE(cloud.calls == 1);
    REQUIRE(service.hasCloudCache());

    const std::vector<Device> second = service.discoverDevices(false);
    REQUIRE(second.size() == 1);
    REQUIRE(cloud.calls == 1);
    REQUIRE(broadcast.calls == 2);

    service.discoverDevices(true);
    REQUIRE(cloud.calls == 2);
}

TEST_CASE("An empty cloud answer is cached too", "[discovery]") {
    FakeDeviceControl control;
    ScriptedDiscovery broadcast;
    broadcast.result = succeeded({});
    ScriptedDiscovery cloud;
    cloud.result.ok = false;
    cloud.result.error = "HTTP 503";
    DiscoveryService service(control, broadcast.callback(), cloud.callback());

    REQUIRE(service.autoDiscoverDevices(false).empty());
    REQUIRE(service.hasCloudCache());
    REQUIRE(service.autoDiscoverDevices(false).empty());
    REQUIRE(cloud.calls == 1);
}

TEST_CASE("Broadcast success ignores an existing cloud cache", "[discovery]") {
    FakeDeviceControl control;
    ScriptedDiscovery broadcast;
    broadcast.result = succeeded({});
    ScriptedDiscovery cloud;
    cloud.result = succeeded({found("10CAFE00", "10.0.0.5")});
    DiscoveryService service(control, broadcast.callback(), cloud.callback());

    REQUIRE(service.autoDiscoverDevices(false).size() == 1);

    broadcast.result = succeeded({found("1040ABCD", "192.168.1.50"), found("10A1B2C3", "192.168.1.51")});
    REQUIRE(service.autoDiscoverDevices(false).size() == 2);
    REQUIRE(cloud.calls == 1);
}

TEST_CASE("Manual hosts are merged first-seen wins", "[discovery]") {
    FakeDeviceControl control;
    control.respond("192.168.1.50", "/sys/model", "HDHR5-4K");
    control.respond("10.0.0.7", "/sys/model", "HDHR5-2US");
    ScriptedDiscovery broadcast;
    broadcast.result = succeeded({found("1040ABCD", "192.168.1.50")});

    DiscoveryOptions options;
    options.manualHosts = {"1040ABCD", "10.0.0.7", "10.0.0.7"};
    DiscoveryService service(control, broadcast.callback(), nullptr, options);

    const std::vector<Device> devices = service.discoverDevices();
    REQUIRE(devices.size() == 2);
    REQUIRE(devices[0].id == "1040ABCD");
    REQUIRE(devices[0].name == "HDHomeRun 1040ABCD (HDHR5-4K)");
    REQUIRE(devices[1].id == "10.0.0.7");
}

TEST_CASE("Disabled auto discovery only uses manual hosts", "[discovery]") {
    FakeDeviceControl control;
    control.respond("10.0.0.7", "/sys/model", "HDHR5-2US");
    ScriptedDiscovery broadcast;
    ScriptedDiscovery cloud;

    DiscoveryOptions options;
    options.autoDiscovery = false;
    options.manualHosts = {"10.0.0.7"};
    DiscoveryService service(control, broadcast.callback(), cloud.callback(), options);

    const std::vector<Device> devices = service.discoverDevices();
    REQUIRE(devices.size() == 1);
    REQUIRE(broadcast.calls == 0);
    REQUIRE(cloud.calls == 0);
}

TEST_CASE("Manual host keeps its address as id", "[discovery]") {
    FakeDeviceControl control;
    control.respond("10.0.0.7", "/sys/model", "HDHR5-4K");
    control.discoverResult("10.0.0.7", CommandResult{true, "hdhomerun device 1050BEEF found at 10.0.0.7", ""});
    DiscoveryService service(control, nullptr, nullptr);

    const Device device = service.getDeviceByHost("10.0.0.7");
    REQUIRE(device.id == "10.0.0.7");
    REQUIRE(device.ip == "10.0.0.7");
    REQUIRE(device.name == "HDHomeRun 1050BEEF (HDHR5-4K)");
    REQUIRE(device.online);
}

TEST_CASE("Manual host name falls back to the host", "[discovery]") {
    FakeDeviceControl control;
    control.respond("hdhr.lan", "/sys/model", "HDHR5-4K");
    DiscoveryService service(control, nullptr, nullptr);

    REQUIRE(service.getDeviceByHost("hdhr.lan").name == "HDHomeRun hdhr.lan (HDHR5-4K)");
}

TEST_CASE("Unreachable manual host becomes a cached offline placeholder", "[discovery]") {
    FakeDeviceControl control;
    FakeClock clock;
    DiscoveryService service(control, nullptr, nullptr, DiscoveryOptions{}, clock.callback());

    const Device device = service.getDeviceByHost("10.0.0.9");
    REQUIRE(device.id == "10.0.0.9");
    REQUIRE_FALSE(device.online);
    REQUIRE(device.name == "HDHomeRun 10.0.0.9 (offline)");
    REQUIRE(service.hostCacheSize() == 1);

    clock.now += std::chrono::seconds(120);
    REQUIRE_FALSE(service.getDeviceByHost("10.0.0.9").online);
    REQUIRE(control.calls("10.0.0.9", "/sys/model") == 1);
}

TEST_CASE("Host cache entries expire after the TTL", "[discovery]") {
    FakeDeviceControl control;
    FakeClock clock;
    DiscoveryService service(control, nullptr, nullptr, DiscoveryOptions{}, clock.callback());

    REQUIRE_FALSE(service.getDeviceByHost("10.0.0.9").online);

    control.respond("10.0.0.9", "/sys/model", "HDHR5-4K");
    clock.now += std::chrono::seconds(301);
    const Device device = service.getDeviceByHost("10.0.0.9");
    REQUIRE(device.online);
    REQUIRE(control.calls("10.0.0.9", "/sys/model") == 2);
}

TEST_CASE("Forced refresh clears the host cache", "[discovery]") {
    FakeDeviceControl control;
    DiscoveryOptions options;
    options.autoDiscovery = false;
    options.manualHosts = {"10.0.0.9"};
    DiscoveryService service(control, nullptr, nullptr, options);

    service.discoverDevices(false);
    service.discoverDevices(false);
    REQUIRE(control.calls("10.0.0.9", "/sys/model") == 1);

    service.discoverDevices(true);
    REQUIRE(control.calls("10.0.0.9", "/sys/model") == 2);
}
