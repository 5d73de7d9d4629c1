#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <chrono>
#include <future>
#include <vector>

#include "fake_device_control.h"
#include "tuner_probe.h"

using Catch::Matchers::WithinAbs;

namespace {
const std::string kDevice = "1040ABCD";
const std::string kLockedStatus = "ch=8vsb:177000000 lock=8vsb ss=86 snq=61 seq=100 bps=19394080 pps=1670";
const std::string kLockedDebug = "tun: ch=8vsb:177000000 lock=8vsb:177000000 ss=86 snq=61 seq=100 dbg=86-19/3";

struct RecordingSleeper {
    std::vector<std::chrono::milliseconds> delays;

    TunerProbe::Sleeper callback() {
        return [this](std::chrono::milliseconds delay) { delays.push_back(delay); };
    }
};
}  // namespace

TEST_CASE("Locked tuner status carries dB estimates", "[tuner_probe]") {
    FakeDeviceControl control;
    control.respond(kDevice, "/tuner0/status", kLockedStatus);
    control.respond(kDevice, "/tuner0/debug", kLockedDebug);
    TunerProbe probe(control);

    const auto status = probe.getTunerStatus(kDevice, 0);
    REQUIRE(status.has_value());
    REQUIRE(status->lock);
    REQUIRE(status->ss == 86);
    REQUIRE(status->ssDb.has_value());
    REQUIRE_THAT(*status->ssDb, WithinAbs(-47.0, 1e-9));
    REQUIRE_THAT(*status->snrDb, WithinAbs(5.9, 1e-9));
    REQUIRE(status->debugRaw == std::string("86-19/3"));
}

TEST_CASE("Failed status query is unknown, not idle", "[tuner_probe]") {
    FakeDeviceControl control;
    control.fail(kDevice, "/tuner1/status");
    control.respond(kDevice, "/tuner1/debug", kLockedDebug);
    TunerProbe probe(control);

    REQUIRE_FALSE(probe.getTunerStatus(kDevice, 1).has_value());
}

TEST_CASE("Failed debug query keeps the status", "[tuner_probe]") {
    FakeDeviceControl control;
    control.respond(kDevice, "/tuner0/status", kLockedStatus);
    control.fail(kDevice, "/tuner0/debug");
    TunerProbe probe(control);

    const auto status = probe.getTunerStatus(kDevice, 0);
    REQUIRE(status.has_value());
    REQUIRE(status->lock);
    REQUIRE_FALSE(status->ssDb.has_value());
    REQUIRE_FALSE(status->snrDb.has_value());
    REQUIRE_FALSE(status->debugRaw.has_value());
}

TEST_CASE("Idle tuner skips the estimate", "[tuner_probe]") {
    FakeDeviceControl control;
    control.respond(kDevice, "/tuner0/status", "none");
    control.respond(kDevice, "/tuner0/debug", "tun: dbg=0-0/0");
    TunerProbe probe(control);

    const auto status = probe.getTunerStatus(kDevice, 0);
    REQUIRE(status.has_value());
    REQUIRE(status->channel == "none");
    REQUIRE_FALSE(status->lock);
    REQUIRE_FALSE(status->ssDb.has_value());
}

TEST_CASE("Current program", "[tuner_probe]") {
    FakeDeviceControl control;
    TunerProbe probe(control);

    control.respond(kDevice, "/tuner0/program", "3");
    REQUIRE(probe.getCurrentProgram(kDevice, 0) == std::string("3"));

    control.respond(kDevice, "/tuner0/program", "none");
    REQUIRE_FALSE(probe.getCurrentProgram(kDevice, 0).has_value());

    control.fail(kDevice, "/tuner0/program");
    REQUIRE_FALSE(probe.getCurrentProgram(kDevice, 0).has_value());
}

TEST_CASE("PLP and L1 reads degrade to empty", "[tuner_probe]") {
    FakeDeviceControl control;
    control.fail(kDevice, "/tuner0/plpinfo");
    control.fail(kDevice, "/tuner0/l1info");
    TunerProbe probe(control);

    REQUIRE(probe.getPlpInfo(kDevice, 0).empty());
    REQUIRE(probe.getL1Info(kDevice, 0).empty());

    control.respond(kDevice, "/tuner0/plpinfo", "0: mod=qam256 lock=1");
    control.respond(kDevice, "/tuner0/l1info", "l1b_version=1");
    REQUIRE(probe.getPlpInfo(kDevice, 0).size() == 1);
    REQUIRE(probe.getL1Info(kDevice, 0).at("l1b_version") == "1");
}

TEST_CASE("Unlocked tuner never asks for stream info", "[tuner_probe]") {
    FakeDeviceControl control;
    control.respond(kDevice, "/tuner2/status", "ch=8vsb:177000000 ss=12 snq=0 seq=0");
    RecordingSleeper sleeper;
    TunerProbe probe(control, ProbeTimeouts{}, sleeper.callback());

    REQUIRE(probe.getProgramsWithRetry(kDevice, 2).empty());
    REQUIRE(control.calls(kDevice, "/tuner2/streaminfo") == 0);
    REQUIRE(sleeper.delays.empty());
}

TEST_CASE("Tuned tuner reporting lock=none still reads stream info", "[tuner_probe]") {
    FakeDeviceControl control;
    control.respond(kDevice, "/tuner1/status", "ch=auto:533000000 lock=none ss=0 snq=0 seq=0 bps=0 pps=0");
    control.respond(kDevice, "/tuner1/streaminfo", "program=3: 7.1 WJLA-HD");
    RecordingSleeper sleeper;
    TunerProbe probe(control, ProbeTimeouts{}, sleeper.callback());

    const std::vector<ProgramEntry> programs = probe.getProgramsWithRetry(kDevice, 1);
    REQUIRE(programs.size() == 1);
    REQUIRE(control.calls(kDevice, "/tuner1/streaminfo") == 1);
}

TEST_CASE("Idle tuner never asks for stream info", "[tuner_probe]") {
    FakeDeviceControl control;
    control.respond(kDevice, "/tuner0/status", "none");
    RecordingSleeper sleeper;
    TunerProbe probe(control, ProbeTimeouts{}, sleeper.callback());

    REQUIRE(probe.getProgramsWithRetry(kDevice, 0).empty());
    REQUIRE(control.calls(kDevice, "/tuner0/streaminfo") == 0);
}

TEST_CASE("Empty stream info is retried with back-off", "[tuner_probe]") {
    FakeDeviceControl control;
    control.respond(kDevice, "/tuner0/status", kLockedStatus);
    control.respond(kDevice, "/tuner0/streaminfo", "tsid=0x0459");
    RecordingSleeper sleeper;
    TunerProbe probe(control, ProbeTimeouts{}, sleeper.callback());

    REQUIRE(probe.getProgramsWithRetry(kDevice, 0, 3).empty());
    REQUIRE(control.calls(kDevice, "/tuner0/streaminfo") == 4);
    REQUIRE(sleeper.delays.size() == 3);
    REQUIRE(sleeper.delays[0] == std::chrono::milliseconds(1500));
    REQUIRE(sleeper.delays[1] == std::chrono::milliseconds(2000));
    REQUIRE(sleeper.delays[2] == std::chrono::milliseconds(2000));
}

TEST_CASE("Programs returned once the stream table fills in", "[tuner_probe]") {
    FakeDeviceControl control;
    control.respond(kDevice, "/tuner0/status", kLockedStatus);
    control.respondSequence(kDevice, "/tuner0/streaminfo",
                            {"tsid=0x0459", "program=3: 7.1 WJLA-HD\nprogram=4: 7.2 Heroes (encrypted)"});
    RecordingSleeper sleeper;
    TunerProbe probe(control, ProbeTimeouts{}, sleeper.callback());

    const std::vector<ProgramEntry> programs = probe.getProgramsWithRetry(kDevice, 0, 3);
    REQUIRE(programs.size() == 2);
    REQUIRE(programs[1].encrypted);
    REQUIRE(control.calls(kDevice, "/tuner0/streaminfo") == 2);
    REQUIRE(sleeper.delays.size() == 1);
}

TEST_CASE("Zero retries makes a single attempt", "[tuner_probe]") {
    FakeDeviceControl control;
    control.respond(kDevice, "/tuner0/status", kLockedStatus);
    control.fail(kDevice, "/tuner0/streaminfo");
    RecordingSleeper sleeper;
    TunerProbe probe(control, ProbeTimeouts{}, sleeper.callback());

    REQUIRE(probe.getProgramsWithRetry(kDevice, 0, 0).empty());
    REQUIRE(control.calls(kDevice, "/tuner0/streaminfo") == 1);
    REQUIRE(sleeper.delays.empty());
}

TEST_CASE("Device info counts answering tuners", "[tuner_probe]") {
    FakeDeviceControl control;
    control.respond(kDevice, "/sys/model", "HDHR5-4K");
    for (int tuner = 0; tuner < 4; tuner++) {
        control.respond(kDevice, "/tuner" + std::to_string(tuner) + "/status", "none");
    }
    TunerProbe probe(control);

    const DeviceInfo info = probe.getDeviceInfo(kDevice);
    REQUIRE(info.model == "HDHR5-4K");
    REQUIRE(info.tuners == 4);
    REQUIRE(info.atsc3Support);
}

TEST_CASE("Verbose logging can be toggled while tuner reads run", "[tuner_probe]") {
    FakeDeviceControl control;
    control.respond(kDevice, "/tuner0/status", kLockedStatus);
    TunerProbe probe(control);

    // The unscripted debug read fails on a worker thread, which consults the flag.
    auto reading = std::async(std::launch::async, [&probe]() { return probe.getTunerStatus(kDevice, 0); });
    probe.setVerboseLogging(true);
    probe.setVerboseLogging(false);
    const auto status = reading.get();
    REQUIRE(status.has_value());
    REQUIRE(status->lock);
    REQUIRE_FALSE(status->ssDb.has_value());
}

TEST_CASE("Device info falls back to the model name", "[tuner_probe]") {
    FakeDeviceControl control;
    control.respond(kDevice, "/sys/model", "HDHR3-CC PRIME");
    TunerProbe probe(control);

    const DeviceInfo info = probe.getDeviceInfo(kDevice);
    REQUIRE(info.tuners == 3);
    REQUIRE_FALSE(info.atsc3Support);
}

TEST_CASE("Unreachable device gets default info", "[tuner_probe]") {
    FakeDeviceControl control;
    TunerProbe probe(control);

    const DeviceInfo info = probe.getDeviceInfo(kDevice);
    REQUIRE(info.model == "Unknown");
    REQUIRE(info.tuners == 2);
    REQUIRE_FALSE(info.atsc3Support);
    REQUIRE(control.calls(kDevice, "/tuner0/status") == 0);
}

TEST_CASE("Channel scan uses the requested map", "[tuner_probe]") {
    FakeDeviceControl control;
    control.scanResult(CommandResult{true,
                                     "SCANNING: 177000000 (us-bcast:7)\n"
                                     "LOCK: 8vsb (ss=86 snq=61 seq=100)\n"
                                     "PROGRAM 3: 7.1 WJLA-HD\n",
                                     ""});
    TunerProbe probe(control);

    const std::vector<ChannelScanResult> channels = probe.scanChannels(kDevice, 1, "us-cable");
    REQUIRE(channels.size() == 1);
    REQUIRE(channels[0].programs.size() == 1);
    REQUIRE(control.scans() == std::vector<std::string>{kDevice + " /tuner1 us-cable"});
}

TEST_CASE("Tuning commands write the channel path", "[tuner_probe]") {
    FakeDeviceControl control;
    TunerProbe probe(control);

    probe.setChannel(kDevice, 0, "8vsb:177000000");
    probe.setAtsc3Channel(kDevice, 1, "24", {0, 1});
    probe.setAtsc3Channel(kDevice, 1, "24");
    probe.incrementChannel(kDevice, 2);
    probe.decrementChannel(kDevice, 2);
    probe.clearTuner(kDevice, 3);

    const std::vector<FakeDeviceControl::SetCall> sets = control.sets();
    REQUIRE(sets.size() == 6);
    REQUIRE(sets[0].path == "/tuner0/channel");
    REQUIRE(sets[0].value == "8vsb:177000000");
    REQUIRE(sets[1].path == "/tuner1/channel");
    REQUIRE(sets[1].value == "atsc3:24:0+1");
    REQUIRE(sets[2].value == "atsc3:24");
    REQUIRE(sets[3].value == "+");
    REQUIRE(sets[4].value == "-");
    REQUIRE(sets[5].path == "/tuner3/channel");
    REQUIRE(sets[5].value == "none");
}

TEST_CASE("Rejected commands raise TunerCommandError", "[tuner_probe]") {
    FakeDeviceControl control;
    control.setResult(CommandResult{false, "", "ERROR: invalid channel"});
    TunerProbe probe(control);

    REQUIRE_THROWS_AS(probe.setChannel(kDevice, 0, "bogus"), TunerCommandError);
    REQUIRE_THROWS_AS(probe.incrementChannel(kDevice, 0), TunerCommandError);
    REQUIRE_THROWS_AS(probe.clearTuner(kDevice, 0), TunerCommandError);
}
