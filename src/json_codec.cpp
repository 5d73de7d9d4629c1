#include "json_codec.h"

using nlohmann::json;

namespace json_codec {

namespace {
template <typename T>
void putOptional(json& out, const char* key, const std::optional<T>& value) {
    if (value) {
        out[key] = *value;
    }
}
}  // namespace

json toJson(const Device& device) {
    return json{
        {"id", device.id},
        {"ip", device.ip},
        {"name", device.name},
        {"online", device.online},
    };
}

json toJson(const std::vector<Device>& devices) {
    json out = json::array();
    for (const Device& device : devices) {
        out.push_back(toJson(device));
    }
    return out;
}

json toJson(const DeviceInfo& info) {
    return json{
        {"model", info.model},
        {"tuners", info.tuners},
        {"atsc3Support", info.atsc3Support},
    };
}

json toJson(const TunerStatus& status) {
    json out = json::object();
    if (!status.channel.empty()) {
        out["channel"] = status.channel;
    }
    out["lock"] = status.lock;
    putOptional(out, "ss", status.ss);
    putOptional(out, "snq", status.snq);
    putOptional(out, "seq", status.seq);
    putOptional(out, "bps", status.bps);
    putOptional(out, "pps", status.pps);
    putOptional(out, "ssDb", status.ssDb);
    putOptional(out, "snrDb", status.snrDb);
    putOptional(out, "debugRaw", status.debugRaw);
    return out;
}

json toJson(const PlpTable& plps) {
    json out = json::object();
    for (const auto& entry : plps) {
        const PlpEntry& plp = entry.second;
        json item = json::object();
        putOptional(item, "sfi", plp.sfi);
        putOptional(item, "modulation", plp.modulation);
        putOptional(item, "coderate", plp.coderate);
        putOptional(item, "layer", plp.layer);
        putOptional(item, "timeInterleaving", plp.timeInterleaving);
        putOptional(item, "lls", plp.lls);
        putOptional(item, "lock", plp.lock);
        out[std::to_string(entry.first)] = item;
    }
    return out;
}

json toJson(const L1Info& l1) {
    json out = json::object();
    for (const auto& entry : l1) {
        out[entry.first] = entry.second;
    }
    return out;
}

json toJson(const std::vector<ProgramEntry>& programs) {
    json out = json::array();
    for (const ProgramEntry& program : programs) {
        out.push_back(json{
            {"programNum", program.programNum},
            {"virtualChannel", program.virtualChannel},
            {"name", program.name},
            {"callsign", program.callsign},
            {"status", program.status},
            {"encrypted", program.encrypted},
            {"atsc3", program.atsc3},
        });
    }
    return out;
}

json toJson(const std::vector<ChannelScanResult>& channels) {
    json out = json::array();
    for (const ChannelScanResult& channel : channels) {
        json programs = json::array();
        for (const ScanProgram& program : channel.programs) {
            programs.push_back(json{
                {"programNum", program.programNum},
                {"virtualChannel", program.virtualChannel},
                {"name", program.name},
            });
        }
        out.push_back(json{
            {"frequency", channel.frequency},
            {"channel", channel.channel},
            {"modulation", channel.modulation},
            {"signalStrength", channel.signalStrength},
            {"snr", channel.snr},
            {"symbolQuality", channel.symbolQuality},
            {"programs", programs},
        });
    }
    return out;
}

json monitorEvent(const TunerMonitorEvent& event) {
    json out = event.status ? toJson(*event.status) : json::object();
    out["tuner"] = event.tuner;
    out["currentProgram"] = event.currentProgram ? json(*event.currentProgram) : json(nullptr);
    out["plpInfo"] = event.plpInfo.empty() ? json(nullptr) : toJson(event.plpInfo);
    out["l1Info"] = event.l1Info.empty() ? json(nullptr) : toJson(event.l1Info);
    return out;
}

json antennaEvent(const std::vector<AntennaTunerStatus>& tuners) {
    json out = json::array();
    for (const AntennaTunerStatus& entry : tuners) {
        out.push_back(json{
            {"tuner", entry.tuner},
            {"status", entry.status ? toJson(*entry.status) : json(nullptr)},
        });
    }
    return out;
}

}  // namespace json_codec
