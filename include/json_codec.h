#ifndef JSON_CODEC_H
#define JSON_CODEC_H

#include <vector>

#include <nlohmann/json.hpp>

#include "monitoring_sessions.h"
#include "tuner_types.h"

// JSON shapes emitted on stdout by the CLI. Absent status fields are left
// out rather than written as null.
namespace json_codec {

nlohmann::json toJson(const Device& device);
nlohmann::json toJson(const std::vector<Device>& devices);
nlohmann::json toJson(const DeviceInfo& info);
nlohmann::json toJson(const TunerStatus& status);
nlohmann::json toJson(const PlpTable& plps);
nlohmann::json toJson(const L1Info& l1);
nlohmann::json toJson(const std::vector<ProgramEntry>& programs);
nlohmann::json toJson(const std::vector<ChannelScanResult>& channels);

// Status fields at top level next to tuner, currentProgram, plpInfo and
// l1Info. Empty tables and a missing program are encoded as null.
nlohmann::json monitorEvent(const TunerMonitorEvent& event);
nlohmann::json antennaEvent(const std::vector<AntennaTunerStatus>& tuners);

}  // namespace json_codec

#endif
