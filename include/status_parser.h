#ifndef STATUS_PARSER_H
#define STATUS_PARSER_H

#include <optional>
#include <string>
#include <vector>

#include "tuner_types.h"

// Parsers for the vendor tool's key=value text output. All functions are
// pure and never throw; malformed lines are skipped.

// One status line, e.g. "ch=8 lock=atsc8 ss=71 snq=83 seq=100 bps=19393000 pps=1670".
// The bare line "none" means the tuner is idle.
TunerStatus parseStatusLine(const std::string& text);

// Finds "dbg=<signal>-<snr>/<third>" anywhere in the debug output.
std::optional<DebugCounters> parseDebugCounters(const std::string& text);

// "0: sfi=0 mod=qam256 cod=10/15 layer=core ti=cti lls=1 lock=1" per line.
PlpTable parsePlpTable(const std::string& text);

// Every key=value token across all lines; the last duplicate wins.
L1Info parseL1Table(const std::string& text);

// streaminfo output: "program=3: 7.1 WJLA-HD (encrypted)" or the ATSC 3.0
// "service=1: 12.1 WHYY (atsc3)" form.
std::vector<ProgramEntry> parsePrograms(const std::string& text);

// Streaming output of "scan /tunerN <channelmap>".
std::vector<ChannelScanResult> parseScanOutput(const std::string& text);

// "hdhomerun device 1040ABCD found at 192.168.1.50" lines.
std::vector<DiscoveredDevice> parseDiscoverOutput(const std::string& text);

#endif
