#include "hdhr_config_tool.h"

#include <iostream>
#include <sstream>

#include "subprocess.h"

namespace {
std::string trimTrailing(std::string value) {
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r' ||
                              value.back() == ' ' || value.back() == '\t')) {
        value.pop_back();
    }
    return value;
}

std::string firstLine(const std::string& text) {
    const size_t newline = text.find('\n');
    return newline == std::string::npos ? text : text.substr(0, newline);
}
}  // namespace

HdhrConfigTool::HdhrConfigTool(const std::string& toolPath)
    : m_toolPath(toolPath)
    , m_verboseLogging(false) {
}

void HdhrConfigTool::setVerboseLogging(bool enabled) {
    m_verboseLogging = enabled;
}

CommandResult HdhrConfigTool::get(const std::string& device, const std::string& path, int timeoutMs) {
    return run({m_toolPath, device, "get", path}, timeoutMs);
}

CommandResult HdhrConfigTool::set(const std::string& device,
                                  const std::string& path,
                                  const std::string& value,
                                  int timeoutMs) {
    return run({m_toolPath, device, "set", path, value}, timeoutMs);
}

CommandResult HdhrConfigTool::scan(const std::string& device,
                                   int tuner,
                                   const std::string& channelMap,
                                   int timeoutMs) {
    return run({m_toolPath, device, "scan", "/tuner" + std::to_string(tuner), channelMap}, timeoutMs);
}

CommandResult HdhrConfigTool::discover(const std::string& host, int timeoutMs) {
    if (host.empty()) {
        return run({m_toolPath, "discover"}, timeoutMs);
    }
    return run({m_toolPath, "discover", host}, timeoutMs);
}

CommandResult HdhrConfigTool::run(const std::vector<std::string>& args, int timeoutMs) {
    CommandResult out;
    const ProcessResult process = runProcess(args, timeoutMs);
    const std::string output = trimTrailing(process.output);

    if (m_verboseLogging.load()) {
        std::ostringstream cmd;
        for (size_t i = 1; i < args.size(); i++) {
            cmd << (i > 1 ? " " : "") << args[i];
        }
        std::cout << "[Tool] " << cmd.str() << " -> exit " << process.exitCode
                  << (process.timedOut ? " (timeout)" : "") << "\n";
    }

    if (!process.started) {
        out.error = process.error;
        return out;
    }
    if (process.timedOut) {
        out.error = process.error;
        return out;
    }
    if (process.exitCode != 0) {
        out.error = !output.empty() ? firstLine(output)
                                    : (!process.error.empty() ? process.error
                                                              : "exit status " + std::to_string(process.exitCode));
        return out;
    }
    // The tool reports some device-side errors with a zero exit status.
    if (output.rfind("ERROR:", 0) == 0) {
        out.error = firstLine(output);
        return out;
    }

    out.ok = true;
    out.output = output;
    return out;
}
