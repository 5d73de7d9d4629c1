#ifndef SUBPROCESS_H
#define SUBPROCESS_H

#include <string>
#include <vector>

struct ProcessResult {
    bool started = false;
    bool timedOut = false;
    int exitCode = -1;
    std::string output;
    std::string error;
};

// Runs argv[0] (searched on PATH) with stdout and stderr captured together.
// The child is killed once timeoutMs elapses.
ProcessResult runProcess(const std::vector<std::string>& argv, int timeoutMs);

#endif
