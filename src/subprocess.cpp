#include "subprocess.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>

namespace {
constexpr size_t kMaxCapturedBytes = 1024 * 1024;

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

int waitForChild(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}
}  // namespace

ProcessResult runProcess(const std::vector<std::string>& argv, int timeoutMs) {
    ProcessResult result;
    if (argv.empty()) {
        result.error = "empty command line";
        return result;
    }

    // Built before fork so the child only calls async-signal-safe functions.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const std::string& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int pipeFds[2] = {-1, -1};
    if (pipe2(pipeFds, O_CLOEXEC) < 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        closeFd(pipeFds[0]);
        closeFd(pipeFds[1]);
        return result;
    }

    if (pid == 0) {
        dup2(pipeFds[1], STDOUT_FILENO);
        dup2(pipeFds[1], STDERR_FILENO);
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        execvp(args[0], args.data());
        _exit(127);
    }

    closeFd(pipeFds[1]);
    result.started = true;

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(timeoutMs > 0 ? timeoutMs : 5000);
    char buffer[4096];
    bool eof = false;
    while (!eof) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                   deadline - std::chrono::steady_clock::now())
                                   .count();
        if (remaining <= 0) {
            result.timedOut = true;
            break;
        }

        struct pollfd pfd;
        pfd.fd = pipeFds[0];
        pfd.events = POLLIN;
        pfd.revents = 0;
        const int ready = poll(&pfd, 1, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error = std::string("poll failed: ") + std::strerror(errno);
            break;
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t n = read(pipeFds[0], buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            result.error = std::string("read failed: ") + std::strerror(errno);
            break;
        }
        if (n == 0) {
            eof = true;
            break;
        }
        if (result.output.size() < kMaxCapturedBytes) {
            result.output.append(buffer, static_cast<size_t>(n));
        }
    }
    closeFd(pipeFds[0]);

    if (!eof) {
        kill(pid, SIGKILL);
    }
    result.exitCode = waitForChild(pid);

    if (result.timedOut) {
        result.error = "timed out after " + std::to_string(timeoutMs) + " ms";
    } else if (result.error.empty() && result.exitCode == 127) {
        result.error = "failed to execute " + argv[0];
    }
    return result;
}
