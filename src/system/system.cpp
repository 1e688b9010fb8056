#include "system/system.hpp"
#include "core/config.hpp"
#include <array>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <filesystem>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <pwd.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace leakscan {
namespace system {

namespace fs = std::filesystem;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void onInterrupt(int) {
    g_interrupted = 1;
}

} // namespace

// Platform-specific file operations
#ifdef __unix__
void secureChmod(const fs::path& path, mode_t mode) {
    ::chmod(path.c_str(), mode);
}
#else
void secureChmod(const fs::path&, int) {
    // No-op on non-Unix platforms
}
#endif

void ensureSecureFile(const fs::path& path) {
    if (!fs::exists(path)) {
        std::ofstream(path.string(), std::ios::app).close();
    }
#ifdef __unix__
    secureChmod(path, 0600);
#endif
}

// Process execution
ProcessResult runProcess(const std::vector<std::string>& argv, int timeoutSeconds, bool mergeStderr) {
    ProcessResult result;
    if (argv.empty()) {
        return result;
    }

    int fds[2];
    if (pipe(fds) != 0) {
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(fds[0]);
        close(fds[1]);
        return result;
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            if (!mergeStderr) {
                dup2(devnull, STDERR_FILENO);
            }
        }
        dup2(fds[1], STDOUT_FILENO);
        if (mergeStderr) {
            dup2(fds[1], STDERR_FILENO);
        }
        close(fds[0]);
        close(fds[1]);

        std::vector<char*> cargv;
        for (const auto& s : argv) {
            cargv.push_back(const_cast<char*>(s.c_str()));
        }
        cargv.push_back(nullptr);
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    result.launched = true;
    close(fds[1]);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeoutSeconds);
    std::array<char, 4096> buffer{};
    bool killed = false;

    while (true) {
        int waitMs = -1;
        if (timeoutSeconds > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                result.timedOut = true;
                break;
            }
            waitMs = static_cast<int>(remaining.count());
        }

        pollfd pfd{fds[0], POLLIN, 0};
        int rc = poll(&pfd, 1, waitMs);
        if (rc < 0) {
            if (errno == EINTR) {
                if (interruptRequested()) {
                    break;
                }
                continue;
            }
            break;
        }
        if (rc == 0) {
            result.timedOut = true;
            break;
        }

        ssize_t bytesRead = read(fds[0], buffer.data(), buffer.size());
        if (bytesRead < 0 && errno == EINTR) {
            continue;
        }
        if (bytesRead <= 0) {
            break;
        }
        result.output.append(buffer.data(), static_cast<size_t>(bytesRead));
    }

    close(fds[0]);

    int status = 0;
    if (result.timedOut || interruptRequested()) {
        kill(pid, SIGKILL);
        killed = true;
    }
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    if (!killed && WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    return result;
}

int runInteractive(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return -1;
    }

    pid_t pid = fork();
    if (pid < 0) {
        return -1;
    }
    if (pid == 0) {
        std::vector<char*> cargv;
        for (const auto& s : argv) {
            cargv.push_back(const_cast<char*>(s.c_str()));
        }
        cargv.push_back(nullptr);
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

// Environment
std::vector<std::string> environmentValues() {
    std::vector<std::string> values;
    for (char** env = environ; env && *env; ++env) {
        const char* entry = *env;
        const char* eq = std::strchr(entry, '=');
        if (!eq) {
            continue;
        }
        values.emplace_back(eq + 1);
    }
    return values;
}

// GitHub CLI token
bool isGithubToken(const std::string& token) {
    return core::startsWith(token, "gho_") || core::startsWith(token, "ghp_");
}

std::optional<std::string> githubToken(const core::Config& cfg) {
    if (!core::commandExists(cfg.githubCommand)) {
        return std::nullopt;
    }

    ProcessResult res = runProcess({cfg.githubCommand, "auth", "token"}, cfg.githubTimeoutSeconds);
    if (!res.launched || res.timedOut || res.exitCode != 0) {
        return std::nullopt;
    }

    std::string token = core::trim(res.output);
    if (token.empty() || !isGithubToken(token)) {
        return std::nullopt;
    }
    return token;
}

// User information
std::string targetHomeDirectory() {
    std::string home;

#ifdef __unix__
    // Check if running under sudo
    const char* sudoUser = getenv("SUDO_USER");
    struct passwd* pwd = sudoUser ? getpwnam(sudoUser) : getpwuid(getuid());
    if (pwd && pwd->pw_dir) {
        home = pwd->pw_dir;
    }
    if (home.empty()) {
        home = core::getenvs("HOME", "/tmp");
    }
#else
    const char* envHome = getenv("HOME");
    if (!envHome) envHome = getenv("USERPROFILE");
    home = envHome ? envHome : "/tmp";
#endif

    return home;
}

// Interrupt handling
void installInterruptHandler() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = onInterrupt;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
}

bool interruptRequested() {
    return g_interrupted != 0;
}

void clearInterrupt() {
    g_interrupted = 0;
}

} // namespace system
} // namespace leakscan
