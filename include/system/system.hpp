#pragma once

#include "core/config.hpp"
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#ifdef __unix__
#include <sys/types.h>
#endif

namespace leakscan {
namespace system {

// Platform-specific file operations
#ifdef __unix__
void secureChmod(const std::filesystem::path& path, mode_t mode);
#else
void secureChmod(const std::filesystem::path& path, int mode);
#endif

void ensureSecureFile(const std::filesystem::path& path);

// Process execution
struct ProcessResult {
    bool launched = false;
    bool timedOut = false;
    int exitCode = -1;
    std::string output;
};

// Runs argv[0] from PATH with stdin closed. stderr is discarded unless
// mergeStderr is set. timeoutSeconds <= 0 waits forever.
ProcessResult runProcess(const std::vector<std::string>& argv, int timeoutSeconds = 0,
                         bool mergeStderr = false);

// Runs argv with the terminal inherited; returns the exit code.
int runInteractive(const std::vector<std::string>& argv);

// Environment
std::vector<std::string> environmentValues();

// GitHub CLI token
bool isGithubToken(const std::string& token);
std::optional<std::string> githubToken(const core::Config& cfg);

// Home directory of the invoking user ($SUDO_USER when run through sudo)
std::string targetHomeDirectory();

// Interrupt handling (SIGINT only sets a flag; scanners poll it)
void installInterruptHandler();
bool interruptRequested();
void clearInterrupt();

} // namespace system
} // namespace leakscan
