#pragma once

#include <string>
#include <vector>

namespace leakscan {
namespace core {

// Version
extern const std::string LEAKSCAN_VERSION;

// Default name of the hand-off file given to the checker
extern const std::string DEFAULT_HANDOFF_FILE;

// Configuration structure
struct Config {
    std::string rootDir;                 // $LEAKSCAN_ROOT or the target user's home
    std::string checkerCommand = "ggshield"; // $LEAKSCAN_CHECKER
    std::string githubCommand = "gh";
    std::string handoffPath;             // gg_gathered_values in the working directory
    int timeoutSeconds = 0;              // 0 = unlimited
    int githubTimeoutSeconds = 5;
    int progressIntervalMs = 200;
    size_t minChars = 5;
    int maxPublicOccurrences = 10;
    bool keepTempFile = false;           // LEAKSCAN_KEEP_TEMP_FILE
    bool verbose = false;
    bool json = false;
    bool scanPrivateKeys = false;        // LEAKSCAN_PRIVATE_KEYS
    std::vector<std::string> exclusions;        // directory/file globs never visited
    std::vector<std::string> allowedHiddenDirs; // hidden directories still descended into
};

// Exclusion presets
std::vector<std::string> defaultExclusions();
std::vector<std::string> extendedExclusions();
std::vector<std::string> defaultAllowedHiddenDirs();

// Configuration loading
Config defaultConfig();
void applyEnvironment(Config& cfg);

// Utility functions
bool commandExists(const std::string& cmd);
std::string getenvs(const char* key, const std::string& defaultValue = "");
std::string trim(const std::string& str);
bool startsWith(const std::string& str, const std::string& prefix);
bool endsWith(const std::string& str, const std::string& suffix);

// Error handling and output
void error(const Config& cfg, const std::string& msg, int code = 1);
void ok(const Config& cfg, const std::string& msg);
void warn(const Config& cfg, const std::string& msg);
void info(const Config& cfg, const std::string& msg);
void debug(const Config& cfg, const std::string& msg);

} // namespace core
} // namespace leakscan
