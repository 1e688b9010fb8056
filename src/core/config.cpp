#include "core/config.hpp"
#include "system/system.hpp"
#include "ui/ui.hpp"
#include <iostream>
#include <cstdlib>

namespace leakscan {
namespace core {

// Version information
#ifndef LEAKSCAN_VERSION_STRING
#define LEAKSCAN_VERSION_STRING "1.3.0"
#endif
const std::string LEAKSCAN_VERSION = LEAKSCAN_VERSION_STRING;

const std::string DEFAULT_HANDOFF_FILE = "gg_gathered_values";

std::vector<std::string> defaultExclusions() {
    return {"node_modules"};
}

std::vector<std::string> extendedExclusions() {
    return {"node_modules", ".git", "__pycache__", "*.pyc", "dist", "build", "target", ".DS_Store"};
}

std::vector<std::string> defaultAllowedHiddenDirs() {
    return {".ssh"};
}

Config defaultConfig() {
    Config cfg;
    cfg.rootDir = system::targetHomeDirectory();
    cfg.handoffPath = DEFAULT_HANDOFF_FILE;
    cfg.exclusions = defaultExclusions();
    cfg.allowedHiddenDirs = defaultAllowedHiddenDirs();
    return cfg;
}

void applyEnvironment(Config& cfg) {
    std::string root = getenvs("LEAKSCAN_ROOT");
    if (!root.empty()) {
        cfg.rootDir = root;
    }
    std::string checker = getenvs("LEAKSCAN_CHECKER");
    if (!checker.empty()) {
        cfg.checkerCommand = checker;
    }
    if (getenv("LEAKSCAN_KEEP_TEMP_FILE")) {
        cfg.keepTempFile = true;
    }
    if (getenv("LEAKSCAN_PRIVATE_KEYS")) {
        cfg.scanPrivateKeys = true;
    }
}

// Utility functions
bool commandExists(const std::string& cmd) {
    std::string command = "command -v '" + cmd + "' >/dev/null 2>&1";
    return ::system(command.c_str()) == 0;
}

std::string getenvs(const char* key, const std::string& defaultValue) {
    const char* val = std::getenv(key);
    return val ? std::string(val) : defaultValue;
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(first, (last - first + 1));
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Error handling and output
void error(const Config& /* cfg */, const std::string& msg, int code) {
    std::cerr << ui::colorize("❌ " + msg, ui::Colors::BRIGHT_RED) << std::endl;
    exit(code);
}

void ok(const Config& cfg, const std::string& msg) {
    if (cfg.json) return;
    std::cout << ui::colorize("✅ " + msg, ui::Colors::BRIGHT_GREEN) << std::endl;
}

void warn(const Config& cfg, const std::string& msg) {
    if (cfg.json) {
        std::cerr << "⚠️  " << msg << std::endl;
        return;
    }
    std::cout << ui::colorize("⚠️  " + msg, ui::Colors::BRIGHT_YELLOW) << std::endl;
}

void info(const Config& cfg, const std::string& msg) {
    if (cfg.json) return;
    std::cout << ui::colorize("ℹ️  " + msg, ui::Colors::BRIGHT_CYAN) << std::endl;
}

void debug(const Config& cfg, const std::string& msg) {
    if (!cfg.verbose) return;
    std::cerr << ui::colorize("   " + msg, ui::Colors::DIM) << std::endl;
}

} // namespace core
} // namespace leakscan
