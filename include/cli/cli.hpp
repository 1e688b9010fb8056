#pragma once

#include "core/config.hpp"
#include <string>
#include <vector>

namespace leakscan {
namespace cli {

// Flag expansion
std::vector<std::string> expandShortFlags(const std::vector<std::string>& args);

// Flag parsing
struct ParsedFlags {
    bool ok = true;
    bool help = false;
    bool version = false;
    std::string error;
    std::vector<std::string> positional;
};

// Applies every recognized flag to cfg; anything not starting with "--" is
// returned as a positional argument.
ParsedFlags parseFlags(const std::vector<std::string>& args, core::Config& cfg);

// Help system
void cmd_help();
void showLogo();

// Shell completion generation
void generateBashCompletion();
void generateZshCompletion();

} // namespace cli
} // namespace leakscan
