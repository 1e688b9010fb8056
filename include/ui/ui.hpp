#pragma once

#include <cstddef>
#include <string>

namespace leakscan {
namespace ui {

// Colors namespace
namespace Colors {
    extern const std::string RESET;
    extern const std::string BOLD;
    extern const std::string DIM;

    // Bright colors
    extern const std::string BRIGHT_RED;
    extern const std::string BRIGHT_GREEN;
    extern const std::string BRIGHT_YELLOW;
    extern const std::string BRIGHT_BLUE;
    extern const std::string BRIGHT_CYAN;
    extern const std::string BRIGHT_WHITE;
}

// Color support functions
bool isColorSupported();
std::string colorize(const std::string& text, const std::string& color);

// Status line helpers for stderr
bool isStatusLineSupported();
const std::string& spinnerFrame(size_t tick);
std::string clearLine();

// "1 leak" / "3 leaks"
std::string plural(size_t count, const std::string& noun);

} // namespace ui
} // namespace leakscan
