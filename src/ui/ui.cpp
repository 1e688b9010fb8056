#include "ui/ui.hpp"
#include <cstdlib>
#include <vector>
#ifdef __unix__
#include <unistd.h>
#endif

namespace leakscan {
namespace ui {

namespace Colors {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string DIM = "\033[2m";

    // Bright colors
    const std::string BRIGHT_RED = "\033[91m";
    const std::string BRIGHT_GREEN = "\033[92m";
    const std::string BRIGHT_YELLOW = "\033[93m";
    const std::string BRIGHT_BLUE = "\033[94m";
    const std::string BRIGHT_CYAN = "\033[96m";
    const std::string BRIGHT_WHITE = "\033[97m";
}

namespace {

bool terminalAllowsEscapes() {
    if (getenv("NO_COLOR")) return false;
    const char* term = getenv("TERM");
    return term && std::string(term) != "dumb";
}

} // namespace

bool isColorSupported() {
#ifdef __unix__
    return terminalAllowsEscapes() && isatty(STDOUT_FILENO);
#else
    return false;
#endif
}

std::string colorize(const std::string& text, const std::string& color) {
    if (color.empty() || !isColorSupported()) return text;
    return color + text + Colors::RESET;
}

bool isStatusLineSupported() {
#ifdef __unix__
    const char* term = getenv("TERM");
    return term && std::string(term) != "dumb" && isatty(STDERR_FILENO);
#else
    return false;
#endif
}

const std::string& spinnerFrame(size_t tick) {
    static const std::vector<std::string> frames = {"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};
    return frames[tick % frames.size()];
}

std::string clearLine() {
    return "\r\033[K";
}

std::string plural(size_t count, const std::string& noun) {
    return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
}

} // namespace ui
} // namespace leakscan
