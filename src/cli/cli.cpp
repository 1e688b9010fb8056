#include "cli/cli.hpp"
#include "ui/ui.hpp"
#include <algorithm>
#include <iostream>
#include <vector>
#include <string>

namespace leakscan {
namespace cli {

namespace {

bool parseCount(const std::string& flag, const std::string& text, int& value, std::string& error) {
    try {
        size_t used = 0;
        int parsed = std::stoi(text, &used);
        if (used != text.size() || parsed < 0) {
            error = "Invalid value for " + flag + ": " + text;
            return false;
        }
        value = parsed;
        return true;
    } catch (const std::exception&) {
        error = "Invalid value for " + flag + ": " + text;
        return false;
    }
}

void addUnique(std::vector<std::string>& list, const std::string& value) {
    if (std::find(list.begin(), list.end(), value) == list.end()) {
        list.push_back(value);
    }
}

} // namespace

// Flag expansion
std::vector<std::string> expandShortFlags(const std::vector<std::string>& args) {
    std::vector<std::string> expanded;
    expanded.reserve(args.size() * 2); // Reserve extra space for expanded flags

    for (const auto& arg : args) {
        if (arg.size() >= 2 && arg[0] == '-' && arg[1] != '-') {
            // Short flag like -vk becomes --verbose --keep-temp-file
            for (size_t i = 1; i < arg.size(); ++i) {
                char c = arg[i];
                if (c == 'v') {
                    expanded.push_back("--verbose");
                } else if (c == 'h') {
                    expanded.push_back("--help");
                } else if (c == 't') {
                    expanded.push_back("--timeout");
                } else if (c == 'k') {
                    expanded.push_back("--keep-temp-file");
                } else if (c == 'r') {
                    expanded.push_back("--root");
                } else {
                    // Unknown short flag, keep as is
                    expanded.push_back(std::string("-") + c);
                }
            }
        } else {
            expanded.push_back(arg);
        }
    }

    return expanded;
}

// Flag parsing
ParsedFlags parseFlags(const std::vector<std::string>& args, core::Config& cfg) {
    ParsedFlags parsed;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string flag = args[i];
        std::string inlineValue;
        bool hasInlineValue = false;

        size_t eq = flag.find('=');
        if (core::startsWith(flag, "--") && eq != std::string::npos) {
            inlineValue = flag.substr(eq + 1);
            flag = flag.substr(0, eq);
            hasInlineValue = true;
        }

        // --flag value or --flag=value
        auto takeValue = [&](std::string& out) {
            if (hasInlineValue) {
                out = inlineValue;
            } else if (i + 1 < args.size()) {
                out = args[++i];
            } else {
                parsed.error = "Missing value for " + flag;
                return false;
            }
            if (out.empty()) {
                parsed.error = "Empty value for " + flag;
                return false;
            }
            return true;
        };

        if (flag == "--verbose") {
            cfg.verbose = true;
        } else if (flag == "--json") {
            cfg.json = true;
        } else if (flag == "--help") {
            parsed.help = true;
        } else if (flag == "--version") {
            parsed.version = true;
        } else if (flag == "--keep-temp-file") {
            cfg.keepTempFile = true;
        } else if (flag == "--private-keys") {
            cfg.scanPrivateKeys = true;
        } else if (flag == "--extended-exclusions") {
            for (const auto& name : core::extendedExclusions()) {
                addUnique(cfg.exclusions, name);
            }
        } else if (flag == "--timeout" || flag == "--min-chars" || flag == "--max-public-occurrences") {
            std::string text;
            int number = 0;
            if (!takeValue(text) || !parseCount(flag, text, number, parsed.error)) {
                parsed.ok = false;
                return parsed;
            }
            if (flag == "--timeout") {
                cfg.timeoutSeconds = number;
            } else if (flag == "--min-chars") {
                cfg.minChars = static_cast<size_t>(number);
            } else {
                cfg.maxPublicOccurrences = number;
            }
        } else if (flag == "--root" || flag == "--exclude" || flag == "--allow-hidden" ||
                   flag == "--handoff-file") {
            std::string text;
            if (!takeValue(text)) {
                parsed.ok = false;
                return parsed;
            }
            if (flag == "--root") {
                cfg.rootDir = text;
            } else if (flag == "--exclude") {
                addUnique(cfg.exclusions, text);
            } else if (flag == "--allow-hidden") {
                addUnique(cfg.allowedHiddenDirs, text);
            } else {
                cfg.handoffPath = text;
            }
        } else if (flag.size() > 1 && flag[0] == '-') {
            parsed.ok = false;
            parsed.error = "Unknown option '" + args[i] + "'";
            return parsed;
        } else {
            parsed.positional.push_back(args[i]);
        }
    }

    return parsed;
}

// Help system
void showLogo() {
    if (!ui::isColorSupported()) {
        std::cout << "leakscan - Local Secret Leak Scanner\n\n";
        return;
    }

    std::cout << ui::colorize("    🔍 ", "") << ui::colorize("leakscan", ui::Colors::BRIGHT_CYAN + ui::Colors::BOLD) << "\n";
    std::cout << ui::colorize("    🔒 ", "") << ui::colorize("Your secrets never leave this machine", ui::Colors::BRIGHT_GREEN) << "\n\n";
}

void cmd_help() {
    showLogo();

    std::cout << ui::colorize("USAGE:", ui::Colors::BRIGHT_WHITE + ui::Colors::BOLD) << "\n";
    std::cout << "  " << ui::colorize("leakscan", ui::Colors::BRIGHT_CYAN) << " [command] [options]\n\n";

    std::cout << ui::colorize("COMMANDS:", ui::Colors::BRIGHT_GREEN + ui::Colors::BOLD) << "\n";
    std::cout << "  " << ui::colorize("leakscan scan", ui::Colors::BRIGHT_CYAN) << "                 Gather local secrets and check them for public leaks (default)\n";
    std::cout << "  " << ui::colorize("leakscan extract <file>", ui::Colors::BRIGHT_CYAN) << "       Print the values that would be gathered from a file\n";
    std::cout << "  " << ui::colorize("leakscan find [path]", ui::Colors::BRIGHT_CYAN) << "          List the candidate files under a directory\n";
    std::cout << "  " << ui::colorize("leakscan doctor", ui::Colors::BRIGHT_CYAN) << "               Check for required tools and show settings\n";
    std::cout << "  " << ui::colorize("leakscan completion <shell>", ui::Colors::BRIGHT_CYAN) << "   Generate shell completion script (bash, zsh)\n";
    std::cout << "  " << ui::colorize("leakscan version", ui::Colors::BRIGHT_CYAN) << "              Show version information\n";
    std::cout << "  " << ui::colorize("leakscan help", ui::Colors::BRIGHT_CYAN) << "                 Show this help message\n\n";

    std::cout << ui::colorize("OPTIONS:", ui::Colors::BRIGHT_BLUE + ui::Colors::BOLD) << "\n";
    std::cout << "  " << ui::colorize("-t, --timeout <seconds>", ui::Colors::BRIGHT_CYAN) << "       Stop searching the disk after this long (0 = unlimited, default)\n";
    std::cout << "  " << ui::colorize("--min-chars <n>", ui::Colors::BRIGHT_CYAN) << "               Ignore values shorter than n characters (default 5)\n";
    std::cout << "  " << ui::colorize("--max-public-occurrences <n>", ui::Colors::BRIGHT_CYAN) << "  Only report leaks seen in fewer than n repositories (default 10)\n";
    std::cout << "  " << ui::colorize("-k, --keep-temp-file", ui::Colors::BRIGHT_CYAN) << "          Keep the gathered values file after checking\n";
    std::cout << "  " << ui::colorize("-r, --root <dir>", ui::Colors::BRIGHT_CYAN) << "              Directory to scan (default: your home directory)\n";
    std::cout << "  " << ui::colorize("--private-keys", ui::Colors::BRIGHT_CYAN) << "                Also gather private key files (id_rsa, *.pem, ...)\n";
    std::cout << "  " << ui::colorize("--exclude <name>", ui::Colors::BRIGHT_CYAN) << "              Never visit entries matching this glob (repeatable)\n";
    std::cout << "  " << ui::colorize("--extended-exclusions", ui::Colors::BRIGHT_CYAN) << "         Also skip .git, build output and caches\n";
    std::cout << "  " << ui::colorize("--allow-hidden <name>", ui::Colors::BRIGHT_CYAN) << "         Visit this hidden directory (default: .ssh)\n";
    std::cout << "  " << ui::colorize("--handoff-file <path>", ui::Colors::BRIGHT_CYAN) << "         Where gathered values are written for the checker\n";
    std::cout << "  " << ui::colorize("--json", ui::Colors::BRIGHT_CYAN) << "                        Print a JSON report\n";
    std::cout << "  " << ui::colorize("-v, --verbose", ui::Colors::BRIGHT_CYAN) << "                 Show detailed scanning progress\n\n";

    std::cout << ui::colorize("ENVIRONMENT:", ui::Colors::BRIGHT_YELLOW + ui::Colors::BOLD) << "\n";
    std::cout << "  LEAKSCAN_ROOT, LEAKSCAN_CHECKER, LEAKSCAN_KEEP_TEMP_FILE, LEAKSCAN_PRIVATE_KEYS\n\n";

    std::cout << ui::colorize("Requires ggshield: ", ui::Colors::DIM)
              << ui::colorize("https://github.com/GitGuardian/ggshield#installation", ui::Colors::BRIGHT_BLUE) << "\n";
}

// Shell completion generation
void generateBashCompletion() {
    std::cout << R"(#!/bin/bash
# Bash completion for leakscan

_leakscan_completion() {
    local cur prev
    COMPREPLY=()
    cur="${COMP_WORDS[COMP_CWORD]}"
    prev="${COMP_WORDS[COMP_CWORD-1]}"

    local commands="scan extract find doctor completion version help"
    local flags="--timeout --min-chars --max-public-occurrences --keep-temp-file --root --private-keys --exclude --extended-exclusions --allow-hidden --handoff-file --json --verbose --help --version"

    case "${prev}" in
        completion)
            COMPREPLY=($(compgen -W "bash zsh" -- ${cur}))
            return 0
            ;;
        extract|--handoff-file)
            COMPREPLY=($(compgen -f -- ${cur}))
            return 0
            ;;
        find|--root|-r)
            COMPREPLY=($(compgen -d -- ${cur}))
            return 0
            ;;
        --timeout|-t|--min-chars|--max-public-occurrences|--exclude|--allow-hidden)
            return 0
            ;;
    esac

    if [[ ${COMP_CWORD} -eq 1 && ${cur} != -* ]]; then
        COMPREPLY=($(compgen -W "${commands}" -- ${cur}))
        return 0
    fi

    COMPREPLY=($(compgen -W "${flags}" -- ${cur}))
}

complete -F _leakscan_completion leakscan
)";
}

void generateZshCompletion() {
    std::cout << R"ZSH(#compdef leakscan
# Zsh completion for leakscan

_arguments -C \
  '(-h --help)'{-h,--help}'[Show help information]' \
  '--version[Show version information]' \
  '(-v --verbose)'{-v,--verbose}'[Show detailed scanning progress]' \
  '(-t --timeout)'{-t,--timeout}'[Seconds before the disk search stops]:seconds:' \
  '--min-chars[Ignore shorter values]:count:' \
  '--max-public-occurrences[Report leaks seen in fewer repositories]:count:' \
  '(-k --keep-temp-file)'{-k,--keep-temp-file}'[Keep the gathered values file]' \
  '(-r --root)'{-r,--root}'[Directory to scan]:directory:_files -/' \
  '--private-keys[Also gather private key files]' \
  '*--exclude[Skip entries matching glob]:glob:' \
  '--extended-exclusions[Also skip .git, build output and caches]' \
  '*--allow-hidden[Visit hidden directory]:name:' \
  '--handoff-file[Gathered values file]:file:_files' \
  '--json[Print a JSON report]' \
  '1:command:(scan extract find doctor completion version help)' \
  '*::arg:->args'

case $state in
  args)
    case $words[1] in
      extract)
        _files
        ;;
      find)
        _files -/
        ;;
      completion)
        _values 'shell' bash zsh
        ;;
    esac
  ;;
esac
)ZSH";
}

} // namespace cli
} // namespace leakscan
