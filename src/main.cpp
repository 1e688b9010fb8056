#include "core/config.hpp"
#include "commands/commands.hpp"
#include "system/system.hpp"
#include "cli/cli.hpp"
#include <iostream>
#include <vector>
#include <string>
#include <map>

using namespace leakscan;

int main(int argc, char** argv) {
    // Defaults, then environment, then command line
    core::Config cfg = core::defaultConfig();
    core::applyEnvironment(cfg);

    std::vector<std::string> rawArgs;
    rawArgs.reserve(argc - 1);
    for (int i = 1; i < argc; ++i) {
        rawArgs.push_back(argv[i]);
    }

    std::vector<std::string> expandedArgs = cli::expandShortFlags(rawArgs);

    // No command, or only flags, means scan
    std::string cmd = "scan";
    if (!expandedArgs.empty() && !expandedArgs[0].empty() && expandedArgs[0][0] != '-') {
        cmd = expandedArgs[0];
        expandedArgs.erase(expandedArgs.begin());
    }

    cli::ParsedFlags flags = cli::parseFlags(expandedArgs, cfg);
    if (!flags.ok) {
        core::error(cfg, flags.error + " (try: leakscan help)");
    }
    if (flags.help) {
        cmd = "help";
    } else if (flags.version) {
        cmd = "version";
    }

    std::vector<std::string> args;
    args.reserve(flags.positional.size() + 1);
    args.push_back(cmd);
    args.insert(args.end(), flags.positional.begin(), flags.positional.end());

    system::installInterruptHandler();

    // Command dispatch table
    std::map<std::string, commands::CommandHandler> commandMap = {
        {"scan", commands::cmd_scan},
        {"extract", commands::cmd_extract},
        {"find", commands::cmd_find},
        {"doctor", commands::cmd_doctor},
        {"completion", commands::cmd_completion},
        {"help", commands::cmd_help},
        {"version", commands::cmd_version},
    };

    auto it = commandMap.find(cmd);
    if (it != commandMap.end()) {
        return it->second(cfg, args);
    } else {
        core::error(cfg, "Unknown command '" + cmd + "' (try: leakscan help)");
        return 1;
    }
}
