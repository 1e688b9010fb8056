#pragma once

#include "core/config.hpp"
#include "scan/collector.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace leakscan {
namespace commands {

// Command handler type definition
using CommandHandler = int(*)(const core::Config& cfg, const std::vector<std::string>& args);

// Individual command handlers
int cmd_scan(const core::Config& cfg, const std::vector<std::string>& args);
int cmd_extract(const core::Config& cfg, const std::vector<std::string>& args);
int cmd_find(const core::Config& cfg, const std::vector<std::string>& args);
int cmd_doctor(const core::Config& cfg, const std::vector<std::string>& args);
int cmd_completion(const core::Config& cfg, const std::vector<std::string>& args);
int cmd_version(const core::Config& cfg, const std::vector<std::string>& args);
int cmd_help(const core::Config& cfg, const std::vector<std::string>& args);

// Gather, hand off to the checker and report. Returns the process exit code:
// 0 when the checker's answer was rendered, 1 when the hand-off file could
// not be written or the checker could not be started, 2 when its output
// could not be parsed.
int runScan(const core::Config& cfg, scan::CollectorSources sources, std::ostream& out);

} // namespace commands
} // namespace leakscan
