#pragma once

#include "core/config.hpp"
#include "scan/collector.hpp"
#include "scan/correlator.hpp"
#include "system/system.hpp"
#include <optional>
#include <string>
#include <vector>

namespace leakscan {
namespace checker {

struct HandoffSummary {
    bool written = false;
    size_t selected = 0;      // records written to the file
    size_t filteredShort = 0; // records dropped for being shorter than minChars
};

struct CheckReport {
    int leaksCount = 0;
    std::vector<scan::LeakRecord> leaks;
};

struct LeakSelection {
    std::vector<scan::LeakRecord> leaks;
    int filtered = 0; // leaks dropped for being too common
};

// Hand-off file
std::string formatHandoffValue(const std::string& value);
HandoffSummary writeHandoffFile(const std::string& path, const scan::SecretRecords& records,
                                size_t minChars);
bool removeHandoffFile(const core::Config& cfg);

// Checker invocation
std::vector<std::string> checkerArgs(const core::Config& cfg);
std::vector<std::string> diagnosticArgs(const core::Config& cfg);
bool checkerAvailable(const core::Config& cfg);
system::ProcessResult runChecker(const core::Config& cfg);
int showRawResults(const core::Config& cfg);

// Result handling
std::optional<CheckReport> parseCheckerOutput(const std::string& output);
LeakSelection selectLeaks(const CheckReport& report, int maxPublicOccurrences);

} // namespace checker
} // namespace leakscan
