#pragma once

#include "checker/checker.hpp"
#include "core/config.hpp"
#include "scan/collector.hpp"
#include "scan/correlator.hpp"
#include <chrono>
#include <iosfwd>
#include <string>
#include <vector>

namespace leakscan {
namespace report {

std::string outcomeName(scan::CollectOutcome outcome);
std::string timeoutDescription(const core::Config& cfg);

// Text rendering
void printHeader(const core::Config& cfg, std::ostream& out);
void printSettings(const core::Config& cfg, std::ostream& out);
void printGatherSummary(const core::Config& cfg, const scan::GatherStats& stats, std::ostream& out);
void printPartialNotice(const core::Config& cfg, const scan::CollectResult& result, std::ostream& out);
std::string checkingLine(const checker::HandoffSummary& handoff, size_t minChars);
void printLeak(size_t index, const scan::CorrelatedLeak& leak, std::ostream& out);
void printLeaks(const core::Config& cfg, const std::vector<scan::CorrelatedLeak>& leaks,
                int filteredCommon, bool partial, std::ostream& out);

// Machine-readable rendering
std::string renderJson(const core::Config& cfg, const scan::CollectResult& result,
                       const checker::HandoffSummary& handoff,
                       const std::vector<scan::CorrelatedLeak>& leaks, int filteredCommon);

// Spinner on stderr fed by the collector's progress callback. Silent in
// JSON and verbose modes and when stderr is not a terminal.
class ProgressPrinter {
public:
    explicit ProgressPrinter(const core::Config& cfg);

    void operator()(scan::ProgressPhase phase, const scan::GatherStats& stats);
    void finish();

private:
    bool enabled_;
    bool dirty_ = false;
    size_t tick_ = 0;
    std::chrono::steady_clock::time_point start_;
};

} // namespace report
} // namespace leakscan
