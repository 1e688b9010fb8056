#pragma once

#include "scan/collector.hpp"
#include "scan/provenance.hpp"
#include <optional>
#include <string>
#include <vector>

namespace leakscan {
namespace scan {

// One leak as reported by the external checker. name is a key produced by
// makeKey, possibly cut short by the checker.
struct LeakRecord {
    std::string name;
    std::string hash;
    int count = 0;
    std::optional<std::string> url;
};

struct CorrelatedLeak {
    LeakRecord leak;
    SourceKind kind = SourceKind::EnvironmentVariable;
    bool kindKnown = false;
    std::string sourceLabel;
    std::string path;
    std::string secretName;
    DecodeConfidence confidence = DecodeConfidence::Unknown;
};

// Attributes a leak to its origin. The collected records are consulted
// first: when every record whose key starts with the leak name shares one
// origin, that origin is used as is. Otherwise the name is decoded
// heuristically with decodeKey.
CorrelatedLeak correlate(const LeakRecord& leak, const SecretRecords& records);

std::vector<CorrelatedLeak> correlateAll(const std::vector<LeakRecord>& leaks,
                                         const SecretRecords& records);

} // namespace scan
} // namespace leakscan
