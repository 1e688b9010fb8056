#include "scan/correlator.hpp"
#include "core/config.hpp"

namespace leakscan {
namespace scan {

namespace {

std::string originDescriptor(const Origin& origin) {
    switch (origin.kind) {
    case SourceKind::EnvironmentVariable: return "os.environ";
    case SourceKind::GithubToken:         return "gh auth token";
    default:                              return origin.path;
    }
}

std::optional<Origin> uniqueOriginForPrefix(const std::string& name, const SecretRecords& records) {
    std::optional<Origin> found;
    for (const auto& record : records) {
        if (!core::startsWith(record.key, name)) {
            continue;
        }
        if (!found) {
            found = record.origin;
        } else if (found->kind != record.origin.kind || found->path != record.origin.path) {
            return std::nullopt;
        }
    }
    return found;
}

} // namespace

CorrelatedLeak correlate(const LeakRecord& leak, const SecretRecords& records) {
    CorrelatedLeak result;
    result.leak = leak;

    auto origin = leak.name.empty() ? std::nullopt : uniqueOriginForPrefix(leak.name, records);
    if (origin) {
        std::string prefix = makeKey(*origin, "");
        result.kind = origin->kind;
        result.kindKnown = true;
        result.path = originDescriptor(*origin);
        result.secretName = leak.name.size() > prefix.size() ? decodeKeyValue(leak.name.substr(prefix.size())) : "";
        result.confidence = DecodeConfidence::Exact;
    } else {
        DecodedKey decoded = decodeKey(leak.name);
        result.kind = decoded.kind;
        result.kindKnown = decoded.kindKnown;
        result.path = decoded.path;
        result.secretName = decoded.secretName;
        result.confidence = decoded.confidence;
    }

    result.sourceLabel = result.kindKnown ? sourceLabel(result.kind) : "Unknown";
    return result;
}

std::vector<CorrelatedLeak> correlateAll(const std::vector<LeakRecord>& leaks,
                                         const SecretRecords& records) {
    std::vector<CorrelatedLeak> correlated;
    correlated.reserve(leaks.size());
    for (const auto& leak : leaks) {
        correlated.push_back(correlate(leak, records));
    }
    return correlated;
}

} // namespace scan
} // namespace leakscan
