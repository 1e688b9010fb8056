#pragma once

#include "core/config.hpp"
#include "scan/provenance.hpp"
#include "scan/walker.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace leakscan {
namespace scan {

struct SecretRecord {
    std::string key;
    std::string value;
    Origin origin;
};

// Insertion-ordered key -> value mapping. Re-inserting a key overwrites the
// value and origin in place.
class SecretRecords {
public:
    using const_iterator = std::vector<SecretRecord>::const_iterator;

    void insert(const std::string& key, const std::string& value, const Origin& origin);
    const SecretRecord* find(const std::string& key) const;

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    size_t countByKind(SourceKind kind) const;

    const_iterator begin() const { return records_.begin(); }
    const_iterator end() const { return records_.end(); }

private:
    std::vector<SecretRecord> records_;
    std::unordered_map<std::string, size_t> index_;
};

// Counters for a single gather pass.
struct GatherStats {
    size_t directoriesVisited = 0;
    size_t filesVisited = 0;
    size_t filesSkipped = 0;
    size_t environmentVariables = 0;
    bool githubTokenFound = false;
    std::map<SourceKind, size_t> filesMatched;
    std::map<SourceKind, size_t> filesWithValues;
    std::map<SourceKind, size_t> valuesFound;
    std::chrono::milliseconds elapsed{0};

    size_t matched(SourceKind kind) const;
    size_t withValues(SourceKind kind) const;
    size_t values(SourceKind kind) const;
    size_t totalFilesMatched() const;
    size_t totalFileValues() const;
};

enum class CollectOutcome {
    Complete,
    TimedOut,
    Interrupted
};

struct CollectResult {
    SecretRecords records;
    GatherStats stats;
    CollectOutcome outcome = CollectOutcome::Complete;

    bool partial() const { return outcome != CollectOutcome::Complete; }
};

// Inputs that come from outside the filesystem walk.
struct CollectorSources {
    std::function<std::vector<std::string>()> environment;
    std::function<std::optional<std::string>()> githubToken;
    std::function<bool()> interrupted;
};

// Process environment, gh CLI and SIGINT flag.
CollectorSources systemSources(const core::Config& cfg);

enum class ProgressPhase {
    Environment,
    GithubToken,
    Searching,
    Scanning,
    Finished
};

using ProgressCallback = std::function<void(ProgressPhase, const GatherStats&)>;

// Lets an event through at most once per interval.
class ProgressThrottle {
public:
    explicit ProgressThrottle(std::chrono::milliseconds interval);
    bool ready();

private:
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_;
    bool first_ = true;
};

class Collector {
public:
    Collector(const core::Config& cfg, CollectorSources sources);

    void setProgressCallback(ProgressCallback callback);
    // Overrides cfg.timeoutSeconds; zero means unlimited.
    void setDeadline(std::chrono::milliseconds budget);

    // Never throws; deadline expiry and interrupts yield a partial result.
    CollectResult collect();

private:
    void collectEnvironment(CollectResult& result);
    void collectGithubToken(CollectResult& result);
    void collectFiles(CollectResult& result, const Deadline& deadline);
    void processFile(const WalkEntry& entry, CollectResult& result);
    void progress(ProgressPhase phase, const GatherStats& stats, bool force);
    bool interrupted() const;

    const core::Config& cfg_;
    CollectorSources sources_;
    ProgressCallback progress_;
    ProgressThrottle throttle_;
    std::chrono::milliseconds budget_;
};

} // namespace scan
} // namespace leakscan
