#include "scan/collector.hpp"
#include "scan/extractor.hpp"
#include "system/system.hpp"
#include <QByteArray>
#include <QString>
#include <fstream>
#include <sstream>

namespace leakscan {
namespace scan {

namespace fs = std::filesystem;

namespace {

size_t lookup(const std::map<SourceKind, size_t>& counts, SourceKind kind) {
    auto it = counts.find(kind);
    return it == counts.end() ? 0 : it->second;
}

bool readWholeFile(const fs::path& path, std::string& text) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return false;
    }
    text = ss.str();
    return true;
}

bool isUtf8(const std::string& text) {
    QByteArray bytes = QByteArray::fromStdString(text);
    return QString::fromUtf8(bytes).toUtf8() == bytes;
}

} // namespace

// SecretRecords
void SecretRecords::insert(const std::string& key, const std::string& value, const Origin& origin) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        records_[it->second].value = value;
        records_[it->second].origin = origin;
        return;
    }
    index_.emplace(key, records_.size());
    records_.push_back(SecretRecord{key, value, origin});
}

const SecretRecord* SecretRecords::find(const std::string& key) const {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &records_[it->second];
}

size_t SecretRecords::countByKind(SourceKind kind) const {
    size_t count = 0;
    for (const auto& record : records_) {
        if (record.origin.kind == kind) {
            ++count;
        }
    }
    return count;
}

// GatherStats
size_t GatherStats::matched(SourceKind kind) const {
    return lookup(filesMatched, kind);
}

size_t GatherStats::withValues(SourceKind kind) const {
    return lookup(filesWithValues, kind);
}

size_t GatherStats::values(SourceKind kind) const {
    return lookup(valuesFound, kind);
}

size_t GatherStats::totalFilesMatched() const {
    size_t total = 0;
    for (const auto& entry : filesMatched) {
        total += entry.second;
    }
    return total;
}

size_t GatherStats::totalFileValues() const {
    size_t total = 0;
    for (const auto& entry : valuesFound) {
        if (hasFilePath(entry.first)) {
            total += entry.second;
        }
    }
    return total;
}

CollectorSources systemSources(const core::Config& cfg) {
    CollectorSources sources;
    sources.environment = system::environmentValues;
    sources.githubToken = [&cfg]() { return system::githubToken(cfg); };
    sources.interrupted = system::interruptRequested;
    return sources;
}

// ProgressThrottle
ProgressThrottle::ProgressThrottle(std::chrono::milliseconds interval)
    : interval_(interval), last_(std::chrono::steady_clock::now()) {}

bool ProgressThrottle::ready() {
    auto now = std::chrono::steady_clock::now();
    if (first_ || now - last_ >= interval_) {
        first_ = false;
        last_ = now;
        return true;
    }
    return false;
}

// Collector
Collector::Collector(const core::Config& cfg, CollectorSources sources)
    : cfg_(cfg),
      sources_(std::move(sources)),
      throttle_(std::chrono::milliseconds(cfg.progressIntervalMs)),
      budget_(std::chrono::seconds(cfg.timeoutSeconds > 0 ? cfg.timeoutSeconds : 0)) {}

void Collector::setProgressCallback(ProgressCallback callback) {
    progress_ = std::move(callback);
}

void Collector::setDeadline(std::chrono::milliseconds budget) {
    budget_ = budget;
}

CollectResult Collector::collect() {
    CollectResult result;
    Deadline deadline(budget_);

    collectEnvironment(result);
    if (!interrupted()) {
        collectGithubToken(result);
    }

    if (interrupted()) {
        result.outcome = CollectOutcome::Interrupted;
    } else {
        collectFiles(result, deadline);
    }

    result.stats.elapsed = deadline.elapsed();
    progress(ProgressPhase::Finished, result.stats, true);
    return result;
}

void Collector::collectEnvironment(CollectResult& result) {
    if (!sources_.environment) {
        return;
    }

    std::vector<std::string> values;
    try {
        values = sources_.environment();
    } catch (const std::exception& e) {
        core::debug(cfg_, std::string("Could not read the environment: ") + e.what());
        return;
    }

    Origin origin{SourceKind::EnvironmentVariable, ""};
    for (const auto& value : values) {
        // Keyed by value: variables sharing a value collapse into one record.
        result.records.insert(makeKey(origin, value), value, origin);
        ++result.stats.environmentVariables;
        ++result.stats.valuesFound[SourceKind::EnvironmentVariable];
    }
    progress(ProgressPhase::Environment, result.stats, true);
}

void Collector::collectGithubToken(CollectResult& result) {
    if (!sources_.githubToken) {
        return;
    }

    std::optional<std::string> token;
    try {
        token = sources_.githubToken();
    } catch (const std::exception& e) {
        core::debug(cfg_, std::string("GitHub token lookup failed: ") + e.what());
    }

    if (token && system::isGithubToken(*token)) {
        Origin origin{SourceKind::GithubToken, ""};
        result.records.insert(makeKey(origin, *token), *token, origin);
        result.stats.githubTokenFound = true;
        ++result.stats.valuesFound[SourceKind::GithubToken];
    }
    progress(ProgressPhase::GithubToken, result.stats, true);
}

void Collector::collectFiles(CollectResult& result, const Deadline& deadline) {
    WalkOptions options;
    options.exclusions.excluded = cfg_.exclusions;
    options.exclusions.allowedHidden = cfg_.allowedHiddenDirs;
    options.scanPrivateKeys = cfg_.scanPrivateKeys;
    options.deadline = deadline;
    options.interrupted = [this]() { return interrupted(); };
    options.onWarning = [this](const std::string& msg) { core::debug(cfg_, msg); };

    DirectoryWalker walker(cfg_.rootDir, options);
    progress(ProgressPhase::Searching, result.stats, true);

    WalkEntry entry;
    while (walker.next(entry)) {
        processFile(entry, result);
        result.stats.directoriesVisited = walker.directoriesVisited();
        result.stats.filesVisited = walker.filesSeen();
        progress(ProgressPhase::Scanning, result.stats, false);
    }

    result.stats.directoriesVisited = walker.directoriesVisited();
    result.stats.filesVisited = walker.filesSeen();

    switch (walker.status()) {
    case WalkStatus::TimedOut:
        result.outcome = CollectOutcome::TimedOut;
        break;
    case WalkStatus::Interrupted:
        result.outcome = CollectOutcome::Interrupted;
        break;
    default:
        result.outcome = CollectOutcome::Complete;
        break;
    }
}

void Collector::processFile(const WalkEntry& entry, CollectResult& result) {
    ++result.stats.filesMatched[entry.kind];

    std::string text;
    if (!readWholeFile(entry.path, text)) {
        ++result.stats.filesSkipped;
        core::debug(cfg_, "Failed reading " + entry.path.string());
        return;
    }
    if (text.find('\0') != std::string::npos || !isUtf8(text)) {
        ++result.stats.filesSkipped;
        core::debug(cfg_, "Skipping binary file " + entry.path.string());
        return;
    }

    Origin origin{entry.kind, entry.path.string()};
    size_t found = 0;

    try {
        if (entry.kind == SourceKind::PrivateKeyFile) {
            std::string content = core::trim(text);
            if (!content.empty()) {
                result.records.insert(makeKey(origin, PRIVATE_KEY_MARKER), content, origin);
                found = 1;
            }
        } else {
            for (const auto& value : extractAssignedValues(text)) {
                result.records.insert(makeKey(origin, value), value, origin);
                ++found;
            }
        }
    } catch (const std::exception& e) {
        ++result.stats.filesSkipped;
        core::debug(cfg_, "Failed extracting values from " + entry.path.string() + ": " + e.what());
        return;
    }

    if (found > 0) {
        ++result.stats.filesWithValues[entry.kind];
        result.stats.valuesFound[entry.kind] += found;
        core::debug(cfg_, "Found " + std::to_string(found) + " values in " + entry.path.string());
    } else {
        core::debug(cfg_, "No values found in " + entry.path.string());
    }
}

void Collector::progress(ProgressPhase phase, const GatherStats& stats, bool force) {
    if (!progress_) {
        return;
    }
    if (throttle_.ready() || force) {
        progress_(phase, stats);
    }
}

bool Collector::interrupted() const {
    return sources_.interrupted && sources_.interrupted();
}

} // namespace scan
} // namespace leakscan
