#pragma once

#include "scan/provenance.hpp"
#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace leakscan {
namespace scan {

// Directory pruning rules, applied before descending.
struct ExclusionPolicy {
    std::vector<std::string> excluded;      // shell globs matched against entry names
    std::vector<std::string> allowedHidden; // hidden directories that are still visited

    bool shouldDescend(const std::string& dirName) const;
    bool isExcluded(const std::string& name) const;
};

bool isPrivateKeyFileName(const std::string& fileName);

// Decides whether a file is a candidate and which source it feeds.
std::optional<SourceKind> selectFile(const std::string& fileName, bool scanPrivateKeys);

// Wall-clock budget. A zero budget never expires.
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    Deadline();
    explicit Deadline(std::chrono::milliseconds budget, Clock::time_point start = Clock::now());

    static Deadline fromSeconds(int seconds);

    bool unlimited() const;
    bool expired() const;
    std::chrono::milliseconds elapsed() const;
    std::chrono::milliseconds budget() const { return budget_; }

private:
    std::chrono::milliseconds budget_;
    Clock::time_point start_;
};

enum class WalkStatus {
    Running,
    Exhausted,
    TimedOut,
    Interrupted
};

struct WalkEntry {
    std::filesystem::path path;
    SourceKind kind = SourceKind::EnvFile;
};

struct WalkOptions {
    ExclusionPolicy exclusions;
    bool scanPrivateKeys = false;
    Deadline deadline;
    std::function<bool()> interrupted;
    std::function<void(const std::string&)> onWarning;
};

// Lazy pre-order walk: a directory's selected files are yielded before its
// subdirectories are entered, entries in name order. The deadline and the
// interrupt predicate are polled before each directory is opened and when
// next() resumes after a yielded file. Each walker is single-use.
class DirectoryWalker {
public:
    DirectoryWalker(std::filesystem::path root, WalkOptions options);

    // Returns false once the walk is over; status() tells why.
    bool next(WalkEntry& entry);

    WalkStatus status() const { return status_; }
    size_t directoriesVisited() const { return directoriesVisited_; }
    size_t filesSeen() const { return filesSeen_; }

private:
    bool checkpoint();
    void openDirectory(const std::filesystem::path& dir);
    void warn(const std::string& msg) const;

    WalkOptions options_;
    std::vector<std::filesystem::path> pendingDirs_;
    std::deque<WalkEntry> pendingFiles_;
    WalkStatus status_ = WalkStatus::Running;
    bool resumingAfterFile_ = false;
    size_t directoriesVisited_ = 0;
    size_t filesSeen_ = 0;
};

} // namespace scan
} // namespace leakscan
