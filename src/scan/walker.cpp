#include "scan/walker.hpp"
#include "core/config.hpp"
#include <algorithm>
#include <fnmatch.h>
#include <system_error>

namespace leakscan {
namespace scan {

namespace fs = std::filesystem;

namespace {

const std::vector<std::string>& privateKeyFileNames() {
    static const std::vector<std::string> names = {
        "id_rsa",
        "id_dsa",
        "id_ecdsa",
        "id_ed25519",
        "certificate.p12",
        "secring.gpg",
        "private_key.dat",
    };
    return names;
}

const std::vector<std::string>& privateKeySuffixes() {
    static const std::vector<std::string> suffixes = {".key", ".pem", ".p12", ".pfx"};
    return suffixes;
}

} // namespace

// Exclusion policy
bool ExclusionPolicy::isExcluded(const std::string& name) const {
    for (const auto& pattern : excluded) {
        if (::fnmatch(pattern.c_str(), name.c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}

bool ExclusionPolicy::shouldDescend(const std::string& dirName) const {
    if (!dirName.empty() && dirName.front() == '.' && !core::startsWith(dirName, ".env") &&
        std::find(allowedHidden.begin(), allowedHidden.end(), dirName) == allowedHidden.end()) {
        return false;
    }
    return !isExcluded(dirName);
}

// File selection
bool isPrivateKeyFileName(const std::string& fileName) {
    const auto& names = privateKeyFileNames();
    if (std::find(names.begin(), names.end(), fileName) != names.end()) {
        return true;
    }
    for (const auto& suffix : privateKeySuffixes()) {
        if (core::endsWith(fileName, suffix)) {
            return true;
        }
    }
    return false;
}

std::optional<SourceKind> selectFile(const std::string& fileName, bool scanPrivateKeys) {
    if (fileName == ".npmrc") {
        return SourceKind::NpmrcFile;
    }
    if (core::startsWith(fileName, ".env") && fileName.find("example") == std::string::npos) {
        return SourceKind::EnvFile;
    }
    if (scanPrivateKeys && isPrivateKeyFileName(fileName)) {
        return SourceKind::PrivateKeyFile;
    }
    return std::nullopt;
}

// Deadline
Deadline::Deadline() : budget_(0), start_(Clock::now()) {}

Deadline::Deadline(std::chrono::milliseconds budget, Clock::time_point start)
    : budget_(budget), start_(start) {}

Deadline Deadline::fromSeconds(int seconds) {
    return Deadline(std::chrono::seconds(seconds > 0 ? seconds : 0));
}

bool Deadline::unlimited() const {
    return budget_.count() <= 0;
}

bool Deadline::expired() const {
    return !unlimited() && elapsed() > budget_;
}

std::chrono::milliseconds Deadline::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_);
}

// Walker
DirectoryWalker::DirectoryWalker(fs::path root, WalkOptions options)
    : options_(std::move(options)) {
    pendingDirs_.push_back(std::move(root));
}

bool DirectoryWalker::next(WalkEntry& entry) {
    if (status_ != WalkStatus::Running) {
        return false;
    }

    if (resumingAfterFile_) {
        resumingAfterFile_ = false;
        if (!checkpoint()) {
            return false;
        }
    }

    while (true) {
        if (!pendingFiles_.empty()) {
            entry = std::move(pendingFiles_.front());
            pendingFiles_.pop_front();
            resumingAfterFile_ = true;
            return true;
        }

        if (pendingDirs_.empty()) {
            status_ = WalkStatus::Exhausted;
            return false;
        }

        fs::path dir = std::move(pendingDirs_.back());
        pendingDirs_.pop_back();

        if (!checkpoint()) {
            return false;
        }
        openDirectory(dir);
    }
}

bool DirectoryWalker::checkpoint() {
    if (options_.interrupted && options_.interrupted()) {
        status_ = WalkStatus::Interrupted;
        return false;
    }
    if (options_.deadline.expired()) {
        status_ = WalkStatus::TimedOut;
        return false;
    }
    return true;
}

void DirectoryWalker::openDirectory(const fs::path& dir) {
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        warn("Cannot open directory " + dir.string() + ": " + ec.message());
        return;
    }
    ++directoriesVisited_;

    std::vector<fs::directory_entry> entries;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        entries.push_back(*it);
    }
    if (ec) {
        warn("Error while reading " + dir.string() + ": " + ec.message());
    }

    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });

    std::vector<fs::path> subdirs;
    for (const auto& e : entries) {
        std::string name = e.path().filename().string();
        std::error_code typeEc;

        bool isLink = e.is_symlink(typeEc);
        if (!isLink && e.is_directory(typeEc)) {
            if (options_.exclusions.shouldDescend(name)) {
                subdirs.push_back(e.path());
            }
            continue;
        }

        if (!e.is_regular_file(typeEc)) {
            continue;
        }
        ++filesSeen_;

        if (options_.exclusions.isExcluded(name)) {
            continue;
        }
        auto kind = selectFile(name, options_.scanPrivateKeys);
        if (kind) {
            pendingFiles_.push_back(WalkEntry{e.path(), *kind});
        }
    }

    // Stack order: the first subdirectory by name is entered first.
    for (auto rit = subdirs.rbegin(); rit != subdirs.rend(); ++rit) {
        pendingDirs_.push_back(*rit);
    }
}

void DirectoryWalker::warn(const std::string& msg) const {
    if (options_.onWarning) {
        options_.onWarning(msg);
    }
}

} // namespace scan
} // namespace leakscan
