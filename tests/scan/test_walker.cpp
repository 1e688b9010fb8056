#include "gtest/gtest.h"
#include "scan/walker.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>
#include <thread>

using namespace leakscan::scan;
namespace fs = std::filesystem;

namespace {

class TempTree {
public:
    TempTree() {
        std::random_device rd;
        root_ = fs::temp_directory_path() / ("leakscan_walker_" + std::to_string(rd()));
        fs::create_directories(root_);
    }
    ~TempTree() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write(const std::string& relative, const std::string& content = "KEY=value\n") {
        fs::path p = root_ / relative;
        fs::create_directories(p.parent_path());
        std::ofstream(p) << content;
    }

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
};

WalkOptions defaultOptions() {
    WalkOptions options;
    options.exclusions.excluded = {"node_modules"};
    options.exclusions.allowedHidden = {".ssh"};
    return options;
}

std::vector<WalkEntry> walkAll(const fs::path& root, const WalkOptions& options, WalkStatus* status = nullptr) {
    DirectoryWalker walker(root, options);
    std::vector<WalkEntry> entries;
    WalkEntry entry;
    while (walker.next(entry)) {
        entries.push_back(entry);
    }
    if (status) {
        *status = walker.status();
    }
    return entries;
}

SourceKind kindOf(const std::string& name, bool scanPrivateKeys) {
    return selectFile(name, scanPrivateKeys).value_or(SourceKind::EnvironmentVariable);
}

bool containsPath(const std::vector<WalkEntry>& entries, const fs::path& path) {
    return std::any_of(entries.begin(), entries.end(),
                       [&](const WalkEntry& e) { return e.path == path; });
}

} // namespace

TEST(FileSelection, RecognizedNames) {
    ASSERT_EQ(kindOf(".npmrc", false), SourceKind::NpmrcFile);
    ASSERT_EQ(kindOf(".env", false), SourceKind::EnvFile);
    ASSERT_EQ(kindOf(".env.production", false), SourceKind::EnvFile);
    ASSERT_EQ(kindOf(".envrc", false), SourceKind::EnvFile);
    ASSERT_FALSE(selectFile(".env.example", false).has_value());
    ASSERT_FALSE(selectFile("env", false).has_value());
    ASSERT_FALSE(selectFile("README.md", false).has_value());
}

TEST(FileSelection, PrivateKeysOnlyWhenEnabled) {
    ASSERT_FALSE(selectFile("id_rsa", false).has_value());
    ASSERT_EQ(kindOf("id_rsa", true), SourceKind::PrivateKeyFile);
    ASSERT_EQ(kindOf("server.pem", true), SourceKind::PrivateKeyFile);
    ASSERT_EQ(kindOf("cert.pfx", true), SourceKind::PrivateKeyFile);
    ASSERT_FALSE(selectFile("id_rsa.pub", true).has_value());
}

TEST(ExclusionPolicyRules, HiddenDirectories) {
    ExclusionPolicy policy{{"node_modules"}, {".ssh"}};
    ASSERT_FALSE(policy.shouldDescend(".git"));
    ASSERT_FALSE(policy.shouldDescend(".cache"));
    ASSERT_TRUE(policy.shouldDescend(".ssh"));
    ASSERT_TRUE(policy.shouldDescend(".env"));
    ASSERT_TRUE(policy.shouldDescend(".envs"));
    ASSERT_FALSE(policy.shouldDescend("node_modules"));
    ASSERT_TRUE(policy.shouldDescend("src"));
}

TEST(ExclusionPolicyRules, GlobPatterns) {
    ExclusionPolicy policy{{"*.pyc", "build"}, {}};
    ASSERT_TRUE(policy.isExcluded("module.pyc"));
    ASSERT_TRUE(policy.isExcluded("build"));
    ASSERT_FALSE(policy.isExcluded("builder"));
}

TEST(DeadlineBehavior, ZeroBudgetNeverExpires) {
    Deadline deadline(std::chrono::milliseconds(0));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ASSERT_TRUE(deadline.unlimited());
    ASSERT_FALSE(deadline.expired());
    ASSERT_FALSE(Deadline().expired());
    ASSERT_TRUE(Deadline::fromSeconds(0).unlimited());
    ASSERT_TRUE(Deadline::fromSeconds(-3).unlimited());
}

TEST(DeadlineBehavior, ShortBudgetExpires) {
    Deadline deadline(std::chrono::milliseconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    ASSERT_TRUE(deadline.expired());
}

TEST(DirectoryWalkerTraversal, FindsCandidateFiles) {
    TempTree tree;
    tree.write(".env");
    tree.write(".npmrc", "_authToken=abc123\n");
    tree.write("project/.env.production");
    tree.write("project/.env.example");
    tree.write("project/notes.txt");

    WalkStatus status = WalkStatus::Running;
    auto entries = walkAll(tree.root(), defaultOptions(), &status);

    ASSERT_EQ(status, WalkStatus::Exhausted);
    ASSERT_EQ(entries.size(), 3u);
    ASSERT_TRUE(containsPath(entries, tree.root() / ".env"));
    ASSERT_TRUE(containsPath(entries, tree.root() / ".npmrc"));
    ASSERT_TRUE(containsPath(entries, tree.root() / "project" / ".env.production"));
    ASSERT_FALSE(containsPath(entries, tree.root() / "project" / ".env.example"));
}

TEST(DirectoryWalkerTraversal, NodeModulesIsPruned) {
    TempTree tree;
    tree.write("app/node_modules/.env", "BURIED=deep_secret\n");
    tree.write("app/node_modules/pkg/.npmrc");
    tree.write("app/.env");

    auto entries = walkAll(tree.root(), defaultOptions());

    ASSERT_EQ(entries.size(), 1u);
    ASSERT_EQ(entries[0].path.string(), (tree.root() / "app" / ".env").string());
}

TEST(DirectoryWalkerTraversal, HiddenDirectoriesArePruned) {
    TempTree tree;
    tree.write(".git/.env");
    tree.write(".config/tool/.npmrc");
    tree.write(".ssh/.env");
    tree.write(".envs/.env");

    auto entries = walkAll(tree.root(), defaultOptions());

    ASSERT_EQ(entries.size(), 2u);
    ASSERT_TRUE(containsPath(entries, tree.root() / ".ssh" / ".env"));
    ASSERT_TRUE(containsPath(entries, tree.root() / ".envs" / ".env"));
}

TEST(DirectoryWalkerTraversal, ExtendedExclusionsApplyToFilesAndDirectories) {
    TempTree tree;
    tree.write("build/.env");
    tree.write("src/.env");

    WalkOptions options = defaultOptions();
    options.exclusions.excluded.push_back("build");
    options.exclusions.excluded.push_back(".env.local");
    tree.write("src/.env.local");

    auto entries = walkAll(tree.root(), options);
    ASSERT_EQ(entries.size(), 1u);
    ASSERT_EQ(entries[0].path.string(), (tree.root() / "src" / ".env").string());
}

TEST(DirectoryWalkerTraversal, PreOrderByName) {
    TempTree tree;
    tree.write("b/.env");
    tree.write("a/inner/.env");
    tree.write("a/.env");
    tree.write(".env");

    auto entries = walkAll(tree.root(), defaultOptions());

    ASSERT_EQ(entries.size(), 4u);
    ASSERT_EQ(entries[0].path.string(), (tree.root() / ".env").string());
    ASSERT_EQ(entries[1].path.string(), (tree.root() / "a" / ".env").string());
    ASSERT_EQ(entries[2].path.string(), (tree.root() / "a" / "inner" / ".env").string());
    ASSERT_EQ(entries[3].path.string(), (tree.root() / "b" / ".env").string());
}

TEST(DirectoryWalkerTraversal, SymlinkedDirectoriesAreNotFollowed) {
    TempTree tree;
    tree.write("real/.env");
    std::error_code ec;
    fs::create_directory_symlink(tree.root() / "real", tree.root() / "link", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    }

    auto entries = walkAll(tree.root(), defaultOptions());
    ASSERT_EQ(entries.size(), 1u);
    ASSERT_EQ(entries[0].path.string(), (tree.root() / "real" / ".env").string());
}

TEST(DirectoryWalkerTraversal, MissingRootIsReportedAndExhausts) {
    std::vector<std::string> warnings;
    WalkOptions options = defaultOptions();
    options.onWarning = [&](const std::string& msg) { warnings.push_back(msg); };

    WalkStatus status = WalkStatus::Running;
    auto entries = walkAll(fs::temp_directory_path() / "leakscan_no_such_dir_4711", options, &status);

    ASSERT_TRUE(entries.empty());
    ASSERT_EQ(status, WalkStatus::Exhausted);
    ASSERT_EQ(warnings.size(), 1u);
}

TEST(DirectoryWalkerDeadline, ZeroDeadlineWalksEverything) {
    TempTree tree;
    for (int i = 0; i < 20; ++i) {
        tree.write("d" + std::to_string(i) + "/.env");
    }

    WalkOptions options = defaultOptions();
    options.deadline = Deadline(std::chrono::milliseconds(0));

    DirectoryWalker walker(tree.root(), options);
    WalkEntry entry;
    size_t count = 0;
    while (walker.next(entry)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        ++count;
    }
    ASSERT_EQ(count, 20u);
    ASSERT_EQ(walker.status(), WalkStatus::Exhausted);
}

TEST(DirectoryWalkerDeadline, ExpiryStopsAfterCurrentFile) {
    TempTree tree;
    for (int i = 0; i < 10; ++i) {
        tree.write("d" + std::to_string(i) + "/.env");
    }

    WalkOptions options = defaultOptions();
    options.deadline = Deadline(std::chrono::milliseconds(100));

    DirectoryWalker walker(tree.root(), options);
    WalkEntry entry;
    size_t count = 0;
    while (walker.next(entry)) {
        ++count;
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
    }
    ASSERT_EQ(count, 1u);
    ASSERT_EQ(walker.status(), WalkStatus::TimedOut);
    ASSERT_FALSE(walker.next(entry));
}

TEST(DirectoryWalkerInterrupt, PredicateStopsTheWalk) {
    TempTree tree;
    tree.write("a/.env");
    tree.write("b/.env");

    bool stop = false;
    WalkOptions options = defaultOptions();
    options.interrupted = [&stop]() { return stop; };

    DirectoryWalker walker(tree.root(), options);
    WalkEntry entry;
    ASSERT_TRUE(walker.next(entry));
    stop = true;
    ASSERT_FALSE(walker.next(entry));
    ASSERT_EQ(walker.status(), WalkStatus::Interrupted);
}
