#include "commands/commands.hpp"
#include "checker/checker.hpp"
#include "cli/cli.hpp"
#include "report/report.hpp"
#include "scan/correlator.hpp"
#include "scan/extractor.hpp"
#include "scan/walker.hpp"
#include "system/system.hpp"
#include "ui/ui.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>

namespace leakscan {
namespace commands {

namespace {

std::string joinList(const std::vector<std::string>& items) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) joined += ", ";
        joined += item;
    }
    return joined.empty() ? "(none)" : joined;
}

void cleanupHandoff(const core::Config& cfg) {
    if (cfg.keepTempFile) {
        core::info(cfg, "Gathered values kept in " + cfg.handoffPath);
        return;
    }
    if (checker::removeHandoffFile(cfg)) {
        core::debug(cfg, "Cleaned up temporary file " + cfg.handoffPath);
    }
}

void reportUnparsable(const core::Config& cfg) {
    if (cfg.verbose && !cfg.json) {
        std::cout << "Error parsing results, showing raw output:" << std::endl;
        int rc = checker::showRawResults(cfg);
        if (rc != 0) {
            core::debug(cfg, cfg.checkerCommand + " exited with code " + std::to_string(rc));
        }
    } else {
        core::warn(cfg, "Error checking secrets - run with --verbose for details");
    }
}

} // namespace

int runScan(const core::Config& cfg, scan::CollectorSources sources, std::ostream& out) {
    report::printHeader(cfg, out);
    report::printSettings(cfg, out);

    scan::Collector collector(cfg, std::move(sources));
    report::ProgressPrinter printer(cfg);
    collector.setProgressCallback([&printer](scan::ProgressPhase phase, const scan::GatherStats& stats) {
        printer(phase, stats);
    });

    scan::CollectResult result = collector.collect();
    printer.finish();

    report::printGatherSummary(cfg, result.stats, out);
    report::printPartialNotice(cfg, result, out);

    checker::HandoffSummary handoff = checker::writeHandoffFile(cfg.handoffPath, result.records, cfg.minChars);
    if (!handoff.written) {
        core::warn(cfg, "Could not write gathered values to " + cfg.handoffPath);
        return 1;
    }
    if (!cfg.json) {
        out << ui::colorize(report::checkingLine(handoff, cfg.minChars), ui::Colors::BRIGHT_BLUE) << std::endl;
    }

    system::ProcessResult proc = checker::runChecker(cfg);
    if (!proc.launched) {
        core::warn(cfg, "Could not start " + cfg.checkerCommand);
        cleanupHandoff(cfg);
        return 1;
    }
    core::debug(cfg, cfg.checkerCommand + " exited with code " + std::to_string(proc.exitCode));

    auto parsed = checker::parseCheckerOutput(proc.output);
    if (!parsed) {
        reportUnparsable(cfg);
        cleanupHandoff(cfg);
        return 2;
    }

    checker::LeakSelection selection = checker::selectLeaks(*parsed, cfg.maxPublicOccurrences);
    std::vector<scan::CorrelatedLeak> leaks = scan::correlateAll(selection.leaks, result.records);

    if (cfg.json) {
        out << report::renderJson(cfg, result, handoff, leaks, selection.filtered);
    } else {
        report::printLeaks(cfg, leaks, selection.filtered, result.partial(), out);
    }

    cleanupHandoff(cfg);
    return 0;
}

// Individual command handlers
int cmd_scan(const core::Config& cfg, const std::vector<std::string>& args) {
    if (args.size() > 1) {
        core::error(cfg, "Unexpected argument '" + args[1] + "' (try: leakscan help)");
    }
    if (!checker::checkerAvailable(cfg)) {
        core::error(cfg, "Please install ggshield first, see https://github.com/GitGuardian/ggshield#installation");
    }
    return runScan(cfg, scan::systemSources(cfg), std::cout);
}

int cmd_extract(const core::Config& cfg, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        core::error(cfg, "Usage: leakscan extract <file>");
    }

    std::ifstream in(args[1], std::ios::binary);
    if (!in) {
        core::error(cfg, "Cannot read " + args[1]);
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    std::set<std::string> values = scan::extractAssignedValues(ss.str());
    if (cfg.json) {
        QJsonArray arr;
        for (const auto& value : values) {
            arr.append(QString::fromStdString(value));
        }
        std::cout << QJsonDocument(arr).toJson(QJsonDocument::Indented).toStdString();
        return 0;
    }

    for (const auto& value : values) {
        std::cout << value << "\n";
    }
    return 0;
}

int cmd_find(const core::Config& cfg, const std::vector<std::string>& args) {
    std::string root = args.size() > 1 ? args[1] : cfg.rootDir;
    if (!std::filesystem::is_directory(root)) {
        core::error(cfg, "Not a directory: " + root);
    }

    scan::WalkOptions options;
    options.exclusions.excluded = cfg.exclusions;
    options.exclusions.allowedHidden = cfg.allowedHiddenDirs;
    options.scanPrivateKeys = cfg.scanPrivateKeys;
    options.deadline = scan::Deadline::fromSeconds(cfg.timeoutSeconds);
    options.interrupted = system::interruptRequested;
    options.onWarning = [&cfg](const std::string& msg) { core::debug(cfg, msg); };

    scan::DirectoryWalker walker(root, options);
    QJsonArray found;
    size_t count = 0;
    scan::WalkEntry entry;
    while (walker.next(entry)) {
        ++count;
        if (cfg.json) {
            QJsonObject obj;
            obj["path"] = QString::fromStdString(entry.path.string());
            obj["kind"] = QString::fromStdString(scan::sourceTag(entry.kind));
            found.append(obj);
        } else if (cfg.verbose) {
            std::cout << entry.path.string() << "  " << ui::colorize(scan::sourceLabel(entry.kind), ui::Colors::DIM) << "\n";
        } else {
            std::cout << entry.path.string() << "\n";
        }
    }

    if (cfg.json) {
        std::cout << QJsonDocument(found).toJson(QJsonDocument::Indented).toStdString();
    } else {
        std::cerr << ui::colorize("Found " + ui::plural(count, "file") + " in " +
                                      std::to_string(options.deadline.elapsed().count()) + "ms (" +
                                      std::to_string(walker.directoriesVisited()) + " directories)",
                                  ui::Colors::DIM)
                  << std::endl;
    }

    if (walker.status() == scan::WalkStatus::TimedOut) {
        core::warn(cfg, "Timeout of " + report::timeoutDescription(cfg) + " reached, the list is incomplete");
    } else if (walker.status() == scan::WalkStatus::Interrupted) {
        core::warn(cfg, "Interrupted, the list is incomplete");
    }
    return 0;
}

int cmd_doctor(const core::Config& cfg, const std::vector<std::string>& args) {
    (void)args; // Parameter intentionally unused
    bool haveChecker = checker::checkerAvailable(cfg);
    bool haveGh = core::commandExists(cfg.githubCommand);

    std::cout << "checker: " << cfg.checkerCommand << (haveChecker ? " (found)" : " (missing)") << "\n";
    std::cout << "github cli: " << cfg.githubCommand << (haveGh ? " (found)" : " (missing, token not gathered)") << "\n";
    std::cout << "root: " << cfg.rootDir
              << (std::filesystem::is_directory(cfg.rootDir) ? "" : " (not a directory)") << "\n";
    std::cout << "handoff file: " << cfg.handoffPath << (cfg.keepTempFile ? " (kept)" : "") << "\n";
    std::cout << "timeout: " << report::timeoutDescription(cfg) << "\n";
    std::cout << "min chars: " << cfg.minChars << "\n";
    std::cout << "max public occurrences: " << cfg.maxPublicOccurrences << "\n";
    std::cout << "private keys: " << (cfg.scanPrivateKeys ? "yes" : "no") << "\n";
    std::cout << "exclusions: " << joinList(cfg.exclusions) << "\n";
    std::cout << "allowed hidden: " << joinList(cfg.allowedHiddenDirs) << "\n";

    if (!haveChecker) {
        core::warn(cfg, "Install ggshield: https://github.com/GitGuardian/ggshield#installation");
        return 1;
    }
    core::ok(cfg, "Ready to scan");
    return 0;
}

int cmd_completion(const core::Config& cfg, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        core::error(cfg, "Usage: leakscan completion <shell>\nSupported shells: bash, zsh");
    }

    std::string shell = args[1];
    if (shell == "bash") {
        cli::generateBashCompletion();
    } else if (shell == "zsh") {
        cli::generateZshCompletion();
    } else {
        core::error(cfg, "Unsupported shell: " + shell + "\nSupported shells: bash, zsh");
    }

    return 0;
}

int cmd_version(const core::Config& cfg, const std::vector<std::string>& args) {
    (void)cfg; // Parameter intentionally unused
    (void)args; // Parameter intentionally unused
    std::cout << "leakscan version " << core::LEAKSCAN_VERSION << "\n";
    return 0;
}

int cmd_help(const core::Config& cfg, const std::vector<std::string>& args) {
    (void)cfg; // Parameter intentionally unused
    (void)args; // Parameter intentionally unused
    cli::cmd_help();
    return 0;
}

} // namespace commands
} // namespace leakscan
