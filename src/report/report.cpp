#include "report/report.hpp"
#include "ui/ui.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>
#include <iostream>
#include <ostream>

namespace leakscan {
namespace report {

using scan::SourceKind;

namespace {

QString qstr(const std::string& s) {
    return QString::fromStdString(s);
}

std::string seconds(std::chrono::milliseconds elapsed) {
    return std::to_string(elapsed.count() / 1000) + "s";
}

void printFileLine(const std::string& branch, const std::string& label, SourceKind kind,
                   const scan::GatherStats& stats, std::ostream& out) {
    out << "   " << branch << " " << label << ": " << stats.matched(kind) << " found, "
        << stats.withValues(kind) << " with secrets (" << stats.values(kind) << " values)\n";
}

QJsonObject statsToJson(const scan::GatherStats& stats) {
    QJsonObject obj;
    obj["directories_visited"] = static_cast<qint64>(stats.directoriesVisited);
    obj["files_visited"] = static_cast<qint64>(stats.filesVisited);
    obj["files_skipped"] = static_cast<qint64>(stats.filesSkipped);
    obj["environment_variables"] = static_cast<qint64>(stats.environmentVariables);
    obj["github_token_found"] = stats.githubTokenFound;
    obj["elapsed_ms"] = static_cast<qint64>(stats.elapsed.count());

    QJsonObject sources;
    for (SourceKind kind : scan::allSourceKinds()) {
        if (!scan::hasFilePath(kind)) {
            continue;
        }
        QJsonObject source;
        source["files_matched"] = static_cast<qint64>(stats.matched(kind));
        source["files_with_values"] = static_cast<qint64>(stats.withValues(kind));
        source["values"] = static_cast<qint64>(stats.values(kind));
        sources[qstr(scan::sourceTag(kind))] = source;
    }
    obj["sources"] = sources;
    return obj;
}

QJsonObject leakToJson(const scan::CorrelatedLeak& leak) {
    QJsonObject obj;
    obj["name"] = qstr(leak.secretName);
    obj["key"] = qstr(leak.leak.name);
    obj["source"] = qstr(leak.sourceLabel);
    obj["kind"] = leak.kindKnown ? qstr(scan::sourceTag(leak.kind)) : QString("UNKNOWN");
    obj["path"] = qstr(leak.path);
    obj["hash"] = qstr(leak.leak.hash);
    obj["count"] = leak.leak.count;
    if (leak.leak.url) {
        obj["url"] = qstr(*leak.leak.url);
    }
    obj["attribution"] = qstr(scan::confidenceName(leak.confidence));
    return obj;
}

} // namespace

std::string outcomeName(scan::CollectOutcome outcome) {
    switch (outcome) {
    case scan::CollectOutcome::Complete:    return "complete";
    case scan::CollectOutcome::TimedOut:    return "timed_out";
    case scan::CollectOutcome::Interrupted: return "interrupted";
    }
    return "complete";
}

std::string timeoutDescription(const core::Config& cfg) {
    return cfg.timeoutSeconds > 0 ? std::to_string(cfg.timeoutSeconds) + "s" : "unlimited";
}

// Text rendering
void printHeader(const core::Config& cfg, std::ostream& out) {
    if (cfg.json) return;
    out << ui::colorize("🔍 leakscan - Detecting leaked secrets", ui::Colors::BRIGHT_WHITE + ui::Colors::BOLD) << "\n";
    out << ui::colorize("🔒 All processing occurs locally, no secrets transmitted", ui::Colors::DIM) << "\n";
}

void printSettings(const core::Config& cfg, std::ostream& out) {
    if (cfg.json || !cfg.verbose) return;
    out << "\n⚙️  Settings: min-chars=" << cfg.minChars
        << ", timeout=" << timeoutDescription(cfg)
        << ", keep-temp-file=" << (cfg.keepTempFile ? "yes" : "no")
        << ", max-public-occurrences=" << cfg.maxPublicOccurrences
        << ", private-keys=" << (cfg.scanPrivateKeys ? "yes" : "no") << "\n";
    out << "📁 Scanning " << cfg.rootDir << " ("
        << (cfg.timeoutSeconds > 0 ? "timeout: " + timeoutDescription(cfg) : std::string("no timeout"))
        << ")...\n\n";
}

void printGatherSummary(const core::Config& cfg, const scan::GatherStats& stats, std::ostream& out) {
    if (cfg.json) return;
    out << "   ├─ Environment variables: " << stats.environmentVariables << " found\n";
    out << "   ├─ GitHub token: " << (stats.githubTokenFound ? "found" : "not found") << "\n";
    printFileLine("├─", "Configuration files", SourceKind::NpmrcFile, stats, out);
    if (cfg.scanPrivateKeys) {
        printFileLine("├─", "Environment files", SourceKind::EnvFile, stats, out);
        printFileLine("└─", "Private key files", SourceKind::PrivateKeyFile, stats, out);
    } else {
        printFileLine("└─", "Environment files", SourceKind::EnvFile, stats, out);
    }
    if (cfg.verbose) {
        out << ui::colorize("   " + std::to_string(stats.directoriesVisited) + " directories, " +
                                std::to_string(stats.filesVisited) + " files visited, " +
                                std::to_string(stats.filesSkipped) + " skipped in " + seconds(stats.elapsed),
                            ui::Colors::DIM)
            << "\n";
    }
}

void printPartialNotice(const core::Config& cfg, const scan::CollectResult& result, std::ostream& out) {
    if (cfg.json || !result.partial()) return;
    size_t processed = result.stats.totalFilesMatched();
    if (result.outcome == scan::CollectOutcome::TimedOut) {
        out << ui::colorize("⏰ Timeout of " + timeoutDescription(cfg) + " reached after processing " +
                                ui::plural(processed, "file") +
                                ". Not all files were scanned. To scan more files, specify a bigger "
                                "timeout with the --timeout option",
                            ui::Colors::BRIGHT_YELLOW)
            << "\n";
    } else {
        out << ui::colorize("⏹️  Scan interrupted by user after processing " + ui::plural(processed, "file") +
                                ". Only the values gathered so far are checked",
                            ui::Colors::BRIGHT_YELLOW)
            << "\n";
    }
}

std::string checkingLine(const checker::HandoffSummary& handoff, size_t minChars) {
    std::string line = "🔍 Checking " + ui::plural(handoff.selected, "value") + " against public leak database";
    if (handoff.filteredShort > 0) {
        line += " (" + std::to_string(handoff.filteredShort) + " filtered, < " + std::to_string(minChars) + " chars)";
    }
    return line + "...";
}

void printLeak(size_t index, const scan::CorrelatedLeak& leak, std::ostream& out) {
    out << ui::colorize("🔑 Secret #" + std::to_string(index), ui::Colors::BRIGHT_RED + ui::Colors::BOLD) << "\n";
    out << "   Name: " << leak.secretName << "\n";
    out << "   Source: " << leak.sourceLabel << "\n";
    out << "   Path: " << leak.path << "\n";
    if (leak.confidence != scan::DecodeConfidence::Exact) {
        out << ui::colorize("   Attribution: " + scan::confidenceName(leak.confidence) +
                                " (origin rebuilt from the reported name)",
                            ui::Colors::DIM)
            << "\n";
    }
    out << "   Hash: " << leak.leak.hash << "\n";
    out << "   Locations: " << leak.leak.count << " distinct Public GitHub repositories\n";
    if (leak.leak.url) {
        out << "   First seen: " << *leak.leak.url << " (only first location shown for security)\n";
    }
    out << "\n";
}

void printLeaks(const core::Config& cfg, const std::vector<scan::CorrelatedLeak>& leaks,
                int filteredCommon, bool partial, std::ostream& out) {
    if (cfg.json) return;

    if (filteredCommon > 0) {
        out << ui::colorize("ℹ️  Filtered out " + ui::plural(static_cast<size_t>(filteredCommon), "leak") +
                                " with high public occurrence count (≥" +
                                std::to_string(cfg.maxPublicOccurrences) + ")",
                            ui::Colors::BRIGHT_CYAN)
            << "\n";
    }

    if (leaks.empty()) {
        if (partial) {
            out << ui::colorize("✅ No leaked secrets among the values gathered, but the scan was cut short.",
                                ui::Colors::BRIGHT_YELLOW)
                << "\n";
        } else {
            out << ui::colorize("✅ All clear! No leaked secrets found.", ui::Colors::BRIGHT_GREEN) << "\n";
        }
        return;
    }

    out << ui::colorize("⚠️  Found " + ui::plural(leaks.size(), "leaked secret"), ui::Colors::BRIGHT_YELLOW + ui::Colors::BOLD)
        << "\n\n";
    for (size_t i = 0; i < leaks.size(); ++i) {
        printLeak(i + 1, leaks[i], out);
    }
    out << "💡 Note: Results may include false positives (non-secret values matching leak patterns).\n";
    out << "   Always verify results before taking action. If confirmed as real secrets:\n";
    out << "   1. Immediately revoke and rotate the credential\n";
    out << "   2. Review when the leak occurred and what systems may be compromised\n";
    if (partial) {
        out << ui::colorize("   The scan was cut short, more leaked secrets may exist.", ui::Colors::BRIGHT_YELLOW) << "\n";
    }
}

// Machine-readable rendering
std::string renderJson(const core::Config& cfg, const scan::CollectResult& result,
                       const checker::HandoffSummary& handoff,
                       const std::vector<scan::CorrelatedLeak>& leaks, int filteredCommon) {
    QJsonObject root;
    root["version"] = qstr(core::LEAKSCAN_VERSION);
    root["root"] = qstr(cfg.rootDir);
    root["outcome"] = qstr(outcomeName(result.outcome));
    root["partial"] = result.partial();
    root["stats"] = statsToJson(result.stats);
    root["checked"] = static_cast<qint64>(handoff.selected);
    root["filtered_short"] = static_cast<qint64>(handoff.filteredShort);
    root["filtered_common"] = filteredCommon;

    QJsonArray leakArray;
    for (const auto& leak : leaks) {
        leakArray.append(leakToJson(leak));
    }
    root["leaks_count"] = static_cast<qint64>(leaks.size());
    root["leaks"] = leakArray;

    return QJsonDocument(root).toJson(QJsonDocument::Indented).toStdString();
}

// Progress
ProgressPrinter::ProgressPrinter(const core::Config& cfg)
    : enabled_(!cfg.json && !cfg.verbose && ui::isStatusLineSupported()),
      start_(std::chrono::steady_clock::now()) {}

void ProgressPrinter::operator()(scan::ProgressPhase phase, const scan::GatherStats& stats) {
    if (!enabled_) return;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_);
    std::string line;
    switch (phase) {
    case scan::ProgressPhase::Environment:
        line = "Reading environment...";
        break;
    case scan::ProgressPhase::GithubToken:
        line = "Asking gh for a token...";
        break;
    case scan::ProgressPhase::Searching:
        line = "Searching directories... (" + seconds(elapsed) + ")";
        break;
    case scan::ProgressPhase::Scanning:
        line = "Scanning... " + std::to_string(stats.totalFilesMatched()) + " files processed (" +
               seconds(elapsed) + ")";
        break;
    case scan::ProgressPhase::Finished:
        finish();
        return;
    }

    std::cerr << ui::clearLine() << ui::spinnerFrame(tick_++) << " " << line << std::flush;
    dirty_ = true;
}

void ProgressPrinter::finish() {
    if (!dirty_) return;
    std::cerr << ui::clearLine() << std::flush;
    dirty_ = false;
}

} // namespace report
} // namespace leakscan
