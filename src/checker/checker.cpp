#include "checker/checker.hpp"
#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <filesystem>
#include <fstream>

namespace leakscan {
namespace checker {

namespace fs = std::filesystem;

namespace {

bool needsQuoting(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    if (value.find_first_of("\n\r") != std::string::npos) {
        return true;
    }
    return core::trim(value).size() != value.size();
}

} // namespace

// Hand-off file
std::string formatHandoffValue(const std::string& value) {
    if (!needsQuoting(value)) {
        return value;
    }
    std::string quoted = "\"";
    quoted.reserve(value.size() + 2);
    for (char c : value) {
        if (c == '\\' || c == '"') {
            quoted.push_back('\\');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

HandoffSummary writeHandoffFile(const std::string& path, const scan::SecretRecords& records,
                                size_t minChars) {
    HandoffSummary summary;

    try {
        system::ensureSecureFile(path);
    } catch (const std::exception&) {
        return summary;
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return summary;
    }

    bool first = true;
    for (const auto& record : records) {
        if (record.value.size() < minChars) {
            ++summary.filteredShort;
            continue;
        }
        if (!first) {
            out << "\n";
        }
        out << record.key << "=" << formatHandoffValue(record.value);
        first = false;
        ++summary.selected;
    }
    out.close();

    summary.written = !out.fail();
    return summary;
}

bool removeHandoffFile(const core::Config& cfg) {
    std::error_code ec;
    return fs::remove(cfg.handoffPath, ec) && !ec;
}

// Checker invocation
std::vector<std::string> checkerArgs(const core::Config& cfg) {
    return {cfg.checkerCommand, "hmsl", "check", cfg.handoffPath, "--type", "env", "-n", "key", "--json"};
}

std::vector<std::string> diagnosticArgs(const core::Config& cfg) {
    return {cfg.checkerCommand, "hmsl", "check", cfg.handoffPath, "-n", "cleartext"};
}

bool checkerAvailable(const core::Config& cfg) {
    return core::commandExists(cfg.checkerCommand);
}

system::ProcessResult runChecker(const core::Config& cfg) {
    return system::runProcess(checkerArgs(cfg));
}

int showRawResults(const core::Config& cfg) {
    return system::runInteractive(diagnosticArgs(cfg));
}

// Result handling
std::optional<CheckReport> parseCheckerOutput(const std::string& output) {
    QJsonParseError jsonError;
    QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(output), &jsonError);
    if (jsonError.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }

    QJsonObject root = doc.object();
    QJsonValue leaksValue = root.value("leaks");
    if (!leaksValue.isUndefined() && !leaksValue.isArray()) {
        return std::nullopt;
    }

    CheckReport report;
    for (const QJsonValue& value : leaksValue.toArray()) {
        if (!value.isObject()) {
            return std::nullopt;
        }
        QJsonObject obj = value.toObject();
        if (!obj.value("name").isString()) {
            return std::nullopt;
        }

        scan::LeakRecord leak;
        leak.name = obj.value("name").toString().toStdString();
        leak.hash = obj.value("hash").toString().toStdString();
        leak.count = obj.value("count").toInt(0);
        if (obj.value("url").isString()) {
            leak.url = obj.value("url").toString().toStdString();
        }
        report.leaks.push_back(leak);
    }

    QJsonValue countValue = root.value("leaks_count");
    if (countValue.isUndefined()) {
        report.leaksCount = static_cast<int>(report.leaks.size());
    } else if (countValue.isDouble()) {
        report.leaksCount = countValue.toInt();
    } else {
        return std::nullopt;
    }
    return report;
}

LeakSelection selectLeaks(const CheckReport& report, int maxPublicOccurrences) {
    LeakSelection selection;
    for (const auto& leak : report.leaks) {
        if (leak.count < maxPublicOccurrences) {
            selection.leaks.push_back(leak);
        }
    }
    selection.filtered = report.leaksCount - static_cast<int>(selection.leaks.size());
    if (selection.filtered < 0) {
        selection.filtered = 0;
    }
    return selection;
}

} // namespace checker
} // namespace leakscan
