#include "scan/extractor.hpp"
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <vector>

namespace leakscan {
namespace scan {

namespace {

// Only the heads are matched with a regex; value spans are measured by hand.
const QRegularExpression& assignmentHead() {
    static const QRegularExpression re(QStringLiteral("^\\s*[A-Za-z_]\\w*\\s*=\\s*"));
    return re;
}

const QRegularExpression& jsonPairHead() {
    static const QRegularExpression re(QStringLiteral("\"[A-Za-z_]\\w*\"\\s*:\\s*\""));
    return re;
}

void extractAssignment(const QString& line, std::vector<QString>& out) {
    QRegularExpressionMatch m = assignmentHead().match(line);
    if (!m.hasMatch()) {
        return;
    }

    auto start = m.capturedEnd(0);
    if (start >= line.size()) {
        return;
    }

    QString raw = line.mid(start, static_cast<int>(MAX_VALUE_LENGTH));
    out.push_back(raw.trimmed());

    auto hash = raw.indexOf(QLatin1Char('#'));
    if (hash >= 0) {
        out.push_back(raw.left(hash).trimmed());
    }
}

void extractJsonPairs(const QString& line, std::vector<QString>& out) {
    qsizetype offset = 0;
    while (offset < line.size()) {
        QRegularExpressionMatch m = jsonPairHead().match(line, offset);
        if (!m.hasMatch()) {
            return;
        }

        auto headStart = m.capturedStart(0);
        auto valueStart = m.capturedEnd(0);

        // Shortest value of at least one character closed by a quote.
        auto close = line.indexOf(QLatin1Char('"'), valueStart + 1);
        if (close >= 0 && static_cast<size_t>(close - valueStart) <= MAX_VALUE_LENGTH) {
            out.push_back(line.mid(valueStart, close - valueStart));
            offset = close + 1;
        } else {
            offset = headStart + 1;
        }
    }
}

} // namespace

std::string removeQuotes(const std::string& value) {
    if (value.size() > 1 && value.front() == value.back() &&
        (value.front() == '\'' || value.front() == '"')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::set<std::string> extractAssignedValues(const std::string& text) {
    std::vector<QString> raw;
    const QStringList lines = QString::fromStdString(text).split(QLatin1Char('\n'));

    for (QString line : lines) {
        if (line.endsWith(QLatin1Char('\r'))) {
            line.chop(1);
        }
        if (line.isEmpty()) {
            continue;
        }
        extractAssignment(line, raw);
        extractJsonPairs(line, raw);
    }

    std::set<std::string> values;
    for (const auto& candidate : raw) {
        std::string value = removeQuotes(candidate.toStdString());
        if (!value.empty()) {
            values.insert(value);
        }
    }
    return values;
}

} // namespace scan
} // namespace leakscan
