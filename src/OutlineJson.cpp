#include "OutlineJson.h"

#include <algorithm>
#include <set>
#include <utility>

#include <QJsonArray>
#include <QJsonDocument>

namespace {
    QString toQString(const std::string &utf8) {
        return QString::fromUtf8(utf8.data(), static_cast<qsizetype>(utf8.size()));
    }

    QString sizeKey(const double size) {
        return QString::number(size, 'f', 1);
    }

    QJsonObject fontAnalysis(const pdfoutline::SizeProfile &profile) {
        // Top ten raw sizes by line count; larger size first among equal counts
        std::vector<std::pair<double, std::size_t> > sizes(profile.histogram.begin(), profile.histogram.end());
        std::sort(sizes.begin(), sizes.end(), [](const auto &a, const auto &b) {
            if (a.second != b.second)
                return a.second > b.second;
            return a.first > b.first;
        });
        if (sizes.size() > 10)
            sizes.resize(10);

        QJsonObject detected;
        for (const auto &[size, count]: sizes)
            detected.insert(sizeKey(size), static_cast<qint64>(count));

        QJsonObject mapping;
        if (profile.title)
            mapping.insert(QStringLiteral("title"), *profile.title);
        if (profile.h1)
            mapping.insert(QStringLiteral("H1"), *profile.h1);
        if (profile.h2)
            mapping.insert(QStringLiteral("H2"), *profile.h2);
        if (profile.h3)
            mapping.insert(QStringLiteral("H3"), *profile.h3);
        if (profile.bodySize)
            mapping.insert(QStringLiteral("body"), *profile.bodySize);

        QJsonObject analysis;
        analysis.insert(QStringLiteral("detected_fonts"), detected);
        analysis.insert(QStringLiteral("font_mapping"), mapping);
        return analysis;
    }

    QJsonObject statistics(const pdfoutline::OutlineResult &result) {
        int h1 = 0, h2 = 0, h3 = 0;
        for (const auto &entry: result.outline) {
            switch (entry.level) {
                case pdfoutline::HeadingLevel::H1: ++h1; break;
                case pdfoutline::HeadingLevel::H2: ++h2; break;
                case pdfoutline::HeadingLevel::H3: ++h3; break;
                default: break;
            }
        }

        QJsonObject byLevel;
        byLevel.insert(QStringLiteral("H1"), h1);
        byLevel.insert(QStringLiteral("H2"), h2);
        byLevel.insert(QStringLiteral("H3"), h3);

        QJsonObject stats;
        stats.insert(QStringLiteral("total_pages"), result.pageCount);
        stats.insert(QStringLiteral("pages_processed"), result.pagesProcessed);
        stats.insert(QStringLiteral("timed_out"), result.timedOut);
        stats.insert(QStringLiteral("total_headings"), static_cast<int>(result.outline.size()));
        stats.insert(QStringLiteral("headings_by_level"), byLevel);
        return stats;
    }
} // namespace

QJsonObject resultToJson(const pdfoutline::OutlineResult &result, const bool includeDiagnostics) {
    QJsonArray outline;
    for (const auto &entry: result.outline) {
        QJsonObject item;
        item.insert(QStringLiteral("level"), toQString(std::string(pdfoutline::LevelName(entry.level))));
        item.insert(QStringLiteral("text"), toQString(entry.text));
        item.insert(QStringLiteral("page"), entry.page);
        outline.append(item);
    }

    QJsonObject root;
    root.insert(QStringLiteral("title"), toQString(result.title));
    root.insert(QStringLiteral("outline"), outline);

    if (includeDiagnostics) {
        root.insert(QStringLiteral("language"), toQString(result.language));
        root.insert(QStringLiteral("font_analysis"), fontAnalysis(result.profile));
        root.insert(QStringLiteral("statistics"), statistics(result));
    }

    return root;
}

QByteArray resultToJsonBytes(const pdfoutline::OutlineResult &result, const bool includeDiagnostics) {
    return QJsonDocument(resultToJson(result, includeDiagnostics)).toJson(QJsonDocument::Indented);
}

QByteArray minimalResultJsonBytes() {
    QJsonObject root;
    root.insert(QStringLiteral("title"), QString());
    root.insert(QStringLiteral("outline"), QJsonArray());
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

QByteArray summaryToJsonBytes(const std::vector<FileReport> &reports) {
    QJsonArray files;
    std::set<QString> languages;
    int processed = 0;
    int failed = 0;

    for (const FileReport &report: reports) {
        QJsonObject item;
        item.insert(QStringLiteral("filename"), report.filename);
        item.insert(QStringLiteral("title"), report.title);
        item.insert(QStringLiteral("language"), report.language);
        item.insert(QStringLiteral("headings_count"), report.headingsCount);
        item.insert(QStringLiteral("pages"), report.pages);
        item.insert(QStringLiteral("timed_out"), report.timedOut);
        if (report.error.isEmpty()) {
            item.insert(QStringLiteral("error"), QJsonValue::Null);
            languages.insert(report.language);
            ++processed;
        } else {
            item.insert(QStringLiteral("error"), report.error);
            ++failed;
        }
        files.append(item);
    }

    QJsonArray detected;
    for (const QString &lang: languages)
        detected.append(lang);

    QJsonObject root;
    root.insert(QStringLiteral("processed_files"), processed);
    root.insert(QStringLiteral("failed_files"), failed);
    root.insert(QStringLiteral("files"), files);
    root.insert(QStringLiteral("languages_detected"), detected);
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}
