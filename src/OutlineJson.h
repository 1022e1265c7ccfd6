#pragma once

#include <vector>

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include "OutlineTypes.hpp"

// One line of processing_summary.json
struct FileReport {
    QString filename;
    QString title;
    QString language = QStringLiteral("unknown");
    int headingsCount = 0;
    int pages = 0;
    bool timedOut = false;
    QString error; // empty on success
};

// {"outline": [{"level", "page", "text"}...], "title"} and, with diagnostics,
// "language", "font_analysis" and "statistics".
QJsonObject resultToJson(const pdfoutline::OutlineResult &result, bool includeDiagnostics);

QByteArray resultToJsonBytes(const pdfoutline::OutlineResult &result, bool includeDiagnostics);

// Written for files that could not be processed
QByteArray minimalResultJsonBytes();

QByteArray summaryToJsonBytes(const std::vector<FileReport> &reports);
