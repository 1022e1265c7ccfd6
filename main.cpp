#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QLoggingCategory>
#include <QtGlobal>

#include "LanguageTagger.hpp"
#include "OutlineErrors.hpp"
#include "OutlineSettings.h"
#include "PdfiumHelper.hpp"
#include "batchworker.h"
#include "filetype_utils.h"

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("pdfoutline"));
    QCoreApplication::setApplicationVersion(QStringLiteral(PDFOUTLINE_VERSION));

    qSetMessagePattern(QStringLiteral("%{time yyyy-MM-dd hh:mm:ss} %{type}: %{message}"));

    QCommandLineParser parser;
    addOutlineOptions(parser);
    parser.process(app);

    QLoggingCategory::setFilterRules(parser.isSet(QStringLiteral("verbose"))
                                         ? QStringLiteral("*.debug=true")
                                         : QStringLiteral("*.debug=false"));

    pdfoutline::OutlineConfig config;
    try {
        config = resolveOutlineConfig(parser);
    } catch (const pdfoutline::ConfigError &e) {
        qCritical("Invalid configuration: %s", e.what());
        return 1;
    }

    const QString inputDir = QString::fromStdString(config.inputDir);
    const QString outputDir = QString::fromStdString(config.outputDir);

    if (!QDir(inputDir).exists()) {
        qCritical("Input directory does not exist: %s", qUtf8Printable(inputDir));
        return 2;
    }
    if (!QDir().mkpath(outputDir)) {
        qCritical("Cannot create output directory: %s", qUtf8Printable(outputDir));
        return 2;
    }

    const QStringList files = listPdfFiles(inputDir);
    qInfo("Found %lld PDF files in %s", static_cast<long long>(files.size()), qUtf8Printable(inputDir));

    // PDFium is initialised once, on the main thread
    pdfoutline::pdfium::PdfiumLibrary::Instance();
    const pdfoutline::ScriptLanguageTagger tagger(config.minLanguageChars);

    BatchWorker worker(files, outputDir, config, tagger);
    QObject::connect(&worker, &BatchWorker::log, [](const QString &line) {
        qInfo("%s", qUtf8Printable(line));
    });
    QObject::connect(&worker, &BatchWorker::error, [](const QString &msg) {
        qWarning("%s", qUtf8Printable(msg));
    });
    QObject::connect(&worker, &BatchWorker::progress, [](const int current, const int total) {
        qDebug("progress %d/%d", current, total);
    });

    worker.process();

    int failed = 0;
    for (const FileReport &report: worker.reports()) {
        if (!report.error.isEmpty())
            ++failed;
    }
    qInfo("Processed %lld files, %d failed", static_cast<long long>(worker.reports().size()), failed);

    return 0;
}
