// BatchWorker.cpp
#include "batchworker.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QList>
#include <QSaveFile>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrentMap>

#include "DocumentProcessor.hpp"
#include "OutlineErrors.hpp"
#include "filetype_utils.h"
#include "textutilities.h"

namespace {
    const QString kSummaryFileName = QStringLiteral("processing_summary.json");
}

BatchWorker::BatchWorker(const QStringList &files,
                         const QString &outDir,
                         const pdfoutline::OutlineConfig &config,
                         const pdfoutline::ILanguageTagger &tagger,
                         QObject *parent)
    : QObject(parent),
      m_files(files),
      m_outDir(outDir),
      m_config(config),
      m_tagger(tagger),
      m_cancelRequested(false),
      m_done(0) {
}

void BatchWorker::requestCancel() {
    m_cancelRequested.storeRelaxed(true);
}

void BatchWorker::process() {
    m_reports.clear();
    m_done.storeRelaxed(0);

    if (const QDir dir(m_outDir); !dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        emit error(QString("Cannot create output directory: %1").arg(m_outDir));
        emit finished(false);
        return;
    }

    m_outPaths = makeOutputPaths(m_outDir, m_files,
                                 m_config.writeSummary ? QStringList{kSummaryFileName} : QStringList{});
    for (int i = 0; i < m_files.size(); ++i) {
        const QFileInfo in(m_files.at(i));
        if (const QFileInfo out(m_outPaths.at(i)); out.completeBaseName() != in.completeBaseName()) {
            emit log(QString("%1: %2 -> output name taken, writing %3 instead.")
                .arg(i + 1)
                .arg(in.fileName(), out.fileName()));
        }
    }

    const int total = static_cast<int>(m_files.size());
    if (total == 0) {
        emit log(QString("No PDF files found."));
        if (m_config.writeSummary)
            writeSummary();
        emit finished(false);
        return;
    }

    if (m_config.workers <= 1) {
        for (int i = 0; i < total; ++i) {
            if (m_cancelRequested.loadRelaxed()) {
                emit log(QStringLiteral("Batch cancelled."));
                emit finished(true);
                return;
            }
            m_reports.push_back(processOneFile(i + 1, m_files.at(i)));
        }
    } else {
        QList<int> indexes;
        indexes.reserve(total);
        for (int i = 0; i < total; ++i)
            indexes << i;

        QThreadPool pool;
        pool.setMaxThreadCount(m_config.workers);

        const QList<FileReport> results = QtConcurrent::blockingMapped<QList<FileReport> >(
            &pool, indexes, [this](const int i) {
                return processOneFile(i + 1, m_files.at(i));
            });
        m_reports.assign(results.cbegin(), results.cend());

        if (m_cancelRequested.loadRelaxed()) {
            emit log(QStringLiteral("Batch cancelled."));
            emit finished(true);
            return;
        }
    }

    if (m_config.writeSummary)
        writeSummary();

    emit finished(false);
}

FileReport BatchWorker::processOneFile(const int idx, const QString &path) {
    const QFileInfo fi(path);
    const QString outPath = m_outPaths.at(idx - 1);
    const int total = static_cast<int>(m_files.size());

    FileReport report;
    report.filename = fi.fileName();

    QByteArray bytes;
    if (m_cancelRequested.loadRelaxed()) {
        report.error = QStringLiteral("cancelled");
        bytes = minimalResultJsonBytes();
    } else {
        try {
            const pdfoutline::OutlineResult result = pdfoutline::ProcessFile(
                QFile::encodeName(path).toStdString(),
                m_config,
                m_tagger,
                [this]() { return m_cancelRequested.loadRelaxed(); });

            report.title = QString::fromStdString(result.title);
            report.language = QString::fromStdString(result.language);
            report.headingsCount = static_cast<int>(result.outline.size());
            report.pages = result.pageCount;
            report.timedOut = result.timedOut;

            if (result.timedOut) {
                emit log(QString("%1: %2 -> ⚠ Time budget exceeded, kept %3 of %4 pages.")
                    .arg(idx)
                    .arg(path)
                    .arg(result.pagesProcessed)
                    .arg(result.pageCount));
            }

            bytes = resultToJsonBytes(result, m_config.includeDiagnostics);
        } catch (const pdfoutline::DocumentError &e) {
            report.error = QString::fromUtf8(e.what());
            bytes = minimalResultJsonBytes();
            emit error(QString("%1: %2 -> ❌ %3")
                .arg(idx)
                .arg(path, report.error));
        } catch (const std::exception &e) {
            report.error = QString::fromUtf8(e.what());
            bytes = minimalResultJsonBytes();
            emit error(QString("%1: %2 -> Error: %3")
                .arg(idx)
                .arg(path, report.error));
        }
    }

    if (QString writeError; !writeBytes(outPath, bytes, &writeError)) {
        if (report.error.isEmpty())
            report.error = writeError;
        emit error(QString("%1: %2 -> ❌ Error writing: %3")
            .arg(idx)
            .arg(outPath, writeError));
    } else if (report.error.isEmpty()) {
        emit log(QString("%1: %2 -> ✅ Done. %3 headings, title \"%4\"")
            .arg(idx)
            .arg(outPath)
            .arg(report.headingsCount)
            .arg(QString::fromStdString(truncate_utf8(report.title.toStdString(), 60))));
    } else {
        emit log(QString("%1: %2 -> Wrote empty outline.")
            .arg(idx)
            .arg(outPath));
    }

    emit progress(m_done.fetchAndAddRelaxed(1) + 1, total);
    return report;
}

bool BatchWorker::writeBytes(const QString &outPath, const QByteArray &bytes, QString *errorMessage) const {
    QSaveFile outFile(outPath);
    if (!outFile.open(QIODevice::WriteOnly)) {
        *errorMessage = outFile.errorString();
        return false;
    }
    if (outFile.write(bytes) != bytes.size()) {
        *errorMessage = outFile.errorString();
        outFile.cancelWriting();
        return false;
    }
    if (!outFile.commit()) {
        *errorMessage = outFile.errorString();
        return false;
    }
    return true;
}

void BatchWorker::writeSummary() {
    const QString summaryPath = QDir(m_outDir).filePath(kSummaryFileName);

    if (QString writeError; !writeBytes(summaryPath, summaryToJsonBytes(m_reports), &writeError)) {
        emit error(QString("Failed to write processing summary %1: %2").arg(summaryPath, writeError));
        return;
    }

    emit log(QString("Processing summary saved to %1").arg(summaryPath));
}
