#pragma once

#include <vector>

#include <QAtomicInteger>
#include <QObject>
#include <QString>
#include <QStringList>

#include "LanguageTagger.hpp"
#include "OutlineConfig.hpp"
#include "OutlineJson.h"

class BatchWorker : public QObject
{
    Q_OBJECT

public:
    BatchWorker(const QStringList &files,
                const QString &outDir,
                const pdfoutline::OutlineConfig &config,
                const pdfoutline::ILanguageTagger &tagger,
                QObject *parent = nullptr);

    // One report per input file, in input order; complete after finished()
    [[nodiscard]] const std::vector<FileReport> &reports() const { return m_reports; }

public slots:
    void process();
    void requestCancel();

    signals:
        void log(const QString &line);
    void progress(int current, int total); // (done, total)
    void finished(bool cancelled);
    void error(const QString &msg);

private:
    FileReport processOneFile(int idx, const QString &path);
    bool writeBytes(const QString &outPath, const QByteArray &bytes, QString *errorMessage) const;
    void writeSummary();

    QStringList m_files;
    QStringList m_outPaths;
    QString     m_outDir;
    pdfoutline::OutlineConfig m_config;
    const pdfoutline::ILanguageTagger &m_tagger;

    std::vector<FileReport> m_reports;
    QAtomicInteger<bool> m_cancelRequested;
    QAtomicInt m_done;
};
