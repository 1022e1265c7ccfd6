#include "filetype_utils.h"

#include <QDir>
#include <QFileInfo>
#include <QSet>

bool isPdfExt(const QString &extLower)
{
    return extLower == QLatin1String("pdf");
}

QStringList listPdfFiles(const QString &dir)
{
    QStringList files;

    const QFileInfoList entries =
        QDir(dir).entryInfoList(QDir::Files, QDir::Name);

    for (const QFileInfo &fi : entries) {
        // suffix() checked by hand: name filters are case-sensitive on Linux
        if (isPdfExt(fi.suffix().toLower()))
            files << fi.absoluteFilePath();
    }

    return files;
}

QString makeOutputPath(const QString &outDir,
                       const QString &baseName)
{
    return QDir(outDir).filePath(baseName + QStringLiteral(".json"));
}

QStringList makeOutputPaths(const QString &outDir,
                            const QStringList &files,
                            const QStringList &reservedNames)
{
    QSet<QString> taken;
    for (const QString &name : reservedNames)
        taken.insert(name.toLower());

    QStringList paths;
    paths.reserve(files.size());

    for (const QString &file : files) {
        const QString baseName = QFileInfo(file).completeBaseName();
        QString stem = baseName;
        for (int n = 2; taken.contains(stem.toLower() + QStringLiteral(".json")); ++n)
            stem = QStringLiteral("%1_%2").arg(baseName).arg(n);

        taken.insert(stem.toLower() + QStringLiteral(".json"));
        paths << makeOutputPath(outDir, stem);
    }

    return paths;
}
