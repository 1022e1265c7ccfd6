#pragma once

#include <QString>
#include <QStringList>

bool isPdfExt(const QString &extLower);

// Absolute paths of the *.pdf files directly inside `dir`, sorted by name.
QStringList listPdfFiles(const QString &dir);

// <outDir>/<baseName>.json
QString makeOutputPath(const QString &outDir,
                       const QString &baseName);

// One output path per input, in input order. A name already taken by an
// earlier input or listed in `reservedNames` (compared case-insensitively)
// becomes <baseName>_2.json, <baseName>_3.json, ...
QStringList makeOutputPaths(const QString &outDir,
                            const QStringList &files,
                            const QStringList &reservedNames = {});
