#pragma once

#include <QCommandLineParser>
#include <QString>

#include "OutlineConfig.hpp"

// Registers -i/-o/-c/-j/--time-budget/--diagnostics/--no-summary/-v
// plus --help and --version.
void addOutlineOptions(QCommandLineParser &parser);

// Reads [outline] and [batch] from an INI file into `config`.
// Missing keys keep their current value. Throws ConfigError when the file
// does not exist, cannot be parsed, or holds a non-numeric value.
void loadOutlineIni(const QString &iniPath, pdfoutline::OutlineConfig &config);

// Defaults, then the INI named by --config, then command-line flags.
// The returned config has been validated.
pdfoutline::OutlineConfig resolveOutlineConfig(const QCommandLineParser &parser);
