#include "OutlineSettings.h"

#include <QFileInfo>
#include <QSettings>
#include <QStringList>

using pdfoutline::ConfigError;
using pdfoutline::OutlineConfig;

namespace {
    const QString kInputOption = QStringLiteral("input");
    const QString kOutputOption = QStringLiteral("output");
    const QString kConfigOption = QStringLiteral("config");
    const QString kWorkersOption = QStringLiteral("workers");
    const QString kTimeBudgetOption = QStringLiteral("time-budget");
    const QString kDiagnosticsOption = QStringLiteral("diagnostics");
    const QString kNoSummaryOption = QStringLiteral("no-summary");
    const QString kVerboseOption = QStringLiteral("verbose");

    std::string toStd(const QString &s) {
        return s.toUtf8().toStdString();
    }

    int toInt(const QString &key, const QVariant &value) {
        bool ok = false;
        const int v = value.toString().trimmed().toInt(&ok);
        if (!ok)
            throw ConfigError(toStd(key) + ": not an integer: " + toStd(value.toString()));
        return v;
    }

    double toDouble(const QString &key, const QVariant &value) {
        bool ok = false;
        const double v = value.toString().trimmed().toDouble(&ok);
        if (!ok)
            throw ConfigError(toStd(key) + ": not a number: " + toStd(value.toString()));
        return v;
    }

    bool toBool(const QString &key, const QVariant &value) {
        const QString s = value.toString().trimmed().toLower();
        if (s == QLatin1String("true") || s == QLatin1String("1") || s == QLatin1String("yes") || s == QLatin1String("on"))
            return true;
        if (s == QLatin1String("false") || s == QLatin1String("0") || s == QLatin1String("no") || s == QLatin1String("off"))
            return false;
        throw ConfigError(toStd(key) + ": not a boolean: " + toStd(value.toString()));
    }

    template<typename T, typename Convert>
    void readKey(const QSettings &settings, const QString &key, T &field, Convert convert) {
        if (settings.contains(key))
            field = convert(key, settings.value(key));
    }
} // namespace

void addOutlineOptions(QCommandLineParser &parser) {
    parser.setApplicationDescription(
        QStringLiteral("Extracts the title and H1/H2/H3 outline of every PDF in a directory."));
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addOptions({
        {{QStringLiteral("i"), kInputOption},
            QStringLiteral("Directory scanned for *.pdf files."), QStringLiteral("dir")},
        {{QStringLiteral("o"), kOutputOption},
            QStringLiteral("Directory receiving <name>.json files."), QStringLiteral("dir")},
        {{QStringLiteral("c"), kConfigOption},
            QStringLiteral("INI file with [outline] and [batch] settings."), QStringLiteral("ini")},
        {{QStringLiteral("j"), kWorkersOption},
            QStringLiteral("Number of files processed in parallel."), QStringLiteral("n")},
        {kTimeBudgetOption,
            QStringLiteral("Per-document time budget in milliseconds (<= 0 disables)."), QStringLiteral("ms")},
        {kDiagnosticsOption,
            QStringLiteral("Add language, font analysis and statistics to each output.")},
        {kNoSummaryOption,
            QStringLiteral("Do not write processing_summary.json.")},
        {{QStringLiteral("v"), kVerboseOption},
            QStringLiteral("Enable debug logging.")},
    });
}

void loadOutlineIni(const QString &iniPath, OutlineConfig &config) {
    if (!QFileInfo::exists(iniPath))
        throw ConfigError("config file not found: " + toStd(iniPath));

    const QSettings settings(iniPath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError)
        throw ConfigError("cannot parse config file: " + toStd(iniPath));

    const auto asDouble = [](const QString &k, const QVariant &v) { return toDouble(k, v); };
    const auto asInt = [](const QString &k, const QVariant &v) { return toInt(k, v); };
    const auto asBool = [](const QString &k, const QVariant &v) { return toBool(k, v); };
    const auto asString = [](const QString &, const QVariant &v) { return toStd(v.toString().trimmed()); };

    readKey(settings, QStringLiteral("outline/size_tolerance"), config.sizeTolerance, asDouble);
    readKey(settings, QStringLiteral("outline/line_tolerance_ratio"), config.lineToleranceRatio, asDouble);
    readKey(settings, QStringLiteral("outline/max_heading_words"), config.maxHeadingWords, asInt);
    readKey(settings, QStringLiteral("outline/max_cjk_heading_chars"), config.maxCjkHeadingChars, asInt);
    readKey(settings, QStringLiteral("outline/max_heading_chars"), config.maxHeadingChars, asInt);
    readKey(settings, QStringLiteral("outline/max_title_chars"), config.maxTitleChars, asInt);
    readKey(settings, QStringLiteral("outline/exclude_body_size"), config.excludeBodySize, asBool);
    readKey(settings, QStringLiteral("outline/collapse_repeats"), config.collapseRepeats, asBool);
    readKey(settings, QStringLiteral("outline/min_language_chars"), config.minLanguageChars, asInt);

    readKey(settings, QStringLiteral("batch/time_budget_ms"), config.timeBudgetMs, asInt);
    readKey(settings, QStringLiteral("batch/workers"), config.workers, asInt);
    readKey(settings, QStringLiteral("batch/input_dir"), config.inputDir, asString);
    readKey(settings, QStringLiteral("batch/output_dir"), config.outputDir, asString);
    readKey(settings, QStringLiteral("batch/write_summary"), config.writeSummary, asBool);
    readKey(settings, QStringLiteral("batch/include_diagnostics"), config.includeDiagnostics, asBool);
}

OutlineConfig resolveOutlineConfig(const QCommandLineParser &parser) {
    OutlineConfig config;

    if (parser.isSet(kConfigOption))
        loadOutlineIni(parser.value(kConfigOption), config);

    if (parser.isSet(kInputOption))
        config.inputDir = toStd(parser.value(kInputOption));
    if (parser.isSet(kOutputOption))
        config.outputDir = toStd(parser.value(kOutputOption));
    if (parser.isSet(kWorkersOption))
        config.workers = toInt(QStringLiteral("--workers"), parser.value(kWorkersOption));
    if (parser.isSet(kTimeBudgetOption))
        config.timeBudgetMs = toInt(QStringLiteral("--time-budget"), parser.value(kTimeBudgetOption));
    if (parser.isSet(kDiagnosticsOption))
        config.includeDiagnostics = true;
    if (parser.isSet(kNoSummaryOption))
        config.writeSummary = false;

    config.Validate();
    return config;
}
