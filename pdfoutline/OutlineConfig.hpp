#pragma once

#include <string>

#include "OutlineErrors.hpp"

namespace pdfoutline {
    // ============================================================
    //  Tunables for the outline heuristics and the batch driver
    // ============================================================

    struct OutlineConfig {
        // --- heading heuristics ---
        double sizeTolerance = 0.5; // pt; tier matching and size clustering
        double lineToleranceRatio = 0.5; // x smaller font size; same-row test
        int maxHeadingWords = 15;
        int maxCjkHeadingChars = 30;
        int maxHeadingChars = 200;
        int maxTitleChars = 150;
        bool excludeBodySize = false;
        bool collapseRepeats = false;
        int minLanguageChars = 10;

        // --- batch ---
        int timeBudgetMs = 10000; // <= 0 disables the budget
        int workers = 1;
        std::string inputDir = "/app/input";
        std::string outputDir = "/app/output";
        bool writeSummary = true;
        bool includeDiagnostics = false;

        // Throws ConfigError on the first invalid value.
        void Validate() const {
            if (sizeTolerance < 0.0)
                throw ConfigError("size_tolerance must be >= 0");
            if (lineToleranceRatio <= 0.0)
                throw ConfigError("line_tolerance_ratio must be > 0");
            if (maxHeadingWords <= 0)
                throw ConfigError("max_heading_words must be > 0");
            if (maxCjkHeadingChars <= 0)
                throw ConfigError("max_cjk_heading_chars must be > 0");
            if (maxHeadingChars <= 0)
                throw ConfigError("max_heading_chars must be > 0");
            if (maxTitleChars <= 0)
                throw ConfigError("max_title_chars must be > 0");
            if (minLanguageChars < 0)
                throw ConfigError("min_language_chars must be >= 0");
            if (workers <= 0)
                throw ConfigError("workers must be > 0");
            if (inputDir.empty())
                throw ConfigError("input_dir must not be empty");
            if (outputDir.empty())
                throw ConfigError("output_dir must not be empty");
        }
    };
} // namespace pdfoutline
