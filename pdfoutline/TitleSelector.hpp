#pragma once

#include <optional>
#include <string>
#include <vector>

#include "CjkText.hpp"
#include "HeadingClassifier.hpp"
#include "HeadingPatterns.hpp"
#include "OutlineConfig.hpp"
#include "OutlineTypes.hpp"
#include "TextNormalize.hpp"

namespace pdfoutline {
    struct TitleSelection {
        std::optional<std::size_t> ordinal; // Line::ordinal of the chosen line
        std::string text;
    };

    inline std::string CleanHeadingText(const std::string &text, const OutlineConfig &config) {
        std::string out = TrimText(text);
        if (config.collapseRepeats)
            out = TrimText(CollapseRepeatedSegments(out));
        return out;
    }

    // Title from the first page only:
    //   1) topmost line at the Title tier, non-empty, at most maxTitleChars
    //   2) otherwise the largest-font line, topmost among equals
    // `lines` must be in document order.
    inline TitleSelection SelectTitle(const std::vector<Line> &lines,
                                      const SizeProfile &profile,
                                      const OutlineConfig &config) {
        TitleSelection selection;

        const Line *fallback = nullptr;
        for (const Line &line: lines) {
            if (line.pageIndex != 0)
                continue;
            if (TrimText(line.text).empty())
                continue;

            if (detail::SizeMatches(line.fontSize, profile.title, config.sizeTolerance) &&
                !ExceedsMaxLength(TrimText(line.text), config.maxTitleChars)) {
                selection.ordinal = line.ordinal;
                selection.text = CleanHeadingText(line.text, config);
                return selection;
            }

            if (fallback == nullptr || line.fontSize > fallback->fontSize)
                fallback = &line;
        }

        if (fallback != nullptr) {
            selection.ordinal = fallback->ordinal;
            selection.text = CleanHeadingText(fallback->text, config);
        }
        return selection;
    }
} // namespace pdfoutline
