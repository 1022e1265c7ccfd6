#pragma once

#include <optional>
#include <utility>
#include <vector>

#include "OutlineConfig.hpp"
#include "OutlineTypes.hpp"
#include "TitleSelector.hpp"

namespace pdfoutline {
    // H1-H3 candidates -> outline entries, document order kept.
    //
    // - the title line and Title-tier candidates are never emitted
    // - adjacent entries with the same text on the same page collapse into
    //   one; when their levels differ the higher level (H1 > H2 > H3) is kept
    // - no other re-leveling: missing ancestors are not invented
    inline std::vector<OutlineEntry> BuildOutline(const std::vector<HeadingCandidate> &candidates,
                                                  const std::optional<std::size_t> &titleOrdinal,
                                                  const OutlineConfig &config) {
        std::vector<OutlineEntry> outline;
        outline.reserve(candidates.size());

        for (const HeadingCandidate &candidate: candidates) {
            if (!IsOutlineLevel(candidate.level))
                continue;
            if (titleOrdinal && candidate.line.ordinal == *titleOrdinal)
                continue;

            OutlineEntry entry;
            entry.level = candidate.level;
            entry.text = CleanHeadingText(candidate.line.text, config);
            entry.page = candidate.line.pageIndex + 1;
            if (entry.text.empty())
                continue;

            if (!outline.empty()) {
                OutlineEntry &prev = outline.back();
                if (prev.text == entry.text && prev.page == entry.page) {
                    if (LevelRank(entry.level) < LevelRank(prev.level))
                        prev.level = entry.level;
                    continue;
                }
            }

            outline.push_back(std::move(entry));
        }

        return outline;
    }
} // namespace pdfoutline
