#pragma once
//
// HeadingClassifier.hpp
// -----------------------------------------------------------------------------
// Font-size tiers and per-line heading classification.
//
// BuildSizeProfile():
//   - histogram of line font sizes over the whole document
//   - sizes within `sizeTolerance` of a larger size join that larger cluster
//   - largest clusters become Title / H1 / H2 / H3; smaller ones are body text
//   - most frequent cluster is the body size (ties -> smaller size); with
//     `excludeBodySize` only clusters above it are tiers, unless that would
//     leave no tier at all
//
// ClassifyLine():
//   - rejections first (pure number, pure punctuation, over-length)
//   - then the size must match a tier
//   - then at least one corroborating predicate must hold
// -----------------------------------------------------------------------------

#include <algorithm>
#include <cmath>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

#include "HeadingPatterns.hpp"
#include "LanguageTagger.hpp"
#include "OutlineConfig.hpp"
#include "OutlineTypes.hpp"

namespace pdfoutline {
    namespace detail {
        struct SizeCluster {
            double size = 0.0; // largest member
            std::size_t count = 0;
        };

        inline std::vector<SizeCluster> ClusterSizes(const std::map<double, std::size_t> &histogram,
                                                     const double tolerance) {
            std::vector<SizeCluster> clusters;
            // std::map is ascending; walk it from the largest size down
            for (auto it = histogram.rbegin(); it != histogram.rend(); ++it) {
                if (!clusters.empty() && clusters.back().size - it->first <= tolerance) {
                    clusters.back().count += it->second;
                    continue;
                }
                clusters.push_back({it->first, it->second});
            }
            return clusters;
        }

        inline bool SizeMatches(const double size, const std::optional<double> &tier, const double tolerance) {
            return tier.has_value() && std::fabs(size - *tier) <= tolerance;
        }
    } // namespace detail

    inline SizeProfile BuildSizeProfile(const std::vector<Line> &lines, const OutlineConfig &config) {
        SizeProfile profile;
        for (const Line &line: lines) {
            if (line.fontSize > 0.0)
                ++profile.histogram[line.fontSize];
        }
        if (profile.histogram.empty())
            return profile;

        const std::vector<detail::SizeCluster> clusters =
                detail::ClusterSizes(profile.histogram, config.sizeTolerance);

        profile.distinctSizes.reserve(clusters.size());
        for (const auto &c: clusters)
            profile.distinctSizes.push_back(c.size);

        // Clusters are descending, so ">=" moves ties to the smaller size
        const detail::SizeCluster *body = &clusters.front();
        for (const auto &c: clusters) {
            if (c.count >= body->count)
                body = &c;
        }
        profile.bodySize = body->size;

        std::vector<double> tiers;
        for (const auto &c: clusters) {
            if (config.excludeBodySize && c.size <= body->size)
                break;
            tiers.push_back(c.size);
        }
        if (tiers.empty()) {
            for (const auto &c: clusters)
                tiers.push_back(c.size);
        }

        std::optional<double> *slots[] = {&profile.title, &profile.h1, &profile.h2, &profile.h3};
        for (std::size_t i = 0; i < tiers.size() && i < std::size(slots); ++i)
            *slots[i] = tiers[i];

        return profile;
    }

    // Tier whose size is within tolerance; the higher tier wins when two match.
    inline HeadingLevel MatchTier(const double fontSize, const SizeProfile &profile, const double tolerance) {
        if (detail::SizeMatches(fontSize, profile.title, tolerance))
            return HeadingLevel::Title;
        if (detail::SizeMatches(fontSize, profile.h1, tolerance))
            return HeadingLevel::H1;
        if (detail::SizeMatches(fontSize, profile.h2, tolerance))
            return HeadingLevel::H2;
        if (detail::SizeMatches(fontSize, profile.h3, tolerance))
            return HeadingLevel::H3;
        return HeadingLevel::Body;
    }

    inline bool IsRejectedLine(const std::string &text, const OutlineConfig &config) {
        return IsPureNumber(text) ||
               IsPurePunctuation(text) ||
               ExceedsMaxLength(text, config.maxHeadingChars);
    }

    inline bool IsCorroboratedHeading(const Line &line, const OutlineConfig &config) {
        return StartsWithNumbering(line.text) ||
               IsShortLine(line.text, config.maxHeadingWords, config.maxCjkHeadingChars) ||
               IsBoldLine(line) ||
               IsAllCaps(line.text) ||
               IsCjkChapterHeading(line.text);
    }

    inline HeadingLevel ClassifyLine(const Line &line, const SizeProfile &profile, const OutlineConfig &config) {
        if (line.text.empty() || IsRejectedLine(line.text, config))
            return HeadingLevel::Body;

        const HeadingLevel tier = MatchTier(line.fontSize, profile, config.sizeTolerance);
        if (tier == HeadingLevel::Body)
            return HeadingLevel::Body;

        return IsCorroboratedHeading(line, config) ? tier : HeadingLevel::Body;
    }

    // Heading candidates in document order, each tagged with a language code.
    inline std::vector<HeadingCandidate> ClassifyLines(const std::vector<Line> &lines,
                                                       const SizeProfile &profile,
                                                       const OutlineConfig &config,
                                                       const ILanguageTagger &tagger) {
        std::vector<HeadingCandidate> candidates;
        for (const Line &line: lines) {
            const HeadingLevel level = ClassifyLine(line, profile, config);
            if (level == HeadingLevel::Body)
                continue;

            HeadingCandidate candidate;
            candidate.line = line;
            candidate.level = level;
            candidate.language = TagLanguage(tagger, line.text);
            candidates.push_back(std::move(candidate));
        }
        return candidates;
    }
} // namespace pdfoutline
