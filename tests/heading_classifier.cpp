// -*- mode: c++ -*-

#include <boost/test/unit_test.hpp>

#include "HeadingClassifier.hpp"
#include "test_fixtures.hpp"

using namespace pdfoutline;
using fixtures::MakeLine;

namespace {
    // sizes -> one line each, in order
    std::vector<Line> LinesOfSizes(const std::vector<double> &sizes) {
        std::vector<Line> lines;
        for (const double size: sizes)
            lines.push_back(MakeLine("Line text", size, 0, lines.size()));
        return lines;
    }
} // namespace

BOOST_AUTO_TEST_SUITE(heading_classifier)

BOOST_AUTO_TEST_CASE(largest_four_sizes_become_tiers) {
    const auto lines = LinesOfSizes({24, 18, 14, 10, 10, 10, 8});
    const SizeProfile profile = BuildSizeProfile(lines, OutlineConfig{});

    BOOST_TEST(profile.title.value() == 24.0);
    BOOST_TEST(profile.h1.value() == 18.0);
    BOOST_TEST(profile.h2.value() == 14.0);
    BOOST_TEST(profile.h3.value() == 10.0);
    BOOST_TEST(profile.bodySize.value() == 10.0);
    BOOST_TEST(profile.distinctSizes == std::vector<double>({24.0, 18.0, 14.0, 10.0, 8.0}),
               boost::test_tools::per_element());
    BOOST_TEST(MatchTier(8.0, profile, 0.5) == HeadingLevel::Body);
}

BOOST_AUTO_TEST_CASE(two_sizes_give_title_and_h1) {
    // larger size more frequent than the smaller one
    auto lines = LinesOfSizes({20, 20, 20, 20, 20, 12, 12});
    SizeProfile profile = BuildSizeProfile(lines, OutlineConfig{});
    BOOST_TEST(profile.TierCount() == 2u);
    BOOST_TEST(profile.title.value() == 20.0);
    BOOST_TEST(profile.h1.value() == 12.0);
    BOOST_TEST(!profile.h2.has_value());

    lines = LinesOfSizes({24, 10, 10, 10, 10, 10});
    profile = BuildSizeProfile(lines, OutlineConfig{});
    BOOST_TEST(profile.TierCount() == 2u);
    BOOST_TEST(profile.title.value() == 24.0);
    BOOST_TEST(profile.h1.value() == 10.0);
}

BOOST_AUTO_TEST_CASE(body_exclusion_keeps_sizes_above_body) {
    OutlineConfig config;
    config.excludeBodySize = true;

    const auto lines = LinesOfSizes({24, 18, 18, 14, 10, 10, 10, 10, 10});
    const SizeProfile profile = BuildSizeProfile(lines, config);

    BOOST_TEST(profile.bodySize.value() == 10.0);
    BOOST_TEST(profile.title.value() == 24.0);
    BOOST_TEST(profile.h1.value() == 18.0);
    BOOST_TEST(profile.h2.value() == 14.0);
    BOOST_TEST(!profile.h3.has_value());
    BOOST_TEST(profile.TierCount() == 3u);
}

BOOST_AUTO_TEST_CASE(body_exclusion_never_removes_every_tier) {
    OutlineConfig config;
    config.excludeBodySize = true;

    // the largest size is also the most frequent
    const auto lines = LinesOfSizes({20, 20, 20, 20, 20, 12, 12});
    const SizeProfile profile = BuildSizeProfile(lines, config);

    BOOST_TEST(profile.bodySize.value() == 20.0);
    BOOST_TEST(profile.title.value() == 20.0);
    BOOST_TEST(profile.h1.value() == 12.0);
}

BOOST_AUTO_TEST_CASE(close_sizes_share_a_cluster) {
    const auto lines = LinesOfSizes({18.0, 17.8, 12, 12, 12, 12});
    const SizeProfile profile = BuildSizeProfile(lines, OutlineConfig{});

    BOOST_TEST(profile.distinctSizes.size() == 2u);
    BOOST_TEST(profile.title.value() == 18.0);
    BOOST_TEST(MatchTier(17.8, profile, 0.5) == HeadingLevel::Title);
}

BOOST_AUTO_TEST_CASE(body_ties_go_to_the_smaller_size) {
    const auto lines = LinesOfSizes({16, 12, 12, 10, 10});
    const SizeProfile profile = BuildSizeProfile(lines, OutlineConfig{});

    BOOST_TEST(profile.bodySize.value() == 10.0);
    BOOST_TEST(profile.title.value() == 16.0);
    BOOST_TEST(profile.h1.value() == 12.0);
}

BOOST_AUTO_TEST_CASE(single_size_is_only_the_title_tier) {
    const auto lines = LinesOfSizes({12, 12, 12});
    const SizeProfile profile = BuildSizeProfile(lines, OutlineConfig{});

    BOOST_TEST(profile.TierCount() == 1u);
    BOOST_TEST(profile.title.value() == 12.0);
    BOOST_TEST(!profile.h1.has_value());
    BOOST_TEST(profile.bodySize.value() == 12.0);
}

BOOST_AUTO_TEST_CASE(empty_document_has_empty_profile) {
    const SizeProfile profile = BuildSizeProfile({}, OutlineConfig{});
    BOOST_TEST(profile.histogram.empty());
    BOOST_TEST(!profile.bodySize.has_value());
    BOOST_TEST(profile.TierCount() == 0u);
}

BOOST_AUTO_TEST_CASE(higher_tier_wins_when_two_match) {
    const auto lines = LinesOfSizes({12.0, 11.4, 9, 9, 9});
    const SizeProfile profile = BuildSizeProfile(lines, OutlineConfig{});

    BOOST_TEST_REQUIRE(profile.title.value() == 12.0);
    BOOST_TEST_REQUIRE(profile.h1.value() == 11.4);
    BOOST_TEST(MatchTier(11.7, profile, 0.5) == HeadingLevel::Title);
    BOOST_TEST(MatchTier(11.0, profile, 0.5) == HeadingLevel::H1);
    BOOST_TEST(MatchTier(9.0, profile, 0.5) == HeadingLevel::H2);
    BOOST_TEST(MatchTier(7.0, profile, 0.5) == HeadingLevel::Body);
}

BOOST_AUTO_TEST_CASE(rejected_lines_are_never_headings) {
    const OutlineConfig config;
    const auto sizes = LinesOfSizes({24, 18, 10, 10, 10});
    const SizeProfile profile = BuildSizeProfile(sizes, config);

    BOOST_TEST(ClassifyLine(MakeLine("12", 18, 0, 0, true), profile, config) == HeadingLevel::Body);
    BOOST_TEST(ClassifyLine(MakeLine("* * *", 18, 0, 0, true), profile, config) == HeadingLevel::Body);
    BOOST_TEST(ClassifyLine(MakeLine(std::string(201, 'X'), 18, 0, 0, true), profile, config) == HeadingLevel::Body);
}

BOOST_AUTO_TEST_CASE(tier_size_needs_corroboration) {
    const OutlineConfig config;
    const auto sizes = LinesOfSizes({24, 18, 10, 10, 10});
    const SizeProfile profile = BuildSizeProfile(sizes, config);

    const std::string longSentence =
            "this is a long running sentence that happens to be typeset in a larger font size "
            "for emphasis and goes on well beyond any heading";

    BOOST_TEST(ClassifyLine(MakeLine(longSentence, 18, 0, 0), profile, config) == HeadingLevel::Body);
    BOOST_TEST(ClassifyLine(MakeLine(longSentence, 18, 0, 0, true), profile, config) == HeadingLevel::H1);
    BOOST_TEST(ClassifyLine(MakeLine("Overview", 18, 0, 0), profile, config) == HeadingLevel::H1);
    BOOST_TEST(ClassifyLine(MakeLine(longSentence, 10, 0, 0), profile, config) == HeadingLevel::Body);
    BOOST_TEST(ClassifyLine(MakeLine("Overview", 10, 0, 0), profile, config) == HeadingLevel::H2);
    BOOST_TEST(ClassifyLine(MakeLine("Overview", 8, 0, 0, true), profile, config) == HeadingLevel::Body);
}

BOOST_AUTO_TEST_CASE(candidates_keep_order_and_language) {
    const OutlineConfig config;
    std::vector<Line> lines;
    lines.push_back(MakeLine("Project Plan", 24, 0, 0));
    lines.push_back(MakeLine("1. Introduction", 18, 0, 1));
    for (std::size_t i = 2; i < 7; ++i)
        lines.push_back(MakeLine(fixtures::kBodyText, 10, 0, i));
    lines.push_back(MakeLine("2. Scope", 18, 1, 7));

    const SizeProfile profile = BuildSizeProfile(lines, config);
    const auto candidates = ClassifyLines(lines, profile, config, fixtures::FixedTagger("en"));

    BOOST_TEST_REQUIRE(candidates.size() == 3u);
    BOOST_TEST((candidates[0].level == HeadingLevel::Title));
    BOOST_TEST(candidates[1].line.text == "1. Introduction");
    BOOST_TEST((candidates[1].level == HeadingLevel::H1));
    BOOST_TEST(candidates[2].line.text == "2. Scope");
    BOOST_TEST(candidates[2].language == "en");
}

BOOST_AUTO_TEST_CASE(failing_tagger_marks_language_unknown) {
    const OutlineConfig config;
    std::vector<Line> lines;
    lines.push_back(MakeLine("1. Introduction", 18, 0, 0));
    for (std::size_t i = 1; i < 4; ++i)
        lines.push_back(MakeLine(fixtures::kBodyText, 10, 0, i));

    const SizeProfile profile = BuildSizeProfile(lines, config);
    const auto candidates = ClassifyLines(lines, profile, config, fixtures::ThrowingTagger());

    BOOST_TEST_REQUIRE(candidates.size() == 1u);
    BOOST_TEST(candidates[0].language == "unknown");
    BOOST_TEST((candidates[0].level == HeadingLevel::Title));
}

BOOST_AUTO_TEST_SUITE_END()
