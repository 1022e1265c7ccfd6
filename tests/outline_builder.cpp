// -*- mode: c++ -*-

#include <boost/test/unit_test.hpp>

#include "OutlineBuilder.hpp"
#include "test_fixtures.hpp"

using namespace pdfoutline;
using fixtures::MakeLine;

namespace {
    HeadingCandidate Candidate(const std::string &text, const HeadingLevel level, const int page,
                               const std::size_t ordinal) {
        HeadingCandidate c;
        c.line = MakeLine(text, 12.0, page, ordinal);
        c.level = level;
        return c;
    }
} // namespace

BOOST_AUTO_TEST_SUITE(outline_builder)

BOOST_AUTO_TEST_CASE(maps_levels_and_one_based_pages) {
    const std::vector<HeadingCandidate> candidates = {
        Candidate("1. Introduction", HeadingLevel::H1, 0, 0),
        Candidate("1.1 Background", HeadingLevel::H2, 1, 1),
        Candidate("1.1.1 History", HeadingLevel::H3, 1, 2),
    };

    const auto outline = BuildOutline(candidates, std::nullopt, OutlineConfig{});
    const std::vector<OutlineEntry> expected = {
        {HeadingLevel::H1, "1. Introduction", 1},
        {HeadingLevel::H2, "1.1 Background", 2},
        {HeadingLevel::H3, "1.1.1 History", 2},
    };
    BOOST_TEST(outline == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(title_line_and_title_tier_are_dropped) {
    const std::vector<HeadingCandidate> candidates = {
        Candidate("Project Plan", HeadingLevel::Title, 0, 0),
        Candidate("Subtitle", HeadingLevel::H1, 0, 1),
        Candidate("Another Big Line", HeadingLevel::Title, 0, 2),
        Candidate("1. Introduction", HeadingLevel::H1, 0, 3),
    };

    const auto outline = BuildOutline(candidates, std::size_t{1}, OutlineConfig{});
    BOOST_TEST_REQUIRE(outline.size() == 1u);
    BOOST_TEST(outline[0].text == "1. Introduction");
}

BOOST_AUTO_TEST_CASE(adjacent_duplicates_collapse) {
    const std::vector<HeadingCandidate> candidates = {
        Candidate("Overview", HeadingLevel::H1, 0, 0),
        Candidate("Overview ", HeadingLevel::H1, 0, 1),
        Candidate("Overview", HeadingLevel::H1, 1, 2),
    };

    const auto outline = BuildOutline(candidates, std::nullopt, OutlineConfig{});
    BOOST_TEST_REQUIRE(outline.size() == 2u);
    BOOST_TEST(outline[0].page == 1);
    BOOST_TEST(outline[1].page == 2);
}

BOOST_AUTO_TEST_CASE(same_text_different_levels_keep_the_higher) {
    const std::vector<HeadingCandidate> candidates = {
        Candidate("Scope", HeadingLevel::H2, 0, 0),
        Candidate("Scope", HeadingLevel::H1, 0, 1),
        Candidate("Scope", HeadingLevel::H3, 0, 2),
    };

    const auto outline = BuildOutline(candidates, std::nullopt, OutlineConfig{});
    BOOST_TEST_REQUIRE(outline.size() == 1u);
    BOOST_TEST(outline[0].level == HeadingLevel::H1);
}

BOOST_AUTO_TEST_CASE(orphan_lower_levels_are_not_promoted) {
    const std::vector<HeadingCandidate> candidates = {
        Candidate("Detail", HeadingLevel::H3, 0, 0),
        Candidate("Top", HeadingLevel::H1, 0, 1),
    };

    const auto outline = BuildOutline(candidates, std::nullopt, OutlineConfig{});
    BOOST_TEST_REQUIRE(outline.size() == 2u);
    BOOST_TEST(outline[0].level == HeadingLevel::H3);
    BOOST_TEST(outline[1].level == HeadingLevel::H1);
}

BOOST_AUTO_TEST_CASE(non_adjacent_repeats_are_kept) {
    const std::vector<HeadingCandidate> candidates = {
        Candidate("Summary", HeadingLevel::H2, 0, 0),
        Candidate("Details", HeadingLevel::H2, 0, 1),
        Candidate("Summary", HeadingLevel::H2, 0, 2),
    };

    BOOST_TEST(BuildOutline(candidates, std::nullopt, OutlineConfig{}).size() == 3u);
}

BOOST_AUTO_TEST_CASE(repeated_words_in_a_heading_are_kept) {
    const std::vector<HeadingCandidate> candidates = {
        Candidate("Bye Bye Bye", HeadingLevel::H1, 0, 0),
        Candidate(" Tora! Tora! Tora! ", HeadingLevel::H2, 0, 1),
    };

    const auto outline = BuildOutline(candidates, std::nullopt, OutlineConfig{});
    BOOST_TEST_REQUIRE(outline.size() == 2u);
    BOOST_TEST(outline[0].text == "Bye Bye Bye");
    BOOST_TEST(outline[1].text == "Tora! Tora! Tora!");

    OutlineConfig collapsing;
    collapsing.collapseRepeats = true;
    BOOST_TEST(BuildOutline(candidates, std::nullopt, collapsing)[0].text == "Bye");
}

BOOST_AUTO_TEST_SUITE_END()
