// -*- mode: c++ -*-

#include <boost/test/unit_test.hpp>

#include "HeadingClassifier.hpp"
#include "TitleSelector.hpp"
#include "test_fixtures.hpp"

using namespace pdfoutline;
using fixtures::MakeLine;

BOOST_AUTO_TEST_SUITE(title_selector)

BOOST_AUTO_TEST_CASE(topmost_title_tier_line_on_first_page) {
    const OutlineConfig config;
    std::vector<Line> lines;
    lines.push_back(MakeLine("Draft", 10, 0, 0));
    lines.push_back(MakeLine("Project Plan", 24, 0, 1));
    lines.push_back(MakeLine("Second Title Line", 24, 0, 2));
    for (std::size_t i = 3; i < 8; ++i)
        lines.push_back(MakeLine(fixtures::kBodyText, 10, 0, i));

    const SizeProfile profile = BuildSizeProfile(lines, config);
    const TitleSelection title = SelectTitle(lines, profile, config);

    BOOST_TEST(title.text == "Project Plan");
    BOOST_TEST(title.ordinal.value() == 1u);
}

BOOST_AUTO_TEST_CASE(over_long_title_tier_lines_are_skipped) {
    OutlineConfig config;
    config.maxTitleChars = 12;

    std::vector<Line> lines;
    lines.push_back(MakeLine("A Title That Is Far Too Long", 24, 0, 0));
    lines.push_back(MakeLine("Short Title", 24, 0, 1));
    for (std::size_t i = 2; i < 6; ++i)
        lines.push_back(MakeLine(fixtures::kBodyText, 10, 0, i));

    const SizeProfile profile = BuildSizeProfile(lines, config);
    BOOST_TEST(SelectTitle(lines, profile, config).text == "Short Title");
}

BOOST_AUTO_TEST_CASE(later_pages_never_provide_the_title) {
    const OutlineConfig config;
    std::vector<Line> lines;
    lines.push_back(MakeLine("Cover note", 12, 0, 0));
    lines.push_back(MakeLine(fixtures::kBodyText, 10, 0, 1));
    lines.push_back(MakeLine(fixtures::kBodyText, 10, 0, 2));
    lines.push_back(MakeLine("Big Heading", 30, 1, 3));

    const SizeProfile profile = BuildSizeProfile(lines, config);
    const TitleSelection title = SelectTitle(lines, profile, config);

    // No first-page line sits at the Title tier: largest first-page font wins
    BOOST_TEST(title.text == "Cover note");
    BOOST_TEST(title.ordinal.value() == 0u);
}

BOOST_AUTO_TEST_CASE(single_size_falls_back_to_first_line) {
    const OutlineConfig config;
    std::vector<Line> lines;
    lines.push_back(MakeLine("First line", 12, 0, 0));
    lines.push_back(MakeLine("Second line", 12, 0, 1));

    const SizeProfile profile = BuildSizeProfile(lines, config);
    BOOST_TEST(SelectTitle(lines, profile, config).text == "First line");
}

BOOST_AUTO_TEST_CASE(empty_first_page_gives_empty_title) {
    const OutlineConfig config;
    std::vector<Line> lines;
    lines.push_back(MakeLine("Only on page two", 20, 1, 0));

    const SizeProfile profile = BuildSizeProfile(lines, config);
    const TitleSelection title = SelectTitle(lines, profile, config);

    BOOST_TEST(title.text.empty());
    BOOST_TEST(!title.ordinal.has_value());
}

BOOST_AUTO_TEST_CASE(title_text_is_kept_as_written) {
    OutlineConfig config;
    std::vector<Line> lines;
    lines.push_back(MakeLine("  Tora! Tora! Tora!  ", 24, 0, 0));
    for (std::size_t i = 1; i < 4; ++i)
        lines.push_back(MakeLine(fixtures::kBodyText, 10, 0, i));

    const SizeProfile profile = BuildSizeProfile(lines, config);
    BOOST_TEST(SelectTitle(lines, profile, config).text == "Tora! Tora! Tora!");
}

BOOST_AUTO_TEST_CASE(repeated_styling_is_collapsed_on_request) {
    OutlineConfig config;
    std::vector<Line> lines;
    lines.push_back(MakeLine("Annual Report Annual Report Annual Report", 24, 0, 0));
    for (std::size_t i = 1; i < 4; ++i)
        lines.push_back(MakeLine(fixtures::kBodyText, 10, 0, i));

    const SizeProfile profile = BuildSizeProfile(lines, config);
    BOOST_TEST(SelectTitle(lines, profile, config).text == "Annual Report Annual Report Annual Report");

    config.collapseRepeats = true;
    BOOST_TEST(SelectTitle(lines, profile, config).text == "Annual Report");
}

BOOST_AUTO_TEST_SUITE_END()
