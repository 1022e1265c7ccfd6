// -*- mode: c++ -*-

#include <string>

#include <boost/test/unit_test.hpp>
#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include "HeadingPatterns.hpp"

using namespace pdfoutline;

BOOST_AUTO_TEST_SUITE(heading_patterns)

static const std::vector<std::string> numbered_dataset{
    "1. Introduction",
    "2) Scope",
    "1.1 Background",
    "2.3.4. Detailed Design",
    "IV. Results",
    "A. Glossary",
    "Chapter 3 Methods",
    "Section 2.3",
    "Part IV",
    "Appendix A",
    u8"第3章 总则",
    u8"第十二节 附录",
    u8"一、概述",
    u8"（二）方法",
    u8"제 1 장 서론",
};

BOOST_DATA_TEST_CASE(numbering_is_recognised, data::make(numbered_dataset), text) {
    BOOST_TEST(StartsWithNumbering(text));
}

static const std::vector<std::string> unnumbered_dataset{
    "Introduction",
    "2024 annual report",
    "In 1999 the company grew",
    "",
};

BOOST_DATA_TEST_CASE(plain_text_is_not_numbered, data::make(unnumbered_dataset), text) {
    BOOST_TEST(!StartsWithNumbering(text));
}

BOOST_AUTO_TEST_CASE(short_line_counts_words) {
    BOOST_TEST(IsShortLine("Project Plan", 15, 30));
    BOOST_TEST(IsShortLine("one two three", 3, 30));
    BOOST_TEST(!IsShortLine("one two three four", 3, 30));
    BOOST_TEST(!IsShortLine("   ", 15, 30));
}

BOOST_AUTO_TEST_CASE(short_line_counts_cjk_code_points) {
    BOOST_TEST(IsShortLine(u8"第一章 总则", 15, 30));
    BOOST_TEST(!IsShortLine(u8"这是一个非常长的中文句子用来测试代码点上限是否按照配置生效而不是按照空格分词计算长度", 15, 30));
}

BOOST_AUTO_TEST_CASE(all_caps) {
    BOOST_TEST(IsAllCaps("EXECUTIVE SUMMARY"));
    BOOST_TEST(IsAllCaps("SECTION 2: RESULTS"));
    BOOST_TEST(!IsAllCaps("Executive Summary"));
    BOOST_TEST(!IsAllCaps("2024"));
    BOOST_TEST(!IsAllCaps(std::string(60, 'A')));
}

BOOST_AUTO_TEST_CASE(cjk_chapter_heading) {
    BOOST_TEST(IsCjkChapterHeading(u8"前言"));
    BOOST_TEST(IsCjkChapterHeading(u8"第一章 风起"));
    BOOST_TEST(IsCjkChapterHeading(u8"番外 一"));
    BOOST_TEST(!IsCjkChapterHeading(u8"第一章分析了结果"));
    BOOST_TEST(!IsCjkChapterHeading(u8"今天天气很好"));
}

BOOST_AUTO_TEST_CASE(rejections) {
    BOOST_TEST(IsPureNumber("12"));
    BOOST_TEST(IsPureNumber("- 3 -"));
    BOOST_TEST(IsPureNumber("1.2"));
    BOOST_TEST(!IsPureNumber("1. Introduction"));
    BOOST_TEST(!IsPureNumber("--"));

    BOOST_TEST(IsPurePunctuation("* * *"));
    BOOST_TEST(IsPurePunctuation(u8"……"));
    BOOST_TEST(!IsPurePunctuation("A."));
    BOOST_TEST(!IsPurePunctuation(""));

    BOOST_TEST(ExceedsMaxLength(std::string(201, 'x'), 200));
    BOOST_TEST(!ExceedsMaxLength(std::string(200, 'x'), 200));
}

BOOST_AUTO_TEST_CASE(word_and_code_point_counts) {
    BOOST_TEST(CountWords("  alpha  beta\tgamma ") == 3u);
    BOOST_TEST(CountCodePoints(u8"日本語") == 3u);
}

BOOST_AUTO_TEST_SUITE_END()
