#pragma once
//
// HeadingPatterns.hpp
// -----------------------------------------------------------------------------
// Independent text predicates used by the heading classifier (UTF-8 input).
//
// Corroborating checks (any one is enough for a tier-sized line):
//   StartsWithNumbering, IsShortLine, IsBoldLine, IsAllCaps, IsCjkChapterHeading
//
// Rejections (a line is never a heading when any one holds):
//   IsPureNumber, IsPurePunctuation, ExceedsMaxLength
// -----------------------------------------------------------------------------

#include <cstddef>
#include <string>

#include "OutlineTypes.hpp"

namespace pdfoutline {
    // "1.", "1.1", "2)", "IV.", "A.", "Chapter 1", "Section 2.3", "第3章", "一、"
    bool StartsWithNumbering(const std::string &text);

    // Whitespace-separated words; CJK-dominant lines count code points instead.
    bool IsShortLine(const std::string &text, int maxWords, int maxCjkChars);

    [[nodiscard]] inline bool IsBoldLine(const Line &line) noexcept { return line.isBold; }

    // At least one cased letter, no lowercase letters, shorter than 50 code points.
    bool IsAllCaps(const std::string &text);

    // 前言 / 序章 / 终章 / 尾声 / 后记 / 番外..., and short 第N章/卷/节/部/回 lines.
    bool IsCjkChapterHeading(const std::string &text);

    // Digits with optional separators only: "12", "1.2", "- 3 -", "٣"
    bool IsPureNumber(const std::string &text);

    bool IsPurePunctuation(const std::string &text);

    bool ExceedsMaxLength(const std::string &text, int maxChars);

    std::size_t CountWords(const std::string &text);

    std::size_t CountCodePoints(const std::string &text);
} // namespace pdfoutline
