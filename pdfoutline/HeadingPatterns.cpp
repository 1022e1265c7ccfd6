#include "HeadingPatterns.hpp"

#include <algorithm>
#include <string_view>

#include <QString>

#include "boost/regex.hpp"

#include "CjkText.hpp"
#include "PunctSets.hpp"
#include "textutilities.h"

namespace pdfoutline {
    namespace {
        // "1.1 Background", "2.3.4. Scope"
        const boost::wregex &MultiLevelNumber() {
            static const boost::wregex re(LR"(^\s*\d{1,3}(?:[.．]\d{1,3})+[.)]?\s+\S)");
            return re;
        }

        // "1. Introduction", "2) Scope", "3：範囲"
        const boost::wregex &SingleLevelNumber() {
            static const boost::wregex re(LR"(^\s*\d{1,3}[.)）．:：]\s*\S)");
            return re;
        }

        // "IV. Results"
        const boost::wregex &RomanNumber() {
            static const boost::wregex re(LR"(^\s*[IVXLC]{1,7}[.)]\s+\S)");
            return re;
        }

        // "A. Appendix"
        const boost::wregex &LetterNumber() {
            static const boost::wregex re(LR"(^\s*[A-Z][.)]\s+\S)");
            return re;
        }

        // "Chapter 1", "Section 2.3", "Part IV", "Appendix A", "Глава 2"
        const boost::wregex &KeywordNumber() {
            static const boost::wregex re(
                LR"(^\s*(?:chapter|section|part|appendix|annex|article|lesson|unit|)"
                LR"(kapitel|abschnitt|teil|chapitre|partie|cap[ií]tulo|capitolo|sezione|parte|hoofdstuk|)"
                LR"([Гг]лава|[Рр]аздел|[Чч]асть))"
                LR"(\s+(?:\d+(?:\.\d+)*|[ivxlc]+|[a-z])\b)",
                boost::regex::perl | boost::regex::icase);
            return re;
        }

        // "第3章", "第十二节", "第 2 部"
        const boost::wregex &CjkOrdinal() {
            static const boost::wregex re(
                LR"(^\s*第\s*[0-9０-９一二三四五六七八九十百千零〇两兩]+\s*[章节節部卷回篇条條课課])");
            return re;
        }

        // "一、概述", "（二）方法"
        const boost::wregex &CjkEnumeration() {
            static const boost::wregex re(
                LR"(^\s*(?:[一二三四五六七八九十]{1,3}\s*[、.．]|[（(][一二三四五六七八九十0-9]{1,3}[)）]))");
            return re;
        }

        // "제 1 장"
        const boost::wregex &HangulOrdinal() {
            static const boost::wregex re(LR"(^\s*제\s*\d+\s*[장절편부])");
            return re;
        }

        // "١. مقدمة"
        const boost::wregex &ArabicIndicNumber() {
            static const boost::wregex re(LR"(^\s*[\x{0660}-\x{0669}\x{06F0}-\x{06F9}]+[.)\-–]\s*\S)");
            return re;
        }

        // ---------- CJK chapter headings ----------

        const std::u32string TITLE_WORDS[] = {
            U"前言", U"序章", U"终章", U"終章", U"尾声", U"尾聲",
            U"后记", U"後記", U"楔子", U"序言", U"引言", U"结语", U"結語"
        };

        // Markers like 章 / 节 / 部 / 卷 / 回 etc.
        constexpr std::u32string_view CHAPTER_MARKERS = U"章节部卷節回";

        // 章分 / 部合 ... are not chapter headings
        constexpr std::u32string_view EXCLUDED_CHAPTER_MARKERS_SUFFIX = U"分合";

        constexpr std::size_t MAX_CHAPTER_HEADING_LEN = 50;

        bool Contains(const std::u32string_view s, const char32_t ch) noexcept {
            return s.find(ch) != std::u32string_view::npos;
        }
    } // namespace

    bool StartsWithNumbering(const std::string &text) {
        if (text.empty())
            return false;

        const std::wstring w = utf8_to_wstring(text);
        return boost::regex_search(w, MultiLevelNumber()) ||
               boost::regex_search(w, SingleLevelNumber()) ||
               boost::regex_search(w, RomanNumber()) ||
               boost::regex_search(w, LetterNumber()) ||
               boost::regex_search(w, KeywordNumber()) ||
               boost::regex_search(w, CjkOrdinal()) ||
               boost::regex_search(w, CjkEnumeration()) ||
               boost::regex_search(w, HangulOrdinal()) ||
               boost::regex_search(w, ArabicIndicNumber());
    }

    std::size_t CountWords(const std::string &text) {
        const std::u32string u32 = text::Utf8ToU32(text);

        std::size_t words = 0;
        bool inWord = false;
        for (const char32_t ch: u32) {
            if (text::IsWhitespace(ch)) {
                inWord = false;
            } else if (!inWord) {
                inWord = true;
                ++words;
            }
        }
        return words;
    }

    std::size_t CountCodePoints(const std::string &text) {
        return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](const char c) {
            return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
        }));
    }

    bool IsShortLine(const std::string &text, const int maxWords, const int maxCjkChars) {
        const std::u32string u32 = text::Utf8ToU32(text);
        if (text::IsBlank(u32))
            return false;

        if (text::IsMostlyCjk(u32)) {
            const auto visible = std::count_if(u32.begin(), u32.end(), [](const char32_t ch) {
                return !text::IsWhitespace(ch);
            });
            return visible <= maxCjkChars;
        }

        return CountWords(text) <= static_cast<std::size_t>(maxWords);
    }

    bool IsAllCaps(const std::string &text) {
        if (CountCodePoints(text) >= 50)
            return false;

        const QString s = QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
        bool hasUpper = false;
        for (const QChar c: s) {
            if (c.isLower())
                return false;
            if (c.isUpper())
                hasUpper = true;
        }
        return hasUpper;
    }

    // Matches:
    //  - 前言 / 序章 / 终章 / 尾声 / 后记 / 尾聲 / 後記 ...
    //  - 番外 + optional short suffix
    //  - Short chapter-like lines with 第N章/卷/节/部/回 (excluding 分 / 合)
    //
    // Equivalent to:
    // ^(?=.{0,50}$)
    // (前言|序章|...|番外.{0,15}|.{0,10}?第.{0,5}?([章节部卷節回][^分合]).{0,20}?)
    bool IsCjkChapterHeading(const std::string &text) {
        const std::u32string u32 = text::Utf8ToU32(text);
        const std::u32string_view s = text::TrimView(u32);

        const std::size_t len = s.size();
        if (len == 0 || len > MAX_CHAPTER_HEADING_LEN)
            return false;

        // 1) Fixed title words
        for (const auto &w: TITLE_WORDS) {
            if (s.substr(0, w.size()) == w)
                return true;
        }

        // 1b) 番外.{0,15}
        if (s.substr(0, 2) == U"番外" && len <= 2 + 15)
            return true;

        // 2a) Search for '第' within first 10 chars
        std::size_t di = std::u32string_view::npos;
        const std::size_t max_before_di = std::min<std::size_t>(10, len - 1);
        for (std::size_t i = 0; i <= max_before_di; ++i) {
            if (s[i] == U'第') {
                di = i;
                break;
            }
        }
        if (di == std::u32string_view::npos)
            return false;

        // 2b) After '第', scan up to 5 chars to find a chapter marker
        const std::size_t max_marker_pos = std::min<std::size_t>(len - 1, di + 1 + 5);
        for (std::size_t j = di + 1; j <= max_marker_pos; ++j) {
            if (!Contains(CHAPTER_MARKERS, s[j]))
                continue;

            // Next char must NOT be 分 / 合
            if (j + 1 < len && Contains(EXCLUDED_CHAPTER_MARKERS_SUFFIX, s[j + 1]))
                continue;

            // Remaining tail length <= 20
            if (len - j - 1 <= 20)
                return true;
        }

        return false;
    }

    bool IsPureNumber(const std::string &text) {
        static constexpr std::u32string_view kSeparators = U".,:-–—/()";

        const std::u32string u32 = text::Utf8ToU32(text);
        bool digit = false;
        for (const char32_t ch: u32) {
            if (text::IsAnyDigit(ch)) {
                digit = true;
                continue;
            }
            if (text::IsWhitespace(ch) || kSeparators.find(ch) != std::u32string_view::npos)
                continue;
            return false;
        }
        return digit;
    }

    bool IsPurePunctuation(const std::string &text) {
        return text::punct::IsAllPunctOrSymbol(text::Utf8ToU32(text));
    }

    bool ExceedsMaxLength(const std::string &text, const int maxChars) {
        return CountCodePoints(text) > static_cast<std::size_t>(std::max(maxChars, 0));
    }
} // namespace pdfoutline
