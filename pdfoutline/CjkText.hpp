#pragma once
//
// CjkText.hpp
// -----------------------------------------------------------------------------
// Code point helpers shared by the line assembler, the heading predicates and
// the language tagger (UTF-8 in / UTF-32 working form).
//
// - UTF-8 <-> UTF-32 conversion
// - deterministic Unicode whitespace (no locale-dependent iswspace)
// - script classifiers (CJK, kana, Hangul, Arabic, Cyrillic, ...)
// -----------------------------------------------------------------------------

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace pdfoutline::text {
    // ---------- UTF-8 <-> UTF-32 helpers ----------

    inline std::u32string Utf8ToU32(const std::string_view s) {
        std::u32string out;
        out.reserve(s.size());

        auto p = reinterpret_cast<const unsigned char *>(s.data());
        const unsigned char *end = p + s.size();

        while (p < end) {
            uint32_t ch = 0;

            if (const unsigned char c = *p++; c < 0x80) {
                ch = c;
            } else if ((c >> 5) == 0x6 && p < end) {
                // 110xxxxx
                ch = ((c & 0x1F) << 6);
                ch |= (*p++ & 0x3F);
            } else if ((c >> 4) == 0xE && p + 1 < end) {
                // 1110xxxx
                ch = ((c & 0x0F) << 12);
                ch |= ((p[0] & 0x3F) << 6);
                ch |= ((p[1] & 0x3F));
                p += 2;
            } else if ((c >> 3) == 0x1E && p + 2 < end) {
                // 11110xxx
                ch = ((c & 0x07) << 18);
                ch |= ((p[0] & 0x3F) << 12);
                ch |= ((p[1] & 0x3F) << 6);
                ch |= ((p[2] & 0x3F));
                p += 3;
            } else {
                ch = 0xFFFD; // �
            }

            out.push_back(static_cast<char32_t>(ch));
        }

        return out;
    }

    inline void AppendUtf8(std::string &out, const char32_t ch) {
        if (const auto c = static_cast<uint32_t>(ch); c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else if (c < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        } else if (c < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (c >> 12)));
            out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (c >> 18)));
            out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }

    inline std::string U32ToUtf8(const std::u32string_view s) {
        std::string out;
        out.reserve(s.size() * 3);

        for (const char32_t ch: s)
            AppendUtf8(out, ch);

        return out;
    }

    // ---------- Unicode whitespace (deterministic; avoids locale-dependent iswspace) ----------

    [[nodiscard]]
    [[gnu::always_inline]] inline bool IsWhitespace(const char32_t ch) noexcept {
        // ASCII whitespace
        if (ch == U' ' || ch == U'\t' || ch == U'\n' || ch == U'\r' || ch == U'\f' || ch == U'\v')
            return true;

        // Common Unicode whitespace
        switch (ch) {
            case 0x00A0: // NO-BREAK SPACE
            case 0x1680: // OGHAM SPACE MARK
            case 0x2000: // EN QUAD
            case 0x2001: // EM QUAD
            case 0x2002: // EN SPACE
            case 0x2003: // EM SPACE
            case 0x2004: // THREE-PER-EM SPACE
            case 0x2005: // FOUR-PER-EM SPACE
            case 0x2006: // SIX-PER-EM SPACE
            case 0x2007: // FIGURE SPACE
            case 0x2008: // PUNCTUATION SPACE
            case 0x2009: // THIN SPACE
            case 0x200A: // HAIR SPACE
            case 0x2028: // LINE SEPARATOR
            case 0x2029: // PARAGRAPH SEPARATOR
            case 0x202F: // NARROW NO-BREAK SPACE
            case 0x205F: // MEDIUM MATHEMATICAL SPACE
            case 0x3000: // IDEOGRAPHIC SPACE (CJK)
                return true;
            default:
                return false;
        }
    }

    [[nodiscard]] inline bool IsBlank(const std::u32string_view s) noexcept {
        return std::all_of(s.begin(), s.end(), IsWhitespace);
    }

    // Trim + collapse inner whitespace runs to one ASCII space.
    inline std::u32string CollapseWhitespace(const std::u32string_view s) {
        std::u32string out;
        out.reserve(s.size());

        bool pendingSpace = false;
        for (const char32_t ch: s) {
            if (IsWhitespace(ch)) {
                pendingSpace = !out.empty();
                continue;
            }
            if (pendingSpace) {
                out.push_back(U' ');
                pendingSpace = false;
            }
            out.push_back(ch);
        }

        return out;
    }

    inline std::u32string_view TrimView(const std::u32string_view s) noexcept {
        std::size_t start = 0;
        std::size_t end = s.size();

        while (start < end && IsWhitespace(s[start]))
            ++start;
        while (end > start && IsWhitespace(s[end - 1]))
            --end;

        return s.substr(start, end - start);
    }

    // ---------- ASCII / digit classifiers ----------

    [[nodiscard]] inline bool IsAsciiDigit(const char32_t ch) noexcept {
        return ch >= U'0' && ch <= U'9';
    }

    [[nodiscard]] inline bool IsAsciiLetter(const char32_t ch) noexcept {
        return (ch >= U'A' && ch <= U'Z') || (ch >= U'a' && ch <= U'z');
    }

    [[nodiscard]] inline bool IsAsciiLetterOrDigit(const char32_t ch) noexcept {
        return IsAsciiDigit(ch) || IsAsciiLetter(ch);
    }

    // Full-width digits: '０'..'９'
    [[nodiscard]] inline bool IsFullwidthDigit(const char32_t ch) noexcept {
        return ch >= U'０' && ch <= U'９';
    }

    // Arabic-Indic and Extended Arabic-Indic digits
    [[nodiscard]] inline bool IsArabicIndicDigit(const char32_t ch) noexcept {
        return (ch >= 0x0660 && ch <= 0x0669) || (ch >= 0x06F0 && ch <= 0x06F9);
    }

    [[nodiscard]] inline bool IsAnyDigit(const char32_t ch) noexcept {
        return IsAsciiDigit(ch) || IsFullwidthDigit(ch) || IsArabicIndicDigit(ch);
    }

    // ---------- Script classifiers ----------

    enum class Script {
        Other,
        Latin,
        Han,
        Kana,
        Hangul,
        Arabic,
        Hebrew,
        Cyrillic,
        Devanagari,
        Thai,
        Greek,
    };

    [[nodiscard]] inline bool IsCjk(const char32_t ch) noexcept {
        const auto c = static_cast<uint32_t>(ch);

        // CJK Unified Ideographs Extension A: U+3400–U+4DBF
        if ((c - 0x3400u) <= (0x4DBFu - 0x3400u))
            return true;

        // CJK Unified Ideographs: U+4E00–U+9FFF
        if ((c - 0x4E00u) <= (0x9FFFu - 0x4E00u))
            return true;

        // CJK Compatibility Ideographs: U+F900–U+FAFF
        return (c - 0xF900u) <= (0xFAFFu - 0xF900u);
    }

    // Hiragana U+3040–U+309F, Katakana U+30A0–U+30FF
    [[nodiscard]] inline bool IsKana(const char32_t ch) noexcept {
        return ch >= 0x3040 && ch <= 0x30FF && ch != 0x30FB;
    }

    // Hangul syllables, Jamo and compatibility Jamo
    [[nodiscard]] inline bool IsHangul(const char32_t ch) noexcept {
        return (ch >= 0xAC00 && ch <= 0xD7AF) ||
               (ch >= 0x1100 && ch <= 0x11FF) ||
               (ch >= 0x3130 && ch <= 0x318F);
    }

    [[nodiscard]] inline bool IsArabicLetter(const char32_t ch) noexcept {
        if (IsArabicIndicDigit(ch))
            return false;
        // comma, semicolon, question mark, percent, full stop
        if (ch == 0x060C || ch == 0x061B || ch == 0x061F || ch == 0x066A || ch == 0x06D4)
            return false;
        return (ch >= 0x0600 && ch <= 0x06FF) ||
               (ch >= 0x0750 && ch <= 0x077F) ||
               (ch >= 0x08A0 && ch <= 0x08FF);
    }

    [[nodiscard]] inline bool IsHebrewLetter(const char32_t ch) noexcept {
        return ch >= 0x05D0 && ch <= 0x05EA;
    }

    [[nodiscard]] inline bool IsCyrillic(const char32_t ch) noexcept {
        return ch >= 0x0400 && ch <= 0x04FF;
    }

    [[nodiscard]] inline bool IsDevanagari(const char32_t ch) noexcept {
        return ch >= 0x0900 && ch <= 0x097F;
    }

    [[nodiscard]] inline bool IsThai(const char32_t ch) noexcept {
        return ch >= 0x0E00 && ch <= 0x0E7F;
    }

    [[nodiscard]] inline bool IsGreek(const char32_t ch) noexcept {
        return ch >= 0x0370 && ch <= 0x03FF;
    }

    // Basic Latin letters plus Latin-1 Supplement / Extended-A / Extended-B letters
    [[nodiscard]] inline bool IsLatinLetter(const char32_t ch) noexcept {
        if (IsAsciiLetter(ch))
            return true;
        if (ch >= 0x00C0 && ch <= 0x024F)
            return ch != 0x00D7 && ch != 0x00F7; // × ÷
        return false;
    }

    [[nodiscard]] inline Script ClassifyScript(const char32_t ch) noexcept {
        if (IsLatinLetter(ch)) return Script::Latin;
        if (IsKana(ch)) return Script::Kana;
        if (IsCjk(ch)) return Script::Han;
        if (IsHangul(ch)) return Script::Hangul;
        if (IsArabicLetter(ch)) return Script::Arabic;
        if (IsHebrewLetter(ch)) return Script::Hebrew;
        if (IsCyrillic(ch)) return Script::Cyrillic;
        if (IsDevanagari(ch)) return Script::Devanagari;
        if (IsThai(ch)) return Script::Thai;
        if (IsGreek(ch)) return Script::Greek;
        return Script::Other;
    }

    [[nodiscard]] inline bool IsLetter(const char32_t ch) noexcept {
        return ClassifyScript(ch) != Script::Other;
    }

    // Right-to-left scripts keep their character order during normalization
    [[nodiscard]] inline bool ContainsRtl(const std::u32string_view s) noexcept {
        return std::any_of(s.begin(), s.end(), [](const char32_t ch) {
            return IsArabicLetter(ch) || IsHebrewLetter(ch);
        });
    }

    // More ideographs/kana/hangul than Latin letters (digits and punctuation are neutral)
    [[nodiscard]] inline bool IsMostlyCjk(const std::u32string_view s) noexcept {
        std::size_t cjk = 0;
        std::size_t ascii = 0;

        for (const char32_t ch: s) {
            if (IsWhitespace(ch) || IsAsciiDigit(ch) || IsFullwidthDigit(ch))
                continue;

            if (IsCjk(ch) || IsKana(ch) || IsHangul(ch)) {
                ++cjk;
                continue;
            }

            // Count ASCII letters only; ASCII punctuation is neutral
            if (ch <= 0x7F && IsAsciiLetter(ch))
                ++ascii;
        }

        return cjk > 0 && cjk >= ascii;
    }
} // namespace pdfoutline::text
