#pragma once
#include <string_view>

#include "CjkText.hpp"

namespace pdfoutline::text::punct {
    /// Anything that is neither a letter, a digit nor whitespace.
    /// Covers ASCII punctuation, general punctuation, CJK symbols and
    /// full-width forms, bullets and box drawing.
    [[nodiscard]] inline bool IsPunctOrSymbol(const char32_t ch) noexcept {
        if (IsWhitespace(ch) || IsAnyDigit(ch) || IsLetter(ch))
            return false;

        if (ch < 0x80)
            return !IsAsciiLetterOrDigit(ch);

        // Latin-1 punctuation and symbols
        if (ch >= 0x00A1 && ch <= 0x00BF) return true;
        if (ch == 0x00D7 || ch == 0x00F7) return true;
        // General Punctuation, super/subscripts, currency, letterlike, arrows,
        // math operators, technical, box drawing, shapes, dingbats
        if (ch >= 0x2010 && ch <= 0x27BF) return true;
        // CJK Symbols and Punctuation
        if (ch >= 0x3001 && ch <= 0x303F) return true;
        // Katakana middle dot
        if (ch == 0x30FB) return true;
        // Full-width ASCII punctuation
        if (ch >= 0xFF01 && ch <= 0xFF0F) return true;
        if (ch >= 0xFF1A && ch <= 0xFF20) return true;
        if (ch >= 0xFF3B && ch <= 0xFF40) return true;
        if (ch >= 0xFF5B && ch <= 0xFF65) return true;
        // Arabic punctuation
        if (ch == 0x060C || ch == 0x061B || ch == 0x061F || ch == 0x066A || ch == 0x06D4) return true;

        return false;
    }

    /// Returns true if the string contains at least one non-space code point
    /// and every non-space code point is punctuation or a symbol.
    [[nodiscard]] inline bool IsAllPunctOrSymbol(const std::u32string_view s) noexcept {
        bool seen = false;
        for (const char32_t ch: s) {
            if (IsWhitespace(ch))
                continue;
            if (!IsPunctOrSymbol(ch))
                return false;
            seen = true;
        }
        return seen;
    }
} // namespace pdfoutline::text::punct
