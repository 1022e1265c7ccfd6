#include "TextNormalize.hpp"

#include <QString>

#include "CjkText.hpp"

namespace pdfoutline {
    std::string NormalizeLineText(const std::string &utf8) {
        if (utf8.empty())
            return {};

        const QString nfkc = QString::fromUtf8(utf8.data(), static_cast<qsizetype>(utf8.size()))
                .normalized(QString::NormalizationForm_KC);
        const QByteArray bytes = nfkc.toUtf8();
        const std::u32string u32 = text::Utf8ToU32(std::string_view(bytes.constData(),
                                                                    static_cast<std::size_t>(bytes.size())));

        // RTL lines: keep the character sequence untouched apart from trimming
        if (text::ContainsRtl(u32))
            return text::U32ToUtf8(text::TrimView(u32));

        return text::U32ToUtf8(text::CollapseWhitespace(u32));
    }

    std::string TrimText(const std::string &utf8) {
        const std::u32string u32 = text::Utf8ToU32(utf8);
        return text::U32ToUtf8(text::TrimView(u32));
    }

    // ------------------------------------------------------------
    // Style-layer repeat collapse for PDF headings / title lines.
    //
    // Conceptually similar to:
    //
    //    (.{4,10}?)\1{2,3}
    //
    // i.e. "a phrase of length 4-10 chars, repeated 3-4 times",
    // but implemented token- and phrase-aware so CJK titles and
    // multi-word headings are handled.
    // ------------------------------------------------------------

    std::u32string CollapseRepeatedToken(const std::u32string &token) {
        const std::size_t length = token.size();
        // Very short tokens or huge ones are unlikely to be styled repeats.
        if (length < 4 || length > 200) {
            return token;
        }

        for (std::size_t unit_len = 4;
             unit_len <= 10 && unit_len <= length / 3;
             ++unit_len) {
            if (length % unit_len != 0)
                continue;

            const std::u32string unit = token.substr(0, unit_len);
            bool all_match = true;

            for (std::size_t pos = 0; pos < length; pos += unit_len) {
                if (token.compare(pos, unit_len, unit) != 0) {
                    all_match = false;
                    break;
                }
            }

            if (all_match) {
                return unit;
            }
        }

        return token;
    }

    std::vector<std::u32string>
    CollapseRepeatedWordSequences(const std::vector<std::u32string> &parts) {
        constexpr int minRepeats = 3;
        constexpr int maxPhraseLen = 8;

        const std::size_t n = parts.size();
        if (n < static_cast<std::size_t>(minRepeats)) {
            return parts;
        }

        // Scan from left to right for any repeating phrase.
        for (std::size_t start = 0; start < n; ++start) {
            for (int phraseLen = 1;
                 phraseLen <= maxPhraseLen && start + static_cast<std::size_t>(phraseLen) <= n;
                 ++phraseLen) {
                const auto len = static_cast<std::size_t>(phraseLen);
                std::size_t count = 1;

                while (true) {
                    const std::size_t nextStart = start + count * len;
                    if (nextStart + len > n) {
                        break;
                    }

                    bool equal = true;
                    for (std::size_t k = 0; k < len; ++k) {
                        if (parts[start + k] != parts[nextStart + k]) {
                            equal = false;
                            break;
                        }
                    }

                    if (!equal)
                        break;

                    ++count;
                }

                if (count < static_cast<std::size_t>(minRepeats)) {
                    continue;
                }

                //   [prefix] + [one phrase] + [tail]
                std::vector<std::u32string> result;
                result.reserve(n - (count - 1) * len);

                for (std::size_t i = 0; i < start; ++i) {
                    result.push_back(parts[i]);
                }

                for (std::size_t k = 0; k < len; ++k) {
                    result.push_back(parts[start + k]);
                }

                const std::size_t tailStart = start + count * len;
                for (std::size_t i = tailStart; i < n; ++i) {
                    result.push_back(parts[i]);
                }

                return result;
            }
        }

        return parts;
    }

    std::string CollapseRepeatedSegments(const std::string &utf8) {
        if (utf8.empty())
            return utf8;

        const std::u32string line = text::Utf8ToU32(utf8);

        // Split on spaces/tabs into discrete tokens.
        std::vector<std::u32string> parts; {
            std::u32string current;
            for (const char32_t ch: line) {
                if (ch == U' ' || ch == U'\t') {
                    if (!current.empty()) {
                        parts.push_back(current);
                        current.clear();
                    }
                } else {
                    current.push_back(ch);
                }
            }
            if (!current.empty()) {
                parts.push_back(current);
            }
        }

        if (parts.empty())
            return utf8;

        // 1) Phrase-level collapse
        parts = CollapseRepeatedWordSequences(parts);

        // 2) Token-level collapse
        std::u32string out;
        bool first = true;
        for (const auto &tok: parts) {
            if (!first) {
                out.push_back(U' ');
            }
            out += CollapseRepeatedToken(tok);
            first = false;
        }

        return text::U32ToUtf8(out);
    }
} // namespace pdfoutline
