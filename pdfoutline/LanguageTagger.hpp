#pragma once

#include <memory>
#include <string>

#include "OutlineErrors.hpp"

class ZhoChecker;

namespace pdfoutline {
    inline constexpr const char *kUnknownLanguage = "unknown";

    // Maps a text string to a language code ("en", "zh-cn", "ja", ...).
    // Implementations throw LanguageDetectionError when they cannot decide.
    class ILanguageTagger {
    public:
        virtual ~ILanguageTagger() = default;

        [[nodiscard]] virtual std::string Detect(const std::string &utf8) const = 0;
    };

    // Script census + stop-word scoring, offline and deterministic.
    //
    // - kana => ja, Hangul => ko, Han => zh-cn / zh-tw (OpenCC variant check)
    // - Arabic, Hebrew, Cyrillic, Devanagari, Thai, Greek => ar, he, ru/uk, hi, th, el
    // - Latin => best stop-word hit among en, fr, de, es, it, pt, nl
    class ScriptLanguageTagger final : public ILanguageTagger {
    public:
        explicit ScriptLanguageTagger(int minLetters = 10);

        ~ScriptLanguageTagger() override;

        ScriptLanguageTagger(const ScriptLanguageTagger &) = delete;

        ScriptLanguageTagger &operator=(const ScriptLanguageTagger &) = delete;

        [[nodiscard]] std::string Detect(const std::string &utf8) const override;

    private:
        [[nodiscard]] std::string DetectLatin(const std::u32string &cleaned) const;

        [[nodiscard]] std::string DetectChineseVariant(const std::string &utf8) const;

        int minLetters_;
        std::unique_ptr<ZhoChecker> zho_;
    };

    // Never throws: tagger failures and inconclusive results become "unknown".
    std::string TagLanguage(const ILanguageTagger &tagger, const std::string &utf8);
} // namespace pdfoutline
