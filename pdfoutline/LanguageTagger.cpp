#include "LanguageTagger.hpp"

#include <algorithm>
#include <array>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <QDebug>

#include "CjkText.hpp"
#include "textutilities.h"

namespace pdfoutline {
    namespace {
        struct StopWords {
            const char *code;
            std::unordered_set<std::u32string> words;
        };

        // Short, high-frequency function words; enough to separate the
        // common Latin-script languages on heading-length text.
        const std::vector<StopWords> &LatinStopWords() {
            static const std::vector<StopWords> table = {
                {"en", {U"the", U"and", U"of", U"to", U"in", U"for", U"is", U"on", U"with", U"by",
                        U"an", U"are", U"this", U"that", U"from", U"at", U"as", U"be", U"or", U"it",
                        U"introduction", U"chapter", U"overview", U"summary", U"background"}},
                {"fr", {U"le", U"la", U"les", U"des", U"et", U"du", U"un", U"une", U"pour", U"dans",
                        U"est", U"sur", U"par", U"au", U"aux", U"avec", U"que", U"qui", U"ce", U"sont"}},
                {"de", {U"der", U"die", U"das", U"und", U"den", U"dem", U"des", U"ein", U"eine", U"mit",
                        U"für", U"ist", U"von", U"zu", U"auf", U"im", U"nicht", U"sich", U"auch", U"über"}},
                {"es", {U"el", U"los", U"las", U"del", U"y", U"en", U"un", U"una", U"para", U"con",
                        U"por", U"es", U"que", U"se", U"al", U"como", U"su", U"más", U"capítulo", U"introducción"}},
                {"it", {U"il", U"lo", U"gli", U"della", U"delle", U"di", U"e", U"per", U"con", U"un",
                        U"una", U"che", U"non", U"sono", U"nel", U"alla", U"dei", U"è", U"capitolo", U"introduzione"}},
                {"pt", {U"o", U"os", U"as", U"do", U"da", U"dos", U"das", U"e", U"em", U"um",
                        U"uma", U"para", U"com", U"não", U"que", U"se", U"na", U"no", U"capítulo", U"introdução"}},
                {"nl", {U"de", U"het", U"een", U"en", U"van", U"in", U"op", U"met", U"voor", U"is",
                        U"dat", U"die", U"niet", U"zijn", U"aan", U"bij", U"ook", U"naar", U"hoofdstuk", U"inleiding"}},
            };
            return table;
        }

        char32_t ToLowerLatin(const char32_t ch) noexcept {
            if (ch >= U'A' && ch <= U'Z')
                return ch + (U'a' - U'A');
            // Latin-1 uppercase block (except ×)
            if (ch >= 0x00C0 && ch <= 0x00DE && ch != 0x00D7)
                return ch + 0x20;
            return ch;
        }

        // Ukrainian-only Cyrillic letters: і ї є ґ (and capitals)
        bool IsUkrainianLetter(const char32_t ch) noexcept {
            switch (ch) {
                case 0x0456: case 0x0406:
                case 0x0457: case 0x0407:
                case 0x0454: case 0x0404:
                case 0x0491: case 0x0490:
                    return true;
                default:
                    return false;
            }
        }
    } // namespace

    ScriptLanguageTagger::ScriptLanguageTagger(const int minLetters)
        : minLetters_(minLetters),
          zho_(std::make_unique<ZhoChecker>()) {
        if (!zho_->IsValid())
            qWarning() << "OpenCC instance unavailable; Chinese text is tagged zh-cn";
    }

    ScriptLanguageTagger::~ScriptLanguageTagger() = default;

    std::string ScriptLanguageTagger::Detect(const std::string &utf8) const {
        const std::u32string u32 = text::Utf8ToU32(utf8);

        // Keep letters only; everything else separates words
        std::u32string cleaned;
        cleaned.reserve(u32.size());
        std::size_t letters = 0;
        std::array<std::size_t, 11> census{};

        for (const char32_t ch: u32) {
            const text::Script script = text::ClassifyScript(ch);
            if (script == text::Script::Other) {
                if (!cleaned.empty() && cleaned.back() != U' ')
                    cleaned.push_back(U' ');
                continue;
            }
            ++census[static_cast<std::size_t>(script)];
            ++letters;
            cleaned.push_back(ch);
        }

        if (letters < static_cast<std::size_t>(std::max(minLetters_, 1)))
            throw LanguageDetectionError("text too short for language detection");

        auto count = [&](const text::Script s) { return census[static_cast<std::size_t>(s)]; };

        // Japanese mixes kana with Han; any kana decides it
        const std::size_t japanese = count(text::Script::Kana) > 0
                                         ? count(text::Script::Kana) + count(text::Script::Han)
                                         : 0;

        const std::pair<text::Script, std::size_t> ranked[] = {
            {text::Script::Kana, japanese},
            {text::Script::Han, count(text::Script::Han)},
            {text::Script::Hangul, count(text::Script::Hangul)},
            {text::Script::Latin, count(text::Script::Latin)},
            {text::Script::Cyrillic, count(text::Script::Cyrillic)},
            {text::Script::Arabic, count(text::Script::Arabic)},
            {text::Script::Hebrew, count(text::Script::Hebrew)},
            {text::Script::Devanagari, count(text::Script::Devanagari)},
            {text::Script::Thai, count(text::Script::Thai)},
            {text::Script::Greek, count(text::Script::Greek)},
        };

        auto best = ranked[0];
        for (const auto &entry: ranked) {
            if (entry.second > best.second)
                best = entry;
        }

        switch (best.first) {
            case text::Script::Kana: return "ja";
            case text::Script::Han: return DetectChineseVariant(utf8);
            case text::Script::Hangul: return "ko";
            case text::Script::Latin: return DetectLatin(cleaned);
            case text::Script::Cyrillic:
                return std::any_of(u32.begin(), u32.end(), IsUkrainianLetter) ? "uk" : "ru";
            case text::Script::Arabic: return "ar";
            case text::Script::Hebrew: return "he";
            case text::Script::Devanagari: return "hi";
            case text::Script::Thai: return "th";
            case text::Script::Greek: return "el";
            default:
                break;
        }

        throw LanguageDetectionError("no dominant script");
    }

    std::string ScriptLanguageTagger::DetectLatin(const std::u32string &cleaned) const {
        std::vector<std::u32string> words;
        std::u32string current;
        for (const char32_t ch: cleaned) {
            if (ch == U' ') {
                if (!current.empty())
                    words.push_back(std::move(current));
                current.clear();
            } else {
                current.push_back(ToLowerLatin(ch));
            }
        }
        if (!current.empty())
            words.push_back(std::move(current));

        const char *bestCode = nullptr;
        std::size_t bestHits = 0;
        for (const StopWords &lang: LatinStopWords()) {
            std::size_t hits = 0;
            for (const auto &w: words) {
                if (lang.words.count(w) != 0)
                    ++hits;
            }
            // Strictly greater: earlier table rows win ties
            if (hits > bestHits) {
                bestHits = hits;
                bestCode = lang.code;
            }
        }

        if (bestCode == nullptr)
            throw LanguageDetectionError("no stop-word evidence for Latin-script text");

        return bestCode;
    }

    std::string ScriptLanguageTagger::DetectChineseVariant(const std::string &utf8) const {
        return zho_->Check(utf8) == 1 ? "zh-tw" : "zh-cn";
    }

    std::string TagLanguage(const ILanguageTagger &tagger, const std::string &utf8) {
        try {
            std::string code = tagger.Detect(utf8);
            if (code.empty())
                return kUnknownLanguage;
            return code;
        } catch (const LanguageDetectionError &ex) {
            qDebug() << "language inconclusive:" << ex.what();
        } catch (const std::exception &ex) {
            qWarning() << "language tagger failed:" << ex.what();
        }
        return kUnknownLanguage;
    }
} // namespace pdfoutline
