#pragma once
//
// DocumentProcessor.hpp
// -----------------------------------------------------------------------------
// Runs the outline pipeline for one document:
//
//   spans (per page) -> lines -> size profile -> candidates -> title + outline
//
// The deadline and the optional cancel callback are polled once after each
// page. When either fires, the remaining pages are skipped and the result is
// built from the pages seen so far (timedOut = true).
// -----------------------------------------------------------------------------

#include <algorithm>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <QDeadlineTimer>
#include <QDebug>

#include "HeadingClassifier.hpp"
#include "LanguageTagger.hpp"
#include "LineAssembler.hpp"
#include "OutlineBuilder.hpp"
#include "OutlineConfig.hpp"
#include "OutlineTypes.hpp"
#include "PdfiumHelper.hpp"
#include "SpanSource.hpp"
#include "TitleSelector.hpp"

namespace pdfoutline {
    namespace detail {
        // Whole-document text for the diagnostic language tag
        inline std::string JoinLineText(const std::vector<Line> &lines, const std::size_t maxBytes) {
            std::string joined;
            for (const Line &line: lines) {
                if (joined.size() >= maxBytes)
                    break;
                if (!joined.empty())
                    joined.push_back('\n');
                joined += line.text;
            }
            return joined;
        }
    } // namespace detail

    inline OutlineResult ProcessDocument(ISpanSource &source,
                                         const OutlineConfig &config,
                                         const ILanguageTagger &tagger,
                                         const std::function<bool()> &isCancelled = {}) {
        const QDeadlineTimer deadline = config.timeBudgetMs > 0
                                            ? QDeadlineTimer(config.timeBudgetMs)
                                            : QDeadlineTimer(QDeadlineTimer::Forever);

        OutlineResult result;
        result.pageCount = std::max(source.PageCount(), 0);

        std::vector<Line> lines;
        for (int pageIndex = 0; pageIndex < result.pageCount; ++pageIndex) {
            std::vector<Line> pageLines = AssembleLines(source.PageSpans(pageIndex), config.lineToleranceRatio);
            for (Line &line: pageLines) {
                line.ordinal = lines.size();
                lines.push_back(std::move(line));
            }
            result.pagesProcessed = pageIndex + 1;

            if (pageIndex + 1 < result.pageCount &&
                (deadline.hasExpired() || (isCancelled && isCancelled()))) {
                result.timedOut = true;
                qDebug() << "time budget exhausted after page" << result.pagesProcessed
                         << "of" << result.pageCount;
                break;
            }
        }

        result.profile = BuildSizeProfile(lines, config);

        const std::vector<HeadingCandidate> candidates = ClassifyLines(lines, result.profile, config, tagger);
        const TitleSelection title = SelectTitle(lines, result.profile, config);

        result.title = title.text;
        result.outline = BuildOutline(candidates, title.ordinal, config);
        result.language = TagLanguage(tagger, detail::JoinLineText(lines, 64 * 1024));

        return result;
    }

    // Throws DocumentError when the PDF cannot be opened or a page fails to load.
    inline OutlineResult ProcessFile(const std::string &path,
                                     const OutlineConfig &config,
                                     const ILanguageTagger &tagger,
                                     const std::function<bool()> &isCancelled = {}) {
        pdfium::PdfiumSpanSource source(path);
        return ProcessDocument(source, config, tagger, isCancelled);
    }
} // namespace pdfoutline
