#pragma once
//
// LineAssembler.hpp
// -----------------------------------------------------------------------------
// Groups the spans of one page into visual lines.
//
// Spans whose vertical centers are closer than `toleranceRatio` x the smaller
// font size share a line; members are ordered left-to-right and joined with
// single spaces. Output lines run top-to-bottom. The result does not depend on
// the order spans were reported in.
// -----------------------------------------------------------------------------

#include <algorithm>
#include <cmath>
#include <string>
#include <tuple>
#include <vector>

#include "CjkText.hpp"
#include "OutlineTypes.hpp"
#include "TextNormalize.hpp"

namespace pdfoutline {
    namespace detail {
        inline bool SpanReadingLess(const Span &a, const Span &b) {
            return std::make_tuple(a.bbox.CenterY(), a.bbox.x0, a.bbox.x1, a.text, a.fontSize, a.isBold) <
                   std::make_tuple(b.bbox.CenterY(), b.bbox.x0, b.bbox.x1, b.text, b.fontSize, b.isBold);
        }

        inline bool SpanLeftToRightLess(const Span &a, const Span &b) {
            return std::make_tuple(a.bbox.x0, a.bbox.CenterY(), a.bbox.x1, a.text, a.fontSize, a.isBold) <
                   std::make_tuple(b.bbox.x0, b.bbox.CenterY(), b.bbox.x1, b.text, b.fontSize, b.isBold);
        }

        // Fills text / fontSize / isBold / yPosition from the member spans.
        inline void FinishLine(Line &line) {
            std::sort(line.spans.begin(), line.spans.end(), SpanLeftToRightLess);

            std::string joined;
            std::size_t boldChars = 0;
            std::size_t totalChars = 0;
            line.fontSize = 0.0;
            line.yPosition = line.spans.front().bbox.y0;
            line.pageIndex = line.spans.front().pageIndex;

            for (const Span &span: line.spans) {
                if (!joined.empty())
                    joined.push_back(' ');
                joined += span.text;

                line.fontSize = std::max(line.fontSize, span.fontSize);
                line.yPosition = std::min(line.yPosition, span.bbox.y0);

                const std::size_t chars = text::Utf8ToU32(span.text).size();
                totalChars += chars;
                if (span.isBold)
                    boldChars += chars;
            }

            line.text = NormalizeLineText(joined);
            line.isBold = totalChars > 0 && boldChars * 2 > totalChars;
        }
    } // namespace detail

    inline std::vector<Line> AssembleLines(std::vector<Span> spans, const double toleranceRatio = 0.5) {
        // Empty / whitespace-only spans never reach a line
        spans.erase(std::remove_if(spans.begin(), spans.end(), [](const Span &span) {
            return text::IsBlank(text::Utf8ToU32(span.text));
        }), spans.end());

        std::sort(spans.begin(), spans.end(), detail::SpanReadingLess);

        std::vector<Line> lines;
        double anchorCenter = 0.0;
        double lineMinSize = 0.0;

        for (Span &span: spans) {
            const double center = span.bbox.CenterY();
            const double size = std::max(std::min(span.fontSize, lineMinSize), 1.0);

            if (!lines.empty() && std::fabs(center - anchorCenter) < toleranceRatio * size) {
                lineMinSize = std::min(lineMinSize, span.fontSize);
                lines.back().spans.push_back(std::move(span));
                continue;
            }

            Line line;
            anchorCenter = center;
            lineMinSize = span.fontSize;
            line.spans.push_back(std::move(span));
            lines.push_back(std::move(line));
        }

        for (Line &line: lines)
            detail::FinishLine(line);

        // NFKC may fold a line down to nothing (e.g. lone format characters)
        lines.erase(std::remove_if(lines.begin(), lines.end(), [](const Line &line) {
            return line.text.empty();
        }), lines.end());

        return lines;
    }
} // namespace pdfoutline
