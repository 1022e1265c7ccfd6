#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pdfoutline {
    // ============================================================
    //  Page geometry
    // ============================================================

    // Top-down page coordinates: y grows downward from the top edge.
    struct BBox {
        double x0 = 0.0;
        double y0 = 0.0;
        double x1 = 0.0;
        double y1 = 0.0;

        [[nodiscard]] double CenterY() const noexcept { return (y0 + y1) * 0.5; }
        [[nodiscard]] double Height() const noexcept { return y1 - y0; }
    };

    // ============================================================
    //  Extraction units
    // ============================================================

    // One styled text fragment as reported by PDF text extraction.
    struct Span {
        std::string text; // UTF-8
        double fontSize = 0.0; // points, rounded to 0.1
        bool isBold = false;
        bool isItalic = false;
        BBox bbox;
        int pageIndex = 0; // 0-based
    };

    // A visual row of spans on one page.
    struct Line {
        std::vector<Span> spans; // left-to-right
        std::string text; // single-space join, normalized
        double fontSize = 0.0; // max of member spans
        bool isBold = false; // bold by character majority
        int pageIndex = 0;
        double yPosition = 0.0; // top of the row
        std::size_t ordinal = 0; // document order, unique per document
    };

    // ============================================================
    //  Classification
    // ============================================================

    enum class HeadingLevel {
        Title,
        H1,
        H2,
        H3,
        Body
    };

    inline std::string_view LevelName(const HeadingLevel level) noexcept {
        switch (level) {
            case HeadingLevel::Title: return "Title";
            case HeadingLevel::H1: return "H1";
            case HeadingLevel::H2: return "H2";
            case HeadingLevel::H3: return "H3";
            case HeadingLevel::Body: return "Body";
        }
        return "Body";
    }

    // Title/H1/H2/H3 are ranked 0..3; lower rank is the more significant level.
    inline int LevelRank(const HeadingLevel level) noexcept {
        return static_cast<int>(level);
    }

    inline bool IsOutlineLevel(const HeadingLevel level) noexcept {
        return level == HeadingLevel::H1 || level == HeadingLevel::H2 || level == HeadingLevel::H3;
    }

    // Document-wide font size statistics and the derived tier sizes.
    // Tier sizes are strictly decreasing: title > h1 > h2 > h3.
    struct SizeProfile {
        std::map<double, std::size_t> histogram; // rounded size -> line count
        std::vector<double> distinctSizes; // clustered, descending
        std::optional<double> bodySize;
        std::optional<double> title;
        std::optional<double> h1;
        std::optional<double> h2;
        std::optional<double> h3;

        [[nodiscard]] std::size_t TierCount() const noexcept {
            return static_cast<std::size_t>(title.has_value()) + h1.has_value() + h2.has_value() + h3.has_value();
        }
    };

    struct HeadingCandidate {
        Line line;
        HeadingLevel level = HeadingLevel::Body;
        std::string language = "unknown";
    };

    // ============================================================
    //  Output
    // ============================================================

    struct OutlineEntry {
        HeadingLevel level = HeadingLevel::H1;
        std::string text;
        int page = 1; // 1-based

        bool operator==(const OutlineEntry &other) const {
            return level == other.level && text == other.text && page == other.page;
        }

        bool operator!=(const OutlineEntry &other) const { return !(*this == other); }
    };

    struct OutlineResult {
        std::string title;
        std::vector<OutlineEntry> outline;

        // Diagnostics, not part of the default JSON
        std::string language = "unknown";
        int pageCount = 0;
        int pagesProcessed = 0;
        bool timedOut = false;
        SizeProfile profile;
    };
} // namespace pdfoutline
