#pragma once
//
// TextNormalize.hpp
// -----------------------------------------------------------------------------
// Text cleanup applied to assembled lines, titles and headings (UTF-8 in/out).
//
// - NFKC normalization + whitespace collapse for line text
// - style-layer repeat collapse for headings / title lines
// -----------------------------------------------------------------------------

#include <string>
#include <vector>

namespace pdfoutline {
    // NFKC-normalize, trim and collapse inner whitespace to single spaces.
    // Lines containing right-to-left script are only normalized and trimmed.
    std::string NormalizeLineText(const std::string &utf8);

    // Trim Unicode whitespace.
    std::string TrimText(const std::string &utf8);

    // Collapse a single token made of a unit (4..10 chars) repeated >= 3 times.
    std::u32string CollapseRepeatedToken(const std::u32string &token);

    // Collapse phrases (1..8 tokens) repeated >= 3 times in a row.
    std::vector<std::u32string> CollapseRepeatedWordSequences(const std::vector<std::u32string> &parts);

    // Line-level wrapper:
    //   1) split on spaces/tabs into tokens
    //   2) collapse repeated *phrases*
    //   3) collapse repeated patterns inside each token
    //
    // Example:
    //   "Annual Report Annual Report Annual Report" -> "Annual Report"
    std::string CollapseRepeatedSegments(const std::string &utf8);
} // namespace pdfoutline
