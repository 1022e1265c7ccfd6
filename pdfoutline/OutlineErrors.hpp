#pragma once

#include <stdexcept>
#include <string>

namespace pdfoutline {
    // Unreadable, corrupt or encrypted PDF, or a page that cannot be loaded.
    class DocumentError : public std::runtime_error {
    public:
        explicit DocumentError(const std::string &what, const unsigned long code = 0)
            : std::runtime_error(what), code_(code) {
        }

        // FPDF_ERR_* code reported by PDFium, 0 when not applicable
        [[nodiscard]] unsigned long Code() const noexcept { return code_; }

    private:
        unsigned long code_;
    };

    // The language tagger could not decide (text too short, no known script).
    class LanguageDetectionError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Invalid tunable in OutlineConfig.
    class ConfigError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };
} // namespace pdfoutline
