#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

// PDFium public headers.
#include "fpdfview.h"
#include "fpdf_text.h"

#include "CjkText.hpp"
#include "OutlineErrors.hpp"
#include "OutlineTypes.hpp"
#include "SpanSource.hpp"

namespace pdfoutline::pdfium {
    // ============================================================
    //  PdfiumLibrary (process-wide RAII + global mutex)
    // ============================================================
    class PdfiumLibrary {
    public:
        PdfiumLibrary(const PdfiumLibrary &) = delete;

        PdfiumLibrary &operator=(const PdfiumLibrary &) = delete;

        static PdfiumLibrary &Instance() {
            static PdfiumLibrary instance;
            return instance;
        }

        std::mutex &Mutex() noexcept { return mutex_; }

    private:
        PdfiumLibrary() {
            FPDF_InitLibrary();
        }

        ~PdfiumLibrary() {
            FPDF_DestroyLibrary();
        }

        std::mutex mutex_;
    };

    inline std::string DescribeError(const unsigned long err) {
        switch (err) {
            case FPDF_ERR_SUCCESS: return "success";
            case FPDF_ERR_FILE: return "file not found or could not be opened";
            case FPDF_ERR_FORMAT: return "file not in PDF format or corrupted";
            case FPDF_ERR_PASSWORD: return "password required or incorrect password";
            case FPDF_ERR_SECURITY: return "unsupported security scheme";
            case FPDF_ERR_PAGE: return "page not found or content error";
            default: return "unknown error";
        }
    }

    // ============================================================
    //  RAII wrappers: Document & Page
    // ============================================================
    class Document {
    public:
        Document() = default;

        explicit Document(const std::string &path,
                          const std::string &password = {}) {
            Open(path, password);
        }

        ~Document() {
            Reset();
        }

        Document(const Document &) = delete;

        Document &operator=(const Document &) = delete;

        Document(Document &&other) noexcept
            : handle_(other.handle_) {
            other.handle_ = nullptr;
        }

        Document &operator=(Document &&other) noexcept {
            if (this != &other) {
                Reset();
                handle_ = other.handle_;
                other.handle_ = nullptr;
            }
            return *this;
        }

        void Open(const std::string &path,
                  const std::string &password = {}) {
            Reset();

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            handle_ = FPDF_LoadDocument(
                path.c_str(),
                password.empty() ? nullptr : password.c_str());

            if (!handle_) {
                const unsigned long err = FPDF_GetLastError();
                throw DocumentError("cannot open " + path + ": " + DescribeError(err) +
                                    " (FPDF error " + std::to_string(err) + ")",
                                    err);
            }
        }

        void Reset() noexcept {
            if (handle_) {
                auto &lib = PdfiumLibrary::Instance();
                std::lock_guard<std::mutex> lock(lib.Mutex());
                FPDF_CloseDocument(handle_);
                handle_ = nullptr;
            }
        }

        [[nodiscard]] bool IsValid() const noexcept { return handle_ != nullptr; }

        [[nodiscard]] FPDF_DOCUMENT Get() const noexcept { return handle_; }

        [[nodiscard]] int GetPageCount() const {
            if (!handle_)
                return 0;
            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard<std::mutex> lock(lib.Mutex());
            return FPDF_GetPageCount(handle_);
        }

    private:
        FPDF_DOCUMENT handle_ = nullptr;
    };

    class Page {
    public:
        Page() = default;

        Page(FPDF_DOCUMENT doc, const int index) {
            Open(doc, index);
        }

        ~Page() {
            Reset();
        }

        Page(const Page &) = delete;

        Page &operator=(const Page &) = delete;

        Page(Page &&other) noexcept
            : handle_(other.handle_) {
            other.handle_ = nullptr;
        }

        Page &operator=(Page &&other) noexcept {
            if (this != &other) {
                Reset();
                handle_ = other.handle_;
                other.handle_ = nullptr;
            }
            return *this;
        }

        void Open(FPDF_DOCUMENT doc, const int index) {
            Reset();
            if (!doc)
                throw DocumentError("Page::Open: null document handle");

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            handle_ = FPDF_LoadPage(doc, index);
            if (!handle_)
                throw DocumentError("FPDF_LoadPage failed at index " +
                                    std::to_string(index), FPDF_ERR_PAGE);
        }

        void Reset() noexcept {
            if (handle_) {
                auto &lib = PdfiumLibrary::Instance();
                std::lock_guard<std::mutex> lock(lib.Mutex());
                FPDF_ClosePage(handle_);
                handle_ = nullptr;
            }
        }

        [[nodiscard]] bool IsValid() const noexcept { return handle_ != nullptr; }

        [[nodiscard]] FPDF_PAGE Get() const noexcept { return handle_; }

        [[nodiscard]] double Height() const {
            if (!handle_) return 0.0;
            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard<std::mutex> lock(lib.Mutex());
            return FPDF_GetPageHeight(handle_);
        }

    private:
        FPDF_PAGE handle_ = nullptr;
    };

    // ============================================================
    //  Internal helpers: per-character metadata -> styled runs
    // ============================================================

    namespace detail {
        // PDFium font descriptor flags (PDF 32000-1, 9.8.2)
        constexpr int kFontFlagItalic = 1 << 6;
        constexpr int kFontFlagForceBold = 1 << 18;

        // Run-splitting thresholds, in multiples of the font size
        constexpr double kSameBaselineRatio = 0.5;
        constexpr double kWordGapRatio = 0.2;
        constexpr double kRunBreakGapRatio = 1.0;

        inline double RoundSize(const double size) {
            return std::round(size * 10.0) / 10.0;
        }

        inline bool FontNameLooksBold(const std::string &name) {
            static const char *const kMarkers[] = {"Bold", "bold", "BOLD", "Black", "Heavy", "Semibold", "SemiBold"};
            for (const char *marker: kMarkers) {
                if (name.find(marker) != std::string::npos)
                    return true;
            }
            return false;
        }

        struct CharInfo {
            char32_t cp = 0;
            double fontSize = 0.0;
            bool bold = false;
            bool italic = false;
            double originY = 0.0; // top-down baseline
            BBox box;
        };

        [[nodiscard]] inline bool SameStyle(const CharInfo &a, const CharInfo &b) noexcept {
            return a.fontSize == b.fontSize && a.bold == b.bold && a.italic == b.italic;
        }

        [[nodiscard]] inline bool SameBaseline(const CharInfo &a, const CharInfo &b) noexcept {
            const double size = std::min(a.fontSize, b.fontSize);
            return std::fabs(a.originY - b.originY) < std::max(size, 1.0) * kSameBaselineRatio;
        }

        // Groups characters into styled runs. Caller holds the library mutex.
        inline std::vector<Span> CollectRuns(FPDF_TEXTPAGE textPage,
                                             const int pageIndex,
                                             const double pageHeight) {
            std::vector<Span> spans;

            const int nChars = FPDFText_CountChars(textPage);
            if (nChars <= 0)
                return spans;

            Span current;
            CharInfo first{};
            CharInfo prev{};
            bool open = false;
            bool pendingSpace = false;

            auto flush = [&]() {
                if (open) {
                    while (!current.text.empty() && current.text.back() == ' ')
                        current.text.pop_back();
                    if (!current.text.empty())
                        spans.push_back(std::move(current));
                }
                current = Span{};
                open = false;
                pendingSpace = false;
            };

            for (int i = 0; i < nChars; ++i) {
                unsigned int unicode = FPDFText_GetUnicode(textPage, i);
                int consumed = 1;

                // UTF-16 surrogate pairs
                if (unicode >= 0xD800 && unicode <= 0xDBFF && i + 1 < nChars) {
                    if (const unsigned int low = FPDFText_GetUnicode(textPage, i + 1);
                        low >= 0xDC00 && low <= 0xDFFF) {
                        unicode = 0x10000 + (((unicode - 0xD800) << 10) | (low - 0xDC00));
                        consumed = 2;
                    } else {
                        unicode = 0xFFFD;
                    }
                } else if (unicode >= 0xD800 && unicode <= 0xDFFF) {
                    unicode = 0xFFFD;
                }

                const char32_t cp = static_cast<char32_t>(unicode);

                if (cp == U'\r' || cp == U'\n') {
                    flush();
                    i += consumed - 1;
                    continue;
                }
                if (cp == 0 || cp == 0xFFFE || cp == 0xFFFF || text::IsWhitespace(cp)) {
                    pendingSpace = open;
                    i += consumed - 1;
                    continue;
                }

                CharInfo info;
                info.cp = cp;
                info.fontSize = RoundSize(FPDFText_GetFontSize(textPage, i));

                char fontName[256] = {};
                int fontFlags = 0;
                FPDFText_GetFontInfo(textPage, i, fontName, sizeof(fontName), &fontFlags);
                const int weight = FPDFText_GetFontWeight(textPage, i);
                info.bold = weight >= 600 ||
                            (fontFlags & kFontFlagForceBold) != 0 ||
                            FontNameLooksBold(fontName);
                info.italic = (fontFlags & kFontFlagItalic) != 0;

                double originX = 0.0;
                double originY = 0.0;
                FPDFText_GetCharOrigin(textPage, i, &originX, &originY);
                info.originY = pageHeight - originY;

                double left = 0.0, right = 0.0, bottom = 0.0, top = 0.0;
                if (FPDFText_GetCharBox(textPage, i, &left, &right, &bottom, &top)) {
                    // PDFium gives bottom-up coordinates; convert to top-down
                    info.box = BBox{left, pageHeight - top, right, pageHeight - bottom};
                } else {
                    info.box = BBox{originX, info.originY - info.fontSize * 0.8,
                                    originX + info.fontSize * 0.5, info.originY + info.fontSize * 0.2};
                }

                if (open) {
                    const double gap = info.box.x0 - prev.box.x1;
                    const double unit = std::max(prev.fontSize, 1.0);
                    if (!SameStyle(first, info) || !SameBaseline(first, info) ||
                        gap > unit * kRunBreakGapRatio || gap < -unit * 4.0) {
                        flush();
                    } else if (!pendingSpace && gap > unit * kWordGapRatio) {
                        pendingSpace = true;
                    }
                }

                if (!open) {
                    open = true;
                    first = info;
                    current.fontSize = info.fontSize;
                    current.isBold = info.bold;
                    current.isItalic = info.italic;
                    current.pageIndex = pageIndex;
                    current.bbox = info.box;
                } else {
                    current.bbox.x0 = std::min(current.bbox.x0, info.box.x0);
                    current.bbox.y0 = std::min(current.bbox.y0, info.box.y0);
                    current.bbox.x1 = std::max(current.bbox.x1, info.box.x1);
                    current.bbox.y1 = std::max(current.bbox.y1, info.box.y1);
                }

                if (pendingSpace)
                    current.text.push_back(' ');
                pendingSpace = false;
                text::AppendUtf8(current.text, cp);

                prev = info;
                i += consumed - 1;
            }

            flush();
            return spans;
        }
    } // namespace detail

    // Extract styled spans from one page (UTF-8 text, top-down boxes).
    inline std::vector<Span> ExtractPageSpans(FPDF_PAGE page,
                                              const int pageIndex,
                                              const double pageHeight) {
        if (!page)
            return {};

        auto &lib = PdfiumLibrary::Instance();
        std::lock_guard lock(lib.Mutex());

        // IMPORTANT:
        // Pdfium handles (FPDF_PAGE, FPDF_TEXTPAGE, FPDF_DOCUMENT, etc.)
        // must NEVER be declared as `const`.
        FPDF_TEXTPAGE textPage = FPDFText_LoadPage(page);
        if (!textPage)
            return {};

        const std::unique_ptr<std::remove_pointer_t<FPDF_TEXTPAGE>, decltype(&FPDFText_ClosePage)>
                guard(textPage, &FPDFText_ClosePage);

        return detail::CollectRuns(textPage, pageIndex, pageHeight);
    }

    // ============================================================
    //  ISpanSource over a PDF file
    // ============================================================

    class PdfiumSpanSource final : public ISpanSource {
    public:
        // Throws DocumentError when the file cannot be opened.
        explicit PdfiumSpanSource(const std::string &path)
            : doc_(path) {
            pageCount_ = doc_.GetPageCount();
            if (pageCount_ < 0)
                throw DocumentError("cannot count pages of " + path, FPDF_ERR_FORMAT);
        }

        [[nodiscard]] int PageCount() const override { return pageCount_; }

        [[nodiscard]] std::vector<Span> PageSpans(const int pageIndex) override {
            const Page page(doc_.Get(), pageIndex);
            return ExtractPageSpans(page.Get(), pageIndex, page.Height());
        }

    private:
        Document doc_;
        int pageCount_ = 0;
    };
} // namespace pdfoutline::pdfium
