#pragma once

#include <utility>
#include <vector>

#include "OutlineTypes.hpp"

namespace pdfoutline {
    // Page-by-page provider of text spans. Implementations may throw
    // DocumentError from any member.
    class ISpanSource {
    public:
        virtual ~ISpanSource() = default;

        [[nodiscard]] virtual int PageCount() const = 0;

        // Spans of one page (0-based), in extraction order.
        [[nodiscard]] virtual std::vector<Span> PageSpans(int pageIndex) = 0;
    };

    // In-memory source, used for pre-extracted documents and test fixtures.
    class MemorySpanSource final : public ISpanSource {
    public:
        MemorySpanSource() = default;

        explicit MemorySpanSource(std::vector<std::vector<Span> > pages)
            : pages_(std::move(pages)) {
        }

        // Appends a span to page `span.pageIndex`, growing the page list as needed.
        void Add(const Span &span) {
            if (span.pageIndex < 0)
                return;
            if (static_cast<std::size_t>(span.pageIndex) >= pages_.size())
                pages_.resize(static_cast<std::size_t>(span.pageIndex) + 1);
            pages_[static_cast<std::size_t>(span.pageIndex)].push_back(span);
        }

        // Ensures at least `count` pages exist (blank pages included).
        void EnsurePages(const int count) {
            if (count > 0 && static_cast<std::size_t>(count) > pages_.size())
                pages_.resize(static_cast<std::size_t>(count));
        }

        [[nodiscard]] int PageCount() const override {
            return static_cast<int>(pages_.size());
        }

        [[nodiscard]] std::vector<Span> PageSpans(const int pageIndex) override {
            if (pageIndex < 0 || pageIndex >= PageCount())
                return {};
            return pages_[static_cast<std::size_t>(pageIndex)];
        }

    private:
        std::vector<std::vector<Span> > pages_;
    };
} // namespace pdfoutline
