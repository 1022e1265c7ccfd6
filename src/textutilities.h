//
// Text helpers shared by the heading predicates and the language tagger.
//
#ifndef TEXTUTILITIES_H
#define TEXTUTILITIES_H

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>

// OpenCC-fmmseg Chinese variant check, one instance reused across calls.
class ZhoChecker {
public:
    ZhoChecker();

    ~ZhoChecker();

    ZhoChecker(const ZhoChecker &) = delete;

    ZhoChecker &operator=(const ZhoChecker &) = delete;

    [[nodiscard]] bool IsValid() const noexcept { return opencc_ != nullptr; }

    // 1 = Traditional, 2 = Simplified, 0 = neither / undecided
    int Check(const std::string &test_text) const;

private:
    void *opencc_ = nullptr;
    mutable std::mutex mutex_;
};

size_t find_max_utf8_length(std::string_view sv, size_t max_byte_count);

// UTF-8 prefix of at most max_byte_count bytes, "..." appended when cut
std::string truncate_utf8(std::string_view sv, size_t max_byte_count);

std::wstring utf8_to_wstring(const std::string &utf8_text);

#endif // TEXTUTILITIES_H
