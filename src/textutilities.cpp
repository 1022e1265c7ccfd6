#include <string>
#include <textutilities.h>
#include "opencc_fmmseg_capi.h"
#include "boost/nowide/convert.hpp"

ZhoChecker::ZhoChecker()
    : opencc_(opencc_new()) {
}

ZhoChecker::~ZhoChecker() {
    if (opencc_ != nullptr) {
        opencc_delete(opencc_);
    }
}

int ZhoChecker::Check(const std::string &test_text) const {
    if (opencc_ == nullptr) {
        return 0;
    }
    std::lock_guard lock(mutex_);
    return opencc_zho_check(opencc_, test_text.c_str());
}

size_t find_max_utf8_length(const std::string_view sv, size_t max_byte_count) {
    // 1. No longer than max byte count
    if (sv.size() <= max_byte_count) {
        return sv.size();
    }
    // 2. Longer than byte count: back off to a code point boundary
    while (max_byte_count > 0 && (sv[max_byte_count] & 0b11000000) == 0b10000000) {
        --max_byte_count;
    }
    return max_byte_count;
}

std::string truncate_utf8(const std::string_view sv, const size_t max_byte_count) {
    const size_t n = find_max_utf8_length(sv, max_byte_count);
    std::string out(sv.substr(0, n));
    if (n < sv.size()) {
        out += "...";
    }
    return out;
}

std::wstring utf8_to_wstring(const std::string &utf8_text) {
    return boost::nowide::widen(utf8_text);
}
