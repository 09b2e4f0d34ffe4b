/**
 * @file truncator.cpp
 * @brief Truncator implementation (prefix view, no copies).
 */
#include "meshsplit/truncator.hpp"

namespace meshsplit {

// text_length(): We don't assume strlen() is available or safe on all MCUs.
size_t text_length(const char* text) {
    if (!text) return 0;
    size_t len = 0;
    while (text[len] != '\0') ++len;
    return len;
}

TruncatedText truncate(const char* text, size_t length, size_t total_limit) {
    TruncatedText out;
    if (!text) return out;                       // nullptr → empty message

    out.data = text;
    if (length > total_limit) {
        out.length  = total_limit;               // hard cut, not word-aware
        out.clipped = true;
    } else {
        out.length  = length;
    }
    return out;
}

} // namespace meshsplit
