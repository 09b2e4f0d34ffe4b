// -----------------------------------------------------------------------------
// marker.cpp: "(i/N) " marker arithmetic, rendering and parsing
//
// API & field descriptions:
//   see include/meshsplit/marker.hpp
// -----------------------------------------------------------------------------
#include "meshsplit/marker.hpp"

namespace meshsplit {

uint8_t decimal_digits(size_t n) {
    uint8_t d = 1;
    while (n >= 10) {
        n /= 10;
        ++d;
    }
    return d;
}

size_t marker_width(size_t total) {
    return 2u * decimal_digits(total) + 4u;
}

// -----------------------------------------------------------------------------
// append_decimal(): Append n in decimal without heap or sprintf().
// PRE:   caller has checked that `out` has room for decimal_digits(n) chars.
// -----------------------------------------------------------------------------
static void append_decimal(size_t n, etl::istring& out) {
    char buf[20];                                   // enough for 64-bit size_t
    int idx = 0;
    do {
        buf[idx++] = static_cast<char>('0' + (n % 10));
        n /= 10;
    } while (n > 0);
    while (idx > 0) out.push_back(buf[--idx]);      // reverse into place
}

bool write_marker(size_t index, size_t total, etl::istring& out) {
    if (index == 0 || index > total) return false;

    const size_t need = static_cast<size_t>(decimal_digits(index)) + decimal_digits(total) + 4u;
    if (out.max_size() - out.size() < need) return false;  // leave `out` untouched

    out.push_back('(');
    append_decimal(index, out);
    out.push_back('/');
    append_decimal(total, out);
    out.push_back(')');
    out.push_back(' ');
    return true;
}

// -----------------------------------------------------------------------------
// read_number(): Parse an unsigned decimal starting at text[pos].
// POLICY:
//   - At least one digit, no leading zero, at most 5 digits (MAX_CHUNKS bound).
// OUT:   value and advanced pos on success.
// -----------------------------------------------------------------------------
static bool read_number(const char* text, size_t length, size_t& pos, size_t& value) {
    const size_t start = pos;
    value = 0;
    while (pos < length && text[pos] >= '0' && text[pos] <= '9') {
        if (pos - start == 5) return false;         // too many digits
        value = value * 10 + static_cast<size_t>(text[pos] - '0');
        ++pos;
    }
    if (pos == start) return false;                 // no digits
    if (text[start] == '0') return false;           // leading zero (also rejects 0)
    return true;
}

bool parse_marker(const char* text, size_t length, MarkerInfo& info) {
    if (!text) return false;

    size_t pos = 0;
    size_t index = 0;
    size_t total = 0;

    if (pos >= length || text[pos] != '(') return false;
    ++pos;
    if (!read_number(text, length, pos, index)) return false;
    if (pos >= length || text[pos] != '/') return false;
    ++pos;
    if (!read_number(text, length, pos, total)) return false;
    if (pos >= length || text[pos] != ')') return false;
    ++pos;
    if (pos >= length || text[pos] != ' ') return false;
    ++pos;

    if (index > total) return false;

    info.index = index;
    info.total = total;
    info.width = pos;
    return true;
}

} // namespace meshsplit
