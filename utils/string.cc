// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <string>
#include <vector>

#include <utils/string.hh>

namespace textflow {
namespace detail {

const char32_t replacement_char = 0xFFFD;

inline bool is_continuation(unsigned char c)
{
    return 0x80 == (c & 0xC0);
}

//
// Decodes the code point starting at `s[i]' and advances `i' past it:
//
char32_t decode(const std::string &s, size_t &i)
{
    const auto c = static_cast< unsigned char >(s[i]);

    size_t n;
    char32_t value;

    if (c < 0x80) {
        ++i;
        return c;
    } else if (0xC0 == (c & 0xE0)) {
        n = 1, value = c & 0x1F;
    } else if (0xE0 == (c & 0xF0)) {
        n = 2, value = c & 0x0F;
    } else if (0xF0 == (c & 0xF8)) {
        n = 3, value = c & 0x07;
    } else {
        ++i;
        return replacement_char;
    }

    // truncated sequence
    if (i + n >= s.size()) {
        ++i;
        return replacement_char;
    }

    for (size_t k = 1; k <= n; ++k) {
        const auto d = static_cast< unsigned char >(s[i + k]);

        if (!is_continuation(d)) {
            ++i;
            return replacement_char;
        }

        value = (value << 6) | (d & 0x3F);
    }

    static const char32_t least[] = { 0, 0x80, 0x800, 0x10000 };

    // overlong, surrogate or out of range
    if (value < least[n] || (0xD800 <= value && value <= 0xDFFF) ||
        value > 0x10FFFF) {
        ++i;
        return replacement_char;
    }

    i += n + 1;
    return value;
}

void encode(char32_t c, std::string &s)
{
    if (c < 0x80) {
        s += char(c);
    } else if (c < 0x800) {
        s += char(0xC0 | (c >> 6));
        s += char(0x80 | (c & 0x3F));
    } else if (c < 0x10000) {
        s += char(0xE0 | (c >> 12));
        s += char(0x80 | ((c >> 6) & 0x3F));
        s += char(0x80 | (c & 0x3F));
    } else {
        s += char(0xF0 | (c >> 18));
        s += char(0x80 | ((c >> 12) & 0x3F));
        s += char(0x80 | ((c >> 6) & 0x3F));
        s += char(0x80 | (c & 0x3F));
    }
}

} // namespace detail

std::u32string to_utf32(const std::string &s)
{
    std::u32string xs;
    xs.reserve(s.size());

    for (size_t i = 0; i < s.size();)
        xs += detail::decode(s, i);

    return xs;
}

std::string to_utf8(const std::u32string &xs)
{
    std::string s;
    s.reserve(xs.size());

    for (auto c : xs)
        detail::encode(c, s);

    return s;
}

size_t length_of(const std::string &s)
{
    size_t n = 0;

    for (size_t i = 0; i < s.size(); ++n)
        detail::decode(s, i);

    return n;
}

bool is_space(char32_t c)
{
    switch (c) {
    case 0x0009: case 0x000A: case 0x000B: case 0x000C: case 0x000D:
    case 0x0020: case 0x00A0: case 0x1680:
    case 0x2028: case 0x2029: case 0x202F: case 0x205F:
    case 0x3000: case 0xFEFF:
        return true;

    default:
        return 0x2000 <= c && c <= 0x200A;
    }
}

std::string normalize_space(const std::string &s)
{
    std::u32string xs;
    xs.reserve(s.size());

    bool pending = false;

    for (auto c : to_utf32(s)) {
        if (is_space(c)) {
            pending = !xs.empty();
        } else {
            if (pending)
                xs += U' ';

            xs += c;
            pending = false;
        }
    }

    return to_utf8(xs);
}

std::string strip_space(const std::string &s)
{
    std::u32string xs;
    xs.reserve(s.size());

    for (auto c : to_utf32(s)) {
        if (!is_space(c))
            xs += c;
    }

    return to_utf8(xs);
}

std::string head_of(const std::string &s, size_t n)
{
    size_t i = 0;

    for (size_t k = 0; k < n && i < s.size(); ++k)
        detail::decode(s, i);

    return s.substr(0, i);
}

std::string tail_of(const std::string &s, size_t n)
{
    const auto len = length_of(s);

    if (len <= n)
        return s;

    size_t i = 0;

    for (size_t k = 0; k < len - n; ++k)
        detail::decode(s, i);

    return s.substr(i);
}

} // namespace textflow
