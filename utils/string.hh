// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef TEXTFLOW_UTILS_STRING_HH
#define TEXTFLOW_UTILS_STRING_HH

#include <defs.hh>

#include <string>
#include <vector>

namespace textflow {

//
// UTF-8 <-> UTF-32. Malformed input sequences, overlong forms and encoded
// surrogates decode to U+FFFD, one per offending byte:
//
std::u32string to_utf32(const std::string &);
std::string to_utf8(const std::u32string &);

//
// Length in code points:
//
size_t length_of(const std::string &);

// Unicode white space, as matched by the `\s' class of ECMAScript regexes.
bool is_space(char32_t);

//
// Collapses every run of white space into a single space and trims both
// ends:
//
std::string normalize_space(const std::string &);

//
// Removes all white space:
//
std::string strip_space(const std::string &);

//
// First/last `n' code points of the string, as the original bytes:
//
std::string head_of(const std::string &, size_t n);
std::string tail_of(const std::string &, size_t n);

inline bool ends_with(const std::string &s, const std::string &suffix)
{
    return s.size() >= suffix.size() &&
        0 == s.compare(s.size() - suffix.size(), suffix.size(), suffix);
}

template< typename Range >
std::string join(const Range &xs, const std::string &separator)
{
    std::string s;

    bool first = true;

    for (const auto &x : xs) {
        if (!first)
            s += separator;

        s += x;
        first = false;
    }

    return s;
}

} // namespace textflow

#endif // TEXTFLOW_UTILS_STRING_HH
