// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef TEXTFLOW_TEXTFLOW_TEXTFLOW_HH
#define TEXTFLOW_TEXTFLOW_TEXTFLOW_HH

#include <defs.hh>

#include <cmath>
#include <stdexcept>

#include <fmt/format.h>
using fmt::format;

namespace textflow {

template< typename T, typename ... U >
inline bool contains (T&& t, U&& ... u) { return ((t == u) || ...); }

//
// Throws std::invalid_argument unless `value' is finite and non-negative:
//
inline void check_ratio (const char* name, double value) {
    if (!std::isfinite (value) || value < 0) {
        throw std::invalid_argument (
            format ("invalid {} value: {}", name, value));
    }
}

inline void check_count (const char* name, long value) {
    if (value < 1) {
        throw std::invalid_argument (
            format ("invalid {} value: {}", name, value));
    }
}

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_TEXTFLOW_HH
