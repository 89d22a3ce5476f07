// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef TEXTFLOW_UTILS_MATH_HH
#define TEXTFLOW_UTILS_MATH_HH

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <vector>

namespace textflow {

template< typename T >
inline T clamp(T x, T lo, T hi)
{
    return (std::max)(lo, (std::min)(hi, x));
}

//
// Linear interpolation between the closest ranks; `q' is clamped to [0, 1].
// Returns 0 for an empty sample:
//
inline double quantile(std::vector< double > xs, double q)
{
    if (xs.empty())
        return 0;

    std::sort(xs.begin(), xs.end());

    const double pos = double(xs.size() - 1) * clamp(q, 0., 1.);
    const size_t base = size_t(std::floor(pos));
    const double rest = pos - double(base);

    if (base + 1 >= xs.size())
        return xs[base];

    return xs[base] + rest * (xs[base + 1] - xs[base]);
}

//
// Middle value or the average of the two middle values, 0 for an empty
// sample:
//
inline double median(std::vector< double > xs)
{
    if (xs.empty())
        return 0;

    std::sort(xs.begin(), xs.end());

    const size_t mid = xs.size() / 2;

    if (xs.size() % 2)
        return xs[mid];

    return (xs[mid - 1] + xs[mid]) / 2;
}

inline double interquartile_range(const std::vector< double > &xs)
{
    if (xs.size() < 2)
        return 0;

    return (std::max)(0., quantile(xs, .75) - quantile(xs, .25));
}

//
// Length of the intersection of two closed intervals, given in any order of
// their ends:
//
inline double overlap_1d(double a0, double a1, double b0, double b1)
{
    const auto lo = (std::max)((std::min)(a0, a1), (std::min)(b0, b1));
    const auto hi = (std::min)((std::max)(a0, a1), (std::max)(b0, b1));
    return (std::max)(0., hi - lo);
}

} // namespace textflow

#endif // TEXTFLOW_UTILS_MATH_HH
