// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef TEXTFLOW_TEXTFLOW_BBOX_HH
#define TEXTFLOW_TEXTFLOW_BBOX_HH

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

namespace textflow {
namespace detail {

//
// Bounding box, described by 4 coordinates of two points, a `bottom-left' and a
// `top-right'. Page space has (0,0) at bottom-left and Y growing upward:
//
template< typename T >
struct bbox_t {
    using value_type = T;
    value_type arr [4];
};

template< typename T >
inline bool
operator== (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return std::equal (
        lhs.arr, lhs.arr + sizeof lhs.arr / sizeof *lhs.arr, rhs.arr);
}

template< typename T >
inline bool
operator!= (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return !(lhs == rhs);
}

template< typename T >
inline bbox_t< T >
operator+ (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return {
        (std::min) (lhs.arr [0], rhs.arr [0]),
        (std::min) (lhs.arr [1], rhs.arr [1]),
        (std::max) (lhs.arr [2], rhs.arr [2]),
        (std::max) (lhs.arr [3], rhs.arr [3])
    };
}

template< typename T >
inline bbox_t< T >&
operator+= (bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return (lhs = lhs + rhs);
}

template< typename T >
inline std::ostream&
operator<< (std::ostream& ss, const bbox_t< T >& box) {
    return ss
        << box.arr [0] << ","
        << box.arr [1] << ","
        << box.arr [2] << ","
        << box.arr [3];
}

////////////////////////////////////////////////////////////////////////

template< typename T >
inline bbox_t< T >
normalize (bbox_t< T > x) {
    if (x.arr [0] > x.arr [2]) { std::swap (x.arr [0], x.arr [2]); }
    if (x.arr [1] > x.arr [3]) { std::swap (x.arr [1], x.arr [3]); }
    return x;
}

template< typename T >
inline T width_of (const bbox_t< T >& x) { return x.arr [2] - x.arr [0]; }

template< typename T >
inline T height_of (const bbox_t< T >& x) { return x.arr [3] - x.arr [1]; }

template< typename T >
inline T
horizontal_overlap (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    const auto dist =
        (std::min) (lhs.arr [2], rhs.arr [2]) -
        (std::max) (lhs.arr [0], rhs.arr [0]);
    return dist > 0 ? dist : 0;
}

template< typename T >
inline T
vertical_overlap (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    const auto dist =
        (std::min) (lhs.arr [3], rhs.arr [3]) -
        (std::max) (lhs.arr [1], rhs.arr [1]);
    return dist > 0 ? dist : 0;
}

template< typename T >
inline bool
overlapping (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return horizontal_overlap (lhs, rhs) && vertical_overlap (lhs, rhs);
}

//
// True if `outer' encloses `inner', edges included:
//
template< typename T >
inline bool
contains (const bbox_t< T >& outer, const bbox_t< T >& inner) {
    return
        outer.arr [0] <= inner.arr [0] && inner.arr [2] <= outer.arr [2] &&
        outer.arr [1] <= inner.arr [1] && inner.arr [3] <= outer.arr [3];
}

} // namespace detail

////////////////////////////////////////////////////////////////////////

//
// The default bounding box type is the floating point specialization for
// double:
//
using bbox_t = detail::bbox_t< double >;

//
// From origin and extent, the way the input describes runs and zones:
//
inline bbox_t
make_bbox (double x, double y, double width, double height) {
    return bbox_t{ x, y, x + width, y + height };
}

inline double center_x_of (const bbox_t& x) { return (x.arr [0] + x.arr [2]) / 2; }

//
// Union of a non-empty range of boxes:
//
template< typename Range >
inline bbox_t
coalesce (const Range& xs) {
    auto iter = std::begin (xs), last = std::end (xs);
    TEXTFLOW_ASSERT (iter != last);

    bbox_t box = *iter;

    for (++iter; iter != last; ++iter) {
        box += *iter;
    }

    return box;
}

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_BBOX_HH
