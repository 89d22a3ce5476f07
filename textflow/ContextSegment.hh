// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_CONTEXTSEGMENT_HH
#define TEXTFLOW_TEXTFLOW_CONTEXTSEGMENT_HH

#include <defs.hh>

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <utils/string.hh>

#include <textflow/ncd.hh>
#include <textflow/SegmentationControl.hh>

namespace textflow {

enum struct boundary_reason_t {
    strong_ncd,
    suffix_prefix_overlap,
    threshold_ncd,
    ncd_too_high,
    insufficient_length,
    blocked_by_callback
};

const char* to_string (boundary_reason_t);

//
// A unit of text with the payload it stands for:
//
template< typename T >
struct context_unit_t {
    std::string text;
    T value;
};

//
// Decision at the boundary between units `index' and `index' + 1; the lengths
// are in code points:
//
struct boundary_score_t {
    size_t index;
    double ncd;
    size_t leftLength, rightLength;
    bool merge;
    boundary_reason_t reason;
};

using boundary_scores_t = std::vector< boundary_score_t >;

//
// Maximal run of merged units, [first, last]; the text is the unit texts
// joined by newlines:
//
template< typename T >
struct context_segment_t {
    size_t first, last;
    std::vector< context_unit_t< T > > units;
    std::string text;
};

template< typename T >
struct context_result_t {
    double threshold;
    boundary_scores_t boundaries;
    std::vector< context_segment_t< T > > segments;
};

template< typename T >
struct boundary_input_t {
    size_t index;
    const context_unit_t< T >& left;
    const context_unit_t< T >& right;
    double ncd;
};

//
// Domain veto on a merge, consulted before any other rule:
//
template< typename T >
using merge_guard_t = std::function< bool (const boundary_input_t< T >&) >;

////////////////////////////////////////////////////////////////////////

//
// Context on both sides of the boundary after texts [index]: the last
// `window' texts up to it, keeping the last `chars' code points, and the next
// `window' texts, keeping the first `chars' code points:
//
std::pair< std::string, std::string > boundary_window (
    const std::vector< std::string >&, size_t index, size_t window,
    size_t chars);

//
// The lower of the base threshold and the `percentile' quantile of the
// distances; the base threshold if the percentile is 0:
//
double choose_threshold (
    double base, double percentile, const std::vector< double >&);

//
// Longest suffix of `lhs' that is a prefix of `rhs', in code points, if at
// least `minChars' long, otherwise 0:
//
size_t suffix_prefix_overlap (
    const std::string& lhs, const std::string& rhs, size_t minChars);

boundary_score_t decide_boundary (
    size_t index, const std::string& lhs, const std::string& rhs, double ncd,
    bool pass, double threshold, const SegmentationControl&);

////////////////////////////////////////////////////////////////////////

//
// Splits a sequence of text units into segments of similar context. Texts are
// normalized (white space collapsed, trimmed), empty units dropped. Throws
// std::invalid_argument for a malformed control:
//
template< typename T >
context_result_t< T >
segment_by_context (
    std::vector< context_unit_t< T > > xs,
    const SegmentationControl& controlA = { },
    merge_guard_t< T > guard = { }) {
    const auto control = resolve (controlA);

    std::vector< context_unit_t< T > > units;

    for (auto& x : xs) {
        x.text = normalize_space (x.text);

        if (!x.text.empty ()) {
            units.push_back (std::move (x));
        }
    }

    context_result_t< T > result{ SegmentationControl{ }.mergeThreshold, { }, { } };

    if (units.empty ()) {
        return result;
    }

    if (1 == units.size ()) {
        const auto text = units [0].text;
        result.segments.push_back ({ 0, 0, std::move (units), text });
        return result;
    }

    std::vector< std::string > texts;

    for (auto& x : units) {
        texts.push_back (x.text);
    }

    compression_cache_t cache;

    std::vector< double > distances;

    for (size_t i = 0; i + 1 < units.size (); ++i) {
        const auto [ lhs, rhs ] = boundary_window (
            texts, i, size_t (control.windowSize),
            size_t (control.boundaryContextChars));

        distances.push_back (ncd (lhs, rhs, cache));
    }

    result.threshold = choose_threshold (
        control.mergeThreshold, *control.adaptiveMergePercentile, distances);

    for (size_t i = 0; i + 1 < units.size (); ++i) {
        const bool pass = !guard || guard (
            boundary_input_t< T >{ i, units [i], units [i + 1], distances [i] });

        result.boundaries.push_back (decide_boundary (
            i, texts [i], texts [i + 1], distances [i], pass,
            result.threshold, control));
    }

    std::vector< size_t > starts{ 0 };

    for (auto& x : result.boundaries) {
        if (!x.merge) {
            starts.push_back (x.index + 1);
        }
    }

    for (size_t i = 0; i < starts.size (); ++i) {
        const size_t first = starts [i];
        const size_t last = i + 1 < starts.size ()
            ? starts [i + 1] - 1 : units.size () - 1;

        context_segment_t< T > segment{ first, last, { }, { } };

        segment.units.assign (
            units.begin () + first, units.begin () + last + 1);

        segment.text = join (
            std::vector< std::string > (
                texts.begin () + first, texts.begin () + last + 1),
            "\n");

        result.segments.push_back (std::move (segment));
    }

    return result;
}

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_CONTEXTSEGMENT_HH
