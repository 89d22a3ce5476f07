// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>

#include <utils/math.hh>
#include <utils/string.hh>

#include <textflow/ContextSegment.hh>

namespace textflow {

const char* to_string (boundary_reason_t x) {
    switch (x) {
    case boundary_reason_t::strong_ncd:            return "strong-ncd";
    case boundary_reason_t::suffix_prefix_overlap: return "suffix-prefix-overlap";
    case boundary_reason_t::threshold_ncd:         return "threshold-ncd";
    case boundary_reason_t::ncd_too_high:          return "ncd-too-high";
    case boundary_reason_t::insufficient_length:   return "insufficient-length";
    default:
    case boundary_reason_t::blocked_by_callback:   return "blocked-by-callback";
    }
}

std::pair< std::string, std::string > boundary_window (
    const std::vector< std::string >& texts, size_t index, size_t window,
    size_t chars) {
    TEXTFLOW_ASSERT (window > 0);
    TEXTFLOW_ASSERT (index + 1 < texts.size ());

    const size_t first = index + 1 >= window ? index + 1 - window : 0;
    const size_t last = (std::min) (texts.size (), index + 1 + window);

    const auto lhs = join (
        std::vector< std::string > (
            texts.begin () + first, texts.begin () + index + 1),
        "\n");

    const auto rhs = join (
        std::vector< std::string > (
            texts.begin () + index + 1, texts.begin () + last),
        "\n");

    return { tail_of (lhs, chars), head_of (rhs, chars) };
}

double choose_threshold (
    double base, double percentile, const std::vector< double >& xs) {
    if (percentile <= 0 || xs.empty ()) {
        return base;
    }

    return (std::min) (base, quantile (xs, percentile));
}

size_t suffix_prefix_overlap (
    const std::string& lhs, const std::string& rhs, size_t min_chars) {
    const auto a = to_utf32 (lhs), b = to_utf32 (rhs);
    const auto n = (std::min) (a.size (), b.size ());

    for (size_t len = n; len >= min_chars && len > 0; --len) {
        if (0 == a.compare (a.size () - len, len, b, 0, len)) {
            return len;
        }
    }

    return 0;
}

boundary_score_t decide_boundary (
    size_t index, const std::string& lhs, const std::string& rhs, double ncd,
    bool pass, double threshold, const SegmentationControl& control) {
    const auto left = length_of (lhs), right = length_of (rhs);

    const auto score = [&](bool merge, boundary_reason_t reason) {
        return boundary_score_t{ index, ncd, left, right, merge, reason };
    };

    if (!pass) {
        return score (false, boundary_reason_t::blocked_by_callback);
    }

    if (ncd <= control.strongMergeThreshold) {
        return score (true, boundary_reason_t::strong_ncd);
    }

    const auto smaller = (std::min) (left, right);

    if (smaller > 0) {
        const auto overlap = suffix_prefix_overlap (
            lhs, rhs, size_t (control.suffixPrefixMergeMinChars));

        if (double (overlap) / smaller >= control.suffixPrefixMergeRatio) {
            return score (true, boundary_reason_t::suffix_prefix_overlap);
        }
    }

    if (left + right < size_t (control.minCombinedChars)) {
        return score (false, boundary_reason_t::insufficient_length);
    }

    if (ncd <= threshold) {
        return score (true, boundary_reason_t::threshold_ncd);
    }

    return score (false, boundary_reason_t::ncd_too_high);
}

} // namespace textflow
