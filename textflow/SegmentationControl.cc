// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <utils/math.hh>

#include <textflow/textflow.hh>
#include <textflow/SegmentationControl.hh>

namespace textflow {
namespace {

// Shortest context kept on either side of a boundary.
const int minBoundaryContextChars = 32;

double finite_or_throw (const char* name, double value) {
    if (!std::isfinite (value)) {
        throw std::invalid_argument (
            format ("invalid {} value: {}", name, value));
    }

    return value;
}

} // anonymous

SegmentationControl resolve (const SegmentationControl& control) {
    SegmentationControl x = control;

    check_count ("windowSize", x.windowSize);
    check_count ("minCombinedChars", x.minCombinedChars);
    check_count ("boundaryContextChars", x.boundaryContextChars);
    check_count ("suffixPrefixMergeMinChars", x.suffixPrefixMergeMinChars);
    check_count ("contextParagraphEdgeCount", x.contextParagraphEdgeCount);

    check_ratio ("minXAxisOverlapRatio", x.minXAxisOverlapRatio);

    x.mergeThreshold = clamp (
        finite_or_throw ("mergeThreshold", x.mergeThreshold), 0., 1.);

    x.strongMergeThreshold = clamp (
        finite_or_throw ("strongMergeThreshold", x.strongMergeThreshold),
        0., x.mergeThreshold);

    x.suffixPrefixMergeRatio = clamp (
        finite_or_throw ("suffixPrefixMergeRatio", x.suffixPrefixMergeRatio),
        0., 1.);

    x.adaptiveMergePercentile = x.adaptiveMergePercentile
        ? clamp (
            finite_or_throw (
                "adaptiveMergePercentile", *x.adaptiveMergePercentile),
            0., 1.)
        : 0.;

    x.boundaryContextChars = (std::max) (
        x.boundaryContextChars, minBoundaryContextChars);

    return x;
}

} // namespace textflow
