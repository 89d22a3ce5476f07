// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_SEGMENTATIONCONTROL_HH
#define TEXTFLOW_TEXTFLOW_SEGMENTATIONCONTROL_HH

#include <defs.hh>

#include <optional>

namespace textflow {

struct SegmentationControl
{
    //
    // Units on each side of a boundary that make up its context:
    //
    int windowSize = 1;

    //
    // Merge at or below this distance, given enough text:
    //
    double mergeThreshold = .22;

    //
    // Merge at or below this distance regardless of length:
    //
    double strongMergeThreshold = .1;

    int minCombinedChars = 48;

    //
    // Code points of context kept on each side of a boundary:
    //
    int boundaryContextChars = 220;

    //
    // Merge when the end of the left unit repeats as the start of the right
    // one, over at least this fraction of the shorter unit and at least
    // suffixPrefixMergeMinChars code points:
    //
    double suffixPrefixMergeRatio = .75;
    int suffixPrefixMergeMinChars = 10;

    //
    // When set, lowers the merge threshold to this quantile of the observed
    // distances:
    //
    std::optional< double > adaptiveMergePercentile;

    //
    // Blocks merge only when they overlap horizontally by this fraction of the
    // narrower one:
    //
    double minXAxisOverlapRatio = .3;

    //
    // Leading and trailing paragraphs of a block that make up its context
    // signature:
    //
    int contextParagraphEdgeCount = 2;
};

//
// Copy with every value brought into its range: thresholds and ratios clamped
// to [0, 1], the strong threshold to the merge threshold, the context length
// raised to at least 32. Throws std::invalid_argument on non-finite values,
// on counts below 1 and on a negative overlap ratio:
//
SegmentationControl resolve (const SegmentationControl&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_SEGMENTATIONCONTROL_HH
