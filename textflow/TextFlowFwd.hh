// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_TEXTFLOW_FWD_HH
#define TEXTFLOW_TEXTFLOW_TEXTFLOW_FWD_HH

#include <defs.hh>

#include <memory>
#include <vector>

////////////////////////////////////////////////////////////////////////

// Descender (in 1/1000 em) assumed for runs without font metrics.
#define defaultDescender -200.

// Font size assumed where a median font size comes out as zero.
#define defaultFontSize 12.

// Character width is estimated as width / length, but never less than
// minCharWidthFactor * fontSize. Unusable widths fall back to
// fallbackCharWidthFactor * fontSize.
#define minCharWidthFactor 0.3
#define fallbackCharWidthFactor 0.5

// Block widths are padded by this fraction of the content width (or by the
// letter spacing of the widest spaced run, if larger).
#define blockWidthBuffer 0.05

//
// Line clustering: baselines within max(minLineTolerance, fontSize *
// lineToleranceRatio) of the running mean are on the same line, provided the
// boxes overlap vertically by at least minLineBoxOverlap of the smaller
// height:
//
#define minLineTolerance 0.5
#define minLineBoxOverlap 0.15

//
// Column split: the space-like gap is estimated from the quartiles of the
// positive gaps of a line. With fewer than minSpaceGapSamples gaps it is
// spaceGapFontFactor * fontSize:
//
#define minSpaceGapSamples 3
#define spaceGapFontFactor 0.33
#define spaceGapSkewRatio 2.5
#define spaceGapMedianFactor 1.7
#define spaceGapUpperFactor 0.9

// Column gap threshold is at least adaptiveGapFactor times the space-like gap.
#define adaptiveGapFactor 3.5

// A two-run line splits only across a gap wider than
// max(strongGutterFactor * threshold, strongGutterFontFactor * fontSize).
#define strongGutterFactor 1.8
#define strongGutterFontFactor 6.

//
// Page gutters: histogram bins with occupancy at most gutterOccThreshold of
// the maximum, at least minGutterWidthRatio of the page wide and away from
// the page edges by columnEdgeMarginRatio of the bins:
//
#define gutterOccThreshold 0.08
#define minGutterWidthRatio 0.018
#define gutterMaxCrossingRatio 0.18
#define columnEdgeMarginRatio 0.06

// Gutter detection needs at least this many ranges narrower than full width.
#define minGutterRanges 8

// Range spans are capped at gutterSpanCapFactor times the
// gutterSpanCapQuantile range width.
#define gutterSpanCapQuantile 0.9
#define gutterSpanCapFactor 1.15

// Histogram size is pageWidth / 2, clamped to these bounds.
#define minHistogramBins 200
#define maxHistogramBins 600

// Columns narrower than this fraction of the page width are dropped.
#define minColumnWidthRatio 0.08

// Page columns apply to lines at least this fraction of the page wide.
#define minPageColumnLineRatio 0.25

//
// Writing mode and inline direction sampling:
//
#define writingModeSampleSize 240
#define neighborSampleSize 180
#define inlineDirectionSampleSize 180

// A run is vertical-like if width <= verticalLikeRatio * height, and
// horizontal-like if width >= horizontalLikeRatio * height.
#define verticalLikeRatio 0.55
#define horizontalLikeRatio 0.9

#define strongVerticalFlowRatio 2.5
#define strongVerticalFlowShare 0.75
#define verticalScoreMargin 1.1

#define minRtlRatio 0.25
#define minRtlCount 2

//
// Vertical columns accept runs within max(minVerticalColumnTolerance,
// meanWidth, width, verticalColumnFontFactor * meanFontSize) of their mean
// center:
//
#define minVerticalColumnTolerance 2.
#define verticalColumnFontFactor 0.9

//
// Line merging:
//
#define minLineOverlapRatio 0.05
#define minAnchorTolerance 0.8
#define anchorToleranceFactor 0.85
#define centerAnchorFactor 0.75
#define styleShiftMinWidthRatio 0.55
#define styleShiftMinOverlap 0.18
#define bodyLineExtentFactor 6.5
#define bodyLineMinChars 10
#define styleShiftGapFactor 0.55

// Lines with baselines within this distance are ordered by x.
#define sameRowSlack 1.

//
// Alignment inference: the spread of the best anchor must be within twice
// max(minAlignmentTolerance, alignmentToleranceFactor * fontSize):
//
#define minAlignmentTolerance 0.8
#define alignmentToleranceFactor 0.35
#define implausibleConfidenceFactor 0.35

// Component tolerance of loose color matching.
#define looseColorTolerance 0.05

#define TEXTFLOW_TYPEDEF(x)                                 \
    struct x;                                               \
    using TEXTFLOW_CAT(x, Ptr) = std::shared_ptr< x >;      \
    using TEXTFLOW_CAT(x, s) = std::vector< TEXTFLOW_CAT(x, Ptr) >

namespace textflow {

TEXTFLOW_TYPEDEF (TextRun);
TEXTFLOW_TYPEDEF (TextParagraph);
TEXTFLOW_TYPEDEF (TextBlock);

} // namespace textflow

#undef TEXTFLOW_TYPEDEF

#endif // TEXTFLOW_TEXTFLOW_TEXTFLOW_FWD_HH
