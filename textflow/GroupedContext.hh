// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_GROUPEDCONTEXT_HH
#define TEXTFLOW_TEXTFLOW_GROUPEDCONTEXT_HH

#include <defs.hh>

#include <string>
#include <vector>

#include <textflow/bbox.hh>
#include <textflow/ContextSegment.hh>
#include <textflow/SegmentationControl.hh>
#include <textflow/TextFlowFwd.hh>

namespace textflow {

struct block_boundary_score_t : boundary_score_t {
    double xAxisOverlapRatio;
};

//
// Adjacent blocks merged by context. `first' and `last' index the blocks
// passed in:
//
struct block_segment_t {
    size_t first, last;
    TextBlocks blocks;

    // newline-joined text of the blocks
    std::string text;

    bbox_t box;
};

struct block_context_result_t {
    double threshold;
    std::vector< block_boundary_score_t > boundaries;
    std::vector< block_segment_t > segments;
};

//
// Horizontal overlap of the boxes as a fraction of the narrower one, 0 if
// either has no width:
//
double x_axis_overlap_ratio (const bbox_t&, const bbox_t&);

//
// Text compared across block boundaries: the first and the last
// contextParagraphEdgeCount non-empty paragraphs:
//
std::string context_signature (const TextBlock&, size_t edgeCount);

//
// Paragraph texts joined by newlines, white space normalized:
//
std::string text_of (const TextBlock&);

//
// Union of the block boxes. Throws std::invalid_argument for an empty set:
//
bbox_t merge_bounds (const TextBlocks&);

//
// Merges blocks of the same context, in the given order; blocks that do not
// overlap horizontally enough never merge:
//
block_context_result_t
segment_blocks_by_context (const TextBlocks&, const SegmentationControl& = { });

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_GROUPEDCONTEXT_HH
