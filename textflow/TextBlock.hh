// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_TEXTBLOCK_HH
#define TEXTFLOW_TEXTFLOW_TEXTBLOCK_HH

#include <defs.hh>

#include <optional>
#include <string>

#include <textflow/bbox.hh>
#include <textflow/Direction.hh>
#include <textflow/TextFlowFwd.hh>

namespace textflow {

enum struct alignment_t { left, center, right, unknown };

const char* to_string (alignment_t);

//
// Paragraph alignment inferred from the spread of the paragraph edges, with
// the box the paragraphs were likely laid out in and the median indents from
// its start and end edges:
//
struct layout_inference_t {
    direction_t dir;
    alignment_t alignment;

    // in [0, 1]
    double confidence;

    bbox_t box;

    double startPadding, endPadding;
};

struct TextBlock {
    //
    // Keeps copies of the paragraphs, sharing their runs. Throws
    // std::invalid_argument for an empty set of paragraphs:
    //
    TextBlock (TextParagraphs, writing_mode_t = writing_mode_t::horizontal);

    TextRuns runs () const;

    TextParagraphs paragraphs;

    //
    // Union of the run boxes, widened by a buffer:
    //
    bbox_t box;

    std::optional< layout_inference_t > layout;
};

inline bbox_t bbox_from (const TextBlock& x) { return x.box; }
inline bbox_t bbox_from (const TextBlockPtr& x) { return x->box; }

////////////////////////////////////////////////////////////////////////

//
// Width added to the content width of a set of runs: the larger of
// blockWidthBuffer times the width and the letter spacing of the most spaced
// run:
//
double width_buffer_of (const TextRuns&, double width);

//
// Records the baseline distance to the next paragraph on each paragraph but
// the last:
//
void add_line_spacing (TextParagraphs&);

//
// Direction of the block from the directions of its paragraphs:
//
direction_t block_direction_of (const TextParagraphs&);

//
// Infers left, center, or right alignment from paragraph edges:
//
layout_inference_t infer_layout (const TextParagraphs&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_TEXTBLOCK_HH
