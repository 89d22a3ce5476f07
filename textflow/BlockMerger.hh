// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_BLOCKMERGER_HH
#define TEXTFLOW_TEXTFLOW_BLOCKMERGER_HH

#include <defs.hh>

#include <optional>

#include <textflow/BlockingZone.hh>
#include <textflow/TextFlowFwd.hh>

namespace textflow {

struct GroupingControl;

//
// Extent of a line and the count of its non-space characters:
//
struct line_geometry_t {
    double xmin, xmax, ymin, ymax;

    // floored at 1e-6
    double width, height;

    double xmid;
    size_t chars;
};

line_geometry_t geometry_of (const TextParagraph&);

//
// Whether `next' continues the block of `prev'; `prev' must be above `next':
//
bool should_merge_lines (
    const TextParagraph& prev, const TextParagraph& next,
    const GroupingControl&);

//
// Merges lines top to bottom into blocks, without regard for columns:
//
TextBlocks
merge_lines (TextParagraphs, const GroupingControl&, const blocking_zones_t&);

//
// Merges lines within the page columns they fall in. Without a page width, or
// with page column detection disabled, merges in reading order:
//
TextBlocks merge_lines_with_columns (
    TextParagraphs, const GroupingControl&, const blocking_zones_t&,
    std::optional< double > pageWidth);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_BLOCKMERGER_HH
