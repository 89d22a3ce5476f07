// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_TEXTLINE_HH
#define TEXTFLOW_TEXTFLOW_TEXTLINE_HH

#include <defs.hh>

#include <optional>
#include <vector>

#include <textflow/BlockingZone.hh>
#include <textflow/TextFlowFwd.hh>

namespace textflow {

struct GroupingControl;

//
// Clusters runs into physical lines by baseline proximity and vertical box
// overlap with the running mean of the line. Lines come out top to bottom:
//
std::vector< TextRuns > cluster_lines (const TextRuns&, const GroupingControl&);

//
// Estimate of the gap between words of a line, from its positive gaps:
//
double space_gap_threshold (const std::vector< double >& gaps, double fontSize);

//
// Splits a line at gaps wider than the expected inter-character gap scaled by
// horizontalGapRatio, and at blocking zones:
//
std::vector< TextRuns > split_adjacent (
    const TextRuns&, const GroupingControl&, const blocking_zones_t&);

//
// Splits a line at column-sized gaps, and at blocking zones:
//
std::vector< TextRuns > split_columns (
    const TextRuns&, const GroupingControl&, const blocking_zones_t&);

//
// Paragraph in the inline direction of its own runs:
//
TextParagraphPtr make_paragraph (TextRuns, const GroupingControl&);

//
// Horizontal writing: the paragraphs of the page, line by line, from runs in
// descending y order:
//
TextParagraphs group_lines (
    const TextRuns&, const GroupingControl&, const blocking_zones_t&,
    std::optional< double > pageWidth = { });

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_TEXTLINE_HH
