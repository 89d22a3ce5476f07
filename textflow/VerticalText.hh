// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_VERTICALTEXT_HH
#define TEXTFLOW_TEXTFLOW_VERTICALTEXT_HH

#include <defs.hh>

#include <vector>

#include <textflow/BlockingZone.hh>
#include <textflow/TextFlowFwd.hh>

namespace textflow {

struct GroupingControl;

//
// Clusters runs into vertical columns by center x, ordered as configured by
// verticalColumnOrder:
//
std::vector< TextRuns >
cluster_vertical_columns (const TextRuns&, const GroupingControl&);

//
// Splits a column, top to bottom, at style changes, at blocking zones and at
// gaps wider than verticalGapRatio times the taller run:
//
TextParagraphs split_vertical_column (
    const TextRuns&, const GroupingControl&, const blocking_zones_t&);

//
// Vertical writing: one block per column:
//
TextBlocks group_vertical (
    const TextRuns&, const GroupingControl&, const blocking_zones_t&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_VERTICALTEXT_HH
