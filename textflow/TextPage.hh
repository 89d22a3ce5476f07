// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_TEXTPAGE_HH
#define TEXTFLOW_TEXTFLOW_TEXTPAGE_HH

#include <defs.hh>

#include <optional>

#include <textflow/BlockingZone.hh>
#include <textflow/GroupingControl.hh>
#include <textflow/TextFlowFwd.hh>

namespace textflow {

//
// What is known about the page besides its runs:
//
struct page_context_t {
    blocking_zones_t blockingZones;
    std::optional< double > pageWidth, pageHeight;
};

//
// Groups the runs of one page into blocks of paragraphs, in reading order.
// Grouping is a pure function of the runs, the context and the control:
//
struct TextPage {
    //
    // Throws std::invalid_argument for a malformed control:
    //
    explicit TextPage (GroupingControl = { });

    TextBlocks group (TextRuns, const page_context_t& = { }) const;

    GroupingControl control;
};

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_TEXTPAGE_HH
