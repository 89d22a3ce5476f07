// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>

#include <textflow/BlockMerger.hh>
#include <textflow/Direction.hh>
#include <textflow/TextBlock.hh>
#include <textflow/TextLine.hh>
#include <textflow/TextPage.hh>
#include <textflow/TextRun.hh>
#include <textflow/VerticalText.hh>

namespace textflow {

TextPage::TextPage (GroupingControl controlA)
    : control (std::move (controlA)) {
    validate (control);
}

TextBlocks TextPage::group (TextRuns runs, const page_context_t& context) const {
    if (runs.empty ()) {
        return { };
    }

    std::stable_sort (runs.begin (), runs.end (), [](auto& a, auto& b) {
        return b->y < a->y;
    });

    const auto& zones = context.blockingZones;

    if (resolve_writing_mode (runs, control) == writing_mode_t::vertical) {
        return group_vertical (runs, control, zones);
    }

    auto lines = group_lines (runs, control, zones, context.pageWidth);

    if (control.enableColumnSeparation) {
        return merge_lines_with_columns (
            std::move (lines), control, zones, context.pageWidth);
    }

    return merge_lines (std::move (lines), control, zones);
}

} // namespace textflow
