// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_TEXTPARAGRAPH_HH
#define TEXTFLOW_TEXTFLOW_TEXTPARAGRAPH_HH

#include <defs.hh>

#include <optional>
#include <string>

#include <textflow/bbox.hh>
#include <textflow/Direction.hh>
#include <textflow/TextFlowFwd.hh>

namespace textflow {

//
// Distance to the baseline of the next paragraph of the same block, with the
// font size it relates to:
//
struct line_spacing_t {
    double baselineDistance, fontSize;
};

//
// One physical line (horizontal writing) or one column segment (vertical
// writing):
//
struct TextParagraph {
    //
    // Orders the runs along `dir' (x ascending, x descending, or center y
    // descending) and takes the baseline of the first one. Throws
    // std::invalid_argument for an empty set of runs:
    //
    TextParagraph (TextRuns, direction_t);

    bbox_t bbox () const;

    //
    // Concatenated run text:
    //
    std::string text () const;

    TextRuns runs;

    double baseline;
    direction_t dir;

    std::optional< line_spacing_t > spacing;
};

inline bbox_t bbox_from (const TextParagraph& x) { return x.bbox (); }
inline bbox_t bbox_from (const TextParagraphPtr& x) { return x->bbox (); }

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_TEXTPARAGRAPH_HH
