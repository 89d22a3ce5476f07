// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_TEXTRUN_HH
#define TEXTFLOW_TEXTFLOW_TEXTRUN_HH

#include <defs.hh>

#include <optional>
#include <string>
#include <vector>

#include <textflow/bbox.hh>
#include <textflow/GroupingControl.hh>
#include <textflow/TextFlowFwd.hh>

namespace textflow {

struct fill_color_t {
    std::string space = "DeviceGray";
    std::vector< double > components{ 0. };
};

//
// A positioned, styled text fragment, as produced by a page parser. `y' is the
// bottom edge of the glyph box and `height' the full glyph box height. Runs
// are shared, never modified, and come back out of grouping as the same
// objects:
//
struct TextRun {
    // UTF-8 text
    std::string text;

    double x = 0, y = 0, width = 0, height = 0;

    std::string fontName;
    double fontSize = 0;

    // font descender, in 1/1000 em
    std::optional< double > descender;

    // Tc, Tw, and Tz (percent) text state
    double charSpacing = 0, wordSpacing = 0, horizontalScaling = 100;

    fill_color_t fillColor;
};

inline bbox_t bbox_from (const TextRun& x) {
    return make_bbox (x.x, x.y, x.width, x.height);
}

inline bbox_t bbox_from (const TextRunPtr& x) {
    return bbox_from (*x);
}

inline double center_x (const TextRun& x) { return x.x + x.width / 2; }
inline double center_y (const TextRun& x) { return x.y + x.height / 2; }

inline double right_of (const TextRun& x) { return x.x + x.width; }
inline double top_of (const TextRun& x) { return x.y + x.height; }

//
// y - descender * fontSize / 1000:
//
double baseline_of (const TextRun&);

//
// Average character width estimated from the run box, with a floor relative to
// the font size:
//
double estimate_char_width (const TextRun&);

//
// Gap expected between the end of `prev' and the start of `next' if they were
// consecutive characters of one word, adjusted for the spacing of `prev':
//
double expected_gap (const TextRun& prev, const TextRun& next);

//
// Horizontal gap from the right edge of `prev' to the left edge of `next':
//
inline double gap_between (const TextRun& prev, const TextRun& next) {
    return next.x - right_of (prev);
}

//
// Removes a subset tag, e.g., `ABCDEF+Helvetica' becomes `Helvetica':
//
std::string normalize_font_name (const std::string&);

bool same_color (const TextRun&, const TextRun&, color_matching_t);

//
// Same font (subset tags ignored), font sizes within tolerance, and, unless
// disabled, same fill color:
//
bool same_style (const TextRun&, const TextRun&, const GroupingControl&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_TEXTRUN_HH
