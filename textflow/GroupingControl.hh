// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_GROUPINGCONTROL_HH
#define TEXTFLOW_TEXTFLOW_GROUPINGCONTROL_HH

#include <defs.hh>

#include <optional>
#include <string>

#include <textflow/Direction.hh>

namespace textflow {

enum struct color_matching_t {
    none,   // ignore fill color
    loose,  // components may differ by a small tolerance
    strict  // components must be equal
};

enum struct column_order_t { right_to_left, left_to_right };

const char* to_string (color_matching_t);
const char* to_string (column_order_t);

std::optional< color_matching_t > color_matching_from (const std::string&);
std::optional< column_order_t > column_order_from (const std::string&);

struct GroupingControl
{
    //
    // Runs whose baselines are within this fraction of the font size of the
    // line's mean baseline are on the same line:
    //
    double lineToleranceRatio = .1;

    //
    // Maximum gap between adjacent runs of one segment, as a multiple of the
    // expected inter-character gap:
    //
    double horizontalGapRatio = 1.5;

    //
    // Maximum gap between lines of one block, as a multiple of line height:
    //
    double verticalGapRatio = 1.2;

    color_matching_t colorMatching = color_matching_t::none;

    //
    // Font sizes within this fraction of each other match:
    //
    double fontSizeToleranceRatio = .1;

    //
    // Split lines at column-sized gaps (table cells, side-by-side columns):
    //
    bool enableColumnSeparation = true;

    //
    // Minimum column gap, as a multiple of the average character width:
    //
    double columnGapRatio = 3.;

    //
    // Detect page columns from the occupancy of the page width; requires a
    // page width in the page context:
    //
    bool enablePageColumnDetection = true;

    int maxPageColumns = 3;

    //
    // Ranges at least this fraction of the page wide (titles, headers) are
    // full width and do not participate in page column detection:
    //
    double fullWidthRatio = .85;

    //
    // Forced writing mode and inline direction; detected when empty:
    //
    std::optional< writing_mode_t > writingMode;
    std::optional< direction_t > inlineDirection;

    //
    // Order of columns in vertical writing:
    //
    column_order_t verticalColumnOrder = column_order_t::right_to_left;
};

//
// Throws std::invalid_argument on non-finite or negative ratios, on
// maxPageColumns < 1, and on a forced top-to-bottom inline direction:
//
void validate (const GroupingControl&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_GROUPINGCONTROL_HH
