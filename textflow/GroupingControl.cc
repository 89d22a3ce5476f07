// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <stdexcept>

#include <textflow/textflow.hh>
#include <textflow/GroupingControl.hh>

namespace textflow {

const char* to_string (color_matching_t x) {
    switch (x) {
    case color_matching_t::loose:  return "loose";
    case color_matching_t::strict: return "strict";
    default:
    case color_matching_t::none:   return "none";
    }
}

const char* to_string (column_order_t x) {
    switch (x) {
    case column_order_t::left_to_right: return "left-to-right";
    default:
    case column_order_t::right_to_left: return "right-to-left";
    }
}

std::optional< color_matching_t > color_matching_from (const std::string& s) {
    if (s == "none")   { return color_matching_t::none; }
    if (s == "loose")  { return color_matching_t::loose; }
    if (s == "strict") { return color_matching_t::strict; }
    return { };
}

std::optional< column_order_t > column_order_from (const std::string& s) {
    if (s == "right-to-left") { return column_order_t::right_to_left; }
    if (s == "left-to-right") { return column_order_t::left_to_right; }
    return { };
}

void validate (const GroupingControl& control) {
    check_ratio ("lineToleranceRatio", control.lineToleranceRatio);
    check_ratio ("horizontalGapRatio", control.horizontalGapRatio);
    check_ratio ("verticalGapRatio", control.verticalGapRatio);
    check_ratio ("fontSizeToleranceRatio", control.fontSizeToleranceRatio);
    check_ratio ("columnGapRatio", control.columnGapRatio);
    check_ratio ("fullWidthRatio", control.fullWidthRatio);

    check_count ("maxPageColumns", control.maxPageColumns);

    if (control.inlineDirection == direction_t::ttb) {
        throw std::invalid_argument (
            "inlineDirection must be ltr or rtl in horizontal grouping");
    }
}

} // namespace textflow
