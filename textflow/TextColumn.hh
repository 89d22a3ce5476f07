// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_TEXTCOLUMN_HH
#define TEXTFLOW_TEXTFLOW_TEXTCOLUMN_HH

#include <defs.hh>

#include <vector>

#include <textflow/TextFlowFwd.hh>

namespace textflow {

struct GroupingControl;

//
// Horizontal extent of a run or a paragraph, weighted by its height:
//
struct x_range_t {
    double x0, x1, weight;
};

using x_ranges_t = std::vector< x_range_t >;

//
// A vertical strip of the page that text does not cross:
//
struct gutter_t {
    double x0, x1, xmid, score;
};

using gutters_t = std::vector< gutter_t >;

struct x_interval_t {
    double x0, x1;
};

using x_intervals_t = std::vector< x_interval_t >;

//
// Finds at most maxPageColumns - 1 gutters, left to right, from the occupancy
// histogram of the ranges across the page width:
//
gutters_t
detect_gutters (const x_ranges_t&, double pageWidth, const GroupingControl&);

//
// Page columns between the gutters. Without gutters, the whole page width:
//
x_intervals_t column_intervals (double pageWidth, const gutters_t&);

//
// Index of the interval the range overlaps best, or -1 for a full-width
// range:
//
int assign_column (
    double x0, double x1, const x_intervals_t&, double pageWidth,
    const GroupingControl&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_TEXTCOLUMN_HH
