// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_BLOCKINGZONE_HH
#define TEXTFLOW_TEXTFLOW_BLOCKINGZONE_HH

#include <defs.hh>

#include <vector>

#include <textflow/bbox.hh>
#include <textflow/TextFlowFwd.hh>

namespace textflow {

//
// Rectangles (rules, table borders, shapes) that separate text. A zone that
// contains both sides of a candidate merge is a container and never blocks;
// only zones in between do:
//
using blocking_zones_t = std::vector< bbox_t >;

//
// Zone in the horizontal gap between two runs of one line:
//
bool blocked_horizontally (
    const TextRun&, const TextRun&, const blocking_zones_t&);

//
// Zone between the baselines of two lines, across their horizontal extent:
//
bool blocked_between_lines (
    const TextParagraph&, const TextParagraph&, const blocking_zones_t&);

//
// Zone in the vertical gap between two runs of a vertical column:
//
bool blocked_vertically (
    const TextRun&, const TextRun&, const blocking_zones_t&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_BLOCKINGZONE_HH
