// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_DIRECTION_HH
#define TEXTFLOW_TEXTFLOW_DIRECTION_HH

#include <defs.hh>

#include <optional>
#include <string>

#include <textflow/TextFlowFwd.hh>

namespace textflow {

//
// Inline direction of a paragraph: left-to-right, right-to-left, or
// top-to-bottom (vertical writing):
//
enum struct direction_t { ltr, rtl, ttb };

enum struct writing_mode_t { horizontal, vertical };

const char* to_string (direction_t);
const char* to_string (writing_mode_t);

std::optional< direction_t > direction_from (const std::string&);
std::optional< writing_mode_t > writing_mode_from (const std::string&);

struct GroupingControl;

//
// Counts, over the first runs, how many have their nearest neighbor along the
// horizontal and the vertical axis:
//
struct neighbor_flow_t {
    size_t horizontal = 0, vertical = 0;
};

neighbor_flow_t score_neighbor_directions (const TextRuns&);

bool is_rtl (char32_t);
bool is_strong (char32_t);

//
// Detection from run geometry and script coverage; the runs are expected in
// descending y order, only the first few hundred are sampled:
//
writing_mode_t detect_writing_mode (const TextRuns&);
direction_t detect_inline_direction (const TextRuns&);

//
// Detection unless the control forces a value:
//
writing_mode_t resolve_writing_mode (const TextRuns&, const GroupingControl&);
direction_t resolve_inline_direction (const TextRuns&, const GroupingControl&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_DIRECTION_HH
