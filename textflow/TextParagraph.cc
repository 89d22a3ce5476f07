// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <stdexcept>

#include <textflow/TextParagraph.hh>
#include <textflow/TextRun.hh>

#include <range/v3/view/transform.hpp>
using namespace ranges;

namespace textflow {

TextParagraph::TextParagraph (TextRuns runsA, direction_t dirA)
    : runs (std::move (runsA)), baseline{ }, dir{ dirA } {

    if (runs.empty ()) {
        throw std::invalid_argument ("paragraph requires at least one run");
    }

    switch (dir) {
    case direction_t::rtl:
        std::stable_sort (runs.begin (), runs.end (), [](auto& a, auto& b) {
            return b->x < a->x;
        });
        break;

    case direction_t::ttb:
        std::stable_sort (runs.begin (), runs.end (), [](auto& a, auto& b) {
            return center_y (*b) < center_y (*a);
        });
        break;

    default:
        std::stable_sort (runs.begin (), runs.end (), [](auto& a, auto& b) {
            return a->x < b->x;
        });
        break;
    }

    baseline = baseline_of (*runs.front ());
}

bbox_t TextParagraph::bbox () const {
    return coalesce (runs | views::transform ([](auto& x) {
        return bbox_from (x);
    }));
}

std::string TextParagraph::text () const {
    std::string s;

    for (auto& run : runs) {
        s += run->text;
    }

    return s;
}

} // namespace textflow
