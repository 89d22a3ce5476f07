// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <tuple>

#include <textflow/BlockingZone.hh>
#include <textflow/TextParagraph.hh>
#include <textflow/TextRun.hh>

namespace textflow {

bool blocked_horizontally (
    const TextRun& lhs, const TextRun& rhs, const blocking_zones_t& zones) {
    if (zones.empty ()) {
        return false;
    }

    const auto& [ left, right ] = lhs.x < rhs.x
        ? std::tie (lhs, rhs) : std::tie (rhs, lhs);

    const double x0 = right_of (left), x1 = right.x;

    if (x0 >= x1) {
        // overlapping runs, no gap
        return false;
    }

    const double y0 = (std::min) (left.y, right.y);
    const double y1 = (std::max) (top_of (left), top_of (right));

    for (auto& zone : zones) {
        const bool across =
            zone.arr [0] < x1 && zone.arr [2] > x0 &&
            zone.arr [1] < y1 && zone.arr [3] > y0;

        if (!across) {
            continue;
        }

        const bool container =
            zone.arr [0] <= left.x && zone.arr [2] >= x0 &&
            zone.arr [0] <= x1 && zone.arr [2] >= right_of (right);

        if (!container) {
            return true;
        }
    }

    return false;
}

bool blocked_between_lines (
    const TextParagraph& lhs, const TextParagraph& rhs,
    const blocking_zones_t& zones) {
    if (zones.empty ()) {
        return false;
    }

    const auto& [ upper, lower ] = lhs.baseline > rhs.baseline
        ? std::tie (lhs, rhs) : std::tie (rhs, lhs);

    const auto upper_box = upper.bbox (), lower_box = lower.bbox ();

    const double x0 = (std::min) (upper_box.arr [0], lower_box.arr [0]);
    const double x1 = (std::max) (upper_box.arr [2], lower_box.arr [2]);

    for (auto& zone : zones) {
        const bool across =
            zone.arr [1] < upper.baseline && zone.arr [3] > lower.baseline &&
            zone.arr [0] < x1 && zone.arr [2] > x0;

        if (!across) {
            continue;
        }

        if (!contains (zone, upper_box) || !contains (zone, lower_box)) {
            return true;
        }
    }

    return false;
}

bool blocked_vertically (
    const TextRun& lhs, const TextRun& rhs, const blocking_zones_t& zones) {
    if (zones.empty ()) {
        return false;
    }

    const auto& [ first, second ] = center_y (lhs) >= center_y (rhs)
        ? std::tie (lhs, rhs) : std::tie (rhs, lhs);

    const double y0 = top_of (second), y1 = first.y;

    if (y1 <= y0) {
        return false;
    }

    const double x0 = (std::min) (first.x, second.x);
    const double x1 = (std::max) (right_of (first), right_of (second));

    const auto first_box = bbox_from (first), second_box = bbox_from (second);

    for (auto& zone : zones) {
        const bool across =
            zone.arr [1] < y1 && zone.arr [3] > y0 &&
            zone.arr [0] < x1 && zone.arr [2] > x0;

        if (!across) {
            continue;
        }

        if (!contains (zone, first_box) || !contains (zone, second_box)) {
            return true;
        }
    }

    return false;
}

} // namespace textflow
