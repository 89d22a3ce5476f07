// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <limits>

#include <utils/string.hh>

#include <textflow/Direction.hh>
#include <textflow/GroupingControl.hh>
#include <textflow/TextRun.hh>

#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/view/take.hpp>
using namespace ranges;

namespace textflow {

const char* to_string (direction_t x) {
    switch (x) {
    case direction_t::rtl: return "rtl";
    case direction_t::ttb: return "ttb";
    default:
    case direction_t::ltr: return "ltr";
    }
}

const char* to_string (writing_mode_t x) {
    switch (x) {
    case writing_mode_t::vertical: return "vertical";
    default:
    case writing_mode_t::horizontal: return "horizontal";
    }
}

std::optional< direction_t > direction_from (const std::string& s) {
    if (s == "ltr") { return direction_t::ltr; }
    if (s == "rtl") { return direction_t::rtl; }
    if (s == "ttb") { return direction_t::ttb; }
    return { };
}

std::optional< writing_mode_t > writing_mode_from (const std::string& s) {
    if (s == "horizontal") { return writing_mode_t::horizontal; }
    if (s == "vertical")   { return writing_mode_t::vertical; }
    return { };
}

neighbor_flow_t score_neighbor_directions (const TextRuns& runs) {
    neighbor_flow_t score;

    if (runs.size () < 2) {
        return score;
    }

    const size_t n = (std::min) (runs.size (), size_t (neighborSampleSize));

    for (size_t i = 0; i < n; ++i) {
        const auto& a = *runs [i];
        const double ax = center_x (a), ay = center_y (a);

        const TextRun* nearest = 0;
        double nearest_dist = std::numeric_limits< double >::infinity ();

        for (size_t j = 0; j < n; ++j) {
            if (i == j) {
                continue;
            }

            const auto& b = *runs [j];

            const double dx = center_x (b) - ax;
            const double dy = center_y (b) - ay;
            const double dist = dx * dx + dy * dy;

            if (dist < nearest_dist) {
                nearest_dist = dist;
                nearest = &b;
            }
        }

        if (0 == nearest) {
            continue;
        }

        const double dx = std::fabs (center_x (*nearest) - ax);
        const double dy = std::fabs (center_y (*nearest) - ay);

        if (dx >= dy) {
            ++score.horizontal;
        }
        else {
            ++score.vertical;
        }
    }

    return score;
}

bool is_rtl (char32_t c) {
    return
        (c >= 0x0590  && c <= 0x08FF)  || // Hebrew, Arabic, Syriac, Thaana
        (c >= 0xFB1D  && c <= 0xFDFF)  || // presentation forms
        (c >= 0xFE70  && c <= 0xFEFF)  || // Arabic presentation forms B
        (c >= 0x10800 && c <= 0x10FFF);   // historic scripts
}

bool is_strong (char32_t c) {
    return c > 0x20 && !(c >= '0' && c <= '9');
}

direction_t detect_inline_direction (const TextRuns& runs) {
    size_t strong = 0, rtl = 0;

    for (const auto& run : runs | views::take (inlineDirectionSampleSize)) {
        for (auto c : to_utf32 (run->text)) {
            if (!is_strong (c)) {
                continue;
            }

            ++strong;

            if (is_rtl (c)) {
                ++rtl;
            }
        }
    }

    if (0 == strong) {
        return direction_t::ltr;
    }

    const double ratio = double (rtl) / strong;

    return ratio >= minRtlRatio && rtl >= minRtlCount
        ? direction_t::rtl : direction_t::ltr;
}

writing_mode_t detect_writing_mode (const TextRuns& runs) {
    if (runs.empty ()) {
        return writing_mode_t::horizontal;
    }

    const TextRuns sample (
        runs.begin (),
        runs.begin () + (std::min) (runs.size (), size_t (writingModeSampleSize)));

    const auto vertical_like = size_t (count_if (sample, [](auto& x) {
        return x->width <= x->height * verticalLikeRatio;
    }));

    const auto horizontal_like = size_t (count_if (sample, [](auto& x) {
        return x->width >= x->height * horizontalLikeRatio;
    }));

    const auto flow = score_neighbor_directions (sample);

    //
    // Right-to-left scripts may have tall, narrow glyph boxes but are always
    // set horizontally:
    //
    if (detect_inline_direction (sample) == direction_t::rtl) {
        return writing_mode_t::horizontal;
    }

    if (vertical_like > 0 &&
        flow.vertical >= flow.horizontal * strongVerticalFlowRatio &&
        flow.vertical >= sample.size () * strongVerticalFlowShare) {
        return writing_mode_t::vertical;
    }

    const double vertical_score = 2. * vertical_like + flow.vertical;
    const double horizontal_score = 2. * horizontal_like + flow.horizontal;

    if (vertical_like > 0 && vertical_score > horizontal_score * verticalScoreMargin) {
        return writing_mode_t::vertical;
    }

    return writing_mode_t::horizontal;
}

writing_mode_t
resolve_writing_mode (const TextRuns& runs, const GroupingControl& control) {
    return control.writingMode
        ? *control.writingMode : detect_writing_mode (runs);
}

direction_t
resolve_inline_direction (const TextRuns& runs, const GroupingControl& control) {
    return control.inlineDirection
        ? *control.inlineDirection : detect_inline_direction (runs);
}

} // namespace textflow
