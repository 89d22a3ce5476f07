// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <utils/math.hh>
#include <utils/string.hh>

#include <textflow/TextBlock.hh>
#include <textflow/TextParagraph.hh>
#include <textflow/TextRun.hh>

#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/max.hpp>
#include <range/v3/algorithm/min.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>
using namespace ranges;

namespace textflow {
namespace {

//
// Edges of the runs of one paragraph:
//
struct paragraph_edges_t {
    double xmin, xmax, ymin, ymax, xmid, fontSize;
    direction_t dir;
};

paragraph_edges_t edges_of (const TextParagraph& paragraph) {
    const auto box = paragraph.bbox ();

    return paragraph_edges_t{
        box.arr [0], box.arr [2], box.arr [1], box.arr [3],
        center_x_of (box), paragraph.runs.front ()->fontSize, paragraph.dir
    };
}

template< typename F >
std::vector< double >
collect (const std::vector< paragraph_edges_t >& xs, F f) {
    return xs | views::transform (f) | to< std::vector< double > > ();
}

} // anonymous

const char* to_string (alignment_t x) {
    switch (x) {
    case alignment_t::left:   return "left";
    case alignment_t::center: return "center";
    case alignment_t::right:  return "right";
    default:
    case alignment_t::unknown: return "unknown";
    }
}

double width_buffer_of (const TextRuns& runs, double width) {
    double spacing = 0;

    for (auto& run : runs) {
        if (run->charSpacing > 0) {
            const double n = double (
                (std::max) (length_of (run->text), size_t (1)) - 1);

            spacing = (std::max) (
                spacing, run->charSpacing * n * run->horizontalScaling / 100);
        }
    }

    return (std::max) (spacing, width * blockWidthBuffer);
}

void add_line_spacing (TextParagraphs& paragraphs) {
    for (size_t i = 0; i < paragraphs.size (); ++i) {
        auto& current = *paragraphs [i];
        current.spacing.reset ();

        if (i + 1 == paragraphs.size ()) {
            break;
        }

        const double distance = current.baseline - paragraphs [i + 1]->baseline;
        const double size = current.runs.front ()->fontSize;

        if (distance > 0 && size > 0) {
            current.spacing = line_spacing_t{ distance, size };
        }
    }
}

direction_t block_direction_of (const TextParagraphs& paragraphs) {
    const auto n = paragraphs.size ();

    if (0 == n) {
        return direction_t::ltr;
    }

    const auto rtl = size_t (count_if (paragraphs, [](auto& x) {
        return x->dir == direction_t::rtl;
    }));

    const auto ttb = size_t (count_if (paragraphs, [](auto& x) {
        return x->dir == direction_t::ttb;
    }));

    if (ttb > rtl && ttb * 2 > n) {
        return direction_t::ttb;
    }

    if (rtl >= (n + 1) / 2) {
        return direction_t::rtl;
    }

    return direction_t::ltr;
}

layout_inference_t infer_layout (const TextParagraphs& paragraphs) {
    if (paragraphs.empty ()) {
        throw std::invalid_argument ("layout inference requires paragraphs");
    }

    const auto edges = paragraphs
        | views::transform ([](auto& x) { return edges_of (*x); })
        | to< std::vector< paragraph_edges_t > > ();

    const auto lefts   = collect (edges, [](auto& x) { return x.xmin; });
    const auto rights  = collect (edges, [](auto& x) { return x.xmax; });
    const auto centers = collect (edges, [](auto& x) { return x.xmid; });

    const auto bottoms = collect (edges, [](auto& x) { return x.ymin; });
    const auto tops    = collect (edges, [](auto& x) { return x.ymax; });

    const double ymin = ranges::min (bottoms), ymax = ranges::max (tops);

    double font_size = quantile (
        collect (edges, [](auto& x) { return x.fontSize; }), .5);

    if (0 == font_size) {
        font_size = defaultFontSize;
    }

    std::vector< std::pair< alignment_t, double > > spreads{
        { alignment_t::left,   interquartile_range (lefts)   },
        { alignment_t::center, interquartile_range (centers) },
        { alignment_t::right,  interquartile_range (rights)  }
    };

    std::stable_sort (spreads.begin (), spreads.end (), [](auto& a, auto& b) {
        return a.second < b.second;
    });

    const auto& [ best, best_spread ] = spreads [0];
    const double second_spread = spreads [1].second;

    const double dominance = second_spread <= 0
        ? 0. : clamp ((second_spread - best_spread) / second_spread, 0., 1.);

    const double tolerance = (std::max) (
        minAlignmentTolerance, font_size * alignmentToleranceFactor);

    const bool plausible =
        best_spread <= tolerance * 2 || paragraphs.size () <= 2;

    layout_inference_t result{ };

    result.dir = block_direction_of (paragraphs);
    result.confidence = plausible
        ? dominance : dominance * implausibleConfidenceFactor;

    if (!plausible) {
        result.alignment = alignment_t::unknown;
        result.box = bbox_t{ ranges::min (lefts), ymin, ranges::max (rights), ymax };
        result.startPadding = result.endPadding = 0;
        return result;
    }

    result.alignment = best;

    switch (best) {
    case alignment_t::left: {
        const double anchor = median (lefts);
        result.box = bbox_t{
            (std::min) (ranges::min (lefts), anchor), ymin, ranges::max (rights), ymax
        };
    }
        break;

    case alignment_t::center: {
        const double anchor = median (centers);

        double half = 0;

        for (auto& x : edges) {
            half = (std::max) (
                half, (std::max) (
                    std::fabs (x.xmax - anchor), std::fabs (anchor - x.xmin)));
        }

        result.box = bbox_t{ anchor - half, ymin, anchor + half, ymax };
    }
        break;

    default: {
        const double anchor = median (rights);
        result.box = bbox_t{
            ranges::min (lefts), ymin, (std::max) (anchor, ranges::max (rights)), ymax
        };
    }
        break;
    }

    const double xmin = result.box.arr [0], xmax = result.box.arr [2];

    const double left_padding = quantile (
        collect (edges, [=](auto& x) { return (std::max) (0., x.xmin - xmin); }),
        .5);

    const double right_padding = quantile (
        collect (edges, [=](auto& x) { return (std::max) (0., xmax - x.xmax); }),
        .5);

    if (result.dir == direction_t::rtl) {
        result.startPadding = right_padding;
        result.endPadding = left_padding;
    }
    else {
        result.startPadding = left_padding;
        result.endPadding = right_padding;
    }

    return result;
}

TextBlock::TextBlock (TextParagraphs paragraphsA, writing_mode_t mode)
    : paragraphs (std::move (paragraphsA)), box{ } {

    if (paragraphs.empty ()) {
        throw std::invalid_argument ("block requires at least one paragraph");
    }

    // own copies, the line spacing is per block
    for (auto& paragraph : paragraphs) {
        paragraph = std::make_shared< TextParagraph > (*paragraph);
    }

    const auto xs = runs ();

    box = coalesce (xs | views::transform ([](auto& x) {
        return bbox_from (x);
    }));

    box.arr [2] += width_buffer_of (xs, width_of (box));

    add_line_spacing (paragraphs);

    if (mode == writing_mode_t::vertical) {
        layout = layout_inference_t{
            direction_t::ttb, alignment_t::unknown, 0., box, 0., 0.
        };
    }
    else {
        layout = infer_layout (paragraphs);
    }
}

TextRuns TextBlock::runs () const {
    TextRuns xs;

    for (auto& paragraph : paragraphs) {
        xs.insert (xs.end (), paragraph->runs.begin (), paragraph->runs.end ());
    }

    return xs;
}

} // namespace textflow
