// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <map>

#include <utils/math.hh>
#include <utils/string.hh>

#include <textflow/BlockMerger.hh>
#include <textflow/GroupingControl.hh>
#include <textflow/TextBlock.hh>
#include <textflow/TextColumn.hh>
#include <textflow/TextParagraph.hh>
#include <textflow/TextRun.hh>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>
using namespace ranges;

namespace textflow {
namespace {

double overlap_ratio (const line_geometry_t& a, const line_geometry_t& b) {
    return overlap_1d (a.xmin, a.xmax, b.xmin, b.xmax) /
        (std::max) (1e-6, (std::min) (a.width, b.width));
}

bool aligned (const line_geometry_t& a, const line_geometry_t& b, double size) {
    const double tolerance = (std::max) (
        minAnchorTolerance, size * anchorToleranceFactor);

    return
        std::fabs (a.xmin - b.xmin) <= tolerance ||
        std::fabs (a.xmax - b.xmax) <= tolerance ||
        std::fabs (a.xmid - b.xmid) <= tolerance * centerAnchorFactor;
}

bool body_like (const line_geometry_t& x, double size) {
    return x.width >= size * bodyLineExtentFactor || x.chars >= bodyLineMinChars;
}

//
// Lines of different styles still merge when they look like consecutive lines
// of running text:
//
bool merges_across_style (
    const line_geometry_t& a, const line_geometry_t& b, double size,
    double gap, double height) {
    const double ratio =
        (std::min) (a.width, b.width) / (std::max) (a.width, b.width);

    if (ratio < styleShiftMinWidthRatio) {
        return false;
    }

    if (!aligned (a, b, size) && overlap_ratio (a, b) < styleShiftMinOverlap) {
        return false;
    }

    if (!body_like (a, size) || !body_like (b, size)) {
        return false;
    }

    return gap <= height * styleShiftGapFactor;
}

//
// Reading order: by baseline, top to bottom, lines within sameRowSlack of
// each other left to right by `xpos':
//
template< typename F >
void sort_reading_order (TextParagraphs& xs, F xpos) {
    std::stable_sort (xs.begin (), xs.end (), [&](auto& a, auto& b) {
        const double diff = b->baseline - a->baseline;

        if (std::fabs (diff) > sameRowSlack) {
            return diff < 0;
        }

        return xpos (*a) < xpos (*b);
    });
}

//
// Folds lines, in the given order, into blocks; each line is compared with
// the last line of the block being built:
//
void fold_lines (
    const TextParagraphs& xs, const GroupingControl& control,
    const blocking_zones_t& zones, TextBlocks& blocks) {
    TextParagraphs current;

    for (auto& x : xs) {
        if (current.empty ()) {
            current.push_back (x);
            continue;
        }

        const auto& prev = *current.back ();

        if (!blocked_between_lines (prev, *x, zones) &&
            should_merge_lines (prev, *x, control)) {
            current.push_back (x);
        }
        else {
            blocks.push_back (std::make_shared< TextBlock > (std::move (current)));
            current = { x };
        }
    }

    if (!current.empty ()) {
        blocks.push_back (std::make_shared< TextBlock > (std::move (current)));
    }
}

} // anonymous

line_geometry_t geometry_of (const TextParagraph& paragraph) {
    const auto box = paragraph.bbox ();

    line_geometry_t x{ };

    x.xmin = box.arr [0];
    x.ymin = box.arr [1];
    x.xmax = box.arr [2];
    x.ymax = box.arr [3];

    x.width = (std::max) (1e-6, width_of (box));
    x.height = (std::max) (1e-6, height_of (box));

    x.xmid = center_x_of (box);
    x.chars = length_of (strip_space (paragraph.text ()));

    return x;
}

bool should_merge_lines (
    const TextParagraph& prev, const TextParagraph& next,
    const GroupingControl& control) {
    const double delta = prev.baseline - next.baseline;

    if (delta <= 0) {
        return false;
    }

    const auto& lhs = *prev.runs.front ();
    const auto& rhs = *next.runs.front ();

    const auto a = geometry_of (prev), b = geometry_of (next);
    const double size = (std::max) (lhs.fontSize, rhs.fontSize);

    if (control.enableColumnSeparation &&
        overlap_ratio (a, b) < minLineOverlapRatio && !aligned (a, b, size)) {
        return false;
    }

    const double height = (std::max) (a.height, b.height);
    const double gap = delta - height;

    if (gap > height * control.verticalGapRatio) {
        return false;
    }

    if (same_style (lhs, rhs, control)) {
        return true;
    }

    return merges_across_style (a, b, size, gap, height);
}

TextBlocks merge_lines (
    TextParagraphs xs, const GroupingControl& control,
    const blocking_zones_t& zones) {
    TextBlocks blocks;

    if (xs.empty ()) {
        return blocks;
    }

    std::stable_sort (xs.begin (), xs.end (), [](auto& a, auto& b) {
        return b->baseline < a->baseline;
    });

    TextParagraphs current{ xs [0] };

    for (size_t i = 1; i < xs.size (); ++i) {
        const auto& prev = *xs [i - 1];
        const auto& curr = *xs [i];

        if (should_merge_lines (prev, curr, control) &&
            !blocked_between_lines (prev, curr, zones)) {
            current.push_back (xs [i]);
        }
        else {
            blocks.push_back (std::make_shared< TextBlock > (std::move (current)));
            current = { xs [i] };
        }
    }

    blocks.push_back (std::make_shared< TextBlock > (std::move (current)));

    return blocks;
}

TextBlocks merge_lines_with_columns (
    TextParagraphs xs, const GroupingControl& control,
    const blocking_zones_t& zones, std::optional< double > page_width) {
    TextBlocks blocks;

    if (xs.empty ()) {
        return blocks;
    }

    if (!page_width || *page_width <= 0 || !control.enablePageColumnDetection) {
        sort_reading_order (xs, [](auto& x) { return x.runs.front ()->x; });
        fold_lines (xs, control, zones, blocks);
        return blocks;
    }

    const auto spans = xs
        | views::transform ([](auto& x) {
              const auto box = x->bbox ();
              return x_range_t{
                  box.arr [0], box.arr [2], (std::max) (1., height_of (box))
              };
          })
        | to< x_ranges_t > ();

    const auto intervals = column_intervals (
        *page_width, detect_gutters (spans, *page_width, control));

    std::map< int, TextParagraphs > columns;

    for (size_t i = 0; i < xs.size (); ++i) {
        columns [assign_column (
                spans [i].x0, spans [i].x1, intervals, *page_width, control)]
            .push_back (xs [i]);
    }

    for (auto& [ ignore, column ] : columns) {
        sort_reading_order (column, [](auto& x) { return x.bbox ().arr [0]; });
        fold_lines (column, control, zones, blocks);
    }

    std::stable_sort (blocks.begin (), blocks.end (), [](auto& a, auto& b) {
        const double diff = b->box.arr [3] - a->box.arr [3];

        if (std::fabs (diff) > sameRowSlack) {
            return diff < 0;
        }

        return a->box.arr [0] < b->box.arr [0];
    });

    return blocks;
}

} // namespace textflow
