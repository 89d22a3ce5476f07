// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <map>

#include <utils/math.hh>

#include <textflow/Direction.hh>
#include <textflow/GroupingControl.hh>
#include <textflow/TextColumn.hh>
#include <textflow/TextLine.hh>
#include <textflow/TextParagraph.hh>
#include <textflow/TextRun.hh>

#include <range/v3/algorithm/max.hpp>
#include <range/v3/algorithm/min.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>
using namespace ranges;

namespace textflow {
namespace {

//
// Running means of the line being built:
//
struct line_state_t {
    TextRuns runs;
    double baseline, fontSize, bottom, top;

    explicit line_state_t (const TextRunPtr& x)
        : runs{ x }, baseline (baseline_of (*x)), fontSize (x->fontSize),
          bottom (x->y), top (top_of (*x))
        { }

    bool accepts (const TextRun&, const GroupingControl&) const;
    void push_back (const TextRunPtr&);
};

bool line_state_t::accepts (
    const TextRun& x, const GroupingControl& control) const {
    const double tolerance = (std::max) (
        minLineTolerance,
        (std::max) (fontSize, x.fontSize) * control.lineToleranceRatio);

    if (std::fabs (baseline_of (x) - baseline) > tolerance) {
        return false;
    }

    const double overlap = overlap_1d (x.y, top_of (x), bottom, top);

    const double height = (std::min) (
        (std::max) (1e-6, x.height), (std::max) (1e-6, top - bottom));

    return overlap / height >= minLineBoxOverlap;
}

void line_state_t::push_back (const TextRunPtr& x) {
    runs.push_back (x);

    const double n = double (runs.size ());

    baseline += (baseline_of (*x) - baseline) / n;
    fontSize += (x->fontSize - fontSize) / n;
    bottom += (x->y - bottom) / n;
    top += (top_of (*x) - top) / n;
}

TextRuns sorted_by_x (TextRuns xs) {
    std::stable_sort (xs.begin (), xs.end (), [](auto& a, auto& b) {
        return a->x < b->x;
    });
    return xs;
}

double line_width_of (const TextRuns& xs) {
    const auto lefts = xs | views::transform ([](auto& x) { return x->x; });
    const auto rights = xs | views::transform ([](auto& x) {
        return right_of (*x);
    });

    return ranges::max (rights) - ranges::min (lefts);
}

} // anonymous

std::vector< TextRuns >
cluster_lines (const TextRuns& runs, const GroupingControl& control) {
    if (runs.empty ()) {
        return { };
    }

    auto xs = runs;

    std::stable_sort (xs.begin (), xs.end (), [](auto& a, auto& b) {
        return baseline_of (*b) < baseline_of (*a);
    });

    std::vector< TextRuns > lines;
    std::optional< line_state_t > current;

    for (auto& x : xs) {
        if (!current) {
            current.emplace (x);
        }
        else if (current->accepts (*x, control)) {
            current->push_back (x);
        }
        else {
            lines.push_back (std::move (current->runs));
            current.emplace (x);
        }
    }

    lines.push_back (std::move (current->runs));

    return lines;
}

double space_gap_threshold (const std::vector< double >& gaps, double font_size) {
    const auto xs = gaps
        | views::filter ([](auto x) { return x > 0; })
        | to< std::vector< double > > ();

    if (xs.size () < minSpaceGapSamples) {
        return font_size * spaceGapFontFactor;
    }

    const double q25 = quantile (xs, .25);
    const double q50 = quantile (xs, .5);
    const double q75 = quantile (xs, .75);

    if (q75 > q25 * spaceGapSkewRatio) {
        return (q25 + q75) / 2;
    }

    return (std::max) ({
        q50 * spaceGapMedianFactor,
        q75 * spaceGapUpperFactor,
        font_size * spaceGapFontFactor });
}

std::vector< TextRuns > split_adjacent (
    const TextRuns& runs, const GroupingControl& control,
    const blocking_zones_t& zones) {
    if (runs.size () < 2) {
        return runs.empty ()
            ? std::vector< TextRuns >{ } : std::vector< TextRuns >{ runs };
    }

    const auto xs = sorted_by_x (runs);

    std::vector< TextRuns > groups;
    TextRuns current{ xs [0] };

    for (size_t i = 1; i < xs.size (); ++i) {
        const auto& prev = *current.back ();
        const auto& curr = *xs [i];

        const double limit = expected_gap (prev, curr) * control.horizontalGapRatio;

        if (blocked_horizontally (prev, curr, zones) ||
            gap_between (prev, curr) > limit) {
            groups.push_back (std::move (current));
            current = { xs [i] };
        }
        else {
            current.push_back (xs [i]);
        }
    }

    groups.push_back (std::move (current));

    return groups;
}

std::vector< TextRuns > split_columns (
    const TextRuns& runs, const GroupingControl& control,
    const blocking_zones_t& zones) {
    if (runs.size () < 2) {
        return runs.empty ()
            ? std::vector< TextRuns >{ } : std::vector< TextRuns >{ runs };
    }

    const auto xs = sorted_by_x (runs);

    double font_size = median (
        xs | views::transform ([](auto& x) { return x->fontSize; })
           | to< std::vector< double > > ());

    if (0 == font_size) {
        font_size = defaultFontSize;
    }

    std::vector< double > gaps, widths;

    for (size_t i = 1; i < xs.size (); ++i) {
        const auto& prev = *xs [i - 1];
        const auto& curr = *xs [i];

        gaps.push_back (gap_between (prev, curr));
        widths.push_back (
            (estimate_char_width (prev) + estimate_char_width (curr)) / 2);
    }

    double char_width = median (widths);

    if (0 == char_width) {
        char_width = font_size * fallbackCharWidthFactor;
    }

    const double threshold = (std::max) (
        char_width * control.columnGapRatio,
        space_gap_threshold (gaps, font_size) * adaptiveGapFactor);

    if (2 == xs.size ()) {
        const double limit = (std::max) (
            threshold * strongGutterFactor, font_size * strongGutterFontFactor);

        if (!blocked_horizontally (*xs [0], *xs [1], zones) && gaps [0] <= limit) {
            return { xs };
        }
    }

    std::vector< TextRuns > groups;
    TextRuns current{ xs [0] };

    for (size_t i = 1; i < xs.size (); ++i) {
        if (gaps [i - 1] > threshold ||
            blocked_horizontally (*xs [i - 1], *xs [i], zones)) {
            groups.push_back (std::move (current));
            current = { xs [i] };
        }
        else {
            current.push_back (xs [i]);
        }
    }

    groups.push_back (std::move (current));

    return groups;
}

TextParagraphPtr make_paragraph (TextRuns runs, const GroupingControl& control) {
    const auto dir = resolve_inline_direction (runs, control);
    return std::make_shared< TextParagraph > (std::move (runs), dir);
}

TextParagraphs group_lines (
    const TextRuns& runs, const GroupingControl& control,
    const blocking_zones_t& zones, std::optional< double > page_width) {
    TextParagraphs paragraphs;

    const auto append = [&](std::vector< TextRuns > groups) {
        for (auto& group : groups) {
            paragraphs.push_back (make_paragraph (std::move (group), control));
        }
    };

    const auto lines = cluster_lines (runs, control);

    if (!control.enableColumnSeparation) {
        for (auto& line : lines) {
            append (split_adjacent (line, control, zones));
        }

        return paragraphs;
    }

    x_intervals_t intervals;

    if (control.enablePageColumnDetection && page_width && *page_width > 0) {
        const auto spans = runs
            | views::transform ([](auto& x) {
                  return x_range_t{ x->x, right_of (*x), x->height };
              })
            | to< x_ranges_t > ();

        intervals = column_intervals (
            *page_width, detect_gutters (spans, *page_width, control));

        if (intervals.size () < 2) {
            intervals.clear ();
        }
    }

    for (auto& line : lines) {
        if (intervals.empty () ||
            line_width_of (line) < *page_width * minPageColumnLineRatio) {
            append (split_columns (line, control, zones));
            continue;
        }

        std::map< int, TextRuns > columns;

        for (auto& x : line) {
            columns [assign_column (
                    x->x, right_of (*x), intervals, *page_width, control)]
                .push_back (x);
        }

        for (auto& [ ignore, column ] : columns) {
            for (auto& group : split_columns (column, control, zones)) {
                append (split_adjacent (group, control, zones));
            }
        }
    }

    return paragraphs;
}

} // namespace textflow
