// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <limits>

#include <textflow/GroupingControl.hh>
#include <textflow/TextBlock.hh>
#include <textflow/TextParagraph.hh>
#include <textflow/TextRun.hh>
#include <textflow/VerticalText.hh>

namespace textflow {
namespace {

struct column_state_t {
    TextRuns runs;
    double xmid, width, fontSize;

    explicit column_state_t (const TextRunPtr& x)
        : runs{ x }, xmid (center_x (*x)), width (x->width),
          fontSize (x->fontSize)
        { }

    double tolerance_for (const TextRun& x) const {
        return (std::max) ({
            minVerticalColumnTolerance, width, x.width,
            fontSize * verticalColumnFontFactor });
    }

    void push_back (const TextRunPtr& x) {
        runs.push_back (x);

        const double n = double (runs.size ());

        xmid += (center_x (*x) - xmid) / n;
        width += (x->width - width) / n;
        fontSize += (x->fontSize - fontSize) / n;
    }
};

TextParagraphPtr make_vertical_paragraph (TextRuns xs) {
    return std::make_shared< TextParagraph > (std::move (xs), direction_t::ttb);
}

} // anonymous

std::vector< TextRuns >
cluster_vertical_columns (const TextRuns& runs, const GroupingControl& control) {
    auto xs = runs;

    std::stable_sort (xs.begin (), xs.end (), [](auto& a, auto& b) {
        return center_x (*b) < center_x (*a);
    });

    std::vector< column_state_t > columns;

    for (auto& x : xs) {
        const double xmid = center_x (*x);

        column_state_t* target = 0;
        double target_distance = std::numeric_limits< double >::infinity ();

        for (auto& column : columns) {
            const double distance = std::fabs (xmid - column.xmid);

            if (distance > column.tolerance_for (*x) ||
                distance >= target_distance) {
                continue;
            }

            target_distance = distance;
            target = &column;
        }

        if (target) {
            target->push_back (x);
        }
        else {
            columns.emplace_back (x);
        }
    }

    const bool ltr = control.verticalColumnOrder == column_order_t::left_to_right;

    std::stable_sort (columns.begin (), columns.end (), [=](auto& a, auto& b) {
        return ltr ? a.xmid < b.xmid : b.xmid < a.xmid;
    });

    std::vector< TextRuns > result;

    for (auto& column : columns) {
        result.push_back (std::move (column.runs));
    }

    return result;
}

TextParagraphs split_vertical_column (
    const TextRuns& runs, const GroupingControl& control,
    const blocking_zones_t& zones) {
    if (runs.empty ()) {
        return { };
    }

    auto xs = runs;

    std::stable_sort (xs.begin (), xs.end (), [](auto& a, auto& b) {
        return center_y (*b) < center_y (*a);
    });

    TextParagraphs paragraphs;
    TextRuns current{ xs [0] };

    for (size_t i = 1; i < xs.size (); ++i) {
        const auto& prev = *xs [i - 1];
        const auto& curr = *xs [i];

        const double gap = prev.y - top_of (curr);
        const double limit =
            (std::max) (prev.height, curr.height) * control.verticalGapRatio;

        if (blocked_vertically (prev, curr, zones) ||
            !same_style (prev, curr, control) || gap > limit) {
            paragraphs.push_back (make_vertical_paragraph (std::move (current)));
            current = { xs [i] };
        }
        else {
            current.push_back (xs [i]);
        }
    }

    paragraphs.push_back (make_vertical_paragraph (std::move (current)));

    return paragraphs;
}

TextBlocks group_vertical (
    const TextRuns& runs, const GroupingControl& control,
    const blocking_zones_t& zones) {
    TextBlocks blocks;

    for (auto& column : cluster_vertical_columns (runs, control)) {
        auto paragraphs = split_vertical_column (column, control, zones);

        if (!paragraphs.empty ()) {
            blocks.push_back (std::make_shared< TextBlock > (
                std::move (paragraphs), writing_mode_t::vertical));
        }
    }

    return blocks;
}

} // namespace textflow
