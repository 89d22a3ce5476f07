// -*- mode: c++ -*-
// Copyright 2020 Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE lines

#include <defs.hh>

#include <memory>
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <textflow/GroupingControl.hh>
#include <textflow/TextColumn.hh>
#include <textflow/TextLine.hh>
#include <textflow/TextParagraph.hh>
#include <textflow/TextRun.hh>

static textflow::TextRunPtr
make_run (const std::string& text, double x, double y, double width = 50,
          double height = 12) {
    auto run = std::make_shared< textflow::TextRun > ();

    run->text = text;
    run->x = x;
    run->y = y;
    run->width = width;
    run->height = height;
    run->fontName = "Helvetica";
    run->fontSize = 12;

    return run;
}

static std::string text_of (const textflow::TextRuns& xs) {
    std::string s;

    for (auto& x : xs) {
        s += x->text;
    }

    return s;
}

BOOST_AUTO_TEST_SUITE(lines)

BOOST_AUTO_TEST_CASE(run_metrics, * utf::tolerance (1e-9)) {
    using namespace textflow;

    {
        auto run = make_run ("Test", 0, 100);
        BOOST_TEST (baseline_of (*run) == 102.4);

        run->descender = -250.;
        BOOST_TEST (baseline_of (*run) == 103.);
    }

    {
        // width / length, floored at .3 of the font size
        BOOST_TEST (estimate_char_width (*make_run ("Hello", 0, 0, 50)) == 10.);
        BOOST_TEST (estimate_char_width (*make_run ("Hello", 0, 0, 5)) == 3.6);
        BOOST_TEST (estimate_char_width (*make_run ("Hello", 0, 0, 0)) == 6.);
    }

    {
        auto prev = make_run ("Hello ", 0, 0, 60);
        auto next = make_run ("World", 60, 0, 50);

        BOOST_TEST (expected_gap (*prev, *next) == 10.);

        prev->wordSpacing = 2;
        prev->charSpacing = 1;
        prev->horizontalScaling = 50;

        BOOST_TEST (expected_gap (*prev, *next) == 6.5);
    }
}

BOOST_AUTO_TEST_CASE(style) {
    using namespace textflow;

    GroupingControl control;

    {
        auto a = make_run ("a", 0, 0), b = make_run ("b", 0, 0);

        a->fontName = "ABCDEF+Helvetica";
        b->fontName = "GHIJKL+Helvetica";
        BOOST_TEST (same_style (*a, *b, control));

        b->fontSize = 12.5;
        BOOST_TEST (same_style (*a, *b, control));

        b->fontSize = 24;
        BOOST_TEST (!same_style (*a, *b, control));
    }

    {
        BOOST_TEST (normalize_font_name ("ABCDEF+Helvetica") == "Helvetica");
        BOOST_TEST (normalize_font_name ("+Helvetica") == "+Helvetica");
        BOOST_TEST (normalize_font_name ("Times") == "Times");
    }

    {
        auto a = make_run ("a", 0, 0), b = make_run ("b", 0, 0);

        a->fillColor.components = { 0. };
        b->fillColor.components = { .02 };

        BOOST_TEST (same_color (*a, *b, color_matching_t::loose));
        BOOST_TEST (!same_color (*a, *b, color_matching_t::strict));

        control.colorMatching = color_matching_t::strict;
        BOOST_TEST (!same_style (*a, *b, control));

        b->fillColor.space = "DeviceRGB";
        b->fillColor.components = { 0., 0., 0. };

        BOOST_TEST (!same_color (*a, *b, color_matching_t::loose));
    }
}

BOOST_AUTO_TEST_CASE(cluster_lines_) {
    using namespace textflow;

    GroupingControl control;

    {
        const TextRuns xs{
            make_run ("Hello", 0, 100), make_run ("World", 60, 101),
            make_run ("Next", 0, 80)
        };

        const auto lines = cluster_lines (xs, control);

        BOOST_TEST_REQUIRE (lines.size () == 2U);
        BOOST_TEST (lines [0].size () == 2U);
        BOOST_TEST (lines [1].size () == 1U);
        BOOST_TEST (text_of (lines [1]) == "Next");
    }

    {
        //
        // Same baseline, but the boxes do not overlap vertically:
        //
        auto a = make_run ("low", 0, 100, 30, 2);
        auto b = make_run ("high", 40, 102.4, 30, 10);

        b->descender = 0.;

        BOOST_TEST (cluster_lines ({ a, b }, control).size () == 2U);
    }

    {
        BOOST_TEST (cluster_lines ({ }, control).empty ());
    }
}

BOOST_AUTO_TEST_CASE(space_gap_threshold_, * utf::tolerance (1e-9)) {
    using namespace textflow;

    {
        // too few samples
        BOOST_TEST (space_gap_threshold ({ 10, 10 }, 12) == 3.96);
        BOOST_TEST (space_gap_threshold ({ 0, -1, 2, 2 }, 12) == 3.96);
    }

    {
        BOOST_TEST (space_gap_threshold ({ 2, 2, 2, 2 }, 12) == 3.96);
        BOOST_TEST (space_gap_threshold ({ 4, 4, 4, 4 }, 12) == 6.8);
    }

    {
        // skewed
        BOOST_TEST (space_gap_threshold ({ 1, 1, 1, 10 }, 12) == 2.125);
    }
}

BOOST_AUTO_TEST_CASE(split_adjacent_) {
    using namespace textflow;

    GroupingControl control;

    {
        const TextRuns xs{ make_run ("World", 60, 100), make_run ("Hello", 0, 100) };

        const auto groups = split_adjacent (xs, control, { });

        BOOST_TEST_REQUIRE (groups.size () == 1U);
        BOOST_TEST (text_of (groups [0]) == "HelloWorld");
    }

    {
        const TextRuns xs{ make_run ("Hello", 0, 100), make_run ("World", 200, 100) };
        BOOST_TEST (split_adjacent (xs, control, { }).size () == 2U);
    }

    {
        const TextRuns xs{ make_run ("Left", 0, 100, 40), make_run ("Right", 48, 100, 40) };

        BOOST_TEST (split_adjacent (xs, control, { }).size () == 1U);

        const blocking_zones_t zones{ make_bbox (41, 90, 5, 30) };
        BOOST_TEST (split_adjacent (xs, control, zones).size () == 2U);
    }
}

BOOST_AUTO_TEST_CASE(split_columns_) {
    using namespace textflow;

    GroupingControl control;

    {
        const TextRuns xs{
            make_run ("word", 0, 100, 40), make_run ("word", 44, 100, 40),
            make_run ("word", 88, 100, 40), make_run ("word", 132, 100, 40)
        };

        BOOST_TEST (split_columns (xs, control, { }).size () == 1U);
    }

    {
        //
        // Table row:
        //
        const TextRuns xs{
            make_run ("Name", 0, 100, 40), make_run ("Age", 200, 100, 30),
            make_run ("City", 400, 100, 40)
        };

        const auto groups = split_columns (xs, control, { });

        BOOST_TEST_REQUIRE (groups.size () == 3U);
        BOOST_TEST (text_of (groups [1]) == "Age");
    }

    {
        //
        // Two runs split only across a wide gutter:
        //
        const TextRuns xs{ make_run ("Hello", 0, 100), make_run ("World", 110, 100) };
        BOOST_TEST (split_columns (xs, control, { }).size () == 1U);

        const TextRuns ys{ make_run ("Hello", 0, 100), make_run ("World", 150, 100) };
        BOOST_TEST (split_columns (ys, control, { }).size () == 2U);
    }
}

BOOST_AUTO_TEST_CASE(gutters, * utf::tolerance (1e-9)) {
    using namespace textflow;

    GroupingControl control;

    x_ranges_t xs;

    for (int i = 0; i < 10; ++i) {
        xs.push_back ({  20, 230, 12 });
        xs.push_back ({ 270, 480, 12 });
    }

    {
        const auto gutters = detect_gutters (xs, 500, control);

        BOOST_TEST_REQUIRE (gutters.size () == 1U);
        BOOST_TEST (gutters [0].x0 == 230.);
        BOOST_TEST (gutters [0].x1 == 270.);
        BOOST_TEST (gutters [0].xmid == 250.);

        const auto intervals = column_intervals (500, gutters);

        BOOST_TEST_REQUIRE (intervals.size () == 2U);
        BOOST_TEST (intervals [0].x0 ==   0.);
        BOOST_TEST (intervals [0].x1 == 230.);
        BOOST_TEST (intervals [1].x0 == 270.);
        BOOST_TEST (intervals [1].x1 == 500.);

        BOOST_TEST (assign_column ( 20, 230, intervals, 500, control) ==  0);
        BOOST_TEST (assign_column (270, 480, intervals, 500, control) ==  1);
        BOOST_TEST (assign_column (180, 290, intervals, 500, control) ==  0);
        BOOST_TEST (assign_column (  0, 500, intervals, 500, control) == -1);
    }

    {
        // too few ranges
        const x_ranges_t ys (xs.begin (), xs.begin () + 6);
        BOOST_TEST (detect_gutters (ys, 500, control).empty ());
    }

    {
        control.maxPageColumns = 1;
        BOOST_TEST (detect_gutters (xs, 500, control).empty ());
    }

    {
        const auto intervals = column_intervals (500, { });

        BOOST_TEST_REQUIRE (intervals.size () == 1U);
        BOOST_TEST (intervals [0].x1 == 500.);
    }
}

BOOST_AUTO_TEST_CASE(group_lines_) {
    using namespace textflow;

    GroupingControl control;

    {
        const TextRuns xs{
            make_run ("Name", 0, 100, 40), make_run ("Age", 200, 100, 30),
            make_run ("Next", 0, 80, 40)
        };

        const auto paragraphs = group_lines (xs, control, { });

        BOOST_TEST_REQUIRE (paragraphs.size () == 3U);
        BOOST_TEST (paragraphs [0]->text () == "Name");
        BOOST_TEST (paragraphs [1]->text () == "Age");
        BOOST_TEST (paragraphs [2]->text () == "Next");
    }

    {
        control.enableColumnSeparation = false;

        const TextRuns xs{
            make_run ("Name", 0, 100, 40), make_run ("Age", 50, 100, 30)
        };

        const auto paragraphs = group_lines (xs, control, { });

        BOOST_TEST_REQUIRE (paragraphs.size () == 1U);
        BOOST_TEST (paragraphs [0]->text () == "NameAge");
    }
}

BOOST_AUTO_TEST_SUITE_END()
