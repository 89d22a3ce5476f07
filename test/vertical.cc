// -*- mode: c++ -*-
// Copyright 2020 Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE vertical

#include <defs.hh>

#include <memory>
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <textflow/BlockingZone.hh>
#include <textflow/GroupingControl.hh>
#include <textflow/TextBlock.hh>
#include <textflow/TextParagraph.hh>
#include <textflow/TextRun.hh>
#include <textflow/VerticalText.hh>

static textflow::TextRunPtr
make_glyph (const std::string& text, double x, double y) {
    auto run = std::make_shared< textflow::TextRun > ();

    run->text = text;
    run->x = x;
    run->y = y;
    run->width = 6;
    run->height = 12;
    run->fontName = "MS-Mincho";
    run->fontSize = 12;

    return run;
}

//
// One glyph per run, top to bottom from `y':
//
static textflow::TextRuns
make_column (const std::string& text, double x, double y) {
    textflow::TextRuns xs;

    for (size_t i = 0; i < text.size (); i += 3, y -= 14) {
        xs.push_back (make_glyph (text.substr (i, 3), x, y));
    }

    return xs;
}

BOOST_AUTO_TEST_SUITE(vertical)

BOOST_AUTO_TEST_CASE(cluster_vertical_columns_) {
    using namespace textflow;

    auto xs = make_column ("一二三", 60, 200);

    for (auto& x : make_column ("四五六", 100, 200)) {
        xs.push_back (x);
    }

    {
        GroupingControl control;

        const auto columns = cluster_vertical_columns (xs, control);

        BOOST_TEST_REQUIRE (columns.size () == 2U);
        BOOST_TEST (columns [0].size () == 3U);
        BOOST_TEST (columns [0][0]->x == 100.);
        BOOST_TEST (columns [1][0]->x == 60.);
    }

    {
        GroupingControl control;
        control.verticalColumnOrder = column_order_t::left_to_right;

        const auto columns = cluster_vertical_columns (xs, control);

        BOOST_TEST_REQUIRE (columns.size () == 2U);
        BOOST_TEST (columns [0][0]->x == 60.);
    }

    {
        //
        // Glyphs a few points off the column axis stay in the column:
        //
        TextRuns ys{
            make_glyph ("一", 100, 200), make_glyph ("二", 103, 186),
            make_glyph ("三", 98, 172)
        };

        GroupingControl control;
        BOOST_TEST (cluster_vertical_columns (ys, control).size () == 1U);
    }
}

BOOST_AUTO_TEST_CASE(split_vertical_column_) {
    using namespace textflow;

    GroupingControl control;

    {
        const auto paragraphs = split_vertical_column (
            make_column ("一二三四", 100, 200), control, { });

        BOOST_TEST_REQUIRE (paragraphs.size () == 1U);
        BOOST_TEST (paragraphs [0]->text () == "一二三四");
        BOOST_TEST ((paragraphs [0]->dir == direction_t::ttb));
    }

    {
        // gap
        auto xs = make_column ("一二三四", 100, 200);
        xs.push_back (make_glyph ("五", 100, 100));

        const auto paragraphs = split_vertical_column (xs, control, { });

        BOOST_TEST_REQUIRE (paragraphs.size () == 2U);
        BOOST_TEST (paragraphs [1]->text () == "五");
    }

    {
        // style change
        auto xs = make_column ("一二三四", 100, 200);
        xs [2]->fontName = "MS-Gothic";

        BOOST_TEST (split_vertical_column (xs, control, { }).size () == 3U);
    }

    {
        // a rule between the first two glyphs
        const blocking_zones_t zones{ make_bbox (90, 198.5, 30, 1) };

        const auto paragraphs = split_vertical_column (
            make_column ("一二三四", 100, 200), control, zones);

        BOOST_TEST_REQUIRE (paragraphs.size () == 2U);
        BOOST_TEST (paragraphs [0]->text () == "一");
    }

    {
        // a frame around the column
        const blocking_zones_t zones{ make_bbox (90, 100, 30, 150) };

        BOOST_TEST (
            split_vertical_column (
                make_column ("一二三四", 100, 200), control, zones).size () == 1U);
    }
}

BOOST_AUTO_TEST_CASE(group_vertical_) {
    using namespace textflow;

    GroupingControl control;

    auto xs = make_column ("一二三", 60, 200);

    for (auto& x : make_column ("四五六", 100, 200)) {
        xs.push_back (x);
    }

    {
        const auto blocks = group_vertical (xs, control, { });

        BOOST_TEST_REQUIRE (blocks.size () == 2U);
        BOOST_TEST (blocks [0]->paragraphs [0]->text () == "四五六");
        BOOST_TEST (blocks [1]->paragraphs [0]->text () == "一二三");

        BOOST_TEST_REQUIRE (blocks [0]->layout.has_value ());
        BOOST_TEST ((blocks [0]->layout->dir == direction_t::ttb));
        BOOST_TEST ((blocks [0]->layout->alignment == alignment_t::unknown));
    }

    {
        BOOST_TEST (group_vertical ({ }, control, { }).empty ());
    }
}

BOOST_AUTO_TEST_SUITE_END()
