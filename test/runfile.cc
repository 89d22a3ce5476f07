// -*- mode: c++ -*-
// Copyright 2020 Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE runfile

#include <defs.hh>

#include <sstream>
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <textflow/Error.hh>
#include <textflow/RunFile.hh>
#include <textflow/TextBlock.hh>
#include <textflow/TextPage.hh>
#include <textflow/TextRun.hh>

static std::vector< std::string > messages;
static std::vector< long > positions;

static void
collect (void*, textflow::ErrorCategory, long pos, const char* msg) {
    messages.push_back (msg);
    positions.push_back (pos);
}

struct error_fixture_t {
    error_fixture_t () {
        messages.clear ();
        positions.clear ();
        textflow::setErrorCallback (collect, 0);
    }

    ~error_fixture_t () {
        textflow::setErrorCallback (0, 0);
    }
};

BOOST_FIXTURE_TEST_SUITE(runfile, error_fixture_t)

BOOST_AUTO_TEST_CASE(page_records, * utf::tolerance (1e-9)) {
    using namespace textflow;

    std::istringstream ss (
        "# two pages\n"
        "page\t612\t792\n"
        "zone\t0\t95\t200\t10\n"
        "run\t10\t100\t50\t12\t12\tHelvetica\tHello\n"
        "run\t70\t100\t50\t12\t12\tHelvetica\tWorld\t-250\t1\t2\t90\r\n"
        "\n"
        "page\t500\t700\n"
        "zone\t10\t20\t-5\t-5\n"
        "run\t0\t0\t10\t12\t12\tTimes\tA b\t\t\t3\n");

    const auto pages = read_run_file (ss, "test");

    BOOST_TEST (messages.empty ());
    BOOST_TEST_REQUIRE (pages.size () == 2U);

    {
        const auto& page = pages [0];

        BOOST_TEST_REQUIRE (page.context.pageWidth.has_value ());
        BOOST_TEST (*page.context.pageWidth == 612.);
        BOOST_TEST (*page.context.pageHeight == 792.);

        BOOST_TEST_REQUIRE (page.context.blockingZones.size () == 1U);
        BOOST_TEST (page.context.blockingZones [0] == make_bbox (0, 95, 200, 10));

        BOOST_TEST_REQUIRE (page.runs.size () == 2U);

        const auto& hello = *page.runs [0];

        BOOST_TEST (hello.text == "Hello");
        BOOST_TEST (hello.fontName == "Helvetica");
        BOOST_TEST (hello.x == 10.);
        BOOST_TEST (hello.fontSize == 12.);
        BOOST_TEST (!hello.descender);
        BOOST_TEST (hello.horizontalScaling == 100.);

        const auto& world = *page.runs [1];

        BOOST_TEST (world.text == "World");
        BOOST_TEST_REQUIRE (world.descender.has_value ());
        BOOST_TEST (*world.descender == -250.);
        BOOST_TEST (world.charSpacing == 1.);
        BOOST_TEST (world.wordSpacing == 2.);
        BOOST_TEST (world.horizontalScaling == 90.);
    }

    {
        const auto& page = pages [1];

        BOOST_TEST_REQUIRE (page.context.blockingZones.size () == 1U);
        BOOST_TEST (page.context.blockingZones [0] == (bbox_t{ 5, 15, 10, 20 }));

        BOOST_TEST_REQUIRE (page.runs.size () == 1U);

        const auto& run = *page.runs [0];

        BOOST_TEST (run.text == "A b");
        BOOST_TEST (!run.descender);
        BOOST_TEST (run.charSpacing == 0.);
        BOOST_TEST (run.wordSpacing == 3.);
    }
}

BOOST_AUTO_TEST_CASE(implicit_page) {
    using namespace textflow;

    std::istringstream ss ("run\t0\t0\t10\t12\t12\tTimes\tA\n");

    const auto pages = read_run_file (ss, "test");

    BOOST_TEST_REQUIRE (pages.size () == 1U);
    BOOST_TEST (!pages [0].context.pageWidth);
    BOOST_TEST (pages [0].runs.size () == 1U);
}

BOOST_AUTO_TEST_CASE(malformed) {
    using namespace textflow;

    std::istringstream ss (
        "page\t612\n"
        "page\t-1\t792\n"
        "zone\t0\t0\tten\t10\n"
        "run\t0\t0\t10\t12\tTimes\tA\n"
        "run\t0\t0\t10\t12\t12\tTimes\tA\tdeep\n"
        "line\t0\t0\n"
        "run\t0\t0\t10\t12\t12\tTimes\tok\n");

    const auto pages = read_run_file (ss, "test");

    BOOST_TEST_REQUIRE (messages.size () == 6U);
    BOOST_TEST (messages [0] == "Bad page record in 'test'");
    BOOST_TEST (messages [5] == "Unknown record 'line' in 'test'");

    const std::vector< long > lines{ 1, 2, 3, 4, 5, 6 };
    BOOST_TEST (positions == lines, boost::test_tools::per_element ());

    //
    // Each bad page record still opens a page:
    //
    BOOST_TEST_REQUIRE (pages.size () == 2U);
    BOOST_TEST (pages [0].runs.empty ());
    BOOST_TEST (!pages [1].context.pageWidth);
    BOOST_TEST_REQUIRE (pages [1].runs.size () == 1U);
    BOOST_TEST (pages [1].runs [0]->text == "ok");
}

BOOST_AUTO_TEST_CASE(bad_page_between_pages) {
    using namespace textflow;

    std::istringstream ss (
        "page\t612\t792\n"
        "run\t10\t100\t50\t12\t12\tHelvetica\tFirst\n"
        "page\t612\tx\n"
        "zone\t0\t0\t10\t10\n"
        "run\t10\t100\t50\t12\t12\tHelvetica\tSecond\n"
        "page\t500\t700\n"
        "run\t10\t100\t50\t12\t12\tHelvetica\tThird\n");

    const auto pages = read_run_file (ss, "test");

    BOOST_TEST_REQUIRE (messages.size () == 1U);
    BOOST_TEST (messages [0] == "Bad page record in 'test'");
    BOOST_TEST (positions [0] == 3);

    BOOST_TEST_REQUIRE (pages.size () == 3U);

    BOOST_TEST_REQUIRE (pages [0].runs.size () == 1U);
    BOOST_TEST (pages [0].runs [0]->text == "First");
    BOOST_TEST (pages [0].context.blockingZones.empty ());

    BOOST_TEST (!pages [1].context.pageWidth);
    BOOST_TEST (!pages [1].context.pageHeight);
    BOOST_TEST (pages [1].context.blockingZones.size () == 1U);
    BOOST_TEST_REQUIRE (pages [1].runs.size () == 1U);
    BOOST_TEST (pages [1].runs [0]->text == "Second");

    BOOST_TEST_REQUIRE (pages [2].context.pageWidth.has_value ());
    BOOST_TEST (*pages [2].context.pageWidth == 500.);
    BOOST_TEST_REQUIRE (pages [2].runs.size () == 1U);
    BOOST_TEST (pages [2].runs [0]->text == "Third");
}

BOOST_AUTO_TEST_CASE(grouping) {
    using namespace textflow;

    std::istringstream ss (
        "page\t612\t792\n"
        "run\t10\t120\t80\t12\t12\tHelvetica\tLine1\n"
        "run\t10\t80\t80\t12\t12\tHelvetica\tLine2\n"
        "zone\t0\t95\t200\t10\n");

    const auto pages = read_run_file (ss, "test");

    BOOST_TEST_REQUIRE (pages.size () == 1U);

    GroupingControl control;
    control.verticalGapRatio = 3;

    const auto blocks = TextPage (control).group (pages [0].runs, pages [0].context);

    BOOST_TEST (blocks.size () == 2U);
}

BOOST_AUTO_TEST_SUITE_END()
