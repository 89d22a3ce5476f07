// -*- mode: c++ -*-
// Copyright 2019-2020 Thinkoid, LLC.

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE bbox

#include <defs.hh>

#include <tuple>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <textflow/bbox.hh>

BOOST_AUTO_TEST_SUITE(box)

static const std::vector<
    std::tuple< textflow::bbox_t, textflow::bbox_t >
    >
normalize_dataset = {
    { {   1, 2, 0, 4 }, { 0, 2, 1, 4 } },
    { {   1, 4, 0, 2 }, { 0, 2, 1, 4 } },
    { {   0, 4, 1, 2 }, { 0, 2, 1, 4 } }
};

BOOST_DATA_TEST_CASE(
    normalize_, data::make (normalize_dataset), box, result) {

    using namespace textflow;

    {
        auto value = normalize (box);
        BOOST_TEST (value == result);
    }
}

BOOST_AUTO_TEST_CASE(make_bbox_) {
    using namespace textflow;

    {
        auto box = make_bbox (10, 100, 50, 12);
        BOOST_TEST (box == (bbox_t{ 10, 100, 60, 112 }));

        BOOST_TEST (50 == width_of (box));
        BOOST_TEST (12 == height_of (box));
        BOOST_TEST (35 == center_x_of (box));
    }
}

static const std::vector<
    std::tuple< textflow::bbox_t, textflow::bbox_t, double >
    >
horizontal_overlap_dataset = {
    { { 10,  5, 20, 10 }, { 30, 15, 40, 20 },  0 },
    { { 10,  5, 30, 10 }, { 30, 15, 40, 20 },  0 },
    { { 10,  5, 31, 10 }, { 30, 15, 40, 20 },  1 },
    { { 10,  5, 35, 10 }, { 30, 15, 40, 20 },  5 },
    { { 10,  5, 52, 10 }, { 30, 15, 40, 20 }, 10 },
    { { 32,  5, 52, 10 }, { 30, 15, 40, 20 },  8 },
    { { 40,  5, 52, 10 }, { 30, 15, 40, 20 },  0 }
};

BOOST_DATA_TEST_CASE(
    horizontal_overlap_, data::make (horizontal_overlap_dataset),
    lhs, rhs, result) {

    using namespace textflow;

    {
        auto value = horizontal_overlap (lhs, rhs);
        BOOST_TEST (value == result);
    }
}

static const std::vector<
    std::tuple< textflow::bbox_t, textflow::bbox_t, bool >
    >
overlapping_dataset = {
    { { 10,  5, 20, 10 }, { 15,  8, 40, 20 },  true },
    { { 10,  5, 20, 10 }, { 20,  8, 40, 20 }, false },
    { { 10,  5, 20, 10 }, { 15, 10, 40, 20 }, false },
    { { 10,  5, 20, 10 }, { 12,  6, 18,  9 },  true }
};

BOOST_DATA_TEST_CASE(
    overlapping_, data::make (overlapping_dataset), lhs, rhs, result) {

    using namespace textflow;

    {
        BOOST_TEST (result == overlapping (lhs, rhs));
        BOOST_TEST (result == overlapping (rhs, lhs));
    }
}

static const std::vector<
    std::tuple< textflow::bbox_t, textflow::bbox_t, bool >
    >
contains_dataset = {
    { { 0, 0, 100, 100 }, { 10, 10, 20,  20 },  true },
    { { 0, 0, 100, 100 }, {  0,  0, 100, 100 }, true },
    { { 0, 0, 100, 100 }, { 90, 10, 110, 20 }, false },
    { { 10, 10, 20, 20 }, {  0,  0, 100, 100 }, false }
};

BOOST_DATA_TEST_CASE(
    contains_, data::make (contains_dataset), outer, inner, result) {

    using namespace textflow;

    {
        BOOST_TEST (result == contains (outer, inner));
    }
}

BOOST_AUTO_TEST_CASE(coalesce_) {
    using namespace textflow;

    {
        const std::vector< bbox_t > xs{
            { 10, 20, 30, 40 }, { 5, 25, 15, 50 }, { 12, 0, 60, 10 }
        };

        BOOST_TEST (coalesce (xs) == (bbox_t{ 5, 0, 60, 50 }));
    }

    {
        const std::vector< bbox_t > xs{ { 10, 20, 30, 40 } };
        BOOST_TEST (coalesce (xs) == xs [0]);
    }
}

BOOST_AUTO_TEST_SUITE_END()
