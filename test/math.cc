// -*- mode: c++ -*-
// Copyright 2020 Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE math

#include <defs.hh>

#include <tuple>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <utils/math.hh>

BOOST_AUTO_TEST_SUITE(math)

BOOST_AUTO_TEST_CASE(quantile_, * utf::tolerance (1e-9)) {
    using namespace textflow;

    {
        const std::vector< double > xs{ 4, 1, 3, 2 };

        BOOST_TEST (quantile (xs,   0) == 1.);
        BOOST_TEST (quantile (xs,   1) == 4.);
        BOOST_TEST (quantile (xs, .25) == 1.75);
        BOOST_TEST (quantile (xs,  .5) == 2.5);
        BOOST_TEST (quantile (xs, .75) == 3.25);

        // clamped
        BOOST_TEST (quantile (xs,  2) == 4.);
        BOOST_TEST (quantile (xs, -1) == 1.);
    }

    {
        BOOST_TEST (quantile ({ }, .5) == 0.);
        BOOST_TEST (quantile ({ 7 }, .3) == 7.);
    }
}

BOOST_AUTO_TEST_CASE(median_, * utf::tolerance (1e-9)) {
    using namespace textflow;

    {
        BOOST_TEST (median ({ }) == 0.);
        BOOST_TEST (median ({ 3, 1, 2 }) == 2.);
        BOOST_TEST (median ({ 4, 1, 3, 2 }) == 2.5);
    }
}

BOOST_AUTO_TEST_CASE(interquartile_range_, * utf::tolerance (1e-9)) {
    using namespace textflow;

    {
        BOOST_TEST (interquartile_range ({ 5 }) == 0.);
        BOOST_TEST (interquartile_range ({ 130, 150, 170 }) == 20.);
        BOOST_TEST (interquartile_range ({ 200, 200, 200 }) == 0.);
    }
}

static const std::vector< std::tuple< double, double, double, double, double > >
overlap_dataset = {
    {  0, 10,  5, 15, 5 },
    {  0, 10, 10, 15, 0 },
    {  0, 10, 12, 15, 0 },
    { 10,  0,  2,  4, 2 },
    {  0, 10, 15,  5, 5 }
};

BOOST_DATA_TEST_CASE(
    overlap_1d_, data::make (overlap_dataset), a0, a1, b0, b1, result) {

    using namespace textflow;

    {
        BOOST_TEST (result == overlap_1d (a0, a1, b0, b1));
    }
}

BOOST_AUTO_TEST_CASE(clamp_) {
    using namespace textflow;

    {
        BOOST_TEST (clamp (5., 0., 1.) == 1.);
        BOOST_TEST (clamp (-5., 0., 1.) == 0.);
        BOOST_TEST (clamp (.5, 0., 1.) == .5);
    }
}

BOOST_AUTO_TEST_SUITE_END()
