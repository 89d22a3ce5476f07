// -*- mode: c++ -*-
// Copyright 2020 Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE string

#include <defs.hh>

#include <string>
#include <tuple>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <utils/string.hh>

BOOST_AUTO_TEST_SUITE(string)

static const std::vector< std::tuple< std::string, size_t > >
length_dataset = {
    { "",                0 },
    { "hello",           5 },
    { "שלום", 4 },
    { "あい",    2 },
    { "\U0001F600 x",    3 },
    { "\xff\xfe",        2 },
    { "\xc0\xaf",        2 },
    { "\xe0\x80\xaf",    3 },
    { "\xed\xa0\x80",    3 },
    { "\xed\x9f\xbf",    1 },
    { "\xf4\x90\x80\x80", 4 },
    { "\xf4\x8f\xbf\xbf", 1 }
};

BOOST_DATA_TEST_CASE(
    length_of_, data::make (length_dataset), s, result) {

    using namespace textflow;

    {
        BOOST_TEST (result == length_of (s));
        BOOST_TEST (result == to_utf32 (s).size ());
    }
}

BOOST_AUTO_TEST_CASE(utf8_) {
    using namespace textflow;

    {
        const std::string s = "café 漢字 \U0001F600";
        BOOST_TEST (to_utf8 (to_utf32 (s)) == s);
    }

    {
        // truncated sequence
        const auto xs = to_utf32 ("a\xe6\xbc");
        BOOST_TEST (xs.size () == 3U);
        BOOST_TEST ((xs [1] == 0xFFFD));
    }

    {
        // overlong slash and an encoded surrogate
        const auto xs = to_utf32 ("\xc0\xaf/\xed\xa0\x80");
        BOOST_TEST_REQUIRE (xs.size () == 6U);
        BOOST_TEST ((xs [0] == 0xFFFD));
        BOOST_TEST ((xs [2] == U'/'));
        BOOST_TEST ((xs [3] == 0xFFFD));
    }
}

static const std::vector< std::tuple< std::string, std::string, std::string > >
space_dataset = {
    { "",                      "",                "" },
    { "  a  b ",               "a b",             "ab" },
    { "\tline one\n line two", "line one line two", "lineonelinetwo" },
    { "a\u00a0 \u3000b",       "a b",             "ab" }
};

BOOST_DATA_TEST_CASE(
    space_, data::make (space_dataset), s, normalized, stripped) {

    using namespace textflow;

    {
        BOOST_TEST (normalize_space (s) == normalized);
        BOOST_TEST (strip_space (s) == stripped);
    }
}

BOOST_AUTO_TEST_CASE(head_tail_) {
    using namespace textflow;

    {
        BOOST_TEST (head_of ("abcdef", 3) == "abc");
        BOOST_TEST (tail_of ("abcdef", 3) == "def");

        BOOST_TEST (head_of ("abc", 10) == "abc");
        BOOST_TEST (tail_of ("abc", 10) == "abc");
    }

    {
        const std::string s = "あいう";

        BOOST_TEST (head_of (s, 1) == "あ");
        BOOST_TEST (tail_of (s, 2) == "いう");
    }

    {
        // malformed bytes come back unchanged
        const std::string s = "\xff" "ab\xc0\xaf";

        BOOST_TEST (head_of (s, 2) == "\xff" "a");
        BOOST_TEST (tail_of (s, 2) == "\xc0\xaf");
        BOOST_TEST (head_of (s, 5) == s);
    }
}

BOOST_AUTO_TEST_CASE(join_) {
    using namespace textflow;

    {
        const std::vector< std::string > xs{ "a", "b", "c" };

        BOOST_TEST (join (xs, "\n") == "a\nb\nc");
        BOOST_TEST (join (std::vector< std::string >{ }, "\n") == "");
    }

    {
        BOOST_TEST (ends_with ("word ", " "));
        BOOST_TEST (!ends_with ("word", " "));
        BOOST_TEST (!ends_with ("", " "));
    }
}

BOOST_AUTO_TEST_SUITE_END()
