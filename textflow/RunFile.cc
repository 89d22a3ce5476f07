// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <cmath>
#include <cstdlib>
#include <istream>
#include <optional>

#include <utils/string.hh>

#include <textflow/Error.hh>
#include <textflow/RunFile.hh>
#include <textflow/TextRun.hh>

namespace textflow {
namespace {

std::vector< std::string > fields_of (const std::string& s) {
    std::vector< std::string > xs;

    for (size_t first = 0;;) {
        const auto last = s.find ('\t', first);

        xs.push_back (s.substr (first, last - first));

        if (last == std::string::npos) {
            break;
        }

        first = last + 1;
    }

    return xs;
}

std::optional< double > number_from (const std::string& s) {
    if (s.empty ()) {
        return { };
    }

    char* end = 0;
    const double x = std::strtod (s.c_str (), &end);

    if (*end || !std::isfinite (x)) {
        return { };
    }

    return x;
}

//
// Numbers in fields [first, last), none missing:
//
std::optional< std::vector< double > >
numbers_from (const std::vector< std::string >& xs, size_t first, size_t last) {
    std::vector< double > result;

    for (size_t i = first; i < last; ++i) {
        const auto x = number_from (xs [i]);

        if (!x) {
            return { };
        }

        result.push_back (*x);
    }

    return result;
}

struct reader_t {
    const std::string& name;
    std::vector< run_page_t > pages;

    run_page_t& current () {
        if (pages.empty ()) {
            pages.emplace_back ();
        }

        return pages.back ();
    }

    void page (const std::vector< std::string >&, int);
    void zone (const std::vector< std::string >&, int);
    void run (const std::vector< std::string >&, int);
};

void reader_t::page (const std::vector< std::string >& xs, int line) {
    const auto values = 3 == xs.size () ? numbers_from (xs, 1, 3) : std::nullopt;

    //
    // A bad record still starts a page, of unknown size:
    //
    pages.emplace_back ();

    if (!values || (*values) [0] <= 0 || (*values) [1] <= 0) {
        error (errSyntaxError, line, "Bad page record in '{}'", name);
        return;
    }

    pages.back ().context.pageWidth = (*values) [0];
    pages.back ().context.pageHeight = (*values) [1];
}

void reader_t::zone (const std::vector< std::string >& xs, int line) {
    const auto values = 5 == xs.size () ? numbers_from (xs, 1, 5) : std::nullopt;

    if (!values) {
        error (errSyntaxError, line, "Bad zone record in '{}'", name);
        return;
    }

    const auto& v = *values;

    current ().context.blockingZones.push_back (
        normalize (make_bbox (v [0], v [1], v [2], v [3])));
}

void reader_t::run (const std::vector< std::string >& xs, int line) {
    const auto values = 8 <= xs.size () && xs.size () <= 12
        ? numbers_from (xs, 1, 6) : std::nullopt;

    if (!values) {
        error (errSyntaxError, line, "Bad run record in '{}'", name);
        return;
    }

    const auto& v = *values;

    auto ptr = std::make_shared< TextRun > ();

    ptr->x = v [0];
    ptr->y = v [1];
    ptr->width = v [2];
    ptr->height = v [3];
    ptr->fontSize = v [4];

    ptr->fontName = xs [6];
    ptr->text = xs [7];

    //
    // Optional trailing fields, an empty one keeps the default:
    //
    double* const trailing [] = {
        0, &ptr->charSpacing, &ptr->wordSpacing, &ptr->horizontalScaling
    };

    for (size_t i = 8; i < xs.size (); ++i) {
        if (xs [i].empty ()) {
            continue;
        }

        const auto x = number_from (xs [i]);

        if (!x) {
            error (errSyntaxError, line, "Bad run record in '{}'", name);
            return;
        }

        if (8 == i) {
            ptr->descender = *x;
        }
        else {
            *trailing [i - 8] = *x;
        }
    }

    current ().runs.push_back (std::move (ptr));
}

} // anonymous

std::vector< run_page_t >
read_run_file (std::istream& stream, const std::string& name) {
    reader_t reader{ name, { } };

    int line = 1;

    for (std::string buf; std::getline (stream, buf); ++line) {
        if (ends_with (buf, "\r")) {
            buf.pop_back ();
        }

        if (buf.empty () || buf [0] == '#') {
            continue;
        }

        const auto xs = fields_of (buf);

        if (xs [0] == "page") {
            reader.page (xs, line);
        }
        else if (xs [0] == "zone") {
            reader.zone (xs, line);
        }
        else if (xs [0] == "run") {
            reader.run (xs, line);
        }
        else {
            error (
                errSyntaxWarning, line, "Unknown record '{}' in '{}'", xs [0],
                name);
        }
    }

    if (stream.bad ()) {
        error (errIO, -1, "Couldn't read '{}'", name);
    }

    return reader.pages;
}

} // namespace textflow
