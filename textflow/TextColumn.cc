// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cmath>

#include <utils/math.hh>

#include <textflow/GroupingControl.hh>
#include <textflow/TextColumn.hh>

#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/max_element.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>
using namespace ranges;

namespace textflow {
namespace {

struct segment_t {
    long first, last;
    double occupancy;
};

//
// Normalized occupancy of `bins' equal slices of the page width:
//
std::vector< double >
make_histogram (const x_ranges_t& xs, double page_width, long bins) {
    const double bin_size = page_width / bins;

    auto widths = xs
        | views::transform ([](auto& x) { return x.x1 - x.x0; })
        | views::filter ([](auto x) { return std::isfinite (x) && x > 0; })
        | to< std::vector< double > > ();

    const double span = widths.empty ()
        ? page_width
        : (std::max) (
            1., quantile (widths, gutterSpanCapQuantile) * gutterSpanCapFactor);

    std::vector< double > hist (bins, 0.);

    for (auto& x : xs) {
        const double x0 = clamp (x.x0, 0., page_width);
        const double x1 = clamp ((std::min) (x.x1, x.x0 + span), 0., page_width);

        const long b0 = clamp (long (std::floor (x0 / bin_size)), 0L, bins - 1);
        const long b1 = clamp (long (std::ceil (x1 / bin_size)), 0L, bins);

        const double weight = (std::max) (1., x.weight);

        for (long i = b0; i < b1; ++i) {
            hist [i] += weight;
        }
    }

    const double maximum = (std::max) (1., *max_element (hist));

    for (auto& x : hist) {
        x /= maximum;
    }

    return hist;
}

//
// Runs of low-occupancy bins, away from the page edges:
//
std::vector< segment_t >
low_segments_of (const std::vector< double >& hist, double page_width) {
    const long bins = long (hist.size ());
    const double bin_size = page_width / bins;

    const long margin = std::lround (bins * columnEdgeMarginRatio);
    const long min_width = (std::max) (
        2L, std::lround (page_width * minGutterWidthRatio / bin_size));

    std::vector< segment_t > xs;

    long first = -1, n = 0;
    double sum = 0;

    const auto emit = [&](long last) {
        if (last - first >= min_width) {
            xs.push_back ({ first, last, sum / double ((std::max) (1L, n)) });
        }
        first = -1;
    };

    for (long i = margin; i < bins - margin; ++i) {
        if (hist [i] <= gutterOccThreshold) {
            if (first < 0) {
                first = i, sum = hist [i], n = 1;
            }
            else {
                sum += hist [i], ++n;
            }
        }
        else if (first >= 0) {
            emit (i);
        }
    }

    if (first >= 0) {
        emit (bins - margin);
    }

    return xs;
}

} // anonymous

gutters_t
detect_gutters (
    const x_ranges_t& spans, double page_width,
    const GroupingControl& control) {
    const auto usable = spans
        | views::filter ([&](auto& x) {
              return x.x1 - x.x0 < page_width * control.fullWidthRatio;
          })
        | to< x_ranges_t > ();

    if (usable.size () < minGutterRanges) {
        return { };
    }

    const long bins = clamp (
        long (std::lround (page_width / 2)),
        long (minHistogramBins), long (maxHistogramBins));

    const double bin_size = page_width / bins;

    const auto hist = make_histogram (usable, page_width, bins);

    gutters_t xs;

    for (auto& segment : low_segments_of (hist, page_width)) {
        const double x0 = segment.first * bin_size;
        const double x1 = segment.last * bin_size;
        const double xmid = (x0 + x1) / 2;

        const auto crossing = count_if (usable, [&](auto& x) {
            return x.x0 <= xmid && xmid <= x.x1;
        });

        if (double (crossing) / usable.size () > gutterMaxCrossingRatio) {
            continue;
        }

        xs.push_back ({ x0, x1, xmid, (x1 - x0) * (1 - segment.occupancy) });
    }

    std::stable_sort (xs.begin (), xs.end (), [](auto& a, auto& b) {
        return a.score > b.score;
    });

    xs.resize ((std::min) (
        xs.size (), size_t ((std::max) (0, control.maxPageColumns - 1))));

    std::stable_sort (xs.begin (), xs.end (), [](auto& a, auto& b) {
        return a.x0 < b.x0;
    });

    return xs;
}

x_intervals_t column_intervals (double page_width, const gutters_t& gutters) {
    if (gutters.empty ()) {
        return { { 0., page_width } };
    }

    x_intervals_t xs;

    double pos = 0;

    for (auto& gutter : gutters) {
        const double end = (std::max) (pos, gutter.x0);

        if (end - pos > 1) {
            xs.push_back ({ pos, end });
        }

        pos = (std::min) (page_width, gutter.x1);
    }

    if (page_width - pos > 1) {
        xs.push_back ({ pos, page_width });
    }

    xs.erase (
        std::remove_if (xs.begin (), xs.end (), [&](auto& x) {
            return x.x1 - x.x0 <= page_width * minColumnWidthRatio;
        }),
        xs.end ());

    return xs;
}

int assign_column (
    double x0, double x1, const x_intervals_t& intervals, double page_width,
    const GroupingControl& control) {
    const double width = x1 - x0;

    if (width >= page_width * control.fullWidthRatio) {
        return -1;
    }

    int best = 0;
    double best_overlap = -1;

    for (size_t i = 0; i < intervals.size (); ++i) {
        const auto& interval = intervals [i];

        const double ratio =
            overlap_1d (x0, x1, interval.x0, interval.x1) /
            (std::max) (1e-6, (std::min) (width, interval.x1 - interval.x0));

        if (ratio > best_overlap) {
            best_overlap = ratio;
            best = int (i);
        }
    }

    return best;
}

} // namespace textflow
