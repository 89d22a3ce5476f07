// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cmath>

#include <utils/string.hh>

#include <textflow/GroupingControl.hh>
#include <textflow/TextRun.hh>

#include <range/v3/algorithm/equal.hpp>
using namespace ranges;

namespace textflow {

double baseline_of (const TextRun& x) {
    const double descender = x.descender.value_or (defaultDescender);
    return x.y - descender * x.fontSize / 1000;
}

double estimate_char_width (const TextRun& x) {
    const auto n = (std::max) (length_of (x.text), size_t (1));
    const double estimate = x.width / double (n);

    const double minimum = x.fontSize * minCharWidthFactor;

    if (!std::isfinite (estimate) || estimate <= 0) {
        return (std::max) (x.fontSize * fallbackCharWidthFactor, minimum);
    }

    return (std::max) (estimate, minimum);
}

double expected_gap (const TextRun& prev, const TextRun& next) {
    const double base =
        (estimate_char_width (prev) + estimate_char_width (next)) / 2;

    const double word = ends_with (prev.text, " ") ? prev.wordSpacing : 0;

    return (base + prev.charSpacing + word) * prev.horizontalScaling / 100;
}

std::string normalize_font_name (const std::string& s) {
    const auto pos = s.find ('+');
    return pos != std::string::npos && pos > 0 ? s.substr (pos + 1) : s;
}

bool same_color (const TextRun& lhs, const TextRun& rhs, color_matching_t mode) {
    const auto& a = lhs.fillColor;
    const auto& b = rhs.fillColor;

    if (a.space != b.space || a.components.size () != b.components.size ()) {
        return false;
    }

    if (mode == color_matching_t::strict) {
        return equal (a.components, b.components);
    }

    return equal (a.components, b.components, [](double x, double y) {
        return std::fabs (x - y) <= looseColorTolerance;
    });
}

bool same_style (const TextRun& lhs, const TextRun& rhs, const GroupingControl& control) {
    if (normalize_font_name (lhs.fontName) != normalize_font_name (rhs.fontName)) {
        return false;
    }

    if (std::fabs (lhs.fontSize - rhs.fontSize) >
        lhs.fontSize * control.fontSizeToleranceRatio) {
        return false;
    }

    if (control.colorMatching != color_matching_t::none &&
        !same_color (lhs, rhs, control.colorMatching)) {
        return false;
    }

    return true;
}

} // namespace textflow
