// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <stdexcept>

#include <utils/string.hh>

#include <textflow/GroupedContext.hh>
#include <textflow/TextBlock.hh>
#include <textflow/TextParagraph.hh>

#include <range/v3/view/transform.hpp>
using namespace ranges;

namespace textflow {
namespace {

std::vector< std::string > paragraph_texts_of (const TextBlock& block) {
    std::vector< std::string > xs;

    for (auto& paragraph : block.paragraphs) {
        auto s = normalize_space (paragraph->text ());

        if (!s.empty ()) {
            xs.push_back (std::move (s));
        }
    }

    return xs;
}

} // anonymous

double x_axis_overlap_ratio (const bbox_t& lhs, const bbox_t& rhs) {
    const double overlap = horizontal_overlap (lhs, rhs);
    const double width = (std::min) (width_of (lhs), width_of (rhs));

    if (width <= 0) {
        return 0;
    }

    return overlap / width;
}

std::string context_signature (const TextBlock& block, size_t edge_count) {
    auto xs = paragraph_texts_of (block);

    if (xs.size () > edge_count * 2) {
        xs.erase (
            xs.begin () + std::ptrdiff_t (edge_count),
            xs.end () - std::ptrdiff_t (edge_count));
    }

    return join (xs, "\n");
}

std::string text_of (const TextBlock& block) {
    return normalize_space (join (
        block.paragraphs | views::transform ([](auto& x) {
            return x->text ();
        }),
        "\n"));
}

bbox_t merge_bounds (const TextBlocks& blocks) {
    if (blocks.empty ()) {
        throw std::invalid_argument ("merging bounds requires at least one box");
    }

    return coalesce (blocks | views::transform ([](auto& x) {
        return x->box;
    }));
}

block_context_result_t
segment_blocks_by_context (
    const TextBlocks& blocks, const SegmentationControl& controlA) {
    const auto control = resolve (controlA);

    const auto edge_count = size_t (control.contextParagraphEdgeCount);
    const auto min_overlap = control.minXAxisOverlapRatio;

    std::vector< context_unit_t< size_t > > units;

    for (size_t i = 0; i < blocks.size (); ++i) {
        units.push_back ({ context_signature (*blocks [i], edge_count), i });
    }

    const auto guard = [&](const boundary_input_t< size_t >& x) {
        return x_axis_overlap_ratio (
            blocks [x.left.value]->box,
            blocks [x.right.value]->box) >= min_overlap;
    };

    const auto base = segment_by_context< size_t > (
        std::move (units), control, guard);

    block_context_result_t result{ base.threshold, { }, { } };

    //
    // Block indices of the units that survived normalization, in order:
    //
    std::vector< size_t > indices;

    for (auto& segment : base.segments) {
        for (auto& unit : segment.units) {
            indices.push_back (unit.value);
        }
    }

    for (auto& boundary : base.boundaries) {
        const auto& lhs = *blocks [indices [boundary.index]];
        const auto& rhs = *blocks [indices [boundary.index + 1]];

        result.boundaries.push_back (block_boundary_score_t{
            boundary, x_axis_overlap_ratio (lhs.box, rhs.box) });
    }

    for (auto& segment : base.segments) {
        block_segment_t x{
            segment.units.front ().value, segment.units.back ().value,
            { }, { }, { }
        };

        std::vector< std::string > texts;

        for (auto& unit : segment.units) {
            x.blocks.push_back (blocks [unit.value]);
            texts.push_back (text_of (*blocks [unit.value]));
        }

        x.text = join (texts, "\n");
        x.box = merge_bounds (x.blocks);

        result.segments.push_back (std::move (x));
    }

    return result;
}

} // namespace textflow
