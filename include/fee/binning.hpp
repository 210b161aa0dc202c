// Metric binning: one-dimensional k-means clustering of a glyph set.
#pragma once
#include "fee/font.hpp"
#include "fee/ir.hpp"
#include <cstddef>
#include <vector>

namespace fee {

inline constexpr size_t max_bin_count = 256;

struct GlyphBin {
    GlyphSet glyphs;
    double average=0.0;
};

// Optimal k-means (Ckmeans) over the distinct values, weighted by how many glyphs share
// each value. Returns exactly k groups (1 <= k <= max_bin_count) ordered by ascending mean; groups beyond
// the number of distinct values are empty.
std::vector<std::vector<size_t>> cluster_values(const std::vector<double>& values, size_t k);

// Bins glyphs by metric value. Glyph order inside a bin follows the input order; glyphs
// unknown to the font read as zero.
std::vector<GlyphBin> bin_glyphs_by_metric(const FontModel& font, const GlyphSet& glyphs, Metric metric, size_t bincount);

} // namespace fee
