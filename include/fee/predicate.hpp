// Glyph predicates: pure boolean tests over a glyph's metrics and properties.
#pragma once
#include "fee/font.hpp"
#include "fee/ir.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace re2 { class RE2; }

namespace fee {

using Predicate = std::function<bool(const GlyphMetrics&, const std::string&)>;

enum class Comparator { lt, le, eq, ne, ge, gt };

std::optional<Comparator> comparator_from_text(std::string_view op);
const char* comparator_text(Comparator c);
bool compare(int64_t lhs, Comparator op, int64_t rhs);

Predicate metric_comparison(Metric metric, Comparator op, int64_t value);
// True if substituting every match of pattern by replacement in the glyph name yields a glyph in the font.
Predicate has_glyph(std::shared_ptr<const re2::RE2> pattern, std::string replacement, const FontModel& font);
// True if the glyph carries the named anchor in the IR anchor table.
Predicate has_anchor(std::string anchor, const FontFeatures& features);
Predicate category_is(std::string category, const FontModel& font);
Predicate negate(Predicate p);

// Metrics used when evaluating predicates; glyphs unknown to the font read as zero.
GlyphMetrics metrics_or_zero(const FontModel& font, const std::string& glyph);

} // namespace fee
