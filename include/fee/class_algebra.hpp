// Set algebra over glyph classes with deferred predicate operands.
#pragma once
#include "fee/font.hpp"
#include "fee/ir.hpp"
#include "fee/predicate.hpp"
#include <optional>
#include <string_view>
#include <variant>

namespace fee {

// "and" is the predicate filter conjunctor; it behaves like '&' once both sides are sets.
enum class Conjunctor { union_, intersection, difference, filter };

std::optional<Conjunctor> conjunctor_from_text(std::string_view op);
const char* conjunctor_text(Conjunctor c);

// An operand of a class expression: either a resolved glyph set or a predicate not yet applied.
using ClassOperand = std::variant<GlyphSet, Predicate>;

GlyphSet set_union(const GlyphSet& a, const GlyphSet& b);
GlyphSet set_intersection(const GlyphSet& a, const GlyphSet& b);
GlyphSet set_difference(const GlyphSet& a, const GlyphSet& b);

// Applies the predicate to every glyph of the font's glyph order.
GlyphSet apply_to_font(const Predicate& p, const FontModel& font);
// Keeps the members of the set for which the predicate holds, in set order.
GlyphSet filter_set(const GlyphSet& glyphs, const Predicate& p, const FontModel& font);

// Combines two operands. A set on the left with a predicate on the right always filters
// the left set pointwise, whichever conjunctor was written. Any other predicate operand
// is applied to the whole font before set algebra.
ClassOperand conjoin(const ClassOperand& left, Conjunctor op, const ClassOperand& right, const FontModel& font);

// Collapses an operand to a set; a bare predicate is applied to the whole font.
GlyphSet materialize(const ClassOperand& operand, const FontModel& font);

} // namespace fee
