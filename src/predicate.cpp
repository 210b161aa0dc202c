#include "fee/predicate.hpp"
#include <re2/re2.h>

namespace fee {

std::optional<Comparator> comparator_from_text(std::string_view op){
    if(op=="<") return Comparator::lt;
    if(op=="<=") return Comparator::le;
    if(op=="==" || op=="=") return Comparator::eq;
    if(op=="!=") return Comparator::ne;
    if(op==">=") return Comparator::ge;
    if(op==">") return Comparator::gt;
    return std::nullopt;
}

const char* comparator_text(Comparator c){
    switch(c){
        case Comparator::lt: return "<";
        case Comparator::le: return "<=";
        case Comparator::eq: return "==";
        case Comparator::ne: return "!=";
        case Comparator::ge: return ">=";
        case Comparator::gt: return ">";
    }
    return "?";
}

bool compare(int64_t lhs, Comparator op, int64_t rhs){
    switch(op){
        case Comparator::lt: return lhs < rhs;
        case Comparator::le: return lhs <= rhs;
        case Comparator::eq: return lhs == rhs;
        case Comparator::ne: return lhs != rhs;
        case Comparator::ge: return lhs >= rhs;
        case Comparator::gt: return lhs > rhs;
    }
    return false;
}

Predicate metric_comparison(Metric metric, Comparator op, int64_t value){
    return [metric, op, value](const GlyphMetrics& m, const std::string&){ return compare(metric_value(m, metric), op, value); };
}

Predicate has_glyph(std::shared_ptr<const re2::RE2> pattern, std::string replacement, const FontModel& font){
    return [pattern, replacement, &font](const GlyphMetrics&, const std::string& glyph){
        std::string candidate = glyph;
        RE2::GlobalReplace(&candidate, *pattern, replacement);
        return font.has_glyph(candidate);
    };
}

Predicate has_anchor(std::string anchor, const FontFeatures& features){
    return [anchor, &features](const GlyphMetrics&, const std::string& glyph){ return features.has_anchor(glyph, anchor); };
}

Predicate category_is(std::string category, const FontModel& font){
    return [category, &font](const GlyphMetrics&, const std::string& glyph){ return font.category(glyph)==category; };
}

Predicate negate(Predicate p){
    return [p](const GlyphMetrics& m, const std::string& glyph){ return !p(m, glyph); };
}

GlyphMetrics metrics_or_zero(const FontModel& font, const std::string& glyph){
    auto m = font.metrics(glyph);
    return m? *m : GlyphMetrics{};
}

} // namespace fee
