#include "fee/class_algebra.hpp"
#include <unordered_set>

namespace fee {

std::optional<Conjunctor> conjunctor_from_text(std::string_view op){
    if(op=="|") return Conjunctor::union_;
    if(op=="&") return Conjunctor::intersection;
    if(op=="-") return Conjunctor::difference;
    if(op=="and") return Conjunctor::filter;
    return std::nullopt;
}

const char* conjunctor_text(Conjunctor c){
    switch(c){
        case Conjunctor::union_: return "|";
        case Conjunctor::intersection: return "&";
        case Conjunctor::difference: return "-";
        case Conjunctor::filter: return "and";
    }
    return "?";
}

GlyphSet set_union(const GlyphSet& a, const GlyphSet& b){
    GlyphSet out; std::unordered_set<std::string> seen;
    for(const auto& g : a) if(seen.insert(g).second) out.push_back(g);
    for(const auto& g : b) if(seen.insert(g).second) out.push_back(g);
    return out;
}

GlyphSet set_intersection(const GlyphSet& a, const GlyphSet& b){
    std::unordered_set<std::string> rhs(b.begin(), b.end()), seen;
    GlyphSet out;
    for(const auto& g : a) if(rhs.count(g) && seen.insert(g).second) out.push_back(g);
    return out;
}

GlyphSet set_difference(const GlyphSet& a, const GlyphSet& b){
    std::unordered_set<std::string> rhs(b.begin(), b.end()), seen;
    GlyphSet out;
    for(const auto& g : a) if(!rhs.count(g) && seen.insert(g).second) out.push_back(g);
    return out;
}

GlyphSet apply_to_font(const Predicate& p, const FontModel& font){
    GlyphSet out;
    for(const auto& g : font.glyph_order()) if(p(metrics_or_zero(font, g), g)) out.push_back(g);
    return out;
}

GlyphSet filter_set(const GlyphSet& glyphs, const Predicate& p, const FontModel& font){
    GlyphSet out;
    for(const auto& g : glyphs) if(p(metrics_or_zero(font, g), g)) out.push_back(g);
    return out;
}

GlyphSet materialize(const ClassOperand& operand, const FontModel& font){
    if(auto s = std::get_if<GlyphSet>(&operand)) return *s;
    return apply_to_font(std::get<Predicate>(operand), font);
}

ClassOperand conjoin(const ClassOperand& left, Conjunctor op, const ClassOperand& right, const FontModel& font){
    if(std::holds_alternative<GlyphSet>(left) && std::holds_alternative<Predicate>(right))
        return filter_set(std::get<GlyphSet>(left), std::get<Predicate>(right), font);
    GlyphSet l = materialize(left, font), r = materialize(right, font);
    switch(op){
        case Conjunctor::union_: return set_union(l, r);
        case Conjunctor::intersection:
        case Conjunctor::filter: return set_intersection(l, r);
        case Conjunctor::difference: return set_difference(l, r);
    }
    return l;
}

} // namespace fee
