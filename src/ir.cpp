#include "fee/ir.hpp"
#include <algorithm>

namespace fee {

const char* rule_kind(const Rule& r){
    struct V {
        const char* operator()(const Substitution&) const { return "substitution"; }
        const char* operator()(const Positioning&) const { return "positioning"; }
        const char* operator()(const Chaining&) const { return "chaining"; }
        const char* operator()(const Attachment&) const { return "attachment"; }
    };
    return std::visit(V{}, r);
}

RuleCommon& rule_common(Rule& r){ return std::visit([](auto& x)->RuleCommon&{ return x; }, r); }
const RuleCommon& rule_common(const Rule& r){ return std::visit([](const auto& x)->const RuleCommon&{ return x; }, r); }

void Routine::apply_flags(uint32_t f){
    flags = f;
    for(auto& r : rules) rule_common(r).flags = f;
}

RoutinePtr make_routine(std::string name, std::string address){
    auto r = std::make_shared<Routine>();
    r->name = std::move(name);
    if(!address.empty()) r->address.push_back(std::move(address));
    return r;
}

void ClassTable::define(const std::string& name, GlyphSet glyphs){
    auto it = classes_.find(name);
    if(it==classes_.end()){ order_.push_back(name); classes_.emplace(name, std::move(glyphs)); }
    else it->second = std::move(glyphs);
}

const GlyphSet* ClassTable::find(const std::string& name) const {
    auto it = classes_.find(name); return it==classes_.end()? nullptr : &it->second;
}

void FontFeatures::add_routine(const RoutinePtr& r){
    if(std::find(routines.begin(), routines.end(), r)==routines.end()) routines.push_back(r);
}

void FontFeatures::add_feature(const std::string& tag, const RoutinePtr& r){
    auto it = features.find(tag);
    if(it==features.end()){ feature_order.push_back(tag); it = features.emplace(tag, std::vector<RoutinePtr>{}).first; }
    it->second.push_back(r);
    add_routine(r);
}

RoutinePtr FontFeatures::find_routine(const std::string& name) const {
    // latest definition wins
    for(auto it = routines.rbegin(); it != routines.rend(); ++it) if(!(*it)->name.empty() && (*it)->name==name) return *it;
    return nullptr;
}

const std::vector<RoutinePtr>* FontFeatures::feature(const std::string& tag) const {
    auto it = features.find(tag); return it==features.end()? nullptr : &it->second;
}

bool FontFeatures::has_anchor(const std::string& glyph, const std::string& anchor) const {
    auto it = anchors.find(glyph);
    return it!=anchors.end() && it->second.count(anchor)!=0;
}

void FontFeatures::set_anchors_from_font(const FontModel& font){
    for(const auto& g : font.glyph_order()){
        auto a = font.anchors(g);
        if(!a.empty()) anchors[g].insert(a.begin(), a.end());
    }
}

} // namespace fee
