#include "fee/ir_writer.hpp"
#include <sstream>
#include <unordered_map>

namespace fee {

namespace {

std::string quote(const std::string& s){
    std::string out = "\"";
    for(char c : s){ if(c=='"' || c=='\\') out += '\\'; out += c; }
    return out + '"';
}

void write_set(std::ostringstream& os, const GlyphSet& g){
    os << '[';
    for(size_t i=0;i<g.size();++i){ if(i) os << ' '; os << quote(g[i]); }
    os << ']';
}

void write_sets(std::ostringstream& os, const std::vector<GlyphSet>& sets){
    os << '[';
    for(size_t i=0;i<sets.size();++i){ if(i) os << ' '; write_set(os, sets[i]); }
    os << ']';
}

void write_value_record(std::ostringstream& os, const ValueRecord& v){
    os << "{:xPlacement " << v.xPlacement << " :yPlacement " << v.yPlacement
       << " :xAdvance " << v.xAdvance << " :yAdvance " << v.yAdvance << '}';
}

void write_anchor_map(std::ostringstream& os, const std::map<std::string, AnchorPoint>& m){
    os << '{';
    bool first = true;
    for(const auto& [glyph, p] : m){ if(!first) os << ' '; first = false; os << quote(glyph) << " [" << p.x << ' ' << p.y << ']'; }
    os << '}';
}

// Anonymous routines are labelled by their position in the routine list.
using Labels = std::unordered_map<const Routine*, std::string>;

std::string routine_label(const Routine& r, const Labels& labels){
    if(!r.name.empty()) return r.name;
    auto it = labels.find(&r);
    return it==labels.end()? std::string("anonymous") : it->second;
}

void write_common(std::ostringstream& os, const RuleCommon& c){
    if(!c.precontext.empty()){ os << " :precontext "; write_sets(os, c.precontext); }
    if(!c.postcontext.empty()){ os << " :postcontext "; write_sets(os, c.postcontext); }
    if(!c.address.empty()) os << " :address " << quote(c.address);
    if(!c.languages.empty()){
        os << " :languages [";
        for(size_t i=0;i<c.languages.size();++i){ if(i) os << ' '; os << '[' << quote(c.languages[i].language) << ' ' << quote(c.languages[i].script) << ']'; }
        os << ']';
    }
    if(c.flags) os << " :flags " << c.flags;
}

void write_rule(std::ostringstream& os, const Rule& rule, const Labels& labels){
    os << "{:kind :" << rule_kind(rule);
    if(auto s = std::get_if<Substitution>(&rule)){
        os << " :input "; write_sets(os, s->input);
        os << " :replacement "; write_sets(os, s->replacement);
    } else if(auto p = std::get_if<Positioning>(&rule)){
        os << " :glyphs "; write_sets(os, p->glyphs);
        os << " :values [";
        for(size_t i=0;i<p->values.size();++i){ if(i) os << ' '; write_value_record(os, p->values[i]); }
        os << ']';
    } else if(auto c = std::get_if<Chaining>(&rule)){
        os << " :input "; write_sets(os, c->input);
        os << " :lookups [";
        for(size_t i=0;i<c->lookups.size();++i){
            if(i) os << ' ';
            os << '[';
            for(size_t j=0;j<c->lookups[i].size();++j){ if(j) os << ' '; os << quote(routine_label(*c->lookups[i][j], labels)); }
            os << ']';
        }
        os << ']';
    } else if(auto a = std::get_if<Attachment>(&rule)){
        os << " :base-anchor " << quote(a->base_anchor) << " :mark-anchor " << quote(a->mark_anchor);
        os << " :bases "; write_anchor_map(os, a->bases);
        os << " :marks "; write_anchor_map(os, a->marks);
        if(a->cursive) os << " :cursive true";
    }
    write_common(os, rule_common(rule));
    os << '}';
}

void write_routine_to(std::ostringstream& os, const Routine& r, const Labels& labels){
    os << "{:name " << quote(routine_label(r, labels));
    if(r.flags) os << " :flags " << r.flags;
    if(r.mark_filtering_set){ os << " :mark-filtering-set "; write_set(os, *r.mark_filtering_set); }
    os << " :rules [";
    for(size_t i=0;i<r.rules.size();++i){ if(i) os << "\n    "; write_rule(os, r.rules[i], labels); }
    os << "]}";
}

} // namespace

std::string write_routine(const Routine& r){
    std::ostringstream os;
    write_routine_to(os, r, Labels{});
    return os.str();
}

std::string write_ir(const FontFeatures& ff){
    Labels labels;
    for(size_t i=0;i<ff.routines.size();++i)
        if(ff.routines[i]->name.empty()) labels[ff.routines[i].get()] = "routine" + std::to_string(i);
    std::ostringstream os;
    os << "{:classes [";
    const auto& names = ff.named_classes.names();
    for(size_t i=0;i<names.size();++i){
        os << (i? "\n            " : "") << "{:name " << quote(names[i]) << " :glyphs ";
        write_set(os, *ff.named_classes.find(names[i]));
        os << '}';
    }
    os << "]\n :routines [";
    for(size_t i=0;i<ff.routines.size();++i){
        os << (i? "\n   " : "");
        write_routine_to(os, *ff.routines[i], labels);
    }
    os << "]\n :features [";
    for(size_t i=0;i<ff.feature_order.size();++i){
        const auto& tag = ff.feature_order[i];
        os << (i? " " : "") << "{:tag " << quote(tag) << " :routines [";
        const auto* rs = ff.feature(tag);
        for(size_t j=0; rs && j<rs->size(); ++j){ if(j) os << ' '; os << quote(routine_label(*(*rs)[j], labels)); }
        os << "]}";
    }
    os << "]\n :anchors {";
    bool first = true;
    for(const auto& [glyph, anchors] : ff.anchors){
        if(!first) os << ' ';
        first = false;
        os << quote(glyph) << ' ';
        write_anchor_map(os, anchors);
    }
    os << "}}\n";
    return os.str();
}

} // namespace fee
