#include "fee/selector.hpp"
#include <re2/re2.h>
#include <cstdio>

namespace fee {

namespace {
std::string codepoint_text(uint32_t cp){
    char buf[16]; std::snprintf(buf, sizeof(buf), "U+%04X", (unsigned)cp); return buf;
}

std::string join(const std::vector<std::string>& xs, const char* sep){
    std::string out; for(size_t i=0;i<xs.size();++i){ if(i) out += sep; out += xs[i]; } return out;
}

GlyphSet resolve_codepoint(uint32_t cp, const ResolveContext& ctx, const SourceLocation& at){
    auto g = ctx.font.glyph_for_codepoint(cp);
    if(!g) throw resolution_error(make_error(codes::missing_codepoint, "Font does not contain glyph for "+codepoint_text(cp), at));
    return {*g};
}
}

std::string apply_suffix(const std::string& glyph, const SuffixOp& op){
    if(op.kind==SuffixKind::append) return glyph + "." + op.suffix;
    const std::string tail = "." + op.suffix;
    if(glyph.size() >= tail.size() && glyph.compare(glyph.size()-tail.size(), tail.size(), tail)==0)
        return glyph.substr(0, glyph.size()-tail.size());
    return glyph;
}

GlyphSelector make_selector(GlyphSelector::Variant v, SourceLocation at, std::vector<SuffixOp> suffixes){
    GlyphSelector s; s.selector = std::move(v); s.location = std::move(at); s.suffixes = std::move(suffixes); return s;
}

std::string GlyphSelector::as_text() const {
    struct V {
        std::string operator()(const BareName& b) const { return b.name; }
        std::string operator()(const ClassName& c) const { return "@"+c.name; }
        std::string operator()(const RegexPattern& r) const { return "/"+r.pattern+"/"; }
        std::string operator()(const Codepoint& c) const { return codepoint_text(c.value); }
        std::string operator()(const CodepointRange& r) const { return codepoint_text(r.first)+"=>"+codepoint_text(r.last); }
        std::string operator()(const InlineClass& ic) const {
            std::vector<std::string> items; for(const auto& m : ic.members) items.push_back(m.as_text());
            return "["+join(items, " ")+"]";
        }
    };
    std::string out = std::visit(V{}, selector);
    for(const auto& s : suffixes){ out += s.marker(); out += s.suffix; }
    return out;
}

GlyphSet GlyphSelector::resolve(const ResolveContext& ctx, bool must_exist) const {
    GlyphSet returned;
    if(auto b = std::get_if<BareName>(&selector)){
        returned.push_back(b->name);
    } else if(auto c = std::get_if<Codepoint>(&selector)){
        returned = resolve_codepoint(c->value, ctx, location);
    } else if(auto r = std::get_if<CodepointRange>(&selector)){
        for(uint64_t cp = r->first; cp <= r->last; ++cp){
            auto one = resolve_codepoint(static_cast<uint32_t>(cp), ctx, location);
            returned.insert(returned.end(), one.begin(), one.end());
        }
    } else if(auto ic = std::get_if<InlineClass>(&selector)){
        for(const auto& m : ic->members){
            auto one = m.resolve(ctx, false);
            returned.insert(returned.end(), one.begin(), one.end());
        }
    } else if(auto cn = std::get_if<ClassName>(&selector)){
        const GlyphSet* members = ctx.classes.find(cn->name);
        if(!members){
            auto d = make_error(codes::undefined_class, "Tried to expand glyph class '@"+cn->name+"' but @"+cn->name+" was not defined", location, "define the class with DefineClass before using it");
            throw undefined_reference_error(std::move(d), cn->name);
        }
        returned = *members;
    } else if(auto re = std::get_if<RegexPattern>(&selector)){
        RE2 pattern(re->pattern, RE2::Quiet);
        if(!pattern.ok())
            throw resolution_error(make_error(codes::bad_regex, "Couldn't parse regular expression '"+re->pattern+"': "+pattern.error(), location));
        for(const auto& g : ctx.font.exported_glyphs()) if(RE2::PartialMatch(g, pattern)) returned.push_back(g);
    }
    for(const auto& s : suffixes)
        for(auto& g : returned) g = apply_suffix(g, s);

    if(must_exist && !(is_bare() && suffixes.empty())){
        GlyphSet found; std::vector<std::string> not_found;
        for(auto& g : returned){
            if(ctx.font.is_exported(g)) found.push_back(std::move(g)); else not_found.push_back(std::move(g));
        }
        returned = std::move(found);
        if(!not_found.empty() && ctx.sink){
            std::string plural = not_found.size()>1? "s" : "";
            ctx.sink->warn(codes::missing_glyph, "Couldn't find glyph"+plural+" '"+join(not_found, ", ")+"' in font ("+as_text()+")", location);
        }
    }
    return returned;
}

} // namespace fee
