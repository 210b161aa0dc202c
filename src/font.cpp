#include "fee/font.hpp"
#include <stdexcept>

namespace fee {

namespace {
struct MetricEntry { const char* name; Metric metric; };
const MetricEntry kMetrics[] = {
    {"width", Metric::width}, {"lsb", Metric::lsb}, {"rsb", Metric::rsb},
    {"xMin", Metric::xMin}, {"xMax", Metric::xMax}, {"yMin", Metric::yMin}, {"yMax", Metric::yMax},
    {"rise", Metric::rise}, {"run", Metric::run}, {"fullwidth", Metric::fullwidth},
};
}

std::optional<Metric> metric_from_name(std::string_view name){
    for(const auto& e : kMetrics) if(name==e.name) return e.metric;
    return std::nullopt;
}

const char* metric_name(Metric m){
    for(const auto& e : kMetrics) if(e.metric==m) return e.name;
    return "?";
}

const std::vector<std::string>& metric_names(){
    static const std::vector<std::string> names = []{ std::vector<std::string> v; for(const auto& e : kMetrics) v.emplace_back(e.name); return v; }();
    return names;
}

int metric_value(const GlyphMetrics& g, Metric m){
    switch(m){
        case Metric::width: return g.width;
        case Metric::lsb: return g.lsb;
        case Metric::rsb: return g.rsb;
        case Metric::xMin: return g.xMin;
        case Metric::xMax: return g.xMax;
        case Metric::yMin: return g.yMin;
        case Metric::yMax: return g.yMax;
        case Metric::rise: return g.rise;
        case Metric::run: return g.run;
        case Metric::fullwidth: return g.fullwidth();
    }
    return 0;
}

MemoryFont& MemoryFont::add_glyph(GlyphRecord g){
    if(glyphs_.count(g.name)) throw std::invalid_argument("duplicate glyph '"+g.name+"'");
    order_.push_back(g.name);
    if(g.exported) exported_.push_back(g.name);
    for(auto cp : g.codepoints) cmap_.emplace(cp, g.name);
    auto name = g.name;
    glyphs_.emplace(std::move(name), std::move(g));
    return *this;
}

MemoryFont& MemoryFont::add(const std::string& name, int width, std::optional<uint32_t> cp){
    GlyphRecord g; g.name = name; g.metrics.width = width; g.metrics.xMax = width; g.metrics.rsb = 0;
    if(cp) g.codepoints.push_back(*cp);
    return add_glyph(std::move(g));
}

bool MemoryFont::is_exported(const std::string& name) const {
    auto it = glyphs_.find(name); return it!=glyphs_.end() && it->second.exported;
}

std::optional<std::string> MemoryFont::glyph_for_codepoint(uint32_t cp) const {
    auto it = cmap_.find(cp); if(it==cmap_.end()) return std::nullopt; return it->second;
}

std::optional<GlyphMetrics> MemoryFont::metrics(const std::string& name) const {
    auto it = glyphs_.find(name); if(it==glyphs_.end()) return std::nullopt; return it->second.metrics;
}

std::string MemoryFont::category(const std::string& name) const {
    auto it = glyphs_.find(name); if(it==glyphs_.end()) return std::string(); return it->second.category;
}

std::map<std::string, AnchorPoint> MemoryFont::anchors(const std::string& name) const {
    auto it = glyphs_.find(name); if(it==glyphs_.end()) return {}; return it->second.anchors;
}

GlyphRecord* MemoryFont::find(const std::string& name){
    auto it = glyphs_.find(name); return it==glyphs_.end()? nullptr : &it->second;
}

} // namespace fee
