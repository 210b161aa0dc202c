// Read-only font model consulted by selector resolution, predicates and binning
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fee {

struct GlyphMetrics {
    int width=0;
    int lsb=0;
    int rsb=0;
    int xMin=0;
    int xMax=0;
    int yMin=0;
    int yMax=0;
    int rise=0; // cursive exit y - entry y
    int run=0;  // cursive exit x - entry x
    int fullwidth() const { return xMax - xMin; }
};

// Fixed metric vocabulary usable in comparisons, glyph values and binning.
enum class Metric { width, lsb, rsb, xMin, xMax, yMin, yMax, rise, run, fullwidth };

std::optional<Metric> metric_from_name(std::string_view name);
const char* metric_name(Metric m);
int metric_value(const GlyphMetrics& g, Metric m);
const std::vector<std::string>& metric_names();

struct AnchorPoint { int x=0; int y=0; };

class FontModel {
public:
    virtual ~FontModel() = default;
    // Glyphs written to the final font, in glyph order.
    virtual const std::vector<std::string>& exported_glyphs() const = 0;
    // Every glyph, including non-exported ones.
    virtual const std::vector<std::string>& glyph_order() const = 0;
    virtual bool has_glyph(const std::string& name) const = 0;
    virtual bool is_exported(const std::string& name) const = 0;
    virtual std::optional<std::string> glyph_for_codepoint(uint32_t cp) const = 0;
    virtual std::optional<GlyphMetrics> metrics(const std::string& name) const = 0;
    virtual std::string category(const std::string& name) const = 0;
    virtual std::map<std::string, AnchorPoint> anchors(const std::string& name) const = 0;
};

struct GlyphRecord {
    std::string name;
    std::vector<uint32_t> codepoints;
    GlyphMetrics metrics;
    std::string category{"base"};
    std::map<std::string, AnchorPoint> anchors;
    bool exported=true;
};

// In-memory font snapshot; the stand-in for a real font file.
class MemoryFont : public FontModel {
public:
    MemoryFont& add_glyph(GlyphRecord g);
    // Convenience for tests: exported base glyph with an advance width.
    MemoryFont& add(const std::string& name, int width, std::optional<uint32_t> cp = std::nullopt);

    const std::vector<std::string>& exported_glyphs() const override { return exported_; }
    const std::vector<std::string>& glyph_order() const override { return order_; }
    bool has_glyph(const std::string& name) const override { return glyphs_.count(name)!=0; }
    bool is_exported(const std::string& name) const override;
    std::optional<std::string> glyph_for_codepoint(uint32_t cp) const override;
    std::optional<GlyphMetrics> metrics(const std::string& name) const override;
    std::string category(const std::string& name) const override;
    std::map<std::string, AnchorPoint> anchors(const std::string& name) const override;

    GlyphRecord* find(const std::string& name);
    size_t size() const { return order_.size(); }
private:
    std::vector<std::string> order_;
    std::vector<std::string> exported_;
    std::unordered_map<std::string, GlyphRecord> glyphs_;
    std::unordered_map<uint32_t, std::string> cmap_;
};

} // namespace fee
