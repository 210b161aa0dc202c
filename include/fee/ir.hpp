// Intermediate representation shared by every front end: classes, anchors, routines, features.
#pragma once
#include "fee/font.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace fee {

using GlyphSet = std::vector<std::string>;

// OpenType lookup flag bits
namespace lookup_flags {
inline constexpr uint32_t right_to_left = 0x0001;
inline constexpr uint32_t ignore_bases = 0x0002;
inline constexpr uint32_t ignore_ligatures = 0x0004;
inline constexpr uint32_t ignore_marks = 0x0008;
inline constexpr uint32_t use_mark_filtering_set = 0x0010;
inline constexpr uint32_t mark_attachment_type_mask = 0xFF00;
}

struct LanguageSystem { std::string language; std::string script; };

struct ValueRecord {
    int xPlacement=0;
    int yPlacement=0;
    int xAdvance=0;
    int yAdvance=0;
    bool empty() const { return !xPlacement && !yPlacement && !xAdvance && !yAdvance; }
    bool operator==(const ValueRecord& o) const { return xPlacement==o.xPlacement && yPlacement==o.yPlacement && xAdvance==o.xAdvance && yAdvance==o.yAdvance; }
};

struct Routine;
using RoutinePtr = std::shared_ptr<Routine>;

struct RuleCommon {
    std::vector<GlyphSet> precontext;
    std::vector<GlyphSet> postcontext;
    std::string address;
    std::vector<LanguageSystem> languages;
    uint32_t flags=0;
};

struct Substitution : RuleCommon {
    std::vector<GlyphSet> input;
    std::vector<GlyphSet> replacement;
};

struct Positioning : RuleCommon {
    std::vector<GlyphSet> glyphs;
    std::vector<ValueRecord> values; // one per glyph position
};

struct Chaining : RuleCommon {
    std::vector<GlyphSet> input;
    std::vector<std::vector<RoutinePtr>> lookups; // one list per input position
};

struct Attachment : RuleCommon {
    std::string base_anchor;
    std::string mark_anchor;
    std::map<std::string, AnchorPoint> bases;
    std::map<std::string, AnchorPoint> marks;
    bool cursive=false;
};

using Rule = std::variant<Substitution, Positioning, Chaining, Attachment>;

const char* rule_kind(const Rule& r);
RuleCommon& rule_common(Rule& r);
const RuleCommon& rule_common(const Rule& r);

struct Routine {
    std::string name;
    std::vector<std::string> address;
    uint32_t flags=0;
    std::optional<GlyphSet> mark_filtering_set;
    std::vector<Rule> rules;

    void add_rule(Rule r){ rules.push_back(std::move(r)); }
    // Sets the routine flags and stamps them onto every contained rule.
    void apply_flags(uint32_t f);
    bool empty() const { return rules.empty(); }
};

RoutinePtr make_routine(std::string name = {}, std::string address = {});

// Insertion-ordered named glyph classes.
class ClassTable {
public:
    void define(const std::string& name, GlyphSet glyphs);
    const GlyphSet* find(const std::string& name) const;
    bool contains(const std::string& name) const { return classes_.count(name)!=0; }
    const std::vector<std::string>& names() const { return order_; }
    size_t size() const { return order_.size(); }
private:
    std::vector<std::string> order_;
    std::unordered_map<std::string, GlyphSet> classes_;
};

struct FontFeatures {
    ClassTable named_classes;
    std::vector<RoutinePtr> routines;
    std::vector<std::string> feature_order;
    std::unordered_map<std::string, std::vector<RoutinePtr>> features;
    std::map<std::string, std::map<std::string, AnchorPoint>> anchors; // glyph -> anchor name -> point

    // Registers the routine (by identity) if it is not known yet.
    void add_routine(const RoutinePtr& r);
    void add_feature(const std::string& tag, const RoutinePtr& r);
    RoutinePtr find_routine(const std::string& name) const;
    const std::vector<RoutinePtr>* feature(const std::string& tag) const;
    bool has_anchor(const std::string& glyph, const std::string& anchor) const;
    // Seeds the anchor table from the font's own anchors.
    void set_anchors_from_font(const FontModel& font);
};

} // namespace fee
