// Glyph selectors: one syntactic glyph reference and its resolution against a font.
#pragma once
#include "fee/diagnostics.hpp"
#include "fee/font.hpp"
#include "fee/ir.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace fee {

struct GlyphSelector;

struct BareName { std::string name; };
struct ClassName { std::string name; };
struct RegexPattern { std::string pattern; };
struct Codepoint { uint32_t value=0; };
struct CodepointRange { uint32_t first=0; uint32_t last=0; };
struct InlineClass { std::vector<GlyphSelector> members; };

enum class SuffixKind { append, strip };
struct SuffixOp {
    SuffixKind kind=SuffixKind::append;
    std::string suffix;
    char marker() const { return kind==SuffixKind::append? '.' : '~'; }
};

// Applies one suffix operation to a glyph name (".x" appends, "~x" strips a trailing ".x").
std::string apply_suffix(const std::string& glyph, const SuffixOp& op);

struct ResolveContext {
    const ClassTable& classes;
    const FontModel& font;
    DiagnosticSink* sink=nullptr;
};

struct GlyphSelector {
    using Variant = std::variant<BareName, ClassName, RegexPattern, Codepoint, CodepointRange, InlineClass>;
    Variant selector;
    std::vector<SuffixOp> suffixes;
    SourceLocation location;

    std::string as_text() const;
    // Resolves to glyph names. With must_exist, names missing from the exported glyph
    // set are dropped and reported as one W0101 warning (bare names without suffixes
    // are taken literally).
    GlyphSet resolve(const ResolveContext& ctx, bool must_exist = true) const;

    bool is_bare() const { return std::holds_alternative<BareName>(selector); }
};

GlyphSelector make_selector(GlyphSelector::Variant v, SourceLocation at = {}, std::vector<SuffixOp> suffixes = {});

} // namespace fee
