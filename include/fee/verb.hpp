// Verb plugins: argument transformers, plugin modules and the verb registry.
#pragma once
#include "fee/diagnostics.hpp"
#include "fee/grammar/composer.hpp"
#include "fee/statement.hpp"
#include "fee/value.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fee {

class Session;

// Arguments of a statement that carries brace groups.
struct BlockArgs {
    std::optional<ArgList> before;
    std::vector<StatementGroup> groups;
    std::vector<std::string> between;
    std::optional<ArgList> after;
    SourceLocation location;
};

// Reduces a verb's parse tree bottom-up into typed values and runs the verb.
class VerbTransformer {
public:
    explicit VerbTransformer(Session& session) : session_(session) {}
    virtual ~VerbTransformer() = default;

    // Reduces the children of a parse root. A null root reduces to an empty list.
    ArgList transform(const ParseNode* root, const SourceMap& map);

    // Reduces one node. The default handles every base grammar node; unknown leaves
    // reduce to their text and unknown inner nodes to a ValueList of their children.
    virtual Value reduce(const ParseNode& n);

    virtual Value action(ArgList args) = 0;
    // Statements with brace groups; verbs without block syntax reject them.
    virtual Value block_action(BlockArgs args);

    void set_statement_location(SourceLocation at){ statement_location_ = std::move(at); }

protected:
    Session& session_;
    SourceLocation statement_location_;

    SourceLocation location_of(const ParseNode& n) const;
    ArgList reduce_children(const ParseNode& n);

    GlyphSelector reduce_glyphselector(const ParseNode& n);
    int64_t reduce_integer(const ParseNode& n);
    // Decimal text of n as a 64-bit integer; out of range is E0200 at n.
    int64_t parse_integer(const ParseNode& n) const;
    // Narrows to a 16-bit value record / anchor coordinate; out of range is E0200.
    int to_coordinate(int64_t v, const SourceLocation& at) const;
    ValueRecord reduce_valuerecord(const ParseNode& n);
    std::vector<LanguageSystem> reduce_languages(const ParseNode& n);
    Metric reduce_metric(const ParseNode& n);
    Predicate reduce_metric_comparison(const ParseNode& n);

    GlyphSet resolve(const GlyphSelector& s, bool must_exist = true) const;
    GlyphSet resolve(const Value& v, bool must_exist = true) const;

private:
    const SourceMap* map_=nullptr;
};

using TransformerFactory = std::function<std::unique_ptr<VerbTransformer>(Session&)>;
using GrammarFragment = std::function<ArgumentParserPtr(const ParseOptions&)>;

// Deferred composition of a fragment rule with the owning module's options.
template<typename Rule>
GrammarFragment fragment(){ return [](const ParseOptions& opts){ return compose<Rule>(opts); }; }

template<typename Transformer>
TransformerFactory transformer(){ return [](Session& s){ return std::make_unique<Transformer>(s); }; }

struct PluginVerb {
    std::string name;
    GrammarFragment grammar;
    GrammarFragment before_brace_grammar;
    GrammarFragment after_brace_grammar;
    TransformerFactory transformer;
};

struct PluginModule {
    std::string name;
    std::optional<ParseOptions> options;
    GrammarFragment grammar; // module-level fallback for verbs without their own
    std::vector<PluginVerb> verbs;
};

struct VerbEntry {
    std::string plugin;
    std::string verb;
    ArgumentParserPtr main;
    ArgumentParserPtr before_brace;
    ArgumentParserPtr after_brace;
    TransformerFactory transformer;
};

class VerbRegistry {
public:
    // Composes every parser of the module and registers its verbs. A module missing
    // options, grammar, verbs or a transformer is reported as W0103 and leaves the
    // registry untouched. Grammar analysis failures throw grammar_error.
    bool register_plugin(const PluginModule& m, DiagnosticSink& sink, const SourceLocation& at = {});

    const VerbEntry* find(const std::string& verb) const;
    bool has_plugin(const std::string& name) const;
    const std::vector<std::string>& plugins() const { return plugins_; }
    const std::vector<std::string>& verbs() const { return verb_order_; }

private:
    std::unordered_map<std::string, VerbEntry> entries_;
    std::vector<std::string> verb_order_;
    std::vector<std::string> plugins_;
};

} // namespace fee
