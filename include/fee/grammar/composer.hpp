// Grammar composer: wraps a verb's fragment in the base grammar and yields a ready parser.
#pragma once
#include "fee/diagnostics.hpp"
#include "fee/features.hpp"
#include "fee/grammar/helpers.hpp"
#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/analyze.hpp>
#include <tao/pegtl/contrib/parse_tree.hpp>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace fee {

using ParseNode = tao::pegtl::parse_tree::node;

struct ParseOptions {
    bool use_helpers=true;
};

// Maps byte offsets in rejoined argument text back to the tokens they came from.
class SourceMap {
public:
    SourceMap() = default;
    explicit SourceMap(SourceLocation whole){ add(0, std::move(whole)); }
    void add(size_t offset, SourceLocation at){ segments_.emplace_back(offset, std::move(at)); }
    SourceLocation locate(size_t offset) const;
    bool empty() const { return segments_.empty(); }
private:
    std::vector<std::pair<size_t, SourceLocation>> segments_;
};

// Argument parser handed to the dispatcher. Returns nullptr when it yields nothing;
// throws syntax_error with the mapped location when the text does not match.
class ArgumentParser {
public:
    virtual ~ArgumentParser() = default;
    virtual std::unique_ptr<ParseNode> parse(const std::string& text, const SourceMap& map) const = 0;
    virtual std::string describe() const = 0;
};
using ArgumentParserPtr = std::shared_ptr<const ArgumentParser>;

// Stand-in for a missing before/after-brace fragment.
class NullParser : public ArgumentParser {
public:
    std::unique_ptr<ParseNode> parse(const std::string&, const SourceMap&) const override { return nullptr; }
    std::string describe() const override { return "<none>"; }
};

// The parse_error text without PEGTL's own position prefix.
std::string parse_error_message(const tao::pegtl::parse_error& e);

// Translates a PEGTL parse_error raised on rejoined text into a located syntax_error.
[[noreturn]] void throw_syntax_error(const tao::pegtl::parse_error& e, const SourceMap& map, const std::string& grammar);

namespace pegtl_front {

template<bool Helpers, typename Nodes>
struct node_selection;

template<typename Nodes>
struct node_selection<true, Nodes> {
    template<typename Rule>
    using type = tao::pegtl::parse_tree::selector< Rule, grammar::helper_nodes, Nodes >;
};

template<typename Nodes>
struct node_selection<false, Nodes> {
    template<typename Rule>
    using type = tao::pegtl::parse_tree::selector< Rule, Nodes >;
};

// A fragment is any PEGTL rule with a nested `nodes` list of the rules it keeps in the tree.
template<typename Fragment, bool Helpers>
class ComposedParser : public ArgumentParser {
public:
    struct rule : tao::pegtl::must< grammar::skip, Fragment, grammar::skip, tao::pegtl::eof > {};

    ComposedParser(){
        if(tao::pegtl::analyze< rule >(trace_enabled()? 1 : 0) != 0)
            throw grammar_error(make_error(codes::grammar, "Grammar for " + describe() + " failed analysis", {}));
        if(trace_enabled()) std::fprintf(stderr, "[dbg][grammar] composed %s helpers=%d\n", describe().c_str(), (int)Helpers);
    }

    std::unique_ptr<ParseNode> parse(const std::string& text, const SourceMap& map) const override {
        tao::pegtl::memory_input in(text, "arguments");
        try {
            return tao::pegtl::parse_tree::parse< rule, node_selection<Helpers, typename Fragment::nodes>::template type >(in);
        } catch(const tao::pegtl::parse_error& e) {
            throw_syntax_error(e, map, describe());
        }
    }

    std::string describe() const override { return std::string(tao::pegtl::demangle< Fragment >()); }
};

} // namespace pegtl_front

template<typename Fragment>
ArgumentParserPtr compose(const ParseOptions& opts){
    if(opts.use_helpers) return std::make_shared<const pegtl_front::ComposedParser<Fragment, true>>();
    return std::make_shared<const pegtl_front::ComposedParser<Fragment, false>>();
}

inline ArgumentParserPtr null_parser(){ return std::make_shared<const NullParser>(); }

} // namespace fee
