// DefineClass and DefineClassBinned: named classes from selector algebra and predicates.
#include "fee/binning.hpp"
#include "fee/class_algebra.hpp"
#include "fee/plugins.hpp"
#include "fee/session.hpp"
#include <re2/re2.h>

namespace fee::plugins {

namespace {
namespace g = pegtl_front::grammar;
using namespace tao::pegtl;

struct conjunctor : sor< one<'|'>, one<'&'>, one<'-'>, TAO_PEGTL_KEYWORD("and") > {};

struct replacement : star< g::glyph_mid > {};
struct hasglyph_predicate : seq< TAO_PEGTL_STRING("hasglyph"), g::skip, one<'('>, g::skip, g::regex, g::skip, replacement, g::skip, one<')'> > {};
struct hasanchor_predicate : seq< TAO_PEGTL_STRING("hasanchor"), g::skip, one<'('>, g::skip, g::barename, g::skip, one<')'> > {};
struct category_predicate : seq< TAO_PEGTL_STRING("category"), g::skip, one<'('>, g::skip, g::barename, g::skip, one<')'> > {};
struct predicate : sor< hasglyph_predicate, hasanchor_predicate, category_predicate, g::metric_comparison > {};

struct class_expression;
struct paren_expression : seq< one<'('>, g::skip, class_expression, g::skip, one<')'> > {};
struct negated_predicate : seq< TAO_PEGTL_KEYWORD("not"), g::skip, sor< predicate, paren_expression > > {};
struct operand : sor< negated_predicate, predicate, paren_expression, g::glyphselector > {};
struct class_expression : seq< operand, star< g::skip, conjunctor, g::skip, operand > > {};

using expression_nodes = parse_tree::store_content::on<
    conjunctor, replacement, hasglyph_predicate, hasanchor_predicate, category_predicate,
    paren_expression, negated_predicate, class_expression >;

struct define_class : seq< g::classname, g::skip, one<'='>, g::skip, class_expression > {
    using nodes = expression_nodes;
};

struct bin_count : plus< digit > {};
struct define_class_binned : seq< g::classname, g::skip, one<'['>, g::skip, g::metric_name, g::skip, one<','>, g::skip,
                                  bin_count, g::skip, one<']'>, g::skip, one<'='>, g::skip, class_expression > {
    using nodes = parse_tree::store_content::on<
        conjunctor, replacement, hasglyph_predicate, hasanchor_predicate, category_predicate,
        paren_expression, negated_predicate, class_expression, bin_count >;
};

// Evaluates class expressions; shared by both verbs.
class ClassExpressionTransformer : public VerbTransformer {
public:
    using VerbTransformer::VerbTransformer;

    Value reduce(const ParseNode& n) override {
        if(n.is_type<class_expression>() || n.is_type<paren_expression>() || n.is_type<negated_predicate>() ||
           n.is_type<hasglyph_predicate>() || n.is_type<hasanchor_predicate>() || n.is_type<category_predicate>()){
            ClassOperand op = operand_of(n);
            if(auto s = std::get_if<GlyphSet>(&op)) return Value(std::move(*s), location_of(n));
            return Value(std::get<Predicate>(std::move(op)), location_of(n));
        }
        if(n.is_type<g::classname>()) return Value(n.string().substr(1), location_of(n));
        if(n.is_type<bin_count>()) return Value(parse_integer(n), location_of(n));
        return VerbTransformer::reduce(n);
    }

protected:
    ClassOperand operand_of(const ParseNode& n){
        const FontModel& font = session_.font();
        if(n.is_type<class_expression>()){
            ClassOperand acc = operand_of(*n.children.at(0));
            for(size_t i=1; i+1<n.children.size(); i+=2){
                auto op = conjunctor_from_text(n.children[i]->string());
                if(!op) throw syntax_error(make_error(codes::syntax, "Unknown conjunctor '" + n.children[i]->string() + "'", location_of(*n.children[i])));
                acc = conjoin(acc, *op, operand_of(*n.children[i+1]), font);
            }
            return acc;
        }
        if(n.is_type<paren_expression>()) return operand_of(*n.children.at(0));
        if(n.is_type<negated_predicate>()){
            ClassOperand inner = operand_of(*n.children.at(0));
            if(auto p = std::get_if<Predicate>(&inner)) return negate(*p);
            throw syntax_error(make_error(codes::syntax, "'not' applies to predicates, not glyph classes", location_of(n)));
        }
        if(n.is_type<g::metric_comparison>()) return reduce_metric_comparison(n);
        if(n.is_type<hasglyph_predicate>()){
            std::string text = n.children.at(0)->string();
            std::string pattern = text.substr(1, text.size()-2);
            std::string with = n.children.size() > 1? n.children[1]->string() : std::string();
            auto re = std::make_shared<const RE2>(pattern, RE2::Quiet);
            if(!re->ok()) throw resolution_error(make_error(codes::bad_regex, "Couldn't parse regular expression '" + pattern + "': " + re->error(), location_of(n)));
            return has_glyph(re, with, font);
        }
        if(n.is_type<hasanchor_predicate>()) return has_anchor(n.children.at(0)->string(), session_.features());
        if(n.is_type<category_predicate>()) return category_is(n.children.at(0)->string(), font);
        if(n.is_type<g::glyphselector>()) return resolve(reduce_glyphselector(n));
        throw syntax_error(make_error(codes::syntax, "Unexpected class operand '" + n.string() + "'", location_of(n)));
    }

    GlyphSet glyphs_of(const Value& v){
        return v.is<Predicate>()? apply_to_font(v.as<Predicate>(), session_.font()) : v.as<GlyphSet>();
    }
};

class DefineClass : public ClassExpressionTransformer {
public:
    using ClassExpressionTransformer::ClassExpressionTransformer;
    Value action(ArgList args) override {
        const std::string& name = args.at(0).as<std::string>();
        session_.classes().define(name, glyphs_of(args.at(1)));
        return {};
    }
};

class DefineClassBinned : public ClassExpressionTransformer {
public:
    using ClassExpressionTransformer::ClassExpressionTransformer;
    Value action(ArgList args) override {
        const std::string& name = args.at(0).as<std::string>();
        auto metric = metric_from_name(args.at(1).as<std::string>());
        int64_t count = args.at(2).as<int64_t>();
        if(count < 1) throw syntax_error(make_error(codes::syntax, "Bin count must be at least 1", args.at(2).location));
        if(count > static_cast<int64_t>(max_bin_count))
            throw syntax_error(make_error(codes::syntax, "Bin count " + std::to_string(count) + " exceeds the limit of " +
                std::to_string(max_bin_count), args.at(2).location));
        GlyphSet glyphs = glyphs_of(args.at(3));
        auto bins = bin_glyphs_by_metric(session_.font(), glyphs, *metric, static_cast<size_t>(count));
        size_t empty = 0;
        for(size_t i=0; i<bins.size(); ++i){
            if(bins[i].glyphs.empty()) ++empty;
            session_.classes().define(name + "_" + metric_name(*metric) + std::to_string(i+1), bins[i].glyphs);
        }
        if(empty)
            session_.diagnostics().warn(codes::sparse_bins, "Only " + std::to_string(bins.size()-empty) + " distinct " + metric_name(*metric) +
                " values for " + std::to_string(count) + " bins of @" + name, statement_location_, "trailing bins are empty");
        return {};
    }
};

} // namespace

PluginModule class_definition(){
    PluginModule m;
    m.name = "ClassDefinition";
    m.options = ParseOptions{true};
    m.grammar = fragment<define_class>();
    m.verbs.push_back(PluginVerb{"DefineClass", fragment<define_class>(), {}, {}, transformer<DefineClass>()});
    m.verbs.push_back(PluginVerb{"DefineClassBinned", fragment<define_class_binned>(), {}, {}, transformer<DefineClassBinned>()});
    return m;
}

} // namespace fee::plugins
