// Chain: contextual rule calling named routines at input positions.
#include "fee/plugins.hpp"
#include "fee/session.hpp"

namespace fee::plugins {

namespace {
namespace g = pegtl_front::grammar;
using namespace tao::pegtl;

struct lookup_ref : seq< one<'^'>, g::identifier > {};
struct chain_input : seq< g::glyphselector, g::skip, star< lookup_ref, g::skip > > {};
struct chain_core : seq< one<'('>, g::skip, plus< chain_input >, one<')'> > {};
struct chain_args : seq< star< g::glyphselector, g::skip >, chain_core, g::skip, star< g::glyphselector, g::skip >, opt< g::languages > > {
    using nodes = parse_tree::store_content::on< lookup_ref, chain_input, chain_core >;
};

class Chain : public VerbTransformer {
public:
    using VerbTransformer::VerbTransformer;

    Value reduce(const ParseNode& n) override {
        if(n.is_type<lookup_ref>()){
            std::string name = n.string().substr(1);
            auto r = session_.features().find_routine(name);
            if(!r) throw undefined_reference_error(make_error(codes::undefined_routine, "Undefined routine: " + name, location_of(n)), name);
            return Value(std::vector<RoutinePtr>{r}, location_of(n));
        }
        return VerbTransformer::reduce(n);
    }

    Value action(ArgList args) override {
        Chaining rule;
        bool seen_core = false;
        for(const auto& v : args){
            if(v.is<ValueList>()){
                seen_core = true;
                for(const auto& input : v.as<ValueList>().items){
                    const auto& parts = input.as<ValueList>().items;
                    rule.input.push_back(resolve(parts.at(0)));
                    std::vector<RoutinePtr> lookups;
                    for(size_t i=1; i<parts.size(); ++i){
                        const auto& rs = parts[i].as<std::vector<RoutinePtr>>();
                        lookups.insert(lookups.end(), rs.begin(), rs.end());
                    }
                    rule.lookups.push_back(std::move(lookups));
                }
            } else if(v.is<std::vector<LanguageSystem>>()){
                rule.languages = v.as<std::vector<LanguageSystem>>();
            } else {
                (seen_core? rule.postcontext : rule.precontext).push_back(resolve(v));
            }
        }
        auto routine = make_routine();
        routine->add_rule(std::move(rule));
        return std::vector<RoutinePtr>{routine};
    }
};

} // namespace

PluginModule chain(){
    PluginModule m;
    m.name = "Chain";
    m.options = ParseOptions{true};
    m.grammar = fragment<chain_args>();
    m.verbs.push_back(PluginVerb{"Chain", {}, {}, {}, transformer<Chain>()});
    return m;
}

} // namespace fee::plugins
