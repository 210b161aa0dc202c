// Feature: attaches routines to a feature tag.
#include "fee/plugins.hpp"
#include "fee/session.hpp"

namespace fee::plugins {

namespace {
namespace g = pegtl_front::grammar;
using namespace tao::pegtl;

struct feature_tag : rep_min_max< 1, 4, sor< alnum, one<'_'> > > {};
struct routine_name : g::identifier {};

// Feature tag { ... };
struct feature_block_args : seq< feature_tag > {
    using nodes = parse_tree::store_content::on< feature_tag >;
};
// Feature tag routine...;
struct feature_args : seq< feature_tag, g::skip, star< routine_name, g::skip > > {
    using nodes = parse_tree::store_content::on< feature_tag, routine_name >;
};

class Feature : public VerbTransformer {
public:
    using VerbTransformer::VerbTransformer;

    Value reduce(const ParseNode& n) override {
        if(n.is_type<routine_name>()){
            auto r = session_.features().find_routine(n.string());
            if(!r) throw undefined_reference_error(make_error(codes::undefined_routine, "Undefined routine: " + n.string(), location_of(n)), n.string());
            return Value(std::vector<RoutinePtr>{r}, location_of(n));
        }
        return VerbTransformer::reduce(n);
    }

    Value action(ArgList args) override {
        const std::string& tag = args.at(0).as<std::string>();
        for(size_t i=1; i<args.size(); ++i)
            for(const auto& r : args[i].as<std::vector<RoutinePtr>>()) session_.features().add_feature(tag, r);
        return {};
    }

    Value block_action(BlockArgs args) override {
        if(!args.before) throw syntax_error(make_error(codes::syntax, "Feature needs a tag before its block", args.location));
        if(!args.between.empty() || args.after)
            throw syntax_error(make_error(codes::syntax, "Feature takes a single block", args.location));
        const std::string& tag = args.before->at(0).as<std::string>();
        for(const auto& group : args.groups)
            for(const auto& r : routines_of(group)) session_.features().add_feature(tag, r);
        return {};
    }
};

} // namespace

PluginModule feature(){
    PluginModule m;
    m.name = "Feature";
    m.options = ParseOptions{true};
    m.grammar = fragment<feature_args>();
    m.verbs.push_back(PluginVerb{"Feature", {}, fragment<feature_block_args>(), {}, transformer<Feature>()});
    return m;
}

} // namespace fee::plugins
