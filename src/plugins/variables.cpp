// Set: binds a variable to an integer or a value record.
#include "fee/plugins.hpp"
#include "fee/session.hpp"

namespace fee::plugins {

namespace {
namespace g = pegtl_front::grammar;
using namespace tao::pegtl;

struct variable_name : seq< one<'$'>, g::barename > {};
struct set_variable : seq< variable_name, g::skip, one<'='>, g::skip,
                           sor< g::fee_value_record, g::fea_value_record, g::integer_container > > {
    using nodes = parse_tree::store_content::on< variable_name >;
};

class Set : public VerbTransformer {
public:
    using VerbTransformer::VerbTransformer;

    Value reduce(const ParseNode& n) override {
        if(n.is_type<variable_name>()) return Value(n.children.at(0)->string(), location_of(n));
        return VerbTransformer::reduce(n);
    }

    Value action(ArgList args) override {
        const std::string& name = args.at(0).as<std::string>();
        const Value& v = args.at(1);
        if(v.is<int64_t>()) session_.set_variable(name, v.as<int64_t>());
        else session_.set_variable(name, v.as<ValueRecord>());
        return {};
    }
};

} // namespace

PluginModule variables(){
    PluginModule m;
    m.name = "Variables";
    m.options = ParseOptions{true};
    m.grammar = fragment<set_variable>();
    m.verbs.push_back(PluginVerb{"Set", {}, {}, {}, transformer<Set>()});
    return m;
}

} // namespace fee::plugins
