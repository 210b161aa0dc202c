// LoadPlugin: registers a built-in plugin by name.
#include "fee/plugins.hpp"
#include "fee/session.hpp"

namespace fee::plugins {

namespace {
namespace g = pegtl_front::grammar;
using namespace tao::pegtl;

struct plugin_name : g::identifier {};
struct load_plugin_args : seq< plugin_name > {
    using nodes = parse_tree::store_content::on< plugin_name >;
};

class LoadPlugin : public VerbTransformer {
public:
    using VerbTransformer::VerbTransformer;
    Value action(ArgList args) override {
        session_.load_plugin(args.at(0).as<std::string>(), args.at(0).location);
        return {};
    }
};

} // namespace

PluginModule load_plugin(){
    PluginModule m;
    m.name = "LoadPlugin";
    m.options = ParseOptions{false};
    m.grammar = fragment<load_plugin_args>();
    m.verbs.push_back(PluginVerb{"LoadPlugin", {}, {}, {}, transformer<LoadPlugin>()});
    return m;
}

} // namespace fee::plugins
