// Include: compiles another rule file into the same session.
#include "fee/plugins.hpp"
#include "fee/session.hpp"

namespace fee::plugins {

namespace {
using namespace tao::pegtl;

struct include_path : plus< not_one<' ', '\t', '\r', '\n', ';'> > {};
struct include_args : seq< include_path > {
    using nodes = parse_tree::store_content::on< include_path >;
};

class Include : public VerbTransformer {
public:
    using VerbTransformer::VerbTransformer;
    Value action(ArgList args) override {
        const Value& path = args.at(0);
        auto statements = session_.include_file(path.as<std::string>(), path.location);
        return routines_of(statements);
    }
};

} // namespace

PluginModule include(){
    PluginModule m;
    m.name = "Include";
    m.options = ParseOptions{false};
    m.grammar = fragment<include_args>();
    m.verbs.push_back(PluginVerb{"Include", {}, {}, {}, transformer<Include>()});
    return m;
}

} // namespace fee::plugins
