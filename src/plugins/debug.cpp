// ShowClass, DumpClassNames, DumpClasses: class introspection as note diagnostics.
#include "fee/plugins.hpp"
#include "fee/session.hpp"

namespace fee::plugins {

namespace {
namespace g = pegtl_front::grammar;
using namespace tao::pegtl;

struct show_class : seq< g::glyphselector > {
    using nodes = parse_tree::store_content::on<>;
};
struct no_arguments : success {
    using nodes = parse_tree::store_content::on<>;
};

std::string join(const GlyphSet& glyphs){
    std::string out;
    for(const auto& gl : glyphs){ if(!out.empty()) out += ' '; out += gl; }
    return out;
}

class ShowClass : public VerbTransformer {
public:
    using VerbTransformer::VerbTransformer;
    Value action(ArgList args) override {
        const auto& sel = args.at(0).as<GlyphSelector>();
        session_.diagnostics().note(sel.as_text() + " = " + join(resolve(sel)), statement_location_);
        return {};
    }
};

class DumpClassNames : public VerbTransformer {
public:
    using VerbTransformer::VerbTransformer;
    Value action(ArgList) override {
        session_.diagnostics().note(join(session_.classes().names()), statement_location_);
        return {};
    }
};

class DumpClasses : public VerbTransformer {
public:
    using VerbTransformer::VerbTransformer;
    Value action(ArgList) override {
        const ClassTable& classes = session_.classes();
        for(const auto& name : classes.names())
            session_.diagnostics().note("@" + name + " = " + join(*classes.find(name)), statement_location_);
        return {};
    }
};

} // namespace

PluginModule debug(){
    PluginModule m;
    m.name = "Debug";
    m.options = ParseOptions{true};
    m.grammar = fragment<no_arguments>();
    m.verbs.push_back(PluginVerb{"ShowClass", fragment<show_class>(), {}, {}, transformer<ShowClass>()});
    m.verbs.push_back(PluginVerb{"DumpClassNames", {}, {}, {}, transformer<DumpClassNames>()});
    m.verbs.push_back(PluginVerb{"DumpClasses", {}, {}, {}, transformer<DumpClasses>()});
    return m;
}

} // namespace fee::plugins
