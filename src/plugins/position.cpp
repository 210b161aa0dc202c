// Position: one positioning rule in an anonymous routine.
#include "fee/plugins.hpp"
#include "fee/session.hpp"

namespace fee::plugins {

namespace {
namespace g = pegtl_front::grammar;
using namespace tao::pegtl;

struct position_args : seq< plus< g::glyphselector, g::skip, opt< g::valuerecord, g::skip > >, opt< g::languages > > {
    using nodes = parse_tree::store_content::on<>;
};

class Position : public VerbTransformer {
public:
    using VerbTransformer::VerbTransformer;
    Value action(ArgList args) override {
        Positioning rule;
        for(const auto& v : args){
            if(v.is<ValueRecord>()) rule.values.back() = v.as<ValueRecord>();
            else if(v.is<std::vector<LanguageSystem>>()) rule.languages = v.as<std::vector<LanguageSystem>>();
            else { rule.glyphs.push_back(resolve(v)); rule.values.emplace_back(); }
        }
        auto routine = make_routine();
        routine->add_rule(std::move(rule));
        return std::vector<RoutinePtr>{routine};
    }
};

} // namespace

PluginModule position(){
    PluginModule m;
    m.name = "Position";
    m.options = ParseOptions{true};
    m.grammar = fragment<position_args>();
    m.verbs.push_back(PluginVerb{"Position", {}, {}, {}, transformer<Position>()});
    return m;
}

} // namespace fee::plugins
