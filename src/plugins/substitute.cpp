// Substitute: one substitution rule in an anonymous routine.
#include "fee/plugins.hpp"
#include "fee/session.hpp"

namespace fee::plugins {

namespace {
namespace g = pegtl_front::grammar;
using namespace tao::pegtl;

struct arrow : string<'-', '>'> {};
struct substitute_args : seq< plus< g::glyphselector, g::skip >, arrow, g::skip, plus< g::glyphselector, g::skip >, opt< g::languages > > {
    using nodes = parse_tree::store_content::on< arrow >;
};

class Substitute : public VerbTransformer {
public:
    using VerbTransformer::VerbTransformer;
    Value action(ArgList args) override {
        Substitution rule;
        bool after_arrow = false;
        for(const auto& v : args){
            if(v.is<std::string>()){ after_arrow = true; continue; }
            if(v.is<std::vector<LanguageSystem>>()){ rule.languages = v.as<std::vector<LanguageSystem>>(); continue; }
            GlyphSet glyphs = resolve(v);
            (after_arrow? rule.replacement : rule.input).push_back(std::move(glyphs));
        }
        check_shape(rule);
        auto routine = make_routine();
        routine->add_rule(std::move(rule));
        return std::vector<RoutinePtr>{routine};
    }

private:
    void check_shape(const Substitution& rule) const {
        if(rule.input.size()==1 && rule.replacement.size()==1){
            size_t in = rule.input[0].size(), out = rule.replacement[0].size();
            if(out != 1 && out != in)
                throw resolution_error(make_error(codes::bad_rule, "Substitution maps " + std::to_string(in) + " glyphs onto " +
                                                  std::to_string(out), statement_location_, "replacement must be one glyph or match the input size"));
        }
    }
};

} // namespace

PluginModule substitute(){
    PluginModule m;
    m.name = "Substitute";
    m.options = ParseOptions{true};
    m.grammar = fragment<substitute_args>();
    m.verbs.push_back(PluginVerb{"Substitute", {}, {}, {}, transformer<Substitute>()});
    return m;
}

} // namespace fee::plugins
