// Anchors records glyph anchors; Attach builds an attachment rule from them.
#include "fee/plugins.hpp"
#include "fee/session.hpp"

namespace fee::plugins {

namespace {
namespace g = pegtl_front::grammar;
using namespace tao::pegtl;

struct anchor_name : g::identifier {};
struct anchor_def : seq< anchor_name, g::skip, one<'<'>, g::skip, g::integer_container, g::skip,
                         g::integer_container, g::skip, one<'>'> > {};
struct anchors_args : seq< g::glyphselector, g::skip, plus< anchor_def, g::skip > > {
    using nodes = parse_tree::store_content::on< anchor_name, anchor_def >;
};

struct anchor_ref : seq< one<'&'>, g::identifier > {};
struct attach_mode : sor< TAO_PEGTL_KEYWORD("bases"), TAO_PEGTL_KEYWORD("marks"), TAO_PEGTL_KEYWORD("cursive") > {};
struct attach_args : seq< anchor_ref, g::skip, anchor_ref, g::skip, opt< attach_mode > > {
    using nodes = parse_tree::store_content::on< anchor_ref, attach_mode >;
};

class Anchors : public VerbTransformer {
public:
    using VerbTransformer::VerbTransformer;
    Value action(ArgList args) override {
        GlyphSet glyphs = resolve(args.at(0));
        for(size_t i=1; i<args.size(); ++i){
            const auto& def = args[i].as<ValueList>().items;
            const std::string& name = def.at(0).as<std::string>();
            AnchorPoint p{to_coordinate(def.at(1).as<int64_t>(), def.at(1).location), to_coordinate(def.at(2).as<int64_t>(), def.at(2).location)};
            for(const auto& gl : glyphs) session_.features().anchors[gl][name] = p;
        }
        return {};
    }
};

class Attach : public VerbTransformer {
public:
    using VerbTransformer::VerbTransformer;

    Value reduce(const ParseNode& n) override {
        if(n.is_type<anchor_ref>()) return Value(n.string().substr(1), location_of(n));
        return VerbTransformer::reduce(n);
    }

    Value action(ArgList args) override {
        Attachment rule;
        rule.base_anchor = args.at(0).as<std::string>();
        rule.mark_anchor = args.at(1).as<std::string>();
        std::string mode = args.size() > 2? args[2].as<std::string>() : std::string("bases");
        rule.cursive = mode=="cursive";
        const FontModel& font = session_.font();
        for(const auto& [glyph, anchors] : session_.features().anchors){
            bool is_mark = font.category(glyph)=="mark";
            auto base = anchors.find(rule.base_anchor);
            if(base != anchors.end()){
                if(rule.cursive || (mode=="bases" && !is_mark) || (mode=="marks" && is_mark)) rule.bases[glyph] = base->second;
            }
            auto mark = anchors.find(rule.mark_anchor);
            if(mark != anchors.end() && (rule.cursive || is_mark)) rule.marks[glyph] = mark->second;
        }
        if(rule.bases.empty() || rule.marks.empty())
            session_.diagnostics().warn(codes::empty_attachment, "Attach &" + rule.base_anchor + " &" + rule.mark_anchor + " matches no glyphs on one side", statement_location_);
        auto routine = make_routine();
        routine->add_rule(std::move(rule));
        return std::vector<RoutinePtr>{routine};
    }
};

} // namespace

PluginModule anchors(){
    PluginModule m;
    m.name = "Anchors";
    m.options = ParseOptions{true};
    m.grammar = fragment<anchors_args>();
    m.verbs.push_back(PluginVerb{"Anchors", {}, {}, {}, transformer<Anchors>()});
    m.verbs.push_back(PluginVerb{"Attach", fragment<attach_args>(), {}, {}, transformer<Attach>()});
    return m;
}

} // namespace fee::plugins
