// Routine: merges the rules of a block into one routine with lookup flags.
#include "fee/plugins.hpp"
#include "fee/session.hpp"

namespace fee::plugins {

namespace {
namespace g = pegtl_front::grammar;
using namespace tao::pegtl;

struct routine_name : g::identifier {};
struct routine_head : opt< routine_name > {
    using nodes = parse_tree::store_content::on< routine_name >;
};

struct simple_flag : sor< TAO_PEGTL_KEYWORD("RightToLeft"), TAO_PEGTL_KEYWORD("IgnoreBases"),
                          TAO_PEGTL_KEYWORD("IgnoreLigatures"), TAO_PEGTL_KEYWORD("IgnoreMarks") > {};
struct mark_filtering_flag : seq< TAO_PEGTL_KEYWORD("UseMarkFilteringSet"), g::skip, g::glyphselector > {};
struct mark_attachment_flag : seq< TAO_PEGTL_KEYWORD("MarkAttachmentType"), g::skip, g::signed_number > {};
struct routine_flags : star< sor< simple_flag, mark_filtering_flag, mark_attachment_flag >, g::skip > {
    using nodes = parse_tree::store_content::on< simple_flag, mark_filtering_flag, mark_attachment_flag >;
};

class Routine : public VerbTransformer {
public:
    using VerbTransformer::VerbTransformer;

    Value reduce(const ParseNode& n) override {
        if(n.is_type<simple_flag>()){
            std::string f = n.string();
            int64_t bit = f=="RightToLeft"? lookup_flags::right_to_left
                        : f=="IgnoreBases"? lookup_flags::ignore_bases
                        : f=="IgnoreLigatures"? lookup_flags::ignore_ligatures : lookup_flags::ignore_marks;
            return Value(bit, location_of(n));
        }
        if(n.is_type<mark_filtering_flag>())
            return Value(resolve(reduce_glyphselector(*n.children.at(0))), location_of(n));
        if(n.is_type<mark_attachment_flag>()){
            int64_t cls = reduce_integer(*n.children.at(0));
            if(cls < 0 || cls > 0xFF) throw syntax_error(make_error(codes::syntax, "Mark attachment type must be 0..255", location_of(n)));
            return Value(static_cast<int64_t>(cls << 8), location_of(n));
        }
        return VerbTransformer::reduce(n);
    }

    Value action(ArgList) override {
        throw syntax_error(make_error(codes::syntax, "Routine needs a block of rules", statement_location_));
    }

    Value block_action(BlockArgs args) override {
        if(!args.between.empty()) throw syntax_error(make_error(codes::syntax, "Routine takes a single block", args.location));
        auto routine = make_routine(args.before? args.before->at(0).as<std::string>() : std::string());
        for(const auto& group : args.groups)
            for(const auto& r : routines_of(group))
                for(const auto& rule : r->rules) routine->add_rule(rule);
        uint32_t flags = 0;
        if(args.after){
            for(const auto& v : *args.after){
                if(v.is<GlyphSet>()){
                    flags |= lookup_flags::use_mark_filtering_set;
                    routine->mark_filtering_set = v.as<GlyphSet>();
                } else {
                    flags |= static_cast<uint32_t>(v.as<int64_t>());
                }
            }
        }
        routine->apply_flags(flags);
        if(!routine->name.empty()) session_.features().add_routine(routine);
        return std::vector<RoutinePtr>{routine};
    }
};

} // namespace

PluginModule routine(){
    PluginModule m;
    m.name = "Routine";
    m.options = ParseOptions{true};
    m.grammar = fragment<routine_head>();
    m.verbs.push_back(PluginVerb{"Routine", {}, fragment<routine_head>(), fragment<routine_flags>(), transformer<Routine>()});
    return m;
}

} // namespace fee::plugins
