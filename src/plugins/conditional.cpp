// If/Else: keeps the routines of the branch whose comparison holds.
#include "fee/plugins.hpp"
#include "fee/session.hpp"

namespace fee::plugins {

namespace {
namespace g = pegtl_front::grammar;
using namespace tao::pegtl;

struct condition : seq< g::integer_container, g::skip, g::comparator, g::skip, g::integer_container > {
    using nodes = parse_tree::store_content::on<>;
};

class If : public VerbTransformer {
public:
    using VerbTransformer::VerbTransformer;

    Value action(ArgList) override {
        throw syntax_error(make_error(codes::syntax, "If needs a block", statement_location_));
    }

    Value block_action(BlockArgs args) override {
        if(!args.before || args.before->size() != 3)
            throw syntax_error(make_error(codes::syntax, "If needs a comparison before its block", args.location));
        if(args.after) throw syntax_error(make_error(codes::syntax, "Unexpected arguments after If block", args.location));
        if(args.groups.size() > 2 || (args.groups.size()==2 && (args.between.size()!=1 || args.between[0]!="Else")))
            throw syntax_error(make_error(codes::syntax, "If takes a block and an optional Else block", args.location));
        const auto& cond = *args.before;
        auto op = comparator_from_text(cond.at(1).as<std::string>());
        bool taken = compare(cond.at(0).as<int64_t>(), *op, cond.at(2).as<int64_t>());
        if(taken) return routines_of(args.groups.at(0));
        if(args.groups.size()==2) return routines_of(args.groups[1]);
        return std::vector<RoutinePtr>{};
    }
};

} // namespace

PluginModule conditional(){
    PluginModule m;
    m.name = "Conditional";
    m.options = ParseOptions{true};
    m.grammar = fragment<condition>();
    m.verbs.push_back(PluginVerb{"If", {}, fragment<condition>(), {}, transformer<If>()});
    return m;
}

} // namespace fee::plugins
