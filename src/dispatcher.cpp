#include "fee/dispatcher.hpp"
#include "fee/features.hpp"
#include "fee/grammar/document.hpp"
#include "fee/session.hpp"
#include <cstdio>
#include <optional>

namespace fee {

StatementGroup parse_document(std::string_view text, const std::string& file){
    tao::pegtl::memory_input in(text.data(), text.size(), file.empty()? std::string("<memory>") : file);
    pegtl_front::build_state st;
    st.file = file;
    try {
        tao::pegtl::parse< pegtl_front::grammar::document, pegtl_front::actions::action >(in, st);
    } catch(const tao::pegtl::parse_error& e) {
        SourceLocation at{file};
        if(!e.positions().empty()){
            auto p = e.positions().front();
            at.line = static_cast<int>(p.line); at.col = static_cast<int>(p.column);
        }
        throw syntax_error(make_error(codes::syntax, "Malformed statement: " + parse_error_message(e), at,
                                      "statements are `Verb args...;` with optional { ... } groups"));
    }
    return std::move(st.top);
}

JoinedText join_tokens(const std::vector<RawArg>& args, size_t first, size_t last){
    JoinedText j;
    for(size_t i=first; i<last && i<args.size(); ++i){
        if(args[i].is_block) continue;
        if(!j.text.empty()) j.text += ' ';
        j.map.add(j.text.size(), args[i].location);
        j.text += args[i].text;
    }
    return j;
}

static std::optional<ArgList> reduce_span(VerbTransformer& t, const ArgumentParser& parser, const std::vector<RawArg>& args, size_t first, size_t last){
    if(first >= last) return std::nullopt;
    auto j = join_tokens(args, first, last);
    auto tree = parser.parse(j.text, j.map);
    if(!tree) return std::nullopt;
    auto reduced = t.transform(tree.get(), j.map);
    if(reduced.empty()) return std::nullopt;
    return reduced;
}

void dispatch(Session& session, Statement& s){
    for(auto& a : s.args) if(a.is_block) dispatch_all(session, a.block);

    const VerbEntry* entry = session.registry().find(s.verb);
    if(!entry){
        session.diagnostics().warn(codes::unknown_verb, "Unknown verb: " + s.verb, s.location);
        s.resolved = false;
        return;
    }
    if(trace_enabled()) std::fprintf(stderr, "[dbg][dispatch] %s at %s\n", s.verb.c_str(), s.location.to_string().c_str());

    auto t = entry->transformer(session);
    t->set_statement_location(s.location);
    if(s.has_blocks()){
        size_t first = s.args.size(), last = 0;
        for(size_t i=0;i<s.args.size();++i) if(s.args[i].is_block){ if(first==s.args.size()) first = i; last = i; }
        BlockArgs b;
        b.location = s.location;
        b.before = reduce_span(*t, *entry->before_brace, s.args, 0, first);
        for(size_t i=first; i<=last; ++i){
            if(s.args[i].is_block) b.groups.push_back(s.args[i].block);
            else b.between.push_back(s.args[i].text);
        }
        b.after = reduce_span(*t, *entry->after_brace, s.args, last+1, s.args.size());
        s.result = t->block_action(std::move(b));
    } else {
        auto j = join_tokens(s.args, 0, s.args.size());
        if(j.map.empty()) j.map.add(0, s.location);
        auto tree = entry->main->parse(j.text, j.map);
        s.result = t->action(t->transform(tree.get(), j.map));
    }
    s.resolved = true;
}

void dispatch_all(Session& session, StatementGroup& statements){
    for(auto& s : statements) dispatch(session, s);
}

} // namespace fee
