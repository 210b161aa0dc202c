// Document grammar: statements of a verb, whitespace-delimited argument tokens and brace groups.
#pragma once
#include "fee/grammar/helpers.hpp"
#include "fee/statement.hpp"
#include <tao/pegtl.hpp>
#include <string>
#include <vector>

namespace fee::pegtl_front {

// Statements and groups under construction; innermost last.
struct build_state {
    std::string file;
    StatementGroup top;
    std::vector<Statement> open;
    std::vector<StatementGroup> groups;
    StatementGroup& sink(){ return groups.empty()? top : groups.back(); }

    template<typename Input>
    SourceLocation here(const Input& in) const {
        auto p = in.position();
        return SourceLocation{file, static_cast<int>(p.line), static_cast<int>(p.column)};
    }
};

namespace grammar {

struct verb_name : seq< upper, plus< sor< alnum, one<'_'> > > > {};
// A /regex/ span is taken whole so quantifier braces stay inside the token.
struct arg_token : seq< not_at< one<'#'> >, plus< sor< regex, not_one<' ', '\t', '\r', '\n', ';', '{', '}'> > > > {};
struct block_open : one<'{'> {};
struct block_close : one<'}'> {};
struct statement_end : one<';'> {};

struct statement;
struct block : seq< block_open, skip, star< statement, skip >, must< block_close > > {};
struct statement : seq< verb_name, skip, star< sor< block, arg_token >, skip >, must< statement_end > > {};
struct document : must< skip, star< statement, skip >, eof > {};

} // namespace grammar

namespace actions {
using namespace tao::pegtl;

template<typename Rule>
struct action : nothing<Rule> {};

template<> struct action< grammar::verb_name > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        Statement s; s.verb = in.string(); s.location = st.here(in);
        st.open.push_back(std::move(s));
    }
};

template<> struct action< grammar::arg_token > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        RawArg a; a.text = in.string(); a.location = st.here(in);
        st.open.back().args.push_back(std::move(a));
    }
};

template<> struct action< grammar::block_open > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.groups.emplace_back(); }
};

template<> struct action< grammar::block_close > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        RawArg a; a.is_block = true; a.location = st.here(in); a.text = "{...}";
        a.block = std::move(st.groups.back());
        st.groups.pop_back();
        st.open.back().args.push_back(std::move(a));
    }
};

template<> struct action< grammar::statement_end > {
    template<typename Input>
    static void apply(const Input&, build_state& st){
        Statement s = std::move(st.open.back());
        st.open.pop_back();
        st.sink().push_back(std::move(s));
    }
};

} // namespace actions

} // namespace fee::pegtl_front
