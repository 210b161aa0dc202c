#include "fee/font_snapshot.hpp"
#include "fee/diagnostics.hpp"
#include "fee/grammar/composer.hpp"
#include "fee/grammar/helpers.hpp"
#include "fee/session.hpp"
#include <tao/pegtl.hpp>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>

namespace fee {

namespace pegtl_front {

struct snapshot_state {
    MemoryFont font;
    GlyphRecord glyph;
    std::string key;
    bool has_lsb=false, has_rsb=false, has_xmax=false;
};

namespace grammar {

struct blank : one<' ', '\t'> {};
struct glyph_keyword : TAO_PEGTL_KEYWORD("glyph") {};
struct glyph_name : barename {};
struct property_key : seq< alpha, star< alnum > > {};
struct property_value : plus< not_one<' ', '\t', '\r', '\n', '#'> > {};
struct property : seq< property_key, one<'='>, must< property_value > > {};
struct glyph_end : seq< star< blank >, sor< eolf, at< one<'#'> > > > {};
struct glyph_decl : seq< glyph_keyword, plus< blank >, must< glyph_name >, star< plus< blank >, property >, must< glyph_end > > {};
struct snapshot : must< skip, star< glyph_decl, skip >, eof > {};

} // namespace grammar

namespace snapshot_actions {
using namespace tao::pegtl;

template<typename Rule>
struct action : nothing<Rule> {};

template<typename Input>
int to_int(const std::string& text, const Input& in){
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(text.c_str(), &end, 10);
    if(errno || end==text.c_str() || *end) throw parse_error("expected an integer, found '" + text + "'", in);
    return static_cast<int>(v);
}

template<> struct action< grammar::glyph_name > {
    template<typename Input>
    static void apply(const Input& in, snapshot_state& st){
        st.glyph = GlyphRecord{};
        st.glyph.name = in.string();
        st.has_lsb = st.has_rsb = st.has_xmax = false;
    }
};

template<> struct action< grammar::property_key > {
    template<typename Input>
    static void apply(const Input& in, snapshot_state& st){ st.key = in.string(); }
};

template<> struct action< grammar::property_value > {
    template<typename Input>
    static void apply(const Input& in, snapshot_state& st){
        const std::string v = in.string();
        const std::string& k = st.key;
        GlyphMetrics& m = st.glyph.metrics;
        if(k=="width") m.width = to_int(v, in);
        else if(k=="lsb"){ m.lsb = to_int(v, in); st.has_lsb = true; }
        else if(k=="rsb"){ m.rsb = to_int(v, in); st.has_rsb = true; }
        else if(k=="xMin") m.xMin = to_int(v, in);
        else if(k=="xMax"){ m.xMax = to_int(v, in); st.has_xmax = true; }
        else if(k=="yMin") m.yMin = to_int(v, in);
        else if(k=="yMax") m.yMax = to_int(v, in);
        else if(k=="rise") m.rise = to_int(v, in);
        else if(k=="run") m.run = to_int(v, in);
        else if(k=="category") st.glyph.category = v;
        else if(k=="export"){
            if(v=="yes") st.glyph.exported = true;
            else if(v=="no") st.glyph.exported = false;
            else throw parse_error("export must be yes or no", in);
        } else if(k=="unicode"){
            size_t start = 0;
            while(start <= v.size()){
                size_t comma = v.find(',', start);
                std::string cp = v.substr(start, comma==std::string::npos? std::string::npos : comma-start);
                char* end = nullptr;
                unsigned long value = std::strtoul(cp.c_str(), &end, 16);
                if(cp.empty() || *end) throw parse_error("bad codepoint '" + cp + "'", in);
                st.glyph.codepoints.push_back(static_cast<uint32_t>(value));
                if(comma==std::string::npos) break;
                start = comma + 1;
            }
        } else if(k=="anchor"){
            // name:x,y
            size_t colon = v.find(':'), comma = v.find(',', colon==std::string::npos? 0 : colon);
            if(colon==std::string::npos || comma==std::string::npos) throw parse_error("anchor must be name:x,y", in);
            st.glyph.anchors[v.substr(0, colon)] = AnchorPoint{to_int(v.substr(colon+1, comma-colon-1), in), to_int(v.substr(comma+1), in)};
        } else {
            throw parse_error("unknown glyph property '" + k + "'", in);
        }
    }
};

template<> struct action< grammar::glyph_decl > {
    template<typename Input>
    static void apply(const Input& in, snapshot_state& st){
        GlyphMetrics& m = st.glyph.metrics;
        if(!st.has_xmax) m.xMax = m.width;
        if(!st.has_lsb) m.lsb = m.xMin;
        if(!st.has_rsb) m.rsb = m.width - m.xMax;
        try {
            st.font.add_glyph(std::move(st.glyph));
        } catch(const std::invalid_argument& e) {
            throw parse_error(e.what(), in);
        }
    }
};

} // namespace snapshot_actions

} // namespace pegtl_front

MemoryFont load_font_snapshot(std::string_view text, const std::string& source){
    tao::pegtl::memory_input in(text.data(), text.size(), source.empty()? std::string("<memory>") : source);
    pegtl_front::snapshot_state st;
    try {
        tao::pegtl::parse< pegtl_front::grammar::snapshot, pegtl_front::snapshot_actions::action >(in, st);
    } catch(const tao::pegtl::parse_error& e) {
        SourceLocation at{source};
        if(!e.positions().empty()){
            at.line = static_cast<int>(e.positions().front().line);
            at.col = static_cast<int>(e.positions().front().column);
        }
        throw syntax_error(make_error(codes::syntax, "Malformed font snapshot: " + parse_error_message(e), at));
    }
    return std::move(st.font);
}

MemoryFont load_font_snapshot_file(const std::string& path){
    return load_font_snapshot(read_source_file(path), path);
}

} // namespace fee
