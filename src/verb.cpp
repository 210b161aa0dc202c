#include "fee/verb.hpp"
#include "fee/class_algebra.hpp"
#include "fee/features.hpp"
#include "fee/session.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace fee {

using namespace pegtl_front;

ArgList VerbTransformer::transform(const ParseNode* root, const SourceMap& map){
    map_ = &map;
    if(!root) return {};
    return reduce_children(*root);
}

ArgList VerbTransformer::reduce_children(const ParseNode& n){
    ArgList out;
    for(const auto& c : n.children) out.push_back(reduce(*c));
    return out;
}

SourceLocation VerbTransformer::location_of(const ParseNode& n) const {
    if(map_ && !map_->empty() && n.has_content()) return map_->locate(n.begin().byte);
    return statement_location_;
}

Value VerbTransformer::reduce(const ParseNode& n){
    auto at = location_of(n);
    if(n.is_type<grammar::glyphselector>()) return Value(reduce_glyphselector(n), at);
    if(n.is_type<grammar::integer_container>() || n.is_type<grammar::signed_number>() ||
       n.is_type<grammar::named_integer>() || n.is_type<grammar::glyph_value>())
        return Value(reduce_integer(n), at);
    if(n.is_type<grammar::valuerecord>() || n.is_type<grammar::fee_value_record>() || n.is_type<grammar::fea_value_record>())
        return Value(reduce_valuerecord(n), at);
    if(n.is_type<grammar::languages>()) return Value(reduce_languages(n), at);
    if(n.is_type<grammar::metric_comparison>()) return Value(reduce_metric_comparison(n), at);
    if(n.is_type<grammar::metric_name>()) return Value(std::string(metric_name(reduce_metric(n))), at);
    if(n.children.empty()) return Value(n.string(), at);
    return Value(ValueList{reduce_children(n)}, at);
}

Value VerbTransformer::block_action(BlockArgs args){
    throw syntax_error(make_error(codes::syntax, "This verb does not take a brace block", args.location));
}

static uint32_t parse_codepoint(const std::string& text){
    // "U+XXXX"
    return static_cast<uint32_t>(std::strtoul(text.c_str()+2, nullptr, 16));
}

GlyphSelector VerbTransformer::reduce_glyphselector(const ParseNode& n){
    auto at = location_of(n);
    GlyphSelector::Variant v;
    std::vector<SuffixOp> suffixes;
    for(const auto& cp : n.children){
        const ParseNode& c = *cp;
        if(c.is_type<grammar::glyphsuffix>()){
            std::string text = c.string();
            SuffixOp op;
            op.kind = text[0]=='~'? SuffixKind::strip : SuffixKind::append;
            op.suffix = text.substr(1);
            suffixes.push_back(std::move(op));
        } else if(c.is_type<grammar::unicoderange>()){
            v = CodepointRange{parse_codepoint(c.children.at(0)->string()), parse_codepoint(c.children.at(1)->string())};
        } else if(c.is_type<grammar::unicodeglyph>()){
            v = Codepoint{parse_codepoint(c.string())};
        } else if(c.is_type<grammar::regex>()){
            std::string text = c.string();
            v = RegexPattern{text.substr(1, text.size()-2)};
        } else if(c.is_type<grammar::classname>()){
            v = ClassName{c.string().substr(1)};
        } else if(c.is_type<grammar::inlineclass>()){
            InlineClass ic;
            for(const auto& m : c.children){
                auto mat = location_of(*m);
                if(m->is_type<grammar::classname>()) ic.members.push_back(make_selector(ClassName{m->string().substr(1)}, mat));
                else ic.members.push_back(make_selector(BareName{m->string()}, mat));
            }
            v = std::move(ic);
        } else if(c.is_type<grammar::barename>()){
            v = BareName{c.string()};
        }
    }
    return make_selector(std::move(v), at, std::move(suffixes));
}

Metric VerbTransformer::reduce_metric(const ParseNode& n){
    std::string name = n.string();
    auto m = metric_from_name(name);
    if(!m){
        std::string known;
        for(const auto& k : metric_names()){ if(!known.empty()) known += ", "; known += k; }
        throw unknown_metric_error(make_error(codes::unknown_metric, "Unknown metric '" + name + "'", location_of(n), "known metrics: " + known));
    }
    return *m;
}

int64_t VerbTransformer::parse_integer(const ParseNode& n) const {
    std::string text = n.string();
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(text.c_str(), &end, 10);
    if(errno==ERANGE) throw syntax_error(make_error(codes::syntax, "Integer '" + text + "' is out of range", location_of(n)));
    if(end==text.c_str() || *end) throw syntax_error(make_error(codes::syntax, "Expected an integer, found '" + text + "'", location_of(n)));
    return static_cast<int64_t>(v);
}

int VerbTransformer::to_coordinate(int64_t v, const SourceLocation& at) const {
    if(v < std::numeric_limits<int16_t>::min() || v > std::numeric_limits<int16_t>::max())
        throw syntax_error(make_error(codes::syntax, "Value " + std::to_string(v) + " does not fit a 16-bit font unit", at));
    return static_cast<int>(v);
}

int64_t VerbTransformer::reduce_integer(const ParseNode& n){
    if(n.is_type<grammar::integer_container>()) return reduce_integer(*n.children.at(0));
    if(n.is_type<grammar::signed_number>()) return parse_integer(n);
    if(n.is_type<grammar::named_integer>()){
        std::string name = n.children.at(0)->string();
        const VariableValue* v = session_.variable(name);
        if(!v) throw undefined_reference_error(make_error(codes::undefined_variable, "Undefined variable: $" + name, location_of(n)), name);
        if(auto i = std::get_if<int64_t>(v)) return *i;
        throw syntax_error(make_error(codes::bad_variable, "Variable $" + name + " holds a value record, not an integer", location_of(n)));
    }
    if(n.is_type<grammar::glyph_value>()){
        Metric m = reduce_metric(*n.children.at(0));
        std::string glyph = n.children.at(1)->string();
        auto gm = session_.font().metrics(glyph);
        if(!gm) throw resolution_error(make_error(codes::missing_metric_glyph, "Font does not contain glyph '" + glyph + "' for metric lookup", location_of(n)));
        return metric_value(*gm, m);
    }
    throw syntax_error(make_error(codes::syntax, "Expected an integer, found '" + n.string() + "'", location_of(n)));
}

ValueRecord VerbTransformer::reduce_valuerecord(const ParseNode& n){
    if(n.is_type<grammar::valuerecord>()) return reduce_valuerecord(*n.children.at(0));
    ValueRecord vr;
    if(n.is_type<grammar::signed_number>()){
        vr.xAdvance = to_coordinate(reduce_integer(n), location_of(n));
    } else if(n.is_type<grammar::named_integer>()){
        std::string name = n.children.at(0)->string();
        const VariableValue* v = session_.variable(name);
        if(!v) throw undefined_reference_error(make_error(codes::undefined_variable, "Undefined variable: $" + name, location_of(n)), name);
        if(auto r = std::get_if<ValueRecord>(v)) vr = *r;
        else vr.xAdvance = to_coordinate(std::get<int64_t>(*v), location_of(n));
    } else if(n.is_type<grammar::fee_value_record>()){
        for(const auto& pair : n.children){
            std::string field = pair->children.at(0)->string();
            int value = to_coordinate(reduce_integer(*pair->children.at(1)), location_of(*pair->children.at(1)));
            if(field=="xPlacement") vr.xPlacement = value;
            else if(field=="yPlacement") vr.yPlacement = value;
            else if(field=="xAdvance") vr.xAdvance = value;
            else vr.yAdvance = value;
        }
    } else if(n.is_type<grammar::fea_value_record>()){
        vr.xPlacement = to_coordinate(reduce_integer(*n.children.at(0)), location_of(*n.children.at(0)));
        vr.yPlacement = to_coordinate(reduce_integer(*n.children.at(1)), location_of(*n.children.at(1)));
        vr.xAdvance = to_coordinate(reduce_integer(*n.children.at(2)), location_of(*n.children.at(2)));
        vr.yAdvance = to_coordinate(reduce_integer(*n.children.at(3)), location_of(*n.children.at(3)));
    }
    return vr;
}

std::vector<LanguageSystem> VerbTransformer::reduce_languages(const ParseNode& n){
    std::vector<LanguageSystem> out;
    for(const auto& pair : n.children)
        out.push_back(LanguageSystem{pair->children.at(0)->string(), pair->children.at(1)->string()});
    return out;
}

Predicate VerbTransformer::reduce_metric_comparison(const ParseNode& n){
    Metric m = reduce_metric(*n.children.at(0));
    auto op = comparator_from_text(n.children.at(1)->string());
    if(!op) throw syntax_error(make_error(codes::syntax, "Unknown comparator '" + n.children.at(1)->string() + "'", location_of(n)));
    return metric_comparison(m, *op, reduce_integer(*n.children.at(2)));
}

GlyphSet VerbTransformer::resolve(const GlyphSelector& s, bool must_exist) const {
    return s.resolve(session_.resolve_context(), must_exist);
}

GlyphSet VerbTransformer::resolve(const Value& v, bool must_exist) const {
    if(auto s = std::get_if<GlyphSelector>(&v.data)) return resolve(*s, must_exist);
    if(auto p = std::get_if<Predicate>(&v.data)) return apply_to_font(*p, session_.font());
    return v.as<GlyphSet>();
}

bool VerbRegistry::register_plugin(const PluginModule& m, DiagnosticSink& sink, const SourceLocation& at){
    auto reject = [&](const std::string& why){
        sink.warn(codes::not_a_plugin, "Module " + m.name + " is not a FEE plugin", at, why);
        return false;
    };
    if(!m.options) return reject("missing parse options");
    if(!m.grammar) return reject("missing module grammar");
    if(m.verbs.empty()) return reject("no verbs listed");
    for(const auto& v : m.verbs)
        if(!v.transformer) return reject("verb " + v.name + " has no transformer");
    if(has_plugin(m.name)) return true;

    const ParseOptions& opts = *m.options;
    ArgumentParserPtr module_parser = m.grammar(opts);
    std::vector<VerbEntry> staged;
    for(const auto& v : m.verbs){
        VerbEntry e;
        e.plugin = m.name;
        e.verb = v.name;
        e.main = v.grammar? v.grammar(opts) : module_parser;
        e.before_brace = v.before_brace_grammar? v.before_brace_grammar(opts) : null_parser();
        e.after_brace = v.after_brace_grammar? v.after_brace_grammar(opts) : null_parser();
        e.transformer = v.transformer;
        staged.push_back(std::move(e));
    }
    for(auto& e : staged){
        if(!entries_.count(e.verb)) verb_order_.push_back(e.verb);
        std::string verb = e.verb;
        entries_[verb] = std::move(e);
    }
    plugins_.push_back(m.name);
    if(trace_enabled()) std::fprintf(stderr, "[dbg][plugin] registered %s (%zu verbs)\n", m.name.c_str(), m.verbs.size());
    return true;
}

const VerbEntry* VerbRegistry::find(const std::string& verb) const {
    auto it = entries_.find(verb);
    return it==entries_.end()? nullptr : &it->second;
}

bool VerbRegistry::has_plugin(const std::string& name) const {
    for(const auto& p : plugins_) if(p==name) return true;
    return false;
}

} // namespace fee
