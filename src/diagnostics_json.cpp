#include "fee/diagnostics_json.hpp"
#include "fee/features.hpp"
#include <sstream>
#include <cstdio>

namespace fee {

std::string json_escape(const std::string& s){
    std::string out;
    out.reserve(s.size()+2);
    out += '"';
    for(char c : s){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){
                    char buf[7]; std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

static void append_notes_json(std::ostringstream& os, const std::vector<DiagnosticNote>& notes){
    os<<"[";
    for(size_t i=0;i<notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(notes[i].message)
          <<",\"line\":"<<notes[i].line
          <<",\"col\":"<<notes[i].col
          <<"}";
    }
    os<<"]";
}

static const char* severity_json(Severity s){
    switch(s){
        case Severity::note: return "note";
        case Severity::warning: return "warning";
        case Severity::error: return "error";
    }
    return "warning";
}

static void append_diagnostic_json(std::ostringstream& os, const Diagnostic& d){
    os<<"{"
        "\"code\":"<<json_escape(d.code)
        <<",\"severity\":\""<<severity_json(d.severity)<<"\""
        <<",\"message\":"<<json_escape(d.message)
        <<",\"hint\":"<<json_escape(d.hint)
        <<",\"file\":"<<json_escape(d.file)
        <<",\"line\":"<<d.line
        <<",\"col\":"<<d.col
        <<",\"notes\":";
    append_notes_json(os,d.notes);
    os<<"}";
}

std::string diagnostics_to_json(const CompileResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"errors\":[";
    for(size_t i=0;i<r.errors.size(); ++i){
        if(i) os<<",";
        append_diagnostic_json(os, r.errors[i]);
    }
    os<<"],\"warnings\":[";
    for(size_t i=0;i<r.warnings.size(); ++i){
        if(i) os<<",";
        append_diagnostic_json(os, r.warnings[i]);
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const CompileResult& r){
    if(diag_json_enabled()){
        auto js=diagnostics_to_json(r);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace fee
