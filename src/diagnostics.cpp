#include "fee/diagnostics.hpp"
#include "fee/features.hpp"
#include <cstdio>
#include <sstream>

namespace fee {

std::string SourceLocation::to_string() const {
    std::ostringstream os;
    os << (file.empty()? "<memory>" : file);
    if(line >= 0) os << ':' << line << ':' << col;
    return os.str();
}

static const char* severity_name(Severity s){
    switch(s){
        case Severity::note: return "note";
        case Severity::warning: return "warning";
        case Severity::error: return "error";
    }
    return "warning";
}

std::string format_diagnostic(const Diagnostic& d){
    std::ostringstream os;
    os << d.location().to_string() << ": " << severity_name(d.severity) << '[' << d.code << "]: " << d.message;
    if(!d.hint.empty()) os << " (hint: " << d.hint << ')';
    for(const auto& n : d.notes) os << "\n  note: " << n.message;
    return os.str();
}

void DiagnosticSink::emit(Diagnostic d){
    if(trace_enabled()) std::fprintf(stderr, "[dbg][diag] %s\n", format_diagnostic(d).c_str());
    diags_.push_back(std::move(d));
}

void DiagnosticSink::warn(std::string code, std::string message, const SourceLocation& at, std::string hint){
    Diagnostic d{std::move(code), std::move(message), std::move(hint), at.file, at.line, at.col, {}, Severity::warning};
    emit(std::move(d));
}

void DiagnosticSink::note(std::string message, const SourceLocation& at){
    Diagnostic d{codes::debug, std::move(message), "", at.file, at.line, at.col, {}, Severity::note};
    emit(std::move(d));
}

std::vector<Diagnostic> DiagnosticSink::warnings() const {
    std::vector<Diagnostic> out;
    for(const auto& d : diags_) if(d.severity==Severity::warning) out.push_back(d);
    return out;
}

size_t DiagnosticSink::count(const std::string& code) const {
    size_t n=0; for(const auto& d : diags_) if(d.code==code) ++n; return n;
}

Diagnostic make_error(std::string code, std::string message, const SourceLocation& at, std::string hint){
    return Diagnostic{std::move(code), std::move(message), std::move(hint), at.file, at.line, at.col, {}, Severity::error};
}

compile_error::compile_error(Diagnostic d)
    : std::runtime_error(format_diagnostic(d)), diag_(std::move(d)) {}

} // namespace fee
