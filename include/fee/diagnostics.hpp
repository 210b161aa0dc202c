// Diagnostics records, the session sink, and the fatal error hierarchy
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace fee {

struct SourceLocation {
    std::string file;
    int line=-1;
    int col=-1;
    bool known() const { return line >= 0; }
    std::string to_string() const;
};

enum class Severity { note, warning, error };

struct DiagnosticNote { std::string message; int line=-1; int col=-1; };
struct Diagnostic {
    std::string code; std::string message; std::string hint;
    std::string file; int line=-1; int col=-1;
    std::vector<DiagnosticNote> notes;
    Severity severity=Severity::warning;
    SourceLocation location() const { return SourceLocation{file,line,col}; }
};

// Formats "file:line:col: warning[W0101]: message"
std::string format_diagnostic(const Diagnostic& d);

// Collects warnings and debug notes in emission order. Never throws.
class DiagnosticSink {
public:
    void emit(Diagnostic d);
    void warn(std::string code, std::string message, const SourceLocation& at, std::string hint="");
    void note(std::string message, const SourceLocation& at);
    const std::vector<Diagnostic>& diagnostics() const { return diags_; }
    std::vector<Diagnostic> warnings() const;
    size_t count(const std::string& code) const;
    void clear(){ diags_.clear(); }
private:
    std::vector<Diagnostic> diags_;
};

Diagnostic make_error(std::string code, std::string message, const SourceLocation& at, std::string hint="");

// Base of every fatal compile error; what() carries the formatted location and cause.
struct compile_error : std::runtime_error {
    explicit compile_error(Diagnostic d);
    const Diagnostic& diagnostic() const { return diag_; }
private:
    Diagnostic diag_;
};

struct grammar_error : compile_error { using compile_error::compile_error; };
struct syntax_error : compile_error { using compile_error::compile_error; };
struct unknown_metric_error : compile_error { using compile_error::compile_error; };
struct resolution_error : compile_error { using compile_error::compile_error; };
struct include_error : compile_error { using compile_error::compile_error; };

struct undefined_reference_error : compile_error {
    undefined_reference_error(Diagnostic d, std::string identifier)
        : compile_error(std::move(d)), identifier_(std::move(identifier)) {}
    const std::string& identifier() const { return identifier_; }
private:
    std::string identifier_;
};

// Error/warning codes
namespace codes {
inline constexpr const char* grammar = "E0100";
inline constexpr const char* syntax = "E0200";
inline constexpr const char* undefined_class = "E0301";
inline constexpr const char* undefined_routine = "E0302";
inline constexpr const char* undefined_variable = "E0303";
inline constexpr const char* unknown_metric = "E0400";
inline constexpr const char* missing_codepoint = "E0501";
inline constexpr const char* bad_regex = "E0502";
inline constexpr const char* missing_metric_glyph = "E0503";
inline constexpr const char* bad_rule = "E0504";
inline constexpr const char* bad_variable = "E0505";
inline constexpr const char* include_failed = "E0600";
inline constexpr const char* missing_glyph = "W0101";
inline constexpr const char* unknown_verb = "W0102";
inline constexpr const char* not_a_plugin = "W0103";
inline constexpr const char* sparse_bins = "W0104";
inline constexpr const char* empty_attachment = "W0105";
inline constexpr const char* debug = "N0001";
}

} // namespace fee
