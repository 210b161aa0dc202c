// Compilation session: owns the IR, variables, plugin table and diagnostics of one run.
#pragma once
#include "fee/diagnostics.hpp"
#include "fee/features.hpp"
#include "fee/font.hpp"
#include "fee/ir.hpp"
#include "fee/selector.hpp"
#include "fee/statement.hpp"
#include "fee/value.hpp"
#include "fee/verb.hpp"
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fee {

struct SessionOptions {
    std::vector<std::string> default_plugins{"LoadPlugin", "ClassDefinition", "Conditional", "Feature", "Substitute",
                                             "Position", "Chain", "Anchors", "Routine", "Include", "Variables"};
    bool load_default_plugins = !default_plugins_disabled();
    // Seed the IR anchor table from the font's anchors.
    bool anchors_from_font = true;
};

struct CompileResult {
    bool success{false};
    std::vector<Diagnostic> errors;
    std::vector<Diagnostic> warnings; // warnings and notes, in emission order
    StatementGroup statements;
};

class Session {
public:
    explicit Session(const FontModel& font, SessionOptions opts = {});

    const FontModel& font() const { return font_; }
    FontFeatures& features(){ return features_; }
    const FontFeatures& features() const { return features_; }
    ClassTable& classes(){ return features_.named_classes; }
    DiagnosticSink& diagnostics(){ return sink_; }
    VerbRegistry& registry(){ return registry_; }
    ResolveContext resolve_context(){ return ResolveContext{features_.named_classes, font_, &sink_}; }

    // Built-in plugin by name; an unknown name is reported as W0103.
    bool load_plugin(const std::string& name, const SourceLocation& at = {});
    bool register_plugin(const PluginModule& m, const SourceLocation& at = {});

    void set_variable(const std::string& name, VariableValue v){ variables_[name] = std::move(v); }
    const VariableValue* variable(const std::string& name) const;

    // Parses and dispatches a whole document. Errors propagate as compile_error.
    StatementGroup parse_string(std::string_view text, const std::string& file = "");
    StatementGroup parse_file(const std::string& path);
    // Compiles a file named relative to the file being compiled.
    StatementGroup include_file(const std::string& path, const SourceLocation& at);

    CompileResult compile(std::string_view text, const std::string& file = "");
    CompileResult compile_file(const std::string& path);

    // File currently being compiled; empty for in-memory text.
    std::string current_file() const { return files_.empty()? std::string() : files_.back(); }

private:
    const FontModel& font_;
    SessionOptions opts_;
    FontFeatures features_;
    DiagnosticSink sink_;
    VerbRegistry registry_;
    std::map<std::string, VariableValue> variables_;
    std::vector<std::string> files_;

    CompileResult finish(bool ok, StatementGroup statements, std::vector<Diagnostic> errors);
};

// Reads a whole file; throws include_error when it cannot be read.
std::string read_source_file(const std::string& path, const SourceLocation& at = {});

} // namespace fee
