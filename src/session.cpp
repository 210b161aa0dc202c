#include "fee/session.hpp"
#include "fee/diagnostics_json.hpp"
#include "fee/dispatcher.hpp"
#include "fee/plugins.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fee {

std::string read_source_file(const std::string& path, const SourceLocation& at){
    std::ifstream ifs(path, std::ios::binary);
    if(!ifs) throw include_error(make_error(codes::include_failed, "Cannot read file '" + path + "'", at));
    std::ostringstream ss; ss << ifs.rdbuf();
    return ss.str();
}

Session::Session(const FontModel& font, SessionOptions opts) : font_(font), opts_(std::move(opts)) {
    if(opts_.anchors_from_font) features_.set_anchors_from_font(font_);
    if(opts_.load_default_plugins){
        for(const auto& name : opts_.default_plugins) load_plugin(name);
    } else {
        load_plugin("LoadPlugin");
    }
}

bool Session::load_plugin(const std::string& name, const SourceLocation& at){
    auto m = builtin_plugin(name);
    if(!m){
        sink_.warn(codes::not_a_plugin, "Module " + name + " is not a FEE plugin", at, "no built-in plugin with that name");
        return false;
    }
    return registry_.register_plugin(*m, sink_, at);
}

bool Session::register_plugin(const PluginModule& m, const SourceLocation& at){
    return registry_.register_plugin(m, sink_, at);
}

const VariableValue* Session::variable(const std::string& name) const {
    auto it = variables_.find(name);
    return it==variables_.end()? nullptr : &it->second;
}

StatementGroup Session::parse_string(std::string_view text, const std::string& file){
    struct file_scope {
        std::vector<std::string>& files;
        file_scope(std::vector<std::string>& f, const std::string& file) : files(f) { files.push_back(file); }
        ~file_scope(){ files.pop_back(); }
    } scope(files_, file);
    StatementGroup statements = parse_document(text, file);
    dispatch_all(*this, statements);
    return statements;
}

StatementGroup Session::parse_file(const std::string& path){
    return parse_string(read_source_file(path), path);
}

StatementGroup Session::include_file(const std::string& path, const SourceLocation& at){
    namespace fs = std::filesystem;
    fs::path target(path);
    std::string current = current_file();
    if(target.is_relative() && !current.empty()) target = fs::path(current).parent_path() / target;
    if(trace_enabled()) std::fprintf(stderr, "[dbg][include] %s\n", target.string().c_str());
    for(const auto& f : files_){
        if(!f.empty() && f==target.string())
            throw include_error(make_error(codes::include_failed, "File '" + target.string() + "' includes itself", at));
    }
    return parse_string(read_source_file(target.string(), at), target.string());
}

CompileResult Session::finish(bool ok, StatementGroup statements, std::vector<Diagnostic> errors){
    CompileResult r;
    r.success = ok;
    r.errors = std::move(errors);
    r.warnings = sink_.diagnostics();
    r.statements = std::move(statements);
    maybe_print_json(r);
    return r;
}

CompileResult Session::compile(std::string_view text, const std::string& file){
    try {
        return finish(true, parse_string(text, file), {});
    } catch(const compile_error& e) {
        return finish(false, {}, {e.diagnostic()});
    }
}

CompileResult Session::compile_file(const std::string& path){
    try {
        return finish(true, parse_file(path), {});
    } catch(const compile_error& e) {
        return finish(false, {}, {e.diagnostic()});
    }
}

} // namespace fee
