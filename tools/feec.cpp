#include <iostream>
#include <string>
#include "fee/diagnostics_json.hpp"
#include "fee/font_snapshot.hpp"
#include "fee/ir_writer.hpp"
#include "fee/session.hpp"

using namespace fee;

static void print_diagnostics(const CompileResult& r){
    for(const auto& w : r.warnings) std::cerr << format_diagnostic(w) << "\n";
    for(const auto& e : r.errors) std::cerr << format_diagnostic(e) << "\n";
}

int main(int argc, char** argv){
    std::string font_path, rules_path;
    bool print_ir = true, json = false;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--no-ir") print_ir = false;
        else if(a=="--json") json = true;
        else if(font_path.empty()) font_path = a;
        else if(rules_path.empty()) rules_path = a;
        else { std::cerr << "unexpected argument: " << a << "\n"; return 2; }
    }
    if(font_path.empty() || rules_path.empty()){ std::cerr << "usage: feec <font-snapshot> <rules.fee> [--no-ir] [--json]\n"; return 2; }

    MemoryFont font;
    std::string rules;
    try {
        font = load_font_snapshot_file(font_path);
        rules = read_source_file(rules_path);
    } catch(const compile_error& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    Session session(font);
    CompileResult r = session.compile(rules, rules_path);
    print_diagnostics(r);
    if(json) std::cout << diagnostics_to_json(r) << "\n";
    if(!r.success) return 1;
    if(print_ir) std::cout << write_ir(session.features());
    return 0;
}
