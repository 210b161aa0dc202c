#include "fee/value.hpp"
#include "fee/statement.hpp"

namespace fee {

const char* Value::kind() const {
    switch(data.index()){
        case 0: return "empty";
        case 1: return "integer";
        case 2: return "name";
        case 3: return "glyph selector";
        case 4: return "glyph set";
        case 5: return "predicate";
        case 6: return "value record";
        case 7: return "language list";
        case 8: return "routine list";
        case 9: return "list";
    }
    return "unknown";
}

bool Statement::has_blocks() const {
    for(const auto& a : args) if(a.is_block) return true;
    return false;
}

std::string Statement::args_text() const {
    std::string out;
    for(const auto& a : args){
        if(!out.empty()) out += ' ';
        out += a.text;
    }
    return out;
}

std::vector<RoutinePtr> routines_of(const StatementGroup& group){
    std::vector<RoutinePtr> out;
    for(const auto& s : group){
        if(auto rs = std::get_if<std::vector<RoutinePtr>>(&s.result.data))
            out.insert(out.end(), rs->begin(), rs->end());
    }
    return out;
}

} // namespace fee
