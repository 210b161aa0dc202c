#pragma once
#include <cstdlib>
#include <string_view>

namespace fee {
inline bool flag_enabled(const char* name) {
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}
inline bool trace_enabled(){ return flag_enabled("FEE_TRACE"); }
inline bool diag_json_enabled(){ return flag_enabled("FEE_DIAG_JSON"); }
inline bool default_plugins_disabled(){ return flag_enabled("FEE_NO_DEFAULT_PLUGINS"); }
}
