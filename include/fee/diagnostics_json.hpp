// diagnostics_json.hpp - JSON serialization for CompileResult diagnostics
#pragma once
#include "fee/session.hpp"
#include <string>

namespace fee {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const CompileResult& r);

// If FEE_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const CompileResult& r);

} // namespace fee
