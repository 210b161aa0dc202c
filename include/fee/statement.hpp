// Raw statements read from a rule document, and their dispatch results.
#pragma once
#include "fee/diagnostics.hpp"
#include "fee/value.hpp"
#include <string>
#include <vector>

namespace fee {

struct Statement;
using StatementGroup = std::vector<Statement>;

// One argument: a whitespace-delimited token or a brace group of nested statements.
struct RawArg {
    std::string text;
    SourceLocation location;
    bool is_block=false;
    StatementGroup block;
};

struct Statement {
    std::string verb;
    SourceLocation location;
    std::vector<RawArg> args;
    bool resolved=false; // false when the verb is unknown
    Value result;

    bool has_blocks() const;
    // Arguments as written, tokens joined by single spaces (groups elided as {...}).
    std::string args_text() const;
};

// Routines produced by the statements of a group, in statement order.
std::vector<RoutinePtr> routines_of(const StatementGroup& group);

} // namespace fee
