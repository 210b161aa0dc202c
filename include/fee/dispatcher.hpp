// Statement dispatch: routes parsed statements to their verbs, nested statements first.
#pragma once
#include "fee/grammar/composer.hpp"
#include "fee/statement.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace fee {

class Session;

// Raw statements of a document; throws syntax_error with the failing location.
StatementGroup parse_document(std::string_view text, const std::string& file);

// Tokens re-joined by single spaces, with a map back to where each token was written.
struct JoinedText {
    std::string text;
    SourceMap map;
};
JoinedText join_tokens(const std::vector<RawArg>& args, size_t first, size_t last);

// Dispatches one statement (its groups first) and stores the verb's result on it.
void dispatch(Session& session, Statement& s);
// Dispatches statements strictly in order.
void dispatch_all(Session& session, StatementGroup& statements);

} // namespace fee
