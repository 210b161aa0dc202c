#include <gtest/gtest.h>
#include "fee/diagnostics.hpp"
#include "fee/diagnostics_json.hpp"
#include "fee/session.hpp"
#include "test_fonts.hpp"

using namespace fee;

TEST(Diagnostics, FormatIncludesLocationCodeAndHint){
    Diagnostic d{codes::missing_glyph, "Couldn't find glyph 'x' in font (x)", "check the name", "rules.fee", 3, 7, {}, Severity::warning};
    EXPECT_EQ(format_diagnostic(d), "rules.fee:3:7: warning[W0101]: Couldn't find glyph 'x' in font (x) (hint: check the name)");
}

TEST(Diagnostics, FormatWithoutFileOrLocation){
    Diagnostic d = make_error(codes::grammar, "Grammar failed analysis", SourceLocation{});
    EXPECT_EQ(format_diagnostic(d), "<memory>: error[E0100]: Grammar failed analysis");
    d.notes.push_back(DiagnosticNote{"while composing Feature", -1, -1});
    EXPECT_EQ(format_diagnostic(d), "<memory>: error[E0100]: Grammar failed analysis\n  note: while composing Feature");
}

TEST(Diagnostics, CompileErrorCarriesTheDiagnostic){
    syntax_error e(make_error(codes::syntax, "Invalid arguments", SourceLocation{"a.fee", 2, 4}));
    EXPECT_STREQ(e.what(), "a.fee:2:4: error[E0200]: Invalid arguments");
    EXPECT_EQ(e.diagnostic().severity, Severity::error);
}

TEST(Diagnostics, SinkKeepsEmissionOrder){
    DiagnosticSink sink;
    sink.warn(codes::unknown_verb, "Unknown verb: X", SourceLocation{"", 1, 1});
    sink.note("@x = A", SourceLocation{"", 2, 1});
    sink.warn(codes::missing_glyph, "Couldn't find glyph 'y' in font (y)", SourceLocation{"", 3, 1});
    ASSERT_EQ(sink.diagnostics().size(), 3u);
    EXPECT_EQ(sink.diagnostics()[1].severity, Severity::note);
    EXPECT_EQ(sink.warnings().size(), 2u);
    EXPECT_EQ(sink.count(codes::debug), 1u);
    sink.clear();
    EXPECT_TRUE(sink.diagnostics().empty());
}

TEST(DiagnosticsJson, EscapesStrings){
    EXPECT_EQ(json_escape("a\"b\\c\n"), "\"a\\\"b\\\\c\\n\"");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\"\\u0001\"");
}

TEST(DiagnosticsJson, FailedCompile){
    MemoryFont font = small_font();
    Session s(font);
    auto result = s.compile("Frobnicate;\nDefineClass @x = @missing;", "r.fee");
    std::string js = diagnostics_to_json(result);
    EXPECT_EQ(js.rfind("{\"success\":false,\"errors\":[{\"code\":\"E0301\",\"severity\":\"error\"", 0), 0u);
    EXPECT_NE(js.find("\"warnings\":[{\"code\":\"W0102\",\"severity\":\"warning\",\"message\":\"Unknown verb: Frobnicate\""), std::string::npos);
    EXPECT_NE(js.find("\"file\":\"r.fee\",\"line\":2,\"col\":18"), std::string::npos);
}

TEST(DiagnosticsJson, CleanCompile){
    MemoryFont font = small_font();
    Session s(font);
    auto result = s.compile("DefineClass @x = [A];");
    EXPECT_EQ(diagnostics_to_json(result), "{\"success\":true,\"errors\":[],\"warnings\":[]}");
}
