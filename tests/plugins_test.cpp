#include <gtest/gtest.h>
#include "fee/font_snapshot.hpp"
#include "fee/session.hpp"
#include "test_env.hpp"
#include "test_fonts.hpp"
#include <stdexcept>

using namespace fee;

namespace {

MemoryFont latin_font(){
    MemoryFont f = small_font();
    f.add("f", 300, 0x66).add("i", 250, 0x69).add("f_i", 550);
    return f;
}

const Substitution& only_substitution(const std::vector<RoutinePtr>& routines){
    if(routines.size()!=1 || routines[0]->rules.size()!=1) throw std::runtime_error("expected one routine with one rule");
    return std::get<Substitution>(routines[0]->rules[0]);
}

std::string data_path(const char* name){ return std::string(FEE_TEST_DATA_DIR) + "/" + name; }

}

TEST(Variables, IntegerVariableInComparison){
    MemoryFont font = small_font();
    Session s(font);
    s.parse_string("Set $w = 250;\nDefineClass @narrow = /^.*$/ and (width < $w);");
    const VariableValue* v = s.variable("w");
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(std::get<int64_t>(*v), 250);
    EXPECT_EQ(*s.classes().find("narrow"), (GlyphSet{"space"}));
}

TEST(Variables, ValueRecordVariableInPosition){
    MemoryFont font = small_font();
    Session s(font);
    auto statements = s.parse_string("Set $kern = <xAdvance=-20>;\nPosition A $kern;");
    auto routines = routines_of(statements);
    ASSERT_EQ(routines.size(), 1u);
    const auto& rule = std::get<Positioning>(routines[0]->rules.at(0));
    EXPECT_EQ(rule.values.at(0).xAdvance, -20);
}

TEST(Variables, UndefinedVariable){
    MemoryFont font = small_font();
    Session s(font);
    try {
        s.parse_string("Position A $nope;");
        FAIL() << "expected undefined_reference_error";
    } catch(const undefined_reference_error& e) {
        EXPECT_EQ(e.diagnostic().code, codes::undefined_variable);
        EXPECT_EQ(e.identifier(), "nope");
    }
}

TEST(Variables, ValueRecordIsNotAnInteger){
    MemoryFont font = small_font();
    Session s(font);
    try {
        s.parse_string("Set $kern = <0 0 -20 0>;\nDefineClass @x = [A] and (width < $kern);");
        FAIL() << "expected syntax_error";
    } catch(const syntax_error& e) {
        EXPECT_EQ(e.diagnostic().code, codes::bad_variable);
    }
}

TEST(Substitute, SingleRuleRoutine){
    MemoryFont font = latin_font();
    Session s(font);
    auto statements = s.parse_string("Substitute f i -> f_i;");
    const Substitution& rule = only_substitution(routines_of(statements));
    EXPECT_EQ(rule.input, (std::vector<GlyphSet>{{"f"}, {"i"}}));
    EXPECT_EQ(rule.replacement, (std::vector<GlyphSet>{{"f_i"}}));
    // Unattached anonymous routines are not part of the IR.
    EXPECT_TRUE(s.features().routines.empty());
}

TEST(Substitute, LanguagesAreAttached){
    MemoryFont font = small_font();
    Session s(font);
    auto statements = s.parse_string("Substitute A -> B <<latn/dflt>>;");
    const Substitution& rule = only_substitution(routines_of(statements));
    ASSERT_EQ(rule.languages.size(), 1u);
    EXPECT_EQ(rule.languages[0].language, "latn");
    EXPECT_EQ(rule.languages[0].script, "dflt");
}

TEST(Substitute, MismatchedClassSizes){
    MemoryFont font = small_font();
    Session s(font);
    try {
        s.parse_string("DefineClass @ab = [A B];\nSubstitute @ab -> [a b A];");
        FAIL() << "expected resolution_error";
    } catch(const resolution_error& e) {
        EXPECT_EQ(e.diagnostic().code, codes::bad_rule);
        EXPECT_EQ(e.diagnostic().line, 2);
    }
}

TEST(Substitute, ClassToClass){
    MemoryFont font = small_font();
    Session s(font);
    auto statements = s.parse_string("Substitute [A B] -> [a b];");
    const Substitution& rule = only_substitution(routines_of(statements));
    EXPECT_EQ(rule.replacement[0], (GlyphSet{"a", "b"}));
}

TEST(Position, AdvanceAndValueRecords){
    MemoryFont font = small_font();
    Session s(font);
    auto routines = routines_of(s.parse_string("Position A 120 B <xAdvance=10> a <0 5 0 0>;"));
    ASSERT_EQ(routines.size(), 1u);
    const auto& rule = std::get<Positioning>(routines[0]->rules.at(0));
    ASSERT_EQ(rule.glyphs.size(), 3u);
    ASSERT_EQ(rule.values.size(), 3u);
    EXPECT_EQ(rule.values[0].xAdvance, 120);
    EXPECT_EQ(rule.values[1].xAdvance, 10);
    EXPECT_EQ(rule.values[2].yPlacement, 5);
    EXPECT_EQ(rule.values[2].xAdvance, 0);
}

TEST(Routine, NamedRoutineMergesRulesAndFlags){
    MemoryFont font = latin_font();
    Session s(font);
    s.parse_string("Routine marks {\n  Position A <0 0 10 0>;\n  Position B <0 0 20 0>;\n} IgnoreMarks UseMarkFilteringSet [a b];");
    RoutinePtr r = s.features().find_routine("marks");
    ASSERT_TRUE(r);
    EXPECT_EQ(r->rules.size(), 2u);
    EXPECT_EQ(r->flags, lookup_flags::ignore_marks | lookup_flags::use_mark_filtering_set);
    ASSERT_TRUE(r->mark_filtering_set.has_value());
    EXPECT_EQ(*r->mark_filtering_set, (GlyphSet{"a", "b"}));
    for(const auto& rule : r->rules) EXPECT_EQ(rule_common(rule).flags, r->flags);
}

TEST(Routine, MarkAttachmentTypeAndDirection){
    MemoryFont font = small_font();
    Session s(font);
    s.parse_string("Routine rtl { Substitute A -> B; } RightToLeft MarkAttachmentType 2;");
    RoutinePtr r = s.features().find_routine("rtl");
    ASSERT_TRUE(r);
    EXPECT_EQ(r->flags, lookup_flags::right_to_left | 0x200u);
}

TEST(Routine, LatestDefinitionWins){
    MemoryFont font = small_font();
    Session s(font);
    s.parse_string("Routine r { Substitute A -> B; };\nRoutine r { Substitute A -> a; };");
    RoutinePtr r = s.features().find_routine("r");
    ASSERT_TRUE(r);
    EXPECT_EQ(std::get<Substitution>(r->rules.at(0)).replacement[0], (GlyphSet{"a"}));
}

TEST(Routine, NeedsABlock){
    MemoryFont font = small_font();
    Session s(font);
    EXPECT_THROW(s.parse_string("Routine r;"), syntax_error);
}

TEST(Feature, BlockRegistersRoutinesInOrder){
    MemoryFont font = latin_font();
    Session s(font);
    s.parse_string("Feature liga {\n  Routine ligs { Substitute f i -> f_i; };\n  Substitute A -> B;\n};");
    const auto* routines = s.features().feature("liga");
    ASSERT_NE(routines, nullptr);
    ASSERT_EQ(routines->size(), 2u);
    EXPECT_EQ((*routines)[0]->name, "ligs");
    EXPECT_TRUE((*routines)[1]->name.empty());
    EXPECT_EQ(s.features().routines.size(), 2u);
    EXPECT_EQ(s.features().feature_order, (std::vector<std::string>{"liga"}));
}

TEST(Feature, ReferencesNamedRoutines){
    MemoryFont font = latin_font();
    Session s(font);
    s.parse_string("Routine ligs { Substitute f i -> f_i; };\nFeature liga ligs;\nFeature dlig ligs;");
    ASSERT_NE(s.features().feature("dlig"), nullptr);
    EXPECT_EQ(s.features().feature("liga")->at(0), s.features().feature("dlig")->at(0));
    EXPECT_EQ(s.features().routines.size(), 1u);
}

TEST(Feature, UndefinedRoutine){
    MemoryFont font = small_font();
    Session s(font);
    try {
        s.parse_string("Feature liga nope;");
        FAIL() << "expected undefined_reference_error";
    } catch(const undefined_reference_error& e) {
        EXPECT_EQ(e.diagnostic().code, codes::undefined_routine);
        EXPECT_EQ(e.identifier(), "nope");
    }
}

TEST(Chain, ContextAndLookups){
    MemoryFont font = small_font();
    Session s(font);
    auto statements = s.parse_string("Routine upper { Substitute a -> A; };\nChain A ( a ^upper b ) B;");
    auto routines = routines_of(statements);
    ASSERT_EQ(routines.size(), 2u);
    const auto& rule = std::get<Chaining>(routines[1]->rules.at(0));
    EXPECT_EQ(rule.precontext, (std::vector<GlyphSet>{{"A"}}));
    EXPECT_EQ(rule.input, (std::vector<GlyphSet>{{"a"}, {"b"}}));
    EXPECT_EQ(rule.postcontext, (std::vector<GlyphSet>{{"B"}}));
    ASSERT_EQ(rule.lookups.size(), 2u);
    ASSERT_EQ(rule.lookups[0].size(), 1u);
    EXPECT_EQ(rule.lookups[0][0], s.features().find_routine("upper"));
    EXPECT_TRUE(rule.lookups[1].empty());
}

TEST(Chain, UndefinedRoutine){
    MemoryFont font = small_font();
    Session s(font);
    try {
        s.parse_string("Chain ( a ^nope );");
        FAIL() << "expected undefined_reference_error";
    } catch(const undefined_reference_error& e) {
        EXPECT_EQ(e.diagnostic().code, codes::undefined_routine);
        EXPECT_EQ(e.identifier(), "nope");
    }
}

TEST(Anchors, FontAnchorsAndAttach){
    MemoryFont font = load_font_snapshot_file(data_path("marks.font"));
    Session s(font);
    auto routines = routines_of(s.parse_string("Attach &top &_top;"));
    ASSERT_EQ(routines.size(), 1u);
    const auto& rule = std::get<Attachment>(routines[0]->rules.at(0));
    ASSERT_EQ(rule.bases.size(), 1u);
    EXPECT_EQ(rule.bases.at("A").x, 300);
    ASSERT_EQ(rule.marks.size(), 1u);
    EXPECT_EQ(rule.marks.at("acutecomb").y, 700);
    EXPECT_FALSE(rule.cursive);
}

TEST(Anchors, AnchorsVerbAddsAnchors){
    MemoryFont font = load_font_snapshot_file(data_path("marks.font"));
    Session s(font);
    auto routines = routines_of(s.parse_string("Anchors B top <310 720>;\nAttach &top &_top;"));
    EXPECT_EQ(s.features().anchors.at("B").at("top").y, 720);
    const auto& rule = std::get<Attachment>(routines.at(0)->rules.at(0));
    EXPECT_EQ(rule.bases.size(), 2u);
}

TEST(Anchors, MarkToMark){
    MemoryFont font = load_font_snapshot_file(data_path("marks.font"));
    Session s(font);
    auto routines = routines_of(s.parse_string("Attach &top &_top marks;"));
    const auto& rule = std::get<Attachment>(routines.at(0)->rules.at(0));
    ASSERT_EQ(rule.bases.size(), 1u);
    EXPECT_EQ(rule.bases.count("acutecomb"), 1u);
}

TEST(Anchors, EmptySideWarns){
    MemoryFont font = load_font_snapshot_file(data_path("marks.font"));
    Session s(font);
    s.parse_string("Attach &nothing &_top;");
    EXPECT_EQ(s.diagnostics().count(codes::empty_attachment), 1u);
    EXPECT_EQ(s.diagnostics().count(codes::missing_glyph), 0u);
}

TEST(Conditional, TakesTheMatchingBranch){
    MemoryFont font = small_font();
    Session s(font);
    s.parse_string("Set $x = 5;\nFeature liga {\n  If $x > 3 { Substitute A -> B; } Else { Substitute A -> a; };\n};");
    const auto* routines = s.features().feature("liga");
    ASSERT_NE(routines, nullptr);
    ASSERT_EQ(routines->size(), 1u);
    EXPECT_EQ(std::get<Substitution>((*routines)[0]->rules.at(0)).replacement[0], (GlyphSet{"B"}));
}

TEST(Conditional, ElseBranch){
    MemoryFont font = small_font();
    Session s(font);
    s.parse_string("Set $x = 1;\nFeature liga {\n  If $x > 3 { Substitute A -> B; } Else { Substitute A -> a; };\n};");
    const auto* routines = s.features().feature("liga");
    ASSERT_NE(routines, nullptr);
    EXPECT_EQ(std::get<Substitution>((*routines)[0]->rules.at(0)).replacement[0], (GlyphSet{"a"}));
}

TEST(Conditional, FalseWithoutElseYieldsNothing){
    MemoryFont font = small_font();
    Session s(font);
    s.parse_string("Feature liga { If 1 == 2 { Substitute A -> B; }; };");
    EXPECT_EQ(s.features().feature("liga"), nullptr);
}

TEST(Conditional, RejectsUnknownSeparator){
    MemoryFont font = small_font();
    Session s(font);
    EXPECT_THROW(s.parse_string("If 1 == 1 { Substitute A -> B; } Otherwise { Substitute A -> a; };"), syntax_error);
}

TEST(Include, CompilesRelativeToTheIncludingFile){
    MemoryFont font = small_font();
    Session s(font);
    auto result = s.compile_file(data_path("include_main.fee"));
    ASSERT_TRUE(result.success) << (result.errors.empty()? "" : result.errors[0].message);
    EXPECT_EQ(*s.classes().find("shared"), (GlyphSet{"A", "B"}));
    EXPECT_EQ(*s.classes().find("both"), (GlyphSet{"A", "B", "b"}));
    const auto* liga = s.features().feature("liga");
    ASSERT_NE(liga, nullptr);
    ASSERT_EQ(liga->size(), 1u);
    EXPECT_EQ((*liga)[0]->name, "shared_ligs");
}

TEST(Include, MissingFile){
    MemoryFont font = small_font();
    Session s(font);
    try {
        s.parse_string("Include no_such_file.fee;", "main.fee");
        FAIL() << "expected include_error";
    } catch(const include_error& e) {
        EXPECT_EQ(e.diagnostic().code, codes::include_failed);
        EXPECT_EQ(e.diagnostic().line, 1);
        EXPECT_EQ(e.diagnostic().col, 9);
    }
}

TEST(Include, SelfInclusionIsAnError){
    MemoryFont font = small_font();
    Session s(font);
    auto result = s.compile_file(data_path("self_include.fee"));
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].code, codes::include_failed);
}

TEST(LoadPlugin, DebugVerbsEmitNotes){
    MemoryFont font = small_font();
    Session s(font);
    s.parse_string("LoadPlugin Debug;\nDefineClass @x = [A B];\nShowClass @x;\nDumpClassNames;\nDumpClasses;");
    ASSERT_EQ(s.diagnostics().count(codes::debug), 3u);
    const auto& d = s.diagnostics().diagnostics();
    EXPECT_EQ(d[0].message, "@x = A B");
    EXPECT_EQ(d[0].line, 3);
    EXPECT_EQ(d[1].message, "x");
    EXPECT_EQ(d[2].message, "@x = A B");
}

TEST(LoadPlugin, DebugVerbsNeedThePlugin){
    MemoryFont font = small_font();
    Session s(font);
    s.parse_string("DefineClass @x = [A B];\nShowClass @x;");
    EXPECT_EQ(s.diagnostics().count(codes::unknown_verb), 1u);
}

TEST(LoadPlugin, UnknownPlugin){
    MemoryFont font = small_font();
    Session s(font);
    s.parse_string("LoadPlugin Nope;");
    EXPECT_EQ(s.diagnostics().count(codes::not_a_plugin), 1u);
    EXPECT_EQ(s.diagnostics().diagnostics()[0].message, "Module Nope is not a FEE plugin");
}

TEST(LoadPlugin, EnvironmentDisablesDefaults){
    ScopedEnv env("FEE_NO_DEFAULT_PLUGINS", "1");
    MemoryFont font = small_font();
    Session s(font);
    s.parse_string("DefineClass @x = [A];");
    EXPECT_EQ(s.diagnostics().count(codes::unknown_verb), 1u);
    s.parse_string("LoadPlugin ClassDefinition;\nDefineClass @x = [A];");
    EXPECT_TRUE(s.classes().contains("x"));
}

TEST(Position, ValueOutsideFontUnitsIsASyntaxError){
    MemoryFont font = small_font();
    Session s(font);
    auto result = s.compile("Position A 40000;", "rules.fee");
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].code, codes::syntax);
    EXPECT_EQ(result.errors[0].line, 1);
    EXPECT_EQ(result.errors[0].col, 12);
}

TEST(Variables, IntegerBeyondRangeIsASyntaxError){
    MemoryFont font = small_font();
    Session s(font);
    auto result = s.compile("Set $big = 99999999999999999999;");
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].code, codes::syntax);
}
