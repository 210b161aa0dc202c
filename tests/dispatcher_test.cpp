#include <gtest/gtest.h>
#include "fee/dispatcher.hpp"
#include "fee/session.hpp"
#include "test_fonts.hpp"
#include "test_plugin.hpp"

using namespace fee;

TEST(Document, StatementsGroupsAndLocations){
    auto statements = parse_document("Feature liga {\n  Substitute a -> b;\n};\nDefineClass @x = [a];\n", "doc.fee");
    ASSERT_EQ(statements.size(), 2u);
    const Statement& feature = statements[0];
    EXPECT_EQ(feature.verb, "Feature");
    EXPECT_EQ(feature.location.line, 1);
    ASSERT_EQ(feature.args.size(), 2u);
    EXPECT_EQ(feature.args[0].text, "liga");
    ASSERT_TRUE(feature.args[1].is_block);
    ASSERT_EQ(feature.args[1].block.size(), 1u);
    const Statement& inner = feature.args[1].block[0];
    EXPECT_EQ(inner.verb, "Substitute");
    EXPECT_EQ(inner.location.file, "doc.fee");
    EXPECT_EQ(inner.location.line, 2);
    EXPECT_EQ(inner.location.col, 3);
    EXPECT_EQ(inner.args_text(), "a -> b");
    EXPECT_EQ(statements[1].location.line, 4);
    EXPECT_EQ(statements[1].args[2].text, "[a]");
}

TEST(Document, CommentsAreSkipped){
    auto statements = parse_document("# heading\nDefineClass @x = [a]; # trailing\n# DefineClass @y = [b];\n", "");
    ASSERT_EQ(statements.size(), 1u);
    EXPECT_EQ(statements[0].args.size(), 3u);
}

TEST(Document, MissingTerminatorIsASyntaxError){
    try {
        parse_document("DefineClass @x = [a]\n", "doc.fee");
        FAIL() << "expected syntax_error";
    } catch(const syntax_error& e) {
        EXPECT_EQ(e.diagnostic().code, codes::syntax);
        EXPECT_EQ(e.diagnostic().file, "doc.fee");
        EXPECT_EQ(e.diagnostic().line, 2);
    }
}

TEST(Document, UnclosedBlockIsASyntaxError){
    EXPECT_THROW(parse_document("Feature liga { Substitute a -> b;\n", ""), syntax_error);
}

TEST(Document, JoinTokensMapsOffsets){
    auto statements = parse_document("Mark one\n  two three;", "");
    auto j = join_tokens(statements[0].args, 0, statements[0].args.size());
    EXPECT_EQ(j.text, "one two three");
    SourceLocation at = j.map.locate(5);
    EXPECT_EQ(at.line, 2);
    EXPECT_EQ(at.col, 4);
}

class DispatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        testplugin::recorded() = testplugin::Recorded{};
        session.register_plugin(testplugin::plugin_module());
    }
    MemoryFont font = small_font();
    Session session{font};
};

TEST_F(DispatchTest, StatementsRunInOrder){
    session.parse_string("Mark one; Mark two three;");
    EXPECT_EQ(testplugin::recorded().calls, (std::vector<std::string>{"Mark one", "Mark two three"}));
}

TEST_F(DispatchTest, NestedStatementsRunBeforeTheirParent){
    session.parse_string("Wrap { Mark inner; Wrap { Mark deepest; }; };");
    EXPECT_EQ(testplugin::recorded().calls,
              (std::vector<std::string>{"Mark inner", "Mark deepest", "Wrap {}", "Wrap {}"}));
}

TEST_F(DispatchTest, BlockArgumentsAreSplitAroundGroups){
    session.parse_string("Wrap one two { Mark x; } mid { } three;");
    ASSERT_TRUE(testplugin::recorded().block.has_value());
    const BlockArgs& b = *testplugin::recorded().block;
    ASSERT_TRUE(b.before.has_value());
    EXPECT_EQ(testplugin::joined(*b.before), "one two");
    ASSERT_EQ(b.groups.size(), 2u);
    EXPECT_EQ(b.groups[0].size(), 1u);
    EXPECT_TRUE(b.groups[1].empty());
    EXPECT_EQ(b.between, (std::vector<std::string>{"mid"}));
    ASSERT_TRUE(b.after.has_value());
    EXPECT_EQ(testplugin::joined(*b.after), "three");
}

TEST_F(DispatchTest, EmptyBeforeAndAfterAreAbsent){
    session.parse_string("Wrap { Mark x; };");
    const BlockArgs& b = *testplugin::recorded().block;
    EXPECT_FALSE(b.before.has_value());
    EXPECT_FALSE(b.after.has_value());
}

TEST_F(DispatchTest, UnknownVerbWarnsAndChangesNothing){
    auto statements = session.parse_string("Frobnicate @a;");
    ASSERT_EQ(statements.size(), 1u);
    EXPECT_FALSE(statements[0].resolved);
    EXPECT_EQ(session.diagnostics().count(codes::unknown_verb), 1u);
    EXPECT_EQ(session.diagnostics().diagnostics().back().message, "Unknown verb: Frobnicate");
    EXPECT_EQ(session.classes().size(), 0u);
    EXPECT_TRUE(session.features().routines.empty());
    EXPECT_TRUE(session.features().features.empty());
}

TEST_F(DispatchTest, UnknownVerbDoesNotStopTheDocument){
    auto result = session.compile("DefineClass @x = [A];\nFrobnicate;\nDefineClass @y = [B];");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(session.classes().contains("x"));
    EXPECT_TRUE(session.classes().contains("y"));
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].line, 2);
}

TEST_F(DispatchTest, ArgumentErrorsPointAtTheToken){
    try {
        session.parse_string("DefineClass @a = [A B];\nDefineClass @b =\n   @a ) ;", "rules.fee");
        FAIL() << "expected syntax_error";
    } catch(const syntax_error& e) {
        EXPECT_EQ(e.diagnostic().file, "rules.fee");
        EXPECT_EQ(e.diagnostic().line, 3);
        EXPECT_EQ(e.diagnostic().col, 7);
    }
}

TEST_F(DispatchTest, BlockOnPlainVerbIsRejected){
    EXPECT_THROW(session.parse_string("Mark { Mark x; };"), syntax_error);
}

TEST_F(DispatchTest, ResolvedStatementsKeepTheirResult){
    auto statements = session.parse_string("Routine r { Substitute A -> B; };");
    ASSERT_EQ(statements.size(), 1u);
    EXPECT_TRUE(statements[0].resolved);
    ASSERT_TRUE(statements[0].result.is<std::vector<RoutinePtr>>());
    EXPECT_EQ(routines_of(statements).size(), 1u);
}
