#include <gtest/gtest.h>
#include "fee/diagnostics.hpp"
#include "fee/font_snapshot.hpp"

using namespace fee;

TEST(FontSnapshot, ReadsGlyphsAndProperties){
    MemoryFont font = load_font_snapshot(
        "# comment line\n"
        "glyph A width=600 unicode=41 anchor=top:300,700\n"
        "glyph Aacute width=600 unicode=C1,E000 xMin=20 xMax=580 # trailing\n"
        "\n"
        "glyph acutecomb width=0 category=mark anchor=_top:0,700\n"
        "glyph hidden width=500 export=no\n");
    EXPECT_EQ(font.glyph_order(), (std::vector<std::string>{"A", "Aacute", "acutecomb", "hidden"}));
    EXPECT_EQ(font.exported_glyphs(), (std::vector<std::string>{"A", "Aacute", "acutecomb"}));
    EXPECT_EQ(font.glyph_for_codepoint(0x41).value_or(""), "A");
    EXPECT_EQ(font.glyph_for_codepoint(0xE000).value_or(""), "Aacute");
    EXPECT_EQ(font.category("acutecomb"), "mark");
    EXPECT_EQ(font.category("A"), "base");
    EXPECT_EQ(font.anchors("A").at("top").y, 700);
    EXPECT_FALSE(font.is_exported("hidden"));
    EXPECT_TRUE(font.has_glyph("hidden"));
}

TEST(FontSnapshot, DerivedMetrics){
    MemoryFont font = load_font_snapshot("glyph A width=600\nglyph B width=600 xMin=20 xMax=580\nglyph C width=600 lsb=7 rsb=9\n");
    auto a = *font.metrics("A");
    EXPECT_EQ(a.xMax, 600);
    EXPECT_EQ(a.lsb, 0);
    EXPECT_EQ(a.rsb, 0);
    auto b = *font.metrics("B");
    EXPECT_EQ(b.lsb, 20);
    EXPECT_EQ(b.rsb, 20);
    EXPECT_EQ(b.fullwidth(), 560);
    auto c = *font.metrics("C");
    EXPECT_EQ(c.lsb, 7);
    EXPECT_EQ(c.rsb, 9);
}

TEST(FontSnapshot, BadValueIsLocated){
    try {
        load_font_snapshot("glyph A width=600\nglyph B width=wide\n", "font.txt");
        FAIL() << "expected syntax_error";
    } catch(const syntax_error& e) {
        EXPECT_EQ(e.diagnostic().code, codes::syntax);
        EXPECT_EQ(e.diagnostic().file, "font.txt");
        EXPECT_EQ(e.diagnostic().line, 2);
        EXPECT_NE(e.diagnostic().message.find("wide"), std::string::npos);
    }
}

TEST(FontSnapshot, UnknownPropertyIsRejected){
    try {
        load_font_snapshot("glyph A colour=red\n");
        FAIL() << "expected syntax_error";
    } catch(const syntax_error& e) {
        EXPECT_NE(e.diagnostic().message.find("colour"), std::string::npos);
    }
}

TEST(FontSnapshot, DuplicateGlyphIsRejected){
    try {
        load_font_snapshot("glyph A width=1\nglyph A width=2\n");
        FAIL() << "expected syntax_error";
    } catch(const syntax_error& e) {
        EXPECT_EQ(e.diagnostic().line, 2);
    }
}

TEST(FontSnapshot, MalformedAnchorAndExport){
    EXPECT_THROW(load_font_snapshot("glyph A anchor=top\n"), syntax_error);
    EXPECT_THROW(load_font_snapshot("glyph A export=maybe\n"), syntax_error);
    EXPECT_THROW(load_font_snapshot("glyph A unicode=zz\n"), syntax_error);
    EXPECT_THROW(load_font_snapshot("glyf A\n"), syntax_error);
}

TEST(FontSnapshot, MissingFile){
    EXPECT_THROW(load_font_snapshot_file("/nonexistent/font.txt"), include_error);
}
