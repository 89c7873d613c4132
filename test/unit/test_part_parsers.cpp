#include "excelcsv/reader/RelationshipsParser.hpp"
#include "excelcsv/reader/SharedStringsParser.hpp"
#include "excelcsv/reader/StylesParser.hpp"
#include "excelcsv/reader/WorkbookParser.hpp"

#include <gtest/gtest.h>

namespace excelcsv {
namespace reader {

// ==================== RelationshipsParser ====================

class RelationshipsParserTest : public ::testing::Test {
protected:
    const std::string workbook_rels_ = R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>
<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">
  <Relationship Id="rId3" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles" Target="styles.xml"/>
  <Relationship Id="rId2" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet" Target="/xl/worksheets/data.xml"/>
  <Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet" Target="worksheets/sheet1.xml"/>
  <Relationship Id="rId4" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/sharedStrings" Target="sharedStrings.xml"/>
  <Relationship Id="rId9" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/hyperlink" Target="https://example.com" TargetMode="External"/>
</Relationships>)";
};

TEST_F(RelationshipsParserTest, IndexesById) {
    RelationshipsParser parser;
    ASSERT_TRUE(parser.parseXML(workbook_rels_)) << parser.getErrorMessage();
    EXPECT_EQ(parser.getRelationshipCount(), 5u);

    const auto* rel = parser.findById("rId1");
    ASSERT_NE(rel, nullptr);
    EXPECT_EQ(rel->target, "worksheets/sheet1.xml");
    EXPECT_EQ(rel->typeName(), "worksheet");
    EXPECT_EQ(rel->target_mode, "Internal");

    EXPECT_EQ(parser.findById("rId9")->target_mode, "External");
    EXPECT_EQ(parser.findById("rId42"), nullptr);
}

TEST_F(RelationshipsParserTest, FindsByTypeName) {
    RelationshipsParser parser;
    ASSERT_TRUE(parser.parseXML(workbook_rels_));
    ASSERT_NE(parser.findFirstByType("sharedStrings"), nullptr);
    EXPECT_EQ(parser.findFirstByType("sharedStrings")->id, "rId4");
    EXPECT_EQ(parser.findFirstByType("theme"), nullptr);
}

TEST_F(RelationshipsParserTest, ReparseReplacesContent) {
    RelationshipsParser parser;
    ASSERT_TRUE(parser.parseXML(workbook_rels_));
    ASSERT_TRUE(parser.parseXML("<Relationships/>"));
    EXPECT_EQ(parser.getRelationshipCount(), 0u);
    EXPECT_EQ(parser.findById("rId1"), nullptr);
}

TEST_F(RelationshipsParserTest, ResolveTarget) {
    EXPECT_EQ(RelationshipsParser::resolveTarget("xl", "worksheets/sheet1.xml"), "xl/worksheets/sheet1.xml");
    EXPECT_EQ(RelationshipsParser::resolveTarget("xl", "/xl/worksheets/data.xml"), "xl/worksheets/data.xml");
    EXPECT_EQ(RelationshipsParser::resolveTarget("xl/worksheets", "../sharedStrings.xml"), "xl/sharedStrings.xml");
    EXPECT_EQ(RelationshipsParser::resolveTarget("", "xl/workbook.xml"), "xl/workbook.xml");
    EXPECT_EQ(RelationshipsParser::resolveTarget("xl", "./styles.xml"), "xl/styles.xml");
}

TEST_F(RelationshipsParserTest, RelsPathFor) {
    EXPECT_EQ(RelationshipsParser::relsPathFor("xl/workbook.xml"), "xl/_rels/workbook.xml.rels");
    EXPECT_EQ(RelationshipsParser::relsPathFor("workbook.xml"), "_rels/workbook.xml.rels");
}

// ==================== WorkbookParser ====================

class WorkbookParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(relationships_.parseXML(R"(<Relationships>
  <Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet" Target="worksheets/sheet1.xml"/>
  <Relationship Id="rId2" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet" Target="/xl/worksheets/other.xml"/>
</Relationships>)"));
        parser_.setRelationships(&relationships_, "xl");
    }

    RelationshipsParser relationships_;
    WorkbookParser parser_;
};

TEST_F(WorkbookParserTest, CollectsSheetsInDocumentOrder) {
    const std::string xml = R"(<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"
    xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">
  <workbookPr defaultThemeVersion="124226"/>
  <sheets>
    <sheet name="Zeta &amp; Co" sheetId="5" r:id="rId2"/>
    <sheet name="Alpha" sheetId="1" r:id="rId1" state="hidden"/>
    <sheet name="Orphan" sheetId="7" r:id="rId7"/>
  </sheets>
</workbook>)";
    ASSERT_TRUE(parser_.parseXML(xml)) << parser_.getErrorMessage();

    const auto& sheets = parser_.getWorksheets();
    ASSERT_EQ(sheets.size(), 3u);
    EXPECT_EQ(sheets[0].name, "Zeta & Co");
    EXPECT_EQ(sheets[0].worksheet_path, "xl/worksheets/other.xml");
    EXPECT_EQ(sheets[1].name, "Alpha");
    EXPECT_EQ(sheets[1].worksheet_path, "xl/worksheets/sheet1.xml");
    EXPECT_EQ(sheets[1].state, "hidden");
    // 关系缺失时按 sheetId 推断
    EXPECT_EQ(sheets[2].worksheet_path, "xl/worksheets/sheet7.xml");
    EXPECT_FALSE(parser_.isDate1904());
}

TEST_F(WorkbookParserTest, AcceptsAnyRelationshipPrefix) {
    const std::string xml = R"(<x:workbook xmlns:x="http://schemas.openxmlformats.org/spreadsheetml/2006/main"
    xmlns:rel="http://schemas.openxmlformats.org/officeDocument/2006/relationships">
  <x:workbookPr date1904="1"/>
  <x:sheets><x:sheet name="Only" sheetId="1" rel:id="rId1"/></x:sheets>
</x:workbook>)";
    ASSERT_TRUE(parser_.parseXML(xml));
    ASSERT_EQ(parser_.getWorksheets().size(), 1u);
    EXPECT_EQ(parser_.getWorksheets()[0].rel_id, "rId1");
    EXPECT_EQ(parser_.getWorksheets()[0].worksheet_path, "xl/worksheets/sheet1.xml");
    EXPECT_TRUE(parser_.isDate1904());
}

TEST_F(WorkbookParserTest, MalformedXmlFails) {
    EXPECT_FALSE(parser_.parseXML("<workbook><sheets></workbook>"));
    EXPECT_TRUE(parser_.hasError());
    EXPECT_FALSE(parser_.getErrorMessage().empty());
}

// ==================== SharedStringsParser ====================

class SharedStringsParserTest : public ::testing::Test {
protected:
    SharedStringsParser parser_;
};

TEST_F(SharedStringsParserTest, PlainAndRichText) {
    const std::string xml = R"(<sst xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" count="4" uniqueCount="4">
  <si><t>Hello</t></si>
  <si><r><rPr><b/></rPr><t>Bold</t></r><r><t xml:space="preserve"> and plain</t></r></si>
  <si><t/></si>
  <si><t xml:space="preserve">  spaced  </t></si>
</sst>)";
    ASSERT_TRUE(parser_.parseXML(xml)) << parser_.getErrorMessage();
    ASSERT_EQ(parser_.getStringCount(), 4u);
    EXPECT_EQ(*parser_.getString(0), "Hello");
    EXPECT_EQ(*parser_.getString(1), "Bold and plain");
    EXPECT_EQ(*parser_.getString(2), "");
    EXPECT_EQ(*parser_.getString(3), "  spaced  ");
    EXPECT_EQ(parser_.getString(4), nullptr);
}

TEST_F(SharedStringsParserTest, PhoneticRunsAreIgnored) {
    const std::string xml = R"(<sst><si><t>東京</t><rPh sb="0" eb="2"><t>トウキョウ</t></rPh><phoneticPr fontId="1"/></si></sst>)";
    ASSERT_TRUE(parser_.parseXML(xml));
    ASSERT_EQ(parser_.getStringCount(), 1u);
    EXPECT_EQ(*parser_.getString(0), "東京");
}

TEST_F(SharedStringsParserTest, EntitiesAndLineBreaks) {
    const std::string xml = "<sst><si><t>a &amp;amp; b\nline2 &lt;tag&gt;</t></si></sst>";
    ASSERT_TRUE(parser_.parseXML(xml));
    EXPECT_EQ(*parser_.getString(0), "a &amp; b\nline2 <tag>");
}

// ==================== StylesParser ====================

class StylesParserTest : public ::testing::Test {
protected:
    const std::string styles_xml_ = R"xml(<styleSheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main">
  <numFmts count="4">
    <numFmt numFmtId="164" formatCode="yyyy\-mm\-dd"/>
    <numFmt numFmtId="165" formatCode="&quot;Day&quot;\ 0.00"/>
    <numFmt numFmtId="166" formatCode="[h]:mm:ss"/>
    <numFmt numFmtId="167" formatCode="[Red]#,##0.00_);[Blue]\(#,##0.00\)"/>
  </numFmts>
  <cellStyleXfs count="1"><xf numFmtId="14"/></cellStyleXfs>
  <cellXfs count="7">
    <xf numFmtId="0" fontId="0"/>
    <xf numFmtId="14" fontId="0" applyNumberFormat="1"/>
    <xf numFmtId="164"/>
    <xf numFmtId="165"/>
    <xf numFmtId="166"/>
    <xf numFmtId="167"/>
    <xf numFmtId="4"><alignment horizontal="left"/></xf>
  </cellXfs>
</styleSheet>)xml";
};

TEST_F(StylesParserTest, ClassifiesCellFormats) {
    StylesParser parser;
    ASSERT_TRUE(parser.parseXML(styles_xml_)) << parser.getErrorMessage();
    ASSERT_EQ(parser.getCellXfCount(), 7u);

    EXPECT_FALSE(parser.isDateStyle(0));
    EXPECT_TRUE(parser.isDateStyle(1));
    EXPECT_TRUE(parser.isDateStyle(2));
    EXPECT_FALSE(parser.isDateStyle(3));
    EXPECT_TRUE(parser.isDateStyle(4));
    EXPECT_FALSE(parser.isDateStyle(5));
    EXPECT_FALSE(parser.isDateStyle(6));
    EXPECT_FALSE(parser.isDateStyle(99));

    EXPECT_EQ(parser.getNumberFormatId(2), 164);
    EXPECT_EQ(parser.getFormatCode(164), "yyyy\\-mm\\-dd");
    EXPECT_EQ(parser.getFormatCode(14), "mm-dd-yy");
}

TEST_F(StylesParserTest, BuiltinDateFormats) {
    for (int id = 14; id <= 22; ++id) {
        EXPECT_TRUE(StylesParser::isBuiltinDateFormat(id)) << id;
    }
    for (int id = 45; id <= 47; ++id) {
        EXPECT_TRUE(StylesParser::isBuiltinDateFormat(id)) << id;
    }
    EXPECT_FALSE(StylesParser::isBuiltinDateFormat(0));
    EXPECT_FALSE(StylesParser::isBuiltinDateFormat(13));
    EXPECT_FALSE(StylesParser::isBuiltinDateFormat(23));
    EXPECT_FALSE(StylesParser::isBuiltinDateFormat(49));
}

TEST_F(StylesParserTest, DateFormatCodes) {
    EXPECT_TRUE(StylesParser::isDateFormatCode("dd/mm/yyyy"));
    EXPECT_TRUE(StylesParser::isDateFormatCode("h:mm AM/PM"));
    EXPECT_TRUE(StylesParser::isDateFormatCode("[$-409]mmmm d, yyyy"));
    EXPECT_TRUE(StylesParser::isDateFormatCode("[mm]:ss"));
    EXPECT_TRUE(StylesParser::isDateFormatCode("[h]"));

    EXPECT_FALSE(StylesParser::isDateFormatCode("General"));
    EXPECT_FALSE(StylesParser::isDateFormatCode("0.00%"));
    EXPECT_FALSE(StylesParser::isDateFormatCode("\"days\" 0"));
    EXPECT_FALSE(StylesParser::isDateFormatCode("0\\d"));
    EXPECT_FALSE(StylesParser::isDateFormatCode("[Red]0.00"));
    EXPECT_FALSE(StylesParser::isDateFormatCode("#,##0_);(#,##0)"));
    EXPECT_FALSE(StylesParser::isDateFormatCode("@"));
}

}} // namespace excelcsv::reader
