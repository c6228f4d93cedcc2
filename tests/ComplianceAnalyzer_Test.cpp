// =====================================================================================
//
//       Filename:  ComplianceAnalyzer_Test.cpp
//
//    Description:  unit tests for the shared utilities, the readers and the application driver
//
//        Version:  1.0
//        Created:  10/19/2026 03:20:18 PM
//       Revision:  none
//       Compiler:  g++
//
//         Author:  Compliance_Analyzer developers
//        License:  GNU General Public License v3
//        Company:
//
// =====================================================================================


	/* This file is part of Compliance_Analyzer. */

	/* Compliance_Analyzer is free software: you can redistribute it and/or modify */
	/* it under the terms of the GNU General Public License as published by */
	/* the Free Software Foundation, either version 3 of the License, or */
	/* (at your option) any later version. */

	/* Compliance_Analyzer is distributed in the hope that it will be useful, */
	/* but WITHOUT ANY WARRANTY; without even the implied warranty of */
	/* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the */
	/* GNU General Public License for more details. */

	/* You should have received a copy of the GNU General Public License */
	/* along with Compliance_Analyzer.  If not, see <http://www.gnu.org/licenses/>. */

#include <filesystem>
#include <fstream>
#include <string>
#include <tuple>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "spdlog/spdlog.h"

#include "AnalyzerTestData.h"

#include "Analyzer_Utils.h"
#include "ComplianceAnalyzerApp.h"
#include "CurrencyValue.h"
#include "JSON_Document.h"
#include "SectionCatalog.h"
#include "TablesFromText.h"
#include "TermLocator.h"

using namespace testing;

// =====================================================================================
//        Class:  UtilitiesTest
//  Description:
// =====================================================================================

TEST(UtilitiesTest, SetEntryKeepsFirstPositionAndTakesLatestValue)
{
    CA::OrderedEntries<int> entries;
    SetEntry(entries, "2023", 1);
    SetEntry(entries, "2022", 2);
    SetEntry(entries, "2023", 3);

    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[0].first, "2023");
    EXPECT_EQ(entries[0].second, 3);
    EXPECT_EQ(entries[1].first, "2022");

    ASSERT_NE(FindEntry(entries, "2022"), nullptr);
    EXPECT_EQ(*FindEntry(entries, "2022"), 2);
    EXPECT_EQ(FindEntry(entries, "2021"), nullptr);
}

TEST(UtilitiesTest, ExcerptIsClippedToText)
{
    const std::string text = "  Going concern doubt exists.  ";

    EXPECT_EQ(ExtractExcerpt(text, 2, 100, 200), "Going concern doubt exists.");
    EXPECT_EQ(ExtractExcerpt(text, 2, 0, 13), "Going concern");
    EXPECT_EQ(ExtractExcerpt(text, 500, 10, 10), "");
}

// an em dash is 3 bytes. put one across each edge of the window.

TEST(UtilitiesTest, ExcerptNeverSplitsACharacter)
{
    const std::string em_dash = "\xE2\x80\x94";

    const std::string leading = em_dash + std::string(98, 'x') + "item 1a risk factors";
    auto excerpt = ExtractExcerpt(leading, 101, 100, 200);
    EXPECT_EQ(excerpt, std::string(98, 'x') + "item 1a risk factors");
    EXPECT_NO_THROW(std::ignore = nlohmann::json(excerpt).dump());

    const std::string trailing = "Item 1A" + std::string(192, 'y') + em_dash + " more";
    excerpt = ExtractExcerpt(trailing, 0, 100, 200);
    EXPECT_EQ(excerpt, "Item 1A" + std::string(192, 'y'));
    EXPECT_NO_THROW(std::ignore = nlohmann::json(excerpt).dump());

    // a window which fits inside one character is empty.

    EXPECT_EQ(ExtractExcerpt(em_dash, 1, 0, 1), "");
}

TEST(UtilitiesTest, MoneyIsFormattedWithGrouping)
{
    EXPECT_EQ(FormatMoney(100.0), "$100.00");
    EXPECT_EQ(FormatMoney(1234567.891), "$1,234,567.89");
    EXPECT_EQ(FormatMoney(-500.0), "$-500.00");
    EXPECT_EQ(FormatMoney(-1234567.5), "$-1,234,567.50");
    EXPECT_DOUBLE_EQ(RoundTo2(2.345678), 2.35);
}

TEST(UtilitiesTest, CaseAndWhitespace)
{
    EXPECT_EQ(ToLower("Item 1A. RISK Factors"), "item 1a. risk factors");
    EXPECT_EQ(Trim("\t Total assets \n"), "Total assets");
}

// =====================================================================================
//        Class:  CurrencyTest
//  Description:
// =====================================================================================

TEST(CurrencyTest, ParenthesesMeanNegative)
{
    EXPECT_THAT(NormalizeCurrency("(500)"), Optional(DoubleEq(-500.0)));
    EXPECT_THAT(NormalizeCurrency("$(1,250.50)"), Optional(DoubleEq(-1250.50)));
}

TEST(CurrencyTest, SymbolsAndSeparatorsAreIgnored)
{
    EXPECT_THAT(NormalizeCurrency("$1,000.00"), Optional(DoubleEq(1000.0)));
    EXPECT_THAT(NormalizeCurrency("  42  "), Optional(DoubleEq(42.0)));
}

TEST(CurrencyTest, MillionsAndThousands)
{
    EXPECT_THAT(NormalizeCurrency("1M"), Optional(DoubleEq(1'000'000.0)));
    EXPECT_THAT(NormalizeCurrency("2.5k"), Optional(DoubleEq(2'500.0)));
    EXPECT_THAT(NormalizeCurrency("(1.5M)"), Optional(DoubleEq(-1'500'000.0)));
}

TEST(CurrencyTest, ManagementIsNotMillions)
{
    EXPECT_THAT(NormalizeCurrency("Management fee 2M"), Optional(DoubleEq(2.0)));
}

TEST(CurrencyTest, PlaceholdersAreZero)
{
    EXPECT_THAT(NormalizeCurrency(""), Optional(DoubleEq(0.0)));
    EXPECT_THAT(NormalizeCurrency("-"), Optional(DoubleEq(0.0)));
    EXPECT_THAT(NormalizeCurrency("—"), Optional(DoubleEq(0.0)));
    EXPECT_THAT(NormalizeCurrency("N/A"), Optional(DoubleEq(0.0)));
    EXPECT_THAT(NormalizeCurrency("   "), Optional(DoubleEq(0.0)));
}

TEST(CurrencyTest, UnparseableIsNotZero)
{
    EXPECT_EQ(NormalizeCurrency("abc"), std::nullopt);
    EXPECT_EQ(NormalizeCurrency("1.2.3"), std::nullopt);
}

// =====================================================================================
//        Class:  TermLocatorTest
//  Description:
// =====================================================================================

class TermLocatorTest : public Test
{
public:
    void SetUp() override
    {
        const std::string text = std::string(300, 'a') + " Risk Factors " + std::string(300, 'b')
            + " Item 1A " + std::string(300, 'c');

        pages_ = {MakePage(1, "Introduction"), MakePage(2, "Nothing to see here."), MakePage(3, text)};
    }

    std::vector<CA::DocumentPage> pages_;
};

TEST_F(TermLocatorTest, FirstTermInListWinsOnAPage)
{
    auto hit = LocateTerms(pages_, {"item 1a", "risk factors"});

    ASSERT_TRUE(hit.found_);
    EXPECT_THAT(hit.page_, Optional(3));
    ASSERT_TRUE(hit.excerpt_);
    EXPECT_THAT(hit.excerpt_.value(), StartsWith("bbb"));
    EXPECT_THAT(hit.excerpt_.value(), HasSubstr("Item 1A"));
    EXPECT_THAT(hit.excerpt_.value(), Not(HasSubstr("Risk Factors")));
}

TEST_F(TermLocatorTest, TermOrderNotTextOrder)
{
    auto hit = LocateTerms(pages_, {"risk factors", "item 1a"});

    ASSERT_TRUE(hit.found_);
    EXPECT_THAT(hit.page_, Optional(3));
    ASSERT_TRUE(hit.excerpt_);
    EXPECT_THAT(hit.excerpt_.value(), StartsWith("aaa"));
    EXPECT_THAT(hit.excerpt_.value(), HasSubstr("Risk Factors"));
    EXPECT_THAT(hit.excerpt_.value(), Not(HasSubstr("Item 1A")));
}

TEST_F(TermLocatorTest, EarlierPageWinsOverTermOrder)
{
    pages_[1].text_ = "The risk factors are listed later.";

    auto hit = LocateTerms(pages_, {"item 1a", "risk factors"});

    EXPECT_THAT(hit.page_, Optional(2));
}

TEST_F(TermLocatorTest, NothingFound)
{
    auto hit = LocateTerms(pages_, {"controls and procedures"});

    EXPECT_FALSE(hit.found_);
    EXPECT_EQ(hit.page_, std::nullopt);
    EXPECT_EQ(hit.excerpt_, std::nullopt);
}

// =====================================================================================
//        Class:  SectionCatalogTest
//  Description:
// =====================================================================================

TEST(SectionCatalogTest, TenKRequirements)
{
    const auto& sections = RequiredSections("10-K");

    ASSERT_EQ(sections.size(), 5);
    EXPECT_EQ(sections[0].name_, "Item 1: Business");
    EXPECT_FALSE(sections[0].critical_);
    EXPECT_EQ(sections[1].name_, "Item 1A: Risk Factors");
    EXPECT_TRUE(sections[1].critical_);
    EXPECT_THAT(sections[2].search_terms_, ElementsAre("item 7", "management's discussion", "md&a"));
}

TEST(SectionCatalogTest, DocumentTypeNames)
{
    EXPECT_THAT(DocumentTypeFromName("SOX 404"), Optional(DocumentType::e_SOX404));
    EXPECT_EQ(DocumentTypeName(DocumentType::e_8K), "8-K");
    EXPECT_EQ(DocumentTypeFromName("10-k"), std::nullopt);
}

TEST(SectionCatalogTest, UnknownTypeRequiresNothing)
{
    EXPECT_TRUE(RequiredSections("S-1").empty());
}

// =====================================================================================
//        Class:  TablesFromTextTest
//  Description:
// =====================================================================================

TEST(TablesFromTextTest, CollectsRunsOfTabbedLines)
{
    const std::string text = "Balance Sheet\n"
        "Item\t2023\t2022\n"
        "Total assets\t$\t100\t90\n"
        "Net loss\t(500\t)\t(400)\n"
        "\n"
        "Notes here\n"
        "Single\tline\n";

    auto tables = CollectTablesFromText(text);

    ASSERT_EQ(tables.size(), 1);
    ASSERT_EQ(tables[0].size(), 3);
    EXPECT_THAT(tables[0][0], ElementsAre("Item", "2023", "2022"));
    EXPECT_THAT(tables[0][1], ElementsAre("Total assets", "$100", "90"));
    EXPECT_THAT(tables[0][2], ElementsAre("Net loss", "(500)", "(400)"));
}

TEST(TablesFromTextTest, ExtraTabsAndSpacesAreOneSeparator)
{
    const std::string text = "A  \t  B\t\tC\r\n"
        "\tD\tE\tF\t\n"
        "plain text\n"
        "x\ty\n"
        "z\tw\n";

    auto tables = CollectTablesFromText(text);

    ASSERT_EQ(tables.size(), 2);
    EXPECT_THAT(tables[0][0], ElementsAre("A", "B", "C"));
    EXPECT_THAT(tables[0][1], ElementsAre("D", "E", "F"));
    EXPECT_THAT(tables[1][1], ElementsAre("z", "w"));
}

TEST(TablesFromTextTest, NoTables)
{
    EXPECT_TRUE(CollectTablesFromText("just some\nprose without cells\n").empty());
    EXPECT_TRUE(CollectTablesFromText("").empty());
}

// =====================================================================================
//        Class:  JSON_DocumentTest
//  Description:
// =====================================================================================

class JSON_DocumentTest : public Test
{
public:
    nlohmann::json document_ = nlohmann::json::parse(R"***(
        {
            "pages": [
                {
                    "text": "page one",
                    "tables": [[["Item", "2023"], ["Cash", 100], ["Other", null]]],
                    "widgets": [{"field_type": "signature", "field_name": "CFO"}]
                },
                {
                    "text": "page two"
                }
            ]
        }
    )***");
};

TEST_F(JSON_DocumentTest, PagesTablesAndWidgets)
{
    JSON_Document document{document_};

    ASSERT_EQ(document.PageCount(), 2);

    auto page = document.Page(0);
    EXPECT_EQ(page.page_number_, 1);
    EXPECT_EQ(page.text_, "page one");
    ASSERT_EQ(page.tables_.size(), 1);
    EXPECT_THAT(page.tables_[0][1], ElementsAre("Cash", "100"));
    EXPECT_THAT(page.tables_[0][2], ElementsAre("Other", ""));
    ASSERT_EQ(page.widgets_.size(), 1);
    EXPECT_EQ(page.widgets_[0].field_type_, "signature");
    EXPECT_EQ(page.widgets_[0].field_name_, "CFO");

    auto page2 = document.Page(1);
    EXPECT_EQ(page2.page_number_, 2);
    EXPECT_TRUE(page2.tables_.empty());
    EXPECT_TRUE(page2.widgets_.empty());
}

TEST_F(JSON_DocumentTest, NoPageAccessAfterClose)
{
    JSON_Document document{document_};
    document.Close();
    document.Close();

    EXPECT_THROW(std::ignore = document.Page(0), AnalyzerException);
}

TEST_F(JSON_DocumentTest, MissingPagesListIsAnOpenFailure)
{
    EXPECT_THROW(JSON_Document(nlohmann::json::parse(R"***({"no_pages": 1})***")), DocumentOpenException);
}

TEST_F(JSON_DocumentTest, MissingFileIsAnOpenFailure)
{
    EXPECT_THROW(JSON_Document(CA::FileName{"/tmp/ComplianceAnalyzer_Test/does_not_exist.json"}),
            DocumentOpenException);
}

// =====================================================================================
//        Class:  AppTest
//  Description:  runs the whole driver against documents written to a scratch
//                directory.
// =====================================================================================

class AppTest : public Test
{
public:
    void SetUp() override
    {
        fs::remove_all(work_dir_);
        fs::create_directories(work_dir_);

        WriteTextFile(work_dir_ / "annual_report.json", R"***(
            {"pages": [{"text": "Note 3\nThere is substantial doubt about the going concern assumption."}]}
        )***");
        WriteTextFile(work_dir_ / "clean_report.json", R"***(
            {"pages": [{"text": "Item 1A. Risk Factors"}]}
        )***");
        WriteTextFile(work_dir_ / "broken.json", "{ not json");
    }

    void TearDown() override
    {
        fs::remove_all(work_dir_);
    }

    static nlohmann::json ReadResult(const fs::path& file_name)
    {
        return nlohmann::json::parse(LoadDataFileForUse(CA::FileName{file_name}));
    }

    const fs::path work_dir_ = fs::temp_directory_path() / "ComplianceAnalyzer_AppTest";
};

TEST_F(AppTest, SingleFileToOutputFile)
{
    ComplianceAnalyzerApp app({"--operation", "detect_compliance_red_flags",
        "--file", (work_dir_ / "annual_report.json").string(),
        "--output", (work_dir_ / "result.json").string(),
        "--log-level", "none"}, FileOpener());

    ASSERT_TRUE(app.Startup());
    auto counters = app.Run();
    app.Shutdown();

    EXPECT_EQ(counters, std::make_tuple(1, 0, 0));

    auto result = ReadResult(work_dir_ / "result.json");
    EXPECT_TRUE(result["success"].get<bool>());
    ASSERT_EQ(result["red_flags"].size(), 1);
    EXPECT_EQ(result["red_flags"][0]["phrase"], "going concern");
    EXPECT_EQ(result["red_flags"][0]["context"], "Note 3");
}

TEST_F(AppTest, UnreadableDocumentWritesError)
{
    ComplianceAnalyzerApp app({"--operation", "extract_financial_statements",
        "--file", (work_dir_ / "broken.json").string(),
        "--output", (work_dir_ / "result.json").string(),
        "--log-level", "none"}, FileOpener());

    ASSERT_TRUE(app.Startup());
    auto counters = app.Run();

    EXPECT_EQ(counters, std::make_tuple(0, 0, 1));

    auto result = ReadResult(work_dir_ / "result.json");
    ASSERT_TRUE(result.contains("error"));
    EXPECT_THAT(result["error"].get<std::string>(), StartsWith("Failed to open PDF: "));
}

TEST_F(AppTest, RequestFile)
{
    nlohmann::json request{{"operation", "find_regulatory_sections"},
        {"pdf_path", (work_dir_ / "clean_report.json").string()}, {"doc_type", "10-K"}};
    WriteTextFile(work_dir_ / "request.json", request.dump());

    ComplianceAnalyzerApp app({"--request-file", (work_dir_ / "request.json").string(),
        "--output", (work_dir_ / "result.json").string(),
        "--log-level", "none"}, FileOpener());

    ASSERT_TRUE(app.Startup());
    EXPECT_EQ(app.Run(), std::make_tuple(1, 0, 0));

    auto result = ReadResult(work_dir_ / "result.json");
    EXPECT_EQ(result["doc_type"], "10-K");
    EXPECT_TRUE(result["sections_found"]["Item 1A: Risk Factors"]["found"].get<bool>());
    EXPECT_EQ(result["summary"]["total_required"], 5);
}

// the heading sits 101 bytes in so the excerpt window opens inside the em dash.

TEST_F(AppTest, ExcerptNextToMultiByteCharacter)
{
    WriteTextFile(work_dir_ / "dash_report.json", catenate(R"***({"pages": [{"text": "\u2014)***",
                std::string(98, 'x'), R"***(Item 1A. Risk Factors"}]})***"));

    ComplianceAnalyzerApp app({"--operation", "find_regulatory_sections", "--doc-type", "10-K",
        "--file", (work_dir_ / "dash_report.json").string(),
        "--output", (work_dir_ / "result.json").string(),
        "--log-level", "none"}, FileOpener());

    ASSERT_TRUE(app.Startup());
    EXPECT_EQ(app.Run(), std::make_tuple(1, 0, 0));

    auto result = ReadResult(work_dir_ / "result.json");
    ASSERT_FALSE(result.contains("error"));
    EXPECT_TRUE(result["success"].get<bool>());
    const auto& section = result["sections_found"]["Item 1A: Risk Factors"];
    EXPECT_EQ(section["page"], 1);
    EXPECT_THAT(section["excerpt"].get<std::string>(), StartsWith("xxx"));
}

TEST_F(AppTest, ListOfFilesConcurrently)
{
    WriteTextFile(work_dir_ / "list.txt", catenate((work_dir_ / "annual_report.json").string(), '\n',
                (work_dir_ / "clean_report.json").string(), "\n\n", (work_dir_ / "not_there.json").string(), '\n',
                (work_dir_ / "broken.json").string(), '\n'));

    ComplianceAnalyzerApp app({"--operation", "detect_compliance_red_flags",
        "--list-file", (work_dir_ / "list.txt").string(),
        "--output-dir", (work_dir_ / "results").string(),
        "-k", "2",
        "--log-level", "none"}, FileOpener());

    ASSERT_TRUE(app.Startup());
    EXPECT_EQ(app.Run(), std::make_tuple(2, 1, 1));

    auto result = ReadResult(work_dir_ / "results" / "annual_report_detect_compliance_red_flags.json");
    EXPECT_EQ(result["summary"]["critical"], 1);

    auto clean = ReadResult(work_dir_ / "results" / "clean_report_detect_compliance_red_flags.json");
    EXPECT_EQ(clean["summary"]["total_flags"], 0);

    EXPECT_TRUE(fs::exists(work_dir_ / "results" / "broken_detect_compliance_red_flags.json"));
    EXPECT_FALSE(fs::exists(work_dir_ / "results" / "not_there_detect_compliance_red_flags.json"));
}

TEST_F(AppTest, UnknownOperationFailsStartup)
{
    ComplianceAnalyzerApp app({"--operation", "summarize",
        "--file", (work_dir_ / "annual_report.json").string(),
        "--log-level", "none"}, FileOpener());

    EXPECT_FALSE(app.Startup());
}

TEST_F(AppTest, SectionsNeedADocType)
{
    ComplianceAnalyzerApp app({"--operation", "find_regulatory_sections",
        "--file", (work_dir_ / "annual_report.json").string(),
        "--log-level", "none"}, FileOpener());

    EXPECT_FALSE(app.Startup());
}

TEST_F(AppTest, ListNeedsAnOutputDirectory)
{
    WriteTextFile(work_dir_ / "list.txt", (work_dir_ / "annual_report.json").string());

    ComplianceAnalyzerApp app({"--operation", "validate_financial_math",
        "--list-file", (work_dir_ / "list.txt").string(),
        "--log-level", "none"}, FileOpener());

    EXPECT_FALSE(app.Startup());
}

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  main
 *  Description:
 * =====================================================================================
 */
int main(int argc, char** argv)
{
    InitGoogleMock(&argc, argv);

    // the driver tests change the level. start out quiet.

    spdlog::set_level(spdlog::level::warn);

    return RUN_ALL_TESTS();
}
