// =====================================================================================
//
//       Filename:  Operations_Test.cpp
//
//    Description:  tests for the six analysis operations and request handling
//
//        Version:  1.0
//        Created:  10/19/2026 04:47:09 PM
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

#include <memory>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "AnalyzerTestData.h"

#include "Analyzer_Utils.h"
#include "ComplianceOperations.h"
#include "PDF_Document.h"

using namespace testing;

namespace
{
    const CA::FileName DOCUMENT{"/tmp/ComplianceAnalyzer_Test/document.pdf"};

    std::vector<std::string> KeysOf(const OrderedJSON& object)
    {
        std::vector<std::string> keys;
        for (const auto& item : object.items())
        {
            keys.push_back(item.key());
        }
        return keys;
    }

    // a document whose pages can be made to fail. lets us see that the
    // document is closed no matter how the analysis ends.

    class TrackingDocument : public PDF_Document
    {
    public:
        TrackingDocument(int page_count, int failing_page, std::shared_ptr<int> close_count)
            : page_count_{page_count}, failing_page_{failing_page}, close_count_{std::move(close_count)} { }

        [[nodiscard]] int PageCount() const override { return page_count_; }

        [[nodiscard]] CA::DocumentPage Page(int index) override
        {
            if (index == failing_page_)
            {
                throw std::runtime_error("bad page");
            }
            return MakePage(index + 1, "Balance Sheet", {{{"", "2023"}, {"A", "1"}, {"B", "2"}, {"Total", "3"}}});
        }

        void Close() override { ++(*close_count_); }

    private:
        int page_count_;
        int failing_page_;
        std::shared_ptr<int> close_count_;
    };
}

// =====================================================================================
//        Class:  RegulatorySectionsTest
//  Description:
// =====================================================================================

class RegulatorySectionsTest : public Test
{
public:
    nlohmann::json document_ = nlohmann::json::parse(R"***(
        {
            "pages": [
                {"text": "Annual report cover"},
                {"text": "Item 1A. Risk Factors\nOur results may vary."},
                {"text": "Item 7. MD&A\nSigned by the CEO and the CFO"}
            ]
        }
    )***");
};

TEST_F(RegulatorySectionsTest, TenKSectionsAndMissingCritical)
{
    auto result = FindRegulatorySections(DOCUMENT, "10-K", MakeOpener(document_));

    EXPECT_TRUE(result["success"].get<bool>());
    EXPECT_EQ(result["doc_type"], "10-K");

    const auto& sections = result["sections_found"];
    EXPECT_THAT(KeysOf(sections), ElementsAre("Item 1: Business", "Item 1A: Risk Factors", "Item 7: MD&A",
                "Item 8: Financial Statements", "Item 9A: Controls and Procedures"));

    // 'item 1' is found inside 'Item 1A'.

    EXPECT_EQ(sections["Item 1: Business"]["page"], 2);
    EXPECT_FALSE(sections["Item 1: Business"]["critical"].get<bool>());
    EXPECT_EQ(sections["Item 1A: Risk Factors"]["excerpt"], "Item 1A. Risk Factors\nOur results may vary.");
    EXPECT_EQ(sections["Item 7: MD&A"]["page"], 3);

    const auto& missing = sections["Item 8: Financial Statements"];
    EXPECT_TRUE(missing["required"].get<bool>());
    EXPECT_FALSE(missing["found"].get<bool>());
    EXPECT_TRUE(missing["page"].is_null());
    EXPECT_TRUE(missing["excerpt"].is_null());

    EXPECT_EQ(result["summary"]["total_required"], 5);
    EXPECT_EQ(result["summary"]["total_found"], 3);
    EXPECT_THAT(result["summary"]["missing_critical"].get<std::vector<std::string>>(),
            ElementsAre("Item 8: Financial Statements", "Item 9A: Controls and Procedures"));
}

TEST_F(RegulatorySectionsTest, UnknownTypeHasNoRequirements)
{
    auto result = FindRegulatorySections(DOCUMENT, "Proxy", MakeOpener(document_));

    EXPECT_TRUE(result["success"].get<bool>());
    EXPECT_TRUE(result["sections_found"].is_object());
    EXPECT_TRUE(result["sections_found"].empty());
    EXPECT_EQ(result["summary"]["total_required"], 0);
    EXPECT_EQ(result["summary"]["total_found"], 0);
    EXPECT_TRUE(result["summary"]["missing_critical"].empty());
}

TEST_F(RegulatorySectionsTest, SameDocumentSameText)
{
    auto opener = MakeOpener(document_);

    EXPECT_EQ(FindRegulatorySections(DOCUMENT, "10-K", opener).dump(),
            FindRegulatorySections(DOCUMENT, "10-K", opener).dump());
}

// =====================================================================================
//        Class:  FinancialStatementsOperationTest
//  Description:
// =====================================================================================

TEST(FinancialStatementsOperationTest, StatementsFromClassifiedPages)
{
    auto document = nlohmann::json::parse(R"***(
        {
            "pages": [
                {
                    "text": "Consolidated Income Statement",
                    "tables": [[
                        ["", "2023", "2022"],
                        ["Total revenue", "$500", "400"],
                        ["Cost", "1", "2"],
                        ["Net income", "see note", "100"]
                    ]]
                },
                {
                    "text": "Unrelated",
                    "tables": [[["", "2023"], ["Total", "1"]]]
                }
            ]
        }
    )***");

    auto result = ExtractFinancialStatements(DOCUMENT, MakeOpener(document));

    EXPECT_TRUE(result["success"].get<bool>());
    ASSERT_EQ(result["statements"].size(), 1);

    const auto& statement = result["statements"][0];
    EXPECT_THAT(KeysOf(statement), ElementsAre("type", "page", "periods", "key_items", "table_data"));
    EXPECT_EQ(statement["type"], "Income Statement");
    EXPECT_EQ(statement["page"], 1);
    EXPECT_THAT(statement["periods"].get<std::vector<std::string>>(), ElementsAre("2023", "2022"));

    EXPECT_THAT(KeysOf(statement["key_items"]), ElementsAre("Total revenue", "Net income"));
    EXPECT_DOUBLE_EQ(statement["key_items"]["Total revenue"]["2023"].get<double>(), 500.0);
    EXPECT_TRUE(statement["key_items"]["Net income"]["2023"].is_null());
    EXPECT_DOUBLE_EQ(statement["key_items"]["Net income"]["2022"].get<double>(), 100.0);

    ASSERT_EQ(statement["table_data"].size(), 4);
    EXPECT_EQ(statement["table_data"][1][1], "$500");
}

// =====================================================================================
//        Class:  FinancialMathOperationTest
//  Description:
// =====================================================================================

TEST(FinancialMathOperationTest, ColumnMismatchReported)
{
    auto document = nlohmann::json::parse(R"***(
        {
            "pages": [
                {
                    "text": "Schedule of fees",
                    "tables": [[["hdr", "2023"], ["A", "10"], ["B", "20"], ["Total", "25"]]]
                },
                {
                    "text": "Notes",
                    "tables": [[["Item"]]]
                }
            ]
        }
    )***");

    auto result = ValidateFinancialMath(DOCUMENT, MakeOpener(document));

    EXPECT_TRUE(result["success"].get<bool>());

    const auto& validation = result["validation"];
    EXPECT_EQ(validation["tables_checked"], 2);
    EXPECT_TRUE(validation["warnings"].is_array());
    EXPECT_TRUE(validation["warnings"].empty());
    ASSERT_EQ(validation["errors"].size(), 1);

    const auto& error = validation["errors"][0];
    EXPECT_THAT(KeysOf(error), ElementsAre("type", "page", "severity", "table_number", "column", "calculated_sum",
                "reported_sum", "difference", "description"));
    EXPECT_EQ(error["type"], "Column Sum Mismatch");
    EXPECT_EQ(error["page"], 1);
    EXPECT_EQ(error["severity"], "high");
    EXPECT_EQ(error["table_number"], 1);
    EXPECT_EQ(error["column"], 2);
    EXPECT_DOUBLE_EQ(error["calculated_sum"].get<double>(), 30.0);
    EXPECT_DOUBLE_EQ(error["reported_sum"].get<double>(), 25.0);
    EXPECT_DOUBLE_EQ(error["difference"].get<double>(), 5.0);
}

TEST(FinancialMathOperationTest, BalanceSheetImbalanceReported)
{
    auto document = nlohmann::json::parse(R"***(
        {
            "pages": [
                {
                    "text": "Balance Sheet",
                    "tables": [[["", "2023"], ["Total assets", "100"], ["Total liabilities", "60"],
                        ["Total equity", "30"]]]
                }
            ]
        }
    )***");

    auto result = ValidateFinancialMath(DOCUMENT, MakeOpener(document));

    const auto& errors = result["validation"]["errors"];
    ASSERT_EQ(errors.size(), 2);
    EXPECT_EQ(errors[0]["type"], "Balance Sheet Imbalance");
    EXPECT_EQ(errors[0]["severity"], "critical");
    EXPECT_DOUBLE_EQ(errors[0]["assets"].get<double>(), 100.0);
    EXPECT_DOUBLE_EQ(errors[0]["liabilities_equity"].get<double>(), 90.0);
    EXPECT_DOUBLE_EQ(errors[0]["difference"].get<double>(), 10.0);
    EXPECT_EQ(errors[0]["description"], "Assets ($100.00) != Liabilities + Equity ($90.00)");
    EXPECT_EQ(errors[1]["type"], "Column Sum Mismatch");
}

// =====================================================================================
//        Class:  SignaturesOperationTest
//  Description:
// =====================================================================================

TEST(SignaturesOperationTest, TenKMissingCAO)
{
    auto document = nlohmann::json::parse(R"***(
        {
            "pages": [
                {"text": "Cover page"},
                {"text": "Signed by the CEO and the CFO"}
            ]
        }
    )***");

    auto result = CheckRequiredSignatures(DOCUMENT, "10-K", std::nullopt, MakeOpener(document));

    EXPECT_TRUE(result["success"].get<bool>());

    const auto& requirements = result["signature_requirements"];
    EXPECT_EQ(requirements["doc_type"], "10-K");
    EXPECT_TRUE(requirements["invoice_amount"].is_null());
    EXPECT_THAT(requirements["required_signatures"].get<std::vector<std::string>>(),
            ElementsAre("CEO Signature", "CFO Signature", "CAO Signature"));

    const auto& found = requirements["found_signatures"];
    ASSERT_EQ(found.size(), 3);
    EXPECT_THAT(KeysOf(found[0]), ElementsAre("type", "signer", "page", "excerpt"));
    EXPECT_EQ(found[0]["type"], "text_mention");
    EXPECT_EQ(found[0]["signer"], "CFO");
    EXPECT_EQ(found[0]["page"], 2);
    EXPECT_EQ(found[1]["signer"], "CEO");
    EXPECT_EQ(found[2]["signer"], "Authorized Signer");

    EXPECT_THAT(requirements["missing_signatures"].get<std::vector<std::string>>(), ElementsAre("CAO Signature"));
    EXPECT_EQ(requirements["compliance_status"], "INCOMPLETE");
}

TEST(SignaturesOperationTest, LargeInvoiceNeedsApprover)
{
    auto approved = nlohmann::json::parse(R"***(
        {"pages": [{"text": "Invoice #77\nApproved by: J. Smith", "widgets": [{"field_type": "signature", "field_name": "J. Smith"}]}]}
    )***");
    auto unapproved = nlohmann::json::parse(R"***(
        {"pages": [{"text": "Invoice #78"}]}
    )***");

    auto result = CheckRequiredSignatures(DOCUMENT, "Invoice", 15'000.0, MakeOpener(approved));

    const auto& requirements = result["signature_requirements"];
    EXPECT_DOUBLE_EQ(requirements["invoice_amount"].get<double>(), 15'000.0);
    EXPECT_THAT(requirements["required_signatures"].get<std::vector<std::string>>(),
            ElementsAre("Authorized Approver"));
    ASSERT_EQ(requirements["found_signatures"].size(), 2);
    EXPECT_EQ(requirements["found_signatures"][0]["type"], "digital_signature");
    EXPECT_EQ(requirements["found_signatures"][1]["signer"], "Approver");
    EXPECT_EQ(requirements["compliance_status"], "COMPLETE");

    auto missing = CheckRequiredSignatures(DOCUMENT, "Invoice", 15'000.0, MakeOpener(unapproved));
    EXPECT_EQ(missing["signature_requirements"]["compliance_status"], "INCOMPLETE");

    auto small = CheckRequiredSignatures(DOCUMENT, "Invoice", 500.0, MakeOpener(unapproved));
    EXPECT_TRUE(small["signature_requirements"]["required_signatures"].empty());
    EXPECT_EQ(small["signature_requirements"]["compliance_status"], "COMPLETE");
}

// =====================================================================================
//        Class:  RedFlagsOperationTest
//  Description:
// =====================================================================================

class RedFlagsOperationTest : public Test
{
public:
    nlohmann::json document_ = nlohmann::json::parse(R"***(
        {
            "pages": [
                {"text": "Note 3\nGoing concern uncertainty"},
                {"text": "Section 9\nWe identified a material weakness and a significant deficiency."}
            ]
        }
    )***");
};

TEST_F(RedFlagsOperationTest, FlagsAndSummary)
{
    auto result = DetectComplianceRedFlags(DOCUMENT, MakeOpener(document_));

    EXPECT_TRUE(result["success"].get<bool>());

    const auto& flags = result["red_flags"];
    ASSERT_EQ(flags.size(), 3);
    EXPECT_THAT(KeysOf(flags[0]), ElementsAre("phrase", "type", "severity", "page", "excerpt", "context"));
    EXPECT_EQ(flags[0]["phrase"], "going concern");
    EXPECT_EQ(flags[0]["severity"], "critical");
    EXPECT_EQ(flags[0]["page"], 1);
    EXPECT_EQ(flags[0]["context"], "Note 3");
    EXPECT_EQ(flags[1]["phrase"], "material weakness");
    EXPECT_EQ(flags[1]["type"], "material_weakness");
    EXPECT_EQ(flags[1]["context"], "Section 9");
    EXPECT_EQ(flags[2]["phrase"], "significant deficiency");
    EXPECT_EQ(flags[2]["severity"], "high");

    EXPECT_EQ(result["summary"]["total_flags"], 3);
    EXPECT_EQ(result["summary"]["critical"], 2);
    EXPECT_EQ(result["summary"]["high"], 1);
    EXPECT_EQ(result["summary"]["medium"], 0);
}

TEST_F(RedFlagsOperationTest, SameDocumentSameText)
{
    auto opener = MakeOpener(document_);

    EXPECT_EQ(DetectComplianceRedFlags(DOCUMENT, opener).dump(), DetectComplianceRedFlags(DOCUMENT, opener).dump());
}

// =====================================================================================
//        Class:  ComparativePeriodsOperationTest
//  Description:
// =====================================================================================

TEST(ComparativePeriodsOperationTest, ChangesBetweenYears)
{
    auto document = nlohmann::json::parse(R"***(
        {
            "pages": [
                {
                    "text": "Selected financial data",
                    "tables": [[["", "2023", "2022"], ["Revenue", "120", "100"], ["Other income", "50", "0"]]]
                }
            ]
        }
    )***");

    auto result = ExtractComparativePeriods(DOCUMENT, MakeOpener(document));

    EXPECT_TRUE(result["success"].get<bool>());

    const auto& data = result["comparative_data"];
    ASSERT_EQ(data.size(), 2);

    EXPECT_THAT(KeysOf(data[0]), ElementsAre("metric", "page", "periods", "changes"));
    EXPECT_EQ(data[0]["metric"], "Revenue");
    EXPECT_EQ(data[0]["page"], 1);
    EXPECT_THAT(KeysOf(data[0]["periods"]), ElementsAre("2023", "2022"));

    const auto& revenue = data[0]["changes"]["2023_vs_2022"];
    EXPECT_THAT(KeysOf(revenue), ElementsAre("absolute", "percent", "material", "direction"));
    EXPECT_DOUBLE_EQ(revenue["absolute"].get<double>(), 20.0);
    EXPECT_DOUBLE_EQ(revenue["percent"].get<double>(), 20.0);
    EXPECT_TRUE(revenue["material"].get<bool>());
    EXPECT_EQ(revenue["direction"], "increase");

    const auto& other = data[1]["changes"]["2023_vs_2022"];
    EXPECT_TRUE(other["percent"].is_null());
    EXPECT_FALSE(other["material"].get<bool>());
}

// =====================================================================================
//        Class:  OperationErrorsTest
//  Description:
// =====================================================================================

TEST(OperationErrorsTest, OpenerFailureIsAnOpenFailure)
{
    DocumentOpener opener = [](const CA::FileName&) -> std::unique_ptr<PDF_Document>
    {
        throw std::runtime_error("corrupt xref table");
    };

    try
    {
        std::ignore = ValidateFinancialMath(DOCUMENT, opener);
        FAIL() << "expected DocumentOpenException";
    }
    catch (const DocumentOpenException& e)
    {
        EXPECT_STREQ(e.what(), "Failed to open PDF: corrupt xref table");
    }
}

TEST(OperationErrorsTest, OpenFailureMessagePassesThrough)
{
    DocumentOpener opener = [](const CA::FileName&) -> std::unique_ptr<PDF_Document>
    {
        throw DocumentOpenException("Failed to open PDF: gone");
    };

    try
    {
        std::ignore = DetectComplianceRedFlags(DOCUMENT, opener);
        FAIL() << "expected DocumentOpenException";
    }
    catch (const DocumentOpenException& e)
    {
        EXPECT_STREQ(e.what(), "Failed to open PDF: gone");
    }
}

TEST(OperationErrorsTest, NoReaderIsAnOpenFailure)
{
    DocumentOpener opener = [](const CA::FileName&) { return std::unique_ptr<PDF_Document>{}; };

    EXPECT_THROW(std::ignore = ExtractComparativePeriods(DOCUMENT, opener), DocumentOpenException);
}

TEST(OperationErrorsTest, MalformedDocumentIsAnOpenFailure)
{
    EXPECT_THROW(std::ignore = ExtractFinancialStatements(DOCUMENT, MakeOpener(nlohmann::json{{"pages", 5}})),
            DocumentOpenException);
}

TEST(OperationErrorsTest, PageFailureIsAnAnalysisFailureAndDocumentIsClosed)
{
    auto close_count = std::make_shared<int>(0);
    DocumentOpener opener = [close_count](const CA::FileName&)
    {
        return std::make_unique<TrackingDocument>(3, 1, close_count);
    };

    try
    {
        std::ignore = ValidateFinancialMath(DOCUMENT, opener);
        FAIL() << "expected AnalysisException";
    }
    catch (const AnalysisException& e)
    {
        EXPECT_STREQ(e.what(), "Failed to validate financial math: bad page");
    }
    EXPECT_EQ(*close_count, 1);
}

// the section search runs over the collected pages while the document is open,
// under the same failure description as the page walk.

TEST(OperationErrorsTest, FindSectionsFailureIsAnAnalysisFailure)
{
    auto close_count = std::make_shared<int>(0);
    DocumentOpener opener = [close_count](const CA::FileName&)
    {
        return std::make_unique<TrackingDocument>(3, 2, close_count);
    };

    try
    {
        std::ignore = FindRegulatorySections(DOCUMENT, "10-K", opener);
        FAIL() << "expected AnalysisException";
    }
    catch (const AnalysisException& e)
    {
        EXPECT_STREQ(e.what(), "Failed to find regulatory sections: bad page");
    }
    EXPECT_EQ(*close_count, 1);

    auto result = FindRegulatorySections(DOCUMENT, "10-K", [close_count](const CA::FileName&)
            { return std::make_unique<TrackingDocument>(2, -1, close_count); });
    EXPECT_EQ(result["summary"]["total_found"], 0);
    EXPECT_EQ(*close_count, 2);
}

TEST(OperationErrorsTest, DocumentIsClosedAfterSuccess)
{
    auto close_count = std::make_shared<int>(0);
    DocumentOpener opener = [close_count](const CA::FileName&)
    {
        return std::make_unique<TrackingDocument>(3, -1, close_count);
    };

    auto result = ValidateFinancialMath(DOCUMENT, opener);

    EXPECT_EQ(result["validation"]["tables_checked"], 3);
    EXPECT_TRUE(result["validation"]["errors"].empty());
    EXPECT_EQ(*close_count, 1);
}

TEST(OperationErrorsTest, EachOperationNamesItsFailure)
{
    auto close_count = std::make_shared<int>(0);
    DocumentOpener opener = [close_count](const CA::FileName&)
    {
        return std::make_unique<TrackingDocument>(1, 0, close_count);
    };

    EXPECT_THAT([&] { std::ignore = FindRegulatorySections(DOCUMENT, "10-K", opener); },
            ThrowsMessage<AnalysisException>(StartsWith("Failed to find regulatory sections: ")));
    EXPECT_THAT([&] { std::ignore = ExtractFinancialStatements(DOCUMENT, opener); },
            ThrowsMessage<AnalysisException>(StartsWith("Failed to extract financial statements: ")));
    EXPECT_THAT([&] { std::ignore = CheckRequiredSignatures(DOCUMENT, "8-K", std::nullopt, opener); },
            ThrowsMessage<AnalysisException>(StartsWith("Failed to check signatures: ")));
    EXPECT_THAT([&] { std::ignore = DetectComplianceRedFlags(DOCUMENT, opener); },
            ThrowsMessage<AnalysisException>(StartsWith("Failed to detect red flags: ")));
    EXPECT_THAT([&] { std::ignore = ExtractComparativePeriods(DOCUMENT, opener); },
            ThrowsMessage<AnalysisException>(StartsWith("Failed to extract comparative periods: ")));

    EXPECT_EQ(*close_count, 5);
}

// =====================================================================================
//        Class:  RunOperationTest
//  Description:
// =====================================================================================

class RunOperationTest : public Test
{
public:
    DocumentOpener opener_ = MakeOpener(nlohmann::json::parse(R"***(
        {"pages": [{"text": "Invoice #9\nApproved by Finance"}]}
    )***"));
};

TEST_F(RunOperationTest, OperationNames)
{
    EXPECT_EQ(OperationNames().size(), 6);
    EXPECT_TRUE(OperationNeedsDocType("find_regulatory_sections"));
    EXPECT_TRUE(OperationNeedsDocType("check_required_signatures"));
    EXPECT_FALSE(OperationNeedsDocType("validate_financial_math"));
}

TEST_F(RunOperationTest, BadRequests)
{
    EXPECT_THROW(std::ignore = RunOperation(nlohmann::json::array(), opener_), RequestException);
    EXPECT_THROW(std::ignore = RunOperation({{"pdf_path", "a.pdf"}}, opener_), RequestException);
    EXPECT_THROW(std::ignore = RunOperation({{"operation", "summarize"}, {"pdf_path", "a.pdf"}}, opener_),
            RequestException);
    EXPECT_THROW(std::ignore = RunOperation({{"operation", "validate_financial_math"}}, opener_), RequestException);
    EXPECT_THROW(std::ignore = RunOperation({{"operation", "find_regulatory_sections"}, {"pdf_path", "a.pdf"}},
                opener_), RequestException);
    EXPECT_THROW(std::ignore = RunOperation({{"operation", "check_required_signatures"}, {"pdf_path", "a.pdf"},
                {"doc_type", "Invoice"}, {"invoice_amount", "lots"}}, opener_), RequestException);
}

TEST_F(RunOperationTest, SignaturesWithInvoiceAmount)
{
    auto result = RunOperation({{"operation", "check_required_signatures"}, {"pdf_path", "a.pdf"},
            {"doc_type", "Invoice"}, {"invoice_amount", 15000}}, opener_);

    const auto& requirements = result["signature_requirements"];
    EXPECT_DOUBLE_EQ(requirements["invoice_amount"].get<double>(), 15'000.0);
    EXPECT_THAT(requirements["required_signatures"].get<std::vector<std::string>>(),
            ElementsAre("Authorized Approver"));
    EXPECT_EQ(requirements["compliance_status"], "COMPLETE");
}

TEST_F(RunOperationTest, NullInvoiceAmountIsAbsent)
{
    auto result = RunOperation({{"operation", "check_required_signatures"}, {"pdf_path", "a.pdf"},
            {"doc_type", "Invoice"}, {"invoice_amount", nullptr}}, opener_);

    EXPECT_TRUE(result["signature_requirements"]["invoice_amount"].is_null());
    EXPECT_TRUE(result["signature_requirements"]["required_signatures"].empty());
}

TEST_F(RunOperationTest, DocTypeIgnoredWhereNotNeeded)
{
    auto result = RunOperation({{"operation", "extract_financial_statements"}, {"pdf_path", "a.pdf"},
            {"doc_type", "10-K"}}, opener_);

    EXPECT_TRUE(result["success"].get<bool>());
    EXPECT_EQ(result["statements"].size(), 0);
    EXPECT_FALSE(result.contains("doc_type"));
}
