// =====================================================================================
//
//       Filename:  ComplianceOperations.cpp
//
//    Description:  the analysis operations a user can ask for. each opens the
//                  document, walks its pages and returns a JSON report.
//
//        Version:  1.0
//        Created:  10/19/2026 05:47:13 PM
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

#include "ComplianceOperations.h"

#include <memory>
#include <variant>

#include <range/v3/algorithm/find.hpp>

#include "spdlog/spdlog.h"

#include "Analyzer_Utils.h"
#include "ComparativePeriods.h"
#include "FinancialMathValidator.h"
#include "FinancialStatements.h"
#include "RedFlagDetector.h"
#include "SectionCatalog.h"
#include "SignatureDetector.h"
#include "TermLocator.h"

namespace
{
    template<typename T>
    OrderedJSON OptionalValue(const std::optional<T>& value)
    {
        return value ? OrderedJSON(value.value()) : OrderedJSON(nullptr);
    }

    std::unique_ptr<PDF_Document> OpenForAnalysis(const CA::FileName& pdf_path, const DocumentOpener& opener)
    {
        std::unique_ptr<PDF_Document> document;
        try
        {
            document = opener(pdf_path);
        }
        catch (const DocumentOpenException&)
        {
            throw;
        }
        catch (const std::exception& e)
        {
            throw DocumentOpenException(catenate("Failed to open PDF: ", e.what()));
        }
        if (! document)
        {
            throw DocumentOpenException(catenate("Failed to open PDF: no reader for: ", pdf_path.get()));
        }
        return document;
    }

    // the document is closed before any exception leaves here. finish_func runs
    // after the last page, still under the operation's error description.

    template<typename PageFunc, typename FinishFunc>
    void WalkDocument(const CA::FileName& pdf_path, const DocumentOpener& opener, CA::sv description,
            PageFunc page_func, FinishFunc finish_func)
    {
        auto document = OpenForAnalysis(pdf_path, opener);
        try
        {
            DocumentCloser closer{*document};

            const int page_count = document->PageCount();
            for (int index = 0; index < page_count; ++index)
            {
                page_func(document->Page(index));
            }
            finish_func();
        }
        catch (const std::exception& e)
        {
            throw AnalysisException(catenate("Failed to ", description, ": ", e.what()));
        }
    }

    template<typename PageFunc>
    void WalkDocument(const CA::FileName& pdf_path, const DocumentOpener& opener, CA::sv description,
            PageFunc page_func)
    {
        WalkDocument(pdf_path, opener, description, page_func, [] {});
    }

    OrderedJSON DiscrepancyToJSON(const Discrepancy& discrepancy)
    {
        OrderedJSON result;
        result["type"] = DiscrepancyKind(discrepancy);

        if (const auto* imbalance = std::get_if<BalanceSheetImbalance>(&discrepancy))
        {
            result["page"] = imbalance->page_;
            result["severity"] = DiscrepancySeverity(discrepancy);
            result["assets"] = imbalance->assets_;
            result["liabilities_equity"] = imbalance->liabilities_equity_;
            result["difference"] = imbalance->difference_;
            result["description"] = imbalance->description_;
        }
        else if (const auto* mismatch = std::get_if<IncomeStatementMismatch>(&discrepancy))
        {
            result["page"] = mismatch->page_;
            result["severity"] = DiscrepancySeverity(discrepancy);
            result["revenue"] = mismatch->revenue_;
            result["expenses"] = mismatch->expenses_;
            result["expected_net"] = mismatch->expected_net_;
            result["reported_net"] = mismatch->reported_net_;
            result["difference"] = mismatch->difference_;
            result["description"] = mismatch->description_;
        }
        else if (const auto* column = std::get_if<ColumnSumMismatch>(&discrepancy))
        {
            result["page"] = column->page_;
            result["severity"] = DiscrepancySeverity(discrepancy);
            result["table_number"] = column->table_number_;
            result["column"] = column->column_;
            result["calculated_sum"] = column->calculated_sum_;
            result["reported_sum"] = column->reported_sum_;
            result["difference"] = column->difference_;
            result["description"] = column->description_;
        }
        return result;
    }

    OrderedJSON StatementToJSON(const ClassifiedStatement& statement)
    {
        OrderedJSON key_items = OrderedJSON::object();
        for (const auto& [label, values] : statement.key_items_)
        {
            OrderedJSON period_values = OrderedJSON::object();
            for (const auto& [period, value] : values)
            {
                period_values[period] = OptionalValue(value);
            }
            key_items[label] = std::move(period_values);
        }

        OrderedJSON result;
        result["type"] = StatementTypeName(statement.type_);
        result["page"] = statement.page_;
        result["periods"] = statement.periods_;
        result["key_items"] = std::move(key_items);
        result["table_data"] = statement.table_data_;
        return result;
    }

    OrderedJSON PeriodChangeToJSON(const PeriodChange& change)
    {
        OrderedJSON periods = OrderedJSON::object();
        for (const auto& [period, value] : change.periods_)
        {
            periods[period] = value;
        }

        OrderedJSON changes = OrderedJSON::object();
        for (const auto& [key, delta] : change.changes_)
        {
            OrderedJSON entry;
            entry["absolute"] = delta.absolute_;
            entry["percent"] = OptionalValue(delta.percent_);
            entry["material"] = delta.material_;
            entry["direction"] = delta.direction_;
            changes[key] = std::move(entry);
        }

        OrderedJSON result;
        result["metric"] = change.metric_;
        result["page"] = change.page_;
        result["periods"] = std::move(periods);
        result["changes"] = std::move(changes);
        return result;
    }
}

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  FindRegulatorySections
 *  Description:  each requirement is searched across the whole document so
 *                collect the pages first.
 * =====================================================================================
 */
OrderedJSON FindRegulatorySections(const CA::FileName& pdf_path, CA::sv doc_type, const DocumentOpener& opener)
{
    const auto& required_sections = RequiredSections(doc_type);
    if (required_sections.empty())
    {
        spdlog::info(catenate("No sections are required for document type: '", doc_type, "'."));
    }

    std::vector<CA::DocumentPage> pages;
    OrderedJSON sections_found = OrderedJSON::object();
    OrderedJSON missing_critical = OrderedJSON::array();
    int total_found{0};

    auto locate_sections = [&]
    {
        for (const auto& section : required_sections)
        {
            auto hit = LocateTerms(pages, section.search_terms_);

            OrderedJSON entry;
            entry["required"] = true;
            entry["critical"] = section.critical_;
            entry["found"] = hit.found_;
            entry["page"] = OptionalValue(hit.page_);
            entry["excerpt"] = OptionalValue(hit.excerpt_);
            sections_found[section.name_] = std::move(entry);

            if (hit.found_)
            {
                ++total_found;
            }
            else if (section.critical_)
            {
                missing_critical.push_back(section.name_);
            }
        }
    };

    WalkDocument(pdf_path, opener, "find regulatory sections",
            [&pages](CA::DocumentPage page) { pages.push_back(std::move(page)); }, locate_sections);

    OrderedJSON result;
    result["success"] = true;
    result["doc_type"] = std::string{doc_type};
    result["sections_found"] = std::move(sections_found);
    result["summary"]["total_required"] = required_sections.size();
    result["summary"]["total_found"] = total_found;
    result["summary"]["missing_critical"] = std::move(missing_critical);
    return result;
}		// -----  end of function FindRegulatorySections  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ExtractFinancialStatements
 *  Description:
 * =====================================================================================
 */
OrderedJSON ExtractFinancialStatements(const CA::FileName& pdf_path, const DocumentOpener& opener)
{
    OrderedJSON statements = OrderedJSON::array();

    WalkDocument(pdf_path, opener, "extract financial statements", [&statements](const CA::DocumentPage& page)
        {
            for (const auto& statement : ExtractStatements(page))
            {
                statements.push_back(StatementToJSON(statement));
            }
        });

    OrderedJSON result;
    result["success"] = true;
    result["statements"] = std::move(statements);
    return result;
}		// -----  end of function ExtractFinancialStatements  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ValidateFinancialMath
 *  Description:
 * =====================================================================================
 */
OrderedJSON ValidateFinancialMath(const CA::FileName& pdf_path, const DocumentOpener& opener)
{
    ValidationReport report;

    WalkDocument(pdf_path, opener, "validate financial math",
            [&report](const CA::DocumentPage& page) { ValidatePage(page, report); });

    spdlog::debug(catenate("Checked: ", report.tables_checked_, " tables. Found: ", report.errors_.size(),
                " problems."));

    OrderedJSON errors = OrderedJSON::array();
    for (const auto& discrepancy : report.errors_)
    {
        errors.push_back(DiscrepancyToJSON(discrepancy));
    }

    OrderedJSON result;
    result["success"] = true;
    result["validation"]["tables_checked"] = report.tables_checked_;
    result["validation"]["errors"] = std::move(errors);
    result["validation"]["warnings"] = report.warnings_;
    return result;
}		// -----  end of function ValidateFinancialMath  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  CheckRequiredSignatures
 *  Description:
 * =====================================================================================
 */
OrderedJSON CheckRequiredSignatures(const CA::FileName& pdf_path, CA::sv doc_type,
        std::optional<double> invoice_amount, const DocumentOpener& opener)
{
    SignatureDetector detector;

    WalkDocument(pdf_path, opener, "check signatures", [&detector](const CA::DocumentPage& page) { detector(page); });

    const auto required = RequiredSignatures(doc_type, invoice_amount);
    const auto missing = MissingSignatures(required, detector.FoundRoles());

    OrderedJSON found_signatures = OrderedJSON::array();
    for (const auto& finding : detector.Findings())
    {
        OrderedJSON entry;
        entry["type"] = SignatureKindName(finding.kind_);
        entry["signer"] = finding.role_;
        entry["page"] = finding.page_;
        entry["excerpt"] = finding.excerpt_;
        found_signatures.push_back(std::move(entry));
    }

    OrderedJSON requirements;
    requirements["doc_type"] = std::string{doc_type};
    requirements["invoice_amount"] = OptionalValue(invoice_amount);
    requirements["required_signatures"] = required;
    requirements["found_signatures"] = std::move(found_signatures);
    requirements["missing_signatures"] = missing;
    requirements["compliance_status"] = missing.empty() ? "COMPLETE" : "INCOMPLETE";

    OrderedJSON result;
    result["success"] = true;
    result["signature_requirements"] = std::move(requirements);
    return result;
}		// -----  end of function CheckRequiredSignatures  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  DetectComplianceRedFlags
 *  Description:
 * =====================================================================================
 */
OrderedJSON DetectComplianceRedFlags(const CA::FileName& pdf_path, const DocumentOpener& opener)
{
    RedFlagDetector detector;

    WalkDocument(pdf_path, opener, "detect red flags", [&detector](const CA::DocumentPage& page) { detector(page); });

    OrderedJSON red_flags = OrderedJSON::array();
    for (const auto& finding : detector.Findings())
    {
        OrderedJSON entry;
        entry["phrase"] = finding.phrase_;
        entry["type"] = finding.category_;
        entry["severity"] = SeverityName(finding.severity_);
        entry["page"] = finding.page_;
        entry["excerpt"] = finding.excerpt_;
        entry["context"] = finding.context_;
        red_flags.push_back(std::move(entry));
    }

    OrderedJSON result;
    result["success"] = true;
    result["red_flags"] = std::move(red_flags);
    result["summary"]["total_flags"] = detector.Findings().size();
    result["summary"]["critical"] = detector.CountBySeverity(Severity::e_Critical);
    result["summary"]["high"] = detector.CountBySeverity(Severity::e_High);
    result["summary"]["medium"] = detector.CountBySeverity(Severity::e_Medium);
    return result;
}		// -----  end of function DetectComplianceRedFlags  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ExtractComparativePeriods
 *  Description:
 * =====================================================================================
 */
OrderedJSON ExtractComparativePeriods(const CA::FileName& pdf_path, const DocumentOpener& opener)
{
    OrderedJSON comparative_data = OrderedJSON::array();

    WalkDocument(pdf_path, opener, "extract comparative periods", [&comparative_data](const CA::DocumentPage& page)
        {
            for (const auto& change : ComparePagePeriods(page))
            {
                comparative_data.push_back(PeriodChangeToJSON(change));
            }
        });

    OrderedJSON result;
    result["success"] = true;
    result["comparative_data"] = std::move(comparative_data);
    return result;
}		// -----  end of function ExtractComparativePeriods  -----

const std::vector<std::string>& OperationNames()
{
    static const std::vector<std::string> names{"find_regulatory_sections", "extract_financial_statements",
        "validate_financial_math", "check_required_signatures", "detect_compliance_red_flags",
        "extract_comparative_periods"};
    return names;
}		// -----  end of function OperationNames  -----

bool OperationNeedsDocType(CA::sv operation)
{
    return operation == "find_regulatory_sections" || operation == "check_required_signatures";
}		// -----  end of function OperationNeedsDocType  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  RunOperation
 *  Description:
 * =====================================================================================
 */
OrderedJSON RunOperation(const nlohmann::json& request, const DocumentOpener& opener)
{
    if (! request.is_object())
    {
        throw RequestException("Request must be a JSON object.");
    }
    if (! request.contains("operation") || ! request["operation"].is_string())
    {
        throw RequestException("Request must name an 'operation'.");
    }
    const std::string operation = request["operation"].get<std::string>();
    if (ranges::find(OperationNames(), operation) == OperationNames().end())
    {
        throw RequestException(catenate("Unknown operation: '", operation, "'."));
    }
    if (! request.contains("pdf_path") || ! request["pdf_path"].is_string())
    {
        throw RequestException(catenate("Operation: ", operation, " needs a 'pdf_path'."));
    }
    const CA::FileName pdf_path{request["pdf_path"].get<std::string>()};

    std::string doc_type;
    if (OperationNeedsDocType(operation))
    {
        if (! request.contains("doc_type") || ! request["doc_type"].is_string())
        {
            throw RequestException(catenate("Operation: ", operation, " needs a 'doc_type'."));
        }
        doc_type = request["doc_type"].get<std::string>();
    }

    std::optional<double> invoice_amount;
    if (request.contains("invoice_amount") && ! request["invoice_amount"].is_null())
    {
        if (! request["invoice_amount"].is_number())
        {
            throw RequestException("'invoice_amount' must be a number.");
        }
        invoice_amount = request["invoice_amount"].get<double>();
    }

    spdlog::info(catenate("Running: ", operation, " on: ", pdf_path.get()));

    if (operation == "find_regulatory_sections")
    {
        return FindRegulatorySections(pdf_path, doc_type, opener);
    }
    if (operation == "extract_financial_statements")
    {
        return ExtractFinancialStatements(pdf_path, opener);
    }
    if (operation == "validate_financial_math")
    {
        return ValidateFinancialMath(pdf_path, opener);
    }
    if (operation == "check_required_signatures")
    {
        return CheckRequiredSignatures(pdf_path, doc_type, invoice_amount, opener);
    }
    if (operation == "detect_compliance_red_flags")
    {
        return DetectComplianceRedFlags(pdf_path, opener);
    }
    return ExtractComparativePeriods(pdf_path, opener);
}		// -----  end of function RunOperation  -----
