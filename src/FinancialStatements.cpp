// =====================================================================================
//
//       Filename:  FinancialStatements.cpp
//
//    Description:  classify pages by financial statement type and pull the key
//                  line items out of their tables.
//
//        Version:  1.0
//        Created:  10/19/2026 12:40:12 PM
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

#include "FinancialStatements.h"

#include <array>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/for_each.hpp>

#include "spdlog/spdlog.h"

#include "Analyzer_Utils.h"
#include "CurrencyValue.h"

// substring match against the lowercased row label.

static const std::array<CA::sv, 12> KEY_ITEM_KEYWORDS{"total assets", "total liabilities", "total equity",
    "stockholders", "revenue", "net income", "net loss", "total", "subtotal", "operating", "investing",
    "financing"};

std::string StatementTypeName(StatementType stmt_type)
{
    switch (stmt_type)
    {
        case StatementType::e_BalanceSheet:
            return "Balance Sheet";
        case StatementType::e_IncomeStatement:
            return "Income Statement";
        case StatementType::e_CashFlow:
            return "Cash Flow Statement";
        case StatementType::e_Invoice:
            return "Invoice";
        case StatementType::e_None:
            break;
    }
    return "None";
}		// -----  end of function StatementTypeName  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  BalanceSheetFilter
 *  Description:
 * =====================================================================================
 */
bool BalanceSheetFilter(CA::sv page_text)
{
    static const boost::regex balance_sheet{R"***(balance sheet)***",
        boost::regex_constants::normal | boost::regex_constants::icase};
    static const boost::regex financial_position{R"***(statement of financial position)***",
        boost::regex_constants::normal | boost::regex_constants::icase};

    std::vector<const boost::regex*> regexs{&balance_sheet, &financial_position};

    return ApplyStatementFilter(regexs, page_text);
}		/* -----  end of function BalanceSheetFilter  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  StatementOfOperationsFilter
 *  Description:  'p&l' is not enough to run the income equation. it only
 *                classifies the page. see ClassifyPage.
 * =====================================================================================
 */
bool StatementOfOperationsFilter(CA::sv page_text)
{
    static const boost::regex income{R"***(income statement)***",
        boost::regex_constants::normal | boost::regex_constants::icase};
    static const boost::regex operations{R"***(statement of operations)***",
        boost::regex_constants::normal | boost::regex_constants::icase};

    std::vector<const boost::regex*> regexs{&income, &operations};

    return ApplyStatementFilter(regexs, page_text);
}		/* -----  end of function StatementOfOperationsFilter  ----- */

bool CashFlowsFilter(CA::sv page_text)
{
    static const boost::regex cash_flow{R"***(cash flow)***",
        boost::regex_constants::normal | boost::regex_constants::icase};

    std::vector<const boost::regex*> regexs{&cash_flow};

    return ApplyStatementFilter(regexs, page_text);
}		/* -----  end of function CashFlowsFilter  ----- */

bool InvoiceFilter(CA::sv page_text)
{
    static const boost::regex invoice{R"***(invoice)***",
        boost::regex_constants::normal | boost::regex_constants::icase};
    static const boost::regex bill_to{R"***(bill to)***",
        boost::regex_constants::normal | boost::regex_constants::icase};

    std::vector<const boost::regex*> regexs{&invoice, &bill_to};

    return ApplyStatementFilter(regexs, page_text);
}		/* -----  end of function InvoiceFilter  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ApplyStatementFilter
 *  Description:  any one of the phrases is enough.
 * =====================================================================================
 */
bool ApplyStatementFilter(const std::vector<const boost::regex*>& regexs, CA::sv page_text)
{
    return ranges::any_of(regexs, [page_text](const boost::regex* stmt_test)
        { return boost::regex_search(page_text.cbegin(), page_text.cend(), *stmt_test); });
}		/* -----  end of function ApplyStatementFilter  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ClassifyPage
 *  Description:
 * =====================================================================================
 */
StatementType ClassifyPage(CA::sv page_text)
{
    static const boost::regex profit_and_loss{R"***(p&l)***",
        boost::regex_constants::normal | boost::regex_constants::icase};

    if (BalanceSheetFilter(page_text))
    {
        return StatementType::e_BalanceSheet;
    }
    if (StatementOfOperationsFilter(page_text)
            || boost::regex_search(page_text.cbegin(), page_text.cend(), profit_and_loss))
    {
        return StatementType::e_IncomeStatement;
    }
    if (CashFlowsFilter(page_text))
    {
        return StatementType::e_CashFlow;
    }
    if (InvoiceFilter(page_text))
    {
        return StatementType::e_Invoice;
    }
    return StatementType::e_None;
}		/* -----  end of function ClassifyPage  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  FindPeriods
 *  Description:
 * =====================================================================================
 */
std::vector<std::string> FindPeriods(const CA::TableRow& header)
{
    static const boost::regex regex_year{R"***((?<!\d)20\d{2}(?!\d))***"};

    std::vector<std::string> periods;
    for (const auto& cell : header)
    {
        if (boost::regex_search(cell, regex_year))
        {
            periods.push_back(Trim(cell));
        }
    }
    return periods;
}		/* -----  end of function FindPeriods  ----- */

bool IsKeyItemLabel(CA::sv label)
{
    const std::string lowered_label = ToLower(label);
    return ranges::any_of(KEY_ITEM_KEYWORDS, [&lowered_label](CA::sv keyword)
        { return lowered_label.find(keyword) != std::string::npos; });
}		/* -----  end of function IsKeyItemLabel  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ExtractStatement
 *  Description:  the i-th period's value lives in column i + 1. a short row
 *                just doesn't have values for the later periods.
 * =====================================================================================
 */
ClassifiedStatement ExtractStatement(const CA::Table& table, StatementType stmt_type, int page_number)
{
    ClassifiedStatement statement{.type_ = stmt_type, .page_ = page_number};

    if (! table.empty())
    {
        statement.periods_ = FindPeriods(table.front());
    }

    for (size_t row_idx = 1; row_idx < table.size(); ++row_idx)
    {
        const auto& row = table[row_idx];
        if (row.empty())
        {
            continue;
        }

        std::string item_name = Trim(row.front());
        if (! IsKeyItemLabel(item_name))
        {
            continue;
        }

        PeriodValues values;
        for (size_t i = 0; i < statement.periods_.size(); ++i)
        {
            if (i + 1 < row.size())
            {
                SetEntry(values, statement.periods_[i], NormalizeCurrency(row[i + 1]));
            }
        }
        SetEntry(statement.key_items_, item_name, std::move(values));
    }

    auto audit_end = table.size() > AUDIT_ROWS ? table.begin() + AUDIT_ROWS : table.end();
    statement.table_data_.assign(table.begin(), audit_end);

    return statement;
}		/* -----  end of function ExtractStatement  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ExtractStatements
 *  Description:
 * =====================================================================================
 */
ClassifiedStatementList ExtractStatements(const CA::DocumentPage& page)
{
    ClassifiedStatementList statements;

    auto stmt_type = ClassifyPage(page.text_);
    if (stmt_type == StatementType::e_None)
    {
        return statements;
    }
    spdlog::debug(catenate("Page: ", page.page_number_, " looks like: ", StatementTypeName(stmt_type),
                " with: ", page.tables_.size(), " tables."));

    ranges::for_each(page.tables_, [&](const auto& table)
        {
            if (table.empty())
            {
                spdlog::debug(catenate("Empty table on page: ", page.page_number_, "...Skipping."));
                return;
            }
            statements.push_back(ExtractStatement(table, stmt_type, page.page_number_));
        });

    return statements;
}		/* -----  end of function ExtractStatements  ----- */
