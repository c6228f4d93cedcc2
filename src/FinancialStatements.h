// =====================================================================================
//
//       Filename:  FinancialStatements.h
//
//    Description:  classify pages by financial statement type and pull the key
//                  line items out of their tables.
//
//        Version:  1.0
//        Created:  10/19/2026 12:31:44 PM
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

#ifndef _FINANCIALSTATEMENTS_INC_
#define _FINANCIALSTATEMENTS_INC_

#include <string>
#include <vector>

#include <boost/regex.hpp>

#include "ComplianceAnalyzer.h"

enum class StatementType
{
    e_None,
    e_BalanceSheet,
    e_IncomeStatement,
    e_CashFlow,
    e_Invoice
};

[[nodiscard]] std::string StatementTypeName(StatementType stmt_type);

// these look at the whole text of a page, not at a single table.

bool BalanceSheetFilter(CA::sv page_text);

bool StatementOfOperationsFilter(CA::sv page_text);

bool CashFlowsFilter(CA::sv page_text);

bool InvoiceFilter(CA::sv page_text);

bool ApplyStatementFilter(const std::vector<const boost::regex*>& regexs, CA::sv page_text);

// balance sheet wins over income statement which wins over cash flow which
// wins over invoice.

[[nodiscard]] StatementType ClassifyPage(CA::sv page_text);

// header cells which contain a year starting with '20', in header order.
// the whole (trimmed) cell is the period label.

[[nodiscard]] std::vector<std::string> FindPeriods(const CA::TableRow& header);

using PeriodValues = CA::OrderedEntries<CA::CurrencyValue>;
using KeyItems = CA::OrderedEntries<PeriodValues>;

[[nodiscard]] bool IsKeyItemLabel(CA::sv label);

constexpr size_t AUDIT_ROWS = 10;

struct ClassifiedStatement
{
    StatementType type_ = StatementType::e_None;
    int page_ = 0;
    std::vector<std::string> periods_;
    KeyItems key_items_;
    CA::Table table_data_;          // first AUDIT_ROWS rows, as extracted
};

using ClassifiedStatementList = std::vector<ClassifiedStatement>;

[[nodiscard]] ClassifiedStatement ExtractStatement(const CA::Table& table, StatementType stmt_type, int page_number);

// nothing for pages which don't classify or have no tables.

[[nodiscard]] ClassifiedStatementList ExtractStatements(const CA::DocumentPage& page);

#endif   /* ----- #ifndef _FINANCIALSTATEMENTS_INC_  ----- */
