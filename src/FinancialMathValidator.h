// =====================================================================================
//
//       Filename:  FinancialMathValidator.h
//
//    Description:  check the arithmetic inside extracted financial tables
//
//        Version:  1.0
//        Created:  10/19/2026 01:12:37 PM
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

#ifndef _FINANCIALMATHVALIDATOR_INC_
#define _FINANCIALMATHVALIDATOR_INC_

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "ComplianceAnalyzer.h"

// differences at or below this are rounding noise.

constexpr double MATH_TOLERANCE = 0.01;

struct BalanceSheetImbalance
{
    int page_ = 0;
    double assets_ = 0.0;
    double liabilities_equity_ = 0.0;
    double difference_ = 0.0;
    std::string description_;
};

struct IncomeStatementMismatch
{
    int page_ = 0;
    double revenue_ = 0.0;
    double expenses_ = 0.0;
    double expected_net_ = 0.0;
    double reported_net_ = 0.0;
    double difference_ = 0.0;
    std::string description_;
};

struct ColumnSumMismatch
{
    int page_ = 0;
    int table_number_ = 0;      // 1-based, on its page
    int column_ = 0;            // 1-based, label column is 1
    double calculated_sum_ = 0.0;
    double reported_sum_ = 0.0;
    double difference_ = 0.0;   // calculated - reported
    std::string description_;
};

using Discrepancy = std::variant<BalanceSheetImbalance, IncomeStatementMismatch, ColumnSumMismatch>;
using DiscrepancyList = std::vector<Discrepancy>;

[[nodiscard]] std::string DiscrepancyKind(const Discrepancy& discrepancy);
[[nodiscard]] std::string DiscrepancySeverity(const Discrepancy& discrepancy);

// each check needs all of its governing rows. a governing value which
// doesn't parse means the check does not apply.

[[nodiscard]] std::optional<BalanceSheetImbalance> CheckBalanceEquation(const CA::Table& table, int page_number);

[[nodiscard]] std::optional<IncomeStatementMismatch> CheckIncomeEquation(const CA::Table& table, int page_number);

// assumes the last row holds the totals for the rows above it.

[[nodiscard]] std::vector<ColumnSumMismatch> CheckColumnSums(const CA::Table& table, int page_number,
        int table_number);

[[nodiscard]] DiscrepancyList ValidateTable(const CA::Table& table, CA::sv page_text, int page_number,
        int table_number);

struct ValidationReport
{
    int tables_checked_ = 0;
    DiscrepancyList errors_;
    std::vector<std::string> warnings_;
};

void ValidatePage(const CA::DocumentPage& page, ValidationReport& report);

#endif   /* ----- #ifndef _FINANCIALMATHVALIDATOR_INC_  ----- */
