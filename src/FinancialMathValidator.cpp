// =====================================================================================
//
//       Filename:  FinancialMathValidator.cpp
//
//    Description:  check the arithmetic inside extracted financial tables
//
//        Version:  1.0
//        Created:  10/19/2026 01:25:50 PM
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

#include "FinancialMathValidator.h"

#include <cmath>

#include "spdlog/spdlog.h"

#include "Analyzer_Utils.h"
#include "CurrencyValue.h"
#include "FinancialStatements.h"

namespace
{
    // helper for std::visit

    template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

    bool LabelHas(const std::string& lowered_label, CA::sv phrase)
    {
        return lowered_label.find(phrase) != std::string::npos;
    }
}

std::string DiscrepancyKind(const Discrepancy& discrepancy)
{
    return std::visit(overloaded {
            [](const BalanceSheetImbalance&) { return "Balance Sheet Imbalance"s; },
            [](const IncomeStatementMismatch&) { return "Income Statement Mismatch"s; },
            [](const ColumnSumMismatch&) { return "Column Sum Mismatch"s; }
        }, discrepancy);
}		// -----  end of function DiscrepancyKind  -----

std::string DiscrepancySeverity(const Discrepancy& discrepancy)
{
    return std::holds_alternative<ColumnSumMismatch>(discrepancy) ? "high" : "critical";
}		// -----  end of function DiscrepancySeverity  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  CheckBalanceEquation
 *  Description:  values come from the first value column. later rows replace
 *                earlier ones.
 * =====================================================================================
 */
std::optional<BalanceSheetImbalance> CheckBalanceEquation(const CA::Table& table, int page_number)
{
    CA::CurrencyValue assets;
    CA::CurrencyValue liabilities;
    CA::CurrencyValue equity;

    for (const auto& row : table)
    {
        if (row.size() < 2)
        {
            continue;
        }
        const std::string label = ToLower(row[0]);
        if (LabelHas(label, "total assets"))
        {
            assets = NormalizeCurrency(row[1]);
        }
        else if (LabelHas(label, "total liabilities"))
        {
            liabilities = NormalizeCurrency(row[1]);
        }
        else if (LabelHas(label, "total equity") || LabelHas(label, "total stockholders"))
        {
            equity = NormalizeCurrency(row[1]);
        }
    }

    if (! assets || ! liabilities || ! equity)
    {
        return std::nullopt;
    }

    const double liabilities_equity = liabilities.value() + equity.value();
    const double difference = std::abs(assets.value() - liabilities_equity);
    if (difference <= MATH_TOLERANCE)
    {
        return std::nullopt;
    }

    spdlog::debug(catenate("Balance sheet does not balance on page: ", page_number));

    return BalanceSheetImbalance{page_number, assets.value(), liabilities_equity, RoundTo2(difference),
        catenate("Assets (", FormatMoney(assets.value()), ") != Liabilities + Equity (",
                FormatMoney(liabilities_equity), ")")};
}		// -----  end of function CheckBalanceEquation  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  CheckIncomeEquation
 *  Description:
 * =====================================================================================
 */
std::optional<IncomeStatementMismatch> CheckIncomeEquation(const CA::Table& table, int page_number)
{
    CA::CurrencyValue revenue;
    CA::CurrencyValue expenses;
    CA::CurrencyValue net_income;

    for (const auto& row : table)
    {
        if (row.size() < 2)
        {
            continue;
        }
        const std::string label = ToLower(row[0]);
        if (LabelHas(label, "total revenue") || LabelHas(label, "net revenue"))
        {
            revenue = NormalizeCurrency(row[1]);
        }
        else if (LabelHas(label, "total expenses") || LabelHas(label, "total operating expenses"))
        {
            expenses = NormalizeCurrency(row[1]);
        }
        else if (LabelHas(label, "net income") || LabelHas(label, "net loss"))
        {
            net_income = NormalizeCurrency(row[1]);
        }
    }

    if (! revenue || ! expenses || ! net_income)
    {
        return std::nullopt;
    }

    const double expected_net = revenue.value() - expenses.value();
    const double difference = std::abs(expected_net - net_income.value());
    if (difference <= MATH_TOLERANCE)
    {
        return std::nullopt;
    }

    spdlog::debug(catenate("Income statement does not add up on page: ", page_number));

    return IncomeStatementMismatch{page_number, revenue.value(), expenses.value(), RoundTo2(expected_net),
        net_income.value(), RoundTo2(difference),
        catenate("Revenue - Expenses (", FormatMoney(expected_net), ") != Net Income (",
                FormatMoney(net_income.value()), ")")};
}		// -----  end of function CheckIncomeEquation  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  CheckColumnSums
 *  Description:  every column after the label column is a candidate. the header
 *                row is not data. a column with nothing parseable above the
 *                total or with no parseable total is skipped.
 * =====================================================================================
 */
std::vector<ColumnSumMismatch> CheckColumnSums(const CA::Table& table, int page_number, int table_number)
{
    std::vector<ColumnSumMismatch> mismatches;

    if (table.size() < 3)
    {
        return mismatches;
    }

    const auto& totals_row = table.back();
    const size_t num_cols = table.front().size();

    for (size_t col_idx = 1; col_idx < num_cols; ++col_idx)
    {
        double calculated_sum{0.0};
        bool have_numbers{false};

        for (size_t row_idx = 1; row_idx < table.size() - 1; ++row_idx)
        {
            if (col_idx >= table[row_idx].size())
            {
                continue;
            }
            if (auto value = NormalizeCurrency(table[row_idx][col_idx]); value)
            {
                calculated_sum += value.value();
                have_numbers = true;
            }
        }

        if (! have_numbers || col_idx >= totals_row.size())
        {
            continue;
        }

        auto reported_sum = NormalizeCurrency(totals_row[col_idx]);
        if (! reported_sum || std::abs(calculated_sum - reported_sum.value()) <= MATH_TOLERANCE)
        {
            continue;
        }

        spdlog::debug(catenate("Column: ", col_idx + 1, " of table: ", table_number, " on page: ", page_number,
                    " does not add up."));

        mismatches.push_back(ColumnSumMismatch{page_number, table_number, static_cast<int>(col_idx + 1),
            RoundTo2(calculated_sum), RoundTo2(reported_sum.value()), RoundTo2(calculated_sum - reported_sum.value()),
            catenate("Column total mismatch: calculated ", FormatMoney(calculated_sum), ", reported ",
                    FormatMoney(reported_sum.value()))});
    }

    return mismatches;
}		// -----  end of function CheckColumnSums  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ValidateTable
 *  Description:  the statement specific checks only run when the page says it
 *                holds that statement. column sums always run.
 * =====================================================================================
 */
DiscrepancyList ValidateTable(const CA::Table& table, CA::sv page_text, int page_number, int table_number)
{
    DiscrepancyList discrepancies;

    if (table.size() < 2)
    {
        return discrepancies;
    }

    if (BalanceSheetFilter(page_text))
    {
        if (auto imbalance = CheckBalanceEquation(table, page_number); imbalance)
        {
            discrepancies.emplace_back(std::move(imbalance.value()));
        }
    }

    if (StatementOfOperationsFilter(page_text))
    {
        if (auto mismatch = CheckIncomeEquation(table, page_number); mismatch)
        {
            discrepancies.emplace_back(std::move(mismatch.value()));
        }
    }

    auto column_mismatches = CheckColumnSums(table, page_number, table_number);
    discrepancies.insert(discrepancies.end(), column_mismatches.begin(), column_mismatches.end());

    return discrepancies;
}		// -----  end of function ValidateTable  -----

void ValidatePage(const CA::DocumentPage& page, ValidationReport& report)
{
    int table_number{0};
    for (const auto& table : page.tables_)
    {
        ++table_number;
        ++report.tables_checked_;

        auto discrepancies = ValidateTable(table, page.text_, page.page_number_, table_number);
        report.errors_.insert(report.errors_.end(), discrepancies.begin(), discrepancies.end());
    }
}		// -----  end of function ValidatePage  -----
