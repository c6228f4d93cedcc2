// =====================================================================================
//
//       Filename:  ComparativePeriods.cpp
//
//    Description:  period over period changes for multi-year table rows
//
//        Version:  1.0
//        Created:  10/19/2026 02:07:45 PM
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

#include "ComparativePeriods.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <iterator>

#include <boost/regex.hpp>

#include <range/v3/action/sort.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/keys.hpp>

#include "spdlog/spdlog.h"

#include "Analyzer_Utils.h"
#include "CurrencyValue.h"

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ComputePeriodDelta
 *  Description:  materiality is judged on the unrounded values.
 * =====================================================================================
 */
PeriodDelta ComputePeriodDelta(double current, double previous)
{
    PeriodDelta delta;

    const double absolute = current - previous;
    std::optional<double> percent;
    if (previous != 0.0)
    {
        percent = absolute / std::abs(previous) * 100.0;
    }

    delta.absolute_ = RoundTo2(absolute);
    if (percent)
    {
        delta.percent_ = RoundTo2(percent.value());
    }
    delta.material_ = (percent && std::abs(percent.value()) > MATERIAL_PERCENT)
        || std::abs(absolute) > MATERIAL_AMOUNT;
    delta.direction_ = absolute > 0 ? "increase" : "decrease";

    return delta;
}		// -----  end of function ComputePeriodDelta  -----

CA::OrderedEntries<size_t> FindPeriodColumns(const CA::TableRow& header)
{
    static const boost::regex regex_year{R"***((?<!\d)(20\d{2})(?!\d))***"};

    CA::OrderedEntries<size_t> period_columns;
    boost::smatch year_match;

    for (size_t col_idx = 0; col_idx < header.size(); ++col_idx)
    {
        if (boost::regex_search(header[col_idx], year_match, regex_year))
        {
            SetEntry(period_columns, year_match.str(1), col_idx);
        }
    }
    return period_columns;
}		// -----  end of function FindPeriodColumns  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ComparePeriods
 *  Description:  adjacent periods are taken newest first. a row needs values
 *                for at least 2 periods and at least 1 adjacent pair to count.
 * =====================================================================================
 */
PeriodChangeList ComparePeriods(const CA::Table& table, int page_number)
{
    PeriodChangeList results;

    if (table.size() < 2)
    {
        return results;
    }

    const auto period_columns = FindPeriodColumns(table.front());
    if (period_columns.size() < 2)
    {
        spdlog::debug(catenate("Table on page: ", page_number, " has fewer than 2 periods...Skipping."));
        return results;
    }

    const auto sorted_periods = period_columns | ranges::views::keys | ranges::to<std::vector<std::string>>
        | ranges::actions::sort(std::greater<>{});

    for (size_t row_idx = 1; row_idx < table.size(); ++row_idx)
    {
        const auto& row = table[row_idx];
        if (row.size() < 2)
        {
            continue;
        }

        std::string metric = Trim(row[0]);
        if (metric.size() < MIN_METRIC_LENGTH)
        {
            continue;
        }

        CA::OrderedEntries<double> period_values;
        for (const auto& [period, col_idx] : period_columns)
        {
            if (col_idx >= row.size())
            {
                continue;
            }
            if (auto value = NormalizeCurrency(row[col_idx]); value)
            {
                SetEntry(period_values, period, value.value());
            }
        }

        if (period_values.size() < 2)
        {
            continue;
        }

        CA::OrderedEntries<PeriodDelta> changes;
        for (size_t i = 0; i + 1 < sorted_periods.size(); ++i)
        {
            const auto& current = sorted_periods[i];
            const auto& previous = sorted_periods[i + 1];

            const double* current_value = FindEntry(period_values, current);
            const double* previous_value = FindEntry(period_values, previous);
            if (current_value == nullptr || previous_value == nullptr)
            {
                continue;
            }
            SetEntry(changes, catenate(current, "_vs_", previous), ComputePeriodDelta(*current_value, *previous_value));
        }

        if (changes.empty())
        {
            continue;
        }

        results.push_back(PeriodChange{std::move(metric), page_number, std::move(period_values), std::move(changes)});
    }

    return results;
}		// -----  end of function ComparePeriods  -----

PeriodChangeList ComparePagePeriods(const CA::DocumentPage& page)
{
    PeriodChangeList results;
    for (const auto& table : page.tables_)
    {
        auto changes = ComparePeriods(table, page.page_number_);
        std::move(changes.begin(), changes.end(), std::back_inserter(results));
    }
    return results;
}		// -----  end of function ComparePagePeriods  -----
