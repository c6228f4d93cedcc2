// =====================================================================================
//
//       Filename:  ComparativePeriods.h
//
//    Description:  period over period changes for multi-year table rows
//
//        Version:  1.0
//        Created:  10/19/2026 01:58:21 PM
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

#ifndef _COMPARATIVEPERIODS_INC_
#define _COMPARATIVEPERIODS_INC_

#include <optional>
#include <string>
#include <vector>

#include "ComplianceAnalyzer.h"

// a change is material if it moves more than this percent or this many dollars.

constexpr double MATERIAL_PERCENT = 10.0;
constexpr double MATERIAL_AMOUNT = 100'000.0;

constexpr size_t MIN_METRIC_LENGTH = 3;

struct PeriodDelta
{
    double absolute_ = 0.0;
    std::optional<double> percent_;     // empty when the previous value is zero
    bool material_ = false;
    std::string direction_;
};

struct PeriodChange
{
    std::string metric_;
    int page_ = 0;
    CA::OrderedEntries<double> periods_;
    CA::OrderedEntries<PeriodDelta> changes_;    // keyed 'current_vs_previous'
};

using PeriodChangeList = std::vector<PeriodChange>;

[[nodiscard]] PeriodDelta ComputePeriodDelta(double current, double previous);

// year -> column. a year which shows up more than once keeps its first
// place in the list but takes the later column.

[[nodiscard]] CA::OrderedEntries<size_t> FindPeriodColumns(const CA::TableRow& header);

[[nodiscard]] PeriodChangeList ComparePeriods(const CA::Table& table, int page_number);

[[nodiscard]] PeriodChangeList ComparePagePeriods(const CA::DocumentPage& page);

#endif   /* ----- #ifndef _COMPARATIVEPERIODS_INC_  ----- */
