// =====================================================================================
//
//       Filename:  RedFlagDetector.h
//
//    Description:  scan page text for phrases which signal compliance risk
//
//        Version:  1.0
//        Created:  10/19/2026 03:14:52 PM
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

#ifndef _REDFLAGDETECTOR_INC_
#define _REDFLAGDETECTOR_INC_

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "ComplianceAnalyzer.h"

constexpr size_t RED_FLAG_EXCERPT_BEFORE = 100;
constexpr size_t RED_FLAG_EXCERPT_AFTER = 300;

enum class Severity
{
    e_Critical,
    e_High,
    e_Medium
};

[[nodiscard]] std::string SeverityName(Severity severity);

struct RedFlagPhrase
{
    CA::sv phrase_;
    CA::sv category_;
    Severity severity_;
};

// in the order they are checked. 'related party transaction' and 'related party'
// are separate entries in the same category.

[[nodiscard]] const std::vector<RedFlagPhrase>& RedFlagCatalog();

struct RedFlagFinding
{
    std::string phrase_;
    std::string category_;
    Severity severity_ = Severity::e_Medium;
    int page_ = 0;
    std::string excerpt_;
    std::string context_;
};

using RedFlagFindingList = std::vector<RedFlagFinding>;

// the nearest 'note ', 'item ' or 'section ' before match_pos up to the end of
// its line. 'Unknown section' if there is none.

[[nodiscard]] std::string FindSectionContext(CA::sv text, CA::sv lowered_text, size_t match_pos);

// =====================================================================================
//        Class:  RedFlagDetector
//  Description:  feed it pages in order. one finding per phrase per page.
// =====================================================================================

class RedFlagDetector
{
public:

    RedFlagDetector() = default;

    void operator()(const CA::DocumentPage& page);

    [[nodiscard]] const RedFlagFindingList& Findings() const { return findings_; }

    [[nodiscard]] int CountBySeverity(Severity severity) const;

private:

    RedFlagFindingList findings_;
    std::set<std::pair<std::string, int>> flags_seen_;
};

#endif   /* ----- #ifndef _REDFLAGDETECTOR_INC_  ----- */
