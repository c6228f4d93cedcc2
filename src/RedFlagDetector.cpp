// =====================================================================================
//
//       Filename:  RedFlagDetector.cpp
//
//    Description:  scan page text for phrases which signal compliance risk
//
//        Version:  1.0
//        Created:  10/19/2026 03:26:05 PM
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

#include "RedFlagDetector.h"

#include <array>
#include <optional>

#include <range/v3/algorithm/count_if.hpp>

#include "spdlog/spdlog.h"

#include "Analyzer_Utils.h"
#include "TermLocator.h"

static const std::array<CA::sv, 3> CONTEXT_KEYWORDS{"note ", "item ", "section "};

std::string SeverityName(Severity severity)
{
    switch (severity)
    {
        case Severity::e_Critical:
            return "critical";
        case Severity::e_High:
            return "high";
        case Severity::e_Medium:
            break;
    }
    return "medium";
}		// -----  end of function SeverityName  -----

const std::vector<RedFlagPhrase>& RedFlagCatalog()
{
    static const std::vector<RedFlagPhrase> catalog
    {
        {"going concern", "going_concern", Severity::e_Critical},
        {"material weakness", "material_weakness", Severity::e_Critical},
        {"restatement", "restatement", Severity::e_Critical},
        {"significant deficiency", "significant_deficiency", Severity::e_High},
        {"qualified opinion", "qualified_opinion", Severity::e_High},
        {"adverse opinion", "adverse_opinion", Severity::e_High},
        {"related party transaction", "related_party", Severity::e_Medium},
        {"related party", "related_party", Severity::e_Medium},
        {"subsequent event", "subsequent_event", Severity::e_Medium},
        {"contingent liability", "contingent_liability", Severity::e_Medium}
    };
    return catalog;
}		// -----  end of function RedFlagCatalog  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  FindSectionContext
 *  Description:  keyword must end before the match starts.
 * =====================================================================================
 */
std::string FindSectionContext(CA::sv text, CA::sv lowered_text, size_t match_pos)
{
    const CA::sv preceding = lowered_text.substr(0, match_pos);

    std::optional<size_t> context_pos;
    for (auto keyword : CONTEXT_KEYWORDS)
    {
        if (auto pos = preceding.rfind(keyword); pos != CA::sv::npos)
        {
            if (! context_pos || pos > context_pos.value())
            {
                context_pos = pos;
            }
        }
    }

    if (! context_pos)
    {
        return "Unknown section";
    }

    auto context_end = text.find('\n', context_pos.value());
    return Trim(text.substr(context_pos.value(),
                context_end == CA::sv::npos ? CA::sv::npos : context_end - context_pos.value()));
}		// -----  end of function FindSectionContext  -----

/*
 *--------------------------------------------------------------------------------------
 *       Class:  RedFlagDetector
 *      Method:  RedFlagDetector::operator()
 * Description:
 *--------------------------------------------------------------------------------------
 */
void RedFlagDetector::operator() (const CA::DocumentPage& page)
{
    const std::string lowered_text = ToLower(page.text_);

    for (const auto& entry : RedFlagCatalog())
    {
        auto pos = FindTerm(lowered_text, entry.phrase_);
        if (! pos)
        {
            continue;
        }

        std::pair<std::string, int> flag_key{std::string{entry.phrase_}, page.page_number_};
        if (flags_seen_.contains(flag_key))
        {
            continue;
        }
        flags_seen_.insert(std::move(flag_key));

        spdlog::debug(catenate("Red flag: '", entry.phrase_, "' on page: ", page.page_number_));

        findings_.push_back(RedFlagFinding{std::string{entry.phrase_}, std::string{entry.category_},
            entry.severity_, page.page_number_,
            ExtractExcerpt(page.text_, pos.value(), RED_FLAG_EXCERPT_BEFORE, RED_FLAG_EXCERPT_AFTER),
            FindSectionContext(page.text_, lowered_text, pos.value())});
    }
}		/* -----  end of method RedFlagDetector::operator()  ----- */

int RedFlagDetector::CountBySeverity (Severity severity) const
{
    return static_cast<int>(
            ranges::count_if(findings_, [severity](const auto& finding) { return finding.severity_ == severity; }));
}		/* -----  end of method RedFlagDetector::CountBySeverity  ----- */
