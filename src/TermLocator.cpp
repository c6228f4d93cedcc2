// =====================================================================================
//
//       Filename:  TermLocator.cpp
//
//    Description:  case-insensitive phrase search over the text of a document's pages
//
//        Version:  1.0
//        Created:  10/19/2026 10:55:02 AM
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

#include "TermLocator.h"

#include "spdlog/spdlog.h"

#include "Analyzer_Utils.h"

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  FindTerm
 *  Description:  caller lowers the text once per page and we lower the term.
 * =====================================================================================
 */
std::optional<size_t> FindTerm(CA::sv lowered_text, CA::sv term)
{
    const std::string lowered_term = ToLower(term);
    if (auto pos = lowered_text.find(lowered_term); pos != CA::sv::npos)
    {
        return pos;
    }
    return std::nullopt;
}		// -----  end of function FindTerm  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  LocateTerms
 *  Description:
 * =====================================================================================
 */
SearchHit LocateTerms(const std::vector<CA::DocumentPage>& pages, const std::vector<std::string>& terms)
{
    for (const auto& page : pages)
    {
        const std::string lowered_text = ToLower(page.text_);

        for (const auto& term : terms)
        {
            if (auto pos = FindTerm(lowered_text, term); pos)
            {
                spdlog::debug(catenate("Found term: '", term, "' on page: ", page.page_number_));
                return SearchHit{true, page.page_number_,
                    ExtractExcerpt(page.text_, pos.value(), EXCERPT_BEFORE, EXCERPT_AFTER)};
            }
        }
    }
    return {};
}		// -----  end of function LocateTerms  -----
