// =====================================================================================
//
//       Filename:  TermLocator.h
//
//    Description:  case-insensitive phrase search over the text of a document's pages
//
//        Version:  1.0
//        Created:  10/19/2026 10:48:16 AM
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

#ifndef _TERMLOCATOR_INC_
#define _TERMLOCATOR_INC_

#include <optional>
#include <string>
#include <vector>

#include "ComplianceAnalyzer.h"

struct SearchHit
{
    bool found_ = false;
    std::optional<int> page_;
    std::optional<std::string> excerpt_;
};

constexpr size_t EXCERPT_BEFORE = 100;
constexpr size_t EXCERPT_AFTER = 200;

// pages are searched in order and, on each page, terms in the order given.
// so an earlier page always wins and, on the same page, an earlier term wins
// even if a later term appears before it in the text.

[[nodiscard]] SearchHit LocateTerms(const std::vector<CA::DocumentPage>& pages, const std::vector<std::string>& terms);

// position of the first case-insensitive occurrence of term in text, if any.

[[nodiscard]] std::optional<size_t> FindTerm(CA::sv lowered_text, CA::sv term);

#endif   /* ----- #ifndef _TERMLOCATOR_INC_  ----- */
