// =====================================================================================
//
//       Filename:  CurrencyValue.h
//
//    Description:  convert the text of a table cell into a comparable number
//
//        Version:  1.0
//        Created:  10/19/2026 10:21:07 AM
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

#ifndef _CURRENCYVALUE_INC_
#define _CURRENCYVALUE_INC_

#include <optional>

#include "ComplianceAnalyzer.h"

// the rules, in order:
//
//  - empty text and placeholders ('-', em/en dash, 'N/A') are an explicit zero.
//  - '(' and ')' anywhere in the text mean the value is negative.
//  - everything except digits and '.' is thrown away. if nothing is left
//    (or what is left isn't a number) the value is unparseable.
//  - an 'M' anywhere (any case) scales by a million unless the text contains
//    'MANAGEMENT'. otherwise a 'K' scales by a thousand.

[[nodiscard]] CA::CurrencyValue NormalizeCurrency(CA::sv text);

#endif   /* ----- #ifndef _CURRENCYVALUE_INC_  ----- */
