// =====================================================================================
//
//       Filename:  CurrencyValue.cpp
//
//    Description:  convert the text of a table cell into a comparable number
//
//        Version:  1.0
//        Created:  10/19/2026 10:29:51 AM
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

#include "CurrencyValue.h"

#include <array>
#include <cctype>
#include <charconv>
#include <system_error>

#include <boost/algorithm/string/predicate.hpp>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/copy_if.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/iterator/insert_iterators.hpp>

#include "Analyzer_Utils.h"

// UTF-8 for em dash and en dash

static const std::array<CA::sv, 6> ZERO_PLACEHOLDERS{"", "-", "—", "–", "N/A", "n/a"};

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  NormalizeCurrency
 *  Description:
 * =====================================================================================
 */
CA::CurrencyValue NormalizeCurrency(CA::sv text)
{
    const std::string value_text = Trim(text);

    if (ranges::find(ZERO_PLACEHOLDERS, CA::sv{value_text}) != ZERO_PLACEHOLDERS.end())
    {
        return 0.0;
    }

    bool is_negative = value_text.find('(') != std::string::npos && value_text.find(')') != std::string::npos;

    std::string cleaned;
    ranges::copy_if(value_text, ranges::back_inserter(cleaned),
            [](unsigned char c) { return std::isdigit(c) || c == '.'; });

    if (cleaned.empty())
    {
        return std::nullopt;
    }

    // things like '1.2.3' don't make it through here.

    double value{0.0};
    if (auto [p, ec] = std::from_chars(cleaned.data(), cleaned.data() + cleaned.size(), value);
            ec != std::errc() || p != cleaned.data() + cleaned.size())
    {
        return std::nullopt;
    }

    if (ranges::any_of(value_text, [](unsigned char c) { return std::toupper(c) == 'M'; })
            && ! boost::algorithm::icontains(value_text, "MANAGEMENT"))
    {
        value *= 1'000'000;
    }
    else if (ranges::any_of(value_text, [](unsigned char c) { return std::toupper(c) == 'K'; }))
    {
        value *= 1'000;
    }

    return is_negative ? -value : value;
}		// -----  end of function NormalizeCurrency  -----
