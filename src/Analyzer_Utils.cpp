/*
 * =====================================================================================
 *
 *       Filename:  Analyzer_Utils.cpp
 *
 *    Description:  Routines shared by the analysis modules and the application.
 *
 *        Version:  1.0
 *        Created:  10/19/2026 09:52:30 AM
 *       Revision:  none
 *       Compiler:  gcc
 *
 *         Author:  Compliance_Analyzer developers
 *   Organization:
 *
 * =====================================================================================
 */

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

#include "Analyzer_Utils.h"

#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>

#include <boost/algorithm/string/trim.hpp>
#include <boost/assert.hpp>

#include <range/v3/algorithm/transform.hpp>
#include <range/v3/iterator/insert_iterators.hpp>

#include <date/tz.h>

#include <fmt/core.h>

std::string LocalDateTimeAsString(std::chrono::system_clock::time_point a_date_time)
{
    auto t = date::make_zoned(date::current_zone(), a_date_time);
    std::string ts = date::format("%a, %b %d, %Y at %I:%M:%S %p %Z", t);
    return ts;
}		// -----  end of function LocalDateTimeAsString  -----

/*
 *--------------------------------------------------------------------------------------
 *       Class:  AnalyzerException
 *      Method:  AnalyzerException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
AnalyzerException::AnalyzerException(const char* text)
    : std::runtime_error(text)
{
}  /* -----  end of method AnalyzerException::AnalyzerException  (constructor)  ----- */

AnalyzerException::AnalyzerException(const std::string& text)
    : std::runtime_error(text)
{
}  /* -----  end of method AnalyzerException::AnalyzerException  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  AssertionException
 *      Method:  AssertionException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
AssertionException::AssertionException(const char* text)
    : std::invalid_argument(text)
{
}  /* -----  end of method AssertionException::AssertionException  (constructor)  ----- */

AssertionException::AssertionException(const std::string& text)
    : std::invalid_argument(text)
{
}  /* -----  end of method AssertionException::AssertionException  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  DocumentOpenException
 *      Method:  DocumentOpenException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
DocumentOpenException::DocumentOpenException(const char* text)
    : AnalyzerException(text)
{
}  /* -----  end of method DocumentOpenException::DocumentOpenException  (constructor)  ----- */

DocumentOpenException::DocumentOpenException(const std::string& text)
    : AnalyzerException(text)
{
}  /* -----  end of method DocumentOpenException::DocumentOpenException  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  AnalysisException
 *      Method:  AnalysisException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
AnalysisException::AnalysisException(const char* text)
    : AnalyzerException(text)
{
}  /* -----  end of method AnalysisException::AnalysisException  (constructor)  ----- */

AnalysisException::AnalysisException(const std::string& text)
    : AnalyzerException(text)
{
}  /* -----  end of method AnalysisException::AnalysisException  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  RequestException
 *      Method:  RequestException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
RequestException::RequestException(const char* text)
    : AnalyzerException(text)
{
}  /* -----  end of method RequestException::RequestException  (constructor)  ----- */

RequestException::RequestException(const std::string& text)
    : AnalyzerException(text)
{
}  /* -----  end of method RequestException::RequestException  (constructor)  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  LoadDataFileForUse
 *  Description:
 * =====================================================================================
 */
std::string LoadDataFileForUse(const CA::FileName& file_name)
{
    std::ifstream input_file{file_name.get(), std::ios_base::in | std::ios_base::binary};
    if (! input_file)
    {
        throw AnalyzerException(catenate("Unable to open file: ", file_name.get()));
    }
    std::string file_content(fs::file_size(file_name.get()), '\0');
    input_file.read(&file_content[0], file_content.size());
    input_file.close();

    return file_content;
}		/* -----  end of function LoadDataFileForUse  ----- */

std::string ToLower(CA::sv text)
{
    std::string result;
    result.reserve(text.size());
    ranges::transform(text, ranges::back_inserter(result), [](unsigned char c) { return std::tolower(c); });
    return result;
}		// -----  end of function ToLower  -----

std::string Trim(CA::sv text)
{
    return boost::algorithm::trim_copy(std::string{text});
}		// -----  end of function Trim  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ExtractExcerpt
 *  Description:  the window is measured in bytes of the source text but both
 *                edges are moved onto character boundaries so a multi-byte
 *                UTF-8 sequence is never split. the start moves forward, the
 *                end moves back.
 * =====================================================================================
 */
std::string ExtractExcerpt(CA::sv text, size_t pos, size_t before, size_t after)
{
    auto is_continuation([](char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; });

    size_t excerpt_begin = pos > before ? pos - before : 0;
    while (excerpt_begin < text.size() && is_continuation(text[excerpt_begin]))
    {
        ++excerpt_begin;
    }
    size_t excerpt_end = std::min(text.size(), pos + after);
    while (excerpt_end > excerpt_begin && excerpt_end < text.size() && is_continuation(text[excerpt_end]))
    {
        --excerpt_end;
    }
    if (excerpt_begin >= excerpt_end)
    {
        return {};
    }
    return Trim(text.substr(excerpt_begin, excerpt_end - excerpt_begin));
}		// -----  end of function ExtractExcerpt  -----

double RoundTo2(double value)
{
    return std::round(value * 100.0) / 100.0;
}		// -----  end of function RoundTo2  -----

std::string FormatMoney(double value)
{
    auto digits = fmt::format("{:.2f}", std::fabs(value));
    auto decimal_point = digits.find('.');

    std::string grouped;
    for (size_t indx = 0; indx < decimal_point; ++indx)
    {
        if (indx > 0 && (decimal_point - indx) % 3 == 0)
        {
            grouped += ',';
        }
        grouped += digits[indx];
    }
    grouped += digits.substr(decimal_point);

    return catenate("$", value < 0 ? "-" : "", grouped);
}		// -----  end of function FormatMoney  -----

namespace boost
{
// these functions are declared in the library headers but left to the user to
// define. so here they are...
//
/*
 * ===  FUNCTION  ======================================================================
 *         Name:  assertion_failed_mgs
 *  Description:  defined in boost header but left to us to implement.
 * =====================================================================================
 */

void assertion_failed_msg(char const* expr, char const* msg, char const* function, char const* file, long line)
{
    throw AssertionException(catenate("\n*** Assertion failed *** test: ", expr, " in function: ", function,
                                      " from file: ", file, " at line: ", line, ".\nassertion msg: ", msg));
}		/* -----  end of function assertion_failed_mgs  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  assertion_failed
 *  Description:
 * =====================================================================================
 */
void assertion_failed(char const* expr, char const* function, char const* file, long line)
{
    throw AssertionException(catenate("\n*** Assertion failed *** test: ", expr, " in function: ", function,
                                      " from file: ", file, " at line: ", line));
}		/* -----  end of function assertion_failed  ----- */
}		/* end namespace boost */
