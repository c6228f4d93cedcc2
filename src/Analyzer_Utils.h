/*
 * =====================================================================================
 *
 *       Filename:  Analyzer_Utils.h
 *
 *    Description:  Routines shared by the analysis modules and the application.
 *
 *        Version:  1.0
 *        Created:  10/19/2026 09:40:13 AM
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

#ifndef _ANALYZER_UTILS_INC_
#define _ANALYZER_UTILS_INC_

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

#include <fmt/format.h>

#include "ComplianceAnalyzer.h"

namespace fs = std::filesystem;

using namespace std::string_literals;

// custom fmtlib formatter for filesytem paths

template <>
struct fmt::formatter<std::filesystem::path> : formatter<std::string>
{
    // parse is inherited from formatter<string_view>.
    template <typename FormatContext>
    auto format(const std::filesystem::path& p, FormatContext& ctx) const
    {
        std::string f_name = p.string();
        return formatter<std::string>::format(f_name, ctx);
    }
};

template <typename... Ts>
inline std::string catenate(Ts&&... ts)
{
    constexpr auto N = sizeof...(Ts);

    // first, construct our format string

    std::string f_string;
    for (size_t i = 0; i < N; ++i)
    {
        f_string.append("{}");
    }

    return fmt::vformat(f_string, fmt::make_format_args(ts...));
}

// let's add tuples...
// based on code techniques from C++17 STL Cookbook zipping tuples.
// (works for any class which supports the '+' operator)

template <typename... Ts>
std::tuple<Ts...> AddTs(std::tuple<Ts...> const& t1, std::tuple<Ts...> const& t2)
{
    auto z_([](auto... xs) { return [xs...](auto... ys) { return std::make_tuple((xs + ys)...); }; });

    return std::apply(std::apply(z_, t1), t2);
}

// let's sum the contents of a single tuple
// (from C++ Templates...second edition p.58
// and C++17 STL Cookbook.

template <typename... Ts>
auto SumT(const std::tuple<Ts...>& t)
{
    auto z_([](auto... ys) { return (... + ys); });
    return std::apply(z_, t);
}

// utility to convert a time point to a local time string
// using Howard Hinnant's date library

std::string LocalDateTimeAsString(std::chrono::system_clock::time_point a_date_time);

std::string LoadDataFileForUse(const CA::FileName& file_name);

// so we can recognize our errors if we want to do something special

class AnalyzerException : public std::runtime_error
{
public:
    explicit AnalyzerException(const char* what);

    explicit AnalyzerException(const std::string& what);
};

class AssertionException : public std::invalid_argument
{
public:
    explicit AssertionException(const char* what);

    explicit AssertionException(const std::string& what);
};

// the document could not be opened or decoded. nothing to release.

class DocumentOpenException : public AnalyzerException
{
public:
    explicit DocumentOpenException(const char* what);

    explicit DocumentOpenException(const std::string& what);
};

// something went wrong while walking an open document.
// the document has been closed by the time anyone sees this.

class AnalysisException : public AnalyzerException
{
public:
    explicit AnalysisException(const char* what);

    explicit AnalysisException(const std::string& what);
};

// a request we can't make sense of.

class RequestException : public AnalyzerException
{
public:
    explicit RequestException(const char* what);

    explicit RequestException(const std::string& what);
};

//  let's do a little 'template normal' programming again

// function to split a string on a delimiter and return a vector of items.
// use concepts to restrict to strings and string_views.

template <typename T>
inline std::vector<T> split_string(CA::sv string_data, char delim)
    requires std::is_same_v<T, std::string> || std::is_same_v<T, CA::sv>
{
    std::vector<T> results;
    for (size_t it = 0; it != T::npos; ++it)
    {
        auto pos = string_data.find(delim, it);
        if (pos != T::npos)
        {
            results.emplace_back(string_data.substr(it, pos - it));
        }
        else
        {
            results.emplace_back(string_data.substr(it));
            break;
        }
        it = pos;
    }
    return results;
}

// true when at least one argument has content.

template <typename... Ts>
auto NotAllEmpty(const Ts&... ts)
{
    return ((!ts.empty()) || ...);
}

// add or replace in an insertion ordered list.

template <typename V>
void SetEntry(CA::OrderedEntries<V>& entries, const std::string& key, V value)
{
    auto found_it =
        std::find_if(entries.begin(), entries.end(), [&key](const auto& entry) { return entry.first == key; });
    if (found_it != entries.end())
    {
        found_it->second = std::move(value);
        return;
    }
    entries.emplace_back(key, std::move(value));
}

template <typename V>
const V* FindEntry(const CA::OrderedEntries<V>& entries, CA::sv key)
{
    auto found_it =
        std::find_if(entries.begin(), entries.end(), [key](const auto& entry) { return entry.first == key; });
    return found_it != entries.end() ? &found_it->second : nullptr;
}

// all of our text matching is ASCII case-insensitive. lowering byte by byte keeps
// offsets in the lowered copy valid in the source text.

std::string ToLower(CA::sv text);

std::string Trim(CA::sv text);

// pull [pos - before, pos + after) out of text, clipped to the text and to UTF-8
// character boundaries, then trimmed.

std::string ExtractExcerpt(CA::sv text, size_t pos, size_t before, size_t after);

double RoundTo2(double value);

// '$1,234.56' style. negative values come out as '$-1,234.56'.

std::string FormatMoney(double value);

#endif /* ----- #ifndef _ANALYZER_UTILS_INC_  ----- */
