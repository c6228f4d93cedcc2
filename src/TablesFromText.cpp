// =====================================================================================
//
//       Filename:  TablesFromText.cpp
//
//    Description:  Range compatible class to iterate over tables (if any) in the
//                  extracted text of a page.
//
//        Version:  1.0
//        Created:  10/19/2026 11:58:03 AM
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


#include "TablesFromText.h"

#include <algorithm>

#include <range/v3/algorithm/transform.hpp>
#include <range/v3/iterator/insert_iterators.hpp>

#include "spdlog/spdlog.h"

#include "Analyzer_Utils.h"

using namespace std::string_literals;

/*
 *--------------------------------------------------------------------------------------
 *       Class:  TablesFromText
 *      Method:  TablesFromText
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
TablesFromText::TablesFromText (CA::sv text)
{
    // at this point, I do not want any carriage returns from source data
    // and cells are separated by exactly 1 tab.

    static const boost::regex regex_returns{R"***(\r)***"};

    for (auto line : split_string<CA::sv>(text, '\n'))
    {
        std::string clean_line = boost::regex_replace(std::string{line}, regex_returns, delete_this);
        clean_line = boost::regex_replace(clean_line, regex_spaces_tab, one_tab);
        clean_line = boost::regex_replace(clean_line, regex_tabs_spaces, one_tab);
        clean_line = boost::regex_replace(clean_line, regex_dollar_tab, just_dollar);
        clean_line = boost::regex_replace(clean_line, regex_tab_before_paren, just_paren);
        clean_line = boost::regex_replace(clean_line, regex_leading_tab, delete_this);
        clean_line = boost::regex_replace(clean_line, regex_trailing_tab, delete_this);
        lines_.push_back(std::move(clean_line));
    }
}  /* -----  end of method TablesFromText::TablesFromText  (constructor)  ----- */

TablesFromText::iterator TablesFromText::begin ()
{
    iterator it{this};
    return it;
}		/* -----  end of method TablesFromText::begin  ----- */

TablesFromText::const_iterator TablesFromText::begin () const
{
    const_iterator it{this};
    return it;
}		/* -----  end of method TablesFromText::begin  ----- */

TablesFromText::iterator TablesFromText::end ()
{
    return {};
}		/* -----  end of method TablesFromText::end  ----- */

TablesFromText::const_iterator TablesFromText::end () const
{
    return {};
}		/* -----  end of method TablesFromText::end  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  TablesFromText::table_itor
 *      Method:  TablesFromText::table_itor
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
TablesFromText::table_itor::table_itor(TablesFromText const * tables)
    : tables_{tables}
{
    if (tables_ == nullptr)
    {
        return;
    }
    operator++();
}  /* -----  end of method TablesFromText::table_itor::table_itor  (constructor)  ----- */

TablesFromText::table_itor& TablesFromText::table_itor::operator++ ()
{
    if (tables_ == nullptr)
    {
        return *this;
    }

    const auto& lines = tables_->GetLines();
    auto has_cells([](const std::string& line) { return line.find('\t') != std::string::npos; });

    while (next_line_ < lines.size())
    {
        // skip until we find a line with cells then collect the run

        if (! has_cells(lines[next_line_]))
        {
            ++next_line_;
            continue;
        }

        size_t run_begin = next_line_;
        while (next_line_ < lines.size() && has_cells(lines[next_line_]))
        {
            ++next_line_;
        }

        if (next_line_ - run_begin < MIN_TABLE_ROWS)
        {
            spdlog::debug("Single line with cells...Skipping.");
            continue;
        }

        table_data_.clear();
        std::for_each(lines.begin() + run_begin, lines.begin() + next_line_,
                [this](const auto& line) { table_data_.push_back(SplitRow(line)); });
        return *this;
    }

    table_data_.clear();
    tables_ = nullptr;
    next_line_ = 0;
    return *this;
}		/* -----  end of method TablesFromText::table_itor::operator++  ----- */

CA::TableRow TablesFromText::table_itor::SplitRow (const std::string& line) const
{
    CA::TableRow row;
    ranges::transform(split_string<CA::sv>(line, '\t'), ranges::back_inserter(row),
            [](CA::sv cell) { return Trim(cell); });
    return row;
}		/* -----  end of method TablesFromText::table_itor::SplitRow  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  CollectTablesFromText
 *  Description:
 * =====================================================================================
 */
CA::TableList CollectTablesFromText (CA::sv text)
{
    TablesFromText tables{text};

    CA::TableList results;
    std::copy(tables.begin(), tables.end(), std::back_inserter(results));

    return results;
}		/* -----  end of function CollectTablesFromText  ----- */
