// =====================================================================================
//
//       Filename:  TablesFromText.h
//
//    Description:  Range compatible class to iterate over tables (if any) in the
//                  extracted text of a page.
//
//        Version:  1.0
//        Created:  10/19/2026 11:42:25 AM
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


#ifndef  _TABLESFROMTEXT_INC_
#define  _TABLESFROMTEXT_INC_

#include <cstddef>
#include <iterator>
#include <string>
#include <vector>

#include <boost/regex.hpp>

#include "ComplianceAnalyzer.h"

// our text extraction separates cells on a line with tabs.
// a table is a run of at least MIN_TABLE_ROWS consecutive lines which have
// at least one tab.

constexpr size_t MIN_TABLE_ROWS = 2;

/*
 * =====================================================================================
 *        Class:  TablesFromText
 *  Description:  Range compatible class to iterate over tables (if any) in block of text.
 * =====================================================================================
 */
class TablesFromText
{
public:

    class table_itor;

    using iterator = table_itor;
    using const_iterator = table_itor;

public:
    /* ====================  LIFECYCLE     ======================================= */

    TablesFromText() = default;
    explicit TablesFromText (CA::sv text);          /* constructor */

    /* ====================  ACCESSORS     ======================================= */

    [[nodiscard]] iterator begin();
    [[nodiscard]] const_iterator begin() const;
    [[nodiscard]] iterator end();
    [[nodiscard]] const_iterator end() const;

private:

    friend class table_itor;

    /* ====================  METHODS       ======================================= */

    [[nodiscard]] const std::vector<std::string>& GetLines() const { return lines_; }

    /* ====================  DATA MEMBERS  ======================================= */

    std::vector<std::string> lines_;

    // used to clean up the extracted lines

    const boost::regex regex_tabs_spaces{R"***(\t[ \t]+)***"};
    const boost::regex regex_spaces_tab{R"***( +\t)***"};
    const boost::regex regex_tab_before_paren{R"***(\t+\))***"};
    const boost::regex regex_dollar_tab{R"***(\$\t)***"};
    const boost::regex regex_leading_tab{R"***(^\t+)***"};
    const boost::regex regex_trailing_tab{R"***(\t+$)***"};

    const std::string delete_this = "";
    const std::string one_tab = "\t";
    const std::string just_paren = ")";
    const std::string just_dollar = "$";

}; /* -----  end of class TablesFromText  ----- */


// =====================================================================================
//        Class:  TablesFromText::table_itor
//  Description:  Range compatible iterator from contents of TablesFromText container.
// =====================================================================================
//
class TablesFromText::table_itor
{
public:

    using iterator_category = std::forward_iterator_tag;
    using value_type = CA::Table;
    using difference_type = std::ptrdiff_t;
    using pointer = const CA::Table *;
    using reference = const CA::Table &;

    // ====================  LIFECYCLE     =======================================

    table_itor() : tables_{nullptr} { }
    explicit table_itor(TablesFromText const* tables);

    // ====================  MUTATORS      =======================================

    table_itor& operator++();
    table_itor operator++(int) { table_itor retval = *this; ++(*this); return retval; }

    // ====================  OPERATORS     =======================================

    bool operator==(const table_itor& other) const
    {
        return tables_ == other.tables_ && next_line_ == other.next_line_;
    }
    bool operator!=(const table_itor& other) const { return !(*this == other); }

    reference operator*() const { return table_data_; };
    pointer operator->() const { return &table_data_; }

private:
    // ====================  METHODS       =======================================

    CA::TableRow SplitRow(const std::string& line) const;

    // ====================  DATA MEMBERS  =======================================

    TablesFromText const * tables_;
    size_t next_line_ = 0;

    CA::Table table_data_;
}; // -----  end of class TablesFromText::table_itor  -----

// convenience for readers which just want the list.

[[nodiscard]] CA::TableList CollectTablesFromText(CA::sv text);

#endif   /* ----- #ifndef _TABLESFROMTEXT_INC_  ----- */
