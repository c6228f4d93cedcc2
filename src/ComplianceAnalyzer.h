// =====================================================================================
//
//       Filename:  ComplianceAnalyzer.h
//
//    Description:  holds some common type defs shared by several classes.
//
//        Version:  1.0
//        Created:  10/19/2026 09:12:44 AM
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

#ifndef COMPLIANCEANALYZER_H_
#define COMPLIANCEANALYZER_H_


#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace ComplianceAnalyzer
{
    // thanks to Jonathan Boccara of fluentcpp.com for his articles on
    // Strong Types and the NamedType library.
    //
    // this code is a simplified and somewhat stripped down version of his.

    // =====================================================================================
    //        Class:  UniqType
    //  Description: Provides a wrapper which makes embedded common data types distinguisable
    // =====================================================================================

    template <typename T, typename Uniqueifier>
    class UniqType
    {
    public:
        // ====================  LIFECYCLE     =======================================

        UniqType() requires std::is_default_constructible_v<T>
            : value_{} {}

        UniqType(const UniqType<T, Uniqueifier>& rhs) requires std::is_copy_constructible_v<T>
            : value_{rhs.value_} {}

        explicit UniqType(T const& value) requires std::is_copy_constructible_v<T>
            : value_{value} {}

        UniqType(UniqType<T, Uniqueifier>&& rhs) requires std::is_move_constructible_v<T>
            : value_(std::move(rhs.value_)) {}

        explicit UniqType(T&& value) requires std::is_move_constructible_v<T>
            : value_(std::move(value)) {}

        // ====================  ACCESSORS     =======================================

        T& get() { return value_; }
        const T& get() const { return value_; }

        // ====================  OPERATORS     =======================================

        UniqType& operator=(const UniqType<T, Uniqueifier>& rhs) requires std::is_copy_assignable_v<T>
        {
            if (this != &rhs)
            {
                value_ = rhs.value_;
            }
            return *this;
        }
        UniqType& operator=(const T& rhs) requires std::is_copy_assignable_v<T>
        {
            if (&value_ != &rhs)
            {
                value_ = rhs;
            }
            return *this;
        }
        UniqType& operator=(UniqType<T, Uniqueifier>&& rhs) requires std::is_move_assignable_v<T>
        {
            if (this != &rhs)
            {
                value_ = std::move(rhs.value_);
            }
            return *this;
        }
        UniqType& operator=(T&& rhs) requires std::is_move_assignable_v<T>
        {
            if (&value_ != &rhs)
            {
                value_ = std::move(rhs);
            }
            return *this;
        }

    private:
        // ====================  DATA MEMBERS  =======================================

        T value_;

    }; // -----  end of class UniqType  -----

    using sv = std::string_view;
    using std::filesystem::path;

    using FileName = UniqType<path, struct FileNameTag>;

    // what our document readers hand us for each page.
    // tables are row/column grids of cell text. row 0 is the header by convention
    // and rows need not be rectangular.

    using TableRow = std::vector<std::string>;
    using Table = std::vector<TableRow>;
    using TableList = std::vector<Table>;

    struct FormWidget
    {
        std::string field_type_;
        std::string field_name_;
    };

    using FormWidgetList = std::vector<FormWidget>;

    struct DocumentPage
    {
        int page_number_ = 0;           // 1-based
        std::string text_;
        TableList tables_;
        FormWidgetList widgets_;
    };

    // 'unparseable' is a legitimate outcome when converting cell text so
    // keep it distinct from zero.

    using CurrencyValue = std::optional<double>;

    // insertion ordered key/value list. keys are unique, a later
    // value for an existing key replaces the earlier one in place.

    template <typename V>
    using OrderedEntries = std::vector<std::pair<std::string, V>>;

}		// namespace ComplianceAnalyzer

namespace CA = ComplianceAnalyzer;

//  seems to be needed by boost program options

template <typename T, typename Uniqueifier>
std::ostream& operator<<(std::ostream& os, const CA::UniqType<T, Uniqueifier>& a_type)
{
    os << a_type.get();
    return os;
}

template <typename T, typename Uniqueifier>
std::istream& operator>>(std::istream& is, CA::UniqType<T, Uniqueifier>& a_type)
{
    T temp = a_type.get();
    is >> temp;
    a_type = temp;
    return is;
}

#endif /* end of include guard: COMPLIANCEANALYZER_H_ */
