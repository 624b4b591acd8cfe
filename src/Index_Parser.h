// =====================================================================================
//
//       Filename:  Index_Parser.h
//
//    Description:  holds some common type defs shared by several classes.
//
//        Version:  1.0
//        Created:  02/06/2024 03:18:22 PM
//       Revision:  none
//       Compiler:  g++
//
//        License:  GNU General Public License v3
//        Company:
//
// =====================================================================================


	/* This file is part of Index_Parser. */

	/* Index_Parser is free software: you can redistribute it and/or modify */
	/* it under the terms of the GNU General Public License as published by */
	/* the Free Software Foundation, either version 3 of the License, or */
	/* (at your option) any later version. */

	/* Index_Parser is distributed in the hope that it will be useful, */
	/* but WITHOUT ANY WARRANTY; without even the implied warranty of */
	/* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the */
	/* GNU General Public License for more details. */

	/* You should have received a copy of the GNU General Public License */
	/* along with Index_Parser.  If not, see <http://www.gnu.org/licenses/>. */

#ifndef INDEX_PARSER_H_
#define INDEX_PARSER_H_


#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace IndexParser
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

    // we don't want to have naked string_views all over the place so
    // lets' add a little type safety based on ideas from fluentcpp

    using FileName = UniqType<path, struct FileNameTag>;

    // lines of a raw data file. They point into the loaded file content so
    // the content must outlive them.

    using RawLineList = std::vector<sv>;

    // the values used to select records by name and the names found
    // in a batch of records.

    using StockFilter = std::vector<std::string>;
    using StockNames = std::vector<std::string>;

    // a raw data file has exactly 1 line for the index itself. All other
    // usable lines are for the stocks in the index and use a different
    // set of columns.

    enum class RecordShape
    {
        e_Index,
        e_Stock
    };

    struct PriceRecord
    {
        RecordShape shape_;
        std::vector<std::string> fields_;
    };

    using PriceRecordList = std::vector<PriceRecord>;

    //  seems to be needed by boost program options.
    //  these need to be found by ADL so they live with UniqType.

    template <typename T, typename Uniqueifier>
    std::ostream& operator<<(std::ostream& os, const UniqType<T, Uniqueifier>& a_type)
    {
        os << a_type.get();
        return os;
    }

    template <typename T, typename Uniqueifier>
    std::istream& operator>>(std::istream& is, UniqType<T, Uniqueifier>& a_type)
    {
        T temp = a_type.get();
        is >> temp;
        a_type = temp;
        return is;
    }

    inline bool operator==(const PriceRecord& lhs, const PriceRecord& rhs)
    {
        return lhs.shape_ == rhs.shape_ && lhs.fields_ == rhs.fields_;
    }

}		// namespace IndexParser

namespace IP = IndexParser;

#endif /* end of include guard: INDEX_PARSER_H_ */
