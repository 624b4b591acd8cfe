// =====================================================================================
//
//       Filename:  IndexTableParser.cpp
//
//    Description:  class which extracts price records from raw text copies of
//                  a stock index price table.
//
//        Version:  1.0
//        Created:  02/06/2024 04:22:47 PM
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

#include "IndexTableParser.h"

#include <boost/algorithm/string/predicate.hpp>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/copy_if.hpp>
#include <range/v3/iterator/insert_iterators.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

namespace rng = ranges;

#include <spdlog/spdlog.h>

#include "IndexParser_Utils.h"

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ExtractDay
 *  Description:  month and year, if present, are ignored.
 * =====================================================================================
 */
std::string ExtractDay (IP::sv date)
{
    if (date.find('/') != IP::sv::npos)
    {
        return std::string{split_string<IP::sv>(date, '/').front()};
    }
    return std::string{date};
}		/* -----  end of function ExtractDay  ----- */

//--------------------------------------------------------------------------------------
//       Class:  IndexTableParser
//      Method:  IndexTableParser
// Description:  constructor
//--------------------------------------------------------------------------------------

IndexTableParser::IndexTableParser (const ParserConfig& config)
    : config_{config}
{
    BOOST_ASSERT_MSG(! config_.index_columns_.empty(), "Must keep at least 1 column from the index line.");
    BOOST_ASSERT_MSG(! config_.stock_columns_.empty(), "Must keep at least 1 column from the stock lines.");
}  // -----  end of method IndexTableParser::IndexTableParser  (constructor)  -----

const std::string& IndexTableParser::SetTargetDate (const std::string& date)
{
    target_date_ = ExtractDay(date);
    spdlog::info(catenate("Target day set to: ", target_date_.value()));

    return target_date_.value();
}		/* -----  end of method IndexTableParser::SetTargetDate  ----- */

std::optional<IP::PriceRecordList> IndexTableParser::LoadDataFile (const IP::FileName& file_name) const
{
    const std::string file_content = LoadDataFileForUse(file_name);
    const auto lines = SplitLines(file_content);

    // avoid a parsing attempt over junk files.

    if (lines.size() < config_.min_lines_)
    {
        spdlog::info(catenate("File: ", file_name.get(), " has: ", lines.size(), " lines. Need at least: ",
                    config_.min_lines_, ". No valid data to parse."));
        return std::nullopt;
    }

    return ExtractRecords(lines);
}		/* -----  end of method IndexTableParser::LoadDataFile  ----- */

IP::PriceRecordList IndexTableParser::ExtractRecords (const IP::RawLineList& lines) const
{
    const auto trailer_boundary = lines.size() > config_.trailer_skip_ ? lines.size() - config_.trailer_skip_ : 0;

    // nothing to check if we have no target date.

    bool date_checked = ! target_date_.has_value();

    IP::PriceRecordList records;
    records.reserve(lines.size());

    for (std::size_t line_number = 0; line_number < lines.size(); ++line_number)
    {
        IP::RecordShape shape;

        if (line_number == config_.index_line_)
        {
            shape = IP::RecordShape::e_Index;
        }
        else if (line_number < config_.header_skip_)
        {
            continue;
        }
        else if (line_number < trailer_boundary)
        {
            shape = IP::RecordShape::e_Stock;
        }
        else
        {
            // trailer. whatever is left is not useful.
            break;
        }

        const auto raw_row = split_string<IP::sv>(lines[line_number], '\t');

        if (! date_checked)
        {
            if (! RowMatchesTargetDate(raw_row, line_number))
            {
                break;
            }
            date_checked = true;
        }

        records.push_back(ExtractRow(raw_row, line_number, shape));
    }

    return records;
}		/* -----  end of method IndexTableParser::ExtractRecords  ----- */

IP::PriceRecord IndexTableParser::ExtractRow (const std::vector<IP::sv>& raw_row, std::size_t line_number,
        IP::RecordShape shape) const
{
    const auto& columns = shape == IP::RecordShape::e_Index ? config_.index_columns_ : config_.stock_columns_;

    IP::PriceRecord record{shape, {}};
    record.fields_.reserve(columns.size());

    for (auto col : columns)
    {
        if (col >= raw_row.size())
        {
            throw MalformedRowException(catenate("Line: ", line_number, " has ", raw_row.size(),
                        " fields. Can't find column: ", col));
        }
        record.fields_.emplace_back(raw_row[col]);
    }
    return record;
}		/* -----  end of method IndexTableParser::ExtractRow  ----- */

bool IndexTableParser::RowMatchesTargetDate (const std::vector<IP::sv>& raw_row, std::size_t line_number) const
{
    if (config_.date_column_ >= raw_row.size())
    {
        throw MalformedRowException(catenate("Line: ", line_number, " has ", raw_row.size(),
                    " fields. Can't find date at column: ", config_.date_column_));
    }

    auto file_day = ExtractDay(raw_row[config_.date_column_]);
    if (file_day != target_date_.value())
    {
        spdlog::info(catenate("File is for day: ", file_day, " not target day: ", target_date_.value(), ". Skipped."));
        return false;
    }
    return true;
}		/* -----  end of method IndexTableParser::RowMatchesTargetDate  ----- */

IP::StockNames IndexTableParser::ExtractStockNames (const IP::PriceRecordList& records) const
{
    // use what is in the data rather than a fixed list so stocks can
    // enter and leave the index.

    return records
        | rng::views::filter([](const auto& record) { return ! record.fields_.empty(); })
        | rng::views::transform([](const auto& record) { return record.fields_.front(); })
        | rng::to<std::vector>();
}		/* -----  end of method IndexTableParser::ExtractStockNames  ----- */

std::optional<IP::PriceRecordList> IndexTableParser::ParseFile (const IP::FileName& file_name)
{
    auto records = LoadDataFile(file_name);
    if (! records)
    {
        return std::nullopt;
    }

    ledger_.Seed(ExtractStockNames(records.value()));

    auto new_records = ledger_.Admit(records.value(), config_.timestamp_column_, config_.close_marker_);

    spdlog::debug(catenate("File: ", file_name.get(), " parsed: ", records->size(), " records. New: ",
                new_records.size()));

    return new_records;
}		/* -----  end of method IndexTableParser::ParseFile  ----- */

std::optional<IP::PriceRecordList> IndexTableParser::FilterFile (const IP::FileName& file_name,
        const IP::StockFilter& filter)
{
    auto records = ParseFile(file_name);
    if (! records || filter.empty())
    {
        return records;
    }
    return FilterRecords(records.value(), filter);
}		/* -----  end of method IndexTableParser::FilterFile  ----- */

IP::PriceRecordList IndexTableParser::FilterRecords (const IP::PriceRecordList& records,
        const IP::StockFilter& filter) const
{
    if (filter.empty())
    {
        return records;
    }

    auto wanted([this, &filter](const IP::PriceRecord& record)
    {
        const auto rendered = Render(record);
        return rng::any_of(filter, [&rendered](const auto& f) { return boost::algorithm::contains(rendered, f); });
    });

    IP::PriceRecordList result;
    rng::copy_if(records, rng::back_inserter(result), wanted);
    return result;
}		/* -----  end of method IndexTableParser::FilterRecords  ----- */

std::string IndexTableParser::Render (const IP::PriceRecord& record) const
{
    return RenderRecord(record, config_.separator_);
}		/* -----  end of method IndexTableParser::Render  ----- */

std::vector<std::string> IndexTableParser::Render (const IP::PriceRecordList& records) const
{
    return RenderRecords(records, config_.separator_);
}		/* -----  end of method IndexTableParser::Render  ----- */
