// =====================================================================================
//
//       Filename:  TimestampLedger.cpp
//
//    Description:  Keeps the last time stamp seen for each stock so successive
//                  snapshots of a trading day only yield new prices.
//
//        Version:  1.0
//        Created:  02/07/2024 09:20:05 AM
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

#include "TimestampLedger.h"

#include <charconv>

#include <range/v3/algorithm/for_each.hpp>
#include <range/v3/algorithm/remove_copy.hpp>
#include <range/v3/iterator/insert_iterators.hpp>

namespace rng = ranges;

#include <spdlog/spdlog.h>

#include "IndexParser_Utils.h"

std::optional<int64_t> TimestampLedger::LastStamp (const std::string& stock_name) const
{
    if (auto found = last_stamps_.find(stock_name); found != last_stamps_.end())
    {
        return found->second;
    }
    return std::nullopt;
}		/* -----  end of method TimestampLedger::LastStamp  ----- */

void TimestampLedger::Seed (const IP::StockNames& stock_names)
{
    if (stock_names.empty() || ! last_stamps_.empty())
    {
        return;
    }

    rng::for_each(stock_names, [this](const auto& name) { last_stamps_[name] = k_unset_stamp; });

    spdlog::debug(catenate("Time stamp ledger seeded with: ", last_stamps_.size(), " stocks."));
}		/* -----  end of method TimestampLedger::Seed  ----- */

int64_t TimestampLedger::EncodeStamp (IP::sv time_stamp)
{
    // '15:19:51' -> 151951 so stamps can be compared as numbers.

    std::string digits;
    rng::remove_copy(time_stamp, rng::back_inserter(digits), ':');

    int64_t result{k_closed_stamp};
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), result);
    if (ec != std::errc() || ptr != digits.data() + digits.size())
    {
        return k_closed_stamp;
    }
    return result;
}		/* -----  end of method TimestampLedger::EncodeStamp  ----- */

IP::PriceRecordList TimestampLedger::Admit (const IP::PriceRecordList& records, std::size_t timestamp_column,
        const std::string& close_marker)
{
    IP::PriceRecordList result;

    for (std::size_t i = 0; i < records.size(); ++i)
    {
        const auto& record = records[i];
        if (record.fields_.size() <= timestamp_column)
        {
            throw MalformedRowException(catenate("Record: ", i, " has ", record.fields_.size(),
                        " fields. No time stamp at column: ", timestamp_column));
        }
        const auto& stock_name = record.fields_.front();
        const auto& time_stamp = record.fields_[timestamp_column];

        // no more prices for this stock until the next session.

        if (time_stamp == close_marker)
        {
            last_stamps_[stock_name] = k_closed_stamp;
            spdlog::debug(catenate("Session closed for: ", stock_name));
            continue;
        }

        const auto current_stamp = EncodeStamp(time_stamp);

        auto [slot, inserted] = last_stamps_.try_emplace(stock_name, k_unset_stamp);
        if (inserted)
        {
            spdlog::debug(catenate("New stock in ledger: ", stock_name));
        }

        if (slot->second != current_stamp)
        {
            slot->second = current_stamp;
            result.push_back(record);
        }
    }

    return result;
}		/* -----  end of method TimestampLedger::Admit  ----- */
