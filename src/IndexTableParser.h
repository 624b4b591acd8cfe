// =====================================================================================
//
//       Filename:  IndexTableParser.h
//
//    Description:  class which extracts price records from raw text copies of
//                  a stock index price table.
//
//        Version:  1.0
//        Created:  02/06/2024 04:05:12 PM
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

// =====================================================================================
//        Class:  IndexTableParser
//  Description:  The raw file is the table found on the BME page for the IBEX 35
//                pasted into a text file. Columns are separated by tabs.
//
//                Lines [0, header_skip_) are page junk, except line index_line_
//                which holds the values for the index itself. Then one line per
//                stock up to the last trailer_skip_ lines which are junk again.
//
//                For the default layout we keep:
//                  index line:   name, date, time, last price
//                  stock lines:  name, date, time, last price, volume, value (thousands of Euro)
//
//                The parser remembers the time stamp of every stock it has passed
//                on so feeding it several snapshots of a trading day in order gives
//                only the prices which changed.
// =====================================================================================

#ifndef  _INDEXTABLEPARSER_INC_
#define  _INDEXTABLEPARSER_INC_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "Index_Parser.h"
#include "TimestampLedger.h"

struct ParserConfig
{
    std::size_t header_skip_{11};
    std::size_t index_line_{6};
    std::size_t trailer_skip_{5};

    std::vector<std::size_t> index_columns_{0, 5, 6, 1};
    std::vector<std::size_t> stock_columns_{0, 7, 8, 1, 5, 6};

    // raw column checked against the target date.
    std::size_t date_column_{5};

    // column of the time in a parsed record, not in the raw line.
    std::size_t timestamp_column_{2};

    // 35 stocks + the index + page junk. Anything shorter is not a data file.
    std::size_t min_lines_{51};

    char separator_{';'};
    std::string close_marker_{"Cierre"};
};

// a day can be given as '21' or as part of a full date '21/01/2023'.

std::string ExtractDay(IP::sv date);

class IndexTableParser
{
	public:

		// ====================  LIFECYCLE     =======================================

		IndexTableParser () = default;                             // constructor
        explicit IndexTableParser (const ParserConfig& config);

		// ====================  ACCESSORS     =======================================

        [[nodiscard]] const ParserConfig& GetConfig() const { return config_; }
        [[nodiscard]] const std::optional<std::string>& GetTargetDate() const { return target_date_; }
        [[nodiscard]] const TimestampLedger& GetLedger() const { return ledger_; }

        // returns std::nullopt when the file is too short to hold a table.
        // no time stamp filtering is done here.

        [[nodiscard]] std::optional<IP::PriceRecordList> LoadDataFile(const IP::FileName& file_name) const;

        [[nodiscard]] IP::StockNames ExtractStockNames(const IP::PriceRecordList& records) const;

        // keep records whose rendered text contains any of the filter values.
        // An empty filter keeps everything.

        [[nodiscard]] IP::PriceRecordList FilterRecords(const IP::PriceRecordList& records,
                const IP::StockFilter& filter) const;

        [[nodiscard]] std::string Render(const IP::PriceRecord& record) const;
        [[nodiscard]] std::vector<std::string> Render(const IP::PriceRecordList& records) const;

		// ====================  MUTATORS      =======================================

        const std::string& SetTargetDate(const std::string& date);

        std::optional<IP::PriceRecordList> ParseFile(const IP::FileName& file_name);
        std::optional<IP::PriceRecordList> FilterFile(const IP::FileName& file_name, const IP::StockFilter& filter);

		// ====================  OPERATORS     =======================================

	protected:

        [[nodiscard]] IP::PriceRecordList ExtractRecords(const IP::RawLineList& lines) const;
        [[nodiscard]] IP::PriceRecord ExtractRow(const std::vector<IP::sv>& raw_row, std::size_t line_number,
                IP::RecordShape shape) const;
        [[nodiscard]] bool RowMatchesTargetDate(const std::vector<IP::sv>& raw_row, std::size_t line_number) const;

		// ====================  DATA MEMBERS  =======================================

	private:
		// ====================  DATA MEMBERS  =======================================

        ParserConfig config_;

        std::optional<std::string> target_date_;

        TimestampLedger ledger_;

}; // -----  end of class IndexTableParser  -----

#endif   // ----- #ifndef _INDEXTABLEPARSER_INC_  -----
