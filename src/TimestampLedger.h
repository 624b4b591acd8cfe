// =====================================================================================
//
//       Filename:  TimestampLedger.h
//
//    Description:  Keeps the last time stamp seen for each stock so successive
//                  snapshots of a trading day only yield new prices.
//
//        Version:  1.0
//        Created:  02/07/2024 09:12:37 AM
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
//        Class:  TimestampLedger
//  Description:  map of stock name -> last emitted time stamp (HHMMSS as a number).
//
//                A record is passed on only when its time stamp differs from the
//                one stored for its stock. NOTE: the test is for a different value,
//                not a later one, so an older time stamp will replace a newer one.
//
//                The session close marker moves a stock to 'closed' and the record
//                is dropped.
// =====================================================================================

#ifndef  _TIMESTAMPLEDGER_INC_
#define  _TIMESTAMPLEDGER_INC_

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "Index_Parser.h"

class TimestampLedger
{
	public:

        // no time stamp seen yet for this stock.
        static constexpr int64_t k_unset_stamp = -1;

        // session closed for this stock. Unparsable time stamps encode to this value too.
        static constexpr int64_t k_closed_stamp = 0;

		// ====================  LIFECYCLE     =======================================

		TimestampLedger () = default;                             // constructor

		// ====================  ACCESSORS     =======================================

        [[nodiscard]] bool empty() const { return last_stamps_.empty(); }
        [[nodiscard]] std::size_t size() const { return last_stamps_.size(); }

        [[nodiscard]] std::optional<int64_t> LastStamp(const std::string& stock_name) const;

		// ====================  MUTATORS      =======================================

        // only does something the first time it is given some names.

        void Seed(const IP::StockNames& stock_names);

        IP::PriceRecordList Admit(const IP::PriceRecordList& records, std::size_t timestamp_column,
                const std::string& close_marker);

        static int64_t EncodeStamp(IP::sv time_stamp);

		// ====================  OPERATORS     =======================================

	private:
		// ====================  DATA MEMBERS  =======================================

        std::map<std::string, int64_t> last_stamps_;

}; // -----  end of class TimestampLedger  -----

#endif   // ----- #ifndef _TIMESTAMPLEDGER_INC_  -----
