// =====================================================================================
//
//       Filename:  Index_Parser_main.cpp
//
//    Description:  module which scans a directory of raw text copies of the
//                  IBEX 35 price table and writes the new price records found.
//
//      Inputs:
//
//        Version:  1.0
//        Created:  02/07/2024
//       Revision:  none
//       Compiler:  g++
//
//        License:  GNU General Public License v3
//        Company:
//
// =====================================================================================
//


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

#include <exception>
#include <iostream>

#include "spdlog/spdlog.h"

#include "IndexParserApp.h"
#include "IndexParser_Utils.h"

int main(int argc, char* argv[])
{
    auto result{0};

    try
    {
        IndexParserApp myApp(argc, argv);

        if (myApp.Startup())
        {
            auto [success_counter, skipped_counter, error_counter] = myApp.Run();
            myApp.Shutdown();

            if (error_counter > 0)
            {
                result = 2;
            }
        }
        else
        {
            result = 1;
        }
    }
    catch (std::exception& e)
    {
        spdlog::error(catenate("Something fundamental went wrong: ", e.what()));
        result = 3;
    }

    return result;

}        // -----  end of method main  -----
