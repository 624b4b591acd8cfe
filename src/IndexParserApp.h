// =====================================================================================
//
//       Filename:  IndexParserApp.h
//
//    Description:  main application
//
//        Version:  1.0
//        Created:  02/07/2024 10:31:18 AM
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
//        Class:  IndexParserApp
//  Description:  scans a directory for raw data files and writes the parsed
//                records, one per line.
// =====================================================================================

#ifndef INDEXPARSERAPP_H_
#define INDEXPARSERAPP_H_

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

namespace fs = std::filesystem;

#include <boost/program_options.hpp>

#include <spdlog/spdlog.h>

namespace po = boost::program_options;

#include "IndexParser_Utils.h"
#include "IndexTableParser.h"
#include "Index_Parser.h"

class IndexParserApp
{
public:
    IndexParserApp(int argc, char *argv[]);

    // use ctor below for testing with predefined options

    explicit IndexParserApp(const std::vector<std::string> &tokens);

    IndexParserApp() = delete;
    IndexParserApp(const IndexParserApp &rhs) = delete;
    IndexParserApp(IndexParserApp &&rhs) = delete;

    ~IndexParserApp() = default;

    IndexParserApp &operator=(const IndexParserApp &rhs) = delete;
    IndexParserApp &operator=(IndexParserApp &&rhs) = delete;

    bool Startup();
    std::tuple<int, int, int> Run();
    void Shutdown();

    [[nodiscard]] const IndexTableParser &GetParser() const
    {
        return parser_;
    }

protected:
    //	Setup for parsing program options.

    void SetupProgramOptions();
    void ParseProgramOptions();
    void ParseProgramOptions(const std::vector<std::string> &tokens);

    void ConfigureLogging();

    bool CheckArgs();

    std::tuple<int, int, int> ProcessFile(const std::string &file_name, std::ostream &output);

    // ====================  DATA MEMBERS  =======================================

private:
    // ====================  DATA MEMBERS  =======================================

    po::positional_options_description mPositional;       //	old style options
    std::unique_ptr<po::options_description> mNewOptions; //	new style options (with identifiers)
    po::variables_map mVariableMap;

    IndexTableParser parser_;

    int mArgc = 0;
    char **mArgv = nullptr;
    const std::vector<std::string> tokens_;

    std::string file_stem_{"data_ibex"};
    std::string file_ext_{"csv"};
    std::string target_date_;
    std::string logging_level_{"information"};

    // may be given positionally and/or as comma-delimited lists.
    std::vector<std::string> filter_args_;

    IP::StockFilter stock_filter_;

    IP::FileName data_directory_;
    IP::FileName output_file_name_;
    IP::FileName log_file_path_name_;

    std::shared_ptr<spdlog::logger> logger_;

    // smaller files can't hold a table. Skip them without reading.
    long min_bytes_per_file_{560};
};

#endif /* INDEXPARSERAPP_H_ */
