// =====================================================================================
//
//       Filename:  IndexParserApp.cpp
//
//    Description:  main application
//
//        Version:  1.0
//        Created:  02/07/2024 10:40:02 AM
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


#include "IndexParserApp.h"

#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <boost/regex.hpp>

#include <range/v3/algorithm/copy_if.hpp>
#include <range/v3/algorithm/for_each.hpp>
#include <range/v3/iterator/insert_iterators.hpp>

namespace rng = ranges;

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

using namespace std::string_literals;

/*
 *--------------------------------------------------------------------------------------
 *       Class:  IndexParserApp
 *      Method:  IndexParserApp
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
IndexParserApp::IndexParserApp (int argc, char* argv[])
    : mArgc{argc}, mArgv{argv}
{
}  /* -----  end of method IndexParserApp::IndexParserApp  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  IndexParserApp
 *      Method:  IndexParserApp
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
IndexParserApp::IndexParserApp (const std::vector<std::string>& tokens)
    : tokens_{tokens}
{
}  /* -----  end of method IndexParserApp::IndexParserApp  (constructor)  ----- */

void IndexParserApp::ConfigureLogging()
{
    // we need to set log level if specified and also log file.
    // records go to stdout so, without a log file, the log goes to stderr.

    if (! log_file_path_name_.get().empty())
    {
        // if we are running inside our test harness, logging may already by
        // running so we don't want to clobber it.
        // different tests may use different names.

        auto logger_name = log_file_path_name_.get().filename().string();
        logger_ = spdlog::get(logger_name);
        if (! logger_)
        {
            fs::path log_dir = log_file_path_name_.get().parent_path();
            if (! log_dir.empty() && ! fs::exists(log_dir))
            {
                fs::create_directories(log_dir);
            }

            logger_ = spdlog::basic_logger_mt(logger_name, log_file_path_name_.get().string());
        }
    }
    else
    {
        logger_ = spdlog::get("Index_Parser");
        if (! logger_)
        {
            logger_ = spdlog::stderr_color_mt("Index_Parser");
        }
    }
    spdlog::set_default_logger(logger_);

    // we are running before 'CheckArgs' so we need to do a little editiing ourselves.

    std::map<std::string, spdlog::level::level_enum> levels
    {
        {"none", spdlog::level::off},
        {"error", spdlog::level::err},
        {"information", spdlog::level::info},
        {"debug", spdlog::level::debug}
    };

    auto which_level = levels.find(logging_level_);
    if (which_level != levels.end())
    {
        spdlog::set_level(which_level->second);
    }
}

bool IndexParserApp::Startup()
{
    bool result{true};
	try
	{
		SetupProgramOptions();
        if (tokens_.empty())
        {
            ParseProgramOptions();
        }
        else
        {
            ParseProgramOptions(tokens_);
        }
        ConfigureLogging();
        spdlog::info(catenate("\n\n*** Begin run ", UTCDateTimeAsString(std::chrono::system_clock::now()), " ***\n"));
		result = CheckArgs ();
	}
	catch(std::exception& e)
	{
        spdlog::error(catenate("Problem in startup: ", e.what(), '\n'));
		//	we're outta here!

		this->Shutdown();
        result = false;
    }
    return result;
}		/* -----  end of method IndexParserApp::Startup  ----- */

void IndexParserApp::SetupProgramOptions ()
{
    mNewOptions = std::make_unique<po::options_description>();

	mNewOptions->add_options()
		("help,h", "produce help message")
		("data-dir", po::value<IP::FileName>(&data_directory_)->required(),
         "directory to search for raw data files. May be given as first positional argument.")
		("filter", po::value<std::vector<std::string>>(&filter_args_)->composing(),
         "stock[s] to output. May be comma-delimited list. May be given as second positional argument. Default is all.")
		("file-stem", po::value<std::string>(&file_stem_)->default_value("data_ibex"),
         "data file names must begin with this. Default is 'data_ibex'.")
		("file-ext", po::value<std::string>(&file_ext_)->default_value("csv"),
         "extension of the data files, without the dot. Default is 'csv'.")
		("target-date", po::value<std::string>(&target_date_),
         "only parse files for this day. Use 'DD' or 'DD/MM/YYYY'. Month and year are ignored.")
		("min-bytes", po::value<long>(&min_bytes_per_file_)->default_value(560),
         "skip files smaller than this. Default is 560.")
		("output,o", po::value<IP::FileName>(&output_file_name_), "write records to this file. Default is stdout.")
		("log-level,l", po::value<std::string>(&logging_level_),
         "logging level. Must be 'none|error|information|debug'. Default is 'information'.")
		("log-path", po::value<IP::FileName>(&log_file_path_name_),	"path name for log file.")
		;

    mPositional.add("data-dir", 1);
    mPositional.add("filter", 1);
}		/* -----  end of method IndexParserApp::SetupProgramOptions  ----- */

void IndexParserApp::ParseProgramOptions ()
{
	auto options = po::command_line_parser(mArgc, mArgv).options(*mNewOptions).positional(mPositional).run();
	po::store(options, mVariableMap);
	if (this->mArgc == 1 ||	mVariableMap.count("help") == 1)
	{
		std::cout << *mNewOptions << "\n";
		throw std::runtime_error("\nExiting after 'help'.");
	}
	po::notify(mVariableMap);

}		/* -----  end of method IndexParserApp::ParseProgramOptions  ----- */

void IndexParserApp::ParseProgramOptions (const std::vector<std::string>& tokens)
{
	auto options = po::command_line_parser(tokens).options(*mNewOptions).positional(mPositional).run();
	po::store(options, mVariableMap);
	if (mVariableMap.count("help") == 1)
	{
		std::cout << *mNewOptions << "\n";
		throw std::runtime_error("\nExiting after 'help'.");
	}
	po::notify(mVariableMap);
}		/* -----  end of method IndexParserApp::ParseProgramOptions  ----- */

bool IndexParserApp::CheckArgs ()
{
    BOOST_ASSERT_MSG(fs::exists(data_directory_.get()), catenate("Can't find data directory: ",
                data_directory_.get()).c_str());
    BOOST_ASSERT_MSG(fs::is_directory(data_directory_.get()),
            catenate("Path: ", data_directory_.get(), " is not a directory.").c_str());

    BOOST_ASSERT_MSG(! file_ext_.empty(), "Must specify a file extension.");
    BOOST_ASSERT_MSG(min_bytes_per_file_ >= 0, "Minimum file size can't be negative.");

    if (! target_date_.empty())
    {
        static const boost::regex regex_target_date{R"***(^[0-9]{1,2}(?:/[0-9]{1,2}/[0-9]{2,4})?$)***"};

        BOOST_ASSERT_MSG(boost::regex_match(target_date_, regex_target_date),
                catenate("Invalid target date: ", target_date_, ". Must be 'DD' or 'DD/MM/YYYY'.").c_str());
        parser_.SetTargetDate(target_date_);
    }
    else
    {
        spdlog::info("No target date specified. No date filtering to be done.");
    }

    //  the user may specify multiple stocks in a comma delimited list and/or
    //  positionally. We need to parse the entries out of those and place into ultimate home.

    stock_filter_.clear();
    for (const auto& filter_arg : filter_args_)
    {
        rng::copy_if(split_string<std::string>(filter_arg, ','), rng::back_inserter(stock_filter_),
                [](const auto& e) { return ! e.empty(); });
    }

    if (stock_filter_.empty())
    {
        spdlog::info("No stock filter specified. All stocks will be output.");
    }

    if (! output_file_name_.get().empty())
    {
        auto output_directory = output_file_name_.get().parent_path();
        if (! output_directory.empty() && ! fs::exists(output_directory))
        {
            fs::create_directories(output_directory);
        }
    }

    return true;
}       // -----  end of method IndexParserApp::CheckArgs  -----

std::tuple<int, int, int> IndexParserApp::Run()
{
    // files must go through the parser in order. Each one updates the time stamps
    // the next one is compared against.

    const auto files_to_process = DiscoverDataFiles(data_directory_, file_stem_, file_ext_);

    spdlog::info(catenate("Found: ", files_to_process.size(), " files to process in: ", data_directory_.get()));

    std::ofstream output_file;
    if (! output_file_name_.get().empty())
    {
        output_file.open(output_file_name_.get());
        if (! output_file)
        {
            throw std::runtime_error(catenate("Can't open output file: ", output_file_name_.get()));
        }
    }
    std::ostream& output = output_file.is_open() ? output_file : std::cout;

    std::tuple<int, int, int> counters{0, 0, 0};

    for (const auto& file_name : files_to_process)
    {
        counters = AddTs(counters, ProcessFile(file_name, output));
    }
    output.flush();

    auto [success_counter, skipped_counter, error_counter] = counters;

    spdlog::info(catenate("Processed: ", SumT(counters), " files. Successes: ",
            success_counter, ". Skips: ", skipped_counter , ". Errors: ", error_counter, "."));

    return counters;
}		/* -----  end of method IndexParserApp::Run  ----- */

std::tuple<int, int, int> IndexParserApp::ProcessFile (const std::string& file_name, std::ostream& output)
{
    const IP::FileName file_path{data_directory_.get() / file_name};

    try
    {
        // avoid passing empty files to the parser.

        if (fs::file_size(file_path.get()) < static_cast<std::uintmax_t>(min_bytes_per_file_))
        {
            spdlog::info(catenate("File: ", file_name, " is smaller than: ", min_bytes_per_file_, " bytes. Skipped."));
            return {0, 1, 0};
        }

        spdlog::info(catenate("Parsing file: ", file_path.get()));

        auto records = parser_.FilterFile(file_path, stock_filter_);
        if (! records)
        {
            spdlog::info(catenate("File ", file_name, " doesn't contain valid data."));
            return {0, 1, 0};
        }

        rng::for_each(parser_.Render(records.value()), [&output](const auto& line) { output << line << '\n'; });

        return {1, 0, 0};
    }
    catch(const std::exception& e)
    {
        spdlog::error(catenate("Problem processing file: ", file_path.get(), ". ", e.what()));
        return {0, 0, 1};
    }
}		/* -----  end of method IndexParserApp::ProcessFile  ----- */

void IndexParserApp::Shutdown ()
{
    spdlog::info(catenate("\n\n*** End run ", UTCDateTimeAsString(std::chrono::system_clock::now()), " ***\n"));
}       // -----  end of method IndexParserApp::Shutdown  -----
