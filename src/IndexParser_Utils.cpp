/*
 * =====================================================================================
 *
 *       Filename:  IndexParser_Utils.cpp
 *
 *    Description:  Routines shared by the parser and the application.
 *
 *        Version:  1.0
 *        Created:  02/06/2024 03:44:51 PM
 *       Revision:  none
 *       Compiler:  gcc
 *
 *   Organization:
 *
 * =====================================================================================
 */

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

#include "IndexParser_Utils.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <range/v3/algorithm/for_each.hpp>
#include <range/v3/algorithm/sort.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

namespace rng = ranges;

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

using namespace std::string_literals;

/*
 *--------------------------------------------------------------------------------------
 *       Class:  IndexParserException
 *      Method:  IndexParserException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
IndexParserException::IndexParserException(const char *text)
    : std::runtime_error(text) {
} /* -----  end of method IndexParserException::IndexParserException
     (constructor) ----- */

IndexParserException::IndexParserException(const std::string &text)
    : std::runtime_error(text) {
} /* -----  end of method IndexParserException::IndexParserException
     (constructor) ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  AssertionException
 *      Method:  AssertionException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
AssertionException::AssertionException(const char *text)
    : std::invalid_argument(text) {
} /* -----  end of method AssertionException::AssertionException  (constructor)
     ----- */

AssertionException::AssertionException(const std::string &text)
    : std::invalid_argument(text) {
} /* -----  end of method AssertionException::AssertionException  (constructor)
     ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  IOException
 *      Method:  IOException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
IOException::IOException(const char *text) : IndexParserException(text) {
} /* -----  end of method IOException::IOException  (constructor)  ----- */

IOException::IOException(const std::string &text)
    : IndexParserException(text) {
} /* -----  end of method IOException::IOException  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  MalformedRowException
 *      Method:  MalformedRowException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
MalformedRowException::MalformedRowException(const char *text)
    : IndexParserException(text) {
} /* -----  end of method MalformedRowException::MalformedRowException
     (constructor)  ----- */

MalformedRowException::MalformedRowException(const std::string &text)
    : IndexParserException(text) {
} /* -----  end of method MalformedRowException::MalformedRowException
     (constructor)  ----- */

/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * LoadDataFileForUse Description:
 * =====================================================================================
 */
std::string LoadDataFileForUse(const IP::FileName &file_name) {
  std::error_code ec;
  if (!fs::is_regular_file(file_name.get(), ec)) {
    throw IOException(catenate("Can't find data file: ", file_name.get()));
  }

  auto file_size = fs::file_size(file_name.get(), ec);
  if (ec) {
    throw IOException(catenate("Can't get size of data file: ",
                               file_name.get(), ". ", ec.message()));
  }

  std::string file_content(file_size, '\0');
  std::ifstream input_file{file_name.get(),
                           std::ios_base::in | std::ios_base::binary};
  if (!input_file) {
    throw IOException(catenate("Can't open data file: ", file_name.get()));
  }
  input_file.read(&file_content[0], file_content.size());
  if (input_file.bad()) {
    throw IOException(catenate("Can't read data file: ", file_name.get()));
  }
  input_file.close();

  return file_content;
} /* -----  end of function LoadDataFileForUse  ----- */

/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * SplitLines Description:  lines end with '\n' or "\r\n". A trailing newline
 * does not start an empty last line.
 * =====================================================================================
 */
IP::RawLineList SplitLines(IP::sv file_content) {
  IP::RawLineList lines;
  if (file_content.empty()) {
    return lines;
  }

  lines = split_string<IP::sv>(file_content, '\n');
  if (file_content.back() == '\n') {
    lines.pop_back();
  }

  rng::for_each(lines, [](IP::sv &line) {
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
  });
  return lines;
} /* -----  end of function SplitLines  ----- */

/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * DiscoverDataFiles Description:  non-recursive scan. Keep regular files
 * whose extension matches and whose stem begins with the prefix. We return
 * them in the order they were written so the snapshots of a day are seen in
 * sequence.
 * =====================================================================================
 */
std::vector<std::string> DiscoverDataFiles(const IP::FileName &directory,
                                           const std::string &stem_prefix,
                                           const std::string &extension) {
  std::error_code ec;
  if (!fs::is_directory(directory.get(), ec)) {
    throw IOException(
        catenate("Can't read data directory: ", directory.get()));
  }

  struct Candidate {
    fs::file_time_type write_time_;
    std::string file_name_;
  };
  std::vector<Candidate> candidates;

  const std::string dot_extension = "."s + extension;

  for (const auto &dir_ent : fs::directory_iterator(directory.get())) {
    if (!dir_ent.is_regular_file()) {
      continue;
    }
    const auto &file_path = dir_ent.path();
    if (file_path.extension().string() != dot_extension) {
      continue;
    }
    if (!boost::algorithm::starts_with(file_path.stem().string(),
                                       stem_prefix)) {
      continue;
    }
    candidates.push_back({dir_ent.last_write_time(),
                          file_path.filename().string()});
  }

  rng::sort(candidates, [](const auto &lhs, const auto &rhs) {
    return std::tie(lhs.write_time_, lhs.file_name_) <
           std::tie(rhs.write_time_, rhs.file_name_);
  });

  spdlog::debug(catenate("Found: ", candidates.size(), " data files in: ",
                         directory.get()));

  return candidates |
         rng::views::transform([](const auto &c) { return c.file_name_; }) |
         rng::to<std::vector>();
} /* -----  end of function DiscoverDataFiles  ----- */

/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * RenderRecord Description:  the joined string is our output format.
 * =====================================================================================
 */
std::string RenderRecord(const IP::PriceRecord &record, char separator) {
  return boost::algorithm::join(record.fields_, std::string(1, separator));
} /* -----  end of function RenderRecord  ----- */

std::vector<std::string> RenderRecords(const IP::PriceRecordList &records,
                                       char separator) {
  return records | rng::views::transform([separator](const auto &record) {
           return RenderRecord(record, separator);
         }) |
         rng::to<std::vector>();
} /* -----  end of function RenderRecords  ----- */

namespace boost {
// these functions are declared in the library headers but left to the user to
// define. so here they are...
//
/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * assertion_failed_mgs Description: defined in boost header but left to us to
 * implement.
 * =====================================================================================
 */

void assertion_failed_msg(char const *expr, char const *msg,
                          char const *function, char const *file, long line) {
  throw AssertionException(catenate(
      "\n*** Assertion failed *** test: ", expr, " in function: ", function,
      " from file: ", file, " at line: ", line, ".\nassertion msg: ", msg));
} /* -----  end of function assertion_failed_mgs  ----- */

/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * assertion_failed Description:
 * =====================================================================================
 */
void assertion_failed(char const *expr, char const *function, char const *file,
                      long line) {
  throw AssertionException(catenate("\n*** Assertion failed *** test: ", expr,
                                    " in function: ", function,
                                    " from file: ", file, " at line: ", line));
} /* -----  end of function assertion_failed  ----- */
} /* end namespace boost */
