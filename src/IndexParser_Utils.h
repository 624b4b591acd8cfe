/*
 * =====================================================================================
 *
 *       Filename:  IndexParser_Utils.h
 *
 *    Description:  Routines shared by the parser and the application.
 *
 *        Version:  1.0
 *        Created:  02/06/2024 03:42:10 PM
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

#ifndef _INDEXPARSER_UTILS_INC_
#define _INDEXPARSER_UTILS_INC_

#include <chrono>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

#include <boost/assert.hpp>

#include <date/date.h>

#include <fmt/format.h>

#include "Index_Parser.h"

namespace fs = std::filesystem;

using namespace std::string_literals;

// custom fmtlib formatter for filesytem paths

template <>
struct fmt::formatter<std::filesystem::path> : formatter<std::string> {
  // parse is inherited from formatter<string_view>.
  template <typename FormatContext>
  auto format(const std::filesystem::path &p, FormatContext &ctx) const {
    std::string f_name = p.string();
    return formatter<std::string>::format(f_name, ctx);
  }
};

template <typename... Ts> inline std::string catenate(Ts &&...ts) {

  constexpr auto N = sizeof...(Ts);

  // first, construct our format string

  std::string f_string;
  for (int i = 0; i < N; ++i) {
    f_string.append("{}");
  }

  return fmt::vformat(f_string, fmt::make_format_args(ts...));
}

// let's add tuples...
// based on code techniques from C++17 STL Cookbook zipping tuples.
// (works for any class which supports the '+' operator)

template <typename... Ts>
std::tuple<Ts...> AddTs(std::tuple<Ts...> const &t1,
                        std::tuple<Ts...> const &t2) {
  auto z_([](auto... xs) {
    return [xs...](auto... ys) { return std::make_tuple((xs + ys)...); };
  });

  return std::apply(std::apply(z_, t1), t2);
}

// let's sum the contents of a single tuple
// (from C++ Templates...second edition p.58
// and C++17 STL Cookbook.

template <typename... Ts> auto SumT(const std::tuple<Ts...> &t) {
  auto z_([](auto... ys) { return (... + ys); });
  return std::apply(z_, t);
}

// utility to convert a time_point to a string
// using Howard Hinnant's date library

inline std::string
UTCDateTimeAsString(std::chrono::system_clock::time_point a_date_time) {
  auto t = date::floor<std::chrono::seconds>(a_date_time);
  std::string ts = date::format("%a, %b %d, %Y at %I:%M:%S %p UTC", t);
  return ts;
}

std::string LoadDataFileForUse(const IP::FileName &file_name);

IP::RawLineList SplitLines(IP::sv file_content);

std::vector<std::string> DiscoverDataFiles(const IP::FileName &directory,
                                           const std::string &stem_prefix,
                                           const std::string &extension);

std::string RenderRecord(const IP::PriceRecord &record, char separator);

std::vector<std::string> RenderRecords(const IP::PriceRecordList &records,
                                       char separator);

// so we can recognize our errors if we want to do something special.

class IndexParserException : public std::runtime_error {
public:
  explicit IndexParserException(const char *what);

  explicit IndexParserException(const std::string &what);
};

class AssertionException : public std::invalid_argument {
public:
  explicit AssertionException(const char *what);

  explicit AssertionException(const std::string &what);
};

// the file could not be read at all.

class IOException : public IndexParserException {
public:
  explicit IOException(const char *what);

  explicit IOException(const std::string &what);
};

// a line does not have a field where the configuration expects one.

class MalformedRowException : public IndexParserException {
public:
  explicit MalformedRowException(const char *what);

  explicit MalformedRowException(const std::string &what);
};

//  let's do a little 'template normal' programming again

// function to split a string on a delimiter and return a vector of items.
// use concepts to restrict to strings and string_views.

template <typename T>
inline std::vector<T> split_string(IP::sv string_data, char delim)
  requires std::is_same_v<T, std::string> || std::is_same_v<T, IP::sv>
{
  std::vector<T> results;
  for (std::size_t it = 0; it != T::npos; ++it) {
    auto pos = string_data.find(delim, it);
    if (pos != T::npos) {
      results.emplace_back(string_data.substr(it, pos - it));
    } else {
      results.emplace_back(string_data.substr(it));
      break;
    }
    it = pos;
  }
  return results;
}

#endif /* ----- #ifndef _INDEXPARSER_UTILS_INC_  ----- */
