/**
 * ==========================================================================
 * SpNDA: Sparse matrices for nda
 *
 * Copyright (c) 2024-2025 The SpNDA developer team
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 * 
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 * ==========================================================================
 */


#ifndef IO_TOML_UTILITIES_HPP
#define IO_TOML_UTILITIES_HPP

#include <sstream>
#include <string>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <toml++/toml.hpp>
#include "IO/AppAbort.hpp"
#include "IO/app_loggers.h"

using boost::property_tree::ptree;

namespace io {

/*
 * toml input is converted to json by toml++ and read back into the property tree,
 * so every driver block can be written in json, xml or toml.
 * toml++ orders keys alphabetically. Arrays (and arrays of tables) become nameless children.
 */
inline void read_toml(std::basic_istream< typename ptree::key_type::value_type >& s,
                      ptree& main_pt)
{
  toml::table tbl;
  try {
    tbl = toml::parse(s);
  } catch (toml::parse_error const& e) {
    APP_ABORT("Error parsing toml input: {} (line {})", std::string(e.description()),
              e.source().begin.line);
  }

  std::ostringstream toml_ss;
  toml_ss << tbl;
  app_log(2, "\nInput Parameters");
  app_log(2, "----------------\n{}", toml_ss.str());
  app_log(2, "-- End of Input Parameters --\n");

  std::stringstream json_ss;
  json_ss << toml::json_formatter(tbl);
  ptree pt;
  boost::property_tree::read_json(json_ss, pt);
  for (const auto& it : pt)
    main_pt.add_child(it.first, it.second);
}

}
#endif
