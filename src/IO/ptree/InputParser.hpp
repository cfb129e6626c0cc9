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


#ifndef IO_INPUTPARSER_HPP
#define IO_INPUTPARSER_HPP
#include <fstream>
#include <sstream>
#include <string>
#include "IO/ptree/ptree_utilities.hpp"
#include "IO/ptree/toml_utilities.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include "IO/AppAbort.hpp"

/*
 * Driver input: a json, xml or toml file (chosen by extension), or a json string.
 */
class InputParser
{
public:
  InputParser() = default; 
  InputParser(const ptree& pt0) : pt(pt0) {}
  InputParser(const std::string &input) {
    std::string extension = io::get_file_extension(input);
    if (extension=="json" or extension=="xml" or extension=="toml") {
      read(input);
    } else {
      // no supported file extension --> input is a string in the json format
      parse(input, "json");
    }
  }

  ptree const& get_root() const {return pt;}

  void read(std::string const& filename)
  { 
    std::ifstream fp(filename);
    if(not fp.is_open())
      APP_ABORT("InputParser: Could not open file {}", filename);
    parse(fp, io::get_file_extension(filename));
  }

  void parse(std::basic_istream< typename ptree::key_type::value_type >& s, std::string const& extension)
  {
    if (extension == "json") { 
      boost::property_tree::read_json(s, pt);
    } else if (extension == "xml") {
      ptree pt0;
      boost::property_tree::read_xml(s, pt0);
      // single root element, e.g. <spnda>...</spnda>
      if(pt0.size() == 1 and pt0.begin()->first != "<xmlcomment>")
        pt = io::convert_xml(pt0.begin()->second);
      else
        pt = io::convert_xml(pt0);
    } else if (extension == "toml") {
      io::read_toml(s, pt);
    } else {
      APP_ABORT("InputParser: Unknown extension {}", extension);
    }
  }

  void parse(std::string const& s, std::string const& extension)
  {
    std::stringstream ss(s);
    parse(ss, extension);
  }

private:
  ptree pt;
};

#endif
