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


#ifndef IO_PTREE_UTILITIES_HPP 
#define IO_PTREE_UTILITIES_HPP 
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>
#include "configuration.hpp"
#include <boost/property_tree/ptree.hpp>
#include <boost/optional.hpp>
#include "IO/AppAbort.hpp"

using boost::property_tree::ptree;

namespace io
{

/* ---------------------------------- xml ----------------------------------- */
// <parameter name="x">v</parameter> becomes x: v, attributes are promoted to children
inline ptree convert_xml(const ptree& pt0)
{
  ptree pt1;
  for(auto& it : pt0)
  {
    std::string cname = it.first;
    ptree const& child = it.second;
    if (cname == "<xmlattr>") {
      for(auto& it1 : child)
        pt1.put(it1.first, it1.second.get_value<std::string>());
    } else if (cname == "<xmlcomment>") {
    } else if (cname == "parameter") {
      std::string pname = child.get<std::string>("<xmlattr>.name");
      pt1.put(pname, child.get_value<std::string>());
    } else if (child.size() < 1) {
      pt1.put(cname, child.get_value<std::string>());
    } else {
      ptree pt2 = convert_xml(child);
      if( auto str = child.get_value_optional<std::string>() )
        pt2.put_value(*str);	
      pt1.add_child(cname, pt2);
    }
  }
  return pt1;
}

/* -------------------------------- utilities ------------------------------- */
inline void tolower(std::string& s)
{
  std::transform(s.begin(), s.end(), s.begin(),
    [](unsigned char c){ return std::tolower(c); });
}

inline std::string tolower_copy(std::string const& s_)
{
  std::string s(s_);
  tolower(s);
  return s;
}

inline std::string get_file_extension(const std::string &s)
{
  size_t i = s.rfind('.', s.length());
  if (i == std::string::npos) return "";
  std::string ext = s.substr(i+1, s.length() - i);
  tolower(ext);
  return ext;
}

template<typename T>
inline T get_value(ptree const& pt, const std::string id, const std::string message="")
{
  auto node = pt.get_child_optional(id);
  if(not node)
    APP_ABORT("Error in io::get_value({}) - Missing Node: {}", id, message);
  auto v = node->get_value_optional<T>();
  if(not v)
    APP_ABORT("Error in io::get_value({}) - Can not extract value from node: {}", id, message);
  return *v;
}

template<typename T>
inline T get_value_with_default(ptree const& pt, const std::string id, const T def) 
{
  if(auto node = pt.get_child_optional(id)) {
    if(auto v = node->get_value_optional<T>())
      return *v;
    APP_ABORT("Error in io::get_value_with_default({}) - Can not extract value from node", id);
  } 
  return def;
}

// one of the allowed (lower case) options, case insensitive
inline std::string get_option(ptree const& pt, const std::string id, std::string const def,
                              std::vector<std::string> const& allowed)
{
  auto v = tolower_copy(get_value_with_default<std::string>(pt, id, def));
  if(std::find(allowed.begin(), allowed.end(), v) == allowed.end())
    APP_ABORT(" Invalid input option: {} = {}", id, v);
  return v;
}

} // io

#endif
