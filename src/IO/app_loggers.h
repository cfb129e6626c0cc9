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


#ifndef UTILITIES_APP_LOGGERS_HPP
#define UTILITIES_APP_LOGGERS_HPP

#include <iostream>
#include <string_view>
#if defined(ENABLE_SPDLOG)
#include "spdlog/spdlog.h"
#endif
#include "IO/fmt_extensions.hpp"
#include "IO/AppAbort.hpp"

extern int __app_debug_level__;
extern int __app_output_level__;

// app_log: "std_console", clean format, only active when root == true
// app_warning: "warn_console"
// app_error/app_debug: "err_console"

void setup_loggers(bool root=true, int output_level=2, int debug_level=0);
void set_output_level(bool root, int output_level);
void set_debug_level(bool root, int debug_level);
void set_stacktrace(bool stk);

namespace utils::detail
{

template<class... Args>
void print_unformatted(std::ostream& os, const std::string_view string_format, Args&&... args)
{
  if constexpr (sizeof...(Args) > 0)
    os<<std::vformat(string_format,std::make_format_args(args...)) <<"\n";
  else
    os<<string_format <<"\n";
}

}

template<class... Args>
void app_log(int level, const std::string_view string_format, Args&&... args)
{
  if(__app_output_level__ > 0 and level <= __app_output_level__) {
#if defined(ENABLE_SPDLOG)
    auto l = spdlog::get("std_console");
    if(l)
      l->info(fmt::runtime(string_format),std::forward<Args>(args)...);
    else
      APP_ABORT(" Error: app_log used uninitialized.");
#else
    utils::detail::print_unformatted(std::cout,string_format,args...);
#endif
  }
}

template<class... Args>
void app_warning(const std::string_view string_format, Args&&... args)
{
#if defined(ENABLE_SPDLOG)
  auto l = spdlog::get("warn_console");
  if(l)
    l->warn(fmt::runtime(string_format),std::forward<Args>(args)...);
  else
    APP_ABORT(" Error: app_warning used uninitialized.");
#else
  utils::detail::print_unformatted(std::cerr,string_format,args...);
#endif
}

template<class... Args>
void app_error(const std::string_view string_format, Args&&... args)
{
#if defined(ENABLE_SPDLOG)
  auto l = spdlog::get("err_console");
  if(l) {
    l->error(fmt::runtime(string_format),std::forward<Args>(args)...);
    l->flush();
  } else
    APP_ABORT(" Error: app_error used uninitialized.");
#else
  utils::detail::print_unformatted(std::cerr,string_format,args...);
#endif
}

template<class... Args>
void app_debug(int level, const std::string_view string_format, Args&&... args)
{
  if(__app_debug_level__ > 0 and level <= __app_debug_level__) {
#if defined(ENABLE_SPDLOG)
    auto l = spdlog::get("err_console");
    if(l)
      l->debug(fmt::runtime(string_format), std::forward<Args>(args)...);
    else
      APP_ABORT(" Error: app_debug used uninitialized.");
#else
    utils::detail::print_unformatted(std::cerr,string_format,args...);
#endif
  }
}

inline void app_log_flush()
{
  if(__app_output_level__ > 0) {
#if defined(ENABLE_SPDLOG)
    auto l = spdlog::get("std_console");
    if(l)
      l->flush();
    else
      APP_ABORT(" Error: app_log used uninitialized.");
#else
    std::cout.flush();
#endif
  }
}

inline void app_error_flush()
{
#if defined(ENABLE_SPDLOG)
  auto l = spdlog::get("err_console");
  if(l)
    l->flush();
  else
    APP_ABORT(" Error: app_error used uninitialized.");
#else
  std::cerr.flush();
#endif
}

#endif
