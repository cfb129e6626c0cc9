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


#ifndef UTILITIES_APPABORT_HPP
#define UTILITIES_APPABORT_HPP

#include "configuration.hpp"
#include <iostream>
#include <string>
#include <string_view>
#include <stdexcept>
#include <source_location>
#if defined(ENABLE_CPPTRACE)
#include <cpptrace/cpptrace.hpp>
#endif

extern bool __app_stacktrace__;

namespace utils
{

/*
 * Thrown by APP_ABORT after the error banner has been written.
 * Library code never catches it, drivers report it and exit.
 */
struct app_abort_error : public std::runtime_error
{
  using std::runtime_error::runtime_error;
};

}

#if defined(ENABLE_SPDLOG)

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"

namespace utils::detail
{

inline std::shared_ptr<spdlog::logger> abort_console()
{
  auto l = spdlog::get("err_console");
  if(not l) {
    l = spdlog::stdout_color_mt("err_console");
    l->set_pattern("%^[%l]%$ %v");
  }
  return l;
}

inline void abort_banner(std::string const& msg, std::source_location const* loc)
{
  auto l = abort_console();
  l->error("**********************************************");
  l->error("        APPLICATION ABORT: Fatal Error.");
  l->error("**********************************************");
  if(loc != nullptr) {
    l->error(" file_name:     {}",loc->file_name());
    l->error(" function_name: {}",loc->function_name());
    l->error(" line:          {}",loc->line());
    l->error(" column:        {}",loc->column());
  }
  l->error(" {}",msg);
  l->error("**********************************************");
  if(__app_stacktrace__) {
    l->error("**********************************************");
    l->error("                Stack Trace                   ");
    l->error("**********************************************");
#if defined(ENABLE_CPPTRACE)
    cpptrace::generate_trace().print();
#else
    l->error("  Not available in current compilation. ");
    l->error("  Compile with -DENABLE_CPPTRACE=ON to make this feature available.");
#endif
    l->error("**********************************************");
  }
  l->flush();
}

template<class... Args>
std::string format_abort_message(const std::string_view format_string, Args&&... args)
{
  if constexpr (sizeof...(Args) > 0)
    return fmt::vformat(fmt::string_view(format_string.data(),format_string.size()),
                        fmt::make_format_args(args...));
  else
    return std::string(format_string);
}

}

#else

#include <format>

namespace utils::detail
{

inline void abort_banner(std::string const& msg, std::source_location const* loc)
{
  std::cerr<<"**********************************************\n";
  std::cerr<<"        APPLICATION ABORT: Fatal Error.\n";
  std::cerr<<"**********************************************\n";
  if(loc != nullptr) {
    std::cerr<<std::format(" file_name:     {}",loc->file_name()) <<"\n";
    std::cerr<<std::format(" function_name: {}",loc->function_name()) <<"\n";
    std::cerr<<std::format(" line:          {}",loc->line()) <<"\n";
    std::cerr<<std::format(" column:        {}",loc->column()) <<"\n";
  }
  std::cerr<<" " <<msg <<"\n";
  std::cerr<<"**********************************************\n";
  if(__app_stacktrace__) {
    std::cerr<<"**********************************************\n";
    std::cerr<<"                Stack Trace                   \n";
    std::cerr<<"**********************************************\n";
#if defined(ENABLE_CPPTRACE)
    cpptrace::generate_trace().print();
#else
    std::cerr<<"  Not available in current compilation. \n";
    std::cerr<<"  Compile with -DENABLE_CPPTRACE=ON to make this feature available.\n";
#endif
    std::cerr<<"**********************************************\n";
  }
  std::cerr.flush();
}

template<class... Args>
std::string format_abort_message(const std::string_view format_string, Args&&... args)
{
  if constexpr (sizeof...(Args) > 0)
    return std::vformat(format_string,std::make_format_args(args...));
  else
    return std::string(format_string);
}

}

#endif

template<class... Args>
[[noreturn]] void APP_ABORT(const std::string_view format_string, Args&&... args)
{
  auto msg = utils::detail::format_abort_message(format_string, std::forward<Args>(args)...);
  utils::detail::abort_banner(msg, nullptr);
  throw utils::app_abort_error(msg);
}

template<class... Args>
[[noreturn]] void APP_ABORT(const std::source_location& loc, const std::string_view format_string, Args&&... args)
{
  auto msg = utils::detail::format_abort_message(format_string, std::forward<Args>(args)...);
  utils::detail::abort_banner(msg, std::addressof(loc));
  throw utils::app_abort_error(msg);
}

#endif
