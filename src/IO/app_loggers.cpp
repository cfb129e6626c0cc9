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


#include "configuration.hpp"
#if defined(ENABLE_SPDLOG)
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#endif
#include "IO/app_loggers.h"

int __app_debug_level__  = -10000;
int __app_output_level__ = -10000;
bool __app_stacktrace__  = true;

namespace
{

#if defined(ENABLE_SPDLOG)
void make_console(std::string const& name, std::string const& pattern)
{
  auto l = spdlog::get(name);
  if(not l) {
    l = spdlog::stdout_color_mt(name);
    l->set_pattern(pattern);
  }
}
#endif

}

void setup_loggers(bool root, int output_level, int debug_level)
{
  set_output_level(root, output_level);
  set_debug_level(root, debug_level);
}

void set_debug_level([[maybe_unused]] bool root, int debug_level)
{
  __app_debug_level__ = debug_level;
#if defined(ENABLE_SPDLOG)
  make_console("err_console", "%^[%l]%$ %v");
  if(debug_level > 0)
    spdlog::get("err_console")->set_level(spdlog::level::debug);
  else
    spdlog::get("err_console")->set_level(spdlog::level::info);
#endif
}

void set_output_level(bool root, int output_level)
{
  if(root) {
    __app_output_level__ = output_level;
#if defined(ENABLE_SPDLOG)
    make_console("std_console", "%v");
#endif
  } else
    __app_output_level__ = -10000;
#if defined(ENABLE_SPDLOG)
  make_console("warn_console", "%^[%l]%$ %v");
  spdlog::get("warn_console")->set_level(spdlog::level::warn);
#endif
}

void set_stacktrace(bool stk) { __app_stacktrace__ = stk; }
