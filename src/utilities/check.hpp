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


#ifndef UTILITIES_ASSERT_HPP
#define UTILITIES_ASSERT_HPP

#include<string>
#include <source_location>
#include "IO/AppAbort.hpp"

namespace utils
{

/**
 * Checks a precondition. On failure calls APP_ABORT with the formatted message
 * and the location of the caller, which throws utils::app_abort_error.
 * @param cond - condition to be verified
 * @param format_string - message format
 * @param args - message arguments
 */
template<class... Args>
struct check
{
  check(bool cond, const std::string_view format_string, Args&&... args, const std::source_location& loc = std::source_location::current()) 
  { 
    if(not cond) {
      if constexpr (sizeof...(Args) > 0) 
        APP_ABORT(loc, format_string, std::forward<Args>(args)...);
      else 
        APP_ABORT(loc, format_string);
    }
  }
};

template <typename... Args>
check(bool, const std::string_view, Args&&...) -> check<Args...>;


/**
 * Checks that an index lies in [0, bound).
 */
template<typename I1, typename I2>
void check_index(I1 i, I2 bound, const std::string_view what,
                 const std::source_location& loc = std::source_location::current())
{
  if(i < 0 or static_cast<long>(i) >= static_cast<long>(bound))
    APP_ABORT(loc, "{} index out of bounds: {} not in [0,{})", what, static_cast<long>(i), static_cast<long>(bound));
}

}

#endif
