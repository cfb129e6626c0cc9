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


#define CATCH_CONFIG_RUNNER
#include "catch2/catch.hpp"

#include <iostream>
#include <cstdlib>

#include "IO/app_loggers.h"

namespace utils::detail {
  // seed of the random generators used in the tests, see utils::test_seed()
  unsigned __unit_test_seed__ = 0;
}

int main(int argc, char* argv[])
{
  int output_level=2, debug_level=2;
  if(const char* env_p = std::getenv("OUTPUT_LEVEL")) {
    output_level = std::atoi(env_p);     
    if(output_level < 0) output_level=2;
    if(output_level > 5) output_level=2;
  }
  if(const char* env_p = std::getenv("DEBUG_LEVEL")) {
    debug_level = std::atoi(env_p);     
    if(debug_level < 0) debug_level=2;
    if(debug_level > 5) debug_level=2;
  }
  setup_loggers(true,output_level,debug_level);

  Catch::Session session;

  // Build a new parser on top of Catch2's
  using namespace Catch::clara;

  auto cli
    = session.cli()           
    | Opt( utils::detail::__unit_test_seed__, "seed" ) 
        ["--seed"]    
        ("Seed of the random sparse matrix generators.");
  session.cli(cli);

  int returnCode = session.applyCommandLine( argc, argv );
  if( returnCode != 0 ) // Indicates a command line error
      return returnCode;

  return session.run();
}
