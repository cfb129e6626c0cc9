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


#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>
#include "cxxopts.hpp"
#include "configuration.hpp"
#include "IO/AppAbort.hpp"
#include "IO/ptree/InputParser.hpp"
#include "IO/app_loggers.h"
#include "main/driver.h"

/** @file main.cpp
 */
int main(int argc, char** argv)
{
  std::vector<std::string> inputs;
  int output_level, debug_level; 
  try { // parse command line inputs
    cxxopts::Options options(argv[0], "Sparse matrix driver: load, inspect, multiply and solve");
    options
      .positional_help("[optional args]")
      .show_positional_help();
    options.add_options()
      ("h,help", "print help message")
      ("verbosity", "0, 1, 2, ...: higher means more", cxxopts::value<int>()->default_value("2"))
      ("debug", "0, 1, 2, ...: higher means more", cxxopts::value<int>()->default_value("0"))
      ("stacktrace", "print stack trace if available: default:false", cxxopts::value<bool>()->default_value("false"))
      ("filenames", "input filenames", cxxopts::value<std::vector<std::string>>())
    ;
    options.parse_positional({"filenames"});
    auto args = options.parse(argc, argv);
    if (args.count("help"))
    {
      std::cout << options.help({"", "Group"}) << std::endl;
      return 0;
    }

    output_level = args["verbosity"].as<int>();
    if (output_level < 0) 
    {
      std::cerr << "verbosity < 0: " << output_level << std::endl;
      return 1;
    }
 
    debug_level = args["debug"].as<int>();
    if (debug_level < 0) 
    {
      std::cerr << "debug < 0: " << debug_level << std::endl;
      return 1;
    }

    set_stacktrace(args["stacktrace"].as<bool>());

    if (args.count("filenames") < 1)
    {
      std::cout << "no input file given; exiting ..." << std::endl;
      return 1;
    }
    inputs = args["filenames"].as<std::vector<std::string>>();
  } catch (cxxopts::exceptions::exception const& e) {
    std::cerr << "Error parsing command line: " << e.what() << std::endl;
    return 1;
  }

  setup_loggers(true, output_level, debug_level);

  std::string welcome(
      std::string("\n --------------------------------\n") +
                  "  SpNDA: Sparse matrices for nda \n" +
                  " --------------------------------");
  app_log(1, welcome);

  // input files run one after the other, each with its own matrices
  for (auto const& input : inputs) {
    InputParser parser;
    try {
      parser.read(input);
    } catch (std::exception const& e) {
      app_error("Error parsing input file {}: {}", input, e.what());
      return 1;
    }

    try {
      driver::run(parser.get_root());
    } catch (std::exception const& e) {
      app_error("Error running input file {}: {}", input, e.what());
      return 1;
    }
  }

  return 0;
}
