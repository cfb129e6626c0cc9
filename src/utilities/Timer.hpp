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


#ifndef UTILITIES_TIMER_HPP
#define UTILITIES_TIMER_HPP

#include <chrono>
#include <string>

namespace utils
{

// simple accumulating clock
struct Watch : private std::chrono::steady_clock{
  std::string name;
  time_point  start_;
  int ncalls = 0;
  double total_time = 0.0;
  Watch(std::string name_ = "") : name(name_), start_{now()} {}
  ~Watch() = default;
  void start() { start_=now(); }
  double time() const { return std::chrono::duration<double>(now() - start_).count(); }
  void stop() {
    total_time += std::chrono::duration<double>(now() - start_).count();
    ncalls++;
  }
  double elapsed() const { return total_time; }
  double average() const { return (ncalls > 0 ? total_time/double(ncalls) : 0.0); }
  int number_of_calls() const { return ncalls; }
  void reset() {
    total_time = 0.0;
    ncalls = 0;
  }
};

}

#endif
