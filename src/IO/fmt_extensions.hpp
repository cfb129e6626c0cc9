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


#ifndef UTILITIES_FMT_EXTENSIONS_HPP
#define UTILITIES_FMT_EXTENSIONS_HPP

#include <format>
#include <complex>

#if defined(ENABLE_SPDLOG)

#include <spdlog/fmt/fmt.h>

template<typename T> struct fmt::formatter<std::complex<T>> {
  template<typename ParseContext>
  constexpr auto parse(ParseContext& ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it == end || *it == '}') return it;
    if (*it == 'f' || *it == 'e' || *it == 'g') presentation = *it++;
    if (it != end && *it != '}')
      throw format_error("invalid format");
    return it;
  }

  template <typename FormatContext>
  auto format(const std::complex<T>& p, FormatContext& ctx) const -> decltype(ctx.out()) {
    if(presentation == 'e')
      return fmt::format_to(ctx.out(), "({:e}, {:e})", std::real(p), std::imag(p));
    if(presentation == 'g')
      return fmt::format_to(ctx.out(), "({:g}, {:g})", std::real(p), std::imag(p));
    return fmt::format_to(ctx.out(), "({:f}, {:f})", std::real(p), std::imag(p));
  }

  char presentation = 'f';
};

#else

namespace std
{

template<typename T> struct formatter<std::complex<T>> {
  template<typename ParseContext>
  constexpr auto parse(ParseContext& ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it == end || *it == '}') return it;
    if (*it == 'f' || *it == 'e' || *it == 'g') presentation = *it++;
    if (it != end && *it != '}')
      throw format_error("invalid format");
    return it;
  }

  template <typename FormatContext>
  auto format(const std::complex<T>& p, FormatContext& ctx) const -> decltype(ctx.out()) {
    if(presentation == 'e')
      return std::format_to(ctx.out(), "({:e}, {:e})", std::real(p), std::imag(p));
    if(presentation == 'g')
      return std::format_to(ctx.out(), "({:g}, {:g})", std::real(p), std::imag(p));
    return std::format_to(ctx.out(), "({:f}, {:f})", std::real(p), std::imag(p));
  }

  char presentation = 'f';
};

}

#endif

#endif
