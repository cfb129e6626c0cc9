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


#ifndef UTILS_TYPE_TRAITS_HPP
#define UTILS_TYPE_TRAITS_HPP

#include <complex>
#include <type_traits>

namespace utils
{

  template <typename T>
  struct remove_complex {typedef T type;};
  template <typename T>
  struct remove_complex<std::complex<T> > {typedef T type;};

  template<typename T>
  using remove_complex_t = typename remove_complex<T>::type;

  template <typename T>
  struct is_complex : std::false_type {};
  template <typename T>
  struct is_complex<std::complex<T> > : std::true_type {};

  template<typename T>
  constexpr bool is_complex_v = is_complex<T>::value;

  // complex conjugate that keeps real types real
  template<typename T>
  constexpr T conj(T const& v)
  {
    if constexpr (is_complex_v<T>) return std::conj(v);
    else return v;
  }

  template<typename T>
  constexpr remove_complex_t<T> real(T const& v)
  {
    if constexpr (is_complex_v<T>) return v.real();
    else return v;
  }

}

#endif
