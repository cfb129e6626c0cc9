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


#ifndef SPARSE_OPERATORS_HPP
#define SPARSE_OPERATORS_HPP

#include <type_traits>
#include <utility>

#include "utilities/check.hpp"
#include "nda/nda.hpp"

#include "numerics/sparse/detail/concepts.hpp"
#include "numerics/sparse/csr_matrix.hpp"
#include "numerics/sparse/csc_matrix.hpp"
#include "numerics/sparse/sparse_blas.hpp"

namespace math::sparse
{

/*
 * Arithmetic operators on compressed matrices. Both operands of a sparse-sparse
 * operation share format and types, the result has the same format.
 */

namespace detail
{

template<CompressedMatrix M>
M zeros_with_pattern(typename M::pattern_t p)
{
  long nnz = p.nnz();
  return M::try_from_pattern_and_values(std::move(p), ::nda::array<typename M::value_type,1>::zeros({nnz}));
}

template<CompressedMatrix M>
void spadd(typename M::value_type alpha, M const& a, typename M::value_type beta, M& c)
{
  if constexpr (CSRMatrix<M>)
    spadd_csr_prealloc(alpha, a, beta, c);
  else
    spadd_csc_prealloc(alpha, a, beta, c);
}

template<CompressedMatrix M>
M add(M const& a, M const& b, typename M::value_type sb)
{
  utils::check(a.shape() == b.shape(), "Shape mismatch in sparse addition: ({},{}) + ({},{})",
               a.nrows(), a.ncols(), b.nrows(), b.ncols());
  auto c = zeros_with_pattern<M>(spadd_pattern(a.pattern(), b.pattern()));
  using V = typename M::value_type;
  spadd(V(1), a, V(0), c);
  spadd(sb, b, V(1), c);
  return c;
}

}

template<CompressedMatrix M>
M operator+(M const& a, M const& b)
{
  return detail::add(a, b, typename M::value_type(1));
}

template<CompressedMatrix M>
M operator-(M const& a, M const& b)
{
  return detail::add(a, b, typename M::value_type(-1));
}

template<CompressedMatrix M>
M operator*(M const& a, M const& b)
{
  using V = typename M::value_type;
  utils::check(a.ncols() == b.nrows(), "Shape mismatch in sparse product: ({},{}) * ({},{})",
               a.nrows(), a.ncols(), b.nrows(), b.ncols());
  if constexpr (CSRMatrix<M>) {
    auto c = detail::zeros_with_pattern<M>(spmm_csr_pattern(a, b));
    spmm_csr_prealloc(V(1), a, b, V(0), c);
    return c;
  } else {
    auto c = detail::zeros_with_pattern<M>(spmm_csc_pattern(a, b));
    spmm_csc_prealloc(V(1), a, b, V(0), c);
    return c;
  }
}

// sparse times dense matrix
template<CompressedMatrix M, ::nda::ArrayOfRank<2> B>
auto operator*(M const& a, B const& b)
{
  using V = typename M::value_type;
  static_assert(std::is_same_v<V, ::nda::get_value_t<B>>, "Type mismatch.");
  utils::check(a.ncols() == b.extent(0), "Shape mismatch in sparse product: ({},{}) * ({},{})",
               a.nrows(), a.ncols(), b.extent(0), b.extent(1));
  ::nda::array<V,2> b_(b);
  ::nda::array<V,2> c(a.nrows(), b.extent(1));
  if constexpr (CSRMatrix<M>)
    csrmm(V(1), a, b_, V(0), c);
  else
    cscmm(V(1), a, b_, V(0), c);
  return c;
}

// sparse times dense vector
template<CompressedMatrix M, ::nda::ArrayOfRank<1> X>
auto operator*(M const& a, X const& x)
{
  using V = typename M::value_type;
  static_assert(std::is_same_v<V, ::nda::get_value_t<X>>, "Type mismatch.");
  utils::check(a.ncols() == x.extent(0), "Shape mismatch in sparse product: ({},{}) * ({})",
               a.nrows(), a.ncols(), x.extent(0));
  ::nda::array<V,1> x_(x);
  ::nda::array<V,1> y(a.nrows());
  if constexpr (CSRMatrix<M>)
    csrmv(V(1), a, x_, V(0), y);
  else
    cscmv(V(1), a, x_, V(0), y);
  return y;
}

template<CompressedMatrix M>
M& operator*=(M& a, std::type_identity_t<typename M::value_type> s)
{
  for(auto& v : a.values()) v *= s;
  return a;
}

template<CompressedMatrix M>
M& operator/=(M& a, std::type_identity_t<typename M::value_type> s)
{
  for(auto& v : a.values()) v /= s;
  return a;
}

template<CompressedMatrix M>
M operator*(M const& a, std::type_identity_t<typename M::value_type> s)
{
  M c(a);
  c *= s;
  return c;
}

template<CompressedMatrix M>
M operator*(std::type_identity_t<typename M::value_type> s, M const& a)
{
  return a * s;
}

template<CompressedMatrix M>
M operator/(M const& a, std::type_identity_t<typename M::value_type> s)
{
  M c(a);
  c /= s;
  return c;
}

template<CompressedMatrix M>
M operator-(M const& a)
{
  return a * typename M::value_type(-1);
}

}

#endif
