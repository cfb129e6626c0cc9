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


#ifndef NUMERICS_LAPACK_LU_HPP
#define NUMERICS_LAPACK_LU_HPP

#include <algorithm>
#include <optional>
#include <utility>

#include "configuration.hpp"
#include "utilities/check.hpp"
#include "IO/app_loggers.h"
#include "nda/nda.hpp"
#include "nda/lapack.hpp"

namespace math::lapack
{

/**
 * LU factorization with partial (row) pivoting of a dense m x n matrix, M = P L U.
 *   - L: m x min(m,n), unit lower triangular
 *   - U: min(m,n) x n, upper triangular
 *   - P: m x m permutation
 * Uses LAPACK getrf/getrs/getri through nda. An exactly singular U is recorded,
 * solves and the inverse then report failure instead of producing a result.
 */
template<typename T>
class lu_factorization
{
public:

  static_assert(::nda::is_blas_lapack_v<T>, "lu_factorization: Invalid value type.");

  using value_type = T;
  using lu_t = ::nda::matrix<T,::nda::F_layout>;

  template<::nda::ArrayOfRank<2> M>
  explicit lu_factorization(M const& m) : lu_(m), ipiv_(std::min(m.extent(0),m.extent(1)))
  {
    int info = ::nda::lapack::getrf(lu_, ipiv_);
    utils::check(info >= 0, "lu_factorization: getrf failed with info:{}", info);
    singular_ = (info > 0);
    if(singular_)
      app_debug(2, "lu_factorization: U({0},{0}) is exactly zero.", info-1);
  }

  long nrows() const { return lu_.extent(0); }
  long ncols() const { return lu_.extent(1); }
  bool is_square() const { return nrows() == ncols(); }

  // false if U has an exactly zero diagonal entry
  bool is_invertible() const { return is_square() and not singular_; }

  ::nda::matrix<T> l() const
  {
    long m = nrows(), k = std::min(nrows(), ncols());
    auto L = ::nda::matrix<T>::zeros({m, k});
    for(long i=0; i<m; ++i)
      for(long j=0; j<std::min(i,k); ++j)
        L(i,j) = lu_(i,j);
    for(long i=0; i<k; ++i)
      L(i,i) = T(1);
    return L;
  }

  ::nda::matrix<T> u() const
  {
    long n = ncols(), k = std::min(nrows(), ncols());
    auto U = ::nda::matrix<T>::zeros({k, n});
    for(long i=0; i<k; ++i)
      for(long j=i; j<n; ++j)
        U(i,j) = lu_(i,j);
    return U;
  }

  ::nda::matrix<T> p() const
  {
    ::nda::matrix<T> P = ::nda::eye<T>(nrows());
    permute(P);
    return P;
  }

  // LAPACK pivots, 1-based: row i was swapped with row permutation_indices()(i)-1
  ::nda::array<int,1> const& permutation_indices() const { return ipiv_; }

  /**
   * b <- P b, for a vector or matrix b with nrows() rows.
   */
  template<typename B>
  requires(::nda::MemoryArray<std::decay_t<B>>)
  void permute(B&& b) const
  {
    constexpr int rank = ::nda::get_rank<std::decay_t<B>>;
    static_assert(rank == 1 or rank == 2, "Rank mismatch.");
    utils::check(b.extent(0) == nrows(), "lu_factorization::permute: Shape mismatch: {} != {}",
                 b.extent(0), nrows());
    // swaps of getrf in reverse order
    for(long i=ipiv_.extent(0)-1; i>=0; --i) {
      long r = ipiv_(i)-1;
      if(r == i) continue;
      if constexpr (rank == 1) {
        std::swap(b(i), b(r));
      } else {
        for(long c=0; c<b.extent(1); ++c)
          std::swap(b(i,c), b(r,c));
      }
    }
  }

  // solves M x = b, empty if M is singular
  template<::nda::Array B>
  auto solve(B const& b) const { return solve_copy('N', b); }

  // solves M^T x = b, empty if M is singular
  template<::nda::Array B>
  auto solve_transpose(B const& b) const { return solve_copy('T', b); }

  // solves M^H x = b, empty if M is singular
  template<::nda::Array B>
  auto solve_adjoint(B const& b) const { return solve_copy('C', b); }

  // in place variants, return false (b untouched) if M is singular
  template<typename B>
  requires(::nda::MemoryArray<std::decay_t<B>>)
  bool solve_inplace(B&& b) const { return generic_solve('N', b); }

  template<typename B>
  requires(::nda::MemoryArray<std::decay_t<B>>)
  bool solve_transpose_inplace(B&& b) const { return generic_solve('T', b); }

  template<typename B>
  requires(::nda::MemoryArray<std::decay_t<B>>)
  bool solve_adjoint_inplace(B&& b) const { return generic_solve('C', b); }

  // M^{-1}, empty if M is singular
  std::optional<::nda::matrix<T>> inverse() const
  {
    utils::check(is_square(), "lu_factorization::inverse: Matrix must be square, found ({},{})",
                 nrows(), ncols());
    if(singular_) return std::nullopt;
    lu_t inv(lu_);
    ::nda::array<int,1> ipiv(ipiv_);
    int info = ::nda::lapack::getri(inv, ipiv);
    utils::check(info >= 0, "lu_factorization::inverse: getri failed with info:{}", info);
    if(info > 0) return std::nullopt;
    return ::nda::matrix<T>(inv);
  }

private:

  template<typename B>
  auto solve_copy(char op, B const& b) const
  {
    constexpr int rank = ::nda::get_rank<B>;
    using res_t = ::nda::array<T,rank>;
    res_t x(b);
    if(generic_solve(op, x))
      return std::optional<res_t>(std::move(x));
    return std::optional<res_t>();
  }

  template<typename B>
  bool generic_solve(char op, B& b) const
  {
    constexpr int rank = ::nda::get_rank<std::decay_t<B>>;
    static_assert(rank == 1 or rank == 2, "Rank mismatch.");
    static_assert(std::is_same_v<::nda::get_value_t<std::decay_t<B>>,T>, "Type mismatch.");
    utils::check(is_square(), "lu_factorization: Unable to solve under/over-determined systems ({},{})",
                 nrows(), ncols());
    utils::check(b.extent(0) == nrows(), "lu_factorization: Shape mismatch: b has {} rows, expected {}",
                 b.extent(0), nrows());
    if(singular_) return false;

    int n = int(nrows());
    int nrhs = (rank == 1 ? 1 : int(b.extent(rank-1)));
    // column major copy of the right hand sides
    ::nda::matrix<T,::nda::F_layout> x(n, nrhs);
    if constexpr (rank == 1) {
      for(long i=0; i<n; ++i) x(i,0) = b(i);
    } else {
      x() = b;
    }
    int info = 0;
    ::nda::lapack::f77::getrs(op, n, nrhs, lu_.data(), std::max(1,n), ipiv_.data(),
                              x.data(), std::max(1,n), info);
    utils::check(info == 0, "lu_factorization: getrs failed with info:{}", info);
    if constexpr (rank == 1) {
      for(long i=0; i<n; ++i) b(i) = x(i,0);
    } else {
      b() = x;
    }
    return true;
  }

  lu_t lu_;
  ::nda::array<int,1> ipiv_;
  bool singular_ = false;

};

}

#endif
