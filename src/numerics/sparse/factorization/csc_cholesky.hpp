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


#ifndef SPARSE_FACTORIZATION_CSC_CHOLESKY_HPP
#define SPARSE_FACTORIZATION_CSC_CHOLESKY_HPP

#include <cmath>
#include <complex>
#include <string>
#include <utility>
#include <vector>

#include "configuration.hpp"
#include "utilities/check.hpp"
#include "utilities/type_traits.hpp"
#include "IO/app_loggers.h"
#include "nda/nda.hpp"

#include "numerics/sparse/sparse_errors.hpp"
#include "numerics/sparse/sparsity_pattern.hpp"
#include "numerics/sparse/csc_matrix.hpp"

namespace math::sparse
{

namespace detail
{

/*
 * Elimination tree of a symmetric matrix, from the upper triangle of its CSC pattern.
 * parent[k] == -1 for roots.
 */
template<typename IndxType, typename IntType>
std::vector<long> elimination_tree(sparsity_pattern<IndxType,IntType> const& a)
{
  long n = a.major_dim();
  auto const& ap = a.major_offsets();
  auto const& ai = a.minor_indices();
  std::vector<long> parent(n, -1);
  std::vector<long> ancestor(n, -1);
  for(long k=0; k<n; ++k) {
    for(long p=ap(k); p<ap(k+1); ++p) {
      // follow the path from i to the root of its current subtree, compressing it
      long i = ai(p);
      while(i != -1 and i < k) {
        long inext = ancestor[i];
        ancestor[i] = k;
        if(inext == -1) parent[i] = k;
        i = inext;
      }
    }
  }
  return parent;
}

/*
 * Nonzero pattern of row k of L: the set of nodes reachable in the elimination tree
 * from the entries A(i,k), i<k. Written to s[top..n) in topological order, returns top.
 * marker must hold values != k on entry.
 */
template<typename IndxType, typename IntType>
long ereach(sparsity_pattern<IndxType,IntType> const& a, long k, std::vector<long> const& parent,
            std::vector<long>& s, std::vector<long>& marker)
{
  long n = a.major_dim();
  auto const& ap = a.major_offsets();
  auto const& ai = a.minor_indices();
  long top = n;
  marker[k] = k;
  for(long p=ap(k); p<ap(k+1); ++p) {
    long i = ai(p);
    if(i > k) continue;
    long len = 0;
    for(; marker[i] != k; i = parent[i]) {
      s[len++] = i;
      marker[i] = k;
    }
    while(len > 0) s[--top] = s[--len];
  }
  return top;
}

}

/**
 * Symbolic Cholesky factorization of a CSC pattern: elimination tree and the
 * pattern of the lower triangular factor L. Only the upper triangle (row <= col)
 * of the input pattern is used. Rows of every column of L are sorted, the
 * diagonal comes first.
 */
template<typename IndxType = int, typename IntType = long>
class csc_symbolic_cholesky
{
public:

  using pattern_t = sparsity_pattern<IndxType,IntType>;

  static csc_symbolic_cholesky factor(pattern_t pattern)
  {
    utils::check(pattern.major_dim() == pattern.minor_dim(),
                 "csc_symbolic_cholesky: Matrix must be square, found ({},{})",
                 pattern.minor_dim(), pattern.major_dim());
    long n = pattern.major_dim();
    auto parent = detail::elimination_tree(pattern);

    // column counts of L
    std::vector<long> s(n), marker(n, -1);
    std::vector<long> cnt(n, 1);
    for(long k=0; k<n; ++k) {
      long top = detail::ereach(pattern, k, parent, s, marker);
      for(long p=top; p<n; ++p) cnt[s[p]]++;
    }
    typename pattern_t::offsets_t lp(n+1);
    lp(0) = 0;
    for(long k=0; k<n; ++k) lp(k+1) = lp(k) + cnt[k];

    // row indices of L, filled row by row
    typename pattern_t::indices_t li(long(lp(n)));
    std::vector<long> c(n);
    for(long k=0; k<n; ++k) c[k] = lp(k);
    std::fill(marker.begin(), marker.end(), -1);
    for(long k=0; k<n; ++k) {
      long top = detail::ereach(pattern, k, parent, s, marker);
      for(long p=top; p<n; ++p) li(c[s[p]]++) = IndxType(k);
      li(c[k]++) = IndxType(k);
    }
    auto l = pattern_t::from_offsets_and_indices_unchecked(n, n, std::move(lp), std::move(li));
    app_debug(2, "csc_symbolic_cholesky: n:{}, nnz(A):{}, nnz(L):{}", n, pattern.nnz(), l.nnz());
    return csc_symbolic_cholesky(std::move(pattern), std::move(l), std::move(parent));
  }

  // pattern of the factorized matrix
  pattern_t const& a_pattern() const { return a_pattern_; }
  // pattern of L, CSC
  pattern_t const& l_pattern() const { return l_pattern_; }
  std::vector<long> const& elimination_tree() const { return parent_; }
  long n() const { return l_pattern_.major_dim(); }

private:

  csc_symbolic_cholesky(pattern_t a, pattern_t l, std::vector<long> parent) :
    a_pattern_(std::move(a)), l_pattern_(std::move(l)), parent_(std::move(parent)) {}

  pattern_t a_pattern_;
  pattern_t l_pattern_;
  std::vector<long> parent_;

};

/**
 * Sparse Cholesky factorization A = L L^H of a Hermitian positive definite
 * CSC matrix. Only the upper triangle (row <= col) of A is read.
 * No fill reducing ordering is applied.
 */
template<typename ValType, typename IndxType = int, typename IntType = long>
class csc_cholesky
{
public:

  using value_type = ValType;
  using symbolic_t = csc_symbolic_cholesky<IndxType,IntType>;
  using matrix_t = csc_matrix<ValType,IndxType,IntType>;
  using values_t = ::nda::array<ValType,1>;

  // symbolic and numeric factorization of a
  static csc_cholesky factor(matrix_t const& a)
  {
    utils::check(a.nrows() == a.ncols(), "csc_cholesky: Matrix must be square, found ({},{})",
                 a.nrows(), a.ncols());
    return factor_numerical(symbolic_t::factor(a.pattern()), a.values());
  }

  /**
   * Numeric factorization on an existing symbolic factorization.
   * values must be aligned with symbolic.a_pattern().
   */
  template<::nda::ArrayOfRank<1> V>
  static csc_cholesky factor_numerical(symbolic_t symbolic, V const& values)
  {
    auto lx = numeric(symbolic, values);
    return csc_cholesky(std::move(symbolic), std::move(lx));
  }

  /**
   * Recomputes L for a matrix with the same pattern. On failure the factor is unchanged.
   */
  template<::nda::ArrayOfRank<1> V>
  void refactor(V const& values)
  {
    auto lx = numeric(symbolic_, values);
    l_ = matrix_t::try_from_pattern_and_values(symbolic_.l_pattern(), std::move(lx));
  }

  matrix_t const& l() const { return l_; }
  matrix_t take_l() && { return std::move(l_); }
  symbolic_t const& symbolic() const { return symbolic_; }

  /**
   * Solves A x = b in place. b is a vector, or a matrix whose columns are right hand sides.
   */
  template<typename B>
  requires(::nda::MemoryArray<std::decay_t<B>>)
  void solve_inplace(B&& b) const
  {
    static_assert(std::is_same_v<::nda::get_value_t<std::decay_t<B>>,ValType>, "Type mismatch.");
    constexpr int rank = ::nda::get_rank<std::decay_t<B>>;
    static_assert(rank == 1 or rank == 2, "Rank mismatch.");
    long n = symbolic_.n();
    utils::check(b.extent(0) == n, "csc_cholesky::solve: Shape mismatch: n:{}, b:{}", n, b.extent(0));
    if constexpr (rank == 1) {
      forward_backward(b);
    } else {
      for(long c=0; c<b.extent(1); ++c) {
        auto bc = b(::nda::range::all, c);
        forward_backward(bc);
      }
    }
  }

  template<::nda::Array B>
  auto solve(B const& b) const
  {
    constexpr int rank = ::nda::get_rank<B>;
    ::nda::array<ValType,rank> x(b);
    solve_inplace(x);
    return x;
  }

private:

  csc_cholesky(symbolic_t s, values_t lx) :
    symbolic_(std::move(s)),
    l_(matrix_t::try_from_pattern_and_values(symbolic_.l_pattern(), std::move(lx))) {}

  template<typename V>
  static values_t numeric(symbolic_t const& symbolic, V const& values)
  {
    auto const& a = symbolic.a_pattern();
    auto const& L = symbolic.l_pattern();
    long n = symbolic.n();
    utils::check(values.extent(0) == a.nnz(), "csc_cholesky: Value count mismatch: found {}, expected {}",
                 values.extent(0), a.nnz());
    auto const& ap = a.major_offsets();
    auto const& ai = a.minor_indices();
    auto const& lp = L.major_offsets();
    auto const& li = L.minor_indices();
    auto const& parent = symbolic.elimination_tree();

    values_t lx(L.nnz());
    std::vector<ValType> x(n, ValType(0));
    std::vector<long> s(n), marker(n, -1), c(n);
    for(long k=0; k<n; ++k) c[k] = lp(k);

    for(long k=0; k<n; ++k) {
      long top = detail::ereach(a, k, parent, s, marker);
      // x = A(0:k,k)
      x[k] = ValType(0);
      for(long p=ap(k); p<ap(k+1); ++p)
        if(ai(p) <= k) x[ai(p)] = ValType(values(p));
      ValType d = x[k];
      x[k] = ValType(0);
      for(; top<n; ++top) {
        long i = s[top];
        // L(k,i) = x(i) / L(i,i)
        ValType lki = x[i] / lx(lp(i));
        x[i] = ValType(0);
        for(long p=lp(i)+1; p<c[i]; ++p)
          x[li(p)] -= lx(p) * lki;
        d -= lki * utils::conj(lki);
        lx(c[i]++) = utils::conj(lki);
      }
      auto dr = utils::real(d);
      if(not (dr > 0))
        throw cholesky_error(cholesky_error_kind::not_positive_definite,
                "non positive pivot " + std::to_string(double(dr)) + " in column " + std::to_string(k));
      lx(c[k]++) = ValType(std::sqrt(dr));
    }
    return lx;
  }

  // forward solve with L, backward solve with L^H
  template<typename X>
  void forward_backward(X&& x) const
  {
    long n = symbolic_.n();
    auto const& lp = l_.col_offsets();
    auto const& li = l_.row_indices();
    auto const& lx = l_.values();
    for(long j=0; j<n; ++j) {
      x(j) /= lx(lp(j));
      auto xj = x(j);
      for(long p=lp(j)+1; p<lp(j+1); ++p)
        x(li(p)) -= lx(p) * xj;
    }
    for(long j=n-1; j>=0; --j) {
      auto xj = x(j);
      for(long p=lp(j)+1; p<lp(j+1); ++p)
        xj -= utils::conj(lx(p)) * x(li(p));
      x(j) = xj / utils::conj(lx(lp(j)));
    }
  }

  symbolic_t symbolic_;
  matrix_t l_;

};

}

#endif
