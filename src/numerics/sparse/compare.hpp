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


#ifndef SPARSE_COMPARE_HPP
#define SPARSE_COMPARE_HPP

#include "configuration.hpp"

#if defined(ENABLE_COMPARE)

#include <algorithm>
#include <array>
#include <cmath>
#include <string>
#include <vector>

#include "nda/nda.hpp"
#include "IO/fmt_extensions.hpp"
#if defined(ENABLE_SPDLOG)
#include <spdlog/fmt/fmt.h>
#else
#include <format>
#endif

#include "numerics/sparse/detail/concepts.hpp"
#include "numerics/sparse/convert.hpp"

namespace math::sparse
{

/*
 * Entrywise comparators for compare_matrices.
 */
struct exact_comparator
{
  template<typename V>
  bool operator()(V const& a, V const& b) const { return a == b; }
};

struct absolute_comparator
{
  double tol = 0.0;
  template<typename V>
  bool operator()(V const& a, V const& b) const { return double(std::abs(a-b)) <= tol; }
};

// |a-b| <= tol * max(|a|,|b|)
struct relative_comparator
{
  double tol = 0.0;
  template<typename V>
  bool operator()(V const& a, V const& b) const
  {
    double d = double(std::abs(a-b));
    return d <= tol * std::max(double(std::abs(a)), double(std::abs(b)));
  }
};

template<typename V>
struct entry_mismatch
{
  long row;
  long col;
  V lhs;
  V rhs;
};

template<typename V>
struct matrix_comparison_result
{
  std::array<long,2> lhs_shape = {0,0};
  std::array<long,2> rhs_shape = {0,0};
  std::vector<entry_mismatch<V>> mismatches;

  bool shape_mismatch() const { return lhs_shape != rhs_shape; }
  bool success() const { return not shape_mismatch() and mismatches.empty(); }
  explicit operator bool() const { return success(); }

  std::string description(long max_entries = 10) const
  {
#if defined(ENABLE_SPDLOG)
    namespace f = fmt;
#else
    namespace f = std;
#endif
    if(shape_mismatch())
      return f::format("shape mismatch: {}x{} vs {}x{}",
                       lhs_shape[0], lhs_shape[1], rhs_shape[0], rhs_shape[1]);
    if(mismatches.empty())
      return f::format("matrices ({}x{}) are equal", lhs_shape[0], lhs_shape[1]);
    std::string s = f::format("{} mismatching entries:", mismatches.size());
    long n = std::min(long(mismatches.size()), max_entries);
    for(long k=0; k<n; ++k) {
      auto const& m = mismatches[k];
      s += f::format("\n  ({},{}): {} != {}", m.row, m.col, m.lhs, m.rhs);
    }
    if(long(mismatches.size()) > n) s += "\n  ...";
    return s;
  }
};

namespace detail
{

// canonical row compressed form, duplicates summed
template<typename M>
auto canonical_csr(M const& a)
{
  if constexpr (SparseMatrix<M>)
    return to_csr(a);
  else
    return to_csr(a, -1.0);  // every dense entry
}

}

/**
 * Entrywise comparison of two matrices in any format (coo, csr, csc or dense).
 * Duplicates in coo matrices are summed. Positions stored in only one
 * of the operands are compared against zero.
 */
template<typename A, typename B, typename Comparator = exact_comparator>
auto compare_matrices(A const& a, B const& b, Comparator cmp = {})
{
  auto ca = detail::canonical_csr(a);
  auto cb = detail::canonical_csr(b);
  using V = std::common_type_t<typename decltype(ca)::value_type, typename decltype(cb)::value_type>;

  matrix_comparison_result<V> res;
  res.lhs_shape = ca.shape();
  res.rhs_shape = cb.shape();
  if(res.shape_mismatch()) return res;

  for(long i=0; i<ca.nrows(); ++i) {
    auto ra = ca.row(i);
    auto rb = cb.row(i);
    auto ja = ra.columns(); auto va = ra.values();
    auto jb = rb.columns(); auto vb = rb.values();
    long p = 0, q = 0;
    while(p < ra.nnz() or q < rb.nnz()) {
      long j;
      V x(0), y(0);
      if(q == rb.nnz() or (p < ra.nnz() and ja(p) < jb(q))) {
        j = ja(p); x = va(p++);
      } else if(p == ra.nnz() or jb(q) < ja(p)) {
        j = jb(q); y = vb(q++);
      } else {
        j = ja(p); x = va(p++); y = vb(q++);
      }
      if(not cmp(x, y))
        res.mismatches.push_back({i, j, x, y});
    }
  }
  return res;
}

}

#endif

#endif
