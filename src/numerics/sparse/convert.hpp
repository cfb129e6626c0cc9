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


#ifndef SPARSE_CONVERT_HPP
#define SPARSE_CONVERT_HPP

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>
#include <vector>

#include "configuration.hpp"
#include "utilities/check.hpp"
#include "IO/app_loggers.h"

#include "nda/nda.hpp"

#include "numerics/sparse/detail/concepts.hpp"
#include "numerics/sparse/sparsity_pattern.hpp"
#include "numerics/sparse/coo_matrix.hpp"
#include "numerics/sparse/csr_matrix.hpp"
#include "numerics/sparse/csc_matrix.hpp"

namespace math::sparse
{

namespace detail
{

/*
 * Compressed storage from triplets (major, minor, value).
 * Entries are bucketed by major index, sorted by minor index within each lane
 * and duplicates are summed. Explicit zeros are kept.
 */
template<typename ValType, typename IndxType, typename IntType>
auto triplets_to_storage(long major_dim, long minor_dim,
                         std::vector<IndxType> const& major,
                         std::vector<IndxType> const& minor,
                         std::vector<ValType> const& vals)
{
  using pattern_t = sparsity_pattern<IndxType,IntType>;
  long nnz = long(vals.size());

  // counting sort on the major index
  std::vector<long> count(major_dim+1, 0);
  for(long n=0; n<nnz; ++n) count[major[n]+1]++;
  for(long i=0; i<major_dim; ++i) count[i+1] += count[i];
  std::vector<long> order(nnz);
  {
    std::vector<long> pos(count.begin(), count.end()-1);
    for(long n=0; n<nnz; ++n) order[pos[major[n]]++] = n;
  }

  typename pattern_t::offsets_t offsets(major_dim+1);
  std::vector<IndxType> idx;
  std::vector<ValType> val;
  idx.reserve(nnz);
  val.reserve(nnz);
  offsets(0) = 0;
  for(long i=0; i<major_dim; ++i) {
    auto b = order.begin()+count[i];
    auto e = order.begin()+count[i+1];
    std::stable_sort(b, e, [&](long x, long y) { return minor[x] < minor[y]; });
    for(auto it=b; it!=e; ++it) {
      if(it != b and minor[*it] == idx.back())
        val.back() += vals[*it];
      else {
        idx.emplace_back(minor[*it]);
        val.emplace_back(vals[*it]);
      }
    }
    offsets(i+1) = IntType(idx.size());
  }
  typename pattern_t::indices_t indices(long(idx.size()));
  ::nda::array<ValType,1> values(long(val.size()));
  std::copy(idx.begin(), idx.end(), indices.data());
  std::copy(val.begin(), val.end(), values.data());
  return std::make_pair(pattern_t::from_offsets_and_indices_unchecked(major_dim, minor_dim,
                                                                     std::move(offsets), std::move(indices)),
                        std::move(values));
}

template<typename V>
double magnitude(V const& v)
{
  return double(std::abs(v));
}

}

/***************************************************************************/
/*                              to_coo                                     */
/***************************************************************************/

// entries of A with |A(i,j)| > vcut
template<typename IndxType = int>
auto to_coo(::nda::ArrayOfRank<2> auto const& A, double vcut = 0.0)
{
  using value_type = typename ::nda::get_value_t<decltype(A)>;
  long nr = A.extent(0);
  long nc = A.extent(1);
  coo_matrix<value_type,IndxType> coo(nr, nc);
  for(long r=0; r<nr; ++r)
    for(long c=0; c<nc; ++c)
      if(detail::magnitude(A(r,c)) > vcut)
        coo.push(r, c, A(r,c));
  return coo;
}

// explicitly stored entries, in storage order
template<CompressedMatrix M>
auto to_coo(M const& a)
{
  coo_matrix<typename M::value_type, typename M::index_type> coo(a.nrows(), a.ncols());
  coo.reserve(a.nnz());
  for(auto const& [i, j, v] : a.triplets())
    coo.push(i, j, v);
  return coo;
}

/***************************************************************************/
/*                              to_csr / to_csc                            */
/***************************************************************************/

/**
 * CSR matrix from a COO matrix. Duplicates are summed, explicit zeros
 * (stored or resulting from the sum) are kept in the pattern.
 */
template<typename IntType = long, typename ValType, typename IndxType>
auto to_csr(coo_matrix<ValType,IndxType> const& coo)
{
  auto [p, v] = detail::triplets_to_storage<ValType,IndxType,IntType>(coo.nrows(), coo.ncols(),
                   coo.row_indices(), coo.col_indices(), coo.values());
  return csr_matrix<ValType,IndxType,IntType>::try_from_pattern_and_values(std::move(p), std::move(v));
}

/**
 * CSC matrix from a COO matrix. Duplicates are summed, explicit zeros are kept.
 */
template<typename IntType = long, typename ValType, typename IndxType>
auto to_csc(coo_matrix<ValType,IndxType> const& coo)
{
  auto [p, v] = detail::triplets_to_storage<ValType,IndxType,IntType>(coo.ncols(), coo.nrows(),
                   coo.col_indices(), coo.row_indices(), coo.values());
  return csc_matrix<ValType,IndxType,IntType>::try_from_pattern_and_values(std::move(p), std::move(v));
}

// same entries, row compressed
template<typename ValType, typename IndxType, typename IntType>
auto to_csr(csc_matrix<ValType,IndxType,IntType> const& csc)
{
  // storage of (A^T in CSC) is the CSR storage of A
  auto [off, idx, val] = csc.transpose().disassemble();
  auto p = sparsity_pattern<IndxType,IntType>::from_offsets_and_indices_unchecked(
              csc.nrows(), csc.ncols(), std::move(off), std::move(idx));
  return csr_matrix<ValType,IndxType,IntType>::try_from_pattern_and_values(std::move(p), std::move(val));
}

// same entries, column compressed
template<typename ValType, typename IndxType, typename IntType>
auto to_csc(csr_matrix<ValType,IndxType,IntType> const& csr)
{
  auto [off, idx, val] = csr.transpose().disassemble();
  auto p = sparsity_pattern<IndxType,IntType>::from_offsets_and_indices_unchecked(
              csr.ncols(), csr.nrows(), std::move(off), std::move(idx));
  return csc_matrix<ValType,IndxType,IntType>::try_from_pattern_and_values(std::move(p), std::move(val));
}

template<typename ValType, typename IndxType, typename IntType>
auto to_csr(csr_matrix<ValType,IndxType,IntType> const& csr) { return csr; }

template<typename ValType, typename IndxType, typename IntType>
auto to_csc(csc_matrix<ValType,IndxType,IntType> const& csc) { return csc; }

/**
 * CSR matrix with the entries of A satisfying |A(i,j)| > vcut.
 */
template<typename IndxType = int, typename IntType = long>
auto to_csr(::nda::ArrayOfRank<2> auto const& A, double vcut = 0.0)
{
  using value_type = typename ::nda::get_value_t<decltype(A)>;
  long nr = A.extent(0);
  long nc = A.extent(1);
  typename sparsity_pattern<IndxType,IntType>::offsets_t offsets(nr+1);
  std::vector<IndxType> idx;
  std::vector<value_type> val;
  offsets(0) = 0;
  for(long r=0; r<nr; ++r) {
    for(long c=0; c<nc; ++c) {
      if(detail::magnitude(A(r,c)) > vcut) {
        idx.emplace_back(IndxType(c));
        val.emplace_back(A(r,c));
      }
    }
    offsets(r+1) = IntType(idx.size());
  }
  typename sparsity_pattern<IndxType,IntType>::indices_t indices(long(idx.size()));
  ::nda::array<value_type,1> values(long(val.size()));
  std::copy(idx.begin(), idx.end(), indices.data());
  std::copy(val.begin(), val.end(), values.data());
  auto p = sparsity_pattern<IndxType,IntType>::from_offsets_and_indices_unchecked(nr, nc,
             std::move(offsets), std::move(indices));
  return csr_matrix<value_type,IndxType,IntType>::try_from_pattern_and_values(std::move(p), std::move(values));
}

/**
 * CSC matrix with the entries of A satisfying |A(i,j)| > vcut.
 */
template<typename IndxType = int, typename IntType = long>
auto to_csc(::nda::ArrayOfRank<2> auto const& A, double vcut = 0.0)
{
  return to_csc(to_csr<IndxType,IntType>(A, vcut));
}

/***************************************************************************/
/*                              to_dense                                   */
/***************************************************************************/

// dense matrix, duplicates summed
template<typename ValType, typename IndxType>
auto to_dense(coo_matrix<ValType,IndxType> const& coo)
{
  auto A = ::nda::matrix<ValType>::zeros({coo.nrows(), coo.ncols()});
  auto const& r = coo.row_indices();
  auto const& c = coo.col_indices();
  auto const& v = coo.values();
  for(std::size_t n=0; n<v.size(); ++n)
    A(r[n], c[n]) += v[n];
  return A;
}

template<CompressedMatrix M>
auto to_dense(M const& a)
{
  auto A = ::nda::matrix<typename M::value_type>::zeros({a.nrows(), a.ncols()});
  for(auto const& [i, j, v] : a.triplets())
    A(i, j) = v;
  return A;
}

} // math::sparse

#endif
