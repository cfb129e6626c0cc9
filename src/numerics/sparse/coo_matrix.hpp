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


#ifndef SPARSE_COO_MATRIX_HPP
#define SPARSE_COO_MATRIX_HPP

#include <array>
#include <vector>
#include <tuple>
#include <string>
#include <utility>

#include "configuration.hpp"
#include "utilities/check.hpp"
#include "nda/nda.hpp"

#include "numerics/sparse/sparse_errors.hpp"

namespace math::sparse
{

/**
 * Matrix in coordinate format: an unordered list of (row, col, value) triplets.
 *
 * Duplicate coordinates are allowed, the represented entry is the sum of all
 * triplets at that coordinate. Explicitly stored zeros are kept.
 * Meant for assembly, convert to csr_matrix/csc_matrix for arithmetic.
 */
template<typename ValType, typename IndxType = int>
class coo_matrix
{
public:

  using value_type = ValType;
  using index_type = IndxType;
  static constexpr bool sparse = true;
  static constexpr int rank = 2;

  coo_matrix() : nrows_(0), ncols_(0) {}

  coo_matrix(long nrows, long ncols) : nrows_(nrows), ncols_(ncols)
  {
    utils::check(nrows >= 0 and ncols >= 0, "coo_matrix: Invalid dimensions ({},{})", nrows, ncols);
  }

  coo_matrix(coo_matrix const&) = default;
  coo_matrix(coo_matrix &&) = default;
  coo_matrix& operator=(coo_matrix const&) = default;
  coo_matrix& operator=(coo_matrix &&) = default;
  ~coo_matrix() = default;

  /**
   * Builds a matrix from parallel arrays of row indices, column indices and values.
   * Throws sparse_format_error:
   *   invalid_structure   - arrays of different length
   *   index_out_of_bounds - a row or column index outside the matrix
   */
  static coo_matrix try_from_triplets(long nrows, long ncols,
                                      std::vector<IndxType> rows,
                                      std::vector<IndxType> cols,
                                      std::vector<ValType> vals)
  {
    if(rows.size() != cols.size() or rows.size() != vals.size())
      throw sparse_format_error(sparse_format_error_kind::invalid_structure,
              "coo_matrix: number of row indices, column indices and values must agree");
    for(std::size_t n=0; n<rows.size(); ++n) {
      if(rows[n] < 0 or long(rows[n]) >= nrows or cols[n] < 0 or long(cols[n]) >= ncols)
        throw sparse_format_error(sparse_format_error_kind::index_out_of_bounds,
                "coo_matrix: entry (" + std::to_string(rows[n]) + "," + std::to_string(cols[n]) +
                ") outside of " + std::to_string(nrows) + "x" + std::to_string(ncols));
    }
    coo_matrix m(nrows, ncols);
    m.rows_ = std::move(rows);
    m.cols_ = std::move(cols);
    m.vals_ = std::move(vals);
    return m;
  }

  // nda overload
  template<::nda::ArrayOfRank<1> R, ::nda::ArrayOfRank<1> C, ::nda::ArrayOfRank<1> V>
  static coo_matrix try_from_triplets(long nrows, long ncols, R const& rows, C const& cols, V const& vals)
  {
    std::vector<IndxType> r(rows.begin(), rows.end());
    std::vector<IndxType> c(cols.begin(), cols.end());
    std::vector<ValType> v(vals.begin(), vals.end());
    return try_from_triplets(nrows, ncols, std::move(r), std::move(c), std::move(v));
  }

  // appends a triplet, (i,j) must lie inside the matrix
  void push(long i, long j, ValType v)
  {
    utils::check(i >= 0 and i < nrows_ and j >= 0 and j < ncols_,
                 "coo_matrix::push: entry ({},{}) outside of {}x{}", i, j, nrows_, ncols_);
    rows_.emplace_back(IndxType(i));
    cols_.emplace_back(IndxType(j));
    vals_.emplace_back(v);
  }

  void reserve(long n)
  {
    rows_.reserve(n);
    cols_.reserve(n);
    vals_.reserve(n);
  }

  // removes all triplets, keeps the shape
  void clear()
  {
    rows_.clear();
    cols_.clear();
    vals_.clear();
  }

  long nrows() const { return nrows_; }
  long ncols() const { return ncols_; }
  std::array<long,2> shape() const { return {nrows_, ncols_}; }
  long shape(int d) const { return (d==0 ? nrows_ : ncols_); }
  // number of stored triplets, duplicates included
  long nnz() const { return long(vals_.size()); }

  std::vector<IndxType> const& row_indices() const { return rows_; }
  std::vector<IndxType> const& col_indices() const { return cols_; }
  std::vector<ValType> const& values() const { return vals_; }
  std::vector<ValType>& values() { return vals_; }

  std::vector<std::tuple<long,long,ValType>> triplets() const
  {
    std::vector<std::tuple<long,long,ValType>> res;
    res.reserve(vals_.size());
    for(std::size_t n=0; n<vals_.size(); ++n)
      res.emplace_back(long(rows_[n]), long(cols_[n]), vals_[n]);
    return res;
  }

  // consumes the matrix, returns {rows, cols, values}
  std::tuple<std::vector<IndxType>, std::vector<IndxType>, std::vector<ValType>> disassemble() &&
  {
    return {std::move(rows_), std::move(cols_), std::move(vals_)};
  }

private:

  long nrows_;
  long ncols_;
  std::vector<IndxType> rows_;
  std::vector<IndxType> cols_;
  std::vector<ValType> vals_;

};

}

#endif
