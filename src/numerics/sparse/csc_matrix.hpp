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


#ifndef SPARSE_CSC_MATRIX_HPP
#define SPARSE_CSC_MATRIX_HPP

#include <array>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

#include "configuration.hpp"
#include "utilities/check.hpp"
#include "nda/nda.hpp"

#include "numerics/sparse/sparse_errors.hpp"
#include "numerics/sparse/sparsity_pattern.hpp"
#include "numerics/sparse/cs_matrix.hpp"

namespace math::sparse
{

/**
 * Compressed sparse column matrix.
 * Lanes of the pattern are columns, minor indices are row indices.
 * Columns are sorted and free of duplicates. Explicit zeros may be stored.
 */
template<typename ValType, typename IndxType = int, typename IntType = long>
class csc_matrix : public cs_matrix<ValType, IndxType, IntType>
{
  using base = cs_matrix<ValType, IndxType, IntType>;
  using base::pattern_;
  using base::values_;

public:

  using value_type = ValType;
  using index_type = IndxType;
  using int_type   = IntType;
  using typename base::pattern_t;
  using typename base::offsets_t;
  using typename base::indices_t;
  using typename base::values_t;

  using base::pattern;
  using base::nnz;
  using base::values;
  using base::serialize;
  using base::deserialize;
  using base::size_of_serialized_in_bytes;

  static constexpr bool sparse        = true;
  static constexpr int rank           = 2;
  static constexpr bool sorted        = true;
  static constexpr bool is_csc = true;

  // 0x0 matrix
  csc_matrix() : base(pattern_t(), values_t(0)) {}

  // nrows x ncols matrix without stored entries, also reached as csc_matrix({nrows,ncols})
  csc_matrix(long nrows, long ncols) : base(pattern_t::zeros(ncols, nrows), values_t(0)) {}

  ~csc_matrix() = default;
  csc_matrix(csc_matrix const&) = default;
  csc_matrix(csc_matrix&&) = default;
  csc_matrix& operator=(csc_matrix const&) = default;
  csc_matrix& operator=(csc_matrix&&) = default;

  static csc_matrix identity(long n)
  {
    return csc_matrix(pattern_t::identity(n), base::ones_(n));
  }

  /**
   * Builds a matrix from column offsets, row indices and values.
   * Throws sparse_format_error:
   *   index_out_of_bounds - a row index outside the matrix
   *   duplicate_entry     - a repeated row index in a column
   *   invalid_structure   - any other structural problem (offset array, ordering, value count)
   */
  static csc_matrix try_from_csc_data(long nrows, long ncols, offsets_t offsets, indices_t indices, values_t vals)
  {
    auto [p, v] = base::make_storage_(ncols, nrows, std::move(offsets), std::move(indices), std::move(vals));
    return csc_matrix(std::move(p), std::move(v));
  }

  // Same as try_from_csc_data, row indices within a column may be in any order.
  static csc_matrix try_from_unsorted_csc_data(long nrows, long ncols, offsets_t offsets, indices_t indices, values_t vals)
  {
    auto [p, v] = base::make_storage_unsorted_(ncols, nrows, std::move(offsets), std::move(indices), std::move(vals));
    return csc_matrix(std::move(p), std::move(v));
  }

  /**
   * Matrix with a given pattern (columns as lanes) and one value per stored entry.
   * Throws sparse_format_error::invalid_structure on a value count mismatch.
   */
  static csc_matrix try_from_pattern_and_values(pattern_t p, values_t vals)
  {
    return csc_matrix(std::move(p), std::move(vals));
  }

  long nrows() const { return pattern_.minor_dim(); }
  long ncols() const { return pattern_.major_dim(); }
  std::array<long,2> shape() const { return {nrows(), ncols()}; }
  long shape(int d) const { return (d==0 ? nrows() : ncols()); }

  offsets_t const& col_offsets() const { return pattern_.major_offsets(); }
  indices_t const& row_indices() const { return pattern_.minor_indices(); }

  // number of stored entries in column i
  long nnz(long i) const { return pattern_.nnz(i); }

  struct const_col_reference : cs_lane<const ValType, IndxType>
  {
    auto rows() const { return this->indices(); }
  };
  struct col_reference : cs_lane<ValType, IndxType>
  {
    auto rows() const { return this->indices(); }
  };

  const_col_reference col(long i) const { return {base::const_lane(i)}; }
  col_reference col(long i) { return {base::mutable_lane(i)}; }
  col_reference col_mut(long i) { return {base::mutable_lane(i)}; }

  // stored value at (i,j), empty for a structural zero
  std::optional<ValType> get_entry(long i, long j) const
  {
    utils::check_index(i, nrows(), "csc_matrix::get_entry: row");
    utils::check_index(j, ncols(), "csc_matrix::get_entry: column");
    return base::get_entry_(j, i);
  }

  // pointer to the stored value at (i,j), nullptr for a structural zero
  ValType* get_entry_mut(long i, long j)
  {
    utils::check_index(i, nrows(), "csc_matrix::get_entry_mut: row");
    utils::check_index(j, ncols(), "csc_matrix::get_entry_mut: column");
    return base::get_entry_mut_(j, i);
  }

  ValType operator()(long i, long j) const
  {
    utils::check_index(i, nrows(), "csc_matrix: row");
    utils::check_index(j, ncols(), "csc_matrix: column");
    return base::value_or_zero_(j, i);
  }

  // (row, col, value) in storage order
  std::vector<std::tuple<long,long,ValType>> triplets() const
  {
    auto t = base::storage_triplets_();
    for(auto& [a, b, v] : t) std::swap(a, b);
    return t;
  }

  // the transposed matrix, in the same format
  csc_matrix transpose() const
  {
    auto [p, v] = base::transpose_storage_();
    return csc_matrix(std::move(p), std::move(v));
  }

  // entries where pred(row, col, value) is true
  template<typename Pred>
  csc_matrix filter(Pred&& pred) const
  {
    auto [p, v] = base::filter_storage_([&](long a, long b, ValType const& x) { return pred(b, a, x); });
    return csc_matrix(std::move(p), std::move(v));
  }

  // entries with row <= col
  csc_matrix upper_triangle() const
  {
    return filter([](long i, long j, ValType const&) { return i <= j; });
  }

  // entries with row >= col
  csc_matrix lower_triangle() const
  {
    return filter([](long i, long j, ValType const&) { return i >= j; });
  }

  // explicitly stored diagonal entries
  csc_matrix diagonal_as_csc() const
  {
    return filter([](long i, long j, ValType const&) { return i == j; });
  }

  // consumes the matrix, returns {column offsets, row indices, values}
  std::tuple<offsets_t, indices_t, values_t> disassemble() &&
  {
    auto [off, idx] = std::move(pattern_).disassemble();
    return {std::move(off), std::move(idx), std::move(values_)};
  }

protected:
  int serialization_code() const override { return 32; }

private:
  csc_matrix(pattern_t p, values_t v) : base(std::move(p), std::move(v)) {}

};

}

#endif
