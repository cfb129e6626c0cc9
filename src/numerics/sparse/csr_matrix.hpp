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


#ifndef SPARSE_CSR_MATRIX_HPP
#define SPARSE_CSR_MATRIX_HPP

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
 * Compressed sparse row matrix.
 * Lanes of the pattern are rows, minor indices are column indices.
 * Rows are sorted and free of duplicates. Explicit zeros may be stored.
 */
template<typename ValType, typename IndxType = int, typename IntType = long>
class csr_matrix : public cs_matrix<ValType, IndxType, IntType>
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
  static constexpr bool is_csr = true;

  // 0x0 matrix
  csr_matrix() : base(pattern_t(), values_t(0)) {}

  // nrows x ncols matrix without stored entries, also reached as csr_matrix({nrows,ncols})
  csr_matrix(long nrows, long ncols) : base(pattern_t::zeros(nrows, ncols), values_t(0)) {}

  ~csr_matrix() = default;
  csr_matrix(csr_matrix const&) = default;
  csr_matrix(csr_matrix&&) = default;
  csr_matrix& operator=(csr_matrix const&) = default;
  csr_matrix& operator=(csr_matrix&&) = default;

  static csr_matrix identity(long n)
  {
    return csr_matrix(pattern_t::identity(n), base::ones_(n));
  }

  /**
   * Builds a matrix from row offsets, column indices and values.
   * Throws sparse_format_error:
   *   index_out_of_bounds - a column index outside the matrix
   *   duplicate_entry     - a repeated column index in a row
   *   invalid_structure   - any other structural problem (offset array, ordering, value count)
   */
  static csr_matrix try_from_csr_data(long nrows, long ncols, offsets_t offsets, indices_t indices, values_t vals)
  {
    auto [p, v] = base::make_storage_(nrows, ncols, std::move(offsets), std::move(indices), std::move(vals));
    return csr_matrix(std::move(p), std::move(v));
  }

  // Same as try_from_csr_data, column indices within a row may be in any order.
  static csr_matrix try_from_unsorted_csr_data(long nrows, long ncols, offsets_t offsets, indices_t indices, values_t vals)
  {
    auto [p, v] = base::make_storage_unsorted_(nrows, ncols, std::move(offsets), std::move(indices), std::move(vals));
    return csr_matrix(std::move(p), std::move(v));
  }

  /**
   * Matrix with a given pattern (rows as lanes) and one value per stored entry.
   * Throws sparse_format_error::invalid_structure on a value count mismatch.
   */
  static csr_matrix try_from_pattern_and_values(pattern_t p, values_t vals)
  {
    return csr_matrix(std::move(p), std::move(vals));
  }

  long nrows() const { return pattern_.major_dim(); }
  long ncols() const { return pattern_.minor_dim(); }
  std::array<long,2> shape() const { return {nrows(), ncols()}; }
  long shape(int d) const { return (d==0 ? nrows() : ncols()); }

  offsets_t const& row_offsets() const { return pattern_.major_offsets(); }
  indices_t const& col_indices() const { return pattern_.minor_indices(); }

  // number of stored entries in row i
  long nnz(long i) const { return pattern_.nnz(i); }

  struct const_row_reference : cs_lane<const ValType, IndxType>
  {
    auto columns() const { return this->indices(); }
  };
  struct row_reference : cs_lane<ValType, IndxType>
  {
    auto columns() const { return this->indices(); }
  };

  const_row_reference row(long i) const { return {base::const_lane(i)}; }
  row_reference row(long i) { return {base::mutable_lane(i)}; }
  row_reference row_mut(long i) { return {base::mutable_lane(i)}; }

  // stored value at (i,j), empty for a structural zero
  std::optional<ValType> get_entry(long i, long j) const
  {
    utils::check_index(i, nrows(), "csr_matrix::get_entry: row");
    utils::check_index(j, ncols(), "csr_matrix::get_entry: column");
    return base::get_entry_(i, j);
  }

  // pointer to the stored value at (i,j), nullptr for a structural zero
  ValType* get_entry_mut(long i, long j)
  {
    utils::check_index(i, nrows(), "csr_matrix::get_entry_mut: row");
    utils::check_index(j, ncols(), "csr_matrix::get_entry_mut: column");
    return base::get_entry_mut_(i, j);
  }

  ValType operator()(long i, long j) const
  {
    utils::check_index(i, nrows(), "csr_matrix: row");
    utils::check_index(j, ncols(), "csr_matrix: column");
    return base::value_or_zero_(i, j);
  }

  // (row, col, value) in storage order
  std::vector<std::tuple<long,long,ValType>> triplets() const
  {
    return base::storage_triplets_();
  }

  // the transposed matrix, in the same format
  csr_matrix transpose() const
  {
    auto [p, v] = base::transpose_storage_();
    return csr_matrix(std::move(p), std::move(v));
  }

  // entries where pred(row, col, value) is true
  template<typename Pred>
  csr_matrix filter(Pred&& pred) const
  {
    auto [p, v] = base::filter_storage_([&](long a, long b, ValType const& x) { return pred(a, b, x); });
    return csr_matrix(std::move(p), std::move(v));
  }

  // entries with row <= col
  csr_matrix upper_triangle() const
  {
    return filter([](long i, long j, ValType const&) { return i <= j; });
  }

  // entries with row >= col
  csr_matrix lower_triangle() const
  {
    return filter([](long i, long j, ValType const&) { return i >= j; });
  }

  // explicitly stored diagonal entries
  csr_matrix diagonal_as_csr() const
  {
    return filter([](long i, long j, ValType const&) { return i == j; });
  }

  // consumes the matrix, returns {row offsets, column indices, values}
  std::tuple<offsets_t, indices_t, values_t> disassemble() &&
  {
    auto [off, idx] = std::move(pattern_).disassemble();
    return {std::move(off), std::move(idx), std::move(values_)};
  }

protected:
  int serialization_code() const override { return 22; }

private:
  csr_matrix(pattern_t p, values_t v) : base(std::move(p), std::move(v)) {}

};

}

#endif
