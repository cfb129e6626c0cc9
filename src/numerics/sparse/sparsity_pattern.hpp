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


#ifndef SPARSE_SPARSITY_PATTERN_HPP
#define SPARSE_SPARSITY_PATTERN_HPP

#include <algorithm>
#include <utility>
#include <vector>
#include <string>

#include "configuration.hpp"
#include "utilities/check.hpp"
#include "nda/nda.hpp"

#include "numerics/sparse/sparse_errors.hpp"

namespace math::sparse
{

/**
 * Compressed description of the nonzero structure of a matrix.
 *
 * The pattern is organized in lanes: major_dim() lanes, each holding a
 * strictly increasing list of minor indices in [0, minor_dim()). Lane i
 * occupies minor_indices()[major_offsets()(i) : major_offsets()(i+1)].
 * For CSR storage lanes are rows, for CSC storage lanes are columns.
 *
 * Invariants (enforced by try_from_offsets_and_indices):
 *   - major_offsets().size() == major_dim()+1
 *   - major_offsets()(0) == 0 and major_offsets()(major_dim()) == nnz()
 *   - offsets are nondecreasing
 *   - minor indices within a lane are in bounds and strictly increasing
 */
template<typename IndxType = int, typename IntType = long>
class sparsity_pattern
{
public:

  using index_type = IndxType;
  using int_type = IntType;
  using offsets_t = nda::array<IntType,1>;
  using indices_t = nda::array<IndxType,1>;

  static_assert(std::is_integral_v<IndxType> and std::is_signed_v<IndxType>, "Invalid index type.");
  static_assert(std::is_integral_v<IntType> and std::is_signed_v<IntType>, "Invalid offset type.");

  // 0x0 pattern
  sparsity_pattern() : minor_dim_(0), offsets_(offsets_t::zeros({1})), indices_(0) {}

  sparsity_pattern(sparsity_pattern const&) = default;
  sparsity_pattern(sparsity_pattern &&) = default;
  sparsity_pattern& operator=(sparsity_pattern const&) = default;
  sparsity_pattern& operator=(sparsity_pattern &&) = default;
  ~sparsity_pattern() = default;

  // pattern with no stored entries
  static sparsity_pattern zeros(long major_dim, long minor_dim)
  {
    utils::check(major_dim >= 0 and minor_dim >= 0, "sparsity_pattern::zeros: Invalid dimensions ({},{})",
                 major_dim, minor_dim);
    return sparsity_pattern(minor_dim, offsets_t::zeros({major_dim+1}), indices_t(0));
  }

  // n x n pattern with the diagonal stored
  static sparsity_pattern identity(long n)
  {
    utils::check(n >= 0, "sparsity_pattern::identity: Invalid dimension {}", n);
    offsets_t offsets(n+1);
    indices_t indices(n);
    for(long i=0; i<n; ++i) {
      offsets(i) = IntType(i);
      indices(i) = IndxType(i);
    }
    offsets(n) = IntType(n);
    return sparsity_pattern(n, std::move(offsets), std::move(indices));
  }

  /**
   * Builds a pattern from offsets and minor indices, validating every invariant.
   * Throws sparsity_pattern_error with the first violation found, in this order:
   * offset array length, first/last offset, monotonicity of offsets, and then,
   * lane by lane, index bounds, duplicates and ordering of minor indices.
   */
  static sparsity_pattern try_from_offsets_and_indices(long major_dim, long minor_dim,
                                                       offsets_t offsets, indices_t indices)
  {
    utils::check(major_dim >= 0 and minor_dim >= 0,
                 "sparsity_pattern: Invalid dimensions ({},{})", major_dim, minor_dim);
    if(offsets.extent(0) != major_dim+1)
      throw sparsity_pattern_error(pattern_error_kind::invalid_offset_array_length,
              "expected " + std::to_string(major_dim+1) + " offsets, found " + std::to_string(offsets.extent(0)));
    long nnz = indices.extent(0);
    if(offsets(0) != 0 or offsets(major_dim) != nnz)
      throw sparsity_pattern_error(pattern_error_kind::invalid_offset_first_last,
              "first offset must be 0 and last offset must be nnz=" + std::to_string(nnz));
    for(long i=0; i<major_dim; ++i)
      if(offsets(i+1) < offsets(i))
        throw sparsity_pattern_error(pattern_error_kind::nonmonotonic_offsets,
                "offsets decrease at lane " + std::to_string(i));
    for(long i=0; i<major_dim; ++i) {
      for(long k=offsets(i); k<offsets(i+1); ++k) {
        long j = indices(k);
        if(j < 0 or j >= minor_dim)
          throw sparsity_pattern_error(pattern_error_kind::minor_index_out_of_bounds,
                  "minor index " + std::to_string(j) + " in lane " + std::to_string(i));
        if(k > offsets(i)) {
          long jp = indices(k-1);
          if(j == jp)
            throw sparsity_pattern_error(pattern_error_kind::duplicate_entry,
                    "minor index " + std::to_string(j) + " repeated in lane " + std::to_string(i));
          if(j < jp)
            throw sparsity_pattern_error(pattern_error_kind::nonmonotonic_minor_indices,
                    "minor indices not sorted in lane " + std::to_string(i));
        }
      }
    }
    return sparsity_pattern(minor_dim, std::move(offsets), std::move(indices));
  }

  // Caller guarantees the invariants. Only array sizes are checked.
  static sparsity_pattern from_offsets_and_indices_unchecked(long major_dim, long minor_dim,
                                                             offsets_t offsets, indices_t indices)
  {
    utils::check(offsets.extent(0) == major_dim+1, "sparsity_pattern: Offset array size mismatch.");
    utils::check(offsets(major_dim) == indices.extent(0), "sparsity_pattern: Index array size mismatch.");
    return sparsity_pattern(minor_dim, std::move(offsets), std::move(indices));
  }

  long major_dim() const { return offsets_.extent(0)-1; }
  long minor_dim() const { return minor_dim_; }
  long nnz() const { return indices_.extent(0); }

  offsets_t const& major_offsets() const { return offsets_; }
  indices_t const& minor_indices() const { return indices_; }

  // number of entries in lane i
  long nnz(long i) const
  {
    utils::check_index(i, major_dim(), "sparsity_pattern::nnz: lane");
    return long(offsets_(i+1)-offsets_(i));
  }

  // minor indices of lane i
  auto lane(long i) const
  {
    utils::check_index(i, major_dim(), "sparsity_pattern::lane: lane");
    return indices_(nda::range(long(offsets_(i)),long(offsets_(i+1))));
  }

  /**
   * Position of entry (i,j) in minor_indices(), or -1 when (i,j) is not stored.
   */
  long find(long i, long j) const
  {
    utils::check_index(i, major_dim(), "sparsity_pattern::find: major");
    utils::check_index(j, minor_dim(), "sparsity_pattern::find: minor");
    auto b = indices_.data() + offsets_(i);
    auto e = indices_.data() + offsets_(i+1);
    auto it = std::lower_bound(b, e, IndxType(j));
    if(it != e and long(*it) == j)
      return long(std::distance(indices_.data(), it));
    return -1;
  }

  // (major, minor) pairs in storage order
  std::vector<std::pair<long,long>> entries() const
  {
    std::vector<std::pair<long,long>> res;
    res.reserve(nnz());
    for(long i=0; i<major_dim(); ++i)
      for(long k=offsets_(i); k<offsets_(i+1); ++k)
        res.emplace_back(i, long(indices_(k)));
    return res;
  }

  /**
   * Transposed pattern, together with the permutation perm such that entry n of
   * the result is entry perm(n) of *this. Computed with a counting sort, so
   * minor indices of the result are sorted.
   */
  std::pair<sparsity_pattern, offsets_t> transpose_with_permutation() const
  {
    long nmaj = major_dim();
    long nnz_ = nnz();
    offsets_t t_off = offsets_t::zeros({minor_dim_+1});
    for(long k=0; k<nnz_; ++k)
      t_off(indices_(k)+1)++;
    for(long j=0; j<minor_dim_; ++j)
      t_off(j+1) += t_off(j);
    offsets_t pos(t_off);
    indices_t t_idx(nnz_);
    offsets_t perm(nnz_);
    for(long i=0; i<nmaj; ++i) {
      for(long k=offsets_(i); k<offsets_(i+1); ++k) {
        auto n = pos(indices_(k))++;
        t_idx(n) = IndxType(i);
        perm(n) = IntType(k);
      }
    }
    return {sparsity_pattern(nmaj, std::move(t_off), std::move(t_idx)), std::move(perm)};
  }

  sparsity_pattern transpose() const { return transpose_with_permutation().first; }

  // consumes the pattern, returns {offsets, indices}
  std::pair<offsets_t, indices_t> disassemble() &&
  {
    return {std::move(offsets_), std::move(indices_)};
  }

  bool operator==(sparsity_pattern const& other) const
  {
    return major_dim() == other.major_dim() and minor_dim_ == other.minor_dim_ and
           nnz() == other.nnz() and
           std::equal(offsets_.data(), offsets_.data()+offsets_.extent(0), other.offsets_.data()) and
           std::equal(indices_.data(), indices_.data()+indices_.extent(0), other.indices_.data());
  }

  bool operator!=(sparsity_pattern const& other) const { return not (*this == other); }

private:

  sparsity_pattern(long minor_dim, offsets_t&& offsets, indices_t&& indices) :
    minor_dim_(minor_dim), offsets_(std::move(offsets)), indices_(std::move(indices)) {}

  long minor_dim_;
  offsets_t offsets_;
  indices_t indices_;

};

}

#endif
