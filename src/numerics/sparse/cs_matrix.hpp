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


#ifndef SPARSE_CS_MATRIX_HPP
#define SPARSE_CS_MATRIX_HPP

#include <algorithm>
#include <array>
#include <cstring>
#include <numeric>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "configuration.hpp"
#include "utilities/check.hpp"
#include "utilities/type_traits.hpp"
#include "nda/nda.hpp"

#include "numerics/sparse/sparse_errors.hpp"
#include "numerics/sparse/sparsity_pattern.hpp"

namespace math::sparse
{

/*
 * One lane (row of a CSR matrix, column of a CSC matrix).
 * Holds views into the parent matrix, V is const qualified for read-only lanes.
 */
template<typename V, typename IndxType>
struct cs_lane
{
  static constexpr int rank    = 1;
  static constexpr bool sparse = true;
  static constexpr bool sorted = true;
  using value_type = std::remove_const_t<V>;
  using index_type = IndxType;

  long size_;
  ::nda::array_view<V,1> vals_;
  ::nda::array_view<const IndxType,1> idx_;

  long size() const { return size_; }
  auto shape() const { return std::array<long,1>{size_}; }
  long nnz() const { return idx_.extent(0); }
  auto values() const { return vals_; }
  auto indices() const { return idx_; }

  // value stored at minor index k, empty if k is not stored
  std::optional<value_type> get_entry(long k) const
  {
    utils::check_index(k, size_, "cs_lane::get_entry");
    auto b = idx_.data();
    auto e = idx_.data() + idx_.extent(0);
    auto it = std::lower_bound(b, e, IndxType(k));
    if(it != e and long(*it) == k)
      return vals_(std::distance(b, it));
    return std::nullopt;
  }
};

/**
 * Compressed sparse storage: a sparsity_pattern together with one value per
 * stored entry. Base class of csr_matrix and csc_matrix, which give the
 * major/minor dimensions their row/column meaning.
 */
template<typename ValType, typename IndxType = int, typename IntType = long>
class cs_matrix
{
public:

  using value_type = ValType;
  using index_type = IndxType;
  using int_type = IntType;
  using pattern_t = sparsity_pattern<IndxType,IntType>;
  using offsets_t = typename pattern_t::offsets_t;
  using indices_t = typename pattern_t::indices_t;
  using values_t = ::nda::array<ValType,1>;

  static constexpr bool sparse = true;
  static constexpr int rank    = 2;
  static constexpr bool sorted = true;

  virtual ~cs_matrix() = default;

  pattern_t const& pattern() const { return pattern_; }
  long nnz() const { return pattern_.nnz(); }

  values_t const& values() const { return values_; }
  auto values() { return values_(); }

  /*
   * Binary serialization.
   * Layout: 4 ints {code, sizeof(value), sizeof(index), sizeof(offset)},
   * 3 longs {major_dim, minor_dim, nnz}, offsets, values, indices.
   */
  long size_of_serialized_in_bytes() const
  {
    return 4*sizeof(int) + 3*sizeof(long) + (major_dim()+1)*sizeof(IntType) +
           nnz()*(sizeof(ValType) + sizeof(IndxType));
  }

  void serialize(char* ptr, long sz) const
  {
    long sz_needed = size_of_serialized_in_bytes();
    utils::check(sz >= sz_needed,
                 "Error in cs_matrix::serialize: bytes needed:{}, bytes provided:{}", sz_needed, sz);
    int header[4] = {serialization_code(), int(sizeof(ValType)), int(sizeof(IndxType)), int(sizeof(IntType))};
    long dims[3] = {major_dim(), minor_dim(), nnz()};
    std::memcpy(ptr, header, sizeof(header));
    ptr += sizeof(header);
    std::memcpy(ptr, dims, sizeof(dims));
    ptr += sizeof(dims);
    std::memcpy(ptr, pattern_.major_offsets().data(), (major_dim()+1)*sizeof(IntType));
    ptr += (major_dim()+1)*sizeof(IntType);
    if(nnz() > 0) {
      std::memcpy(ptr, values_.data(), nnz()*sizeof(ValType));
      ptr += nnz()*sizeof(ValType);
      std::memcpy(ptr, pattern_.minor_indices().data(), nnz()*sizeof(IndxType));
    }
  }

  ::nda::array<char,1> serialize() const
  {
    long sz = size_of_serialized_in_bytes();
    ::nda::array<char,1> buff(sz);
    serialize(buff.data(), sz);
    return buff;
  }

  void deserialize(char const* ptr, long sz)
  {
    constexpr long header_sz = 4*sizeof(int) + 3*sizeof(long);
    utils::check(sz >= header_sz, "Error in cs_matrix::deserialize: Buffer too small: {} bytes.", sz);
    int header[4];
    long dims[3];
    std::memcpy(header, ptr, sizeof(header));
    ptr += sizeof(header);
    utils::check(header[0] == serialization_code(),
                 "Error in cs_matrix::deserialize: Format mismatch, found {}, expected {}",
                 header[0], serialization_code());
    utils::check(header[1] == int(sizeof(ValType)) and header[2] == int(sizeof(IndxType)) and
                 header[3] == int(sizeof(IntType)),
                 "Error in cs_matrix::deserialize: Type size mismatch.");
    std::memcpy(dims, ptr, sizeof(dims));
    ptr += sizeof(dims);
    if(dims[0] < 0 or dims[1] < 0 or dims[2] < 0)
      throw sparse_format_error(sparse_format_error_kind::invalid_structure,
              "serialized dimensions (" + std::to_string(dims[0]) + "," + std::to_string(dims[1]) +
              ") with " + std::to_string(dims[2]) + " entries");
    // payload size, in units that cannot overflow before the comparison
    long avail = sz - header_sz;
    if(dims[0] >= avail / long(sizeof(IntType)) or
       dims[2] > (avail - (dims[0]+1)*long(sizeof(IntType))) / long(sizeof(ValType) + sizeof(IndxType)))
      throw sparse_format_error(sparse_format_error_kind::invalid_structure,
              "truncated buffer: " + std::to_string(sz) + " bytes for " + std::to_string(dims[0]) +
              " lanes and " + std::to_string(dims[2]) + " entries");
    offsets_t offsets(dims[0]+1);
    indices_t indices(dims[2]);
    values_t vals(dims[2]);
    std::memcpy(offsets.data(), ptr, (dims[0]+1)*sizeof(IntType));
    ptr += (dims[0]+1)*sizeof(IntType);
    if(dims[2] > 0) {
      std::memcpy(vals.data(), ptr, dims[2]*sizeof(ValType));
      ptr += dims[2]*sizeof(ValType);
      std::memcpy(indices.data(), ptr, dims[2]*sizeof(IndxType));
    }
    pattern_ = pattern_t::try_from_offsets_and_indices(dims[0], dims[1], std::move(offsets), std::move(indices));
    values_ = std::move(vals);
  }

  void deserialize(::nda::ArrayOfRank<1> auto const& buff)
  {
    static_assert(std::is_same_v<::nda::get_value_t<decltype(buff)>,char>, "Type mismatch.");
    utils::check(buff.indexmap().min_stride() == 1, "Error in cs_matrix::deserialize: Stride mismatch.");
    deserialize(buff.data(), buff.extent(0));
  }

protected:

  cs_matrix() = default;
  cs_matrix(cs_matrix const&) = default;
  cs_matrix(cs_matrix &&) = default;
  cs_matrix& operator=(cs_matrix const&) = default;
  cs_matrix& operator=(cs_matrix &&) = default;

  cs_matrix(pattern_t p, values_t v) : pattern_(std::move(p)), values_(std::move(v))
  {
    if(values_.extent(0) != pattern_.nnz())
      throw sparse_format_error(sparse_format_error_kind::invalid_structure,
              "number of values (" + std::to_string(values_.extent(0)) +
              ") does not match number of stored entries (" + std::to_string(pattern_.nnz()) + ")");
  }

  virtual int serialization_code() const = 0;

  long major_dim() const { return pattern_.major_dim(); }
  long minor_dim() const { return pattern_.minor_dim(); }

  auto const_lane(long i) const
  {
    utils::check_index(i, major_dim(), "cs_matrix::lane");
    long b = pattern_.major_offsets()(i);
    long n = pattern_.major_offsets()(i+1) - b;
    return cs_lane<const ValType,IndxType>{minor_dim(),
             ::nda::array_view<const ValType,1>({n}, values_.data()+b),
             ::nda::array_view<const IndxType,1>({n}, pattern_.minor_indices().data()+b)};
  }

  auto mutable_lane(long i)
  {
    utils::check_index(i, major_dim(), "cs_matrix::lane");
    long b = pattern_.major_offsets()(i);
    long n = pattern_.major_offsets()(i+1) - b;
    return cs_lane<ValType,IndxType>{minor_dim(),
             ::nda::array_view<ValType,1>({n}, values_.data()+b),
             ::nda::array_view<const IndxType,1>({n}, pattern_.minor_indices().data()+b)};
  }

  std::optional<ValType> get_entry_(long i, long j) const
  {
    long k = pattern_.find(i, j);
    if(k < 0) return std::nullopt;
    return values_(k);
  }

  ValType* get_entry_mut_(long i, long j)
  {
    long k = pattern_.find(i, j);
    if(k < 0) return nullptr;
    return values_.data() + k;
  }

  ValType value_or_zero_(long i, long j) const
  {
    long k = pattern_.find(i, j);
    return (k < 0 ? ValType(0) : values_(k));
  }

  // {major, minor, value} in storage order
  std::vector<std::tuple<long,long,ValType>> storage_triplets_() const
  {
    std::vector<std::tuple<long,long,ValType>> res;
    res.reserve(nnz());
    auto const& off = pattern_.major_offsets();
    auto const& idx = pattern_.minor_indices();
    for(long i=0; i<major_dim(); ++i)
      for(long k=off(i); k<off(i+1); ++k)
        res.emplace_back(i, long(idx(k)), values_(k));
    return res;
  }

  // storage with major and minor roles exchanged
  std::pair<pattern_t, values_t> transpose_storage_() const
  {
    auto [tp, perm] = pattern_.transpose_with_permutation();
    values_t tv(nnz());
    for(long n=0; n<nnz(); ++n)
      tv(n) = values_(perm(n));
    return {std::move(tp), std::move(tv)};
  }

  // storage restricted to the entries where pred(major, minor, value) is true
  template<typename Pred>
  std::pair<pattern_t, values_t> filter_storage_(Pred&& pred) const
  {
    auto const& off = pattern_.major_offsets();
    auto const& idx = pattern_.minor_indices();
    offsets_t new_off(major_dim()+1);
    std::vector<IndxType> new_idx;
    std::vector<ValType> new_val;
    new_off(0) = 0;
    for(long i=0; i<major_dim(); ++i) {
      for(long k=off(i); k<off(i+1); ++k) {
        if(pred(i, long(idx(k)), values_(k))) {
          new_idx.emplace_back(idx(k));
          new_val.emplace_back(values_(k));
        }
      }
      new_off(i+1) = IntType(new_idx.size());
    }
    indices_t ni(long(new_idx.size()));
    values_t nv(long(new_val.size()));
    std::copy(new_idx.begin(), new_idx.end(), ni.data());
    std::copy(new_val.begin(), new_val.end(), nv.data());
    return {pattern_t::from_offsets_and_indices_unchecked(major_dim(), minor_dim(), std::move(new_off), std::move(ni)),
            std::move(nv)};
  }

  /*
   * Validates raw compressed data. Pattern errors are reported as sparse_format_error.
   */
  static std::pair<pattern_t, values_t> make_storage_(long major, long minor, offsets_t offsets,
                                                      indices_t indices, values_t values)
  {
    if(values.extent(0) != indices.extent(0))
      throw sparse_format_error(sparse_format_error_kind::invalid_structure,
              "number of values and minor indices must agree");
    try {
      auto p = pattern_t::try_from_offsets_and_indices(major, minor, std::move(offsets), std::move(indices));
      return {std::move(p), std::move(values)};
    } catch(sparsity_pattern_error const& e) {
      throw to_format_error(e);
    }
  }

  /*
   * Same as make_storage_, but minor indices inside a lane may come in any order.
   * Each lane is sorted by index, carrying its values along, before validation.
   */
  static std::pair<pattern_t, values_t> make_storage_unsorted_(long major, long minor, offsets_t offsets,
                                                               indices_t indices, values_t values)
  {
    long nnz_ = indices.extent(0);
    if(values.extent(0) != nnz_)
      throw sparse_format_error(sparse_format_error_kind::invalid_structure,
              "number of values and minor indices must agree");
    if(offsets.extent(0) != major+1 or offsets(0) != 0 or offsets(major) != nnz_)
      throw sparse_format_error(sparse_format_error_kind::invalid_structure,
              "invalid offset array");
    for(long i=0; i<major; ++i)
      if(offsets(i+1) < offsets(i))
        throw sparse_format_error(sparse_format_error_kind::invalid_structure,
                "offsets decrease at lane " + std::to_string(i));
    std::vector<long> perm;
    std::vector<IndxType> idx_buff;
    std::vector<ValType> val_buff;
    for(long i=0; i<major; ++i) {
      long b = offsets(i), e = offsets(i+1);
      if(e-b < 2) continue;
      perm.resize(e-b);
      std::iota(perm.begin(), perm.end(), b);
      std::stable_sort(perm.begin(), perm.end(),
                       [&](long x, long y) { return indices(x) < indices(y); });
      idx_buff.clear();
      val_buff.clear();
      for(auto p : perm) {
        idx_buff.emplace_back(indices(p));
        val_buff.emplace_back(values(p));
      }
      std::copy(idx_buff.begin(), idx_buff.end(), indices.data()+b);
      std::copy(val_buff.begin(), val_buff.end(), values.data()+b);
    }
    return make_storage_(major, minor, std::move(offsets), std::move(indices), std::move(values));
  }

  static values_t ones_(long n)
  {
    values_t v(n);
    v() = ValType(1);
    return v;
  }

  pattern_t pattern_;
  values_t values_;

};

}

#endif
