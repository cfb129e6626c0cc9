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


#ifndef SPARSE_SPARSE_ERRORS_HPP
#define SPARSE_SPARSE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace math::sparse
{

/*
 * Documented, recoverable failures of the sparse module.
 * Precondition violations (shape mismatch, bad element index) are not
 * reported here, they go through utils::check.
 */

enum class pattern_error_kind
{
  invalid_offset_array_length,
  invalid_offset_first_last,
  nonmonotonic_offsets,
  minor_index_out_of_bounds,
  duplicate_entry,
  nonmonotonic_minor_indices
};

enum class sparse_format_error_kind
{
  invalid_structure,
  index_out_of_bounds,
  duplicate_entry
};

enum class operation_error_kind
{
  invalid_pattern
};

enum class cholesky_error_kind
{
  not_positive_definite
};

inline std::string_view to_string(pattern_error_kind k)
{
  switch(k) {
    case pattern_error_kind::invalid_offset_array_length: return "invalid_offset_array_length";
    case pattern_error_kind::invalid_offset_first_last: return "invalid_offset_first_last";
    case pattern_error_kind::nonmonotonic_offsets: return "nonmonotonic_offsets";
    case pattern_error_kind::minor_index_out_of_bounds: return "minor_index_out_of_bounds";
    case pattern_error_kind::duplicate_entry: return "duplicate_entry";
    case pattern_error_kind::nonmonotonic_minor_indices: return "nonmonotonic_minor_indices";
  }
  return "unknown";
}

inline std::string_view to_string(sparse_format_error_kind k)
{
  switch(k) {
    case sparse_format_error_kind::invalid_structure: return "invalid_structure";
    case sparse_format_error_kind::index_out_of_bounds: return "index_out_of_bounds";
    case sparse_format_error_kind::duplicate_entry: return "duplicate_entry";
  }
  return "unknown";
}

inline std::string_view to_string(operation_error_kind k)
{
  switch(k) {
    case operation_error_kind::invalid_pattern: return "invalid_pattern";
  }
  return "unknown";
}

inline std::string_view to_string(cholesky_error_kind k)
{
  switch(k) {
    case cholesky_error_kind::not_positive_definite: return "not_positive_definite";
  }
  return "unknown";
}

/**
 * Exception carrying a machine readable kind and a human readable message.
 */
template<typename Kind>
class kinded_error : public std::runtime_error
{
public:
  kinded_error(Kind k, std::string const& msg) :
    std::runtime_error(std::string(to_string(k)) + ": " + msg), kind_(k) {}

  Kind kind() const noexcept { return kind_; }

private:
  Kind kind_;
};

using sparsity_pattern_error = kinded_error<pattern_error_kind>;
using sparse_format_error = kinded_error<sparse_format_error_kind>;
using operation_error = kinded_error<operation_error_kind>;
using cholesky_error = kinded_error<cholesky_error_kind>;

/*
 * Pattern errors seen through a matrix constructor.
 */
inline sparse_format_error to_format_error(sparsity_pattern_error const& e)
{
  switch(e.kind()) {
    case pattern_error_kind::minor_index_out_of_bounds:
      return sparse_format_error(sparse_format_error_kind::index_out_of_bounds, e.what());
    case pattern_error_kind::duplicate_entry:
      return sparse_format_error(sparse_format_error_kind::duplicate_entry, e.what());
    default:
      return sparse_format_error(sparse_format_error_kind::invalid_structure, e.what());
  }
}

}

#endif
