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


#ifndef NUMERICS_SPARSE_DETAIL_CONCEPTS_HPP
#define NUMERICS_SPARSE_DETAIL_CONCEPTS_HPP

#include <concepts>
#include <type_traits>
#include "nda/nda.hpp"

namespace math::sparse
{

/*
 * Compressed sparse matrix concept (csr_matrix, csc_matrix)
 */
template <typename A>
concept CompressedMatrix = requires(A const& a) {
  { a.nnz() };
  { a.values() };
  { a.pattern() };
  { a.nrows() };
  { a.ncols() };
  { a.shape() } -> ::nda::StdArrayOfLong;
  { std::decay_t<A>::sparse == true };
  { std::decay_t<A>::rank == 2 };
  { std::decay_t<A>::sorted == true };
};

/*
 * Compressed sparse row matrix concept
 */
template <typename A>
concept CSRMatrix = CompressedMatrix<A> and requires(A const& a) {
  { a.row_offsets() };
  { a.col_indices() };
  { std::decay_t<A>::is_csr == true };
};

/*
 * Compressed sparse column matrix concept
 */
template <typename A>
concept CSCMatrix = CompressedMatrix<A> and requires(A const& a) {
  { a.col_offsets() };
  { a.row_indices() };
  { std::decay_t<A>::is_csc == true };
};

/*
 * Coordinate format matrix concept
 */
template <typename A>
concept COOMatrix = requires(A const& a) {
  { a.nnz() };
  { a.row_indices() };
  { a.col_indices() };
  { a.values() };
  { a.triplets() };
  { a.shape() } -> ::nda::StdArrayOfLong;
  { std::decay_t<A>::sparse == true };
  { std::decay_t<A>::rank == 2 };
} and (not CompressedMatrix<A>);

template <typename A>
concept SparseMatrix = CompressedMatrix<A> or COOMatrix<A>;

}

#endif
