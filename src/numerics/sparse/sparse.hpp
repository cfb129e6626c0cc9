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


#ifndef SPARSE_SPARSE_HPP
#define SPARSE_SPARSE_HPP

#include "numerics/sparse/sparse_errors.hpp"
#include "numerics/sparse/detail/concepts.hpp"
#include "numerics/sparse/detail/ops_aux.hpp"
#include "numerics/sparse/sparsity_pattern.hpp"
#include "numerics/sparse/coo_matrix.hpp"
#include "numerics/sparse/csr_matrix.hpp"
#include "numerics/sparse/csc_matrix.hpp"
#include "numerics/sparse/convert.hpp"
#include "numerics/sparse/sparse_blas.hpp"
#include "numerics/sparse/operators.hpp"
#include "numerics/sparse/factorization/csc_cholesky.hpp"
#include "numerics/sparse/compare.hpp"
#include "numerics/sparse/testing/generators.hpp"

#endif
