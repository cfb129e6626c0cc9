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


#ifndef MAIN_DRIVER_H
#define MAIN_DRIVER_H

#include <map>
#include <string>
#include <variant>

#include "configuration.hpp"
#include "IO/ptree/ptree_utilities.hpp"
#include "numerics/sparse/coo_matrix.hpp"
#include "numerics/sparse/csr_matrix.hpp"
#include "numerics/sparse/csc_matrix.hpp"

namespace driver
{

using coo_t = math::sparse::coo_matrix<RealType>;
using csr_t = math::sparse::csr_matrix<RealType>;
using csc_t = math::sparse::csc_matrix<RealType>;
using stored_matrix = std::variant<coo_t, csr_t, csc_t>;
using matrix_list = std::map<std::string, stored_matrix>;

/*
 * Input blocks:
 *   matrix:   { name, file, format = csr|csc|coo, base = 1, nrows, ncols }
 *   info:     { matrix }
 *   multiply: { matrix, x, op = n|t|h, output }
 *   solve:    { matrix, b, method = cholesky|lu, output }
 * Every block may appear several times, as repeated keys (json, xml) or as
 * an array of blocks (toml arrays of tables).
 */

// reads a matrix block and stores the matrix in list, returns its name
std::string add_matrix(ptree const& pt, matrix_list& list);

// summary of a stored matrix: shape, nnz, density, symmetry, per-row nnz range
struct matrix_summary
{
  long nrows = 0;
  long ncols = 0;
  long nnz = 0;
  double density = 0.0;
  bool symmetric = false;
  long min_row_nnz = 0;
  long max_row_nnz = 0;
};
matrix_summary summarize(stored_matrix const& m);
void info(ptree const& pt, matrix_list const& list);

// y = op(A) x, returns y
nda::array<RealType,1> multiply(ptree const& pt, matrix_list const& list);

// x such that A x = b, returns x and the relative residual |b - A x| / |b|
std::pair<nda::array<RealType,1>, double> solve(ptree const& pt, matrix_list const& list);

// runs every block of the input tree in order
void run(ptree const& root);

}

#endif
