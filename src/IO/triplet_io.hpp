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


#ifndef IO_TRIPLET_IO_HPP
#define IO_TRIPLET_IO_HPP

#include <algorithm>
#include <fstream>
#include <ios>
#include <limits>
#include <string>
#include <vector>

#include "configuration.hpp"
#include "IO/AppAbort.hpp"
#include "IO/app_loggers.h"
#include "nda/nda.hpp"
#include "numerics/sparse/sparse_errors.hpp"
#include "numerics/sparse/coo_matrix.hpp"

namespace io
{

/*
 * Plain text matrix/vector files.
 *   matrix: one "row col value" triplet per line
 *   vector: one value per line
 * Values are read with operator>>, complex values are written as (re,im).
 */

/**
 * Reads a coo matrix from a triplet file.
 * @param filename - input file
 * @param base - index base of the file, 1 for Fortran style indices
 * @param nrows, ncols - matrix dimensions, negative values are inferred from the largest index
 */
template<typename V = double, typename IndxType = int>
math::sparse::coo_matrix<V,IndxType> read_triplets(std::string const& filename, int base = 1,
                                                   long nrows = -1, long ncols = -1)
{
  std::ifstream file(filename);
  if(not file.is_open())
    APP_ABORT("io::read_triplets: Could not open file {}", filename);

  std::vector<IndxType> rows, cols;
  std::vector<V> vals;
  long row, col;
  V value;
  long max_row = -1, max_col = -1;
  while(file >> row >> col >> value) {
    row -= base;
    col -= base;
    if(row < 0 or col < 0)
      APP_ABORT("io::read_triplets: Negative index ({},{}) in {} with base {}", row, col, filename, base);
    if(row > long(std::numeric_limits<IndxType>::max()) or col > long(std::numeric_limits<IndxType>::max()))
      throw math::sparse::sparse_format_error(math::sparse::sparse_format_error_kind::index_out_of_bounds,
              "index (" + std::to_string(row) + "," + std::to_string(col) + ") in " + filename +
              " does not fit the index type");
    max_row = std::max(max_row, row);
    max_col = std::max(max_col, col);
    rows.emplace_back(IndxType(row));
    cols.emplace_back(IndxType(col));
    vals.emplace_back(value);
  }
  if(not file.eof())
    APP_ABORT("io::read_triplets: Malformed entry after {} triplets in {}", vals.size(), filename);
  if(vals.empty())
    app_warning("io::read_triplets: No data read from {}", filename);

  if(nrows < 0) nrows = max_row + 1;
  if(ncols < 0) ncols = max_col + 1;
  app_log(2, "  Read {} triplets from {}: {}x{}", vals.size(), filename, nrows, ncols);
  return math::sparse::coo_matrix<V,IndxType>::try_from_triplets(nrows, ncols, std::move(rows),
                                                                 std::move(cols), std::move(vals));
}

template<typename V = double>
nda::array<V,1> read_vector(std::string const& filename)
{
  std::ifstream file(filename);
  if(not file.is_open())
    APP_ABORT("io::read_vector: Could not open file {}", filename);

  std::vector<V> values;
  V value;
  while(file >> value)
    values.push_back(value);
  if(not file.eof())
    APP_ABORT("io::read_vector: Malformed entry after {} values in {}", values.size(), filename);
  if(values.empty())
    app_warning("io::read_vector: No data read from {}", filename);

  nda::array<V,1> v(long(values.size()));
  std::copy(values.begin(), values.end(), v.data());
  return v;
}

void write_vector(::nda::ArrayOfRank<1> auto const& v, std::string const& filename)
{
  std::ofstream file(filename);
  if(not file.is_open())
    APP_ABORT("io::write_vector: Could not open file {} for writing", filename);
  file.precision(16);
  file << std::scientific;
  for(long i=0; i<v.extent(0); ++i)
    file << v(i) << "\n";
  app_log(2, "  Wrote {} values to {}", v.extent(0), filename);
}

}

#endif
