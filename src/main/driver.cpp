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


#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <variant>

#include "configuration.hpp"
#include "utilities/check.hpp"
#include "utilities/Timer.hpp"
#include "IO/AppAbort.hpp"
#include "IO/app_loggers.h"
#include "IO/ptree/ptree_utilities.hpp"
#include "IO/triplet_io.hpp"
#include "nda/nda.hpp"
#include "nda/blas.hpp"

#include "numerics/sparse/sparse.hpp"
#include "numerics/lapack/lu.hpp"
#include "main/driver.h"

namespace driver
{

namespace
{

stored_matrix const& find_matrix(ptree const& pt, matrix_list const& list, std::string const& block)
{
  auto name = io::get_value<std::string>(pt, "matrix", block+": missing matrix name");
  auto it = list.find(name);
  if(it == list.end())
    APP_ABORT("{}: Unknown matrix: {}", block, name);
  return it->second;
}

csr_t as_csr(stored_matrix const& m)
{
  return std::visit([](auto const& a) { return csr_t(math::sparse::to_csr(a)); }, m);
}

double norm2(nda::array<RealType,1> const& v)
{
  return std::sqrt(nda::blas::dot(v, v));
}

}

std::string add_matrix(ptree const& pt, matrix_list& list)
{
  auto name = io::get_value<std::string>(pt, "name", "matrix block: missing name");
  auto file = io::get_value<std::string>(pt, "file", "matrix block: missing file");
  auto format = io::get_option(pt, "format", "csr", {"csr", "csc", "coo"});
  auto base = io::get_value_with_default<int>(pt, "base", 1);
  auto nrows = io::get_value_with_default<long>(pt, "nrows", -1);
  auto ncols = io::get_value_with_default<long>(pt, "ncols", -1);
  utils::check(base == 0 or base == 1, "matrix block: base must be 0 or 1, found {}", base);
  if(list.count(name) > 0)
    app_warning(" matrix block: Replacing existing matrix {}", name);

  auto coo = io::read_triplets<RealType>(file, base, nrows, ncols);
  if(format == "coo")
    list.insert_or_assign(name, stored_matrix(std::move(coo)));
  else if(format == "csr")
    list.insert_or_assign(name, stored_matrix(math::sparse::to_csr(coo)));
  else
    list.insert_or_assign(name, stored_matrix(math::sparse::to_csc(coo)));
  app_log(1, " Matrix {}: {} from {}", name, format, file);
  return name;
}

matrix_summary summarize(stored_matrix const& m)
{
  // duplicates in coo matrices are summed
  auto a = as_csr(m);
  matrix_summary s;
  s.nrows = a.nrows();
  s.ncols = a.ncols();
  s.nnz = a.nnz();
  s.density = (s.nrows*s.ncols > 0 ? double(s.nnz)/double(s.nrows*s.ncols) : 0.0);
  s.symmetric = (s.nrows == s.ncols);
  if(s.symmetric) {
    for(auto const& [i, j, v] : a.triplets())
      if(a(j, i) != v) { s.symmetric = false; break; }
  }
  if(s.nrows > 0) {
    s.min_row_nnz = a.nnz(0);
    s.max_row_nnz = a.nnz(0);
    for(long i=1; i<s.nrows; ++i) {
      s.min_row_nnz = std::min(s.min_row_nnz, a.nnz(i));
      s.max_row_nnz = std::max(s.max_row_nnz, a.nnz(i));
    }
  }
  return s;
}

void info(ptree const& pt, matrix_list const& list)
{
  auto name = io::get_value<std::string>(pt, "matrix", "info block: missing matrix name");
  auto s = summarize(find_matrix(pt, list, "info block"));
  app_log(1, "\n Matrix: {}", name);
  app_log(1, "   shape:         {} x {}", s.nrows, s.ncols);
  app_log(1, "   nnz:           {}", s.nnz);
  app_log(1, "   density:       {:.6e}", s.density);
  app_log(1, "   symmetric:     {}", s.symmetric);
  app_log(1, "   nnz per row:   [{},{}]", s.min_row_nnz, s.max_row_nnz);
}

nda::array<RealType,1> multiply(ptree const& pt, matrix_list const& list)
{
  auto a = as_csr(find_matrix(pt, list, "multiply block"));
  auto xfile = io::get_value<std::string>(pt, "x", "multiply block: missing x");
  auto op = io::get_option(pt, "op", "n", {"n", "t", "h"});
  auto output = io::get_value_with_default<std::string>(pt, "output", "");

  auto x = io::read_vector<RealType>(xfile);
  long ny = (op == "n" ? a.nrows() : a.ncols());
  long nx = (op == "n" ? a.ncols() : a.nrows());
  utils::check(x.extent(0) == nx, "multiply block: x has {} entries, expected {}", x.extent(0), nx);

  auto y = nda::array<RealType,1>::zeros({ny});
  if(op == "n")
    math::sparse::csrmv(1.0, math::sparse::N(a), x, 0.0, y);
  else if(op == "t")
    math::sparse::csrmv(1.0, math::sparse::T(a), x, 0.0, y);
  else
    math::sparse::csrmv(1.0, math::sparse::H(a), x, 0.0, y);
  app_log(1, " multiply: |y| = {:.12e}", norm2(y));

  if(output != "")
    io::write_vector(y, output);
  return y;
}

std::pair<nda::array<RealType,1>, double> solve(ptree const& pt, matrix_list const& list)
{
  auto const& m = find_matrix(pt, list, "solve block");
  auto bfile = io::get_value<std::string>(pt, "b", "solve block: missing b");
  auto method = io::get_option(pt, "method", "cholesky", {"cholesky", "lu"});
  auto output = io::get_value_with_default<std::string>(pt, "output", "");

  auto a = as_csr(m);
  auto b = io::read_vector<RealType>(bfile);
  utils::check(a.nrows() == a.ncols(), "solve block: Matrix must be square, found ({},{})",
               a.nrows(), a.ncols());
  utils::check(b.extent(0) == a.nrows(), "solve block: b has {} entries, expected {}",
               b.extent(0), a.nrows());

  utils::Watch watch;
  watch.start();
  nda::array<RealType,1> x;
  if(method == "cholesky") {
    auto chol = math::sparse::csc_cholesky<RealType>::factor(math::sparse::to_csc(a));
    app_log(2, "   cholesky: nnz(L) = {}", chol.l().nnz());
    x = chol.solve(b);
  } else {
    math::lapack::lu_factorization<RealType> lu(math::sparse::to_dense(a));
    auto sol = lu.solve(b);
    if(not sol)
      APP_ABORT("solve block: Matrix is singular.");
    x = std::move(*sol);
  }
  watch.stop();

  nda::array<RealType,1> r = b - a * x;
  double nb = norm2(b);
  double res = (nb > 0.0 ? norm2(r)/nb : norm2(r));
  app_log(1, " solve ({}): relative residual = {:.6e}, time = {:.3f} s", method, res, watch.elapsed());

  if(output != "")
    io::write_vector(x, output);
  return {std::move(x), res};
}

void run(ptree const& root)
{
  matrix_list list;

  // a block node is either a single block or an array of nameless blocks
  auto for_each_block = [](ptree const& node, auto&& f) {
    if(not node.empty() and node.begin()->first == "")
      for(auto const& it : node) f(it.second);
    else
      f(node);
  };

  // matrices are loaded before any operation
  for(auto const& it : root)
    if(io::tolower_copy(it.first) == "matrix")
      for_each_block(it.second, [&](ptree const& pt) { add_matrix(pt, list); });

  for(auto const& it : root) {
    std::string cname = io::tolower_copy(it.first);
    if(cname == "matrix") {
      continue;
    } else if(cname == "info") {
      for_each_block(it.second, [&](ptree const& pt) { info(pt, list); });
    } else if(cname == "multiply") {
      for_each_block(it.second, [&](ptree const& pt) { multiply(pt, list); });
    } else if(cname == "solve") {
      for_each_block(it.second, [&](ptree const& pt) { solve(pt, list); });
    } else {
      APP_ABORT("Error: Invalid input block: {}", it.first);
    }
  }
}

}
