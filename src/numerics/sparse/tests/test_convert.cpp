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


#undef NDEBUG

#include <complex>
#include <random>

#include "catch2/catch.hpp"

#include "nda/nda.hpp"
#include "utilities/test_common.hpp"

#include "numerics/sparse/sparse.hpp"

namespace spnda_tests
{

using math::sparse::to_coo;
using math::sparse::to_csr;
using math::sparse::to_csc;
using math::sparse::to_dense;

template<typename Type, typename IndxType, typename IntType>
void test_convert_dense()
{
  long m = 13, n = 7;
  auto A = utils::make_random_sparse<Type>(m, n, 0.3, 11);

  auto a_coo = to_coo<IndxType>(A);
  auto a_csr = to_csr<IndxType,IntType>(A);
  auto a_csc = to_csc<IndxType,IntType>(A);

  long nnz = 0;
  for(long i=0; i<m; ++i)
    for(long j=0; j<n; ++j)
      if(A(i,j) != Type(0)) ++nnz;
  REQUIRE(a_coo.nnz() == nnz);
  REQUIRE(a_csr.nnz() == nnz);
  REQUIRE(a_csc.nnz() == nnz);

  utils::ARRAY_EQUAL(to_dense(a_coo), A);
  utils::ARRAY_EQUAL(to_dense(a_csr), A);
  utils::ARRAY_EQUAL(to_dense(a_csc), A);

  // cutoff drops small entries
  auto a_cut = to_csr<IndxType,IntType>(A, 0.5);
  for(auto const& [i, j, v] : a_cut.triplets())
    REQUIRE(std::abs(v) > 0.5);
  for(long i=0; i<m; ++i)
    for(long j=0; j<n; ++j)
      if(std::abs(A(i,j)) > 0.5) REQUIRE(a_cut.get_entry(i,j).has_value());
}

template<typename Type, typename IndxType, typename IntType>
void test_convert_formats()
{
  long m = 9, n = 11;
  auto A = utils::make_random_sparse<Type>(m, n, 0.4, 3);
  auto a_csr = to_csr<IndxType,IntType>(A);
  auto a_csc = to_csc<IndxType,IntType>(A);

  // csr <-> csc
  auto b_csc = to_csc(a_csr);
  auto b_csr = to_csr(a_csc);
  REQUIRE(b_csc.pattern() == a_csc.pattern());
  REQUIRE((b_csc.values() == a_csc.values()));
  REQUIRE(b_csr.pattern() == a_csr.pattern());
  REQUIRE((b_csr.values() == a_csr.values()));

  // compressed -> coo keeps the stored entries
  auto c = to_coo(a_csc);
  REQUIRE(c.nnz() == a_csc.nnz());
  utils::ARRAY_EQUAL(to_dense(c), A);

  // identity conversions
  REQUIRE(to_csr(a_csr).pattern() == a_csr.pattern());
  REQUIRE(to_csc(a_csc).pattern() == a_csc.pattern());
}

template<typename Type, typename IndxType>
void test_convert_coo_duplicates()
{
  // (1,2) three times, (0,0) stored zero, unsorted input
  math::sparse::coo_matrix<Type,IndxType> coo(3, 4);
  coo.push(1, 2, Type(1.0));
  coo.push(2, 0, Type(5.0));
  coo.push(1, 2, Type(2.0));
  coo.push(0, 0, Type(0.0));
  coo.push(1, 0, Type(-1.0));
  coo.push(1, 2, Type(3.0));

  auto a = to_csr(coo);
  REQUIRE(a.nnz() == 4);
  REQUIRE(a(1,2) == Type(6.0));
  REQUIRE(a.get_entry(0,0).has_value());
  REQUIRE(a.col_indices()(1) == 0);
  REQUIRE(a.col_indices()(2) == 2);

  auto b = to_csc(coo);
  REQUIRE(b.nnz() == 4);
  REQUIRE(b(1,2) == Type(6.0));
  REQUIRE(b(2,0) == Type(5.0));
  REQUIRE(b.get_entry(0,0).has_value());
  nda::array<IndxType,1> rows_ref = {0, 1, 2, 1};
  REQUIRE((b.row_indices() == rows_ref));

  // entries that cancel stay in the pattern
  coo.push(2, 0, Type(-5.0));
  auto c = to_csr(coo);
  REQUIRE(c.nnz() == 4);
  REQUIRE(c.get_entry(2,0).has_value());
  REQUIRE(*c.get_entry(2,0) == Type(0.0));

  auto A = to_dense(coo);
  REQUIRE(A(1,2) == Type(6.0));
  REQUIRE(A(2,0) == Type(0.0));

  // empty and degenerate shapes
  math::sparse::coo_matrix<Type,IndxType> e(0, 5);
  REQUIRE(to_csr(e).nrows() == 0);
  REQUIRE(to_csc(e).ncols() == 5);
  REQUIRE(to_dense(e).shape() == std::array<long,2>{0,5});
}

TEST_CASE("convert_dense", "[sparse][convert]")
{
  test_convert_dense<double, int, long>();
  test_convert_dense<std::complex<double>, long, long>();
  test_convert_dense<float, int, int>();
}

TEST_CASE("convert_formats", "[sparse][convert]")
{
  test_convert_formats<double, int, long>();
  test_convert_formats<std::complex<double>, int, int>();
}

TEST_CASE("convert_coo_duplicates", "[sparse][convert]")
{
  test_convert_coo_duplicates<double, int>();
  test_convert_coo_duplicates<std::complex<double>, long>();
}

} // spnda_tests
