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
#include <vector>

#include "catch2/catch.hpp"

#include "nda/nda.hpp"
#include "utilities/test_common.hpp"

#include "numerics/sparse/sparse.hpp"

namespace spnda_tests
{

using math::sparse::csc_matrix;
using math::sparse::sparse_format_error;
using math::sparse::sparse_format_error_kind;

/*
 * 3x4 reference matrix, stored by columns
 *   1 . 2 .
 *   . . . .
 *   . 3 0 4     (explicit zero at (2,2))
 */
template<typename Type, typename IndxType, typename IntType>
auto make_reference_csc()
{
  nda::array<IntType,1> off = {0, 1, 2, 4, 5};
  nda::array<IndxType,1> idx = {0, 2, 0, 2, 2};
  nda::array<Type,1> val = {Type(1.0), Type(3.0), Type(2.0), Type(0.0), Type(4.0)};
  return csc_matrix<Type,IndxType,IntType>::try_from_csc_data(3, 4, off, idx, val);
}

template<typename Type, typename IndxType, typename IntType>
void test_csc_construction()
{
  using csc_t = csc_matrix<Type,IndxType,IntType>;
  {
    csc_t a(3,5);
    REQUIRE(a.nrows() == 3);
    REQUIRE(a.ncols() == 5);
    REQUIRE(a.col_offsets().extent(0) == 6);
    REQUIRE(a.nnz() == 0);
    csc_t b({3,5});
    REQUIRE(b.shape() == a.shape());
    REQUIRE(b.pattern() == a.pattern());
  }
  {
    auto a = make_reference_csc<Type,IndxType,IntType>();
    REQUIRE(a.shape() == std::array<long,2>{3,4});
    REQUIRE(a.nnz() == 5);
    REQUIRE(a.nnz(2) == 2);
    REQUIRE(a.row_indices()(1) == 2);
    REQUIRE(a(0,2) == Type(2.0));
    REQUIRE(a(2,1) == Type(3.0));
    REQUIRE(a(1,3) == Type(0.0));
    REQUIRE(a.get_entry(2,2).has_value());
    REQUIRE(not a.get_entry(1,2).has_value());
    CHECK_THROWS_AS(a.get_entry(0,4), utils::app_abort_error);

    auto c = a.col(2);
    REQUIRE(c.size() == 3);
    REQUIRE(c.nnz() == 2);
    REQUIRE(c.rows()(1) == 2);
    REQUIRE(c.values()(0) == Type(2.0));

    *a.get_entry_mut(2,2) = Type(7.0);
    REQUIRE(a(2,2) == Type(7.0));
    a.col_mut(3).values()(0) = Type(8.0);
    REQUIRE(a(2,3) == Type(8.0));

    // triplets are (row, col, value)
    auto t = a.triplets();
    REQUIRE(std::get<0>(t[1]) == 2);
    REQUIRE(std::get<1>(t[1]) == 1);
  }
  {
    auto a = csc_t::identity(3);
    REQUIRE(a.nnz() == 3);
    REQUIRE(a(1,1) == Type(1.0));
  }
  {
    nda::array<IntType,1> off = {0, 2, 2};
    nda::array<IndxType,1> idx = {2, 0};
    nda::array<Type,1> val = {Type(1.0), Type(2.0)};
    auto a = csc_t::try_from_unsorted_csc_data(3, 2, off, idx, val);
    REQUIRE(a(0,0) == Type(2.0));
    REQUIRE(a(2,0) == Type(1.0));
    REQUIRE(a.row_indices()(0) == 0);

    // a row index is checked against the number of rows
    nda::array<IndxType,1> bad = {0, 3};
    try {
      csc_t::try_from_csc_data(3, 2, off, bad, val);
      FAIL("construction succeeded");
    } catch(sparse_format_error const& e) {
      REQUIRE(e.kind() == sparse_format_error_kind::index_out_of_bounds);
    }
  }
}

template<typename Type, typename IndxType, typename IntType>
void test_csc_transformations()
{
  auto a = make_reference_csc<Type,IndxType,IntType>();
  auto A = math::sparse::to_dense(a);
  REQUIRE(A(0,0) == Type(1.0));
  REQUIRE(A(2,3) == Type(4.0));

  auto at = a.transpose();
  REQUIRE(at.shape() == std::array<long,2>{4,3});
  for(long i=0; i<3; ++i)
    for(long j=0; j<4; ++j)
      REQUIRE(at(j,i) == A(i,j));

  REQUIRE(a.upper_triangle().nnz() == 4);
  REQUIRE(a.lower_triangle().nnz() == 3);
  REQUIRE(a.diagonal_as_csc().nnz() == 2);
  auto f = a.filter([](long i, long, Type const&) { return i == 2; });
  REQUIRE(f.nnz() == 3);
  REQUIRE(not f.get_entry(0,0).has_value());

  auto [off, idx, val] = std::move(at).disassemble();
  REQUIRE(off.extent(0) == 4);
  REQUIRE(idx.extent(0) == 5);
  REQUIRE(val.extent(0) == 5);
}

template<typename Type, typename IndxType, typename IntType>
void test_csc_serialization()
{
  using csc_t = csc_matrix<Type,IndxType,IntType>;
  auto a = make_reference_csc<Type,IndxType,IntType>();
  auto buff = a.serialize();
  csc_t b;
  b.deserialize(buff);
  REQUIRE(b.shape() == a.shape());
  REQUIRE(b.pattern() == a.pattern());
  REQUIRE((b.values() == a.values()));

  CHECK_THROWS_AS(b.deserialize(math::sparse::to_csr(a).serialize()), utils::app_abort_error);
  // index type mismatch
  auto other = math::sparse::csc_matrix<Type,short,IntType>(2,2);
  CHECK_THROWS_AS(b.deserialize(other.serialize()), utils::app_abort_error);
}

TEST_CASE("csc_matrix_construction", "[sparse][csc]")
{
  test_csc_construction<double, int, long>();
  test_csc_construction<std::complex<double>, long, int>();
  test_csc_construction<float, int, long>();
}

TEST_CASE("csc_matrix_transformations", "[sparse][csc]")
{
  test_csc_transformations<double, int, long>();
  test_csc_transformations<std::complex<float>, int, long>();
}

TEST_CASE("csc_matrix_serialization", "[sparse][csc]")
{
  test_csc_serialization<double, int, long>();
}

} // spnda_tests
