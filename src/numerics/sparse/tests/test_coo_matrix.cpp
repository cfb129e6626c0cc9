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

using math::sparse::coo_matrix;
using math::sparse::sparse_format_error;
using math::sparse::sparse_format_error_kind;

template<typename Type, typename IndxType>
void test_coo_construction()
{
  using coo_t = coo_matrix<Type,IndxType>;
  {
    coo_t a;
    REQUIRE(a.nrows() == 0);
    REQUIRE(a.ncols() == 0);
    REQUIRE(a.nnz() == 0);
  }
  {
    coo_t a(3, 4);
    REQUIRE(a.shape() == std::array<long,2>{3,4});
    REQUIRE(a.nnz() == 0);
    coo_t b({3, 4});
    REQUIRE(b.shape() == a.shape());
    REQUIRE(b.nnz() == 0);
    a.push(0, 1, Type(1.0));
    a.push(2, 3, Type(2.0));
    a.push(0, 1, Type(3.0));
    a.push(1, 1, Type(0.0));
    REQUIRE(a.nnz() == 4);

    auto t = a.triplets();
    REQUIRE(t.size() == 4);
    REQUIRE(std::get<0>(t[1]) == 2);
    REQUIRE(std::get<1>(t[1]) == 3);
    REQUIRE(std::get<2>(t[1]) == Type(2.0));
    // explicit zeros are kept
    REQUIRE(std::get<2>(t[3]) == Type(0.0));

    CHECK_THROWS_AS(a.push(3, 0, Type(1.0)), utils::app_abort_error);
    CHECK_THROWS_AS(a.push(0, -1, Type(1.0)), utils::app_abort_error);
    REQUIRE(a.nnz() == 4);

    // duplicates are summed in the dense representation
    auto A = math::sparse::to_dense(a);
    REQUIRE(A(0,1) == Type(4.0));
    REQUIRE(A(2,3) == Type(2.0));
    REQUIRE(A(1,1) == Type(0.0));

    a.clear();
    REQUIRE(a.nnz() == 0);
    REQUIRE(a.nrows() == 3);
    REQUIRE(a.ncols() == 4);
  }
  {
    auto a = coo_t::try_from_triplets(2, 3, std::vector<IndxType>{0, 1, 1},
                                      std::vector<IndxType>{2, 0, 2},
                                      std::vector<Type>{Type(1.0), Type(2.0), Type(3.0)});
    REQUIRE(a.nnz() == 3);
    REQUIRE(a.row_indices()[1] == 1);
    REQUIRE(a.col_indices()[2] == 2);
    REQUIRE(a.values()[2] == Type(3.0));

    auto [r, c, v] = std::move(a).disassemble();
    REQUIRE(r.size() == 3);
    REQUIRE(c.size() == 3);
    REQUIRE(v.size() == 3);
  }
  {
    // nda input
    nda::array<long,1> r = {0, 1};
    nda::array<long,1> c = {1, 0};
    nda::array<Type,1> v = {Type(1.0), Type(-1.0)};
    auto a = coo_t::try_from_triplets(2, 2, r, c, v);
    REQUIRE(a.nnz() == 2);
    REQUIRE(a.values()[1] == Type(-1.0));
  }
}

template<typename Type, typename IndxType>
void test_coo_errors()
{
  using coo_t = coo_matrix<Type,IndxType>;
  auto kind_of = [](auto&& f) {
    try {
      f();
    } catch(sparse_format_error const& e) {
      return e.kind();
    }
    FAIL("construction succeeded");
    return sparse_format_error_kind::invalid_structure;
  };

  REQUIRE(kind_of([] {
    coo_t::try_from_triplets(2, 2, std::vector<IndxType>{0, 1}, std::vector<IndxType>{0},
                             std::vector<Type>{Type(1.0), Type(1.0)});
  }) == sparse_format_error_kind::invalid_structure);
  REQUIRE(kind_of([] {
    coo_t::try_from_triplets(2, 2, std::vector<IndxType>{0}, std::vector<IndxType>{0},
                             std::vector<Type>{Type(1.0), Type(1.0)});
  }) == sparse_format_error_kind::invalid_structure);
  REQUIRE(kind_of([] {
    coo_t::try_from_triplets(2, 2, std::vector<IndxType>{0, 2}, std::vector<IndxType>{0, 0},
                             std::vector<Type>{Type(1.0), Type(1.0)});
  }) == sparse_format_error_kind::index_out_of_bounds);
  REQUIRE(kind_of([] {
    coo_t::try_from_triplets(2, 2, std::vector<IndxType>{0, 1}, std::vector<IndxType>{0, -1},
                             std::vector<Type>{Type(1.0), Type(1.0)});
  }) == sparse_format_error_kind::index_out_of_bounds);
  // zero sized matrix accepts no entries
  REQUIRE(kind_of([] {
    coo_t::try_from_triplets(0, 3, std::vector<IndxType>{0}, std::vector<IndxType>{0},
                             std::vector<Type>{Type(1.0)});
  }) == sparse_format_error_kind::index_out_of_bounds);

  CHECK_THROWS_AS(coo_t(-1, 2), utils::app_abort_error);
}

TEST_CASE("coo_matrix_construction", "[sparse][coo]")
{
  test_coo_construction<double, int>();
  test_coo_construction<double, long>();
  test_coo_construction<std::complex<double>, int>();
  test_coo_construction<float, int>();
}

TEST_CASE("coo_matrix_errors", "[sparse][coo]")
{
  test_coo_errors<double, int>();
  test_coo_errors<std::complex<double>, long>();
}

} // spnda_tests
