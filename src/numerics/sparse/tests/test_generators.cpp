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

#include "configuration.hpp"

#if defined(ENABLE_PROPTEST_SUPPORT)

#include <complex>
#include <random>

#include "catch2/catch.hpp"

#include "nda/nda.hpp"
#include "nda/blas.hpp"
#include "utilities/test_common.hpp"
#include "utilities/catch_generators.hpp"

#include "numerics/sparse/sparse.hpp"

namespace spnda_tests
{

using math::sparse::testing::dim_range;
using math::sparse::testing::pattern_strategy;

// rebuilds p through the checked constructor
template<typename Pattern>
void check_valid_pattern(Pattern const& p)
{
  auto off = p.major_offsets();
  auto idx = p.minor_indices();
  auto q = Pattern::try_from_offsets_and_indices(p.major_dim(), p.minor_dim(), off, idx);
  REQUIRE(q == p);
}

TEST_CASE("generators_pattern", "[sparse][generators]")
{
  auto p = GENERATE(take(50, utils::sparsity_patterns<int,long>(pattern_strategy{dim_range(0,8), dim_range(1,6), 25},
                                                               utils::test_seed())));
  REQUIRE(p.major_dim() >= 0);
  REQUIRE(p.major_dim() <= 8);
  REQUIRE(p.minor_dim() >= 1);
  REQUIRE(p.minor_dim() <= 6);
  REQUIRE(p.nnz() <= 25);
  REQUIRE(p.nnz() <= p.major_dim()*p.minor_dim());
  check_valid_pattern(p);
  REQUIRE(p.transpose().transpose() == p);
}

TEST_CASE("generators_dense_pattern", "[sparse][generators]")
{
  std::mt19937 rng(utils::test_seed());
  for(int n=0; n<20; n++) {
    auto p = math::sparse::testing::random_pattern<int,long>(rng, pattern_strategy{dim_range(3), dim_range(4), 12});
    REQUIRE(p.major_dim() == 3);
    REQUIRE(p.minor_dim() == 4);
    check_valid_pattern(p);
  }
}

TEST_CASE("generators_reproducible", "[sparse][generators]")
{
  std::mt19937 r1(17), r2(17);
  auto gen = math::sparse::testing::uniform_values<double>{};
  auto a = math::sparse::testing::random_csr<double>(r1, gen, dim_range(2,9), dim_range(2,9), 30);
  auto b = math::sparse::testing::random_csr<double>(r2, gen, dim_range(2,9), dim_range(2,9), 30);
  REQUIRE(a.pattern() == b.pattern());
  utils::ARRAY_EQUAL(a.values(), b.values(), 0.0, 0.0);
  CHECK_THROWS_AS(dim_range(3,2), utils::app_abort_error);
}

TEST_CASE("generators_coo_to_csr", "[sparse][generators]")
{
  auto coo = GENERATE(take(30, utils::coo_matrices<double>(dim_range(0,7), dim_range(0,7), 40, utils::test_seed())));
  using namespace math::sparse;
  // duplicates are summed by both conversions
  auto A = to_dense(coo);
  auto a = to_csr(coo);
  auto c = to_csc(coo);
  REQUIRE(a.shape() == coo.shape());
  REQUIRE(a.nnz() <= coo.nnz());
  utils::ARRAY_EQUAL(A, to_dense(a));
  utils::ARRAY_EQUAL(A, to_dense(c));
  REQUIRE(to_csc(a).pattern() == c.pattern());
}

TEST_CASE("generators_csr_properties", "[sparse][generators]")
{
  using namespace math::sparse;
  using cplx = std::complex<double>;
  auto a = GENERATE(take(30, utils::csr_matrices<cplx>(dim_range(1,10), dim_range(1,10), 40, utils::test_seed())));
  auto A = to_dense(a);

  // transpose agrees with the dense one
  nda::array<cplx,2> At = nda::transpose(A);
  utils::ARRAY_EQUAL(nda::array<cplx,2>(to_dense(a.transpose())), At);

  // triangle split adds back to A, the diagonal counted twice
  auto s = a.upper_triangle() + a.lower_triangle() - a.diagonal_as_csr();
  utils::ARRAY_EQUAL(to_dense(s), A);

  // products
  std::mt19937 rng(utils::test_seed() + 1);
  auto b = testing::random_csr<cplx>(rng, testing::uniform_values<cplx>{}, dim_range(a.ncols()), dim_range(1,6), 30);
  auto B = to_dense(b);
  nda::matrix<cplx> AB(A.extent(0), B.extent(1));
  nda::blas::gemm(cplx(1.0), A, B, cplx(0.0), AB);
  utils::ARRAY_EQUAL(to_dense(a * b), AB);
  nda::array<cplx,2> Bd(B);
  utils::ARRAY_EQUAL(a * Bd, AB);

  // csr and csc agree
  auto ac = to_csc(a), bc = to_csc(b);
  utils::ARRAY_EQUAL(to_dense(ac * bc), AB);
}

TEST_CASE("generators_csc_cholesky", "[sparse][generators][cholesky]")
{
  using namespace math::sparse;
  std::mt19937 rng(utils::test_seed());
  for(int n=0; n<10; n++) {
    long dim = dim_range(1,12).sample(rng);
    auto a = testing::random_hpd_csc<double>(rng, dim, 2*dim);
    auto chol = csc_cholesky<double>::factor(a);
    nda::array<double,1> b = testing::random_values<double>(rng, testing::uniform_values<double>{}, dim);
    auto x = chol.solve(b);
    nda::array<double,1> r = a * x;
    utils::ARRAY_EQUAL(r, b, 1e-10, 1e-10);
  }
}

} // spnda_tests

#endif
