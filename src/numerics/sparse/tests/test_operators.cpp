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

#include "catch2/catch.hpp"

#include "nda/nda.hpp"
#include "nda/blas.hpp"
#include "utilities/test_common.hpp"

#include "numerics/sparse/sparse.hpp"

namespace spnda_tests
{

template<typename Mat, typename Type>
void test_operators_impl(Mat const& a, Mat const& b, Mat const& c,
                         nda::array<Type,2> const& A, nda::array<Type,2> const& B, nda::array<Type,2> const& C)
{
  using namespace math::sparse;

  // sparse + sparse
  {
    auto s = a + b;
    nda::array<Type,2> ref = A + B;
    utils::ARRAY_EQUAL(ref, to_dense(s));
    REQUIRE(s.nnz() <= a.nnz() + b.nnz());
    auto d = a - b;
    ref = A - B;
    utils::ARRAY_EQUAL(ref, to_dense(d));
    // a - a keeps the pattern with explicit zeros
    auto z = a - a;
    REQUIRE(z.pattern() == a.pattern());
    for(auto const& v : z.values()) REQUIRE(v == Type(0));
    CHECK_THROWS_AS(a + c, utils::app_abort_error);
  }

  // sparse * sparse
  {
    auto p = a * c;
    nda::array<Type,2> ref(A.extent(0), C.extent(1));
    nda::blas::gemm(Type(1.0), A, C, Type(0.0), ref);
    utils::ARRAY_EQUAL(ref, to_dense(p));
    CHECK_THROWS_AS(a * b, utils::app_abort_error);
  }

  // sparse * dense
  {
    nda::array<Type,2> ref(A.extent(0), C.extent(1));
    nda::blas::gemm(Type(1.0), A, C, Type(0.0), ref);
    auto p = a * C;
    utils::ARRAY_EQUAL(ref, p);

    nda::array<Type,1> x = utils::make_random<Type>(A.extent(1));
    nda::array<Type,1> y_ref(A.extent(0));
    nda::blas::gemv(Type(1.0), A, x, Type(0.0), y_ref);
    auto y = a * x;
    utils::ARRAY_EQUAL(y_ref, y);
    // strided input is copied
    nda::array<Type,1> x2(2*A.extent(1));
    x2(nda::range(0, 2*A.extent(1), 2)) = x;
    auto y2 = a * x2(nda::range(0, 2*A.extent(1), 2));
    utils::ARRAY_EQUAL(y_ref, y2);
  }

  // scalars
  {
    auto s = a * Type(2.0);
    nda::array<Type,2> ref = Type(2.0)*A;
    utils::ARRAY_EQUAL(ref, to_dense(s));
    s = Type(3.0) * a;
    ref = Type(3.0)*A;
    utils::ARRAY_EQUAL(ref, to_dense(s));
    s = a / Type(4.0);
    ref = A / Type(4.0);
    utils::ARRAY_EQUAL(ref, to_dense(s));
    s = -a;
    ref = -A;
    utils::ARRAY_EQUAL(ref, to_dense(s));
    s *= Type(-2.0);
    ref = Type(2.0)*A;
    utils::ARRAY_EQUAL(ref, to_dense(s));
    s /= Type(2.0);
    utils::ARRAY_EQUAL(A, to_dense(s));
    REQUIRE(s.pattern() == a.pattern());
  }
}

template<typename Type, typename IndxType, typename IntType>
void test_operators()
{
  long m = 12, k = 9, n = 5;
  nda::array<Type,2> A = utils::make_random_sparse<Type>(m, k, 0.3, 21);
  nda::array<Type,2> B = utils::make_random_sparse<Type>(m, k, 0.3, 22);
  nda::array<Type,2> C = utils::make_random_sparse<Type>(k, n, 0.3, 23);

  test_operators_impl(math::sparse::to_csr<IndxType,IntType>(A),
                      math::sparse::to_csr<IndxType,IntType>(B),
                      math::sparse::to_csr<IndxType,IntType>(C), A, B, C);
  test_operators_impl(math::sparse::to_csc<IndxType,IntType>(A),
                      math::sparse::to_csc<IndxType,IntType>(B),
                      math::sparse::to_csc<IndxType,IntType>(C), A, B, C);
}

TEST_CASE("sparse_operators", "[sparse][operators]")
{
  test_operators<double, int, long>();
  test_operators<std::complex<double>, int, long>();
  test_operators<double, long, int>();
}

} // spnda_tests
