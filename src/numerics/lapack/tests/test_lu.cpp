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
#include "utilities/type_traits.hpp"

#include "numerics/lapack/lu.hpp"

namespace spnda_tests
{

using math::lapack::lu_factorization;

template<typename Type>
auto matmul(nda::matrix<Type> const& A, nda::matrix<Type> const& B)
{
  nda::matrix<Type> C(A.extent(0), B.extent(1));
  nda::blas::gemm(Type(1.0), A, B, Type(0.0), C);
  return C;
}

template<typename Type>
void check_plu(nda::matrix<Type> const& M)
{
  lu_factorization<Type> lu(M);
  long m = M.extent(0), n = M.extent(1), k = std::min(m,n);
  auto L = lu.l();
  auto U = lu.u();
  auto P = lu.p();
  REQUIRE(L.shape() == std::array<long,2>{m,k});
  REQUIRE(U.shape() == std::array<long,2>{k,n});
  REQUIRE(P.shape() == std::array<long,2>{m,m});
  for(long i=0; i<k; i++) {
    REQUIRE(L(i,i) == Type(1.0));
    for(long j=i+1; j<k; j++) REQUIRE(L(i,j) == Type(0.0));
    for(long j=0; j<i; j++) REQUIRE(U(i,j) == Type(0.0));
  }
  auto PLU = matmul(P, matmul(L, U));
  utils::ARRAY_EQUAL(PLU, M, 1e-10, 1e-10);

  // permute agrees with P
  nda::matrix<Type> R = utils::make_random<Type>(m, 2);
  auto PR = matmul(P, R);
  lu.permute(R);
  utils::ARRAY_EQUAL(PR, R);
}

template<typename Type>
void test_lu_square(long n)
{
  nda::matrix<Type> M = utils::make_random<Type>(n, n);
  for(long i=0; i<n; i++) M(i,i) += Type(n);
  check_plu(M);

  lu_factorization<Type> lu(M);
  REQUIRE(lu.is_square());
  REQUIRE(lu.is_invertible());

  // M x = b
  nda::array<Type,1> b = utils::make_random<Type>(n);
  auto x = lu.solve(b);
  REQUIRE(x.has_value());
  nda::array<Type,1> r(n);
  nda::blas::gemv(Type(1.0), M, *x, Type(0.0), r);
  utils::ARRAY_EQUAL(r, b, 1e-10, 1e-10);

  // M^T x = b
  auto xt = lu.solve_transpose(b);
  REQUIRE(xt.has_value());
  nda::matrix<Type> Mt = nda::transpose(M);
  nda::blas::gemv(Type(1.0), Mt, *xt, Type(0.0), r);
  utils::ARRAY_EQUAL(r, b, 1e-10, 1e-10);

  // M^H x = b
  auto xh = lu.solve_adjoint(b);
  REQUIRE(xh.has_value());
  nda::matrix<Type> Mh(n, n);
  for(long i=0; i<n; i++)
    for(long j=0; j<n; j++) Mh(i,j) = utils::conj(M(j,i));
  nda::blas::gemv(Type(1.0), Mh, *xh, Type(0.0), r);
  utils::ARRAY_EQUAL(r, b, 1e-10, 1e-10);

  // several right hand sides, in place, column major
  nda::matrix<Type> B = utils::make_random<Type>(n, 3);
  nda::matrix<Type,nda::F_layout> X(B);
  REQUIRE(lu.solve_inplace(X));
  nda::matrix<Type> MX = matmul(M, nda::matrix<Type>(X));
  utils::ARRAY_EQUAL(MX, B, 1e-10, 1e-10);

  nda::array<Type,1> y(b);
  REQUIRE(lu.solve_adjoint_inplace(y));
  utils::ARRAY_EQUAL(y, *xh);
  y = b;
  REQUIRE(lu.solve_transpose_inplace(y));
  utils::ARRAY_EQUAL(y, *xt);

  // inverse
  auto Minv = lu.inverse();
  REQUIRE(Minv.has_value());
  auto I = matmul(M, *Minv);
  nda::matrix<Type> eye = nda::eye<Type>(n);
  utils::ARRAY_EQUAL(I, eye, 1e-10, 1e-10);

  CHECK_THROWS_AS(lu.solve(nda::array<Type,1>(n+1)), utils::app_abort_error);
}

template<typename Type>
void test_lu_singular()
{
  long n = 4;
  nda::matrix<Type> M = utils::make_random<Type>(n, n);
  // zero column, U(1,1) is exactly zero
  M(nda::range::all, 1) = Type(0.0);
  lu_factorization<Type> lu(M);
  REQUIRE(not lu.is_invertible());
  check_plu(M);

  nda::array<Type,1> b = utils::make_random<Type>(n);
  REQUIRE(not lu.solve(b).has_value());
  REQUIRE(not lu.solve_transpose(b).has_value());
  REQUIRE(not lu.solve_adjoint(b).has_value());
  nda::array<Type,1> y(b);
  REQUIRE(not lu.solve_inplace(y));
  utils::ARRAY_EQUAL(y, b);
  REQUIRE(not lu.inverse().has_value());
}

TEST_CASE("lu_square", "[lapack][lu]")
{
  test_lu_square<double>(1);
  test_lu_square<double>(7);
  test_lu_square<std::complex<double>>(7);
}

TEST_CASE("lu_singular", "[lapack][lu]")
{
  test_lu_singular<double>();
  test_lu_singular<std::complex<double>>();
}

TEST_CASE("lu_rectangular", "[lapack][lu]")
{
  check_plu(nda::matrix<double>(utils::make_random<double>(6, 4)));
  check_plu(nda::matrix<double>(utils::make_random<double>(4, 6)));
  check_plu(nda::matrix<std::complex<double>>(utils::make_random<std::complex<double>>(5, 3)));

  lu_factorization<double> lu(nda::matrix<double>(utils::make_random<double>(6, 4)));
  REQUIRE(not lu.is_square());
  REQUIRE(not lu.is_invertible());
  CHECK_THROWS_AS(lu.solve(nda::array<double,1>(6)), utils::app_abort_error);
  CHECK_THROWS_AS(lu.inverse(), utils::app_abort_error);
}

TEST_CASE("lu_permutation", "[lapack][lu]")
{
  // first pivot requires a row swap
  nda::matrix<double> M = {{0.0, 1.0}, {2.0, 3.0}};
  lu_factorization<double> lu(M);
  nda::matrix<double> P = {{0.0, 1.0}, {1.0, 0.0}};
  utils::ARRAY_EQUAL(lu.p(), P);
  REQUIRE(lu.permutation_indices()(0) == 2);
  auto x = lu.solve(nda::array<double,1>{1.0, 5.0});
  REQUIRE(x.has_value());
  utils::VALUE_EQUAL((*x)(0), 1.0);
  utils::VALUE_EQUAL((*x)(1), 1.0);
}

} // spnda_tests
