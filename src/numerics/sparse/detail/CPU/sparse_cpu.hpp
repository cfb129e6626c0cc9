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


#ifndef NUMERICS_SPARSE_DETAIL_CPU_SPARSE_CPU_HPP
#define NUMERICS_SPARSE_DETAIL_CPU_SPARSE_CPU_HPP

#include <complex>
#include "utilities/check.hpp"
#include "utilities/type_traits.hpp"

namespace math::sparse::cpu
{

/*
 * Host kernels on compressed row storage of an M x K matrix A:
 *   A     - values
 *   indx  - column indices
 *   pntrb - pntrb[r] is the position of the first entry of row r
 *   pntre - pntre[r] is one past the last entry of row r
 * transa:
 *   'N' - A, 'T' - A^T, 'C' - A^H, 'R' - conj(A)
 * matdescra[0] == 'G' (general), matdescra[3] == 'C' or 'F' (layout of dense operands)
 * beta == 0 overwrites the output, its previous content is not read.
 */

namespace detail
{

template<typename T>
inline T op_value(const char transa, T const& a)
{
  if(transa == 'C' or transa == 'c' or transa == 'H' or transa == 'h' or transa == 'R' or transa == 'r')
    return utils::conj(a);
  return a;
}

inline bool is_transposed(const char transa)
{
  return not (transa == 'N' or transa == 'n' or transa == 'R' or transa == 'r');
}

template<typename T>
inline void scale(long n, T beta, T* y)
{
  if(beta == T(0))
    for(long i=0; i<n; ++i) y[i] = T(0);
  else if(beta != T(1))
    for(long i=0; i<n; ++i) y[i] *= beta;
}

}

// y = beta*y + alpha*op(A)*x
template<typename T, typename I1, typename I2>
void csrmv(const char transa,
           const long M,
           const long K,
           const T alpha,
           const char* matdescra,
           const T* A,
           const I1* indx,
           const I2* pntrb,
           const I2* pntre,
           const T* x,
           const T beta,
           T* y)
{
  utils::check(matdescra[0] == 'G' && (matdescra[3] == 'C' || matdescra[3]=='F'),
               "cpu::csrmv: Invalid matdescra");
  if (not detail::is_transposed(transa))
  {
    for (long nr = 0; nr < M; nr++, y++, pntrb++, pntre++)
    {
      T acc = T(0);
      for (I2 i = *pntrb; i < *pntre; i++)
        acc += detail::op_value(transa, *(A + i)) * (*(x + (*(indx + i))));
      *y = (beta == T(0) ? alpha * acc : beta * (*y) + alpha * acc);
    }
  }
  else
  {
    detail::scale(K, beta, y);
    for (long nr = 0; nr < M; nr++, pntrb++, pntre++, x++)
    {
      T ax = alpha * (*x);
      for (I2 i = *pntrb; i < *pntre; i++)
        *(y + (*(indx + i))) += detail::op_value(transa, *(A + i)) * ax;
    }
  }
}

// C = beta*C + alpha*op(A)*B, B and C dense with N columns
template<typename T, typename I1, typename I2>
void csrmm(const char transa,
           const long M,
           const long N,
           const long K,
           const T alpha,
           const char* matdescra,
           const T* A,
           const I1* indx,
           const I2* pntrb,
           const I2* pntre,
           const T* B,
           const long ldb,
           const T beta,
           T* C,
           const long ldc)
{
  utils::check(matdescra[0] == 'G' && (matdescra[3] == 'C' || matdescra[3]=='F'),
               "cpu::csrmm: Invalid matdescra");
  if(matdescra[3] == 'F') {
    // one column at a time
    for(long nc=0; nc<N; ++nc, B+=ldb, C+=ldc)
      csrmv(transa,M,K,alpha,matdescra,A,indx,pntrb,pntre,B,beta,C);
    return;
  }
  if (not detail::is_transposed(transa))
  {
    for (long nr = 0; nr < M; nr++, pntrb++, pntre++, C += ldc)
    {
      detail::scale(N, beta, C);
      for (I2 i = *pntrb; i < *pntre; i++)
      {
        // C(r,:) += alpha * op(A_rc) * B(c,:)
        const T* Bc = B + ldb * (*(indx + i));
        T* Cr       = C;
        T Arc       = alpha * detail::op_value(transa, *(A + i));
        for (long k = 0; k < N; k++, Cr++, Bc++)
          *Cr += Arc * (*Bc);
      }
    }
  }
  else
  {
    for (long i = 0; i < K; i++)
      detail::scale(N, beta, C + i * ldc);
    for (long nr = 0; nr < M; nr++, pntrb++, pntre++, B += ldb)
    {
      for (I2 i = *pntrb; i < *pntre; i++)
      {
        // C(c,:) += alpha * op(A_rc) * B(r,:)
        const T* Br = B;
        T* Cc       = C + ldc * (*(indx + i));
        T Arc       = alpha * detail::op_value(transa, *(A + i));
        for (long k = 0; k < N; k++, Cc++, Br++)
          *Cc += Arc * (*Br);
      }
    }
  }
}

} // namespace math::sparse::cpu

#endif
