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


#ifndef SPARSE_SPARSE_BLAS_HPP
#define SPARSE_SPARSE_BLAS_HPP

#include <algorithm>
#include <array>
#include <iterator>
#include <string>
#include <vector>

#include "numerics/sparse/detail/concepts.hpp"
#include "numerics/sparse/detail/ops_aux.hpp"
#include "numerics/sparse/detail/CPU/sparse_cpu.hpp"
#include "numerics/sparse/sparse_errors.hpp"
#include "numerics/sparse/sparsity_pattern.hpp"
#include "numerics/sparse/csr_matrix.hpp"
#include "numerics/sparse/csc_matrix.hpp"

#include "utilities/check.hpp"
#include "utilities/type_traits.hpp"
#include "IO/app_loggers.h"
#include "nda/nda.hpp"

namespace math::sparse
{

/***************************************************************************/
/*                              operation tags                             */
/***************************************************************************/

template<CompressedMatrix MA>
auto normal(MA&& arg)
{ return detail::normal_tag<MA>(std::forward<MA>(arg)); }

template<CompressedMatrix MA>
auto transpose(MA&& arg)
{ return detail::transpose_tag<MA>(std::forward<MA>(arg)); }

template<CompressedMatrix MA>
auto dagger(MA&& arg)
{ return detail::conjugate_transpose_tag<MA>(std::forward<MA>(arg)); }

template<CompressedMatrix MA>
auto N(MA&& arg)
{ return detail::normal_tag<MA>(std::forward<MA>(arg)); }

template<CompressedMatrix MA>
auto T(MA&& arg)
{ return detail::transpose_tag<MA>(std::forward<MA>(arg)); }

template<CompressedMatrix MA>
auto H(MA&& arg)
{ return detail::conjugate_transpose_tag<MA>(std::forward<MA>(arg)); }

namespace detail
{

/*
 * Every compressed matrix is handled through its compressed row storage:
 * a CSR matrix A is stored as A, a CSC matrix A is stored as the CSR storage of A^T.
 * storage_op returns the op to apply on the storage to obtain op(A).
 */
template<CompressedMatrix M>
constexpr char storage_op(char op)
{
  if constexpr (CSCMatrix<M>) return transpose_op(op);
  else return op;
}

// shape of op(A) from the shape of A
inline std::array<long,2> op_shape(char op, std::array<long,2> s)
{
  if(op == 'N' or op == 'R') return s;
  return {s[1], s[0]};
}

template<CompressedMatrix M, ::nda::MemoryVector X, ::nda::MemoryVector Y>
void spmv_impl(char op, typename M::value_type alpha, M const& a, X const& x,
               typename M::value_type beta, Y&& y)
{
  static_assert( std::is_same_v<typename M::index_type,int> or std::is_same_v<typename M::index_type,long>, "Invalid type");
  static_assert( std::is_same_v<typename M::int_type,int> or std::is_same_v<typename M::int_type,long>, "Invalid type");
  auto [m, n] = op_shape(op, a.shape());
  utils::check(m == y.extent(0), "Shape mismatch: op(A):({},{}), y:{}", m, n, y.extent(0));
  utils::check(n == x.extent(0), "Shape mismatch: op(A):({},{}), x:{}", m, n, x.extent(0));

  // contiguous vectors only
  utils::check(x.indexmap().min_stride() == 1, "Stride mismatch");
  utils::check(y.indexmap().min_stride() == 1, "Stride mismatch");

  char sop = storage_op<M>(op);
  auto const& p = a.pattern();
  auto const* offsets = p.major_offsets().data();
  cpu::csrmv(sop, p.major_dim(), p.minor_dim(), alpha, "GxxCxx", a.values().data(),
             p.minor_indices().data(), offsets, offsets+1, x.data(), beta, y.data());
}

template<CompressedMatrix M, ::nda::MemoryMatrix B, ::nda::MemoryMatrix C>
void spmm_dense_impl(char op, typename M::value_type alpha, M const& a, B const& b,
                     typename M::value_type beta, C&& c)
{
  static_assert( std::is_same_v<typename M::index_type,int> or std::is_same_v<typename M::index_type,long>, "Invalid type");
  static_assert( std::is_same_v<typename M::int_type,int> or std::is_same_v<typename M::int_type,long>, "Invalid type");
  static_assert((std::decay_t<B>::is_stride_order_C() and std::decay_t<C>::is_stride_order_C()) or
                (std::decay_t<B>::is_stride_order_Fortran() and std::decay_t<C>::is_stride_order_Fortran()),
                "Layout mismatch");

  auto [m, k] = op_shape(op, a.shape());
  utils::check(m == c.extent(0), "Shape mismatch: op(A):({},{}), C:({},{})", m, k, c.extent(0), c.extent(1));
  utils::check(k == b.extent(0), "Shape mismatch: op(A):({},{}), B:({},{})", m, k, b.extent(0), b.extent(1));
  utils::check(b.extent(1) == c.extent(1), "Shape mismatch: B:({},{}), C:({},{})",
               b.extent(0), b.extent(1), c.extent(0), c.extent(1));

  // Must be lapack compatible
  utils::check(b.indexmap().min_stride() == 1, "Stride mismatch");
  utils::check(c.indexmap().min_stride() == 1, "Stride mismatch");

  char sop = storage_op<M>(op);
  auto const& p = a.pattern();
  auto const* offsets = p.major_offsets().data();
  long n = c.extent(1);
  if constexpr (std::decay_t<B>::is_stride_order_C()) {
    cpu::csrmm(sop, p.major_dim(), n, p.minor_dim(), alpha, "GxxCxx", a.values().data(),
               p.minor_indices().data(), offsets, offsets+1, b.data(), b.strides()[0],
               beta, c.data(), c.strides()[0]);
  } else {
    cpu::csrmm(sop, p.major_dim(), n, p.minor_dim(), alpha, "GxxFxx", a.values().data(),
               p.minor_indices().data(), offsets, offsets+1, b.data(), b.strides()[1],
               beta, c.data(), c.strides()[1]);
  }
}

}

/***************************************************************************/
/*                     sparse x dense                                      */
/***************************************************************************/

/**
 * y = beta*y + alpha*op(A)*x, with A in CSR format.
 */
template<detail::TaggedCompressedMatrix A_t, ::nda::MemoryVector X, ::nda::MemoryVector Y>
requires(CSRMatrix<detail::arg_t<A_t>> and
         ::nda::have_same_value_type_v<X, Y> and
         std::is_same_v<::nda::get_value_t<X>, typename detail::arg_t<A_t>::value_type>)
void csrmv(::nda::get_value_t<X> alpha, A_t const& a, X const &x, ::nda::get_value_t<X> beta, Y &&y)
{
  detail::spmv_impl(detail::op_tag_v<A_t>, alpha, detail::arg(a), x, beta, std::forward<Y>(y));
}

/**
 * y = beta*y + alpha*op(A)*x, with A in CSC format.
 */
template<detail::TaggedCompressedMatrix A_t, ::nda::MemoryVector X, ::nda::MemoryVector Y>
requires(CSCMatrix<detail::arg_t<A_t>> and
         ::nda::have_same_value_type_v<X, Y> and
         std::is_same_v<::nda::get_value_t<X>, typename detail::arg_t<A_t>::value_type>)
void cscmv(::nda::get_value_t<X> alpha, A_t const& a, X const &x, ::nda::get_value_t<X> beta, Y &&y)
{
  detail::spmv_impl(detail::op_tag_v<A_t>, alpha, detail::arg(a), x, beta, std::forward<Y>(y));
}

/**
 * C = beta*C + alpha*op(A)*B, with A in CSR format.
 * B and C must share layout (C or Fortran) and have unit stride in the fast index.
 */
template<typename V, detail::TaggedCompressedMatrix A_t, ::nda::MemoryMatrix B, ::nda::MemoryMatrix C>
requires(CSRMatrix<detail::arg_t<A_t>> and ::nda::have_same_value_type_v<B, C>)
void csrmm(V alpha, A_t const& a, B const &b, V beta, C &&c)
{
  static_assert( std::is_same_v<V,::nda::get_value_t<B>>, "Type mismatch.");
  detail::spmm_dense_impl(detail::op_tag_v<A_t>, alpha, detail::arg(a), b, beta, std::forward<C>(c));
}

/**
 * C = beta*C + alpha*B*op(A), with A in CSR format.
 * Computed as C^T = beta*C^T + alpha*op(A)^T*B^T.
 */
template<typename V, detail::TaggedCompressedMatrix A_t, ::nda::MemoryMatrix B, ::nda::MemoryMatrix C>
requires(CSRMatrix<detail::arg_t<A_t>> and ::nda::have_same_value_type_v<B, C>)
void csrmm(V alpha, B const& b, A_t const &a, V beta, C &&c)
{
  static_assert( std::is_same_v<V,::nda::get_value_t<B>>, "Type mismatch.");
  auto bt = ::nda::transpose(b);
  auto ct = ::nda::transpose(c);
  detail::spmm_dense_impl(detail::transpose_op(detail::op_tag_v<A_t>), alpha, detail::arg(a), bt, beta, ct);
}

/**
 * C = beta*C + alpha*op(A)*B, with A in CSC format.
 */
template<typename V, detail::TaggedCompressedMatrix A_t, ::nda::MemoryMatrix B, ::nda::MemoryMatrix C>
requires(CSCMatrix<detail::arg_t<A_t>> and ::nda::have_same_value_type_v<B, C>)
void cscmm(V alpha, A_t const& a, B const &b, V beta, C &&c)
{
  static_assert( std::is_same_v<V,::nda::get_value_t<B>>, "Type mismatch.");
  detail::spmm_dense_impl(detail::op_tag_v<A_t>, alpha, detail::arg(a), b, beta, std::forward<C>(c));
}

/**
 * C = beta*C + alpha*B*op(A), with A in CSC format.
 */
template<typename V, detail::TaggedCompressedMatrix A_t, ::nda::MemoryMatrix B, ::nda::MemoryMatrix C>
requires(CSCMatrix<detail::arg_t<A_t>> and ::nda::have_same_value_type_v<B, C>)
void cscmm(V alpha, B const& b, A_t const &a, V beta, C &&c)
{
  static_assert( std::is_same_v<V,::nda::get_value_t<B>>, "Type mismatch.");
  auto bt = ::nda::transpose(b);
  auto ct = ::nda::transpose(c);
  detail::spmm_dense_impl(detail::transpose_op(detail::op_tag_v<A_t>), alpha, detail::arg(a), bt, beta, ct);
}

/***************************************************************************/
/*                     sparse x sparse                                     */
/***************************************************************************/

/**
 * Union of two patterns of equal dimensions.
 */
template<typename IndxType, typename IntType>
sparsity_pattern<IndxType,IntType> spadd_pattern(sparsity_pattern<IndxType,IntType> const& a,
                                                 sparsity_pattern<IndxType,IntType> const& b)
{
  using pattern_t = sparsity_pattern<IndxType,IntType>;
  utils::check(a.major_dim() == b.major_dim() and a.minor_dim() == b.minor_dim(),
               "spadd_pattern: Shape mismatch: ({},{}), ({},{})",
               a.major_dim(), a.minor_dim(), b.major_dim(), b.minor_dim());
  long nmaj = a.major_dim();
  auto const& ao = a.major_offsets();
  auto const& ai = a.minor_indices();
  auto const& bo = b.major_offsets();
  auto const& bi = b.minor_indices();
  typename pattern_t::offsets_t offsets(nmaj+1);
  std::vector<IndxType> indices;
  indices.reserve(std::max(a.nnz(), b.nnz()));
  offsets(0) = 0;
  for(long i=0; i<nmaj; ++i) {
    std::set_union(ai.data()+ao(i), ai.data()+ao(i+1), bi.data()+bo(i), bi.data()+bo(i+1),
                   std::back_inserter(indices));
    offsets(i+1) = IntType(indices.size());
  }
  typename pattern_t::indices_t idx(long(indices.size()));
  std::copy(indices.begin(), indices.end(), idx.data());
  return pattern_t::from_offsets_and_indices_unchecked(nmaj, a.minor_dim(), std::move(offsets), std::move(idx));
}

/**
 * Pattern of the product of compressed row storages: lanes of a, lanes of b indexed by minor indices of a.
 */
template<typename IndxType, typename IntType>
sparsity_pattern<IndxType,IntType> spmm_pattern(sparsity_pattern<IndxType,IntType> const& a,
                                                sparsity_pattern<IndxType,IntType> const& b)
{
  using pattern_t = sparsity_pattern<IndxType,IntType>;
  utils::check(a.minor_dim() == b.major_dim(), "spmm_pattern: Shape mismatch: ({},{}), ({},{})",
               a.major_dim(), a.minor_dim(), b.major_dim(), b.minor_dim());
  long nmaj = a.major_dim();
  long nmin = b.minor_dim();
  auto const& ao = a.major_offsets();
  auto const& ai = a.minor_indices();
  auto const& bo = b.major_offsets();
  auto const& bi = b.minor_indices();
  typename pattern_t::offsets_t offsets(nmaj+1);
  std::vector<IndxType> indices;
  std::vector<IndxType> lane;
  std::vector<long> marker(nmin, -1);
  offsets(0) = 0;
  for(long i=0; i<nmaj; ++i) {
    lane.clear();
    for(long p=ao(i); p<ao(i+1); ++p) {
      long k = ai(p);
      for(long q=bo(k); q<bo(k+1); ++q) {
        long j = bi(q);
        if(marker[j] != i) {
          marker[j] = i;
          lane.emplace_back(IndxType(j));
        }
      }
    }
    std::sort(lane.begin(), lane.end());
    indices.insert(indices.end(), lane.begin(), lane.end());
    offsets(i+1) = IntType(indices.size());
  }
  typename pattern_t::indices_t idx(long(indices.size()));
  std::copy(indices.begin(), indices.end(), idx.data());
  return pattern_t::from_offsets_and_indices_unchecked(nmaj, nmin, std::move(offsets), std::move(idx));
}

template<CSRMatrix MA, CSRMatrix MB>
auto spmm_csr_pattern(MA const& a, MB const& b)
{
  return spmm_pattern(a.pattern(), b.pattern());
}

// CSC storage of A*B is the CSR storage of B^T*A^T
template<CSCMatrix MA, CSCMatrix MB>
auto spmm_csc_pattern(MA const& a, MB const& b)
{
  return spmm_pattern(b.pattern(), a.pattern());
}

namespace detail
{

/*
 * vc = beta*vc + alpha*va on storages, pc must contain pa.
 * Throws operation_error::invalid_pattern before modifying vc otherwise.
 */
template<typename Pattern, typename VA, typename VC, typename V>
void spadd_storage(V alpha, Pattern const& pa, VA const& va, V beta, Pattern const& pc, VC&& vc)
{
  utils::check(pa.major_dim() == pc.major_dim() and pa.minor_dim() == pc.minor_dim(),
               "spadd: Shape mismatch: ({},{}), ({},{})",
               pa.major_dim(), pa.minor_dim(), pc.major_dim(), pc.minor_dim());
  auto const& ao = pa.major_offsets();
  auto const& ai = pa.minor_indices();
  auto const& co = pc.major_offsets();
  auto const& ci = pc.minor_indices();
  // position in vc of every entry of a
  std::vector<long> dest(pa.nnz());
  for(long i=0; i<pa.major_dim(); ++i) {
    long q = co(i);
    for(long p=ao(i); p<ao(i+1); ++p) {
      while(q < co(i+1) and ci(q) < ai(p)) ++q;
      if(q == co(i+1) or ci(q) != ai(p))
        throw operation_error(operation_error_kind::invalid_pattern,
                "entry (" + std::to_string(i) + "," + std::to_string(ai(p)) +
                ") of the added matrix is not in the pattern of the output");
      dest[p] = q;
    }
  }
  long nc = pc.nnz();
  if(beta == V(0))
    for(long q=0; q<nc; ++q) vc(q) = V(0);
  else if(beta != V(1))
    for(long q=0; q<nc; ++q) vc(q) *= beta;
  for(long p=0; p<pa.nnz(); ++p)
    vc(dest[p]) += alpha * va(p);
}

/*
 * vc = beta*vc + alpha*(a*b) on compressed row storages, pc must contain the product pattern.
 * Throws operation_error::invalid_pattern before modifying vc otherwise.
 */
template<typename Pattern, typename VA, typename VB, typename VC, typename V>
void spmm_storage(V alpha, Pattern const& pa, VA const& va, Pattern const& pb, VB const& vb,
                  V beta, Pattern const& pc, VC&& vc)
{
  utils::check(pa.minor_dim() == pb.major_dim() and pc.major_dim() == pa.major_dim() and
               pc.minor_dim() == pb.minor_dim(),
               "spmm: Shape mismatch: ({},{}) x ({},{}) -> ({},{})",
               pa.major_dim(), pa.minor_dim(), pb.major_dim(), pb.minor_dim(),
               pc.major_dim(), pc.minor_dim());
  auto const& ao = pa.major_offsets();
  auto const& ai = pa.minor_indices();
  auto const& bo = pb.major_offsets();
  auto const& bi = pb.minor_indices();
  auto const& co = pc.major_offsets();
  auto const& ci = pc.minor_indices();
  ::nda::array<V,1> prod = ::nda::array<V,1>::zeros({pc.nnz()});
  std::vector<long> pos(pc.minor_dim(), -1);
  for(long i=0; i<pa.major_dim(); ++i) {
    for(long q=co(i); q<co(i+1); ++q) pos[ci(q)] = q;
    for(long p=ao(i); p<ao(i+1); ++p) {
      long k = ai(p);
      for(long r=bo(k); r<bo(k+1); ++r) {
        long j = bi(r);
        if(pos[j] < 0)
          throw operation_error(operation_error_kind::invalid_pattern,
                  "entry (" + std::to_string(i) + "," + std::to_string(j) +
                  ") of the product is not in the pattern of the output");
        prod(pos[j]) += va(p) * vb(r);
      }
    }
    for(long q=co(i); q<co(i+1); ++q) pos[ci(q)] = -1;
  }
  long nc = pc.nnz();
  if(beta == V(0))
    for(long q=0; q<nc; ++q) vc(q) = alpha * prod(q);
  else
    for(long q=0; q<nc; ++q) vc(q) = beta * vc(q) + alpha * prod(q);
}

}

/**
 * C = beta*C + alpha*op(A), A and C in CSR format.
 * The pattern of C must contain the pattern of op(A), otherwise
 * operation_error::invalid_pattern is thrown and C is left untouched.
 */
template<detail::TaggedCompressedMatrix A_t, CSRMatrix MC>
requires(CSRMatrix<detail::arg_t<A_t>>)
void spadd_csr_prealloc(typename MC::value_type alpha, A_t const& a, typename MC::value_type beta, MC& c)
{
  auto opa = detail::apply_op(a);
  auto const& A = opa.get();
  detail::spadd_storage(alpha, A.pattern(), A.values(), beta, c.pattern(), c.values());
}

/**
 * C = beta*C + alpha*op(A), A and C in CSC format.
 */
template<detail::TaggedCompressedMatrix A_t, CSCMatrix MC>
requires(CSCMatrix<detail::arg_t<A_t>>)
void spadd_csc_prealloc(typename MC::value_type alpha, A_t const& a, typename MC::value_type beta, MC& c)
{
  auto opa = detail::apply_op(a);
  auto const& A = opa.get();
  detail::spadd_storage(alpha, A.pattern(), A.values(), beta, c.pattern(), c.values());
}

/**
 * C = beta*C + alpha*op(A)*op(B), all in CSR format.
 * The pattern of C must contain the pattern of the product, otherwise
 * operation_error::invalid_pattern is thrown and C is left untouched.
 */
template<detail::TaggedCompressedMatrix A_t, detail::TaggedCompressedMatrix B_t, CSRMatrix MC>
requires(CSRMatrix<detail::arg_t<A_t>> and CSRMatrix<detail::arg_t<B_t>>)
void spmm_csr_prealloc(typename MC::value_type alpha, A_t const& a, B_t const& b,
                       typename MC::value_type beta, MC& c)
{
  auto opa = detail::apply_op(a);
  auto opb = detail::apply_op(b);
  auto const& A = opa.get();
  auto const& B = opb.get();
  detail::spmm_storage(alpha, A.pattern(), A.values(), B.pattern(), B.values(),
                       beta, c.pattern(), c.values());
}

/**
 * C = beta*C + alpha*op(A)*op(B), all in CSC format.
 * Works on the storages as C^T = op(B)^T * op(A)^T.
 */
template<detail::TaggedCompressedMatrix A_t, detail::TaggedCompressedMatrix B_t, CSCMatrix MC>
requires(CSCMatrix<detail::arg_t<A_t>> and CSCMatrix<detail::arg_t<B_t>>)
void spmm_csc_prealloc(typename MC::value_type alpha, A_t const& a, B_t const& b,
                       typename MC::value_type beta, MC& c)
{
  auto opa = detail::apply_op(a);
  auto opb = detail::apply_op(b);
  auto const& A = opa.get();
  auto const& B = opb.get();
  detail::spmm_storage(alpha, B.pattern(), B.values(), A.pattern(), A.values(),
                       beta, c.pattern(), c.values());
}

}

#endif
