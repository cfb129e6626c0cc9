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


#ifndef NUMERICS_SPARSE_DETAILS_OPS_AUX_HPP
#define NUMERICS_SPARSE_DETAILS_OPS_AUX_HPP

/*
 * Operation tags for sparse operands: N(a), T(a), H(a)
 */

#include <memory>
#include <optional>
#include <utility>
#include <type_traits>
#include "utilities/check.hpp"
#include "utilities/type_traits.hpp"
#include "nda/nda.hpp"
#include "numerics/sparse/detail/concepts.hpp"

namespace math::sparse::detail
{

template<typename MA>
struct normal_tag
{
  MA arg1;
  using value_type = typename std::decay_t<MA>::value_type;
  normal_tag(MA m) : arg1(std::forward<MA>(m)) {}
  normal_tag()                     = delete;
  normal_tag(normal_tag const&)    = delete;
  normal_tag(normal_tag&&)         = default;
  static const char tag            = 'N';
};

template<typename MA>
struct transpose_tag
{
  MA arg1;
  using value_type = typename std::decay_t<MA>::value_type;
  transpose_tag(MA m) : arg1(std::forward<MA>(m)) {}
  transpose_tag()                        = delete;
  transpose_tag(transpose_tag const&)    = delete;
  transpose_tag(transpose_tag&&)         = default;
  static const char tag                  = 'T';
};

template<typename MA>
struct conjugate_transpose_tag
{
  MA arg1;
  using value_type = typename std::decay_t<MA>::value_type;
  conjugate_transpose_tag(MA m) : arg1(std::forward<MA>(m)) {}
  conjugate_transpose_tag()                                  = delete;
  conjugate_transpose_tag(conjugate_transpose_tag const&)    = delete;
  conjugate_transpose_tag(conjugate_transpose_tag&&)         = default;
  static const char tag                                      = 'C';
};

// untagged operands behave as N(a)
template<class MA>
struct tag_traits
{
  static constexpr char value = 'N';
  static constexpr bool tagged = false;
  static MA const& arg(MA const& a) { return a; }
};

template<class MA>
struct tag_traits<normal_tag<MA>>
{
  static constexpr char value = 'N';
  static constexpr bool tagged = true;
  static auto const& arg(normal_tag<MA> const& t) { return t.arg1; }
};

template<class MA>
struct tag_traits<transpose_tag<MA>>
{
  static constexpr char value = 'T';
  static constexpr bool tagged = true;
  static auto const& arg(transpose_tag<MA> const& t) { return t.arg1; }
};

template<class MA>
struct tag_traits<conjugate_transpose_tag<MA>>
{
  static constexpr char value = 'C';
  static constexpr bool tagged = true;
  static auto const& arg(conjugate_transpose_tag<MA> const& t) { return t.arg1; }
};

template<class MA>
inline constexpr char op_tag_v = tag_traits<std::decay_t<MA>>::value;

template<typename M>
inline constexpr bool is_tagged_matrix = tag_traits<std::decay_t<M>>::tagged;

// extract matrix
template<class MA>
auto const& arg(MA const& a) { return tag_traits<std::decay_t<MA>>::arg(a); }

template<class MA>
using arg_t = std::decay_t<decltype(arg(std::declval<MA const&>()))>;

template<class MA>
concept TaggedCompressedMatrix = CompressedMatrix<MA> or
                                 (is_tagged_matrix<MA> and CompressedMatrix<arg_t<MA>>);

// op acting on the transposed operand: op(A)^T == transpose_op(op)(A)
constexpr char transpose_op(char op)
{
  switch(op) {
    case 'N': return 'T';
    case 'T': return 'N';
    case 'C': return 'R';
    case 'R': return 'C';
  }
  return op;
}

/*
 * op(A) in the format of A. For N(a) refers to the argument, otherwise holds
 * a transposed (and conjugated for H) copy.
 */
template<CompressedMatrix M>
class applied_op
{
public:
  applied_op(M const& a, char op) : ptr_(std::addressof(a))
  {
    if(op == 'T' or op == 'C') {
      holder_.emplace(a.transpose());
      if(op == 'C')
        for(auto& v : holder_->values()) v = utils::conj(v);
    }
  }
  M const& get() const { return (holder_ ? *holder_ : *ptr_); }
private:
  M const* ptr_;
  std::optional<M> holder_;
};

template<TaggedCompressedMatrix A_t>
auto apply_op(A_t const& a)
{
  return applied_op<arg_t<A_t>>(arg(a), op_tag_v<A_t>);
}

} // math::sparse::detail

#endif
