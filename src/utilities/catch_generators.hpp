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


#ifndef UTILITIES_CATCH_GENERATORS_HPP
#define UTILITIES_CATCH_GENERATORS_HPP

#include "configuration.hpp"

#if defined(ENABLE_PROPTEST_SUPPORT)

#include <memory>
#include <random>
#include <utility>

#include "catch2/catch.hpp"
#include "numerics/sparse/testing/generators.hpp"

namespace utils
{

/*
 * Catch2 generator drawing values from a callable f(rng).
 * Use with take: GENERATE(take(20, csr_matrices<double>(...)))
 */
template<typename T, typename F>
class random_object_generator final : public Catch::Generators::IGenerator<T>
{
public:
  random_object_generator(unsigned seed, F f) : rng_(seed), f_(std::move(f)), current_(f_(rng_)) {}

  T const& get() const override { return current_; }

  bool next() override
  {
    current_ = f_(rng_);
    return true;
  }

private:
  std::mt19937 rng_;
  F f_;
  T current_;
};

template<typename F>
auto make_random_generator(unsigned seed, F f)
{
  using T = std::decay_t<decltype(f(std::declval<std::mt19937&>()))>;
  return Catch::Generators::GeneratorWrapper<T>(
            std::unique_ptr<Catch::Generators::IGenerator<T>>(
              new random_object_generator<T,F>(seed, std::move(f))));
}

template<typename IndxType = int, typename IntType = long>
auto sparsity_patterns(math::sparse::testing::pattern_strategy s, unsigned seed = 0)
{
  return make_random_generator(seed, [s](std::mt19937& rng) {
    return math::sparse::testing::random_pattern<IndxType,IntType>(rng, s);
  });
}

template<typename V, typename IndxType = int>
auto coo_matrices(math::sparse::testing::dim_range rows, math::sparse::testing::dim_range cols,
                  long max_nnz, unsigned seed = 0)
{
  return make_random_generator(seed, [=](std::mt19937& rng) {
    return math::sparse::testing::random_coo<V,IndxType>(rng, math::sparse::testing::uniform_values<V>{},
                                                         rows, cols, max_nnz);
  });
}

template<typename V, typename IndxType = int, typename IntType = long>
auto csr_matrices(math::sparse::testing::dim_range rows, math::sparse::testing::dim_range cols,
                  long max_nnz, unsigned seed = 0)
{
  return make_random_generator(seed, [=](std::mt19937& rng) {
    return math::sparse::testing::random_csr<V,IndxType,IntType>(rng, math::sparse::testing::uniform_values<V>{},
                                                                 rows, cols, max_nnz);
  });
}

template<typename V, typename IndxType = int, typename IntType = long>
auto csc_matrices(math::sparse::testing::dim_range rows, math::sparse::testing::dim_range cols,
                  long max_nnz, unsigned seed = 0)
{
  return make_random_generator(seed, [=](std::mt19937& rng) {
    return math::sparse::testing::random_csc<V,IndxType,IntType>(rng, math::sparse::testing::uniform_values<V>{},
                                                                 rows, cols, max_nnz);
  });
}

}

#endif

#endif
