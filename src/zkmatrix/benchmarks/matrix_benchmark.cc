/*
  Benchmarks of the matrix operations over PrimeFieldElement, for square shapes.
  The cost of Add, ScalarMult and Transpose grows with N^2 and the cost of Mult with N^3; comparing
  the reported times across shapes shows how closely the implementation follows that model.
*/

#include "benchmark/benchmark.h"

#include "zkmatrix/algebra/fields/prime_field_element.h"
#include "zkmatrix/matrix/matrix_operations.h"
#include "zkmatrix/matrix/matrix_test_utils.h"

namespace zkmatrix {
namespace {

using FieldElementT = PrimeFieldElement;

template <size_t N>
void AddBenchmark(benchmark::State& state) {  // NOLINT
  Prng prng;
  const auto a = RandomMatrix<N, N, FieldElementT>(&prng);
  const auto b = RandomMatrix<N, N, FieldElementT>(&prng);
  // NOLINTNEXTLINE: Suppressing warnings for unused variable '_'.
  for (auto _ : state) {
    auto res = Add(a, b);
    benchmark::DoNotOptimize(res);
  }
  state.SetItemsProcessed(state.iterations() * N * N);
}

template <size_t N>
void ScalarMultBenchmark(benchmark::State& state) {  // NOLINT
  Prng prng;
  const auto a = RandomMatrix<N, N, FieldElementT>(&prng);
  const FieldElementT k = FieldElementT::RandomElement(&prng);
  // NOLINTNEXTLINE: Suppressing warnings for unused variable '_'.
  for (auto _ : state) {
    auto res = ScalarMult(a, k);
    benchmark::DoNotOptimize(res);
  }
  state.SetItemsProcessed(state.iterations() * N * N);
}

template <size_t N>
void MultBenchmark(benchmark::State& state) {  // NOLINT
  Prng prng;
  const auto a = RandomMatrix<N, N, FieldElementT>(&prng);
  const auto b = RandomMatrix<N, N, FieldElementT>(&prng);
  // NOLINTNEXTLINE: Suppressing warnings for unused variable '_'.
  for (auto _ : state) {
    auto res = Mult(a, b);
    benchmark::DoNotOptimize(res);
  }
  // Element multiplications.
  state.SetItemsProcessed(state.iterations() * N * N * N);
}

template <size_t N>
void TransposeBenchmark(benchmark::State& state) {  // NOLINT
  Prng prng;
  const auto a = RandomMatrix<N, N, FieldElementT>(&prng);
  // NOLINTNEXTLINE: Suppressing warnings for unused variable '_'.
  for (auto _ : state) {
    auto res = Transpose(a);
    benchmark::DoNotOptimize(res);
  }
  state.SetItemsProcessed(state.iterations() * N * N);
}

// NOLINTNEXTLINE: cppcoreguidelines-owning-memory.
BENCHMARK_TEMPLATE(AddBenchmark, 8);
BENCHMARK_TEMPLATE(AddBenchmark, 16);
BENCHMARK_TEMPLATE(AddBenchmark, 32);
BENCHMARK_TEMPLATE(AddBenchmark, 64);

BENCHMARK_TEMPLATE(ScalarMultBenchmark, 8);
BENCHMARK_TEMPLATE(ScalarMultBenchmark, 16);
BENCHMARK_TEMPLATE(ScalarMultBenchmark, 32);
BENCHMARK_TEMPLATE(ScalarMultBenchmark, 64);

BENCHMARK_TEMPLATE(MultBenchmark, 8);
BENCHMARK_TEMPLATE(MultBenchmark, 16);
BENCHMARK_TEMPLATE(MultBenchmark, 32);
BENCHMARK_TEMPLATE(MultBenchmark, 64);

BENCHMARK_TEMPLATE(TransposeBenchmark, 8);
BENCHMARK_TEMPLATE(TransposeBenchmark, 16);
BENCHMARK_TEMPLATE(TransposeBenchmark, 32);
BENCHMARK_TEMPLATE(TransposeBenchmark, 64);

}  // namespace
}  // namespace zkmatrix
