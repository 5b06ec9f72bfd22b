#ifndef ZKMATRIX_MATRIX_MATRIX_TEST_UTILS_H_
#define ZKMATRIX_MATRIX_MATRIX_TEST_UTILS_H_

#include <array>
#include <cstdint>
#include <type_traits>

#include "zkmatrix/algebra/field_element_base.h"
#include "zkmatrix/matrix/matrix.h"
#include "zkmatrix/randomness/prng.h"

namespace zkmatrix {

/*
  Bound for random integer elements, small enough that the products of the matrices used in tests
  do not overflow int64_t.
*/
constexpr int64_t kRandomIntBound = 1000;

template <typename T>
std::enable_if_t<kIsFieldElement<T>, T> RandomScalar(Prng* prng) {
  return T::RandomElement(prng);
}

template <typename T>
std::enable_if_t<std::is_integral<T>::value, T> RandomScalar(Prng* prng) {
  return prng->UniformInt<T>(-kRandomIntBound, kRandomIntBound);
}

template <size_t M, size_t N, typename T>
Matrix<M, N, T> RandomMatrix(Prng* prng) {
  return Matrix<M, N, T>::Generate(
      [prng](size_t /*row*/, size_t /*col*/) { return RandomScalar<T>(prng); });
}

/*
  Returns the N-element vector with One() at index i and Zero() elsewhere.
*/
template <size_t N, typename T>
std::array<T, N> StandardBasisVector(size_t i) {
  return Matrix<N, N, T>::Identity().Data().at(i);
}

}  // namespace zkmatrix

#endif  // ZKMATRIX_MATRIX_MATRIX_TEST_UTILS_H_
