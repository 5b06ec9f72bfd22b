#ifndef ZKMATRIX_MATRIX_MATRIX_OPERATIONS_H_
#define ZKMATRIX_MATRIX_MATRIX_OPERATIONS_H_

#include <array>
#include <cstddef>
#include <cstdint>

#include "gsl/gsl-lite.hpp"

#include "zkmatrix/algebra/scalar_traits.h"
#include "zkmatrix/error_handling/error_handling.h"
#include "zkmatrix/matrix/matrix.h"

namespace zkmatrix {

/*
  The operations below are pure: they take their operands by const reference and return a new
  value. Operand shapes are constrained by the signatures, so a call with incompatible shapes does
  not compile.

  Every sum is a left fold in ascending index order starting from ScalarTraits<T>::Zero(), and
  every product keeps the operand order written in the formulas. Both matter when T's operations
  are not associative or not commutative.
*/

// --- Elementwise operations ---

/*
  result[i][j] = a[i][j] + b[i][j].
*/
template <size_t M, size_t N, typename T>
Matrix<M, N, T> Add(const Matrix<M, N, T>& a, const Matrix<M, N, T>& b);

/*
  result[i][j] = a[i][j] - b[i][j].
*/
template <size_t M, size_t N, typename T>
Matrix<M, N, T> Sub(const Matrix<M, N, T>& a, const Matrix<M, N, T>& b);

/*
  result[i][j] = scalar * a[i][j]. The scalar is the left operand of the product.
*/
template <size_t M, size_t N, typename T>
Matrix<M, N, T> ScalarMult(const Matrix<M, N, T>& a, const TypeIdentityT<T>& scalar);

// --- Products ---

/*
  Multiplies an MxN matrix by an NxK matrix using the classic triple loop:
    result[i][j] = Zero() + a[i][0] * b[0][j] + ... + a[i][N-1] * b[N-1][j].
  Costs exactly M*N*K element multiplications and M*N*K element additions.
*/
template <size_t M, size_t N, size_t K, typename T>
Matrix<M, K, T> Mult(const Matrix<M, N, T>& a, const Matrix<N, K, T>& b);

/*
  Returns sum_i u[i] * v[i].
*/
template <size_t N, typename T>
T DotProduct(const std::array<T, N>& u, const std::array<T, N>& v);

/*
  Same as DotProduct, for sequences whose lengths are known only at runtime. Fails if the lengths
  differ.
*/
template <typename T>
T InnerProduct(gsl::span<const T> u, gsl::span<const T> v);

/*
  Returns a * v, where v is a column vector: result[i] = DotProduct(row i of a, v).
*/
template <size_t M, size_t N, typename T>
std::array<T, M> MatrixVectorMult(const Matrix<M, N, T>& a, const std::array<T, N>& v);

/*
  Returns a^exp using square-and-multiply, so Pow(a, 0) is the identity matrix.
  The grouping of the products differs from a left-to-right chain, hence the result equals
  a * a * ... * a only when T's multiplication is associative.
*/
template <size_t N, typename T>
Matrix<N, N, T> Pow(const Matrix<N, N, T>& a, uint64_t exp);

// --- Shape operations ---

/*
  result[j][i] = a[i][j].
*/
template <size_t M, size_t N, typename T>
Matrix<N, M, T> Transpose(const Matrix<M, N, T>& a);

/*
  Returns the sum of the diagonal. Only square matrices are accepted.
*/
template <size_t N, typename T>
T Trace(const Matrix<N, N, T>& a);

// --- Operators ---

template <size_t M, size_t N, typename T>
Matrix<M, N, T> operator+(const Matrix<M, N, T>& a, const Matrix<M, N, T>& b) {
  return Add(a, b);
}

template <size_t M, size_t N, typename T>
Matrix<M, N, T> operator-(const Matrix<M, N, T>& a, const Matrix<M, N, T>& b) {
  return Sub(a, b);
}

template <size_t M, size_t N, size_t K, typename T>
Matrix<M, K, T> operator*(const Matrix<M, N, T>& a, const Matrix<N, K, T>& b) {
  return Mult(a, b);
}

}  // namespace zkmatrix

#include "zkmatrix/matrix/matrix_operations.inl"

#endif  // ZKMATRIX_MATRIX_MATRIX_OPERATIONS_H_
