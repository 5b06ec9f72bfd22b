#ifndef ZKMATRIX_MATRIX_MATRIX_H_
#define ZKMATRIX_MATRIX_MATRIX_H_

#include <array>
#include <cstddef>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "gsl/gsl-lite.hpp"

#include "zkmatrix/algebra/scalar_traits.h"
#include "zkmatrix/error_handling/error_handling.h"

namespace zkmatrix {

using std::size_t;

/*
  A dense matrix with M rows and N columns of elements of type T, stored row-major.

  The shape is part of the type, so operations whose operands have incompatible shapes (see
  matrix_operations.h) do not compile. A Matrix cannot be modified after construction; operations
  return new matrices.

  T must satisfy kIsScalar (see scalar_traits.h). Elements are never default constructed: every
  element is produced either by the caller or by ScalarTraits<T>.

  Usage:
    const Matrix<2, 3, int64_t> a({{1, 2, 3}, {4, 5, 6}});
    const Matrix<3, 2, int64_t> b = Transpose(a);
*/
template <size_t M, size_t N, typename T>
class Matrix {
 public:
  static_assert(kIsScalar<T>, "Matrix element type must support +, - and *.");

  using ValueType = T;
  using RowType = std::array<T, N>;
  using DataType = std::array<RowType, M>;

  /*
    Returns the matrix whose elements are all ScalarTraits<T>::Zero().
  */
  Matrix();

  /*
    Builds a matrix from its rows, e.g. Matrix<2, 3, int64_t>({{1, 2, 3}, {4, 5, 6}}). A row with
    more than N elements does not compile. The number of rows is checked at runtime.
  */
  explicit Matrix(std::initializer_list<RowType> rows);

  /*
    Returns the matrix whose (i, j) element is func(i, j). func is invoked exactly once per element,
    rows outer and columns inner.
  */
  template <typename Func>
  static Matrix Generate(const Func& func) {
    return Matrix(GenerateData(func, std::make_index_sequence<M>()));
  }

  /*
    Returns the identity matrix. Defined for square matrices only.
  */
  static Matrix Identity();

  /*
    Builds a matrix from M * N values given in row-major order. The length is checked at
    runtime.
  */
  static Matrix FromRowMajor(gsl::span<const T> values);

  /*
    Builds a matrix from a runtime-shaped list of rows. Fails unless there are exactly M rows of
    exactly N elements each.
  */
  static Matrix FromRows(const std::vector<std::vector<T>>& rows);

  static constexpr size_t NumRows() { return M; }
  static constexpr size_t NumCols() { return N; }

  const T& At(size_t row, size_t col) const;

  gsl::span<const T> Row(size_t row) const;

  const DataType& Data() const { return data_; }

  bool operator==(const Matrix& other) const { return data_ == other.data_; }
  bool operator!=(const Matrix& other) const { return !(*this == other); }

  /*
    Returns the elements as nested lists, e.g. "[[1, 2], [3, 4]]".
  */
  std::string ToString() const;

 private:
  explicit Matrix(const DataType& rows) : data_(rows) {}

  static const RowType* CheckedRows(std::initializer_list<RowType> rows);

  /*
    The two functions below build the rows with the pack expansion {func(row, Cols)...}, so that
    each element is initialized directly from the value returned by func.
  */
  template <typename Func, size_t... Cols>
  static RowType GenerateRow(
      const Func& func, size_t row, std::index_sequence<Cols...> /*unused*/) {
    return {{func(row, Cols)...}};
  }

  template <typename Func, size_t... Rows>
  static DataType GenerateData(const Func& func, std::index_sequence<Rows...> /*unused*/) {
    return {{GenerateRow(func, Rows, std::make_index_sequence<N>())...}};
  }

  DataType data_;
};

template <size_t M, size_t N, typename T>
std::ostream& operator<<(std::ostream& out, const Matrix<M, N, T>& matrix);

/*
  Square matrices are scalars themselves (they form a ring under the operations of
  matrix_operations.h), so a Matrix may be the element type of another Matrix.
*/
template <size_t N, typename T>
struct ScalarTraits<Matrix<N, N, T>> {
  static Matrix<N, N, T> Zero() { return Matrix<N, N, T>(); }
  static Matrix<N, N, T> One() { return Matrix<N, N, T>::Identity(); }
};

}  // namespace zkmatrix

#include "zkmatrix/matrix/matrix.inl"

#endif  // ZKMATRIX_MATRIX_MATRIX_H_
