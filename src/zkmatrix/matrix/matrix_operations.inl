namespace zkmatrix {

namespace matrix_operations {
namespace details {

/*
  Returns the array {func(0), func(1), ..., func(sizeof...(I) - 1)}, evaluated in this order.
  Used instead of filling a default-constructed array, since T may not be default constructible.
*/
template <typename T, typename Func, size_t... I>
std::array<T, sizeof...(I)> GenerateArray(const Func& func, std::index_sequence<I...> /*unused*/) {
  return {{func(I)...}};
}

}  // namespace details
}  // namespace matrix_operations

template <size_t M, size_t N, typename T>
Matrix<M, N, T> Add(const Matrix<M, N, T>& a, const Matrix<M, N, T>& b) {
  const auto& a_data = a.Data();
  const auto& b_data = b.Data();
  return Matrix<M, N, T>::Generate(
      [&](size_t row, size_t col) -> T { return a_data[row][col] + b_data[row][col]; });
}

template <size_t M, size_t N, typename T>
Matrix<M, N, T> Sub(const Matrix<M, N, T>& a, const Matrix<M, N, T>& b) {
  const auto& a_data = a.Data();
  const auto& b_data = b.Data();
  return Matrix<M, N, T>::Generate(
      [&](size_t row, size_t col) -> T { return a_data[row][col] - b_data[row][col]; });
}

template <size_t M, size_t N, typename T>
Matrix<M, N, T> ScalarMult(const Matrix<M, N, T>& a, const TypeIdentityT<T>& scalar) {
  const auto& a_data = a.Data();
  return Matrix<M, N, T>::Generate(
      [&](size_t row, size_t col) -> T { return scalar * a_data[row][col]; });
}

template <size_t M, size_t N, size_t K, typename T>
Matrix<M, K, T> Mult(const Matrix<M, N, T>& a, const Matrix<N, K, T>& b) {
  const auto& a_data = a.Data();
  const auto& b_data = b.Data();
  return Matrix<M, K, T>::Generate([&](size_t row, size_t col) -> T {
    T sum = ScalarTraits<T>::Zero();
    for (size_t k = 0; k < N; ++k) {
      sum = sum + a_data[row][k] * b_data[k][col];
    }
    return sum;
  });
}

template <size_t N, typename T>
T DotProduct(const std::array<T, N>& u, const std::array<T, N>& v) {
  T sum = ScalarTraits<T>::Zero();
  for (size_t i = 0; i < N; ++i) {
    sum = sum + u[i] * v[i];
  }
  return sum;
}

template <typename T>
T InnerProduct(gsl::span<const T> u, gsl::span<const T> v) {
  ASSERT_RELEASE(
      u.size() == v.size(), "Size mismatch: cannot multiply a vector of length " +
                                std::to_string(u.size()) + " by a vector of length " +
                                std::to_string(v.size()) + ".");
  T sum = ScalarTraits<T>::Zero();
  for (size_t i = 0; i < u.size(); ++i) {
    sum = sum + u[i] * v[i];
  }
  return sum;
}

template <size_t M, size_t N, typename T>
std::array<T, M> MatrixVectorMult(const Matrix<M, N, T>& a, const std::array<T, N>& v) {
  const auto& a_data = a.Data();
  return matrix_operations::details::GenerateArray<T>(
      [&](size_t row) { return DotProduct(a_data[row], v); }, std::make_index_sequence<M>());
}

template <size_t N, typename T>
Matrix<N, N, T> Pow(const Matrix<N, N, T>& a, uint64_t exp) {
  Matrix<N, N, T> power = a;
  Matrix<N, N, T> res = Matrix<N, N, T>::Identity();
  while (exp != 0) {
    if ((exp & 1) == 1) {
      res = Mult(res, power);
    }
    exp >>= 1;
    if (exp != 0) {
      power = Mult(power, power);
    }
  }
  return res;
}

template <size_t M, size_t N, typename T>
Matrix<N, M, T> Transpose(const Matrix<M, N, T>& a) {
  const auto& a_data = a.Data();
  return Matrix<N, M, T>::Generate([&](size_t row, size_t col) { return a_data[col][row]; });
}

template <size_t N, typename T>
T Trace(const Matrix<N, N, T>& a) {
  const auto& a_data = a.Data();
  T sum = ScalarTraits<T>::Zero();
  for (size_t i = 0; i < N; ++i) {
    sum = sum + a_data[i][i];
  }
  return sum;
}

}  // namespace zkmatrix
