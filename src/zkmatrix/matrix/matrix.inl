namespace zkmatrix {

template <size_t M, size_t N, typename T>
Matrix<M, N, T>::Matrix()
    : data_(GenerateData(
          [](size_t /*row*/, size_t /*col*/) { return ScalarTraits<T>::Zero(); },
          std::make_index_sequence<M>())) {}

template <size_t M, size_t N, typename T>
Matrix<M, N, T>::Matrix(std::initializer_list<RowType> rows)
    : data_(GenerateData(
          [first = CheckedRows(rows)](size_t row, size_t col) { return first[row][col]; },
          std::make_index_sequence<M>())) {}

template <size_t M, size_t N, typename T>
auto Matrix<M, N, T>::CheckedRows(std::initializer_list<RowType> rows) -> const RowType* {
  ASSERT_RELEASE(
      rows.size() == M,
      "Expected " + std::to_string(M) + " rows, got " + std::to_string(rows.size()) + ".");
  return rows.begin();
}

template <size_t M, size_t N, typename T>
auto Matrix<M, N, T>::Identity() -> Matrix {
  static_assert(M == N, "Identity is defined only for square matrices.");
  return Generate([](size_t row, size_t col) {
    return row == col ? ScalarTraits<T>::One() : ScalarTraits<T>::Zero();
  });
}

template <size_t M, size_t N, typename T>
auto Matrix<M, N, T>::FromRowMajor(gsl::span<const T> values) -> Matrix {
  ASSERT_RELEASE(
      values.size() == M * N, "Expected " + std::to_string(M * N) + " values for a " +
                                  std::to_string(M) + "x" + std::to_string(N) + " matrix, got " +
                                  std::to_string(values.size()) + ".");
  return Generate([&values](size_t row, size_t col) { return values[row * N + col]; });
}

template <size_t M, size_t N, typename T>
auto Matrix<M, N, T>::FromRows(const std::vector<std::vector<T>>& rows) -> Matrix {
  ASSERT_RELEASE(
      rows.size() == M,
      "Expected " + std::to_string(M) + " rows, got " + std::to_string(rows.size()) + ".");
  for (size_t i = 0; i < M; ++i) {
    ASSERT_RELEASE(
        rows[i].size() == N, "Row " + std::to_string(i) + " has " +
                                 std::to_string(rows[i].size()) + " elements, expected " +
                                 std::to_string(N) + ".");
  }
  return Generate([&rows](size_t row, size_t col) { return rows[row][col]; });
}

template <size_t M, size_t N, typename T>
const T& Matrix<M, N, T>::At(size_t row, size_t col) const {
  ASSERT_RELEASE(
      row < M && col < N, "Index (" + std::to_string(row) + ", " + std::to_string(col) +
                              ") is out of range for a " + std::to_string(M) + "x" +
                              std::to_string(N) + " matrix.");
  return data_[row][col];
}

template <size_t M, size_t N, typename T>
gsl::span<const T> Matrix<M, N, T>::Row(size_t row) const {
  ASSERT_RELEASE(
      row < M, "Row " + std::to_string(row) + " is out of range for a matrix with " +
                   std::to_string(M) + " rows.");
  return gsl::span<const T>(data_[row].data(), N);
}

template <size_t M, size_t N, typename T>
std::string Matrix<M, N, T>::ToString() const {
  std::stringstream s;
  s << "[";
  for (size_t i = 0; i < M; ++i) {
    if (i != 0) {
      s << ", ";
    }
    s << "[";
    for (size_t j = 0; j < N; ++j) {
      if (j != 0) {
        s << ", ";
      }
      s << data_[i][j];
    }
    s << "]";
  }
  s << "]";
  return s.str();
}

template <size_t M, size_t N, typename T>
std::ostream& operator<<(std::ostream& out, const Matrix<M, N, T>& matrix) {
  return out << matrix.ToString();
}

}  // namespace zkmatrix
