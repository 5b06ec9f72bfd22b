#include "zkmatrix/matrix/matrix.h"

#include <sstream>
#include <type_traits>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "zkmatrix/algebra/fields/prime_field_element.h"
#include "zkmatrix/error_handling/test_utils.h"
#include "zkmatrix/matrix/matrix_operations.h"
#include "zkmatrix/matrix/matrix_test_utils.h"

namespace zkmatrix {
namespace {

using testing::ElementsAre;
using testing::HasSubstr;

using FieldElementT = PrimeFieldElement;
using Mat22 = Matrix<2, 2, int64_t>;
using Mat23 = Matrix<2, 3, int64_t>;
using Mat32 = Matrix<3, 2, int64_t>;
using Mat33 = Matrix<3, 3, int64_t>;

TEST(Matrix, DefaultIsZero) {
  const Mat23 m;
  for (size_t i = 0; i < 2; ++i) {
    for (size_t j = 0; j < 3; ++j) {
      EXPECT_EQ(m.At(i, j), 0);
    }
  }
}

TEST(Matrix, DefaultIsZeroForFieldElements) {
  // PrimeFieldElement cannot be default constructed in debug builds; the zeros come from
  // ScalarTraits.
#ifndef NDEBUG
  static_assert(
      !std::is_default_constructible<FieldElementT>::value,
      "Debug builds must reject default constructed field elements.");
#endif
  const Matrix<3, 2, FieldElementT> m;
  for (size_t i = 0; i < 3; ++i) {
    for (size_t j = 0; j < 2; ++j) {
      EXPECT_EQ(m.At(i, j), FieldElementT::Zero());
    }
  }
}

TEST(Matrix, ConstructFromRows) {
  const Mat23 m({{1, 2, 3}, {4, 5, 6}});
  EXPECT_EQ(m.At(0, 0), 1);
  EXPECT_EQ(m.At(0, 2), 3);
  EXPECT_EQ(m.At(1, 0), 4);
  EXPECT_EQ(m.At(1, 2), 6);
  EXPECT_EQ(m.Data()[1][1], 5);

  const gsl::span<const int64_t> row = m.Row(1);
  EXPECT_THAT(std::vector<int64_t>(row.begin(), row.end()), ElementsAre(4, 5, 6));
}

TEST(Matrix, ConstructSingleRow) {
  const Matrix<1, 3, int64_t> row({{7, 8, 9}});
  EXPECT_EQ(row.At(0, 0), 7);
  EXPECT_EQ(row.At(0, 1), 8);
  EXPECT_EQ(row.At(0, 2), 9);

  const Matrix<1, 1, int64_t> single({{4}});
  EXPECT_EQ(single.At(0, 0), 4);

  const Matrix<1, 1, FieldElementT> field_single({{FieldElementT::FromUint(5)}});
  EXPECT_EQ(field_single.At(0, 0), FieldElementT::FromUint(5));

  const Matrix<3, 1, int64_t> column({{1}, {2}, {3}});
  EXPECT_EQ(column.At(2, 0), 3);
}

TEST(Matrix, ConstructWrongNumberOfRows) {
  EXPECT_ASSERT(Mat23({{1, 2, 3}}), HasSubstr("Expected 2 rows, got 1."));
  EXPECT_ASSERT(
      Mat23({{1, 2, 3}, {4, 5, 6}, {7, 8, 9}}), HasSubstr("Expected 2 rows, got 3."));
}

TEST(Matrix, Shape) {
  static_assert(Mat23::NumRows() == 2, "Wrong number of rows.");
  static_assert(Mat23::NumCols() == 3, "Wrong number of columns.");
  static_assert(Matrix<0, 7, int64_t>::NumRows() == 0, "Wrong number of rows.");
}

TEST(Matrix, AtOutOfRange) {
  const Mat23 m;
  EXPECT_ASSERT(m.At(2, 0), HasSubstr("Index (2, 0) is out of range for a 2x3 matrix"));
  EXPECT_ASSERT(m.At(0, 3), HasSubstr("out of range"));
  EXPECT_ASSERT(m.Row(2), HasSubstr("Row 2 is out of range"));
}

TEST(Matrix, Generate) {
  std::vector<size_t> calls;
  const auto m = Mat23::Generate([&calls](size_t row, size_t col) {
    calls.push_back(10 * row + col);
    return static_cast<int64_t>(10 * row + col);
  });
  EXPECT_EQ(m, Mat23({{0, 1, 2}, {10, 11, 12}}));
  // Row outer, column inner, each element once.
  EXPECT_THAT(calls, ElementsAre(0U, 1U, 2U, 10U, 11U, 12U));
}

TEST(Matrix, Identity) {
  EXPECT_EQ(Mat33::Identity(), Mat33({{1, 0, 0}, {0, 1, 0}, {0, 0, 1}}));

  const auto identity = Matrix<2, 2, FieldElementT>::Identity();
  EXPECT_EQ(identity.At(0, 0), FieldElementT::One());
  EXPECT_EQ(identity.At(0, 1), FieldElementT::Zero());
  EXPECT_EQ(identity.At(1, 0), FieldElementT::Zero());
  EXPECT_EQ(identity.At(1, 1), FieldElementT::One());
}

TEST(Matrix, FromRowMajor) {
  const std::vector<int64_t> values = {1, 2, 3, 4, 5, 6};
  EXPECT_EQ(Mat23::FromRowMajor(values), Mat23({{1, 2, 3}, {4, 5, 6}}));
  EXPECT_EQ(Mat32::FromRowMajor(values), Mat32({{1, 2}, {3, 4}, {5, 6}}));

  const std::vector<int64_t> short_values = {1, 2, 3, 4, 5};
  EXPECT_ASSERT(
      Mat23::FromRowMajor(short_values), HasSubstr("Expected 6 values for a 2x3 matrix, got 5."));
}

TEST(Matrix, FromRows) {
  EXPECT_EQ(Mat22::FromRows({{1, 2}, {3, 4}}), Mat22({{1, 2}, {3, 4}}));

  EXPECT_ASSERT(Mat22::FromRows({{1, 2}, {3, 4}, {5, 6}}), HasSubstr("Expected 2 rows, got 3."));
  EXPECT_ASSERT(
      Mat23::FromRows({{1, 2, 3}, {4, 5}}), HasSubstr("Row 1 has 2 elements, expected 3."));
}

TEST(Matrix, Equality) {
  const Mat22 a({{1, 2}, {3, 4}});
  const Mat22 b({{1, 2}, {3, 5}});
  EXPECT_TRUE(a == a);
  EXPECT_FALSE(a == b);
  EXPECT_TRUE(a != b);
  EXPECT_FALSE(a != a);
}

TEST(Matrix, ResultDoesNotAliasOperands) {
  Prng prng;
  const auto a = RandomMatrix<3, 3, FieldElementT>(&prng);
  auto b = a;
  const auto sum = Add(a, b);
  b = Matrix<3, 3, FieldElementT>();
  EXPECT_EQ(sum, Add(a, a));
  EXPECT_EQ(b, (Matrix<3, 3, FieldElementT>()));
}

TEST(Matrix, ToString) {
  EXPECT_EQ(Mat23({{1, 2, 3}, {-4, 5, 6}}).ToString(), "[[1, 2, 3], [-4, 5, 6]]");
  EXPECT_EQ((Matrix<0, 3, int64_t>().ToString()), "[]");
  EXPECT_EQ((Matrix<2, 0, int64_t>().ToString()), "[[], []]");

  const Matrix<1, 2, FieldElementT> m({{FieldElementT::FromUint(255), FieldElementT::Zero()}});
  std::stringstream s;
  s << m;
  EXPECT_EQ(s.str(), "[[0xff, 0x0]]");
}

TEST(Matrix, ZeroSizedShapes) {
  using Empty = Matrix<0, 0, int64_t>;
  EXPECT_EQ(Empty(), Empty::Identity());
  const Matrix<3, 0, int64_t> no_cols;
  EXPECT_TRUE(no_cols.Row(2).empty());
}

TEST(Matrix, SquareMatrixAsScalar) {
  static_assert(kIsScalar<Mat22>, "Square matrices should be scalars.");
  static_assert(!kIsScalar<Mat23>, "Non-square matrices cannot be multiplied by themselves.");

  EXPECT_EQ(ScalarTraits<Mat22>::Zero(), Mat22());
  EXPECT_EQ(ScalarTraits<Mat22>::One(), Mat22::Identity());

  using BlockMatrix = Matrix<2, 2, Mat22>;
  const BlockMatrix block_identity = BlockMatrix::Identity();
  EXPECT_EQ(block_identity.At(0, 0), Mat22::Identity());
  EXPECT_EQ(block_identity.At(0, 1), Mat22());
  EXPECT_EQ(BlockMatrix().At(1, 1), Mat22());
}

}  // namespace
}  // namespace zkmatrix
