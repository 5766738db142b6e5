#include "catch2/catch.hpp"
#include "eigen_utils.hpp"
#include "spa/compose.hpp"
#include "spa/errors.hpp"

using namespace spa;

TEST_CASE("interleave_basic")
{
  Eigen::MatrixXd left(2, 3);
  left << 1, 1, 1,  //
      2, 2, 2;
  Eigen::MatrixXd right(2, 3);
  right << 10, 10, 10,  //
      20, 20, 20;

  Eigen::MatrixXd expected(4, 3);
  expected << 1, 1, 1,  //
      10, 10, 10,       //
      2, 2, 2,          //
      20, 20, 20;

  Eigen::MatrixXd out = interleave_channels(left, right);
  REQUIRE(out == expected);
}

TEST_CASE("interleave_float")
{
  Eigen::MatrixXf left = Eigen::MatrixXf::Random(5, 64);
  Eigen::MatrixXf right = Eigen::MatrixXf::Random(5, 64);

  Eigen::MatrixXf out = interleave_channels(left, right);
  REQUIRE(out.rows() == 10);
  REQUIRE(out.cols() == 64);
  for (Eigen::Index channel = 0; channel < 5; channel++) {
    REQUIRE(out.row(2 * channel) == left.row(channel));
    REQUIRE(out.row(2 * channel + 1) == right.row(channel));
  }
}

TEST_CASE("interleave_shape_mismatch")
{
  Eigen::MatrixXd left = Eigen::MatrixXd::Zero(2, 3);
  Eigen::MatrixXd right = Eigen::MatrixXd::Zero(3, 2);
  REQUIRE_THROWS_AS(interleave_channels(left, right), DimensionMismatchError);

  Eigen::MatrixXd shorter = Eigen::MatrixXd::Zero(2, 2);
  REQUIRE_THROWS_AS(interleave_channels(left, shorter), DimensionMismatchError);
}

TEST_CASE("interleave_ssr")
{
  Eigen::MatrixXf left = Eigen::MatrixXf::Ones(360, 8);
  Eigen::MatrixXf right = Eigen::MatrixXf::Zero(360, 8);

  Eigen::MatrixXf out = interleave_channels(left, right, ChannelLayout::ssr);
  REQUIRE(out.rows() == 720);
  REQUIRE(out(0, 0) == 1.0f);
  REQUIRE(out(1, 0) == 0.0f);
  REQUIRE(out(718, 7) == 1.0f);
  REQUIRE(out(719, 7) == 0.0f);

  Eigen::MatrixXf few = Eigen::MatrixXf::Zero(359, 8);
  REQUIRE_THROWS_AS(interleave_channels(few, few, ChannelLayout::ssr), FormatConstraintError);
  // any other number of channels is fine without the SSR check
  REQUIRE(interleave_channels(few, few).rows() == 718);
}

TEST_CASE("stack_rows")
{
  // shared dimension 1 is the smaller one, so the rows are concatenated
  Eigen::RowVectorXd a = Eigen::RowVectorXd::LinSpaced(5, 0.0, 4.0);
  Eigen::RowVectorXd b = Eigen::RowVectorXd::LinSpaced(5, 5.0, 9.0);

  NDArray<double> out =
      stack(NDArray<double>({1, 5}, {0, 1, 2, 3, 4}), NDArray<double>({1, 5}, {5, 6, 7, 8, 9}));
  REQUIRE(out.shape() == std::vector<size_t>{2, 5});
  for (size_t i = 0; i < 5; i++) {
    REQUIRE(out(0, i) == a(i));
    REQUIRE(out(1, i) == b(i));
  }

  // 1D vectors are treated as rows
  NDArray<double> from_1d = stack(a, b);
  REQUIRE(from_1d.shape() == std::vector<size_t>{2, 5});
  REQUIRE(from_1d.values() == out.values());
}

TEST_CASE("stack_columns")
{
  // 4x2 and 4x2 share the smaller dimension 2, columns are concatenated
  Eigen::MatrixXd a(4, 2);
  a << 1, 2,  //
      3, 4,   //
      5, 6,   //
      7, 8;
  Eigen::MatrixXd b = (a.array() + 8.0).matrix();

  NDArray<double> out = stack(a, b);
  REQUIRE(out.shape() == std::vector<size_t>{4, 4});
  REQUIRE(out.values() == std::vector<double>{1, 2, 9, 10, 3, 4, 11, 12, 5, 6, 13, 14, 7, 8, 15, 16});

  // the row counts match, but the shared dimension is the larger one
  Eigen::MatrixXd narrow(4, 1);
  narrow << 1, 2, 3, 4;
  REQUIRE_THROWS_AS(stack(narrow, a), DimensionMismatchError);
}

TEST_CASE("stack_matrices")
{
  // 2x5 and 2x5 share the smaller dimension 2, rows are concatenated
  Eigen::MatrixXd a = Eigen::MatrixXd::Constant(2, 5, 1.0);
  Eigen::MatrixXd b = Eigen::MatrixXd::Constant(2, 5, 2.0);
  NDArray<double> out = stack(a, b);
  REQUIRE(out.shape() == std::vector<size_t>{4, 5});
  REQUIRE(out(1, 4) == 1.0);
  REQUIRE(out(2, 0) == 2.0);

  // 5x2 and 5x2 share the smaller dimension 2 as columns
  NDArray<double> tall = stack(Eigen::MatrixXd(a.transpose()), Eigen::MatrixXd(b.transpose()));
  REQUIRE(tall.shape() == std::vector<size_t>{5, 4});
}

TEST_CASE("stack_squeezes")
{
  // two column vectors give a 2 column matrix
  Eigen::MatrixXd col(3, 1);
  col << 1, 2, 3;
  REQUIRE(stack(col, col).shape() == std::vector<size_t>{3, 2});

  // a 1x1 next to a 1x3 row matches on the row rule, which then needs equal
  // column counts
  NDArray<double> row({1, 3}, {1, 2, 3});
  REQUIRE_THROWS_AS(stack(row, 4.0), DimensionMismatchError);

  NDArray<double> pair = stack(NDArray<double>{1.0, 2.0}, NDArray<double>{3.0, 4.0});
  REQUIRE(pair.shape() == std::vector<size_t>{2, 2});
  REQUIRE(pair.values() == std::vector<double>{1, 2, 3, 4});
}

TEST_CASE("stack_no_common_dimension")
{
  Eigen::MatrixXd a = Eigen::MatrixXd::Zero(2, 3);
  Eigen::MatrixXd b = Eigen::MatrixXd::Zero(4, 5);
  REQUIRE_THROWS_AS(stack(a, b), DimensionMismatchError);

  // square inputs have no smaller dimension to stack along
  Eigen::MatrixXd square = Eigen::MatrixXd::Zero(3, 3);
  REQUIRE_THROWS_AS(stack(square, square), DimensionMismatchError);

  // two scalars likewise
  REQUIRE_THROWS_AS(stack(1.0, 2.0), DimensionMismatchError);

  REQUIRE_THROWS_AS(stack(NDArray<double>({1, 1, 2}, {1, 2}), a), ShapeError);
}
