#pragma once
#include <Eigen/Core>
#include <cstddef>
#include <string>
#include <type_traits>

#include "errors.hpp"
#include "ndarray.hpp"

namespace spa {

/// number of channels in the SSR layout
constexpr Eigen::Index ssr_num_channels = 360;

/// channel layout conventions checked by interleave_channels
enum class ChannelLayout {
  any,
  /// 360 channels, one per degree of head rotation
  ssr,
};

/// Stack two vectors or matrices along a common dimension.
///
/// Both are viewed as 2D (M1 x N1 and M2 x N2, vectors as 1 x N). If
/// M1 == M2 and that is the smaller dimension of either, the rows are
/// concatenated; otherwise if N1 == N2 and that is the smaller dimension of
/// either, the columns are concatenated. The row rule is tried first. The
/// result is squeezed.
NDArray<double> stack(const NDArray<double> &v1, const NDArray<double> &v2);

/// Interleave left and right channels (channels x samples) so that output
/// channel 2i is left channel i and 2i+1 is right channel i.
template <typename DerivedL, typename DerivedR>
Eigen::Matrix<typename DerivedL::Scalar, Eigen::Dynamic, Eigen::Dynamic> interleave_channels(
    const Eigen::MatrixBase<DerivedL> &left,
    const Eigen::MatrixBase<DerivedR> &right,
    ChannelLayout layout = ChannelLayout::any)
{
  static_assert(std::is_same<typename DerivedL::Scalar, typename DerivedR::Scalar>::value,
                "left and right channels must have the same sample type");

  if (left.rows() != right.rows() || left.cols() != right.cols())
    throw DimensionMismatchError("left channels (" + std::to_string(left.rows()) + "x" +
                                 std::to_string(left.cols()) + ") and right channels (" +
                                 std::to_string(right.rows()) + "x" + std::to_string(right.cols()) +
                                 ") must have the same dimensions");

  if (layout == ChannelLayout::ssr && left.rows() != ssr_num_channels)
    throw FormatConstraintError("SSR layout requires " + std::to_string(ssr_num_channels) +
                                " channels (channels x samples), got " + std::to_string(left.rows()));

  Eigen::Matrix<typename DerivedL::Scalar, Eigen::Dynamic, Eigen::Dynamic> out(2 * left.rows(), left.cols());
  for (Eigen::Index channel = 0; channel < left.rows(); channel++) {
    out.row(2 * channel) = left.row(channel);
    out.row(2 * channel + 1) = right.row(channel);
  }
  return out;
}

}  // namespace spa
