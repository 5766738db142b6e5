#include "spa/metrics.hpp"

#include <Eigen/Geometry>
#include <algorithm>
#include <boost/math/constants/constants.hpp>
#include <cmath>
#include <string>

#include "spa/errors.hpp"
#include "spa/shape.hpp"

namespace spa {

namespace {
  Eigen::Vector3d to_3d(const Eigen::Ref<const Eigen::VectorXd> &p, const char *name)
  {
    if (p.size() == 3) return p;
    if (p.size() == 2) return Eigen::Vector3d(p(0), p(1), 0.0);
    throw DimensionMismatchError(std::string("triangle_area: ") + name + " must have 2 or 3 coordinates, got " +
                                 std::to_string(p.size()));
  }
}  // namespace

Eigen::ArrayXd angle_between(const NDArray<double> &v1_in,
                             const Eigen::Ref<const Eigen::MatrixXd> &v2_in,
                             const boost::optional<NDArray<double>> &vertex)
{
  Eigen::VectorXd v1 = asarray_1d(v1_in).matrix();
  Eigen::MatrixXd v2 = v2_in;

  // a single vector given as a column
  if (v2.cols() != v1.size() && v2.cols() == 1 && v2.rows() == v1.size()) v2.transposeInPlace();

  if (v2.cols() != v1.size())
    throw DimensionMismatchError("angle_between: v1 has " + std::to_string(v1.size()) +
                                 " coordinates but v2 has " + std::to_string(v2.cols()));

  if (vertex) {
    Eigen::VectorXd vi = asarray_1d(*vertex).matrix();
    if (vi.size() != v1.size())
      throw DimensionMismatchError("angle_between: vertex has " + std::to_string(vi.size()) +
                                   " coordinates but v1 has " + std::to_string(v1.size()));
    v1 -= vi;
    v2.rowwise() -= vi.transpose();
  }

  Eigen::ArrayXd cos_angle = (v2 * v1).array() / (v2.rowwise().norm().array() * v1.norm());

  // rounding can take the cosine slightly outside [-1, 1]; NaN is left alone
  return cos_angle.unaryExpr([](double c) {
    if (std::isnan(c)) return c;
    return std::acos(std::min(1.0, std::max(-1.0, c)));
  });
}

Eigen::ArrayXd haversine(const NDArray<double> &azimuth1_in,
                         const NDArray<double> &colatitude1_in,
                         const NDArray<double> &azimuth2_in,
                         const NDArray<double> &colatitude2_in,
                         const NDArray<double> &radius_in)
{
  Eigen::ArrayXd azimuth1 = asarray_1d(azimuth1_in);
  Eigen::ArrayXd colatitude1 = asarray_1d(colatitude1_in);
  Eigen::ArrayXd azimuth2 = asarray_1d(azimuth2_in);
  Eigen::ArrayXd colatitude2 = asarray_1d(colatitude2_in);
  Eigen::ArrayXd radius = asarray_1d(radius_in);

  Eigen::Index n = broadcast_size(
      {azimuth1.size(), colatitude1.size(), azimuth2.size(), colatitude2.size(), radius.size()});

  const double half_pi = boost::math::constants::half_pi<double>();
  Eigen::ArrayXd lat1 = half_pi - broadcast_to(colatitude1, n);
  Eigen::ArrayXd lat2 = half_pi - broadcast_to(colatitude2, n);

  Eigen::ArrayXd dlon = broadcast_to(azimuth2, n) - broadcast_to(azimuth1, n);
  Eigen::ArrayXd dlat = lat2 - lat1;

  Eigen::ArrayXd haversin_alpha =
      (dlat / 2.0).sin().square() + lat1.cos() * lat2.cos() * (dlon / 2.0).sin().square();

  // antipodal points can round to just above 1
  return 2.0 * broadcast_to(radius, n) * haversin_alpha.min(1.0).sqrt().asin();
}

double triangle_area(const Eigen::Ref<const Eigen::VectorXd> &p1,
                     const Eigen::Ref<const Eigen::VectorXd> &p2,
                     const Eigen::Ref<const Eigen::VectorXd> &p3)
{
  if (p1.size() != p2.size() || p1.size() != p3.size())
    throw DimensionMismatchError("triangle_area: corners must have the same number of coordinates");

  Eigen::Vector3d a = to_3d(p1, "p1");
  Eigen::Vector3d b = to_3d(p2, "p2");
  Eigen::Vector3d c = to_3d(p3, "p3");

  return 0.5 * (b - a).cross(c - a).norm();
}

}  // namespace spa
