#include "spa/coordinates.hpp"

#include <boost/math/constants/constants.hpp>
#include <cmath>
#include <string>

#include "spa/angles.hpp"
#include "spa/errors.hpp"
#include "spa/shape.hpp"

namespace spa {

Spherical cart_to_sph(const NDArray<double> &x_in,
                      const NDArray<double> &y_in,
                      const NDArray<double> &z_in,
                      bool steady_colatitude)
{
  Eigen::ArrayXd x = asarray_1d(x_in);
  Eigen::ArrayXd y = asarray_1d(y_in);
  Eigen::ArrayXd z = asarray_1d(z_in);

  Eigen::Index n = broadcast_size({x.size(), y.size(), z.size()});
  x = broadcast_to(x, n);
  y = broadcast_to(y, n);
  z = broadcast_to(z, n);

  Spherical sph;
  sph.radius = (x.square() + y.square() + z.square()).sqrt();
  sph.azimuth = y.binaryExpr(x, [](double y_, double x_) { return std::atan2(y_, x_); });

  if (steady_colatitude)
    sph.colatitude = (z / sph.radius.max(steady_radius_floor)).acos();
  else
    sph.colatitude = (z / sph.radius).acos();

  return sph;
}

Cartesian sph_to_cart(const NDArray<double> &azimuth_in,
                      const NDArray<double> &colatitude_in,
                      const NDArray<double> &radius_in)
{
  Eigen::ArrayXd azimuth = asarray_1d(azimuth_in);
  Eigen::ArrayXd colatitude = asarray_1d(colatitude_in);
  Eigen::ArrayXd radius = asarray_1d(radius_in);

  Eigen::Index n = broadcast_size({azimuth.size(), colatitude.size(), radius.size()});
  azimuth = broadcast_to(azimuth, n);
  colatitude = broadcast_to(colatitude, n);
  radius = broadcast_to(radius, n);

  Cartesian cart;
  cart.x = radius * azimuth.cos() * colatitude.sin();
  cart.y = radius * azimuth.sin() * colatitude.sin();
  cart.z = radius * colatitude.cos();
  return cart;
}

Cartesian sph_to_cart_elevation(const NDArray<double> &azimuth_in,
                                const NDArray<double> &elevation_in,
                                const NDArray<double> &radius_in)
{
  Eigen::ArrayXd azimuth = asarray_1d(azimuth_in);
  Eigen::ArrayXd elevation = asarray_1d(elevation_in);
  Eigen::ArrayXd radius = asarray_1d(radius_in);

  Eigen::Index n = broadcast_size({azimuth.size(), elevation.size(), radius.size()});
  azimuth = broadcast_to(azimuth, n);
  elevation = broadcast_to(elevation, n);
  radius = broadcast_to(radius, n);

  Eigen::ArrayXd r_cos_elevation = radius * elevation.cos();

  Cartesian cart;
  cart.x = r_cos_elevation * azimuth.cos();
  cart.y = r_cos_elevation * azimuth.sin();
  cart.z = radius * elevation.sin();
  return cart;
}

Eigen::MatrixX2d vecs_to_dirs(const Eigen::Ref<const Eigen::MatrixXd> &vectors, bool positive_azimuth)
{
  if (vectors.cols() != 3)
    throw DimensionMismatchError("vecs_to_dirs: expected rows of [x, y, z], got " +
                                 std::to_string(vectors.cols()) + " columns");

  Spherical sph = cart_to_sph(vectors.col(0), vectors.col(1), vectors.col(2));

  if (positive_azimuth) {
    const double two_pi = boost::math::constants::two_pi<double>();
    sph.azimuth = sph.azimuth.unaryExpr([two_pi](double az) { return wrap(az, two_pi); });
  }

  Eigen::MatrixX2d dirs(vectors.rows(), 2);
  dirs.col(0) = sph.azimuth.matrix();
  dirs.col(1) = sph.colatitude.matrix();
  return dirs;
}

}  // namespace spa
