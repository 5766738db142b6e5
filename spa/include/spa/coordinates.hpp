#pragma once
#include <Eigen/Core>

#include "ndarray.hpp"

namespace spa {

/// lower bound for the radius used to calculate the colatitude when
/// steady_colatitude is set
constexpr double steady_radius_floor = 1e-14;

/// points in spherical coordinates; the azimuth is measured anti-clockwise
/// from the x axis, the colatitude down from the +z pole
struct Spherical {
  Eigen::ArrayXd azimuth;
  Eigen::ArrayXd colatitude;
  Eigen::ArrayXd radius;
};

struct Cartesian {
  Eigen::ArrayXd x;
  Eigen::ArrayXd y;
  Eigen::ArrayXd z;
};

/// Cartesian to spherical coordinates.
///
/// x, y and z must each be one-dimensional (after squeezing) and of the same
/// length, or of length 1. The azimuth is in (-pi, pi]. At the origin the
/// colatitude is NaN unless steady_colatitude is set, in which case the
/// radius is clamped to steady_radius_floor for the division.
Spherical cart_to_sph(const NDArray<double> &x,
                      const NDArray<double> &y,
                      const NDArray<double> &z,
                      bool steady_colatitude = false);

/// spherical (azimuth, colatitude) to Cartesian coordinates
Cartesian sph_to_cart(const NDArray<double> &azimuth,
                      const NDArray<double> &colatitude,
                      const NDArray<double> &radius = 1.0);

/// spherical to Cartesian coordinates where the second angle is the
/// elevation above the horizontal plane rather than the colatitude
///
/// elevation = pi/2 - colatitude; the two are not interchangeable.
Cartesian sph_to_cart_elevation(const NDArray<double> &azimuth,
                                const NDArray<double> &elevation,
                                const NDArray<double> &radius);

/// convert rows of [x, y, z] to rows of [azimuth, colatitude]; with
/// positive_azimuth the azimuth is wrapped into [0, 2pi)
Eigen::MatrixX2d vecs_to_dirs(const Eigen::Ref<const Eigen::MatrixXd> &vectors, bool positive_azimuth = true);

}  // namespace spa
