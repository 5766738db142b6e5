#pragma once
#include <Eigen/Core>
#include <boost/optional.hpp>

#include "ndarray.hpp"

namespace spa {

/// angle in radians between v1 and each row of v2, optionally measured at the
/// initial point vertex rather than the origin
///
/// v2 may also be a single vector given as a column. Zero-length vectors give
/// NaN.
Eigen::ArrayXd angle_between(const NDArray<double> &v1,
                             const Eigen::Ref<const Eigen::MatrixXd> &v2,
                             const boost::optional<NDArray<double>> &vertex = boost::none);

/// great-circle distance between pairs of points given as (azimuth,
/// colatitude) on a sphere of the given radius; for radius 1 this is the
/// central angle
Eigen::ArrayXd haversine(const NDArray<double> &azimuth1,
                         const NDArray<double> &colatitude1,
                         const NDArray<double> &azimuth2,
                         const NDArray<double> &colatitude2,
                         const NDArray<double> &radius = 1.0);

/// area of the triangle with corners p1, p2, p3; points may be 2D or 3D
double triangle_area(const Eigen::Ref<const Eigen::VectorXd> &p1,
                     const Eigen::Ref<const Eigen::VectorXd> &p2,
                     const Eigen::Ref<const Eigen::VectorXd> &p3);

}  // namespace spa
