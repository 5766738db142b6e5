#pragma once
#include <Eigen/Core>
#include <boost/math/constants/constants.hpp>
#include <cmath>

namespace spa {

/// floored modulo: x reduced into [0, period)
inline double wrap(double x, double period)
{
  double r = std::fmod(x, period);
  if (r < 0.0) r += period;
  // a tiny negative remainder plus period can round up to period; also turns -0 into 0
  if (r >= period || r == 0.0) return 0.0;
  return r;
}

/// degrees (any value) to radians in [0, 2pi)
inline double deg2rad(double deg)
{
  const double two_pi = boost::math::constants::two_pi<double>();
  double rad = wrap(deg, 360.0) / 180.0 * boost::math::constants::pi<double>();
  return rad < two_pi ? rad : 0.0;
}

/// radians (any value) to degrees in [0, 360)
inline double rad2deg(double rad) { return wrap(rad / boost::math::constants::pi<double>() * 180.0, 360.0); }

template <typename Derived>
typename Derived::PlainObject deg2rad(const Eigen::ArrayBase<Derived> &deg)
{
  using Scalar = typename Derived::Scalar;
  return deg.unaryExpr([](Scalar d) { return static_cast<Scalar>(deg2rad(static_cast<double>(d))); });
}

template <typename Derived>
typename Derived::PlainObject rad2deg(const Eigen::ArrayBase<Derived> &rad)
{
  using Scalar = typename Derived::Scalar;
  return rad.unaryExpr([](Scalar r) { return static_cast<Scalar>(rad2deg(static_cast<double>(r))); });
}

}  // namespace spa
