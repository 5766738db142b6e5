#pragma once
#include <Eigen/Core>
#include <cmath>
#include <complex>
#include <type_traits>

#include "ndarray.hpp"

namespace spa {

namespace detail {
  /// real scalar type of T if T is a floating point or complex scalar
  template <typename T>
  struct real_scalar : std::enable_if<std::is_floating_point<T>::value, T> {};

  template <typename T>
  struct real_scalar<std::complex<T>> : real_scalar<T> {};
}  // namespace detail

/// Convert a ratio to decibels.
///
/// With power=false (the default) x is an amplitude ratio and is
/// effectively squared, i.e. 20 log10|x|; with power=true it is 10 log10|x|.
/// Zero gives -infinity; this is a result, not an error.
template <typename T>
inline typename detail::real_scalar<T>::type db(T x, bool power = false)
{
  using Real = typename detail::real_scalar<T>::type;
  return (power ? Real(10) : Real(20)) * std::log10(std::abs(x));
}

/// element-wise db() for real or complex Eigen arrays; the result is real
template <typename Derived>
Eigen::Array<typename Eigen::NumTraits<typename Derived::Scalar>::Real,
             Derived::RowsAtCompileTime,
             Derived::ColsAtCompileTime>
db(const Eigen::ArrayBase<Derived> &x, bool power = false)
{
  using Real = typename Eigen::NumTraits<typename Derived::Scalar>::Real;
  return (power ? Real(10) : Real(20)) * x.abs().log10();
}

/// convert decibels back to a ratio; power must match the value used in db()
inline double from_db(double db_value, bool power = false)
{
  return std::pow(10.0, db_value / (power ? 10.0 : 20.0));
}

template <typename Derived>
typename Derived::PlainObject from_db(const Eigen::ArrayBase<Derived> &db_values, bool power = false)
{
  using Scalar = typename Derived::Scalar;
  return db_values.unaryExpr(
      [power](Scalar d) { return static_cast<Scalar>(from_db(static_cast<double>(d), power)); });
}

/// root-mean-square along one axis (negative values count from the last
/// axis), keeping all other axes
///
/// Complex input is multiplied with its conjugate, so the result is always
/// real. Reducing over an axis of length 0 gives NaN.
NDArray<double> rms(const NDArray<double> &x, int axis = -1);
NDArray<double> rms(const NDArray<std::complex<double>> &x, int axis = -1);

}  // namespace spa
