#pragma once
#include <Eigen/Core>
#include <initializer_list>
#include <vector>

#include "errors.hpp"
#include "ndarray.hpp"

namespace spa {

/// remove all dimensions of extent 1
template <typename T>
NDArray<T> squeeze(const NDArray<T> &a)
{
  std::vector<size_t> shape;
  for (auto extent : a.shape())
    if (extent != 1) shape.push_back(extent);
  return a.reshape(std::move(shape));
}

/// view a as a 2D array: scalars become 1x1, vectors of length n become 1xn
template <typename T>
NDArray<T> atleast_2d(const NDArray<T> &a)
{
  switch (a.ndim()) {
    case 0:
      return a.reshape({1, 1});
    case 1:
      return a.reshape({1, a.shape(0)});
    case 2:
      return a;
    default:
      throw ShapeError("array must have at most two dimensions");
  }
}

/// squeeze a and check that the result is one-dimensional; scalars are
/// upgraded to a sequence of length 1
template <typename T>
Eigen::Array<T, Eigen::Dynamic, 1> asarray_1d(const NDArray<T> &a)
{
  NDArray<T> result = squeeze(a);
  if (result.ndim() > 1) throw ShapeError("array must be one-dimensional");

  return Eigen::Map<const Eigen::Array<T, Eigen::Dynamic, 1>>(result.data(),
                                                              static_cast<Eigen::Index>(result.size()));
}

/// common length of sequences which are combined element-wise; each length
/// must be either 1 or the common length
Eigen::Index broadcast_size(std::initializer_list<Eigen::Index> sizes);

/// repeat a sequence of length 1 to length n; other sequences must already be
/// of length n
Eigen::ArrayXd broadcast_to(const Eigen::ArrayXd &a, Eigen::Index n);

}  // namespace spa
