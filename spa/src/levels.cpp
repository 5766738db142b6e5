#include "spa/levels.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "spa/errors.hpp"
#include "utils.hpp"

namespace spa {

namespace {
  inline double squared_magnitude(double x) { return x * x; }
  inline double squared_magnitude(std::complex<double> x) { return std::norm(x); }

  template <typename T>
  NDArray<double> rms_impl(const NDArray<T> &x, int axis)
  {
    const int ndim = static_cast<int>(x.ndim());
    const int axis_idx = axis < 0 ? axis + ndim : axis;
    if (axis_idx < 0 || axis_idx >= ndim)
      throw ShapeError("rms: axis " + std::to_string(axis) + " is out of bounds for an array with " +
                       std::to_string(ndim) + " dimensions");

    // view x as (outer, length, inner), reducing over the middle
    size_t outer = 1, inner = 1;
    std::vector<size_t> out_shape;
    for (int i = 0; i < ndim; i++) {
      if (i < axis_idx) outer *= x.shape(i);
      if (i > axis_idx) inner *= x.shape(i);
      if (i != axis_idx) out_shape.push_back(x.shape(i));
    }
    const size_t length = x.shape(axis_idx);

    Indexer<3> in_index(outer, length, inner);
    Indexer<2> out_index(outer, inner);
    spa_assert(in_index.size() == x.size(), "rms: inconsistent array size");

    std::vector<double> out(out_index.size());
    for (size_t o = 0; o < outer; o++)
      for (size_t i = 0; i < inner; i++) {
        double acc = 0.0;
        for (size_t k = 0; k < length; k++) acc += squared_magnitude(x.data()[in_index(o, k, i)]);

        out[out_index(o, i)] =
            length ? std::sqrt(acc / length) : std::numeric_limits<double>::quiet_NaN();
      }

    return NDArray<double>(std::move(out_shape), std::move(out));
  }
}  // namespace

NDArray<double> rms(const NDArray<double> &x, int axis) { return rms_impl(x, axis); }

NDArray<double> rms(const NDArray<std::complex<double>> &x, int axis) { return rms_impl(x, axis); }

}  // namespace spa
