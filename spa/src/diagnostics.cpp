#include "spa/diagnostics.hpp"

#include <Eigen/Core>
#include <string>

#include "spa/errors.hpp"
#include "spa/logging.hpp"
#include "spa/shape.hpp"

namespace spa {

double compare_arrays(const NDArray<double> &v1, const NDArray<double> &v2, const CompareOptions &options)
{
  if (options.axis && *options.axis != 0 && *options.axis != -1)
    throw ShapeError("compare_arrays: axis " + std::to_string(*options.axis) +
                     " is out of bounds for the flattened difference");

  Eigen::ArrayXd a = Eigen::Map<const Eigen::ArrayXd>(v1.data(), static_cast<Eigen::Index>(v1.size()));
  Eigen::ArrayXd b = Eigen::Map<const Eigen::ArrayXd>(v2.data(), static_cast<Eigen::Index>(v2.size()));

  Eigen::Index n = broadcast_size({a.size(), b.size()});
  double diff = (broadcast_to(a, n) - broadcast_to(b, n)).abs().sum();

  if (options.verbose) {
    std::string prefix = options.label ? *options.label + " -- " : "";
    // NaN counts as a difference
    if (diff <= options.tolerance)
      logging::get()->info("{}Close enough.", prefix);
    else
      logging::get()->warn("{}Diff: {}", prefix, diff);
  }

  return diff;
}

}  // namespace spa
