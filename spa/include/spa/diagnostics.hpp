#pragma once
#include <boost/optional.hpp>
#include <string>

#include "ndarray.hpp"

namespace spa {

struct CompareOptions {
  /// printed before the result if set
  boost::optional<std::string> label;
  /// axis of the flattened difference to sum over; everything if unset
  boost::optional<int> axis;
  double tolerance = 1e-6;
  /// log the outcome through spa::logging
  bool verbose = true;
};

/// Cumulative element-wise absolute difference between v1 and v2.
///
/// Both are flattened first. When verbose, logs "Close enough." if the
/// difference is within tolerance and "Diff: <d>" otherwise. A NaN anywhere
/// makes the sum NaN, which is never within tolerance and is logged as
/// "Diff: nan". For debugging only; the difference is returned either way and
/// nothing is enforced.
double compare_arrays(const NDArray<double> &v1,
                      const NDArray<double> &v2,
                      const CompareOptions &options = CompareOptions());

}  // namespace spa
