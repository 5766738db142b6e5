#include "spa/shape.hpp"

#include <string>

namespace spa {

Eigen::Index broadcast_size(std::initializer_list<Eigen::Index> sizes)
{
  Eigen::Index n = 1;
  bool found = false;
  for (auto size : sizes) {
    if (size == 1) continue;
    if (found && size != n)
      throw DimensionMismatchError("sequences of length " + std::to_string(n) + " and " +
                                   std::to_string(size) + " can not be broadcast together");
    n = size;
    found = true;
  }
  return n;
}

Eigen::ArrayXd broadcast_to(const Eigen::ArrayXd &a, Eigen::Index n)
{
  if (a.size() == n) return a;
  if (a.size() != 1)
    throw DimensionMismatchError("can not broadcast a sequence of length " + std::to_string(a.size()) +
                                 " to length " + std::to_string(n));
  return Eigen::ArrayXd::Constant(n, a(0));
}

}  // namespace spa
