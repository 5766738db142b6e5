#pragma once
#include <stdexcept>
#include <string>

namespace spa {

/// input can not be reduced to the number of dimensions an operation needs
class ShapeError : public std::invalid_argument {
 public:
  explicit ShapeError(const std::string &what) : std::invalid_argument(what) {}
};

/// two arrays which have to share a dimension (or be broadcastable against
/// each other) do not
class DimensionMismatchError : public std::invalid_argument {
 public:
  explicit DimensionMismatchError(const std::string &what) : std::invalid_argument(what) {}
};

/// a named channel layout convention is violated
class FormatConstraintError : public std::invalid_argument {
 public:
  explicit FormatConstraintError(const std::string &what) : std::invalid_argument(what) {}
};

}  // namespace spa
