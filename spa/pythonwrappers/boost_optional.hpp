#pragma once
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <boost/optional.hpp>

namespace pybind11 {
namespace detail {
  template <typename T>
  struct type_caster<boost::optional<T>> : optional_caster<boost::optional<T>> {};

  template <>
  struct type_caster<boost::none_t> : void_caster<boost::none_t> {};
}  // namespace detail
}  // namespace pybind11
