#pragma once
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>

#include <string>
#include <vector>

#include "spa/ndarray.hpp"

namespace spa {
namespace python {

  template <typename T>
  using py_array_c = pybind11::array_t<T, pybind11::array::c_style | pybind11::array::forcecast>;

  // copy a numpy array (of any number of dimensions) into an NDArray
  template <typename T>
  NDArray<T> py_array_to_ndarray(const py_array_c<T> &arr)
  {
    std::vector<size_t> shape(arr.shape(), arr.shape() + arr.ndim());
    std::vector<T> data(arr.data(), arr.data() + arr.size());
    return NDArray<T>(std::move(shape), std::move(data));
  }

  // convert anything numpy can turn into an array of T
  template <typename T>
  NDArray<T> py_to_ndarray(const pybind11::handle &obj, const std::string &name)
  {
    auto arr = py_array_c<T>::ensure(obj);
    if (!arr) throw pybind11::type_error(name + " can not be converted to a numeric array");
    return py_array_to_ndarray<T>(arr);
  }

  template <typename T>
  pybind11::array_t<T> ndarray_to_py_array(const NDArray<T> &a)
  {
    return pybind11::array_t<T>(a.shape(), a.data());
  }

  // numpy arrays with a complex dtype take the complex overloads
  inline bool is_complex(const pybind11::handle &obj)
  {
    return pybind11::isinstance<pybind11::array>(obj) &&
           pybind11::reinterpret_borrow<pybind11::array>(obj).dtype().kind() == 'c';
  }

}  // namespace python
}  // namespace spa
