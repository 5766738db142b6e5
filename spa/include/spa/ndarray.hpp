#pragma once
#include <Eigen/Core>
#include <cassert>
#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace spa {

namespace detail {
  inline size_t calc_index(const size_t *) { return 0u; }

  template <typename Index, typename... Indices>
  inline size_t calc_index(const size_t *strides, Index index, Indices... indices)
  {
    return *strides * index + calc_index(strides + 1, indices...);
  }

  inline size_t num_elements(const std::vector<size_t> &shape)
  {
    size_t n = 1;
    for (auto extent : shape) n *= extent;
    return n;
  }

  inline std::vector<size_t> row_major_strides(const std::vector<size_t> &shape)
  {
    std::vector<size_t> strides(shape.size());
    size_t stride = 1;
    for (size_t i = shape.size(); i-- > 0;) {
      strides[i] = stride;
      stride *= shape[i];
    }
    return strides;
  }

  template <typename Derived, typename T>
  using enable_if_scalar_t = typename std::enable_if<std::is_same<typename Derived::Scalar, T>::value>::type;
}  // namespace detail

/// owning n-dimensional array in row-major order
///
/// This is the type that "array-like" arguments are converted to, so it can be
/// built implicitly from a scalar (0 dimensions), a list or std::vector (1
/// dimension) or an Eigen object. Eigen vectors become 1-dimensional, all
/// other Eigen objects 2-dimensional (rows x cols).
template <typename T>
class NDArray {
 public:
  using value_type = T;

  NDArray() : shape_{0}, strides_{1} {}

  NDArray(T value) : data_{value} {}

  NDArray(std::initializer_list<T> values) : NDArray(std::vector<T>(values)) {}

  NDArray(std::vector<T> values) : shape_{values.size()}, strides_{1}, data_(std::move(values)) {}

  NDArray(std::vector<size_t> shape, std::vector<T> data)
      : shape_(std::move(shape)), strides_(detail::row_major_strides(shape_)), data_(std::move(data))
  {
    if (detail::num_elements(shape_) != data_.size())
      throw std::invalid_argument("NDArray: " + std::to_string(data_.size()) +
                                  " elements do not fit the given shape");
  }

  template <typename Derived, typename = detail::enable_if_scalar_t<Derived, T>>
  NDArray(const Eigen::DenseBase<Derived> &m)
  {
    const Derived &d = m.derived();
    if (Derived::IsVectorAtCompileTime)
      shape_ = {static_cast<size_t>(d.size())};
    else
      shape_ = {static_cast<size_t>(d.rows()), static_cast<size_t>(d.cols())};
    strides_ = detail::row_major_strides(shape_);

    data_.reserve(static_cast<size_t>(d.size()));
    for (Eigen::Index i = 0; i < d.rows(); i++)
      for (Eigen::Index j = 0; j < d.cols(); j++) data_.push_back(d(i, j));
  }

  size_t ndim() const { return shape_.size(); }
  size_t size() const { return data_.size(); }

  const std::vector<size_t> &shape() const { return shape_; }
  size_t shape(size_t i) const { return shape_[i]; }

  const T *data() const { return data_.data(); }
  T *data() { return data_.data(); }

  /// elements in row-major order
  const std::vector<T> &values() const { return data_; }

  template <typename... Indices>
  inline size_t idx(Indices... indices) const
  {
    assert(sizeof...(indices) == strides_.size());
    return detail::calc_index(strides_.data(), indices...);
  }

  template <typename... Indices>
  inline const T &operator()(Indices... indices) const
  {
    return data_[idx(indices...)];
  }

  template <typename... Indices>
  inline T &operator()(Indices... indices)
  {
    return data_[idx(indices...)];
  }

  /// the single element of an array of size 1, whatever its dimensions
  T item() const
  {
    if (data_.size() != 1)
      throw std::invalid_argument("NDArray: item() needs exactly one element, have " +
                                  std::to_string(data_.size()));
    return data_[0];
  }

  /// the same elements viewed with a different shape
  NDArray reshape(std::vector<size_t> shape) const { return NDArray(std::move(shape), data_); }

 private:
  std::vector<size_t> shape_;
  std::vector<size_t> strides_;
  std::vector<T> data_;
};

}  // namespace spa
