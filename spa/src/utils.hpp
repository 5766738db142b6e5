#pragma once
#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace spa {

/// helper to convert between N-dimensional indices and a 1-dimensional
/// flattened representation
template <int N>
class Indexer {
 public:
  template <typename... Sizes>
  Indexer(Sizes... sizes_) : sizes{static_cast<size_t>(sizes_)...}
  {
    size_t stride = 1;
    for (int i = N - 1; i >= 0; i--) {
      strides[i] = stride;
      stride *= sizes[i];
    }
  }

  template <typename... Indices>
  size_t operator()(Indices... indices) const
  {
    size_t indices_arr[N] = {static_cast<size_t>(indices)...};
    size_t idx = 0;
    for (size_t i = 0; i < N; i++) idx += strides[i] * indices_arr[i];
    return idx;
  }

  size_t size() const { return sizes[0] * strides[0]; }

  std::array<size_t, N> sizes;
  std::array<size_t, N> strides;
};

inline void spa_assert(bool condition, const std::string &message)
{
  if (!condition) throw std::logic_error(message);
}

}  // namespace spa
