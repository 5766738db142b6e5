#include "spa/compose.hpp"

#include <vector>

#include "spa/shape.hpp"
#include "utils.hpp"

namespace spa {

namespace {
  std::string shape_str(size_t rows, size_t cols) { return std::to_string(rows) + "x" + std::to_string(cols); }

  NDArray<double> vstack(const NDArray<double> &a, const NDArray<double> &b)
  {
    if (a.shape(1) != b.shape(1))
      throw DimensionMismatchError("can not stack rows of " + shape_str(a.shape(0), a.shape(1)) + " and " +
                                   shape_str(b.shape(0), b.shape(1)) + ": column counts differ");

    // row-major, so the rows of b simply follow the rows of a
    std::vector<double> data(a.values());
    data.insert(data.end(), b.values().begin(), b.values().end());
    return NDArray<double>({a.shape(0) + b.shape(0), a.shape(1)}, std::move(data));
  }

  NDArray<double> hstack(const NDArray<double> &a, const NDArray<double> &b)
  {
    if (a.shape(0) != b.shape(0))
      throw DimensionMismatchError("can not stack columns of " + shape_str(a.shape(0), a.shape(1)) +
                                   " and " + shape_str(b.shape(0), b.shape(1)) + ": row counts differ");

    const size_t rows = a.shape(0), cols = a.shape(1) + b.shape(1);
    Indexer<2> out_index(rows, cols);

    std::vector<double> data(out_index.size());
    for (size_t row = 0; row < rows; row++) {
      for (size_t col = 0; col < a.shape(1); col++) data[out_index(row, col)] = a(row, col);
      for (size_t col = 0; col < b.shape(1); col++) data[out_index(row, a.shape(1) + col)] = b(row, col);
    }
    return NDArray<double>({rows, cols}, std::move(data));
  }
}  // namespace

NDArray<double> stack(const NDArray<double> &v1_in, const NDArray<double> &v2_in)
{
  NDArray<double> v1 = atleast_2d(v1_in);
  NDArray<double> v2 = atleast_2d(v2_in);

  const size_t m1 = v1.shape(0), n1 = v1.shape(1);
  const size_t m2 = v2.shape(0), n2 = v2.shape(1);

  if (m1 == m2 && (m1 < n1 || m2 < n2))
    return squeeze(vstack(v1, v2));
  else if (n1 == n2 && (n1 < m1 || n2 < m2))
    return squeeze(hstack(v1, v2));
  else
    throw DimensionMismatchError("can not stack " + shape_str(m1, n1) + " and " + shape_str(m2, n2) +
                                 ": no common dimension");
}

}  // namespace spa
