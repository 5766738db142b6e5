#include <pybind11/pybind11.h>

namespace spa {
namespace python {
  void export_api(pybind11::module &m);
}  // namespace python
}  // namespace spa

PYBIND11_MODULE(spa, m)
{
  m.doc() = "spatial-audio coordinate, geometry and level utilities";
  spa::python::export_api(m);
}
