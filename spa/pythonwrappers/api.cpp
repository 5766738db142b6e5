#include <pybind11/complex.h>
#include <pybind11/eigen.h>
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>

#include "array_conversion.hpp"
#include "boost_optional.hpp"
#include "spa/spa.hpp"

namespace spa {
namespace python {

  namespace py = pybind11;

  namespace {
    py::tuple to_tuple(const Spherical &sph) { return py::make_tuple(sph.azimuth, sph.colatitude, sph.radius); }
    py::tuple to_tuple(const Cartesian &cart) { return py::make_tuple(cart.x, cart.y, cart.z); }

    NDArray<double> as_nd(const py::handle &obj, const char *name) { return py_to_ndarray<double>(obj, name); }

    ChannelLayout parse_style(const boost::optional<std::string> &style)
    {
      if (style && *style == "SSR") return ChannelLayout::ssr;
      return ChannelLayout::any;
    }
  }  // namespace

  void export_api(py::module &m)
  {
    py::register_exception<ShapeError>(m, "ShapeError", PyExc_ValueError);
    py::register_exception<DimensionMismatchError>(m, "DimensionMismatchError", PyExc_ValueError);
    py::register_exception<FormatConstraintError>(m, "FormatConstraintError", PyExc_ValueError);

    m.def("asarray_1d", [](py::object a) { return Eigen::ArrayXd(asarray_1d(as_nd(a, "a"))); });

    m.def("deg2rad", py::vectorize(static_cast<double (*)(double)>(&deg2rad)));
    m.def("rad2deg", py::vectorize(static_cast<double (*)(double)>(&rad2deg)));

    m.def(
        "cart2sph",
        [](py::object x, py::object y, py::object z, bool steady_colat) {
          return to_tuple(cart_to_sph(as_nd(x, "x"), as_nd(y, "y"), as_nd(z, "z"), steady_colat));
        },
        py::arg("x"),
        py::arg("y"),
        py::arg("z"),
        py::arg("steady_colat") = false);

    m.def(
        "sph2cart",
        [](py::object azi, py::object colat, py::object r) {
          return to_tuple(sph_to_cart(as_nd(azi, "azi"), as_nd(colat, "colat"), as_nd(r, "r")));
        },
        py::arg("azi"),
        py::arg("colat"),
        py::arg("r") = 1.0);

    m.def(
        "sph2cart_elevation",
        [](py::object az, py::object elev, py::object r) {
          return to_tuple(sph_to_cart_elevation(as_nd(az, "az"), as_nd(elev, "elev"), as_nd(r, "r")));
        },
        py::arg("az"),
        py::arg("elev"),
        py::arg("r"));

    m.def("vecs2dirs", &vecs_to_dirs, py::arg("vecs"), py::arg("positive_azi") = true);

    m.def(
        "angle_between",
        [](py::object v1, Eigen::MatrixXd v2, py::object vi) {
          boost::optional<NDArray<double>> vertex;
          if (!vi.is_none()) vertex = as_nd(vi, "vi");
          return angle_between(as_nd(v1, "v1"), v2, vertex);
        },
        py::arg("v1"),
        py::arg("v2"),
        py::arg("vi") = py::none());

    m.def(
        "haversine",
        [](py::object azi1, py::object colat1, py::object azi2, py::object colat2, py::object r) {
          return haversine(as_nd(azi1, "azi1"),
                           as_nd(colat1, "colat1"),
                           as_nd(azi2, "azi2"),
                           as_nd(colat2, "colat2"),
                           as_nd(r, "r"));
        },
        py::arg("azi1"),
        py::arg("colat1"),
        py::arg("azi2"),
        py::arg("colat2"),
        py::arg("r") = 1.0);

    m.def("area_triangle", &triangle_area, py::arg("p1"), py::arg("p2"), py::arg("p3"));

    m.def("db",
          py::vectorize([](std::complex<double> x, bool power) { return db(x, power); }),
          py::arg("x"),
          py::arg("power") = false);
    m.def("from_db",
          py::vectorize([](double x, bool power) { return from_db(x, power); }),
          py::arg("db"),
          py::arg("power") = false);

    m.def(
        "rms",
        [](py::object x, int axis) {
          if (is_complex(x))
            return ndarray_to_py_array(rms(py_to_ndarray<std::complex<double>>(x, "x"), axis));
          return ndarray_to_py_array(rms(as_nd(x, "x"), axis));
        },
        py::arg("x"),
        py::arg("axis") = -1);

    m.def(
        "stack",
        [](py::object vector_1, py::object vector_2) {
          return ndarray_to_py_array(stack(as_nd(vector_1, "vector_1"), as_nd(vector_2, "vector_2")));
        },
        py::arg("vector_1"),
        py::arg("vector_2"));

    m.def(
        "interleave_channels",
        [](Eigen::MatrixXd left, Eigen::MatrixXd right, boost::optional<std::string> style) {
          return interleave_channels(left, right, parse_style(style));
        },
        py::arg("left_channel"),
        py::arg("right_channel"),
        py::arg("style") = py::none());

    m.def(
        "test_diff",
        [](py::object v1,
           py::object v2,
           boost::optional<std::string> msg,
           boost::optional<int> axis,
           double test_lim,
           bool verbose) {
          CompareOptions options;
          options.label = msg;
          options.axis = axis;
          options.tolerance = test_lim;
          options.verbose = verbose;
          return compare_arrays(as_nd(v1, "v1"), as_nd(v2, "v2"), options);
        },
        py::arg("v1"),
        py::arg("v2"),
        py::arg("msg") = py::none(),
        py::arg("axis") = py::none(),
        py::arg("test_lim") = 1e-6,
        py::arg("VERBOSE") = true);
  }

}  // namespace python
}  // namespace spa
