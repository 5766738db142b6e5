#include <cmath>
#include <limits>
#include <memory>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

#include "catch2/catch.hpp"
#include "spa/diagnostics.hpp"
#include "spa/errors.hpp"
#include "spa/logging.hpp"

using namespace spa;

namespace {
/// send library log messages to a string for the lifetime of the object
class CaptureLog {
 public:
  CaptureLog() : previous(logging::get())
  {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
    auto logger = std::make_shared<spdlog::logger>("spa_test", sink);
    logger->set_pattern("%l: %v");
    logging::set(logger);
  }
  ~CaptureLog() { logging::set(previous); }

  std::string str() const { return stream.str(); }

 private:
  std::ostringstream stream;
  std::shared_ptr<spdlog::logger> previous;
};
}  // namespace

TEST_CASE("compare_close")
{
  CaptureLog log;
  NDArray<double> a{1.0, 2.0, 3.0};
  NDArray<double> b{1.0, 2.0, 3.0 + 1e-9};

  CompareOptions options;
  options.label = "coords";
  double diff = compare_arrays(a, b, options);

  REQUIRE(diff == Approx(1e-9).margin(1e-12));
  REQUIRE(log.str() == "info: coords -- Close enough.\n");
}

TEST_CASE("compare_diff")
{
  CaptureLog log;
  NDArray<double> a{1.0, 2.0, 3.0};
  NDArray<double> b{2.0, 2.0, 1.0};

  double diff = compare_arrays(a, b);

  REQUIRE(diff == 3.0);
  REQUIRE(log.str() == "warning: Diff: 3\n");
}

TEST_CASE("compare_flattens")
{
  CaptureLog log;
  Eigen::MatrixXd m(2, 2);
  m << 1.0, 2.0, 3.0, 4.0;
  NDArray<double> flat{1.0, 2.0, 3.0, 5.0};

  CompareOptions options;
  options.axis = 0;
  REQUIRE(compare_arrays(m, flat, options) == 1.0);

  options.axis = 1;
  REQUIRE_THROWS_AS(compare_arrays(m, flat, options), ShapeError);

  // a single value is compared against every element
  options.axis = boost::none;
  REQUIRE(compare_arrays(flat, 1.0, options) == 0.0 + 1.0 + 2.0 + 4.0);

  REQUIRE_THROWS_AS(compare_arrays(flat, NDArray<double>{1.0, 2.0}), DimensionMismatchError);
}

TEST_CASE("compare_quiet")
{
  CaptureLog log;
  CompareOptions options;
  options.verbose = false;
  options.tolerance = 0.5;

  REQUIRE(compare_arrays(NDArray<double>{0.0}, NDArray<double>{1.0}, options) == 1.0);
  REQUIRE(log.str().empty());
}

TEST_CASE("compare_nan")
{
  CaptureLog log;
  double nan = std::numeric_limits<double>::quiet_NaN();
  double diff = compare_arrays(NDArray<double>{nan}, NDArray<double>{0.0});
  REQUIRE(std::isnan(diff));
  REQUIRE(log.str() == "warning: Diff: nan\n");
}
