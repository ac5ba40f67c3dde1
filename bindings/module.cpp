#include "peerbench/core/version.hpp"
#include <pybind11/pybind11.h>

namespace py = pybind11;

namespace peerbench {
void init_engine_bindings(py::module &m);
}

/// Main Python module definition
PYBIND11_MODULE(peerbench_cpp, m) {
  m.doc() = "peerbench C++ core - KPI computation, peer benchmarks and "
            "tiered query serving";

  // Version information
  m.attr("__version__") = peerbench::Version::get_version_string();
  m.def("get_version", &peerbench::Version::get_version_string,
        "Get library version string");

  // Engine context, build pipeline and query router
  peerbench::init_engine_bindings(m);
}
