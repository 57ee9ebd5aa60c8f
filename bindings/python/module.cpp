// SPDX-License-Identifier: MIT

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "qcl/classifier.hpp"

namespace py = pybind11;
using namespace qcl;

PYBIND11_MODULE(qcl_python, m){
  py::class_<QclClassifier>(m, "QclClassifier")
    .def(py::init([](std::size_t nqubit, std::size_t c_depth, std::size_t num_class, uint64_t seed, bool verbose){
      ClassifierOptions o;
      o.nqubit = nqubit; o.c_depth = c_depth; o.num_class = num_class; o.seed = seed;
      if (!verbose) o.log = nullptr;
      return QclClassifier(o);
    }), py::arg("nqubit"), py::arg("c_depth"), py::arg("num_class"), py::arg("seed") = 0, py::arg("verbose") = true)
    .def_static("from_file", [](const std::string& path){
      std::string err; auto o = load_options(path, err);
      if (!o) throw std::runtime_error(err);
      return QclClassifier(*o);
    })
    .def("fit", [](QclClassifier& c, const Batch& x, const Batch& y, int maxiter){
      FitResult r = c.fit(x, y, maxiter);
      return py::make_tuple(r.result.fun, r.theta_init, r.theta_opt);
    }, py::arg("x"), py::arg("y"), py::arg("maxiter") = 200)
    .def("predict", &QclClassifier::predict)
    .def("classify", &QclClassifier::classify)
    .def_property_readonly("theta", &QclClassifier::theta);
}
