#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include "debiaser/debiaser.h"
#include "debiaser/types.h"
#include "debiaser/chunk.h"
#include "debiaser/svd.h"

namespace py = pybind11;
using namespace debiaser;

// NumPy arrays arrive as copies (Eigen::MatrixXd by value), so every
// mutating call returns the transformed matrix.

PYBIND11_MODULE(_debiaser_cpp, m) {
    m.doc() = "debiaser C++ backend — covariate-sorted bias removal for depth matrices";

    // ── DebiasMethod ──────────────────────────────────────────────────────────
    py::enum_<DebiasMethod>(m, "DebiasMethod")
        .value("MovingMedian",       DebiasMethod::MovingMedian)
        .value("ChunkRatio",         DebiasMethod::ChunkRatio)
        .value("VarianceTruncation", DebiasMethod::VarianceTruncation);

    // ── DebiasConfig ──────────────────────────────────────────────────────────
    py::class_<DebiasConfig>(m, "DebiasConfig")
        .def(py::init<>())
        .def_readwrite("method",           &DebiasConfig::method)
        .def_readwrite("window",           &DebiasConfig::window)
        .def_readwrite("score_window",     &DebiasConfig::score_window)
        .def_readwrite("min_variance_pct", &DebiasConfig::min_variance_pct)
        .def_readwrite("max_components",   &DebiasConfig::max_components)
        .def_static("parse_method", &parse_debias_method, py::arg("name"));

    // ── Debiaser ──────────────────────────────────────────────────────────────
    py::class_<Debiaser>(m, "Debiaser")
        .def(py::init([](DebiasConfig cfg) {
                 return std::make_unique<Debiaser>(std::move(cfg));
             }),
             py::arg("config") = DebiasConfig{})

        .def("set_covariate",
            [](Debiaser& self, Vector cov) { self.set_covariate(std::move(cov)); },
            py::arg("covariate"))
        .def_property_readonly("covariate",
            [](const Debiaser& self) -> Vector { return self.covariate(); })

        .def("sort",
            [](Debiaser& self, Matrix X) {
                py::gil_scoped_release release;
                self.sort(X);
                return X;
            }, py::arg("X"))

        .def("unsort",
            [](Debiaser& self, Matrix X) {
                py::gil_scoped_release release;
                self.unsort(X);
                return X;
            }, py::arg("X"))

        .def("debias",
            [](Debiaser& self, Matrix X) {
                py::gil_scoped_release release;
                self.debias(X);
                return X;
            }, py::arg("X"))

        .def("run",
            [](Debiaser& self, Matrix X) {
                py::gil_scoped_release release;
                self.run(X);
                return X;
            }, py::arg("X"))

        .def_property_readonly("permutation",
            [](const Debiaser& self) { return self.sorter().permutation(); })
        .def_property_readonly("method",
            [](Debiaser& self) { return self.strategy().method(); })
        .def_property_readonly("requires_sort", &Debiaser::requires_sort);

    // ── Standalone helpers ────────────────────────────────────────────────────
    m.def("chunk_bounds", &chunk_bounds,
          py::arg("sorted_covariate"), py::arg("score_window"),
          "Chunk boundaries [0, ..., n] for an ascending covariate.");

    m.def("count_truncated_components", &count_truncated_components,
          py::arg("singular_values"), py::arg("min_variance_pct"),
          py::arg("max_components") = 15,
          "Number of leading components whose variance share exceeds the threshold.");

    py::register_exception<SvdError>(m, "SvdError");
}
