// minblep/bindings/bindings.cpp
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>
#include "minblep/minblep.hpp"

#include <algorithm>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

namespace py = pybind11;

namespace {

template <typename T>
py::array_t<T> to_array(const std::vector<T>& values) {
    py::array_t<T> result(static_cast<py::ssize_t>(values.size()));
    std::copy(values.begin(), values.end(), result.mutable_data());
    return result;
}

void check_naivex(const minblep::MinBleps& t, std::int64_t naivex) {
    if (!t.is_normalized(naivex)) throw std::out_of_range("naivex out of range");
}

void python_log(minblep::LogLevel level, std::string_view message) {
    py::gil_scoped_acquire gil;
    auto logger = py::module_::import("logging").attr("getLogger")("minblep");
    switch (level) {
        case minblep::LogLevel::Debug:   logger.attr("debug")(std::string(message)); break;
        case minblep::LogLevel::Info:    logger.attr("info")(std::string(message)); break;
        case minblep::LogLevel::Warning: logger.attr("warning")(std::string(message)); break;
        case minblep::LogLevel::Error:   logger.attr("error")(std::string(message)); break;
    }
}

}  // namespace

PYBIND11_MODULE(minblep_core, m) {
    m.doc() = "minBLEP table bindings";

    // --- Constants ---
    m.attr("DEFAULT_CUTOFF") = minblep::DEFAULT_CUTOFF;
    m.attr("DEFAULT_TRANSITION") = minblep::DEFAULT_TRANSITION;
    m.attr("__version__") = std::string(minblep::Version::string());

    // --- Errors ---
    py::register_exception<minblep::ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    py::register_exception<minblep::CacheError>(m, "CacheError", PyExc_OSError);

    m.def("resolve_scale", &minblep::resolve_scale,
        py::arg("naiverate"), py::arg("outrate"), py::arg("scale") = py::none());

    // Route library messages to the Python "minblep" logger
    m.def("enable_logging", []() { minblep::set_log_handler(python_log); });
    m.def("disable_logging", []() { minblep::set_log_handler(nullptr); });

    // --- Table ---
    py::class_<minblep::MinBleps>(m, "MinBleps")
        .def_static("create", &minblep::MinBleps::create,
            py::arg("naiverate"), py::arg("outrate"), py::arg("scale") = py::none(),
            py::arg("cutoff") = minblep::DEFAULT_CUTOFF,
            py::arg("transition") = minblep::DEFAULT_TRANSITION)
        .def_static("load_or_create",
            [](int naiverate, int outrate, std::optional<int> scale, double cutoff, double transition) {
                return minblep::MinBleps::load_or_create(naiverate, outrate, scale, cutoff, transition);
            },
            py::arg("naiverate"), py::arg("outrate"), py::arg("scale") = py::none(),
            py::arg("cutoff") = minblep::DEFAULT_CUTOFF,
            py::arg("transition") = minblep::DEFAULT_TRANSITION)
        .def_property_readonly("naiverate", &minblep::MinBleps::naiverate)
        .def_property_readonly("outrate", &minblep::MinBleps::outrate)
        .def_property_readonly("scale", &minblep::MinBleps::scale)
        .def_property_readonly("mixinsize", &minblep::MinBleps::mixin_size)
        .def_property_readonly("minblep", [](const minblep::MinBleps& t) { return to_array(t.minblep()); })
        .def_property_readonly("demultiplexed", [](const minblep::MinBleps& t) { return to_array(t.demultiplexed()); })
        .def_property_readonly("naivex2outx", [](const minblep::MinBleps& t) { return to_array(t.maps().naivex2outx); })
        .def_property_readonly("naivex2shape", [](const minblep::MinBleps& t) { return to_array(t.maps().naivex2shape); })
        .def_property_readonly("naivex2off", [](const minblep::MinBleps& t) { return to_array(t.maps().naivex2off); })
        .def_property_readonly("outx2minnaivex", [](const minblep::MinBleps& t) { return to_array(t.maps().outx2minnaivex); })
        .def("getoutcount", [](const minblep::MinBleps& t, std::int64_t naivex, std::int64_t naiven) {
            check_naivex(t, naivex);
            if (naiven < 0) throw std::out_of_range("naiven must not be negative");
            return t.get_out_count(naivex, naiven);
        }, py::arg("naivex"), py::arg("naiven"))
        .def("getminnaiven", [](const minblep::MinBleps& t, std::int64_t naivex, std::int64_t outcount) {
            check_naivex(t, naivex);
            if (outcount < 0) throw std::out_of_range("outcount must not be negative");
            return t.get_min_naive_n(naivex, outcount);
        }, py::arg("naivex"), py::arg("outcount"))

        // Accumulates into outbuf in place. outbuf is never converted: a
        // converted copy would take the result and leave the caller's array as it was.
        .def("paste", [](const minblep::MinBleps& t, std::int32_t naivex,
                         py::array_t<float, py::array::c_style | py::array::forcecast> diffbuf,
                         py::array_t<float, py::array::c_style> outbuf) {
            check_naivex(t, naivex);
            if (diffbuf.ndim() != 1 || outbuf.ndim() != 1) throw std::invalid_argument("Buffers must be 1-dimensional");
            t.paste(naivex,
                    std::span<const float>(diffbuf.data(), static_cast<std::size_t>(diffbuf.size())),
                    std::span<float>(outbuf.mutable_data(), static_cast<std::size_t>(outbuf.size())));
        }, py::arg("naivex"), py::arg("diffbuf"), py::arg("outbuf").noconvert());
}
