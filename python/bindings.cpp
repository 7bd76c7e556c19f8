// python/bindings.cpp — Pybind11 bindings for the ratkit module.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include <pybind11/pybind11.h>

#include <ratkit/ratkit.hpp>

namespace py = pybind11;
namespace core = ratkit::core;

static py::int_ to_python_int(const core::bigint& value) {
    const auto builtins = py::module_::import("builtins");
    return builtins.attr("int")(ratkit::io::to_string(value));
}

static core::bigint from_python_int(const py::int_& value) {
    const std::string text = py::str(value).cast<std::string>();
    return core::bigint(text.c_str());
}

PYBIND11_MODULE(ratkit, module) {
    module.doc() = "Python bindings for the ratkit exact rational arithmetic library";

    py::enum_<core::sign_t>(module, "Sign")
        .value("POSITIVE", core::sign_t::positive)
        .value("NEGATIVE", core::sign_t::negative);

    py::class_<core::rational> py_rational(
        module, "Rational", "Exact signed fraction over arbitrary-precision magnitudes");
    py_rational.def(py::init<>())
        .def(py::init([](const py::int_& numerator, const py::int_& denominator) {
                 return core::rational::from_bigint(from_python_int(numerator),
                                                    from_python_int(denominator));
             }),
             py::arg("numerator"),
             py::arg("denominator") = py::int_(1))
        .def_property_readonly("numerator",
                               [](const core::rational& value) {
                                   return to_python_int(value.numerator());
                               })
        .def_property_readonly("denominator",
                               [](const core::rational& value) {
                                   return to_python_int(value.denominator());
                               })
        .def_property_readonly("sign", &core::rational::sign)
        .def("is_zero", &core::rational::is_zero)
        .def("is_positive", &core::rational::is_positive)
        .def("is_reduced", [](const core::rational& value) { return core::is_reduced(value); })
        .def("reduce", [](const core::rational& value) { return core::reduce(value); })
        .def("reciprocal", [](const core::rational& value) { return core::reciprocal(value); })
        .def("integer_part",
             [](const core::rational& value) { return to_python_int(core::integer_part(value)); })
        .def("fractional_part",
             [](const core::rational& value) { return core::fractional_part(value); })
        .def("__add__", [](const core::rational& a, const core::rational& b) { return a + b; })
        .def("__sub__", [](const core::rational& a, const core::rational& b) { return a - b; })
        .def("__mul__", [](const core::rational& a, const core::rational& b) { return a * b; })
        .def("__truediv__", [](const core::rational& a, const core::rational& b) { return a / b; })
        .def("__pow__",
             [](const core::rational& a, std::int64_t exponent) { return core::pow(a, exponent); })
        .def("__neg__", [](const core::rational& a) { return -a; })
        .def("__abs__", [](const core::rational& a) { return core::abs(a); })
        .def("__lt__", [](const core::rational& a, const core::rational& b) { return core::lt(a, b); })
        .def("__le__", [](const core::rational& a, const core::rational& b) { return core::lte(a, b); })
        .def("__eq__", [](const core::rational& a, const core::rational& b) { return a == b; })
        .def("__ne__", [](const core::rational& a, const core::rational& b) { return !(a == b); })
        .def("__gt__", [](const core::rational& a, const core::rational& b) { return core::gt(a, b); })
        .def("__ge__", [](const core::rational& a, const core::rational& b) { return core::gte(a, b); })
        .def("__hash__",
             [](const core::rational& value) { return std::hash<core::rational>{}(value); })
        .def("__str__", [](const core::rational& value) { return ratkit::io::to_string(value); })
        .def("__repr__", [](const core::rational& value) {
            return "<ratkit.Rational " + ratkit::io::to_string(value) + ">";
        });

    module.def(
        "gcd",
        [](const py::int_& a, const py::int_& b) {
            return to_python_int(core::gcd(from_python_int(a), from_python_int(b)));
        },
        py::arg("a"),
        py::arg("b"));
    module.def(
        "lcm",
        [](const py::int_& a, const py::int_& b) {
            const core::bigint lhs = from_python_int(a);
            const core::bigint rhs = from_python_int(b);
            if (lhs.is_zero() && rhs.is_zero()) {
                throw py::value_error("lcm(0, 0) is undefined");
            }
            return to_python_int(core::lcm(lhs, rhs));
        },
        py::arg("a"),
        py::arg("b"));
}
