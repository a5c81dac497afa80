/**
 * @file rolling_bindings.cpp
 * @brief pybind11 bindings for window statistics and rolling drivers
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "core/math_utils.hpp"
#include "core/rolling.hpp"

namespace py = pybind11;
using namespace tsstat;

void bind_rolling(py::module_& m) {
    py::enum_<RatioMode>(m, "RatioMode")
        .value("Ratio", RatioMode::Ratio)
        .value("Difference", RatioMode::Difference)
        .value("Auto", RatioMode::Auto);

    // ============== Single-window statistics ==============
    m.def("mean", py::overload_cast<const std::vector<double>&>(&mean),
          py::arg("data"),
          "Arithmetic mean, raises ValueError on an empty list");
    m.def("variance", py::overload_cast<const std::vector<double>&>(&sample_variance),
          py::arg("data"),
          "Unbiased sample variance, NaN for fewer than 2 values");
    m.def("skewness", py::overload_cast<const std::vector<double>&>(&sample_skewness),
          py::arg("data"),
          R"doc(
          Adjusted Fisher-Pearson skewness.

              G1 = sqrt(n(n-1))/(n-2) * m3 / m2^(3/2)

          Returns:
              Skewness, NaN for fewer than 3 values or constant data
          )doc");
    m.def("autocorrelation",
          py::overload_cast<const std::vector<double>&>(&lag1_autocorrelation),
          py::arg("data"),
          "Lag-1 autocorrelation, NaN when undefined");
    m.def("kendall_tau_c", py::overload_cast<const std::vector<double>&>(&kendall_tau_c),
          py::arg("data"),
          R"doc(
          Kendall's tau-c between position (0..n-1) and value.

          Returns:
              tau_c in [-1, 1], NaN for fewer than 2 values or constant data
          )doc");
    m.def("safe_divide", &safe_divide,
          py::arg("num"), py::arg("den"), py::arg("zero_value"),
          "num / den, or zero_value when den == 0");

    // ============== Rolling drivers ==============
    m.def("trailing_mean_exclusive", &trailing_mean_exclusive,
          py::arg("values"), py::arg("width"),
          "Mean over [max(0, i-width), i) for every i; index 0 uses values[0]");
    m.def("ratio_to_trailing_mean", &ratio_to_trailing_mean,
          py::arg("values"),
          py::arg("width"),
          py::arg("mode") = RatioMode::Ratio,
          py::arg("zero_value") = DEFAULT_ZERO_DIVISION_VALUE,
          R"doc(
          Compare each value with the mean of its exclusive trailing window.

          Args:
              values: Input series
              width: Window length in samples
              mode: RatioMode.Ratio or RatioMode.Difference
              zero_value: Result of a division by a zero mean

          Returns:
              List of the same length as values
          )doc");
    m.def("rolling_variance", &rolling_variance,
          py::arg("values"), py::arg("width"),
          "Variance over [max(0, i-width), i] for every i");
    m.def("rolling_skewness", &rolling_skewness,
          py::arg("values"), py::arg("width"),
          "Skewness over [max(0, i-width), i] for every i");
    m.def("rolling_autocorrelation", &rolling_autocorrelation,
          py::arg("values"), py::arg("width"),
          "Lag-1 autocorrelation over [max(0, i-width), i] for every i");
    m.def("rolling_kendall_tau", &rolling_kendall_tau,
          py::arg("values"), py::arg("width"),
          "Kendall's tau-c over [max(0, i-width), i] for every i, 0 where undefined");
    m.def("time_axis", &time_axis,
          py::arg("tmin"), py::arg("dt"), py::arg("n"),
          "Exactly n time points tmin + i*dt");
}
