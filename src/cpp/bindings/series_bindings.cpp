/**
 * @file series_bindings.cpp
 * @brief pybind11 bindings for TimeSeries and the renderer interface
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>
#ifdef TSSTAT_USE_EIGEN
#include <pybind11/eigen.h>
#endif

#include <utility>

#include "render/figure_path.hpp"
#include "render/renderer.hpp"
#include "series/time_series.hpp"

namespace py = pybind11;
using namespace tsstat;
using namespace tsstat::series;
using tsstat::render::CallbackRenderer;
using tsstat::render::PlotRequest;
using tsstat::render::Renderer;

namespace {

/// Lets Python classes implement Renderer.render
class PyRenderer : public Renderer {
public:
    using Renderer::Renderer;

    void render(const PlotRequest& request) override {
        PYBIND11_OVERRIDE_PURE(void, Renderer, render, request);
    }
};

}  // anonymous namespace

void bind_render(py::module_& m) {
    // ============== PlotRequest struct ==============
    py::class_<PlotRequest>(m, "PlotRequest",
        R"doc(
        Data and options of one 1D plot.

        Attributes:
            x, y: abscissa and ordinate, same length
            xlabel, ylabel: axis labels
            xlog, ylog: logarithmic axes
            xmin, ymin, ymax: fixed axis bounds or None
            hline, vline: guide lines or None
            save_path: image path, empty to only render
        )doc")
        .def(py::init<>())
        .def_readwrite("x", &PlotRequest::x)
        .def_readwrite("y", &PlotRequest::y)
        .def_readwrite("xlabel", &PlotRequest::xlabel)
        .def_readwrite("ylabel", &PlotRequest::ylabel)
        .def_readwrite("xlog", &PlotRequest::xlog)
        .def_readwrite("ylog", &PlotRequest::ylog)
        .def_readwrite("xmin", &PlotRequest::xmin)
        .def_readwrite("ymin", &PlotRequest::ymin)
        .def_readwrite("ymax", &PlotRequest::ymax)
        .def_readwrite("hline", &PlotRequest::hline)
        .def_readwrite("vline", &PlotRequest::vline)
        .def_readwrite("save_path", &PlotRequest::save_path)
        .def("saves", &PlotRequest::saves, "True if the figure must be written to save_path");

    // ============== Renderer interface ==============
    py::class_<Renderer, PyRenderer>(m, "Renderer",
        R"doc(
        Plotting backend.

        Subclass and override render(request). Implementations must write
        the figure to request.save_path when it is not empty.
        )doc")
        .def(py::init<>())
        .def("render", &Renderer::render, py::arg("request"));

    m.def("figure_path", &render::figure_path,
          py::arg("root"), py::arg("id"), py::arg("savename"),
          "root/id/savename.png, or an empty string for an empty savename");
    m.def("figures_root", &render::figures_root,
          py::arg("configured") = "",
          "Figures root: $TSSTAT_FIGS_PATH, else configured, else 'figs'");
}

void bind_time_series(py::module_& m) {
    py::enum_<Statistic>(m, "Statistic")
        .value("TimeAxis", Statistic::TimeAxis)
        .value("RatioToMean", Statistic::RatioToMean)
        .value("Variance", Statistic::Variance)
        .value("Skewness", Statistic::Skewness)
        .value("Autocorrelation", Statistic::Autocorrelation)
        .value("KendallTau", Statistic::KendallTau);

    // ============== SeriesConfig struct ==============
    py::class_<SeriesConfig>(m, "SeriesConfig",
        R"doc(
        Sampling and window parameters of a time series.

        Attributes:
            tmin: time of the first sample (seconds)
            t_interval: spacing between samples (seconds)
            sw_width_mean: window of the ratio to the sliding mean
            sw_width_ews: window of variance/skewness/autocorrelation/tau
            zero_division_value: ratio returned when the sliding mean is 0
            ratio_mode: core.RatioMode, Auto picks Difference for 'autoco*' labels
            figures_root: root directory of saved figures
        )doc")
        .def(py::init<>(),
             "Construct with default parameters")
        .def(py::init<double, double, int, int>(),
             py::arg("tmin"),
             py::arg("t_interval"),
             py::arg("sw_width_mean"),
             py::arg("sw_width_ews"),
             "Construct with specified parameters")
        .def_readwrite("tmin", &SeriesConfig::tmin)
        .def_readwrite("t_interval", &SeriesConfig::t_interval)
        .def_readwrite("sw_width_mean", &SeriesConfig::sw_width_mean)
        .def_readwrite("sw_width_ews", &SeriesConfig::sw_width_ews)
        .def_readwrite("zero_division_value", &SeriesConfig::zero_division_value)
        .def_readwrite("ratio_mode", &SeriesConfig::ratio_mode)
        .def_readwrite("figures_root", &SeriesConfig::figures_root)
        .def("is_valid", &SeriesConfig::is_valid,
             "Check if parameters describe a usable sampling")
        .def("validate", &SeriesConfig::validate,
             "Validate parameters and raise ValueError if invalid")
        .def("__repr__", &SeriesConfig::to_string);

    // ============== SeriesDescription struct ==============
    py::class_<SeriesDescription>(m, "SeriesDescription",
        "Descriptive strings of a time series")
        .def(py::init<>())
        .def(py::init([](std::string desc_long, std::string desc_short, std::string label,
                         std::string name) {
                 return SeriesDescription{std::move(desc_long), std::move(desc_short),
                                          std::move(label), std::move(name)};
             }),
             py::arg("desc_long") = "",
             py::arg("desc_short") = "",
             py::arg("label") = "",
             py::arg("name") = "")
        .def_readwrite("desc_long", &SeriesDescription::desc_long)
        .def_readwrite("desc_short", &SeriesDescription::desc_short)
        .def_readwrite("label", &SeriesDescription::label)
        .def_readwrite("name", &SeriesDescription::name);

    // ============== StatsContext struct ==============
    py::class_<StatsContext>(m, "StatsContext",
        "Sampling and figure id inherited from the object a series describes")
        .def(py::init<>())
        .def(py::init([](std::string id, double tmin, double t_interval, int sw_width) {
                 return StatsContext{std::move(id), tmin, t_interval, sw_width};
             }),
             py::arg("id"),
             py::arg("tmin") = 0.0,
             py::arg("t_interval") = 300.0,
             py::arg("sw_width") = 40)
        .def_readwrite("id", &StatsContext::id)
        .def_readwrite("tmin", &StatsContext::tmin)
        .def_readwrite("t_interval", &StatsContext::t_interval)
        .def_readwrite("sw_width", &StatsContext::sw_width);

    // ============== PlotOptions struct ==============
    py::class_<PlotOptions>(m, "PlotOptions", "Options of TimeSeries.plot1d")
        .def(py::init<>())
        .def_readwrite("xlog", &PlotOptions::xlog)
        .def_readwrite("ylog", &PlotOptions::ylog)
        .def_readwrite("ymin", &PlotOptions::ymin)
        .def_readwrite("ymax", &PlotOptions::ymax)
        .def_readwrite("save", &PlotOptions::save)
        .def_readwrite("hline", &PlotOptions::hline)
        .def_readwrite("vline", &PlotOptions::vline)
        .def_readwrite("ibeg_remove", &PlotOptions::ibeg_remove)
        .def_readwrite("iend_remove", &PlotOptions::iend_remove);

    // ============== TimeSeries class ==============
    py::class_<TimeSeries>(m, "TimeSeries",
        R"doc(
        Time-dependent variable with lazily computed rolling statistics.

        Derived sequences (t_pts, ratio_to_sw_mean, variance, skewness,
        autocorrelation, kendall_tau) are None until their set_* method
        runs, then cached. Pass rerun=True to recompute.

        Example:
            >>> ts = TimeSeries([1.0, 2.0, 4.0, 3.0], SeriesConfig(0.0, 300.0, 2, 2))
            >>> ts.set_kendall_tau()
            >>> ts.kendall_tau
        )doc")
        .def(py::init<>(), "Empty series")
        .def(py::init<std::optional<std::vector<double>>, const SeriesConfig&,
                      const SeriesDescription&, const std::string&, bool>(),
             py::arg("values"),
             py::arg("config") = SeriesConfig(),
             py::arg("description") = SeriesDescription(),
             py::arg("savename") = "",
             py::arg("record_all") = false)
        .def(py::init<std::optional<std::vector<double>>, const StatsContext&,
                      const SeriesConfig&, const SeriesDescription&, const std::string&,
                      bool>(),
             py::arg("values"),
             py::arg("context"),
             py::arg("config") = SeriesConfig(),
             py::arg("description") = SeriesDescription(),
             py::arg("savename") = "",
             py::arg("record_all") = false)
        .def("exists", &TimeSeries::exists, "True if the series holds values")
        .def_property_readonly("n_pts", &TimeSeries::n_pts)
        .def_property_readonly("val", &TimeSeries::values)
        .def_property_readonly("config", &TimeSeries::config)
        .def_property_readonly("description", &TimeSeries::description)
        .def_property_readonly("savename", &TimeSeries::savename)
        .def_property_readonly("t_pts", &TimeSeries::t_pts)
        .def_property_readonly("ratio_to_sw_mean", &TimeSeries::ratio_to_sw_mean)
        .def_property_readonly("variance", &TimeSeries::variance)
        .def_property_readonly("skewness", &TimeSeries::skewness)
        .def_property_readonly("autocorrelation", &TimeSeries::autocorrelation)
        .def_property_readonly("kendall_tau", &TimeSeries::kendall_tau)
        .def("sequence", &TimeSeries::sequence, py::arg("which"))
#ifdef TSSTAT_USE_EIGEN
        .def("sequence_eigen", &TimeSeries::sequence_eigen, py::arg("which"),
             "Cached sequence as a NumPy array, None until computed")
#endif
        .def("set_all_vars", &TimeSeries::set_all_vars)
        .def("set_t_pts", &TimeSeries::set_t_pts, py::arg("rerun") = false)
        .def("set_ratio_to_sw_average", &TimeSeries::set_ratio_to_sw_average,
             py::arg("rerun") = false)
        .def("set_variance", &TimeSeries::set_variance, py::arg("rerun") = false)
        .def("set_skewness", &TimeSeries::set_skewness, py::arg("rerun") = false)
        .def("set_autocorrelation", &TimeSeries::set_autocorrelation,
             py::arg("rerun") = false)
        .def("set_kendall_tau", &TimeSeries::set_kendall_tau, py::arg("rerun") = false)
        .def("plot_request", &TimeSeries::plot_request,
             py::arg("options") = PlotOptions())
        .def("plot1d", &TimeSeries::plot1d,
             py::arg("renderer"),
             py::arg("options") = PlotOptions(),
             "Plot values versus time through a Renderer")
        .def("plot1d",
             [](TimeSeries& ts, CallbackRenderer::Callback draw, const PlotOptions& options) {
                 CallbackRenderer renderer(std::move(draw));
                 ts.plot1d(renderer, options);
             },
             py::arg("draw"),
             py::arg("options") = PlotOptions(),
             "Plot values versus time through a callable taking a PlotRequest");
}
