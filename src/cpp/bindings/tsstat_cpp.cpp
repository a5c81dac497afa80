/**
 * @file tsstat_cpp.cpp
 * @brief Main pybind11 module combining all C++ bindings
 *
 * This creates the 'tsstat_cpp' Python extension module that exposes the
 * rolling statistics engine and its plotting hook to Python.
 */

#include <pybind11/pybind11.h>

namespace py = pybind11;

// Forward declarations of binding functions
void bind_rolling(py::module_& m);
void bind_render(py::module_& m);
void bind_time_series(py::module_& m);

/**
 * @brief Main Python module definition
 *
 * Creates submodules for each layer:
 * - core: window statistics and trailing-window drivers
 * - render: renderer interface and plot requests
 * - series: TimeSeries and its parameter structs
 */
PYBIND11_MODULE(tsstat_cpp, m) {
    m.doc() = R"doc(
        Rolling Statistics C++ Extension Module

        Rolling statistics over a uniformly sampled time series: ratio to
        the sliding mean, variance, skewness, lag-1 autocorrelation and
        Kendall's tau trend coefficient.

        Submodules:
            core: window statistics and rolling drivers on plain lists
            render: Renderer interface implemented by plotting backends
            series: TimeSeries with lazily cached derived sequences

        Example:
            >>> from tsstat_cpp import series
            >>> cfg = series.SeriesConfig(tmin=0.0, t_interval=300.0,
            ...                           sw_width_mean=40, sw_width_ews=10)
            >>> ts = series.TimeSeries(values, cfg, record_all=True)
            >>> ts.kendall_tau[-1]

            >>> # Plot with matplotlib
            >>> def draw(req):
            ...     plt.plot(req.x, req.y)
            ...     if req.save_path:
            ...         plt.savefig(req.save_path)
            >>> ts.plot1d(draw, series.PlotOptions())
    )doc");

    py::module_ core_module = m.def_submodule("core",
        R"doc(
        Window statistics and trailing-window drivers.

        Functions:
            variance, skewness, autocorrelation, kendall_tau_c: one window
            rolling_variance, rolling_skewness, rolling_autocorrelation,
            rolling_kendall_tau: inclusive trailing windows, min_periods=1
            ratio_to_trailing_mean: exclusive trailing window
            time_axis: uniform time points
        )doc");

    py::module_ render_module = m.def_submodule("render",
        R"doc(
        Plotting hook.

        Classes:
            PlotRequest: data and options of one 1D plot
            Renderer: subclass and override render(request)
        )doc");

    py::module_ series_module = m.def_submodule("series",
        R"doc(
        Time series with cached rolling statistics.

        Classes:
            SeriesConfig: sampling and window parameters
            SeriesDescription: descriptive strings used by plots
            StatsContext: sampling and id inherited from a parent object
            PlotOptions: options of TimeSeries.plot1d
            TimeSeries: values plus lazily computed derived sequences
        )doc");

    bind_rolling(core_module);
    bind_render(render_module);
    bind_time_series(series_module);

    // Add version information
    m.attr("__version__") = "0.1.0";
}
