#ifndef TSSTAT_TIME_SERIES_HPP
#define TSSTAT_TIME_SERIES_HPP

/**
 * @file time_series.hpp
 * @brief Uniformly sampled state variable with cached rolling statistics
 *
 * A TimeSeries holds the values of one variable at times
 *   t_i = tmin + i * t_interval,  i = 0..n-1
 * and derives, on demand, sequences aligned index-for-index with the values:
 * - ratio (or difference) to the mean of the preceding sw_width_mean samples
 * - variance, skewness, lag-1 autocorrelation and Kendall's tau over the
 *   trailing sw_width_ews window (the early-warning signals)
 * - the time axis itself
 *
 * Each derived sequence is computed at most once and cached. A set_* call
 * with rerun = true recomputes it. A series constructed without values is
 * empty: exists() is false and every set_* call is a no-op.
 */

#include <cmath>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef TSSTAT_USE_EIGEN
#include <Eigen/Dense>
#endif

#include "core/rolling.hpp"
#include "render/renderer.hpp"

namespace tsstat::series {

/**
 * @brief Sampling and window parameters of a series
 *
 * Parameters:
 * - tmin: time of the first sample (seconds)
 * - t_interval: spacing between two samples (seconds)
 * - sw_width_mean: window of the ratio-to-mean, in time intervals
 * - sw_width_ews: window of the early-warning statistics, in time intervals
 */
struct SeriesConfig {
    double tmin;                  ///< Time of the first sample
    double t_interval;            ///< Sampling interval
    int sw_width_mean;            ///< Ratio-to-mean window width
    int sw_width_ews;             ///< Variance/skewness/autocorrelation/tau window width
    double zero_division_value = DEFAULT_ZERO_DIVISION_VALUE;  ///< Substitute for x / 0
    RatioMode ratio_mode = RatioMode::Auto;                    ///< Ratio or difference to mean
    std::string figures_root;     ///< Root directory of saved figures (empty: default)

    /// Default constructor
    SeriesConfig() : tmin(0.0), t_interval(300.0), sw_width_mean(40), sw_width_ews(10) {}

    /// Parameterized constructor
    SeriesConfig(double tmin_, double t_interval_, int sw_width_mean_, int sw_width_ews_)
        : tmin(tmin_),
          t_interval(t_interval_),
          sw_width_mean(sw_width_mean_),
          sw_width_ews(sw_width_ews_) {}

    /**
     * @brief Validate parameters
     * @return true if the configuration describes a usable sampling
     */
    bool is_valid() const noexcept {
        return std::isfinite(tmin) && std::isfinite(t_interval) && t_interval > 0.0 &&
               sw_width_mean >= 1 && sw_width_ews >= 1 && !std::isnan(zero_division_value);
    }

    /**
     * @brief Validate and throw if invalid
     */
    void validate() const {
        if (!std::isfinite(tmin)) {
            throw std::invalid_argument("SeriesConfig: tmin must be finite");
        }
        if (!std::isfinite(t_interval) || t_interval <= 0.0) {
            throw std::invalid_argument("SeriesConfig: t_interval must be positive, got " +
                                        std::to_string(t_interval));
        }
        if (sw_width_mean < 1) {
            throw std::invalid_argument("SeriesConfig: sw_width_mean must be >= 1, got " +
                                        std::to_string(sw_width_mean));
        }
        if (sw_width_ews < 1) {
            throw std::invalid_argument("SeriesConfig: sw_width_ews must be >= 1, got " +
                                        std::to_string(sw_width_ews));
        }
        if (std::isnan(zero_division_value)) {
            throw std::invalid_argument("SeriesConfig: zero_division_value must not be NaN");
        }
    }

    /// String representation for logging and debugging
    std::string to_string() const {
        return "SeriesConfig(tmin=" + std::to_string(tmin) +
               ", t_interval=" + std::to_string(t_interval) +
               ", sw_width_mean=" + std::to_string(sw_width_mean) +
               ", sw_width_ews=" + std::to_string(sw_width_ews) +
               ", zero_division_value=" + std::to_string(zero_division_value) + ")";
    }
};

/**
 * @brief Human-readable naming of a series
 */
struct SeriesDescription {
    std::string desc_long;   ///< Long description of the meaning of the variable
    std::string desc_short;  ///< Short description, y-axis label of plots
    std::string label;       ///< Shortened name for plots with limited space
    std::string name;        ///< Generic name of the variable
};

/**
 * @brief Sampling and identity inherited from the object a series describes
 *
 * When given, tmin, t_interval and sw_width override the corresponding
 * SeriesConfig fields (sw_width sets sw_width_mean), and id becomes the
 * figure sub-directory.
 */
struct StatsContext {
    std::string id;
    double tmin = 0.0;
    double t_interval = 300.0;
    int sw_width = 40;
};

/**
 * @brief Options of TimeSeries::plot1d
 */
struct PlotOptions {
    bool xlog = false;
    bool ylog = false;
    std::optional<double> ymin;
    std::optional<double> ymax;
    bool save = true;                 ///< Persist to the series' save path (if it has one)
    std::optional<double> hline;
    std::optional<double> vline;
    size_t ibeg_remove = 0;           ///< Leading points left out of the plot
    size_t iend_remove = 0;           ///< Trailing points left out of the plot
};

/**
 * @brief Derived sequences of a TimeSeries
 */
enum class Statistic {
    TimeAxis,
    RatioToMean,
    Variance,
    Skewness,
    Autocorrelation,
    KendallTau
};

/// Cached derived sequence, std::nullopt until computed
using Sequence = std::optional<std::vector<double>>;

/**
 * @brief Time-dependent variable with lazily computed rolling statistics
 */
class TimeSeries {
public:
    /// Empty series (exists() is false)
    TimeSeries() = default;

    /**
     * @brief Construct from values
     *
     * @param values Sampled values, std::nullopt or empty for an empty series
     * @param config Sampling and window parameters
     * @param description Naming used by plots
     * @param savename Figure file stem, empty for no saving
     * @param record_all Compute every derived sequence immediately
     * @throws std::invalid_argument if config is invalid
     */
    explicit TimeSeries(std::optional<std::vector<double>> values,
                        const SeriesConfig& config = SeriesConfig(),
                        const SeriesDescription& description = SeriesDescription(),
                        const std::string& savename = "", bool record_all = false);

    /**
     * @brief Construct from values sampled like a parent object
     *
     * The context supplies tmin, t_interval, sw_width_mean and the figure
     * sub-directory. sw_width_ews and the remaining options come from config.
     */
    TimeSeries(std::optional<std::vector<double>> values, const StatsContext& context,
               const SeriesConfig& config = SeriesConfig(),
               const SeriesDescription& description = SeriesDescription(),
               const std::string& savename = "", bool record_all = false);

#ifdef TSSTAT_USE_EIGEN
    /**
     * @brief Construct from an Eigen vector
     */
    explicit TimeSeries(const Eigen::VectorXd& values,
                        const SeriesConfig& config = SeriesConfig(),
                        const SeriesDescription& description = SeriesDescription(),
                        const std::string& savename = "", bool record_all = false);
#endif

    /// True if the series holds values
    bool exists() const noexcept { return val_.has_value(); }

    /// Number of samples (0 for an empty series)
    size_t n_pts() const noexcept { return exists() ? val_->size() : 0; }

    const Sequence& values() const noexcept { return val_; }
    const SeriesConfig& config() const noexcept { return config_; }
    const SeriesDescription& description() const noexcept { return description_; }

    /// Full figure path, empty if the series is not meant to be saved
    const std::string& savename() const noexcept { return savename_; }

    const Sequence& t_pts() const noexcept { return t_pts_; }
    const Sequence& ratio_to_sw_mean() const noexcept { return ratio_to_sw_mean_; }
    const Sequence& variance() const noexcept { return variance_; }
    const Sequence& skewness() const noexcept { return skewness_; }
    const Sequence& autocorrelation() const noexcept { return autocorrelation_; }
    const Sequence& kendall_tau() const noexcept { return kendall_tau_; }

    /// Cached sequence by kind
    const Sequence& sequence(Statistic which) const;

#ifdef TSSTAT_USE_EIGEN
    /// Cached sequence as an Eigen vector, std::nullopt until computed
    std::optional<Eigen::VectorXd> sequence_eigen(Statistic which) const;
#endif

    /// Compute every derived sequence that is not cached yet
    void set_all_vars();

    /// Time axis tmin + i * t_interval, exactly n_pts() points
    void set_t_pts(bool rerun = false);

    /**
     * @brief Ratio of val[i] to the mean over [max(0, i-sw_width_mean), i)
     *
     * Uses the difference instead of the ratio for autocorrelation-type
     * series (see RatioMode). A zero trailing mean yields
     * config().zero_division_value.
     */
    void set_ratio_to_sw_average(bool rerun = false);

    /// Unbiased variance over [max(0, i-sw_width_ews), i]
    void set_variance(bool rerun = false);

    /// Adjusted skewness over [max(0, i-sw_width_ews), i]
    void set_skewness(bool rerun = false);

    /// Lag-1 autocorrelation over [max(0, i-sw_width_ews), i]
    void set_autocorrelation(bool rerun = false);

    /// Kendall's tau-c trend over [max(0, i-sw_width_ews), i], 0 where undefined
    void set_kendall_tau(bool rerun = false);

    /**
     * @brief Build the request plot1d hands to a renderer
     *
     * Computes the time axis if it is not cached.
     *
     * @throws std::logic_error if the series is empty
     * @throws std::invalid_argument if more points are removed than exist
     */
    render::PlotRequest plot_request(const PlotOptions& options = PlotOptions());

    /**
     * @brief Plot values versus time through a renderer
     *
     * The figure is saved to savename() when options.save is true and the
     * series has a save path.
     */
    void plot1d(render::Renderer& renderer, const PlotOptions& options = PlotOptions());

private:
    Sequence val_;
    SeriesConfig config_;
    SeriesDescription description_;
    std::string savename_;

    Sequence t_pts_;
    Sequence ratio_to_sw_mean_;
    Sequence variance_;
    Sequence skewness_;
    Sequence autocorrelation_;
    Sequence kendall_tau_;

    /// Shared constructor tail: validation, save path, eager computation
    void init(const std::string& id, const std::string& savename, bool record_all);

    /// Fill cache with compute() unless already present (and rerun is false)
    template <typename Compute>
    void refresh(Sequence& cache, bool rerun, Compute compute);
};

}  // namespace tsstat::series

#endif  // TSSTAT_TIME_SERIES_HPP
