#ifndef TSSTAT_ROLLING_HPP
#define TSSTAT_ROLLING_HPP

/**
 * @file rolling.hpp
 * @brief Trailing-window drivers over a fully materialized series
 *
 * Two window shapes are used:
 * - Exclusive trailing window [max(0, i-w), i) for the ratio-to-mean
 *   (the current sample is compared against its past)
 * - Inclusive trailing window [max(0, i-w), i] for the early-warning
 *   statistics, with min_periods=1: near the start of the series the
 *   statistic is evaluated over whatever samples exist
 *
 * Every driver returns a sequence aligned index-for-index with its input.
 */

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace tsstat {

/**
 * @brief How a sample is compared with its trailing mean
 */
enum class RatioMode {
    Ratio,       ///< val[i] / mean
    Difference,  ///< val[i] - mean
    Auto         ///< Difference for autocorrelation-type labels, Ratio otherwise
};

/// Statistic evaluated on one window (pointer to first sample, sample count)
using WindowStatistic = std::function<double(const double*, size_t)>;

/// Default substitute for x / 0 in the ratio-to-mean
constexpr double DEFAULT_ZERO_DIVISION_VALUE = 1.0;

/**
 * @brief Resolve RatioMode::Auto from a variable label
 *
 * Labels starting with "autoco" are autocorrelation-type variables, whose
 * natural comparison with the past is a difference (they can cross zero).
 */
RatioMode resolve_ratio_mode(RatioMode mode, const std::string& label);

/**
 * @brief Mean over the exclusive trailing window [max(0, i-width), i)
 *
 * Computed from a cumulative sum, O(n) regardless of width. Index 0 has no
 * past, its mean is values[0] itself. For 0 < i <= width the mean runs over
 * all i preceding samples.
 *
 * A window whose values cancel to within rounding has a mean of exactly 0, and
 * a constant window has exactly its common value. Near-zero windows are summed
 * again directly, so heavily cancelling input may cost O(width) per sample.
 *
 * @param values Input series
 * @param width Window length in samples (>= 1)
 * @return Trailing means, same length as values
 * @throws std::invalid_argument if width < 1
 */
std::vector<double> trailing_mean_exclusive(const std::vector<double>& values, int width);

/**
 * @brief Compare each sample with the mean of its exclusive trailing window
 *
 * Ratio mode divides through safe_divide(): a zero trailing mean yields
 * zero_value instead of inf/NaN.
 *
 * @param values Input series
 * @param width Window length in samples (>= 1)
 * @param mode Ratio or Difference (Auto must be resolved beforehand)
 * @param zero_value Substitute for a division by a zero mean
 * @throws std::invalid_argument if width < 1 or mode is Auto
 */
std::vector<double> ratio_to_trailing_mean(const std::vector<double>& values, int width,
                                           RatioMode mode = RatioMode::Ratio,
                                           double zero_value = DEFAULT_ZERO_DIVISION_VALUE);

/**
 * @brief Apply a statistic over the inclusive trailing window [max(0, i-width), i]
 *
 * @param values Input series
 * @param width Window reach in samples (>= 1); full windows hold width+1 samples
 * @param statistic Function evaluated on each window
 * @throws std::invalid_argument if width < 1
 */
std::vector<double> rolling_apply(const std::vector<double>& values, int width,
                                  const WindowStatistic& statistic);

/// Rolling unbiased variance, NaN where the window holds a single sample
std::vector<double> rolling_variance(const std::vector<double>& values, int width);

/// Rolling adjusted skewness, NaN for windows of fewer than 3 samples
std::vector<double> rolling_skewness(const std::vector<double>& values, int width);

/// Rolling lag-1 autocorrelation, NaN where undefined
std::vector<double> rolling_autocorrelation(const std::vector<double>& values, int width);

/**
 * @brief Rolling Kendall's tau-c trend coefficient
 *
 * Undefined windows (single sample, all values tied) give 0, not NaN.
 */
std::vector<double> rolling_kendall_tau(const std::vector<double>& values, int width);

/**
 * @brief Uniform time axis tmin, tmin+dt, ..., tmin+(n-1)dt
 *
 * Each point is computed as tmin + i*dt, so exactly n points are produced
 * and rounding does not accumulate.
 */
std::vector<double> time_axis(double tmin, double dt, size_t n);

} // namespace tsstat

#endif // TSSTAT_ROLLING_HPP
