#ifndef TSSTAT_MATH_UTILS_HPP
#define TSSTAT_MATH_UTILS_HPP

/**
 * @file math_utils.hpp
 * @brief Window statistics over a contiguous block of samples
 *
 * Provides the per-window quantities used by the rolling drivers:
 * - Moments (mean, sample variance, adjusted skewness)
 * - Lag-1 autocorrelation
 * - Kendall's tau-c trend coefficient against sample position
 * - Division with an explicit zero policy
 *
 * Statistics that are undefined for the given block (too few samples,
 * zero variance) return NaN instead of throwing.
 */

#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace tsstat {

/// Quiet NaN used as the "undefined statistic" sentinel
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/**
 * @brief Arithmetic mean of a block
 * @param data Pointer to the first sample
 * @param n Number of samples
 * @return Arithmetic mean
 * @throws std::invalid_argument if n == 0
 */
double mean(const double* data, size_t n);

/**
 * @brief Arithmetic mean of a vector
 * @throws std::invalid_argument if data is empty
 */
double mean(const std::vector<double>& data);

/**
 * @brief Unbiased sample variance (divides by n-1)
 * @return Sample variance, NaN if n < 2
 */
double sample_variance(const double* data, size_t n);

double sample_variance(const std::vector<double>& data);

/**
 * @brief Adjusted Fisher-Pearson standardized moment coefficient
 *
 *   G1 = sqrt(n(n-1)) / (n-2) * m3 / m2^{3/2}
 *
 * where m2, m3 are the biased central moments.
 *
 * @return Skewness, NaN if n < 3 or the block has zero variance
 */
double sample_skewness(const double* data, size_t n);

double sample_skewness(const std::vector<double>& data);

/**
 * @brief Lag-1 sample autocorrelation
 *
 * Pearson correlation between y[0..n-2] and y[1..n-1].
 *
 * @return Autocorrelation in [-1, 1], NaN if fewer than 2 lagged pairs or
 *         either lagged half is constant
 */
double lag1_autocorrelation(const double* data, size_t n);

double lag1_autocorrelation(const std::vector<double>& data);

/**
 * @brief Kendall's tau-c between sample position and sample value
 *
 * With x = 0..n-1:
 *   tau_c = 2(P - Q) / (n^2 (m-1)/m),  m = min(#distinct x, #distinct y)
 *
 * P and Q count concordant and discordant pairs. Pairs tied in y count as
 * neither.
 *
 * @return tau_c in [-1, 1], NaN if n < 2 or all values are equal
 */
double kendall_tau_c(const double* data, size_t n);

double kendall_tau_c(const std::vector<double>& data);

/**
 * @brief Division with a zero-denominator fallback
 * @param num Numerator
 * @param den Denominator
 * @param zero_value Value returned when den == 0
 */
inline double safe_divide(double num, double den, double zero_value) noexcept {
    return den == 0.0 ? zero_value : num / den;
}

/**
 * @brief Running sum, out[i] = data[0] + ... + data[i]
 */
std::vector<double> cumulative_sum(const std::vector<double>& data);

} // namespace tsstat

#endif // TSSTAT_MATH_UTILS_HPP
