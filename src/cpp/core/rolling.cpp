#include "rolling.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

#include "math_utils.hpp"

namespace tsstat {

namespace {

void check_width(int width) {
    if (width < 1) {
        throw std::invalid_argument("Window width must be at least 1, got " +
                                    std::to_string(width));
    }
}

}  // anonymous namespace

RatioMode resolve_ratio_mode(RatioMode mode, const std::string& label) {
    if (mode != RatioMode::Auto) {
        return mode;
    }
    return label.compare(0, 6, "autoco") == 0 ? RatioMode::Difference : RatioMode::Ratio;
}

std::vector<double> trailing_mean_exclusive(const std::vector<double>& values, int width) {
    check_width(width);

    const size_t n = values.size();
    std::vector<double> means(n);
    if (n == 0) {
        return means;
    }

    const size_t sw = static_cast<size_t>(width);
    const double eps = std::numeric_limits<double>::epsilon();

    // cumul[i] = values[0] + ... + values[i], cumul_abs the same over |values|
    std::vector<double> cumul = cumulative_sum(values);
    std::vector<double> cumul_abs(n);
    // changes[i] = number of k in [1, i] with values[k] != values[k-1]
    std::vector<size_t> changes(n, 0);
    cumul_abs[0] = std::abs(values[0]);
    for (size_t k = 1; k < n; ++k) {
        cumul_abs[k] = cumul_abs[k - 1] + std::abs(values[k]);
        changes[k] = changes[k - 1] + (values[k] != values[k - 1] ? 1 : 0);
    }

    means[0] = values[0];
    for (size_t i = 1; i < n; ++i) {
        const size_t first = i > sw ? i - sw : 0;
        const double count = static_cast<double>(i - first);

        // A constant window averages to its common value exactly
        if (changes[i - 1] == changes[first]) {
            means[i] = values[first];
            continue;
        }

        double window_sum = cumul[i - 1] - (first > 0 ? cumul[first - 1] : 0.0);
        double window_abs = cumul_abs[i - 1] - (first > 0 ? cumul_abs[first - 1] : 0.0);

        // The prefix difference carries rounding from the whole prefix. Inside
        // that bound, resum the window directly before deciding it is zero.
        if (std::abs(window_sum) <= 2.0 * static_cast<double>(i) * eps * cumul_abs[i - 1]) {
            window_sum = std::accumulate(values.begin() + first, values.begin() + i, 0.0);
            window_abs = 0.0;
            for (size_t k = first; k < i; ++k) {
                window_abs += std::abs(values[k]);
            }
            if (std::abs(window_sum) <= count * eps * window_abs) {
                means[i] = 0.0;
                continue;
            }
        }
        means[i] = window_sum / count;
    }
    return means;
}

std::vector<double> ratio_to_trailing_mean(const std::vector<double>& values, int width,
                                           RatioMode mode, double zero_value) {
    if (mode == RatioMode::Auto) {
        throw std::invalid_argument("RatioMode::Auto must be resolved against a label first");
    }

    std::vector<double> result = trailing_mean_exclusive(values, width);
    for (size_t i = 0; i < values.size(); ++i) {
        if (mode == RatioMode::Difference) {
            result[i] = values[i] - result[i];
        } else {
            result[i] = safe_divide(values[i], result[i], zero_value);
        }
    }
    return result;
}

std::vector<double> rolling_apply(const std::vector<double>& values, int width,
                                  const WindowStatistic& statistic) {
    check_width(width);

    const size_t n = values.size();
    const size_t sw = static_cast<size_t>(width);
    std::vector<double> result(n);

    for (size_t i = 0; i < n; ++i) {
        size_t first = i > sw ? i - sw : 0;
        result[i] = statistic(values.data() + first, i - first + 1);
    }
    return result;
}

std::vector<double> rolling_variance(const std::vector<double>& values, int width) {
    return rolling_apply(values, width, [](const double* data, size_t n) {
        return sample_variance(data, n);
    });
}

std::vector<double> rolling_skewness(const std::vector<double>& values, int width) {
    return rolling_apply(values, width, [](const double* data, size_t n) {
        return sample_skewness(data, n);
    });
}

std::vector<double> rolling_autocorrelation(const std::vector<double>& values, int width) {
    return rolling_apply(values, width, [](const double* data, size_t n) {
        return lag1_autocorrelation(data, n);
    });
}

std::vector<double> rolling_kendall_tau(const std::vector<double>& values, int width) {
    return rolling_apply(values, width, [](const double* data, size_t n) {
        double tau = kendall_tau_c(data, n);
        return std::isnan(tau) ? 0.0 : tau;
    });
}

std::vector<double> time_axis(double tmin, double dt, size_t n) {
    std::vector<double> t(n);
    for (size_t i = 0; i < n; ++i) {
        t[i] = tmin + static_cast<double>(i) * dt;
    }
    return t;
}

} // namespace tsstat
