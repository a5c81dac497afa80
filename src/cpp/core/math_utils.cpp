#include "math_utils.hpp"

#include <algorithm>
#include <iterator>

namespace tsstat {

namespace {

/// Relative threshold below which a second moment is treated as zero
constexpr double VARIANCE_EPSILON = 1e-14;

/// True if a biased second moment is numerically zero for data of this scale
bool is_degenerate(double m2, double center) {
    return m2 <= VARIANCE_EPSILON * std::max(1.0, center * center);
}

}  // anonymous namespace

double mean(const double* data, size_t n) {
    if (n == 0) {
        throw std::invalid_argument("Cannot compute mean of empty block");
    }
    return std::accumulate(data, data + n, 0.0) / static_cast<double>(n);
}

double mean(const std::vector<double>& data) {
    return mean(data.data(), data.size());
}

double sample_variance(const double* data, size_t n) {
    if (n < 2) {
        return NaN;
    }

    double m = mean(data, n);
    double sum_sq = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double diff = data[i] - m;
        sum_sq += diff * diff;
    }
    return sum_sq / static_cast<double>(n - 1);
}

double sample_variance(const std::vector<double>& data) {
    return sample_variance(data.data(), data.size());
}

double sample_skewness(const double* data, size_t n) {
    if (n < 3) {
        return NaN;
    }

    double m = mean(data, n);
    double m2 = 0.0;
    double m3 = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double diff = data[i] - m;
        m2 += diff * diff;
        m3 += diff * diff * diff;
    }
    double dn = static_cast<double>(n);
    m2 /= dn;
    m3 /= dn;

    if (is_degenerate(m2, m)) {
        return NaN;
    }

    // G1 = sqrt(n(n-1))/(n-2) * g1, g1 = m3 / m2^{3/2}
    double g1 = m3 / std::pow(m2, 1.5);
    return std::sqrt(dn * (dn - 1.0)) / (dn - 2.0) * g1;
}

double sample_skewness(const std::vector<double>& data) {
    return sample_skewness(data.data(), data.size());
}

double lag1_autocorrelation(const double* data, size_t n) {
    if (n < 3) {
        // fewer than 2 (y_t, y_{t+1}) pairs
        return NaN;
    }

    const size_t pairs = n - 1;
    double mean_head = mean(data, pairs);
    double mean_tail = mean(data + 1, pairs);

    double s_hh = 0.0;
    double s_tt = 0.0;
    double s_ht = 0.0;
    for (size_t i = 0; i < pairs; ++i) {
        double dh = data[i] - mean_head;
        double dt = data[i + 1] - mean_tail;
        s_hh += dh * dh;
        s_tt += dt * dt;
        s_ht += dh * dt;
    }

    double dp = static_cast<double>(pairs);
    if (is_degenerate(s_hh / dp, mean_head) || is_degenerate(s_tt / dp, mean_tail)) {
        return NaN;
    }

    double r = s_ht / std::sqrt(s_hh * s_tt);
    return std::clamp(r, -1.0, 1.0);
}

double lag1_autocorrelation(const std::vector<double>& data) {
    return lag1_autocorrelation(data.data(), data.size());
}

double kendall_tau_c(const double* data, size_t n) {
    if (n < 2) {
        return NaN;
    }

    std::vector<double> sorted(data, data + n);
    std::sort(sorted.begin(), sorted.end());
    size_t distinct_y = static_cast<size_t>(
        std::distance(sorted.begin(), std::unique(sorted.begin(), sorted.end())));
    if (distinct_y < 2) {
        return NaN;
    }

    // Positions are strictly increasing, so the sign of (y_j - y_i) for j > i
    // decides concordance.
    long long concordant_minus_discordant = 0;
    for (size_t i = 0; i + 1 < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            if (data[j] > data[i]) {
                ++concordant_minus_discordant;
            } else if (data[j] < data[i]) {
                --concordant_minus_discordant;
            }
        }
    }

    double m = static_cast<double>(std::min(n, distinct_y));
    double dn = static_cast<double>(n);
    double tau = 2.0 * static_cast<double>(concordant_minus_discordant) /
                 (dn * dn * (m - 1.0) / m);
    return std::clamp(tau, -1.0, 1.0);
}

double kendall_tau_c(const std::vector<double>& data) {
    return kendall_tau_c(data.data(), data.size());
}

std::vector<double> cumulative_sum(const std::vector<double>& data) {
    std::vector<double> out(data.size());
    std::partial_sum(data.begin(), data.end(), out.begin());
    return out;
}

} // namespace tsstat
