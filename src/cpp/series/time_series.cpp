#include "time_series.hpp"

#include <utility>

#include "render/figure_path.hpp"

namespace tsstat::series {

namespace {

/// x-axis label of plot1d
constexpr const char* TIME_AXIS_LABEL = "Time [s]";

/// An empty vector carries no samples and is stored as absent
Sequence normalize(std::optional<std::vector<double>> values) {
    if (values && values->empty()) {
        return std::nullopt;
    }
    return values;
}

}  // anonymous namespace

TimeSeries::TimeSeries(std::optional<std::vector<double>> values, const SeriesConfig& config,
                       const SeriesDescription& description, const std::string& savename,
                       bool record_all)
    : val_(normalize(std::move(values))), config_(config), description_(description) {
    init("", savename, record_all);
}

TimeSeries::TimeSeries(std::optional<std::vector<double>> values, const StatsContext& context,
                       const SeriesConfig& config, const SeriesDescription& description,
                       const std::string& savename, bool record_all)
    : val_(normalize(std::move(values))), config_(config), description_(description) {
    config_.tmin = context.tmin;
    config_.t_interval = context.t_interval;
    config_.sw_width_mean = context.sw_width;
    init(context.id, savename, record_all);
}

#ifdef TSSTAT_USE_EIGEN
TimeSeries::TimeSeries(const Eigen::VectorXd& values, const SeriesConfig& config,
                       const SeriesDescription& description, const std::string& savename,
                       bool record_all)
    : TimeSeries(std::vector<double>(values.data(), values.data() + values.size()), config,
                 description, savename, record_all) {}
#endif

void TimeSeries::init(const std::string& id, const std::string& savename, bool record_all) {
    config_.validate();
    savename_ = render::figure_path(render::figures_root(config_.figures_root), id, savename);

    if (record_all) {
        set_all_vars();
    }
}

template <typename Compute>
void TimeSeries::refresh(Sequence& cache, bool rerun, Compute compute) {
    if (!exists()) {
        return;
    }
    if (cache && !rerun) {
        return;
    }
    cache = compute(*val_);
}

const Sequence& TimeSeries::sequence(Statistic which) const {
    switch (which) {
        case Statistic::TimeAxis:
            return t_pts_;
        case Statistic::RatioToMean:
            return ratio_to_sw_mean_;
        case Statistic::Variance:
            return variance_;
        case Statistic::Skewness:
            return skewness_;
        case Statistic::Autocorrelation:
            return autocorrelation_;
        case Statistic::KendallTau:
            return kendall_tau_;
    }
    throw std::invalid_argument("Unknown statistic");
}

#ifdef TSSTAT_USE_EIGEN
std::optional<Eigen::VectorXd> TimeSeries::sequence_eigen(Statistic which) const {
    const Sequence& seq = sequence(which);
    if (!seq) {
        return std::nullopt;
    }
    Eigen::VectorXd out(static_cast<Eigen::Index>(seq->size()));
    for (size_t i = 0; i < seq->size(); ++i) {
        out(static_cast<Eigen::Index>(i)) = (*seq)[i];
    }
    return out;
}
#endif

void TimeSeries::set_all_vars() {
    set_t_pts();
    set_ratio_to_sw_average();
    set_variance();
    set_autocorrelation();
    set_skewness();
    set_kendall_tau();
}

void TimeSeries::set_t_pts(bool rerun) {
    refresh(t_pts_, rerun, [this](const std::vector<double>& v) {
        return time_axis(config_.tmin, config_.t_interval, v.size());
    });
}

void TimeSeries::set_ratio_to_sw_average(bool rerun) {
    refresh(ratio_to_sw_mean_, rerun, [this](const std::vector<double>& v) {
        RatioMode mode = resolve_ratio_mode(config_.ratio_mode, description_.label);
        return ratio_to_trailing_mean(v, config_.sw_width_mean, mode,
                                      config_.zero_division_value);
    });
}

void TimeSeries::set_variance(bool rerun) {
    refresh(variance_, rerun, [this](const std::vector<double>& v) {
        return rolling_variance(v, config_.sw_width_ews);
    });
}

void TimeSeries::set_skewness(bool rerun) {
    refresh(skewness_, rerun, [this](const std::vector<double>& v) {
        return rolling_skewness(v, config_.sw_width_ews);
    });
}

void TimeSeries::set_autocorrelation(bool rerun) {
    refresh(autocorrelation_, rerun, [this](const std::vector<double>& v) {
        return rolling_autocorrelation(v, config_.sw_width_ews);
    });
}

void TimeSeries::set_kendall_tau(bool rerun) {
    refresh(kendall_tau_, rerun, [this](const std::vector<double>& v) {
        return rolling_kendall_tau(v, config_.sw_width_ews);
    });
}

render::PlotRequest TimeSeries::plot_request(const PlotOptions& options) {
    if (!exists()) {
        throw std::logic_error("Cannot plot an empty time series");
    }

    const size_t n = n_pts();
    if (options.ibeg_remove > n || options.iend_remove > n - options.ibeg_remove) {
        throw std::invalid_argument("Cannot remove " + std::to_string(options.ibeg_remove) +
                                    " leading and " + std::to_string(options.iend_remove) +
                                    " trailing points from a series of " + std::to_string(n));
    }

    set_t_pts();

    const size_t ibeg = options.ibeg_remove;
    const size_t iend = n - options.iend_remove;

    render::PlotRequest request;
    request.x.assign(t_pts_->begin() + ibeg, t_pts_->begin() + iend);
    request.y.assign(val_->begin() + ibeg, val_->begin() + iend);
    request.xlabel = TIME_AXIS_LABEL;
    request.ylabel = description_.desc_short;
    request.xlog = options.xlog;
    request.ylog = options.ylog;
    request.xmin = config_.tmin;
    request.ymin = options.ymin;
    request.ymax = options.ymax;
    request.hline = options.hline;
    request.vline = options.vline;
    request.save_path = options.save ? savename_ : "";
    return request;
}

void TimeSeries::plot1d(render::Renderer& renderer, const PlotOptions& options) {
    renderer.render(plot_request(options));
}

}  // namespace tsstat::series
