#ifndef TSSTAT_RENDERER_HPP
#define TSSTAT_RENDERER_HPP

/**
 * @file renderer.hpp
 * @brief Plotting capability consumed by TimeSeries::plot1d
 *
 * The statistics code never draws. It fills a PlotRequest and hands it to a
 * Renderer, which may draw on screen, write an image to save_path, or just
 * record the request. The Python module lets a matplotlib-backed class
 * implement this interface.
 */

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tsstat::render {

/**
 * @brief Everything a renderer needs to draw one 1D curve
 */
struct PlotRequest {
    std::vector<double> x;            ///< Abscissa (time axis)
    std::vector<double> y;            ///< Ordinate (values), same length as x
    std::string xlabel;               ///< x-axis label
    std::string ylabel;               ///< y-axis label
    bool xlog = false;                ///< Logarithmic x-axis
    bool ylog = false;                ///< Logarithmic y-axis
    std::optional<double> xmin;       ///< Fixed lower x bound
    std::optional<double> ymin;       ///< Fixed lower y bound
    std::optional<double> ymax;       ///< Fixed upper y bound
    std::optional<double> hline;      ///< Horizontal guide line at this y
    std::optional<double> vline;      ///< Vertical guide line at this x
    std::string save_path;            ///< Output image path, empty to only render

    bool saves() const noexcept { return !save_path.empty(); }
};

/**
 * @brief Abstract plotting backend
 */
class Renderer {
public:
    virtual ~Renderer() = default;

    /**
     * @brief Draw the curve described by request
     *
     * Implementations persist the figure when request.saves() is true.
     */
    virtual void render(const PlotRequest& request) = 0;
};

/**
 * @brief Renderer forwarding each request to a callable
 */
class CallbackRenderer : public Renderer {
public:
    using Callback = std::function<void(const PlotRequest&)>;

    /// @throws std::invalid_argument if callback is empty
    explicit CallbackRenderer(Callback callback) : callback_(std::move(callback)) {
        if (!callback_) {
            throw std::invalid_argument("CallbackRenderer: callback must not be empty");
        }
    }

    void render(const PlotRequest& request) override { callback_(request); }

private:
    Callback callback_;
};

}  // namespace tsstat::render

#endif  // TSSTAT_RENDERER_HPP
