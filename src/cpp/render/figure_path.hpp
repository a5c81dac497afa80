#ifndef TSSTAT_FIGURE_PATH_HPP
#define TSSTAT_FIGURE_PATH_HPP

/**
 * @file figure_path.hpp
 * @brief Output locations of saved figures
 *
 * Figures are stored as <figures_root>/<id>/<savename>.png, where id names
 * the object the series belongs to.
 */

#include <string>

namespace tsstat::render {

/// Environment variable overriding the configured figures root
constexpr const char* FIGS_PATH_ENV = "TSSTAT_FIGS_PATH";

/// Figures root used when neither the configuration nor the environment sets one
constexpr const char* DEFAULT_FIGS_PATH = "figs";

/**
 * @brief Figures root directory
 *
 * Returns the value of TSSTAT_FIGS_PATH when set and non-empty, otherwise
 * configured, otherwise DEFAULT_FIGS_PATH.
 */
std::string figures_root(const std::string& configured = "");

/**
 * @brief Full figure path
 * @param root Figures root directory
 * @param id Sub-directory (may be empty)
 * @param savename File stem without extension
 * @return root/id/savename.png, or an empty string if savename is empty
 */
std::string figure_path(const std::string& root, const std::string& id,
                        const std::string& savename);

}  // namespace tsstat::render

#endif  // TSSTAT_FIGURE_PATH_HPP
