#include "figure_path.hpp"

#include <cstdlib>
#include <filesystem>

namespace tsstat::render {

std::string figures_root(const std::string& configured) {
    const char* env = std::getenv(FIGS_PATH_ENV);
    if (env != nullptr && *env != '\0') {
        return env;
    }
    return configured.empty() ? DEFAULT_FIGS_PATH : configured;
}

std::string figure_path(const std::string& root, const std::string& id,
                        const std::string& savename) {
    if (savename.empty()) {
        return "";
    }

    std::filesystem::path path(root);
    if (!id.empty()) {
        path /= id;
    }
    path /= savename + ".png";
    return path.string();
}

}  // namespace tsstat::render
