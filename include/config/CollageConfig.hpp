#pragma once

#include "image/Raster.hpp"
#include "image/Resampler.hpp"
#include <filesystem>
#include <string>

namespace collagist::config {

struct CollageConfig {
    // Grid settings
    int columns = 5;
    int width = 350;
    int height = 600;
    int padding = 10;
    std::string background = "white";

    // Output settings
    int quality = 95;
    std::string filter = "mitchell";

    // Paths
    std::filesystem::path input_dir = ".";
    std::filesystem::path output = "collage_output.jpg";

    // Logging
    std::filesystem::path log_file = "/tmp/collagist.log";
    bool verbose = false;
};

// Typed values derived from a CollageConfig once it has been validated
struct RenderSettings {
    image::Rgb background;
    image::ResampleFilter filter = image::ResampleFilter::Mitchell;
};

class ConfigLoader {
public:
    // Defaults overlaid with `path` (or the default config file) if it exists
    static CollageConfig load_config(const std::filesystem::path& path = {});
    static CollageConfig load_from_file(const std::filesystem::path& path);
    static void save_config(const CollageConfig& cfg, const std::filesystem::path& path);

    /**
     * Checks every option and resolves the background color and filter.
     *
     * @throws model::ConfigError naming the first invalid option
     */
    static RenderSettings validate(const CollageConfig& cfg);

    // Parses a whole-string integer; throws model::ConfigError naming `what` otherwise
    static int parse_int(const std::string& value, const std::string& what);
    static bool parse_bool(const std::string& value, const std::string& what);
};

}  // namespace collagist::config
