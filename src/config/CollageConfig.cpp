#include "config/CollageConfig.hpp"
#include "image/ColorParser.hpp"
#include "model/Errors.hpp"
#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <charconv>
#include <fstream>
#include <string>

namespace collagist::config {

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

int ConfigLoader::parse_int(const std::string& value, const std::string& what) {
    std::string v = trim(value);
    int result = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), result);
    if (v.empty() || ec != std::errc() || ptr != v.data() + v.size()) {
        throw model::ConfigError("Invalid integer for " + what + ": '" + value + "'");
    }
    return result;
}

bool ConfigLoader::parse_bool(const std::string& value, const std::string& what) {
    std::string v = trim(value);
    if (v == "true" || v == "yes" || v == "1") return true;
    if (v == "false" || v == "no" || v == "0") return false;
    throw model::ConfigError("Invalid boolean for " + what + ": '" + value + "'");
}

CollageConfig ConfigLoader::load_config(const std::filesystem::path& path) {
    auto config_file = path.empty() ? util::Platform::get_default_config_file() : path;

    std::error_code ec;
    if (std::filesystem::exists(config_file, ec)) {
        util::Logger::info("Config: Loading " + config_file.string());
        return load_from_file(config_file);
    }
    if (!path.empty()) {
        // An explicitly named file must exist
        throw model::ConfigError("Config file not found: " + config_file.string());
    }
    util::Logger::debug("Config: No config file, using defaults");
    return CollageConfig{};
}

CollageConfig ConfigLoader::load_from_file(const std::filesystem::path& path) {
    CollageConfig cfg;

    std::ifstream file(path);
    if (!file) {
        throw model::ConfigError("Cannot read config file: " + path.string());
    }

    std::string line, current_section;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            util::Logger::warn("Config: Ignoring line " + std::to_string(line_no) + ": " + line);
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        const std::string where = current_section + "." + key + " (" + path.filename().string() +
                                  ":" + std::to_string(line_no) + ")";

        if (current_section == "collage") {
            if (key == "columns") cfg.columns = parse_int(value, where);
            else if (key == "width") cfg.width = parse_int(value, where);
            else if (key == "height") cfg.height = parse_int(value, where);
            else if (key == "padding") cfg.padding = parse_int(value, where);
            else if (key == "background") cfg.background = value;
            else if (key == "quality") cfg.quality = parse_int(value, where);
            else if (key == "filter") cfg.filter = value;
            else util::Logger::warn("Config: Unknown key " + where);
        }
        else if (current_section == "paths") {
            if (key == "input_dir") cfg.input_dir = value;
            else if (key == "output") cfg.output = value;
            else util::Logger::warn("Config: Unknown key " + where);
        }
        else if (current_section == "logging") {
            if (key == "log_file") cfg.log_file = value;
            else if (key == "verbose") cfg.verbose = parse_bool(value, where);
            else util::Logger::warn("Config: Unknown key " + where);
        }
        else {
            util::Logger::warn("Config: Unknown section [" + current_section + "] at line " +
                               std::to_string(line_no));
        }
    }

    return cfg;
}

void ConfigLoader::save_config(const CollageConfig& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw model::ConfigError("Cannot create " + path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream file(path);
    if (!file) {
        throw model::ConfigError("Cannot write config file: " + path.string());
    }

    file << "# collagist config\n";
    file << "# Command-line flags override these values\n\n";

    file << "[collage]\n";
    file << "# Number of columns in the grid\n";
    file << "columns = " << cfg.columns << "\n";
    file << "# Cell size in pixels\n";
    file << "width = " << cfg.width << "\n";
    file << "height = " << cfg.height << "\n";
    file << "# Gap between cells in pixels\n";
    file << "padding = " << cfg.padding << "\n";
    file << "# Color name, \"#rrggbb\" or \"rgb(r, g, b)\"\n";
    file << "background = \"" << cfg.background << "\"\n";
    file << "# JPEG quality (1-100)\n";
    file << "quality = " << cfg.quality << "\n";
    file << "# Resampling filter: \"box\", \"triangle\", \"cubicbspline\", \"catmullrom\", \"mitchell\"\n";
    file << "filter = \"" << cfg.filter << "\"\n\n";

    file << "[paths]\n";
    file << "input_dir = \"" << cfg.input_dir.string() << "\"\n";
    file << "output = \"" << cfg.output.string() << "\"\n\n";

    file << "[logging]\n";
    file << "log_file = \"" << cfg.log_file.string() << "\"\n";
    file << "verbose = " << (cfg.verbose ? "true" : "false") << "\n";

    if (!file) {
        throw model::ConfigError("Error writing config file: " + path.string());
    }
}

RenderSettings ConfigLoader::validate(const CollageConfig& cfg) {
    if (cfg.columns < 1) {
        throw model::ConfigError("Number of columns must be at least 1");
    }
    if (cfg.width < 1 || cfg.height < 1) {
        throw model::ConfigError("Width and height must be positive numbers");
    }
    if (cfg.padding < 0) {
        throw model::ConfigError("Padding cannot be negative");
    }
    if (cfg.quality < 1 || cfg.quality > 100) {
        throw model::ConfigError("Quality must be between 1 and 100");
    }
    if (cfg.output.empty()) {
        throw model::ConfigError("Output path cannot be empty");
    }

    RenderSettings settings;

    auto filter = image::Resampler::parse_filter(cfg.filter);
    if (!filter) {
        throw model::ConfigError("Unknown resampling filter: " + cfg.filter);
    }
    settings.filter = *filter;

    auto color = image::ColorParser::parse(cfg.background);
    if (!color) {
        throw model::ConfigError("Invalid background color: " + cfg.background +
                                 " (use a color name such as 'white' or a hex value such as '#FFFFFF')");
    }
    settings.background = *color;

    return settings;
}

}  // namespace collagist::config
