#pragma once

#include "config/CollageConfig.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace collagist::config {

// Parsed argv. Values stay raw strings until apply() so that the config file
// named by --config can be loaded first and then overridden.
struct CommandLine {
    bool show_help = false;
    bool verbose = false;
    std::optional<std::filesystem::path> config_file;
    std::vector<std::pair<std::string, std::string>> values;  // option name -> raw value, in order

    /**
     * Accepts "--name value", "--name=value" and "-x value".
     *
     * @throws model::ConfigError on unknown options or missing values
     */
    static CommandLine parse(int argc, const char* const* argv);

    // Writes parsed values over cfg; integers are checked here
    void apply(CollageConfig& cfg) const;

    static std::string usage(const std::string& program);
};

}  // namespace collagist::config
