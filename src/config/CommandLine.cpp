#include "config/CommandLine.hpp"
#include "model/Errors.hpp"
#include <array>
#include <sstream>
#include <string_view>

namespace collagist::config {

namespace {

struct OptionSpec {
    std::string_view name;   // Long form without dashes
    char short_name;         // 0 when there is none
    bool takes_value;
};

constexpr std::array<OptionSpec, 13> OPTIONS = {{
    {"columns", 'c', true},
    {"input-dir", 'i', true},
    {"output", 'o', true},
    {"width", 'w', true},
    {"height", 't', true},
    {"padding", 'p', true},
    {"background", 'b', true},
    {"quality", 'q', true},
    {"filter", 'f', true},
    {"config", 0, true},
    {"log-file", 0, true},
    {"verbose", 'v', false},
    {"help", 'h', false},
}};

const OptionSpec* find_long(std::string_view name) {
    for (const auto& opt : OPTIONS) {
        if (opt.name == name) return &opt;
    }
    return nullptr;
}

const OptionSpec* find_short(char c) {
    for (const auto& opt : OPTIONS) {
        if (opt.short_name != 0 && opt.short_name == c) return &opt;
    }
    return nullptr;
}

}  // namespace

CommandLine CommandLine::parse(int argc, const char* const* argv) {
    CommandLine cl;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        const OptionSpec* spec = nullptr;
        std::optional<std::string> inline_value;

        if (arg.starts_with("--")) {
            std::string_view body = arg.substr(2);
            auto eq = body.find('=');
            if (eq != std::string_view::npos) {
                inline_value = std::string(body.substr(eq + 1));
                body = body.substr(0, eq);
            }
            spec = find_long(body);
        } else if (arg.size() == 2 && arg[0] == '-') {
            spec = find_short(arg[1]);
        }

        if (!spec) {
            throw model::ConfigError("Unrecognized argument: " + std::string(arg));
        }

        if (!spec->takes_value) {
            if (inline_value) {
                throw model::ConfigError("Option --" + std::string(spec->name) + " takes no value");
            }
            if (spec->name == "help") cl.show_help = true;
            else if (spec->name == "verbose") cl.verbose = true;
            continue;
        }

        std::string value;
        if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            throw model::ConfigError("Option --" + std::string(spec->name) + " expects a value");
        }

        if (spec->name == "config") {
            cl.config_file = value;
        } else {
            cl.values.emplace_back(std::string(spec->name), value);
        }
    }

    return cl;
}

void CommandLine::apply(CollageConfig& cfg) const {
    for (const auto& [name, value] : values) {
        const std::string what = "--" + name;
        if (name == "columns") cfg.columns = ConfigLoader::parse_int(value, what);
        else if (name == "input-dir") cfg.input_dir = value;
        else if (name == "output") cfg.output = value;
        else if (name == "width") cfg.width = ConfigLoader::parse_int(value, what);
        else if (name == "height") cfg.height = ConfigLoader::parse_int(value, what);
        else if (name == "padding") cfg.padding = ConfigLoader::parse_int(value, what);
        else if (name == "background") cfg.background = value;
        else if (name == "quality") cfg.quality = ConfigLoader::parse_int(value, what);
        else if (name == "filter") cfg.filter = value;
        else if (name == "log-file") cfg.log_file = value;
    }
    if (verbose) {
        cfg.verbose = true;
    }
}

std::string CommandLine::usage(const std::string& program) {
    std::ostringstream out;
    out << "usage: " << program << " [options]\n\n"
        << "Create an image collage from your images.\n\n"
        << "options:\n"
        << "  -c, --columns N       Number of columns in the collage (default: 5)\n"
        << "  -i, --input-dir DIR   Input directory containing images (default: current directory)\n"
        << "  -o, --output FILE     Output filename (default: collage_output.jpg)\n"
        << "  -w, --width N         Target width for each image (default: 350)\n"
        << "  -t, --height N        Target height for each image (default: 600)\n"
        << "  -p, --padding N       Padding between images (default: 10)\n"
        << "  -b, --background C    Background color (default: white)\n"
        << "  -q, --quality N       JPEG quality 1-100 (default: 95)\n"
        << "  -f, --filter NAME     box, triangle, cubicbspline, catmullrom, mitchell (default: mitchell)\n"
        << "      --config FILE     Config file (default: ~/.config/collagist/config.toml)\n"
        << "      --log-file FILE   Log file (default: /tmp/collagist.log)\n"
        << "  -v, --verbose         Log debug messages\n"
        << "  -h, --help            Show this help message and exit\n\n"
        << "Example usage:\n"
        << "  " << program << " --columns 3\n"
        << "  " << program << " -c 3 -i my_images -o collages/my_collage.jpg -w 400 -t 600 -p 15 -b black\n\n"
        << "Supported image formats: JPG, JPEG, PNG, BMP, GIF, WEBP\n";
    return out.str();
}

}  // namespace collagist::config
