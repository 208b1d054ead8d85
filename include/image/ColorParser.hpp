#pragma once

#include "image/Raster.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace collagist::image {

// Parses background color strings: CSS/X11 color names, #rgb, #rgba,
// #rrggbb, #rrggbbaa and rgb(r, g, b) with integer or percent components.
// Alpha components are accepted and ignored.
class ColorParser {
public:
    [[nodiscard]] static std::optional<Rgb> parse(std::string_view text);

    [[nodiscard]] static std::optional<Rgb> lookup_name(std::string_view name);

    // "#rrggbb" form, lower-case
    static std::string to_hex(Rgb color);

private:
    static std::optional<Rgb> parse_hex(std::string_view digits);
    static std::optional<Rgb> parse_rgb_function(std::string_view args);
};

}  // namespace collagist::image
