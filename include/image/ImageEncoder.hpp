#pragma once

#include "image/Raster.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace collagist::image {

enum class OutputFormat {
    JPEG,
    PNG,
    BMP,
    TGA,
};

namespace image_encoder {

// .png/.bmp/.tga select those formats; everything else is JPEG
OutputFormat format_for_path(const std::filesystem::path& path);
std::string format_name(OutputFormat format);

// Largest width or height the format's header can describe (JPEG and TGA use 16-bit fields)
int max_dimension(OutputFormat format);

// Encodes the raster into `out`. quality applies to JPEG only and is clamped to 1..100.
// Fails with `err` set when the raster exceeds max_dimension(format).
bool encode(const Raster& raster,
            OutputFormat format,
            int quality,
            std::vector<std::uint8_t>& out,
            std::string& err);

}  // namespace image_encoder
}  // namespace collagist::image
