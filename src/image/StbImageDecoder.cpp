#include "image/ImageDecoder.hpp"
#include "util/Logger.hpp"
#include <cstring>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_JPEG
#define STBI_ONLY_PNG
#define STBI_ONLY_BMP
#define STBI_ONLY_GIF
#include <stb/stb_image.h>

namespace collagist::image {

DecodeResult StbImageDecoder::decode(const std::filesystem::path& path) {
    DecodeResult result;

    int w = 0, h = 0, channels = 0;
    // Request 3 components: stb expands palette/gray and drops alpha
    unsigned char* pixels = stbi_load(path.c_str(), &w, &h, &channels, 3);

    if (!pixels) {
        const char* reason = stbi_failure_reason();
        result.error = std::string("cannot identify image file: ") + (reason ? reason : "unknown error");
        util::Logger::warn("StbImageDecoder: Failed to decode " + path.string() + " (" + result.error + ")");
        return result;
    }

    if (w <= 0 || h <= 0) {
        stbi_image_free(pixels);
        result.error = "image has no pixels";
        return result;
    }

    size_t bytes = static_cast<size_t>(w) * h * Raster::CHANNELS;
    std::vector<uint8_t> rgb(pixels, pixels + bytes);
    stbi_image_free(pixels);

    if (channels == 2 || channels == 4) {
        util::Logger::debug("StbImageDecoder: Dropped alpha channel of " + path.filename().string());
    }

    result.raster = Raster(w, h, std::move(rgb));
    result.source_channels = channels;
    result.valid = true;
    util::Logger::debug("StbImageDecoder: Decoded " + path.filename().string() + " " +
                        std::to_string(w) + "x" + std::to_string(h) + ", " +
                        std::to_string(channels) + " channel(s)");
    return result;
}

}  // namespace collagist::image
