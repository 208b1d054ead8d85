#include "image/ImageEncoder.hpp"
#include "util/Platform.hpp"

#include <algorithm>
#include <limits>

// stb_image_write implementation must live in exactly one translation unit
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>
#pragma GCC diagnostic pop

namespace collagist::image::image_encoder {

static void append_bytes(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<std::uint8_t>*>(context);
    const auto* bytes = static_cast<const std::uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

OutputFormat format_for_path(const std::filesystem::path& path) {
    const std::string ext = util::Platform::lower_extension(path);
    if (ext == ".png") return OutputFormat::PNG;
    if (ext == ".bmp") return OutputFormat::BMP;
    if (ext == ".tga") return OutputFormat::TGA;
    return OutputFormat::JPEG;
}

std::string format_name(OutputFormat format) {
    switch (format) {
        case OutputFormat::JPEG: return "JPEG";
        case OutputFormat::PNG: return "PNG";
        case OutputFormat::BMP: return "BMP";
        case OutputFormat::TGA: return "TGA";
    }
    return "JPEG";
}

int max_dimension(OutputFormat format) {
    switch (format) {
        case OutputFormat::JPEG:
        case OutputFormat::TGA:
            return 65535;
        case OutputFormat::PNG:
        case OutputFormat::BMP:
            break;
    }
    return std::numeric_limits<int>::max();
}

bool encode(const Raster& raster, OutputFormat format, int quality,
            std::vector<std::uint8_t>& out, std::string& err) {
    err.clear();
    out.clear();
    if (raster.empty()) {
        err = "Invalid image dimensions.";
        return false;
    }

    const int w = raster.width();
    const int h = raster.height();
    const int comp = Raster::CHANNELS;
    const int limit = max_dimension(format);
    if (w > limit || h > limit) {
        err = format_name(format) + " cannot store a " + std::to_string(w) + "x" + std::to_string(h) +
              " image (limit " + std::to_string(limit) + " pixels per side).";
        return false;
    }
    int ok = 0;
    switch (format) {
        case OutputFormat::JPEG:
            quality = std::clamp(quality, 1, 100);
            ok = stbi_write_jpg_to_func(append_bytes, &out, w, h, comp, raster.data(), quality);
            break;
        case OutputFormat::PNG:
            ok = stbi_write_png_to_func(append_bytes, &out, w, h, comp, raster.data(),
                                        static_cast<int>(raster.stride()));
            break;
        case OutputFormat::BMP:
            ok = stbi_write_bmp_to_func(append_bytes, &out, w, h, comp, raster.data());
            break;
        case OutputFormat::TGA:
            ok = stbi_write_tga_to_func(append_bytes, &out, w, h, comp, raster.data());
            break;
    }

    if (!ok || out.empty()) {
        err = "stb_image_write failed to encode " + format_name(format) + ".";
        out.clear();
        return false;
    }
    return true;
}

}  // namespace collagist::image::image_encoder
