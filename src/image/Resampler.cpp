#include "image/Resampler.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb/stb_image_resize2.h>

namespace collagist::image {

static stbir_filter to_stbir(ResampleFilter filter) {
    switch (filter) {
        case ResampleFilter::Box: return STBIR_FILTER_BOX;
        case ResampleFilter::Triangle: return STBIR_FILTER_TRIANGLE;
        case ResampleFilter::CubicBSpline: return STBIR_FILTER_CUBICBSPLINE;
        case ResampleFilter::CatmullRom: return STBIR_FILTER_CATMULLROM;
        case ResampleFilter::Mitchell: return STBIR_FILTER_MITCHELL;
    }
    return STBIR_FILTER_MITCHELL;
}

Raster Resampler::resize(const Raster& source, int target_w, int target_h, ResampleFilter filter) {
    if (source.empty() || target_w <= 0 || target_h <= 0) {
        return Raster{};
    }

    std::vector<uint8_t> output(static_cast<size_t>(target_w) * target_h * Raster::CHANNELS);
    void* ok = stbir_resize(source.data(), source.width(), source.height(), 0,
                            output.data(), target_w, target_h, 0,
                            STBIR_RGB, STBIR_TYPE_UINT8, STBIR_EDGE_CLAMP, to_stbir(filter));
    if (!ok) {
        util::Logger::error("Resampler: stbir_resize failed " + std::to_string(source.width()) + "x" +
                            std::to_string(source.height()) + " -> " + std::to_string(target_w) +
                            "x" + std::to_string(target_h));
        return Raster{};
    }
    return Raster(target_w, target_h, std::move(output));
}

std::optional<ResampleFilter> Resampler::parse_filter(std::string_view name) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (key == "box") return ResampleFilter::Box;
    if (key == "triangle" || key == "bilinear") return ResampleFilter::Triangle;
    if (key == "cubicbspline" || key == "bspline") return ResampleFilter::CubicBSpline;
    if (key == "catmullrom" || key == "bicubic") return ResampleFilter::CatmullRom;
    if (key == "mitchell") return ResampleFilter::Mitchell;
    return std::nullopt;
}

std::string Resampler::filter_name(ResampleFilter filter) {
    switch (filter) {
        case ResampleFilter::Box: return "box";
        case ResampleFilter::Triangle: return "triangle";
        case ResampleFilter::CubicBSpline: return "cubicbspline";
        case ResampleFilter::CatmullRom: return "catmullrom";
        case ResampleFilter::Mitchell: return "mitchell";
    }
    return "mitchell";
}

}  // namespace collagist::image
