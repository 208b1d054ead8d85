#pragma once

#include "image/Raster.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace collagist::image {

enum class ResampleFilter {
    Box,
    Triangle,
    CubicBSpline,
    CatmullRom,
    Mitchell,
};

class Resampler {
public:
    // Resizes source to exactly target_w x target_h. Returns an empty raster
    // if the resampler rejects the request.
    static Raster resize(const Raster& source, int target_w, int target_h, ResampleFilter filter);

    static std::optional<ResampleFilter> parse_filter(std::string_view name);
    static std::string filter_name(ResampleFilter filter);
};

}  // namespace collagist::image
