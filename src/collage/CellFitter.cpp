#include "collage/CellFitter.hpp"
#include "model/Errors.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <functional>

namespace collagist::collage {

// Picks floor or ceil of `value`, whichever the key scores lower (floor on ties), at least 1
static int round_aspect(double value, const std::function<double(int)>& key) {
    int lo = static_cast<int>(std::floor(value));
    int hi = static_cast<int>(std::ceil(value));
    int best = key(hi) < key(lo) ? hi : lo;
    return std::max(best, 1);
}

CellFitter::CellFitter(int target_width, int target_height, image::ResampleFilter filter)
    : target_width_(target_width), target_height_(target_height), filter_(filter) {
    if (target_width < 1 || target_height < 1) {
        throw model::ConfigError("Width and height must be positive numbers");
    }
}

std::pair<int, int> CellFitter::thumbnail_size(int width, int height, int target_w, int target_h) {
    if (target_w >= width && target_h >= height) {
        return {width, height};
    }

    const double aspect = static_cast<double>(width) / height;
    int x = target_w;
    int y = target_h;
    if (static_cast<double>(x) / y >= aspect) {
        // Height is the binding edge
        x = round_aspect(y * aspect, [&](int n) {
            return std::abs(aspect - static_cast<double>(n) / y);
        });
    } else {
        y = round_aspect(x / aspect, [&](int n) {
            return n == 0 ? 0.0 : std::abs(aspect - static_cast<double>(x) / n);
        });
    }
    return {x, y};
}

std::pair<int, int> CellFitter::crop_origin(int width, int height, int target_w, int target_h) {
    int left = width > target_w ? (width - target_w) / 2 : 0;
    int top = height > target_h ? (height - target_h) / 2 : 0;
    return {left, top};
}

FitResult CellFitter::fit(const image::DecodeResult& decoded) const {
    if (!decoded.valid) {
        FitResult result;
        result.error = decoded.error.empty() ? "image could not be decoded" : decoded.error;
        return result;
    }
    return fit(decoded.raster);
}

FitResult CellFitter::fit(const image::Raster& source) const {
    FitResult result;
    if (source.empty()) {
        result.error = "image has no pixels";
        return result;
    }

    auto [w, h] = thumbnail_size(source.width(), source.height(), target_width_, target_height_);

    image::Raster scaled;
    if (w == source.width() && h == source.height()) {
        scaled = source;
    } else {
        scaled = image::Resampler::resize(source, w, h, filter_);
        if (scaled.empty()) {
            result.error = "resampling to " + std::to_string(w) + "x" + std::to_string(h) + " failed";
            return result;
        }
        result.scaled = true;
    }

    if (scaled.width() != target_width_ || scaled.height() != target_height_) {
        auto [left, top] = crop_origin(scaled.width(), scaled.height(), target_width_, target_height_);
        scaled = scaled.crop(left, top, target_width_, target_height_);
        result.cropped = true;
    }

    util::Logger::debug("CellFitter: " + std::to_string(source.width()) + "x" + std::to_string(source.height()) +
                        " -> " + std::to_string(scaled.width()) + "x" + std::to_string(scaled.height()));

    result.image = std::move(scaled);
    result.valid = true;
    return result;
}

}  // namespace collagist::collage
