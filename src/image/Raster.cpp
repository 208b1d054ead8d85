#include "image/Raster.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

namespace collagist::image {

Raster::Raster(int width, int height, Rgb fill_color) : width_(width), height_(height) {
    if (width < 0 || height < 0) {
        throw std::invalid_argument("Raster: negative dimensions");
    }
    pixels_.resize(static_cast<size_t>(width) * height * CHANNELS);
    fill(fill_color);
}

Raster::Raster(int width, int height, std::vector<uint8_t> pixels)
    : width_(width), height_(height), pixels_(std::move(pixels)) {
    if (width < 0 || height < 0) {
        throw std::invalid_argument("Raster: negative dimensions");
    }
    if (pixels_.size() != static_cast<size_t>(width) * height * CHANNELS) {
        throw std::invalid_argument("Raster: buffer holds " + std::to_string(pixels_.size()) +
                                    " bytes, expected " + std::to_string(width) + "x" +
                                    std::to_string(height) + "x3");
    }
}

Rgb Raster::at(int x, int y) const {
    if (!is_in_bounds(x, y)) {
        return Rgb{};
    }
    const uint8_t* p = pixels_.data() + offset(x, y);
    return Rgb{p[0], p[1], p[2]};
}

void Raster::set(int x, int y, Rgb color) {
    if (!is_in_bounds(x, y)) return;
    uint8_t* p = pixels_.data() + offset(x, y);
    p[0] = color.r;
    p[1] = color.g;
    p[2] = color.b;
}

void Raster::fill(Rgb color) {
    for (size_t i = 0; i < pixels_.size(); i += CHANNELS) {
        pixels_[i + 0] = color.r;
        pixels_[i + 1] = color.g;
        pixels_[i + 2] = color.b;
    }
}

void Raster::fill_rect(int x, int y, int w, int h, Rgb color) {
    int x0 = std::max(x, 0);
    int y0 = std::max(y, 0);
    int x1 = std::min(x + w, width_);
    int y1 = std::min(y + h, height_);
    for (int cy = y0; cy < y1; ++cy) {
        for (int cx = x0; cx < x1; ++cx) {
            set(cx, cy, color);
        }
    }
}

Raster Raster::crop(int x, int y, int w, int h) const {
    int x0 = std::clamp(x, 0, width_);
    int y0 = std::clamp(y, 0, height_);
    int x1 = std::clamp(x + w, x0, width_);
    int y1 = std::clamp(y + h, y0, height_);

    Raster out(x1 - x0, y1 - y0);
    size_t row_bytes = static_cast<size_t>(out.width_) * CHANNELS;
    for (int row = 0; row < out.height_; ++row) {
        std::memcpy(out.pixels_.data() + out.offset(0, row),
                    pixels_.data() + offset(x0, y0 + row), row_bytes);
    }
    return out;
}

void Raster::blit(const Raster& source, int dest_x, int dest_y) {
    // Clip the source rectangle against this raster once, then copy whole rows
    int sx0 = std::max(0, -dest_x);
    int sy0 = std::max(0, -dest_y);
    int sx1 = std::min(source.width_, width_ - dest_x);
    int sy1 = std::min(source.height_, height_ - dest_y);
    if (sx1 <= sx0 || sy1 <= sy0) return;

    size_t row_bytes = static_cast<size_t>(sx1 - sx0) * CHANNELS;
    for (int sy = sy0; sy < sy1; ++sy) {
        std::memcpy(pixels_.data() + offset(dest_x + sx0, dest_y + sy),
                    source.pixels_.data() + source.offset(sx0, sy), row_bytes);
    }
}

}  // namespace collagist::image
