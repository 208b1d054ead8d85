#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace collagist::image {

// Opaque 8-bit color. Alpha is never carried.
struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb& other) const = default;
};

/**
 * A tightly packed 8-bit RGB pixel buffer.
 * Origin (0,0) is top-left, rows are stored top to bottom without stride padding.
 */
class Raster {
public:
    static constexpr int CHANNELS = 3;

    Raster() = default;
    Raster(int width, int height, Rgb fill = {});
    // Takes ownership of width * height * 3 bytes of RGB data
    Raster(int width, int height, std::vector<uint8_t> pixels);

    int width() const { return width_; }
    int height() const { return height_; }
    bool empty() const { return width_ == 0 || height_ == 0; }

    Rgb at(int x, int y) const;
    void set(int x, int y, Rgb color);

    uint8_t* data() { return pixels_.data(); }
    const uint8_t* data() const { return pixels_.data(); }
    const std::vector<uint8_t>& pixels() const { return pixels_; }
    size_t stride() const { return static_cast<size_t>(width_) * CHANNELS; }

    void fill(Rgb color);
    void fill_rect(int x, int y, int w, int h, Rgb color);

    // Copy of the given region, clipped to this raster's bounds.
    // The result may be smaller than w x h; it is never padded.
    Raster crop(int x, int y, int w, int h) const;

    // Copy source onto this raster with its top-left at (dest_x, dest_y).
    // Pixels falling outside this raster are dropped.
    void blit(const Raster& source, int dest_x, int dest_y);

    bool operator==(const Raster& other) const = default;

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> pixels_;

    bool is_in_bounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }
    size_t offset(int x, int y) const {
        return (static_cast<size_t>(y) * width_ + x) * CHANNELS;
    }
};

}  // namespace collagist::image
