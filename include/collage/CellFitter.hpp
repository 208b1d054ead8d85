#pragma once

#include "image/Raster.hpp"
#include "image/Resampler.hpp"
#include "image/ImageDecoder.hpp"
#include <string>
#include <utility>

namespace collagist::collage {

// Per-image outcome of decode + fit. `valid == false` means the image is
// skipped and `error` says why.
struct FitResult {
    image::Raster image;
    bool valid = false;
    std::string error;

    bool scaled = false;   // Source was larger than the cell and got downscaled
    bool cropped = false;  // Scaled size differed from the cell size
};

/**
 * Maps an arbitrary source raster onto one grid cell.
 *
 * 1. Downscale (never upscale) to fit inside the cell, preserving aspect ratio.
 * 2. Center-crop to the cell size. The crop is clipped to the image, so a
 *    source smaller than the cell stays smaller; it is not padded.
 */
class CellFitter {
public:
    CellFitter(int target_width, int target_height,
               image::ResampleFilter filter = image::ResampleFilter::Mitchell);

    [[nodiscard]] FitResult fit(const image::Raster& source) const;
    [[nodiscard]] FitResult fit(const image::DecodeResult& decoded) const;

    // Size after the no-upscale, aspect-preserving shrink
    static std::pair<int, int> thumbnail_size(int width, int height, int target_w, int target_h);

    // Top-left of the centered crop window; never negative
    static std::pair<int, int> crop_origin(int width, int height, int target_w, int target_h);

private:
    int target_width_;
    int target_height_;
    image::ResampleFilter filter_;
};

}  // namespace collagist::collage
