#pragma once

#include "image/Raster.hpp"
#include <filesystem>
#include <string>

namespace collagist::image {

struct DecodeResult {
    Raster raster;              // Always 8-bit RGB, alpha dropped
    int source_channels = 0;    // Channel count stored in the file (1..4)
    bool valid = false;
    std::string error;
};

// Decodes one image file into an opaque RGB raster. Grayscale, palette and
// alpha sources are normalized to three channels; alpha is discarded rather
// than blended. Failures are reported through DecodeResult, not thrown.
class ImageDecoder {
public:
    virtual ~ImageDecoder() = default;

    virtual DecodeResult decode(const std::filesystem::path& path) = 0;
    virtual std::string name() const = 0;
};

// stb_image backed decoder: JPEG, PNG, BMP, GIF (first frame).
class StbImageDecoder : public ImageDecoder {
public:
    DecodeResult decode(const std::filesystem::path& path) override;
    std::string name() const override { return "stb_image"; }
};

}  // namespace collagist::image
