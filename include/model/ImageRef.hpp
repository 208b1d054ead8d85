#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace collagist::model {

enum class ImageFormat {
    Unknown,
    JPEG,
    PNG,
    BMP,
    GIF,
    WEBP,
};

// A discovered source image. Identity is the path; index is its position
// in the sorted scan order and therefore its grid cell.
struct ImageRef {
    std::filesystem::path path;
    std::size_t index = 0;
    ImageFormat format = ImageFormat::Unknown;

    std::string filename() const { return path.filename().string(); }

    bool operator==(const ImageRef& other) const { return path == other.path; }
};

struct SkippedImage {
    ImageRef image;
    std::string reason;
};

enum class RunStatus {
    Written,  // Canvas composed and persisted
    Empty,    // No supported images, nothing written
};

struct RunReport {
    RunStatus status = RunStatus::Empty;
    std::size_t images_found = 0;
    std::size_t images_placed = 0;
    std::vector<SkippedImage> skipped;

    int canvas_width = 0;
    int canvas_height = 0;
    std::filesystem::path output_path;

    // FNV-1a over the canvas pixels, zero when nothing was written
    std::size_t canvas_checksum = 0;
};

}  // namespace collagist::model
