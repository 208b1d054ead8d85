#pragma once

#include "image/Raster.hpp"
#include <stb/stb_image_write.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

namespace collagist::test {

// Unique scratch directory, removed with everything in it on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("collagist_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

// Writes a solid-color PNG with `channels` components (1 = gray, 3 = RGB, 4 = RGBA)
inline void write_solid_png(const std::filesystem::path& path, int w, int h,
                            const std::vector<unsigned char>& pixel, int channels = 3) {
    std::vector<unsigned char> data(static_cast<size_t>(w) * h * channels);
    for (size_t i = 0; i < data.size(); i += channels) {
        for (int c = 0; c < channels; ++c) data[i + c] = pixel[c];
    }
    if (!stbi_write_png(path.c_str(), w, h, channels, data.data(), w * channels)) {
        throw std::runtime_error("fixture: cannot write " + path.string());
    }
}

inline void write_solid_png(const std::filesystem::path& path, int w, int h, image::Rgb color) {
    write_solid_png(path, w, h, {color.r, color.g, color.b}, 3);
}

inline void write_bytes(const std::filesystem::path& path, const std::string& bytes) {
    std::ofstream f(path, std::ios::binary);
    f << bytes;
}

inline std::vector<char> read_bytes(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    return std::vector<char>((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

}  // namespace collagist::test
