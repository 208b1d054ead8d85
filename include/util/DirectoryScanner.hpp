#pragma once

#include "model/ImageRef.hpp"
#include <filesystem>
#include <vector>
#include <string>
#include <string_view>
#include <array>
#include <cstddef>

namespace collagist::util {

/**
 * DirectoryScanner: lists the supported images directly inside one directory.
 *
 * Reads entries with the getdents64 syscall and uses d_type to skip stat()
 * for most entries. Subdirectories are not descended into.
 */
class DirectoryScanner {
public:
    struct ScanResult {
        std::vector<model::ImageRef> images;  // Sorted by path, index == position
        std::filesystem::path directory;      // Directory that was scanned
        bool created = false;                 // Directory did not exist and was created
    };

    /**
     * Scans a directory for supported image files.
     *
     * A missing directory is created (with parents) and yields an empty result.
     *
     * @param dir Directory to scan
     * @return ScanResult with images sorted lexicographically by path
     * @throws model::ScanError if the directory cannot be created or read,
     *         or the path names something other than a directory
     */
    [[nodiscard]] static ScanResult scan(const std::filesystem::path& dir);

    /**
     * Checks if a filename has a supported image extension (case-insensitive).
     *
     * @param filename Filename to check
     * @return true for .jpg, .jpeg, .png, .bmp, .gif or .webp
     */
    [[nodiscard]] static bool is_image_extension(const char* filename);

    static constexpr std::array<std::string_view, 6> IMAGE_EXTENSIONS = {
        ".bmp", ".gif", ".jpeg", ".jpg", ".png", ".webp"
    };

private:
    static constexpr size_t BUFFER_SIZE = 64 * 1024;  // 64KB buffer for getdents64

    // Creates the directory if missing. Returns true if it had to be created.
    static bool ensure_directory(const std::filesystem::path& dir);

    static void read_entries(const std::string& dir_path, std::vector<std::filesystem::path>& out);
};

}  // namespace collagist::util
