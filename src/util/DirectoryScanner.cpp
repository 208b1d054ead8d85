#include "util/DirectoryScanner.hpp"
#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include "model/Errors.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <cctype>
#include <algorithm>
#include <memory>

namespace collagist::util {

// Linux dirent64 structure for getdents64 syscall
struct linux_dirent64 {
    uint64_t d_ino;           // Inode number
    int64_t  d_off;           // Offset to next structure
    uint16_t d_reclen;        // Size of this dirent
    uint8_t  d_type;          // File type
    char     d_name[];        // Filename (null-terminated)
};

// File type constants from dirent.h
constexpr uint8_t DT_UNKNOWN_TYPE = 0;
constexpr uint8_t DT_REG_TYPE = 8;
constexpr uint8_t DT_LNK_TYPE = 10;

bool DirectoryScanner::is_image_extension(const char* filename) {
    const char* ext = strrchr(filename, '.');
    if (!ext || ext == filename) return false;

    std::string lowered(ext);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& ie : IMAGE_EXTENSIONS) {
        if (ie == lowered) return true;
    }
    return false;
}

bool DirectoryScanner::ensure_directory(const std::filesystem::path& dir) {
    std::error_code ec;
    if (std::filesystem::exists(dir, ec)) {
        if (!std::filesystem::is_directory(dir, ec)) {
            throw model::ScanError("Not a directory: " + dir.string());
        }
        return false;
    }
    if (ec) {
        throw model::ScanError("Cannot access " + dir.string() + ": " + ec.message());
    }

    std::filesystem::create_directories(dir, ec);
    if (ec) {
        Logger::error("DirectoryScanner: Failed to create " + dir.string() + ": " + ec.message());
        throw model::ScanError("Error creating directory " + dir.string() + ": " + ec.message());
    }
    Logger::info("DirectoryScanner: Created directory " + dir.string());
    return true;
}

DirectoryScanner::ScanResult DirectoryScanner::scan(const std::filesystem::path& dir) {
    ScanResult result;
    result.directory = dir.empty() ? std::filesystem::path(".") : dir;

    // Normalize: strip trailing slashes to prevent // in paths
    std::string dir_str = result.directory.string();
    while (dir_str.length() > 1 && dir_str.back() == '/') {
        dir_str.pop_back();
    }
    Logger::info("DirectoryScanner: Scanning " + dir_str);

    result.created = ensure_directory(result.directory);
    if (result.created) {
        return result;
    }

    std::vector<std::filesystem::path> paths;
    read_entries(dir_str, paths);

    std::sort(paths.begin(), paths.end());

    result.images.reserve(paths.size());
    for (size_t i = 0; i < paths.size(); ++i) {
        model::ImageRef ref;
        ref.path = paths[i];
        ref.index = i;
        ref.format = Platform::get_image_format(paths[i]);
        result.images.push_back(std::move(ref));
    }

    Logger::info("DirectoryScanner: Found " + std::to_string(result.images.size()) +
                 " image files in " + dir_str);
    return result;
}

void DirectoryScanner::read_entries(const std::string& dir_path,
                                    std::vector<std::filesystem::path>& out) {
    int fd = open(dir_path.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        std::string reason = std::strerror(errno);
        Logger::error("DirectoryScanner: Failed to open directory: " + dir_path);
        throw model::ScanError("Cannot open directory " + dir_path + ": " + reason);
    }

    // Heap buffer: the scanner may run on small stacks
    auto buffer = std::make_unique<char[]>(BUFFER_SIZE);

    while (true) {
        long nread = syscall(SYS_getdents64, fd, buffer.get(), BUFFER_SIZE);

        if (nread == -1) {
            std::string reason = std::strerror(errno);
            close(fd);
            Logger::error("DirectoryScanner: getdents64 failed for " + dir_path);
            throw model::ScanError("Cannot read directory " + dir_path + ": " + reason);
        }

        if (nread == 0) {
            break;
        }

        for (long pos = 0; pos < nread;) {
            auto* d = reinterpret_cast<linux_dirent64*>(buffer.get() + pos);
            pos += d->d_reclen;

            if (strcmp(d->d_name, ".") == 0 || strcmp(d->d_name, "..") == 0) {
                continue;
            }
            if (!is_image_extension(d->d_name)) {
                continue;
            }

            bool regular = d->d_type == DT_REG_TYPE;
            if (d->d_type == DT_UNKNOWN_TYPE || d->d_type == DT_LNK_TYPE) {
                // Filesystem doesn't report d_type, or a symlink: follow with stat
                struct stat entry_stat;
                regular = fstatat(fd, d->d_name, &entry_stat, 0) == 0 && S_ISREG(entry_stat.st_mode);
            }

            if (regular) {
                out.emplace_back(dir_path + "/" + d->d_name);
            } else {
                Logger::debug(std::string("DirectoryScanner: Ignoring non-file entry ") + d->d_name);
            }
        }
    }

    close(fd);
}

}  // namespace collagist::util
