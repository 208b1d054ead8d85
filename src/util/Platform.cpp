#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace collagist::util {

std::filesystem::path Platform::get_config_directory() {
    Logger::debug("Platform: Detecting config directory");
    if (auto xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        auto path = std::filesystem::path(xdg) / "collagist";
        Logger::debug("Platform: Config directory: " + path.string());
        return path;
    }
    auto home = std::getenv("HOME");
    if (home) {
        auto path = std::filesystem::path(home) / ".config" / "collagist";
        Logger::debug("Platform: Config directory: " + path.string());
        return path;
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .config/collagist");
    return ".config/collagist";
}

std::filesystem::path Platform::get_default_config_file() {
    return get_config_directory() / "config.toml";
}

std::string Platform::lower_extension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool Platform::is_image_file(const std::filesystem::path& path) {
    return get_image_format(path) != model::ImageFormat::Unknown;
}

model::ImageFormat Platform::get_image_format(const std::filesystem::path& path) {
    auto ext = lower_extension(path);
    if (ext == ".jpg" || ext == ".jpeg") return model::ImageFormat::JPEG;
    if (ext == ".png") return model::ImageFormat::PNG;
    if (ext == ".bmp") return model::ImageFormat::BMP;
    if (ext == ".gif") return model::ImageFormat::GIF;
    if (ext == ".webp") return model::ImageFormat::WEBP;
    return model::ImageFormat::Unknown;
}

std::string Platform::format_name(model::ImageFormat format) {
    switch (format) {
        case model::ImageFormat::JPEG: return "JPEG";
        case model::ImageFormat::PNG: return "PNG";
        case model::ImageFormat::BMP: return "BMP";
        case model::ImageFormat::GIF: return "GIF";
        case model::ImageFormat::WEBP: return "WEBP";
        default: return "Unknown";
    }
}

}  // namespace collagist::util
