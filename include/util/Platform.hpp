#pragma once

#include "model/ImageRef.hpp"
#include <filesystem>
#include <string>

namespace collagist::util {

class Platform {
public:
    static std::filesystem::path get_config_directory();
    static std::filesystem::path get_default_config_file();

    static bool is_image_file(const std::filesystem::path& path);
    static model::ImageFormat get_image_format(const std::filesystem::path& path);
    static std::string format_name(model::ImageFormat format);

    // Lower-cased extension including the dot (".jpg"), empty if none
    static std::string lower_extension(const std::filesystem::path& path);
};

}  // namespace collagist::util
