#include "collage/CollageWriter.hpp"
#include "model/Errors.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace collagist::collage {

CollageWriter::CollageWriter(int jpeg_quality) : quality_(std::clamp(jpeg_quality, 1, 100)) {}

bool CollageWriter::ensure_parent_directory(const std::filesystem::path& output) {
    auto parent = output.parent_path();
    if (parent.empty()) return false;

    std::error_code ec;
    if (std::filesystem::is_directory(parent, ec)) return false;

    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw model::WriteError("Error creating directory " + parent.string() + ": " + ec.message());
    }
    util::Logger::info("CollageWriter: Created directory " + parent.string());
    return true;
}

void CollageWriter::write(const image::Raster& canvas, const std::filesystem::path& output) const {
    if (output.empty() || !output.has_filename()) {
        throw model::WriteError("Invalid output path: '" + output.string() + "'");
    }

    auto format = image::image_encoder::format_for_path(output);
    std::vector<std::uint8_t> bytes;
    std::string err;
    if (!image::image_encoder::encode(canvas, format, quality_, bytes, err)) {
        throw model::WriteError("Error encoding collage: " + err);
    }

    ensure_parent_directory(output);

    auto temp = output;
    temp += ".part" + std::to_string(::getpid());

    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw model::WriteError("Cannot open " + temp.string() + " for writing");
        }
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file) {
            file.close();
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            throw model::WriteError("Error writing " + temp.string() + " (disk full?)");
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, output, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        throw model::WriteError("Error saving collage to " + output.string() + ": " + ec.message());
    }

    util::Logger::info("CollageWriter: Wrote " + std::to_string(bytes.size()) + " bytes of " +
                       image::image_encoder::format_name(format) + " to " + output.string());
}

}  // namespace collagist::collage
