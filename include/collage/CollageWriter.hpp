#pragma once

#include "image/ImageEncoder.hpp"
#include "image/Raster.hpp"
#include <filesystem>

namespace collagist::collage {

class CollageWriter {
public:
    static constexpr int DEFAULT_QUALITY = 95;

    explicit CollageWriter(int jpeg_quality = DEFAULT_QUALITY);

    /**
     * Encodes the canvas in the format implied by the output extension and
     * stores it at `output`, creating missing parent directories.
     * Data goes to a sibling temporary file first and is renamed into place,
     * so a failed write never leaves a partial output file.
     *
     * @throws model::WriteError on encode, directory or I/O failure
     */
    void write(const image::Raster& canvas, const std::filesystem::path& output) const;

    // Creates the parent directories of `output`. Returns true if any were created.
    // @throws model::WriteError if they cannot be created
    static bool ensure_parent_directory(const std::filesystem::path& output);

private:
    int quality_;
};

}  // namespace collagist::collage
