#pragma once

#include <cstddef>
#include <utility>

namespace collagist::collage {

/**
 * Fixed grid layout: columns x rows cells of cell_width x cell_height,
 * separated by `padding` pixels. There is no outer margin, so the canvas is
 * columns * (cell_width + padding) - padding wide (rows analogous).
 */
struct GridGeometry {
    int columns = 1;
    int rows = 1;
    int cell_width = 1;
    int cell_height = 1;
    int padding = 0;

    /**
     * Geometry for `image_count` images laid out in `columns` columns.
     * rows = ceil(image_count / columns), at least 1.
     *
     * @throws model::ConfigError if columns, cell sizes or padding are out of range
     */
    static GridGeometry for_images(std::size_t image_count, int columns,
                                   int cell_width, int cell_height, int padding);

    int canvas_width() const { return columns * (cell_width + padding) - padding; }
    int canvas_height() const { return rows * (cell_height + padding) - padding; }
    int capacity() const { return columns * rows; }

    // Top-left pixel of the cell for scan index `index`
    std::pair<int, int> cell_origin(std::size_t index) const;

    bool operator==(const GridGeometry& other) const = default;
};

}  // namespace collagist::collage
