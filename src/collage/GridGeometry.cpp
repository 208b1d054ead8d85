#include "collage/GridGeometry.hpp"
#include "model/Errors.hpp"
#include <algorithm>
#include <limits>
#include <string>

namespace collagist::collage {

GridGeometry GridGeometry::for_images(std::size_t image_count, int columns,
                                      int cell_width, int cell_height, int padding) {
    if (columns < 1) {
        throw model::ConfigError("Number of columns must be at least 1");
    }
    if (cell_width < 1 || cell_height < 1) {
        throw model::ConfigError("Width and height must be positive numbers");
    }
    if (padding < 0) {
        throw model::ConfigError("Padding cannot be negative");
    }

    GridGeometry g;
    g.columns = columns;
    g.cell_width = cell_width;
    g.cell_height = cell_height;
    g.padding = padding;

    std::size_t rows = (image_count + columns - 1) / columns;
    g.rows = rows == 0 ? 1 : static_cast<int>(std::min<std::size_t>(rows, std::numeric_limits<int>::max()));

    // Every intermediate of canvas_width()/canvas_height()/cell_origin() is
    // bounded by columns * (cell + padding), so that product must fit an int
    constexpr long long limit = std::numeric_limits<int>::max();
    long long pitch_x = static_cast<long long>(g.columns) * (cell_width + static_cast<long long>(padding));
    long long pitch_y = static_cast<long long>(g.rows) * (cell_height + static_cast<long long>(padding));
    if (pitch_x > limit || pitch_y > limit || rows > static_cast<std::size_t>(limit)) {
        throw model::ConfigError("Canvas would be too large: " + std::to_string(pitch_x - padding) + "x" +
                                 std::to_string(pitch_y - padding));
    }
    return g;
}

std::pair<int, int> GridGeometry::cell_origin(std::size_t index) const {
    int row = static_cast<int>(index / columns);
    int col = static_cast<int>(index % columns);
    return {col * (cell_width + padding), row * (cell_height + padding)};
}

}  // namespace collagist::collage
