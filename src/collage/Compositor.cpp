#include "collage/Compositor.hpp"
#include "model/Errors.hpp"
#include "util/Logger.hpp"
#include <string>

namespace collagist::collage {

Compositor::Compositor(const GridGeometry& geometry, image::Rgb background)
    : geometry_(geometry),
      canvas_(geometry.canvas_width(), geometry.canvas_height(), background) {
    util::Logger::info("Compositor: Canvas " + std::to_string(canvas_.width()) + "x" +
                       std::to_string(canvas_.height()) + ", grid " + std::to_string(geometry_.columns) +
                       "x" + std::to_string(geometry_.rows));
}

void Compositor::place(std::size_t index, const image::Raster& cell) {
    if (index >= static_cast<std::size_t>(geometry_.capacity())) {
        throw model::CompositeError("cell index " + std::to_string(index) + " outside " +
                                    std::to_string(geometry_.capacity()) + "-cell grid");
    }
    if (cell.empty()) {
        throw model::CompositeError("cannot paste an empty image");
    }
    if (cell.width() > geometry_.cell_width || cell.height() > geometry_.cell_height) {
        throw model::CompositeError("image " + std::to_string(cell.width()) + "x" +
                                    std::to_string(cell.height()) + " exceeds cell " +
                                    std::to_string(geometry_.cell_width) + "x" +
                                    std::to_string(geometry_.cell_height));
    }

    auto [x, y] = geometry_.cell_origin(index);
    canvas_.blit(cell, x, y);
    ++placed_;
    util::Logger::debug("Compositor: Placed cell " + std::to_string(index) + " at (" +
                        std::to_string(x) + ", " + std::to_string(y) + ")");
}

}  // namespace collagist::collage
