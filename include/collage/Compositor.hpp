#pragma once

#include "collage/GridGeometry.hpp"
#include "image/Raster.hpp"
#include <cstddef>

namespace collagist::collage {

// Owns the canvas for one run. Cells never overlap, so placement order
// does not affect the result.
class Compositor {
public:
    Compositor(const GridGeometry& geometry, image::Rgb background);

    /**
     * Pastes a fitted cell into the slot for scan index `index`.
     * A cell smaller than the slot leaves the remainder as background.
     *
     * @throws model::CompositeError if index is outside the grid, or the cell
     *         is empty or larger than a slot
     */
    void place(std::size_t index, const image::Raster& cell);

    const image::Raster& canvas() const { return canvas_; }
    std::size_t placed() const { return placed_; }

    // Hands the canvas over to the caller; the compositor is spent afterwards
    image::Raster take_canvas() { return std::move(canvas_); }

private:
    GridGeometry geometry_;
    image::Raster canvas_;
    std::size_t placed_ = 0;
};

}  // namespace collagist::collage
