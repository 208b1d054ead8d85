#include "../framework/SimpleTest.hpp"
#include "collage/GridGeometry.hpp"
#include "collage/Compositor.hpp"
#include "model/Errors.hpp"
#include <limits>

using namespace collagist::collage;
using collagist::image::Raster;
using collagist::image::Rgb;
using collagist::model::CompositeError;
using collagist::model::ConfigError;

TEST_CASE(test_canvas_size_defaults) {
    // 12 images, 5 columns of 350x600 with 10px gaps -> 3 rows
    auto g = GridGeometry::for_images(12, 5, 350, 600, 10);
    ASSERT_EQ(g.rows, 3);
    ASSERT_EQ(g.canvas_width(), 5 * 360 - 10);
    ASSERT_EQ(g.canvas_height(), 3 * 610 - 10);
}

TEST_CASE(test_rows_round_up) {
    ASSERT_EQ(GridGeometry::for_images(1, 5, 10, 10, 0).rows, 1);
    ASSERT_EQ(GridGeometry::for_images(5, 5, 10, 10, 0).rows, 1);
    ASSERT_EQ(GridGeometry::for_images(6, 5, 10, 10, 0).rows, 2);
    ASSERT_EQ(GridGeometry::for_images(7, 1, 10, 10, 0).rows, 7);
}

TEST_CASE(test_zero_padding_is_tight) {
    auto g = GridGeometry::for_images(4, 2, 30, 20, 0);
    ASSERT_EQ(g.canvas_width(), 60);
    ASSERT_EQ(g.canvas_height(), 40);
}

TEST_CASE(test_cell_origin_row_major) {
    auto g = GridGeometry::for_images(7, 3, 40, 60, 5);
    ASSERT_EQ(g.cell_origin(0), std::make_pair(0, 0));
    ASSERT_EQ(g.cell_origin(2), std::make_pair(90, 0));
    ASSERT_EQ(g.cell_origin(3), std::make_pair(0, 65));
    ASSERT_EQ(g.cell_origin(6), std::make_pair(0, 130));
}

TEST_CASE(test_invalid_geometry_rejected) {
    ASSERT_THROWS(GridGeometry::for_images(3, 0, 10, 10, 0), ConfigError);
    ASSERT_THROWS(GridGeometry::for_images(3, 2, 0, 10, 0), ConfigError);
    ASSERT_THROWS(GridGeometry::for_images(3, 2, 10, -1, 0), ConfigError);
    ASSERT_THROWS(GridGeometry::for_images(3, 2, 10, 10, -1), ConfigError);
    // Single column: the canvas extent fits an int, but cell + padding does not
    constexpr int max = std::numeric_limits<int>::max();
    ASSERT_THROWS(GridGeometry::for_images(1, 1, 1, 1, max), ConfigError);
    ASSERT_THROWS(GridGeometry::for_images(1, 1, max, 1, 1), ConfigError);
    ASSERT_THROWS(GridGeometry::for_images(2, 2, 1, 1, max / 2), ConfigError);
}

TEST_CASE(test_large_geometry_stays_in_range) {
    constexpr int max = std::numeric_limits<int>::max();
    auto g = GridGeometry::for_images(1, 1, max - 10, 1, 10);
    ASSERT_EQ(g.canvas_width(), max - 10);
    ASSERT_EQ(g.cell_origin(0), std::make_pair(0, 0));
}

TEST_CASE(test_compositor_background_and_placement) {
    auto g = GridGeometry::for_images(2, 2, 4, 3, 2);
    Rgb white{255, 255, 255};
    Compositor comp(g, white);
    ASSERT_EQ(comp.canvas().width(), 10);
    ASSERT_EQ(comp.canvas().height(), 3);
    ASSERT_EQ(comp.canvas().at(5, 1), white);

    comp.place(1, Raster(4, 3, Rgb{255, 0, 0}));
    ASSERT_EQ(comp.canvas().at(6, 0), (Rgb{255, 0, 0}));
    ASSERT_EQ(comp.canvas().at(9, 2), (Rgb{255, 0, 0}));
    // Gap and the untouched first cell stay background
    ASSERT_EQ(comp.canvas().at(4, 1), white);
    ASSERT_EQ(comp.canvas().at(0, 0), white);
    ASSERT_EQ(comp.placed(), 1u);
}

TEST_CASE(test_compositor_small_cell_leaves_background) {
    auto g = GridGeometry::for_images(1, 1, 10, 10, 0);
    Compositor comp(g, Rgb{0, 0, 255});
    comp.place(0, Raster(3, 2, Rgb{0, 255, 0}));
    ASSERT_EQ(comp.canvas().at(2, 1), (Rgb{0, 255, 0}));
    ASSERT_EQ(comp.canvas().at(3, 1), (Rgb{0, 0, 255}));
    ASSERT_EQ(comp.canvas().at(2, 2), (Rgb{0, 0, 255}));
}

TEST_CASE(test_compositor_rejects_bad_cells) {
    auto g = GridGeometry::for_images(2, 2, 4, 4, 0);
    Compositor comp(g, Rgb{});
    ASSERT_THROWS(comp.place(2, Raster(4, 4)), CompositeError);
    ASSERT_THROWS(comp.place(0, Raster()), CompositeError);
    ASSERT_THROWS(comp.place(0, Raster(5, 4)), CompositeError);
    ASSERT_EQ(comp.placed(), 0u);
}

int main() {
    return collagist::test::TestRunner::instance().run_all();
}
