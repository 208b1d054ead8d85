#include "../framework/SimpleTest.hpp"
#include "collage/CellFitter.hpp"
#include "model/Errors.hpp"
#include <algorithm>

using namespace collagist::collage;
using collagist::image::DecodeResult;
using collagist::image::Raster;
using collagist::image::ResampleFilter;
using collagist::image::Rgb;

// Horizontal gradient so resampling actually has something to do
static Raster gradient(int w, int h) {
    Raster r(w, h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            r.set(x, y, Rgb{static_cast<uint8_t>(x * 255 / std::max(1, w - 1)),
                            static_cast<uint8_t>(y * 255 / std::max(1, h - 1)), 77});
        }
    }
    return r;
}

TEST_CASE(test_thumbnail_matching_aspect) {
    ASSERT_EQ(CellFitter::thumbnail_size(700, 1200, 350, 600), std::make_pair(350, 600));
}

TEST_CASE(test_thumbnail_square_into_tall_cell) {
    // Width binds: 1000x1000 -> 350x350
    ASSERT_EQ(CellFitter::thumbnail_size(1000, 1000, 350, 600), std::make_pair(350, 350));
}

TEST_CASE(test_thumbnail_tall_and_narrow) {
    // Height binds: 100x1000 -> 60x600, even though width already fits
    ASSERT_EQ(CellFitter::thumbnail_size(100, 1000, 350, 600), std::make_pair(60, 600));
}

TEST_CASE(test_thumbnail_picks_closest_rounding) {
    // 350 / (1000/333) = 116.55; 117 keeps the aspect closer than 116
    ASSERT_EQ(CellFitter::thumbnail_size(1000, 333, 350, 600), std::make_pair(350, 117));
}

TEST_CASE(test_thumbnail_never_below_one_pixel) {
    ASSERT_EQ(CellFitter::thumbnail_size(10000, 1, 100, 100), std::make_pair(100, 1));
}

TEST_CASE(test_thumbnail_small_source_untouched) {
    ASSERT_EQ(CellFitter::thumbnail_size(100, 50, 350, 600), std::make_pair(100, 50));
    ASSERT_EQ(CellFitter::thumbnail_size(350, 600, 350, 600), std::make_pair(350, 600));
}

TEST_CASE(test_crop_origin_centers_and_clamps) {
    ASSERT_EQ(CellFitter::crop_origin(500, 700, 350, 600), std::make_pair(75, 50));
    ASSERT_EQ(CellFitter::crop_origin(351, 600, 350, 600), std::make_pair(0, 0));
    ASSERT_EQ(CellFitter::crop_origin(100, 50, 350, 600), std::make_pair(0, 0));
}

TEST_CASE(test_fit_exact_cell) {
    CellFitter fitter(35, 60);
    auto result = fitter.fit(gradient(70, 120));
    ASSERT_TRUE(result.valid);
    ASSERT_TRUE(result.scaled);
    ASSERT_FALSE(result.cropped);
    ASSERT_EQ(result.image.width(), 35);
    ASSERT_EQ(result.image.height(), 60);
}

TEST_CASE(test_fit_aspect_mismatch_stays_inside_cell) {
    CellFitter fitter(35, 60);
    auto result = fitter.fit(gradient(100, 100));
    ASSERT_TRUE(result.valid);
    ASSERT_EQ(result.image.width(), 35);
    ASSERT_EQ(result.image.height(), 35);
}

TEST_CASE(test_fit_small_source_not_upscaled_or_padded) {
    CellFitter fitter(35, 60);
    Raster small = gradient(10, 8);
    auto result = fitter.fit(small);
    ASSERT_TRUE(result.valid);
    ASSERT_FALSE(result.scaled);
    ASSERT_EQ(result.image.width(), 10);
    ASSERT_EQ(result.image.height(), 8);
    ASSERT_TRUE(result.image == small);
}

TEST_CASE(test_fit_preserves_solid_color) {
    CellFitter fitter(20, 20, ResampleFilter::Mitchell);
    auto result = fitter.fit(Raster(200, 200, Rgb{200, 40, 10}));
    ASSERT_TRUE(result.valid);
    Rgb px = result.image.at(10, 10);
    ASSERT_NEAR(static_cast<int>(px.r), 200, 1);
    ASSERT_NEAR(static_cast<int>(px.g), 40, 1);
    ASSERT_NEAR(static_cast<int>(px.b), 10, 1);
}

TEST_CASE(test_fit_is_deterministic) {
    CellFitter fitter(35, 60, ResampleFilter::CatmullRom);
    Raster src = gradient(300, 217);
    auto a = fitter.fit(src);
    auto b = fitter.fit(src);
    ASSERT_TRUE(a.valid && b.valid);
    ASSERT_TRUE(a.image == b.image);
}

TEST_CASE(test_fit_failed_decode_is_skippable) {
    CellFitter fitter(35, 60);
    DecodeResult failed;
    failed.error = "corrupt header";
    auto result = fitter.fit(failed);
    ASSERT_FALSE(result.valid);
    ASSERT_EQ(result.error, std::string("corrupt header"));

    auto empty = fitter.fit(Raster());
    ASSERT_FALSE(empty.valid);
}

TEST_CASE(test_fitter_rejects_empty_cell) {
    ASSERT_THROWS(CellFitter(0, 10), collagist::model::ConfigError);
}

int main() {
    return collagist::test::TestRunner::instance().run_all();
}
