#include "../framework/SimpleTest.hpp"
#include "../framework/Fixtures.hpp"
#include "collage/CollageBuilder.hpp"
#include "image/ImageDecoder.hpp"
#include "model/Errors.hpp"
#include "util/Logger.hpp"
#include <stb/stb_image.h>

using namespace collagist;
using collagist::image::Rgb;
using collagist::test::TempDir;
using collagist::test::write_bytes;
using collagist::test::write_solid_png;

// Small cells keep the fixtures cheap
static config::CollageConfig small_config(const TempDir& dir, const std::string& output = "out/collage.png") {
    config::CollageConfig cfg;
    cfg.input_dir = dir / "in";
    cfg.output = dir / output;
    cfg.columns = 3;
    cfg.width = 40;
    cfg.height = 60;
    cfg.padding = 4;
    cfg.background = "white";
    return cfg;
}

struct Decoded {
    int w = 0, h = 0;
    std::vector<unsigned char> rgb;
    Rgb at(int x, int y) const {
        size_t i = (static_cast<size_t>(y) * w + x) * 3;
        return Rgb{rgb[i], rgb[i + 1], rgb[i + 2]};
    }
};

static Decoded load_output(const std::filesystem::path& path) {
    Decoded d;
    int channels = 0;
    unsigned char* px = stbi_load(path.c_str(), &d.w, &d.h, &channels, 3);
    if (!px) throw std::runtime_error("cannot read " + path.string());
    d.rgb.assign(px, px + static_cast<size_t>(d.w) * d.h * 3);
    stbi_image_free(px);
    return d;
}

// Decoder double: serves solid rasters and fails on names containing "bad"
class FakeDecoder : public image::ImageDecoder {
public:
    int calls = 0;
    image::DecodeResult decode(const std::filesystem::path& path) override {
        ++calls;
        image::DecodeResult result;
        if (path.filename().string().find("bad") != std::string::npos) {
            result.error = "fake failure";
            return result;
        }
        result.raster = image::Raster(80, 120, Rgb{0, 0, 255});
        result.source_channels = 3;
        result.valid = true;
        return result;
    }
    std::string name() const override { return "fake"; }
};

TEST_CASE(test_canvas_dimensions_follow_grid) {
    TempDir dir;
    std::filesystem::create_directories(dir / "in");
    for (int i = 0; i < 7; ++i) {
        write_solid_png(dir / "in" / ("img" + std::to_string(i) + ".png"), 30 + i * 20, 50 + i * 10,
                        Rgb{static_cast<uint8_t>(i * 30), 100, 50});
    }

    image::StbImageDecoder decoder;
    collage::CollageBuilder builder(decoder, small_config(dir));
    auto report = builder.run();

    ASSERT_TRUE(report.status == model::RunStatus::Written);
    ASSERT_EQ(report.images_found, 7u);
    ASSERT_EQ(report.images_placed, 7u);
    // 3 columns, ceil(7/3) = 3 rows
    ASSERT_EQ(report.canvas_width, 3 * (40 + 4) - 4);
    ASSERT_EQ(report.canvas_height, 3 * (60 + 4) - 4);

    auto out = load_output(dir / "out" / "collage.png");
    ASSERT_EQ(out.w, report.canvas_width);
    ASSERT_EQ(out.h, report.canvas_height);
    // Padding gap and the empty last-row cells are background
    ASSERT_EQ(out.at(41, 10), (Rgb{255, 255, 255}));
    ASSERT_EQ(out.at(report.canvas_width - 1, report.canvas_height - 1), (Rgb{255, 255, 255}));
}

TEST_CASE(test_corrupt_image_is_skipped) {
    TempDir dir;
    std::filesystem::create_directories(dir / "in");
    // Sorted order: a0 a1 a2(corrupt) a3 a4 a5
    for (int i : {0, 1, 3, 4, 5}) {
        write_solid_png(dir / "in" / ("a" + std::to_string(i) + ".png"), 40, 60, Rgb{200, 0, 0});
    }
    write_bytes(dir / "in" / "a2.jpg", "definitely not a jpeg");

    auto cfg = small_config(dir);
    cfg.background = "#00ff00";
    image::StbImageDecoder decoder;
    collage::CollageBuilder builder(decoder, cfg);

    std::vector<events::ProgressEvent::Type> seen;
    builder.set_progress_handler([&](const events::ProgressEvent& e) { seen.push_back(e.type); });
    auto report = builder.run();

    ASSERT_TRUE(report.status == model::RunStatus::Written);
    ASSERT_EQ(report.images_placed, 5u);
    ASSERT_EQ(report.skipped.size(), 1u);
    ASSERT_EQ(report.skipped[0].image.filename(), std::string("a2.jpg"));
    ASSERT_FALSE(report.skipped[0].reason.empty());

    auto out = load_output(cfg.output);
    // Cell 2 (row 0, col 2) shows only background, cell 1 is populated
    ASSERT_EQ(out.at(2 * 44 + 20, 30), (Rgb{0, 255, 0}));
    ASSERT_EQ(out.at(44 + 20, 30), (Rgb{200, 0, 0}));
    ASSERT_EQ(out.at(20, 64 + 30), (Rgb{200, 0, 0}));

    int skipped_events = 0;
    for (auto t : seen) {
        if (t == events::ProgressEvent::Type::ImageSkipped) ++skipped_events;
    }
    ASSERT_EQ(skipped_events, 1);
    ASSERT_TRUE(seen.back() == events::ProgressEvent::Type::CollageSaved);
}

TEST_CASE(test_small_image_is_not_upscaled) {
    TempDir dir;
    std::filesystem::create_directories(dir / "in");
    write_solid_png(dir / "in" / "tiny.png", 10, 12, Rgb{255, 0, 0});

    auto cfg = small_config(dir);
    cfg.columns = 1;
    cfg.background = "black";
    image::StbImageDecoder decoder;
    auto report = collage::CollageBuilder(decoder, cfg).run();
    ASSERT_EQ(report.canvas_width, 40);
    ASSERT_EQ(report.canvas_height, 60);

    auto out = load_output(cfg.output);
    ASSERT_EQ(out.at(9, 11), (Rgb{255, 0, 0}));
    ASSERT_EQ(out.at(10, 11), (Rgb{0, 0, 0}));
    ASSERT_EQ(out.at(20, 30), (Rgb{0, 0, 0}));
}

TEST_CASE(test_empty_directory_writes_nothing) {
    TempDir dir;
    std::filesystem::create_directories(dir / "in");
    write_bytes(dir / "in" / "readme.txt", "no images here");

    image::StbImageDecoder decoder;
    collage::CollageBuilder builder(decoder, small_config(dir));
    bool announced = false;
    builder.set_progress_handler([&](const events::ProgressEvent& e) {
        if (e.type == events::ProgressEvent::Type::NoImages) announced = true;
    });
    auto report = builder.run();

    ASSERT_TRUE(report.status == model::RunStatus::Empty);
    ASSERT_TRUE(announced);
    ASSERT_FALSE(std::filesystem::exists(dir / "out"));
}

TEST_CASE(test_missing_input_directory_is_created) {
    TempDir dir;
    image::StbImageDecoder decoder;
    auto report = collage::CollageBuilder(decoder, small_config(dir)).run();
    ASSERT_TRUE(report.status == model::RunStatus::Empty);
    ASSERT_TRUE(std::filesystem::is_directory(dir / "in"));
}

TEST_CASE(test_invalid_background_fails_before_scanning) {
    TempDir dir;
    auto cfg = small_config(dir);
    cfg.background = "bluish";
    FakeDecoder decoder;
    ASSERT_THROWS(collage::CollageBuilder builder(decoder, cfg), model::ConfigError);
    ASSERT_EQ(decoder.calls, 0);
    ASSERT_FALSE(std::filesystem::exists(dir / "in"));
    ASSERT_FALSE(std::filesystem::exists(dir / "out"));
}

TEST_CASE(test_runs_are_identical) {
    TempDir dir;
    std::filesystem::create_directories(dir / "in");
    for (int i = 0; i < 4; ++i) {
        write_solid_png(dir / "in" / ("p" + std::to_string(i) + ".png"), 97 + i * 13, 71 + i * 29,
                        Rgb{static_cast<uint8_t>(40 * i), static_cast<uint8_t>(255 - 40 * i), 9});
    }
    auto cfg = small_config(dir, "run.jpg");
    image::StbImageDecoder decoder;

    auto first = collage::CollageBuilder(decoder, cfg).run();
    auto first_bytes = test::read_bytes(cfg.output);
    auto second = collage::CollageBuilder(decoder, cfg).run();
    auto second_bytes = test::read_bytes(cfg.output);

    ASSERT_EQ(first.canvas_checksum, second.canvas_checksum);
    ASSERT_TRUE(first_bytes == second_bytes);
    ASSERT_FALSE(first_bytes.empty());
    // JPEG SOI marker
    ASSERT_EQ(static_cast<unsigned char>(first_bytes[0]), 0xFF);
    ASSERT_EQ(static_cast<unsigned char>(first_bytes[1]), 0xD8);
}

TEST_CASE(test_injected_decoder_is_used) {
    TempDir dir;
    std::filesystem::create_directories(dir / "in");
    for (const char* n : {"one.jpg", "bad_two.png", "three.gif"}) write_bytes(dir / "in" / n, "x");

    FakeDecoder decoder;
    auto cfg = small_config(dir);
    auto report = collage::CollageBuilder(decoder, cfg).run();
    ASSERT_EQ(decoder.calls, 3);
    ASSERT_EQ(report.images_placed, 2u);
    ASSERT_EQ(report.skipped.size(), 1u);
    ASSERT_EQ(report.skipped[0].reason, std::string("fake failure"));

    // 80x120 source halves to exactly 40x60; "bad_two.png" sorts first
    auto out = load_output(cfg.output);
    ASSERT_EQ(out.at(20, 30), (Rgb{255, 255, 255}));
    Rgb placed = out.at(44 + 20, 30);
    ASSERT_TRUE(placed.r <= 1 && placed.g <= 1 && placed.b >= 254);
}

TEST_CASE(test_output_directories_are_created) {
    TempDir dir;
    std::filesystem::create_directories(dir / "in");
    write_solid_png(dir / "in" / "x.png", 40, 60, Rgb{1, 2, 3});

    image::StbImageDecoder decoder;
    auto cfg = small_config(dir, "deep/er/still/collage.bmp");
    auto report = collage::CollageBuilder(decoder, cfg).run();
    ASSERT_TRUE(report.status == model::RunStatus::Written);
    ASSERT_TRUE(std::filesystem::is_regular_file(cfg.output));
    ASSERT_EQ(load_output(cfg.output).w, 3 * 44 - 4);
}

TEST_CASE(test_unwritable_output_fails_without_partial_file) {
    TempDir dir;
    std::filesystem::create_directories(dir / "in");
    write_solid_png(dir / "in" / "x.png", 40, 60, Rgb{1, 2, 3});
    write_bytes(dir / "blocker", "a file where a directory is needed");

    image::StbImageDecoder decoder;
    auto cfg = small_config(dir, "blocker/collage.jpg");
    ASSERT_THROWS((void)collage::CollageBuilder(decoder, cfg).run(), model::WriteError);

    // Target is an existing directory: rename fails and the temp file is removed
    std::filesystem::create_directories(dir / "taken.jpg");
    cfg.output = dir / "taken.jpg";
    ASSERT_THROWS((void)collage::CollageBuilder(decoder, cfg).run(), model::WriteError);
    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        ASSERT_TRUE(entry.path().filename().string().find(".part") == std::string::npos);
    }
}

TEST_CASE(test_oversized_jpeg_fails_before_decoding) {
    TempDir dir;
    std::filesystem::create_directories(dir / "in");
    for (const char* n : {"a.png", "b.png"}) write_bytes(dir / "in" / n, "x");

    FakeDecoder decoder;
    auto cfg = small_config(dir, "tall.jpg");
    cfg.columns = 1;
    cfg.width = 1;
    cfg.height = 40000;
    cfg.padding = 0;
    ASSERT_THROWS((void)collage::CollageBuilder(decoder, cfg).run(), model::WriteError);
    ASSERT_EQ(decoder.calls, 0);
    ASSERT_FALSE(std::filesystem::exists(cfg.output));
}

TEST_CASE(test_created_directories_are_reported) {
    TempDir dir;
    FakeDecoder decoder;
    std::vector<std::string> created;
    auto track = [&created](const events::ProgressEvent& evt) {
        if (evt.type == events::ProgressEvent::Type::DirectoryCreated) created.push_back(evt.data);
    };

    collage::CollageBuilder first(decoder, small_config(dir));
    first.set_progress_handler(track);
    (void)first.run();
    ASSERT_EQ(created.size(), 1u);
    ASSERT_EQ(created[0], (dir / "in").string());

    write_bytes(dir / "in" / "one.png", "x");
    collage::CollageBuilder second(decoder, small_config(dir));
    second.set_progress_handler(track);
    (void)second.run();
    ASSERT_EQ(created.size(), 2u);
    ASSERT_EQ(created[1], (dir / "out").string());

    // Directories now exist: nothing more to announce
    collage::CollageBuilder third(decoder, small_config(dir));
    third.set_progress_handler(track);
    (void)third.run();
    ASSERT_EQ(created.size(), 2u);
}

int main() {
    collagist::util::Logger::init("/tmp/collagist_test_pipeline.log", collagist::util::Logger::Level::Debug);
    return collagist::test::TestRunner::instance().run_all();
}
