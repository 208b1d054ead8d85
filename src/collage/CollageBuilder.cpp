#include "collage/CollageBuilder.hpp"
#include "collage/CellFitter.hpp"
#include "collage/CollageWriter.hpp"
#include "collage/Compositor.hpp"
#include "collage/GridGeometry.hpp"
#include "image/ColorParser.hpp"
#include "image/ImageEncoder.hpp"
#include "model/Errors.hpp"
#include "util/Checksum.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"

namespace collagist::collage {

using events::ProgressEvent;

CollageBuilder::CollageBuilder(image::ImageDecoder& decoder, config::CollageConfig config)
    : decoder_(decoder),
      config_(std::move(config)),
      settings_(config::ConfigLoader::validate(config_)) {
    util::Logger::info("CollageBuilder: " + std::to_string(config_.columns) + " columns, cell " +
                       std::to_string(config_.width) + "x" + std::to_string(config_.height) +
                       ", padding " + std::to_string(config_.padding) + ", background " +
                       image::ColorParser::to_hex(settings_.background) + ", filter " +
                       image::Resampler::filter_name(settings_.filter) + ", decoder " + decoder_.name());
}

void CollageBuilder::emit(ProgressEvent event) const {
    if (progress_) {
        progress_(event);
    }
}

model::RunReport CollageBuilder::run() {
    model::RunReport report;
    report.output_path = config_.output;

    auto scan = util::DirectoryScanner::scan(config_.input_dir);
    report.images_found = scan.images.size();
    if (scan.created) {
        emit({ProgressEvent::Type::DirectoryCreated, 0, 0, scan.directory.string(), {}});
    }

    if (scan.images.empty()) {
        util::Logger::info("CollageBuilder: No supported images in " + config_.input_dir.string());
        emit({ProgressEvent::Type::NoImages, 0, 0, config_.input_dir.string(), {}});
        report.status = model::RunStatus::Empty;
        return report;
    }

    const std::size_t total = scan.images.size();
    auto geometry = GridGeometry::for_images(total, config_.columns, config_.width,
                                             config_.height, config_.padding);

    // Fail before decoding anything if the output format cannot hold the canvas
    const auto format = image::image_encoder::format_for_path(config_.output);
    const int limit = image::image_encoder::max_dimension(format);
    if (geometry.canvas_width() > limit || geometry.canvas_height() > limit) {
        throw model::WriteError("Canvas " + std::to_string(geometry.canvas_width()) + "x" +
                                std::to_string(geometry.canvas_height()) + " exceeds the " +
                                image::image_encoder::format_name(format) + " limit of " +
                                std::to_string(limit) + " pixels per side");
    }

    Compositor compositor(geometry, settings_.background);
    CellFitter fitter(config_.width, config_.height, settings_.filter);

    report.canvas_width = geometry.canvas_width();
    report.canvas_height = geometry.canvas_height();
    emit({ProgressEvent::Type::CollageStarted, 0, total,
          std::to_string(report.canvas_width) + "x" + std::to_string(report.canvas_height), {}});

    for (const auto& ref : scan.images) {
        const std::size_t position = ref.index + 1;
        emit({ProgressEvent::Type::ImageStarted, position, total, ref.filename(), {}});

        FitResult fitted = fitter.fit(decoder_.decode(ref.path));
        if (fitted.valid) {
            try {
                compositor.place(ref.index, fitted.image);
                continue;
            } catch (const model::CompositeError& e) {
                fitted.error = e.what();
            }
        }

        util::Logger::warn("CollageBuilder: Skipping " + ref.path.string() + ": " + fitted.error);
        report.skipped.push_back({ref, fitted.error});
        emit({ProgressEvent::Type::ImageSkipped, position, total, ref.filename(), fitted.error});
    }

    report.images_placed = compositor.placed();

    image::Raster canvas = compositor.take_canvas();
    report.canvas_checksum = util::fnv1a(canvas.pixels());

    if (CollageWriter::ensure_parent_directory(config_.output)) {
        emit({ProgressEvent::Type::DirectoryCreated, 0, 0, config_.output.parent_path().string(), {}});
    }
    CollageWriter writer(config_.quality);
    writer.write(canvas, config_.output);

    report.status = model::RunStatus::Written;
    util::Logger::info("CollageBuilder: Placed " + std::to_string(report.images_placed) + "/" +
                       std::to_string(total) + " images, skipped " + std::to_string(report.skipped.size()));
    emit({ProgressEvent::Type::CollageSaved, 0, total, config_.output.string(), {}});
    return report;
}

}  // namespace collagist::collage
