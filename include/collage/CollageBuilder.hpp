#pragma once

#include "config/CollageConfig.hpp"
#include "events/ProgressEvent.hpp"
#include "image/ImageDecoder.hpp"
#include "model/ImageRef.hpp"

namespace collagist::collage {

/**
 * Runs one collage: scan -> decode + fit each image -> composite -> write.
 *
 * The decoder is supplied by the caller and must outlive the builder.
 * Options are validated in the constructor, before anything touches disk.
 * Per-image failures are recorded in the report and skipped; scan and write
 * failures propagate as model::ScanError / model::WriteError. A canvas larger
 * than the output format can describe is a WriteError raised before decoding.
 */
class CollageBuilder {
public:
    CollageBuilder(image::ImageDecoder& decoder, config::CollageConfig config);

    void set_progress_handler(events::ProgressHandler handler) { progress_ = std::move(handler); }

    [[nodiscard]] model::RunReport run();

private:
    image::ImageDecoder& decoder_;
    config::CollageConfig config_;
    config::RenderSettings settings_;
    events::ProgressHandler progress_;

    void emit(events::ProgressEvent event) const;
};

}  // namespace collagist::collage
