#include "app/Runner.hpp"
#include "collage/CollageBuilder.hpp"
#include "config/CollageConfig.hpp"
#include "config/CommandLine.hpp"
#include "image/ImageDecoder.hpp"
#include "model/Errors.hpp"
#include "util/Logger.hpp"
#include <filesystem>
#include <string>

namespace collagist::app {

using events::ProgressEvent;

static void print_progress(std::ostream& out, const ProgressEvent& evt) {
    switch (evt.type) {
        case ProgressEvent::Type::DirectoryCreated:
            out << "Created directory: " << evt.data << std::endl;
            break;
        case ProgressEvent::Type::NoImages:
            out << "No supported image files found in " << evt.data << std::endl;
            out << "Supported formats: JPG, JPEG, PNG, BMP, GIF, WEBP" << std::endl;
            break;
        case ProgressEvent::Type::CollageStarted:
            out << "\nCreating collage with " << evt.total << " images..." << std::endl;
            out << "Canvas size: " << evt.data << " pixels" << std::endl;
            break;
        case ProgressEvent::Type::ImageStarted:
            out << "Processing image " << evt.index << "/" << evt.total << ": " << evt.data << std::endl;
            break;
        case ProgressEvent::Type::ImageSkipped:
            out << "Error processing " << evt.data << ": " << evt.reason << std::endl;
            out << "Skipping this image and continuing..." << std::endl;
            break;
        case ProgressEvent::Type::CollageSaved:
            out << "\nCollage successfully saved as: " << evt.data << std::endl;
            break;
    }
}

int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    namespace fs = std::filesystem;
    const std::string program = argc > 0 ? fs::path(argv[0]).filename().string() : "collagist";

    try {
        auto cli = config::CommandLine::parse(argc, argv);
        if (cli.show_help) {
            out << config::CommandLine::usage(program);
            return 0;
        }

        // Defaults < config file < command line
        auto cfg = config::ConfigLoader::load_config(cli.config_file.value_or(fs::path{}));
        cli.apply(cfg);

        util::Logger::init(cfg.log_file, cfg.verbose ? util::Logger::Level::Debug : util::Logger::Level::Info);
        util::Logger::info("collagist starting");

        // Decoder is chosen here and handed to the pipeline
        image::StbImageDecoder decoder;
        collage::CollageBuilder builder(decoder, cfg);
        builder.set_progress_handler([&out](const ProgressEvent& evt) { print_progress(out, evt); });

        auto report = builder.run();

        if (!report.skipped.empty()) {
            out << report.skipped.size() << " of " << report.images_found
                << " images could not be processed" << std::endl;
        }
        util::Logger::info("collagist finished");
        util::Logger::shutdown();
        return 0;
    } catch (const model::CollageError& e) {
        util::Logger::error(e.what());
        err << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        util::Logger::error("Fatal error: " + std::string(e.what()));
        err << "\nAn unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }
}

}  // namespace collagist::app
