#pragma once

#include <ostream>

namespace collagist::app {

/**
 * Full command-line run: parse options, layer defaults < config file <
 * command line, start logging, build the collage and print progress to `out`.
 *
 * Returns the process exit code: 0 on success, on --help and when the input
 * directory holds no images; 1 on any option, scan or write error (reported
 * on `err`).
 */
int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

}  // namespace collagist::app
