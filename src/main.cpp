#include "app/Runner.hpp"
#include <csignal>
#include <iostream>
#include <unistd.h>

// Interrupt: report and leave immediately (only async-signal-safe calls here)
static void signal_handler(int signum) {
    static const char msg[] = "\nOperation cancelled by user.\n";
    ssize_t ignored = ::write(STDOUT_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    ::_exit(signum == SIGINT ? 0 : 128 + signum);
}

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    return collagist::app::run(argc, argv, std::cout, std::cerr);
}
