/**
 * @file main.cpp
 * @brief Entry point for storage-filler-worker
 *
 * The worker is started by the controller (storage-filler) and communicates
 * with it only through the working directory: it writes chunk files and
 * status.txt, and watches for stop.txt.
 */

#include "worker/WorkerCommand.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    auto options = worker::parse_worker_args(argc, argv);
    if (!options) {
        std::cerr << "Error: " << options.error().message << "\n\n";
        worker::print_worker_usage();
        return worker::EXIT_USAGE;
    }

    if (options->show_help) {
        worker::print_worker_usage();
        return 0;
    }

    return worker::run_worker(*options);
}
