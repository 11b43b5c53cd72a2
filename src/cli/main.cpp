#include "cli/colors.hpp"
#include "cli/interrupt.hpp"
#include "cli/shell.hpp"
#include "common/logging.hpp"
#include <argparse/argparse.hpp>
#include <iostream>
#include <stdexcept>

namespace {
constexpr const char *FILEWARDEN_VERSION = "1.0.0";
}

/**
 * Set up command line argument parser with all available options
 */
void setup_argument_parser(argparse::ArgumentParser &program)
{
    program.add_description("Interactive file system manager");

    program.add_argument("--log-level")
        .help("Log file level (trace, debug, info, warn, error, critical, off)")
        .default_value(std::string("debug"));

    program.add_argument("--console-log-level")
        .help("Console logging level (trace, debug, info, warn, error, "
              "critical, off)")
        .default_value(std::string("info"));

    program.add_argument("--log-file")
        .help("Path to log file")
        .default_value(std::string("filewarden.log"));

    program.add_argument("--no-file-log")
        .help("Disable logging to file")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--no-console-log")
        .help("Disable logging to console")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);
}

/**
 * Parse arguments and handle parsing errors
 */
bool parse_arguments(argparse::ArgumentParser &program, int argc, char *argv[])
{
    try {
        program.parse_args(argc, argv);
        return true;
    } catch (const std::runtime_error &err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return false;
    }
}

int main(int argc, char *argv[])
{
    argparse::ArgumentParser program("filewarden", FILEWARDEN_VERSION);
    setup_argument_parser(program);

    if (!parse_arguments(program, argc, argv)) {
        return 1;
    }

    if (!filewarden::common::configure_logging(program)) {
        std::cerr << "Failed to initialize logging system" << std::endl;
        return 1;
    }

    auto logger = filewarden::common::get_logger("filewarden");

    if (program.get<bool>("--no-color")) {
        filewarden::colors::set_enabled(false);
    }

    if (!filewarden::interrupt::install_handler()) {
        logger->warn("could not install interrupt handler");
    }

    try {
        filewarden::cli::Shell shell;
        shell.run();
    } catch (const std::exception &e) {
        logger->error("exception occurred: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    logger->info("filewarden shutting down");
    return 0;
}
