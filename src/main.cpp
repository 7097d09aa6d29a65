#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include <unistd.h>

#include "CommandLine.hpp"
#include "ConfigParser.hpp"
#include "Interactive.hpp"
#include "Sorter.hpp"

namespace {
constexpr int kInterruptedExitCode = 130;

// Ctrl+C ends the run immediately; only async-signal-safe calls are allowed here.
void handleInterrupt(int) {
    constexpr char message[] = "\nInterrupted.\n";
    ssize_t ignored = write(STDERR_FILENO, message, sizeof(message) - 1);
    (void)ignored;
    _exit(kInterruptedExitCode);
}
} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, handleInterrupt);

    const std::string programName = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "sortify";

    CommandLineOptions options;
    std::string error;
    if (!parseCommandLine(argc, argv, options, error)) {
        std::cerr << error << std::endl << std::endl << usageText(programName);
        return EXIT_FAILURE;
    }

    if (options.showHelp) {
        std::cout << usageText(programName);
        return EXIT_SUCCESS;
    }

    ConfigParser parser;
    if (options.configFile && !parser.load(*options.configFile)) {
        std::cerr << "Failed to load configuration. Exiting." << std::endl;
        return EXIT_FAILURE;
    }

    SortConfig config = buildConfig(options, parser.getDefaults());

    if (config.interactive) {
        InteractiveSession session(std::cin, std::cout, supportsColor());
        const auto guided = session.run(config.root);
        if (!guided) {
            return EXIT_FAILURE;
        }
        config = *guided;
    }

    SortSummary summary;
    if (!sortFiles(config, summary)) {
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
