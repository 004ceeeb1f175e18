#include "cli.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        auto config = imgmin::CLI::parse(argc, argv);
        if (!config) {
            return 1;
        }

        imgmin::setup_logging(config->verbose);
        return imgmin::CLI::run(*config);
    }
    catch (const imgmin::Error& e) {
        std::cerr << "Fatal error (" << imgmin::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
