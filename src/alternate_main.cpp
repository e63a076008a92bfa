#include <exception>
#include <iostream>

#include <nlohmann/json.hpp>

#include "../include/interleave.hpp"
#include "../include/logger.hpp"
#include "../include/options.hpp"

// Interleave the "left" and "right" arrays of the JSON object read from stdin.
//
//   alternate_cli [options.json] < input.json
int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "usage: " << argv[0] << " [options.json] < input.json" << std::endl;
        return 1;
    }

    try {
        alternating::Options options;
        if (argc == 2) {
            options = alternating::Options::FromFile(argv[1]);
        }
        alternating::logger::Logger::instance().configure(alternating::CommandLineLogConfig(options.log));
        ALT_LOG_INFO("mode=%s fuse=%d max_gaps=%zu", alternating::ModeName(options.mode),
                     options.fuse ? 1 : 0, options.max_gaps);

        nlohmann::json input = nlohmann::json::parse(std::cin);
        std::cout << alternating::Interleave(options, input).dump() << std::endl;
    } catch (const std::exception& e) {
        ALT_LOG_ERROR("alternate_cli failed: %s", e.what());
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
