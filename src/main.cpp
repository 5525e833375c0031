#include "transfer_api.hpp"
#include <iostream>
#include <string>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <path>]" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile = "sftptransfer.json";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }

    auto result = TransferAPI::run(configFile);
    if (!result) {
        std::cerr << "Error: " << result.error() << std::endl;
        return 1;
    }
    return 0;
}
