#include <cstring>
#include <iostream>
#include <string>
#include <json/json.h>
#include "Log.hpp"
#include "ReplicaConfig.hpp"
#include "ReplicaController.hpp"

namespace {

void writeLine(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";  // Compact output
    std::cout << Json::writeString(writer, value) << std::endl;
}

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <file>]" << std::endl
              << "Reads one JSON request per line from stdin and applies it to an in-memory replica." << std::endl;
}

}

int main(int argc, char** argv) {
    ReplicaConfig config;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            try {
                config = ReplicaConfig::loadFile(argv[++i]);
            } catch (const std::exception& e) {
                std::cerr << e.what() << std::endl;
                return 2;
            }
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }
    setLogLevel(config.logLevel);

    ReplicaController controller(config);
    logInfo("Replica stdio tool started");

    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty()) {
            writeLine(controller.handleLine(line));
        }
    }

    return 0;
}
