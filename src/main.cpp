#include "errors.hpp"
#include "logger.hpp"
#include "writer_api.hpp"
#include <exception>
#include <print>
#include <string>

int main(int argc, char* argv[]) {
    std::string dataDir;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--data-dir" && i + 1 < argc) {
            dataDir = argv[++i];
        } else if (arg == "--debug") {
            Logger::setDebug(true);
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: {} [--data-dir <path>] [--debug]", argv[0]);
            return 0;
        } else {
            std::println(stderr, "Usage: {} [--data-dir <path>] [--debug]", argv[0]);
            return 1;
        }
    }

    try {
        auto result = WriterAPI::start(WriterAPI::resolveDataDir(dataDir));
        if (!result) {
            Logger::error("{}: {}", errorKindName(result.error().kind), result.error().message);
            return exitCodeFor(result.error().kind);
        }
    } catch (const std::exception& e) {
        Logger::error("Unexpected failure: {}", e.what());
        return exitCodeFor(ErrorKind::Unclassified);
    }

    return 0;
}
