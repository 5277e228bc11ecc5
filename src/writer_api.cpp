#include "writer_api.hpp"
#include "connection_manager.hpp"
#include "input_catalog.hpp"
#include "key_parser.hpp"
#include "logger.hpp"
#include "sftp_writer.hpp"
#include "writer_config.hpp"
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

std::string WriterAPI::resolveDataDir(const std::string& cliDataDir) {
    if (!cliDataDir.empty()) {
        return cliDataDir;
    }
    if (const char* env = std::getenv("KBC_DATADIR"); env && *env) {
        return env;
    }
    return "./data";
}

std::expected<void, WriterError> WriterAPI::start(const std::string& dataDir) {
    Logger::info("Loading configuration...");
    auto config = WriterConfig::load((fs::path(dataDir) / "config.json").string());
    if (!config) {
        return std::unexpected(config.error());
    }
    if (config->debug) {
        Logger::setDebug(true);
        Logger::info("Running version {}", kWriterVersion);
    }

    KeyParser parser;
    auto key = parser.parse(config->privateKey, config->password);
    if (!key) {
        return std::unexpected(key.error());
    }

    Credential credential{config->password, std::move(*key)};
    ConnectionManager connections;
    auto session = connections.connect(config->connectionParams(), credential);
    if (!session) {
        return std::unexpected(session.error());
    }

    InputCatalog catalog(dataDir);
    auto tasks = catalog.tasks();
    if (!tasks) {
        (*session)->close();
        return std::unexpected(tasks.error());
    }

    SftpWriter writer(*config);
    auto result = writer.run(std::move(*session), *tasks);
    if (result) {
        Logger::info("Done.");
    }
    return result;
}
