/**
 * @file writer_api.hpp
 * @brief High-level entry point of the SFTP writer.
 *
 * Ties the stages together: configuration, key parsing, connection, input enumeration and
 * the upload run.
 */

#ifndef WRITER_API_HPP
#define WRITER_API_HPP

#include "errors.hpp"
#include <expected>
#include <string>

/**
 * @brief Version reported at start-up.
 */
inline constexpr const char* kWriterVersion = "1.0.0";

/**
 * @brief API for running the writer.
 */
class WriterAPI {
public:
    /**
     * @brief Picks the data directory.
     *
     * @param cliDataDir Value of --data-dir; used when not empty.
     * @return cliDataDir, else the KBC_DATADIR environment variable, else "./data".
     */
    static std::string resolveDataDir(const std::string& cliDataDir);

    /**
     * @brief Runs one complete upload.
     *
     * Reads <dataDir>/config.json, parses the private key (the password doubles as its
     * passphrase), connects, enumerates inputs and uploads them.
     *
     * @param dataDir Data directory containing config.json and in/.
     * @return std::expected<void, WriterError> Success or the first failure.
     */
    static std::expected<void, WriterError> start(const std::string& dataDir);
};

#endif // WRITER_API_HPP
