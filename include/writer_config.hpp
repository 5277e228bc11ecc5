/**
 * @file writer_config.hpp
 * @brief Configuration of the SFTP writer.
 *
 * The configuration is read from <data dir>/config.json. Writer settings live under
 * "parameters"; the platform may add "image_parameters" that override the host and port.
 *
 * Example:
 * @code
 * {
 *   "parameters": {
 *     "user": "uploader",
 *     "#pass": "secret",
 *     "hostname": "sftp.example.com",
 *     "port": 22,
 *     "path": "/upload",
 *     "append_date": true,
 *     "append_date_format": "YYYYMMDD"
 *   }
 * }
 * @endcode
 */

#ifndef WRITER_CONFIG_HPP
#define WRITER_CONFIG_HPP

#include "connection_manager.hpp"
#include "errors.hpp"
#include <expected>
#include <string>
#include <json/json.h>

/**
 * @brief Validated writer settings.
 */
struct WriterConfig {
    std::string user;               ///< SFTP login name ("user").
    std::string password;           ///< Password or key passphrase ("#pass").
    std::string privateKey;         ///< Private key text ("#private_key").
    std::string host;               ///< Effective host ("hostname", or image "sftp_host").
    int port = 22;                  ///< Effective port ("port", or image "sftp_port").
    std::string remotePath;         ///< Remote destination directory ("path").
    bool appendDate = false;        ///< Stamp uploaded names with the upload time ("append_date").
    std::string appendDateFormat;   ///< Timestamp format ("append_date_format").
    bool debug = false;             ///< Verbose logging ("debug").

    /**
     * @brief Loads and validates a configuration file.
     *
     * @param configFile Path to config.json.
     * @return The configuration, or ErrorKind::InvalidConfiguration.
     */
    static std::expected<WriterConfig, WriterError> load(const std::string& configFile);

    /**
     * @brief Validates an already parsed configuration document.
     *
     * @param root Document with "parameters" and optional "image_parameters".
     * @return The configuration, or ErrorKind::InvalidConfiguration naming what is missing.
     */
    static std::expected<WriterConfig, WriterError> fromJson(const Json::Value& root);

    /**
     * @brief Host, port and user for the connection manager.
     */
    ConnectionParams connectionParams() const;
};

#endif // WRITER_CONFIG_HPP
