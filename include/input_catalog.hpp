/**
 * @file input_catalog.hpp
 * @brief Enumerates the artifacts waiting in the data directory.
 *
 * Tables are read from <data>/in/tables and files from <data>/in/files. Manifests
 * ("*.manifest") describe artifacts and are never uploaded themselves.
 */

#ifndef INPUT_CATALOG_HPP
#define INPUT_CATALOG_HPP

#include "errors.hpp"
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

/**
 * @brief Kind of input artifact.
 */
enum class ArtifactKind {
    Table,
    File
};

/**
 * @brief One artifact to upload. Immutable once enumerated.
 */
struct UploadTask {
    std::string localPath; ///< Absolute or data-dir-relative path of the local file.
    std::string name;      ///< Logical name used to build the remote file name.
    ArtifactKind kind;     ///< Table or file.
};

/**
 * @brief Stored file together with the id and name taken from its manifest or file name.
 */
struct StoredFile {
    std::string localPath; ///< Path of the stored file.
    std::string name;      ///< Logical name without the id prefix.
    std::int64_t id = 0;   ///< Platform file id; higher is newer.
};

/**
 * @brief Lists upload tasks from a data directory.
 */
class InputCatalog {
public:
    /**
     * @brief Constructs a catalog rooted at @p dataDir.
     */
    explicit InputCatalog(std::string dataDir);

    /**
     * @brief Returns all tasks: tables sorted by name, then the latest file of each name.
     *
     * @return std::expected<std::vector<UploadTask>, WriterError> Tasks, or
     *         ErrorKind::InvalidConfiguration when a directory or manifest cannot be read.
     */
    std::expected<std::vector<UploadTask>, WriterError> tasks() const;

    /**
     * @brief Returns the table tasks, sorted by name.
     */
    std::expected<std::vector<UploadTask>, WriterError> tables() const;

    /**
     * @brief Returns the file tasks, keeping only the highest id per logical name.
     */
    std::expected<std::vector<UploadTask>, WriterError> latestFiles() const;

    /**
     * @brief Splits a stored file name of the form "<id>_<name>".
     *
     * @return The parsed id and name; a name without a numeric prefix yields id 0 and the
     *         unchanged name.
     */
    static StoredFile splitStoredName(const std::string& fileName);

private:
    std::string dataDir_;
};

#endif // INPUT_CATALOG_HPP
