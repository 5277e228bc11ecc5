#include "input_catalog.hpp"
#include "logger.hpp"
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <format>
#include <fstream>
#include <map>
#include <json/json.h>

namespace fs = std::filesystem;

namespace {

constexpr const char* kManifestExtension = ".manifest";

WriterError catalogError(const std::string& message) {
    return {ErrorKind::InvalidConfiguration, message};
}

/**
 * @brief Lists regular, non-manifest files of a directory sorted by file name.
 *
 * A missing directory yields an empty list.
 */
std::expected<std::vector<fs::path>, WriterError> listArtifacts(const fs::path& dir) {
    std::vector<fs::path> paths;
    try {
        if (!fs::exists(dir)) {
            Logger::debug("Input directory does not exist, skipping: {}", dir.string());
            return paths;
        }
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (!entry.is_regular_file() || entry.path().extension() == kManifestExtension) {
                continue;
            }
            paths.push_back(entry.path());
        }
    } catch (const fs::filesystem_error& e) {
        return std::unexpected(catalogError(std::format("Failed to read input directory {}: {}", dir.string(), e.what())));
    }
    std::ranges::sort(paths, {}, [](const fs::path& p) { return p.filename().string(); });
    return paths;
}

/**
 * @brief Reads "id" and "name" from a file manifest, overriding the values in @p file.
 */
std::expected<void, WriterError> applyManifest(const fs::path& manifestPath, StoredFile& file) {
    std::ifstream in(manifestPath);
    if (!in.is_open()) {
        return std::unexpected(catalogError(std::format("Failed to open manifest: {}", manifestPath.string())));
    }
    Json::Value manifest;
    Json::Reader reader;
    if (!reader.parse(in, manifest) || !manifest.isObject()) {
        return std::unexpected(catalogError(std::format("Failed to parse manifest: {} ({})", manifestPath.string(),
                                                        reader.getFormattedErrorMessages())));
    }

    const Json::Value& id = manifest["id"];
    if (id.isIntegral()) {
        file.id = id.asInt64();
    } else if (id.isString()) {
        const std::string text = id.asString();
        std::int64_t parsed = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if (ec == std::errc() && ptr == text.data() + text.size()) {
            file.id = parsed;
        }
    }
    if (manifest["name"].isString() && !manifest["name"].asString().empty()) {
        file.name = manifest["name"].asString();
    }
    return {};
}

} // namespace

InputCatalog::InputCatalog(std::string dataDir) : dataDir_(std::move(dataDir)) {}

StoredFile InputCatalog::splitStoredName(const std::string& fileName) {
    StoredFile stored;
    stored.name = fileName;

    auto underscore = fileName.find('_');
    if (underscore == std::string::npos || underscore == 0 || underscore + 1 == fileName.size()) {
        return stored;
    }
    std::int64_t id = 0;
    auto [ptr, ec] = std::from_chars(fileName.data(), fileName.data() + underscore, id);
    if (ec != std::errc() || ptr != fileName.data() + underscore) {
        return stored;
    }
    stored.id = id;
    stored.name = fileName.substr(underscore + 1);
    return stored;
}

std::expected<std::vector<UploadTask>, WriterError> InputCatalog::tables() const {
    auto paths = listArtifacts(fs::path(dataDir_) / "in" / "tables");
    if (!paths) {
        return std::unexpected(paths.error());
    }

    std::vector<UploadTask> result;
    for (const auto& path : *paths) {
        result.push_back({path.string(), path.filename().string(), ArtifactKind::Table});
    }
    return result;
}

std::expected<std::vector<UploadTask>, WriterError> InputCatalog::latestFiles() const {
    auto paths = listArtifacts(fs::path(dataDir_) / "in" / "files");
    if (!paths) {
        return std::unexpected(paths.error());
    }

    std::map<std::string, StoredFile> latest;
    for (const auto& path : *paths) {
        StoredFile file = splitStoredName(path.filename().string());
        file.localPath = path.string();

        fs::path manifestPath = path;
        manifestPath += kManifestExtension;
        if (fs::exists(manifestPath)) {
            auto applied = applyManifest(manifestPath, file);
            if (!applied) {
                return std::unexpected(applied.error());
            }
        }

        auto it = latest.find(file.name);
        if (it == latest.end()) {
            std::string key = file.name;
            latest.emplace(std::move(key), std::move(file));
        } else if (file.id > it->second.id) {
            Logger::debug("Skipping older version of {}: {}", file.name, it->second.localPath);
            it->second = std::move(file);
        } else {
            Logger::debug("Skipping older version of {}: {}", file.name, file.localPath);
        }
    }

    std::vector<UploadTask> result;
    for (const auto& [name, file] : latest) {
        result.push_back({file.localPath, name, ArtifactKind::File});
    }
    return result;
}

std::expected<std::vector<UploadTask>, WriterError> InputCatalog::tasks() const {
    auto tableTasks = tables();
    if (!tableTasks) {
        return std::unexpected(tableTasks.error());
    }
    auto fileTasks = latestFiles();
    if (!fileTasks) {
        return std::unexpected(fileTasks.error());
    }

    std::vector<UploadTask> all = std::move(*tableTasks);
    all.insert(all.end(), fileTasks->begin(), fileTasks->end());
    Logger::debug("Found {} table(s) and {} file(s) to upload", all.size() - fileTasks->size(), fileTasks->size());
    return all;
}
