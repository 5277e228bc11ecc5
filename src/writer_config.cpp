#include "writer_config.hpp"
#include "destination_resolver.hpp"
#include <charconv>
#include <chrono>
#include <format>
#include <fstream>
#include <vector>

namespace {

constexpr const char* kUser = "user";
constexpr const char* kPassword = "#pass";
constexpr const char* kHostname = "hostname";
constexpr const char* kPort = "port";
constexpr const char* kRemotePath = "path";
constexpr const char* kAppendDate = "append_date";
constexpr const char* kAppendDateFormat = "append_date_format";
constexpr const char* kPrivateKey = "#private_key";
constexpr const char* kDebug = "debug";
constexpr const char* kImageHostname = "sftp_host";
constexpr const char* kImagePort = "sftp_port";

WriterError configError(const std::string& message) {
    return {ErrorKind::InvalidConfiguration, message};
}

bool hasValue(const Json::Value& object, const char* key) {
    if (!object.isMember(key) || object[key].isNull()) {
        return false;
    }
    const Json::Value& value = object[key];
    if (value.isString()) {
        return !value.asString().empty();
    }
    return true;
}

std::string joined(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ", ";
        }
        out += item;
    }
    return out;
}

std::expected<int, WriterError> parsePort(const Json::Value& value, const char* key) {
    int port = 0;
    if (value.isIntegral()) {
        port = value.asInt();
    } else if (value.isString()) {
        const std::string text = value.asString();
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
        if (ec != std::errc() || ptr != text.data() + text.size()) {
            return std::unexpected(configError(std::format("Parameter '{}' is not a number: {}", key, text)));
        }
    } else {
        return std::unexpected(configError(std::format("Parameter '{}' must be a number", key)));
    }
    if (port < 1 || port > 65535) {
        return std::unexpected(configError(std::format("Parameter '{}' is out of range: {}", key, port)));
    }
    return port;
}

bool asFlag(const Json::Value& value) {
    if (value.isBool()) {
        return value.asBool();
    }
    if (value.isIntegral()) {
        return value.asInt() != 0;
    }
    return false;
}

} // namespace

std::expected<WriterConfig, WriterError> WriterConfig::load(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        return std::unexpected(configError(std::format("Failed to open config file: {}", configFile)));
    }

    Json::Value root;
    Json::Reader reader;
    if (!reader.parse(file, root)) {
        return std::unexpected(configError(
            std::format("Failed to parse config file: {} ({})", configFile, reader.getFormattedErrorMessages())));
    }
    return fromJson(root);
}

std::expected<WriterConfig, WriterError> WriterConfig::fromJson(const Json::Value& root) {
    if (!root.isObject()) {
        return std::unexpected(configError("Configuration must be a JSON object"));
    }
    const Json::Value& params = root["parameters"];
    const Json::Value& image = root["image_parameters"];
    if (!params.isObject()) {
        return std::unexpected(configError("Configuration has no 'parameters' object"));
    }

    std::vector<std::string> missing;
    for (const char* key : {kUser, kRemotePath}) {
        if (!hasValue(params, key)) {
            missing.emplace_back(key);
        }
    }
    if (!hasValue(params, kPrivateKey) && !hasValue(params, kPassword)) {
        missing.push_back(std::format("[{}, {}]", kPrivateKey, kPassword));
    }

    const bool useImage = image.isObject() && !image.empty();
    const Json::Value& endpoint = useImage ? image : params;
    const char* hostKey = useImage ? kImageHostname : kHostname;
    const char* portKey = useImage ? kImagePort : kPort;
    for (const char* key : {hostKey, portKey}) {
        if (!hasValue(endpoint, key)) {
            missing.emplace_back(key);
        }
    }

    if (!missing.empty()) {
        return std::unexpected(configError(std::format("Missing required parameters: {}", joined(missing))));
    }

    auto port = parsePort(endpoint[portKey], portKey);
    if (!port) {
        return std::unexpected(port.error());
    }

    WriterConfig config;
    config.user = params[kUser].asString();
    config.password = params.get(kPassword, "").asString();
    config.privateKey = params.get(kPrivateKey, "").asString();
    config.host = endpoint[hostKey].asString();
    config.port = *port;
    config.remotePath = params[kRemotePath].asString();
    config.appendDate = asFlag(params[kAppendDate]);
    config.appendDateFormat = params.get(kAppendDateFormat, kDefaultDateFormat).asString();
    if (config.appendDateFormat.empty()) {
        config.appendDateFormat = kDefaultDateFormat;
    }
    if (config.appendDate) {
        auto sample = formatTimestamp(config.appendDateFormat, std::chrono::system_clock::now());
        if (!sample) {
            return std::unexpected(sample.error());
        }
    }
    config.debug = asFlag(params[kDebug]);
    return config;
}

ConnectionParams WriterConfig::connectionParams() const {
    return ConnectionParams{host, port, user};
}
