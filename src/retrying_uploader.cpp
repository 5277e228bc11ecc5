#include "retrying_uploader.hpp"
#include "logger.hpp"
#include <format>

RetryingUploader::RetryingUploader(RetryPolicy policy, Sleeper sleeper)
    : policy_(policy), sleeper_(std::move(sleeper)) {}

bool RetryingUploader::isRetryable(TransferFault fault) noexcept {
    switch (fault) {
    case TransferFault::ConnectionLost:
    case TransferFault::Io:
    case TransferFault::NotFound:
        return true;
    case TransferFault::PermissionDenied:
    case TransferFault::Other:
        break;
    }
    return false;
}

WriterError RetryingUploader::classify(const TransferFailure& failure, const std::string& remoteBasePath) {
    switch (failure.fault) {
    case TransferFault::NotFound:
        return {ErrorKind::RemotePathNotFound,
                std::format("Destination path: '{}' in SFTP Server not found, recheck the remote destination path",
                            remoteBasePath)};
    case TransferFault::PermissionDenied:
        return {ErrorKind::RemotePermissionDenied,
                std::format("Permission Error: you do not have permissions to write to '{}', "
                            "choose a different directory on the SFTP server",
                            remoteBasePath)};
    case TransferFault::ConnectionLost:
    case TransferFault::Io:
    case TransferFault::Other:
        break;
    }
    return {ErrorKind::Unclassified, std::format("Upload failed ({}): {}", transferFaultName(failure.fault), failure.detail)};
}

std::expected<void, WriterError> RetryingUploader::upload(TransferSession& session,
                                                          const std::string& localPath,
                                                          const std::string& destination,
                                                          const std::string& remoteBasePath) const {
    Logger::info("File Source: {}", localPath);
    Logger::info("File Destination: {}", destination);

    auto result = retryWithBackoff(
        policy_,
        [&]() { return session.put(localPath, destination); },
        [](const TransferFailure& failure) { return isRetryable(failure.fault); },
        [&](int attempt, const TransferFailure& failure, std::chrono::milliseconds delay) {
            Logger::warning("Upload attempt {}/{} of {} failed ({}): {}. Retrying in {} ms.", attempt,
                            policy_.maxAttempts, localPath, transferFaultName(failure.fault), failure.detail,
                            delay.count());
        },
        sleeper_);

    if (!result) {
        Logger::debug("Giving up on {}: {}", localPath, result.error().detail);
        return std::unexpected(classify(result.error(), remoteBasePath));
    }
    return {};
}
