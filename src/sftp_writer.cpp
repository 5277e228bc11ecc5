#include "sftp_writer.hpp"
#include "destination_resolver.hpp"
#include "logger.hpp"

void SessionGuard::release() {
    if (released_) {
        return;
    }
    released_ = true;
    session_.close();
    Logger::debug("Transfer session closed");
}

SftpWriter::SftpWriter(WriterConfig config, RetryingUploader uploader, Clock clock)
    : config_(std::move(config)), uploader_(std::move(uploader)), clock_(std::move(clock)) {}

std::expected<std::string, WriterError> SftpWriter::destinationFor(const UploadTask& task) const {
    return DestinationResolver::resolve(config_.remotePath, task.name, config_.appendDate, config_.appendDateFormat,
                                        clock_());
}

std::expected<void, WriterError> SftpWriter::run(std::unique_ptr<TransferSession> session,
                                                 const std::vector<UploadTask>& tasks) const {
    if (!session) {
        return std::unexpected(WriterError{ErrorKind::Unclassified, "No transfer session to upload with"});
    }
    SessionGuard guard(*session);

    std::size_t uploaded = 0;
    for (const auto& task : tasks) {
        auto destination = destinationFor(task);
        if (!destination) {
            return std::unexpected(destination.error());
        }
        auto result = uploader_.upload(*session, task.localPath, *destination, config_.remotePath);
        if (!result) {
            Logger::error("Upload of {} failed after {} of {} file(s) were uploaded", task.name, uploaded, tasks.size());
            return std::unexpected(result.error());
        }
        ++uploaded;
    }

    Logger::info("Uploaded {} file(s)", uploaded);
    return {};
}
