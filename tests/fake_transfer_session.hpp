/**
 * @file fake_transfer_session.hpp
 * @brief Scripted TransferSession used by the uploader and writer tests.
 */

#ifndef FAKE_TRANSFER_SESSION_HPP
#define FAKE_TRANSFER_SESSION_HPP

#include "transfer_session.hpp"
#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Observations shared between a fake session and the test that created it.
 *
 * Outlives the session so that tests can inspect it after the writer destroyed the session.
 */
struct FakeSessionLog {
    std::vector<std::pair<std::string, std::string>> puts; // (local, remote) per call
    int closeCalls = 0;
};

class FakeTransferSession : public TransferSession {
public:
    explicit FakeTransferSession(std::shared_ptr<FakeSessionLog> log = std::make_shared<FakeSessionLog>())
        : log_(std::move(log)) {}

    /**
     * @brief Queues the outcome of the next put() call. Unscripted calls succeed.
     */
    void failNext(TransferFault fault, std::string detail = "scripted failure") {
        script_.push_back(TransferFailure{fault, std::move(detail)});
    }

    /**
     * @brief Makes the put() for @p localPath fail with @p fault every time.
     */
    void failFor(std::string localPath, TransferFault fault) {
        failingPath_ = std::move(localPath);
        failingFault_ = fault;
    }

    std::expected<void, TransferFailure> put(const std::string& localFile, const std::string& remotePath) override {
        log_->puts.emplace_back(localFile, remotePath);
        if (!failingPath_.empty() && localFile == failingPath_) {
            return std::unexpected(TransferFailure{failingFault_, "forced failure"});
        }
        if (!script_.empty()) {
            TransferFailure failure = script_.front();
            script_.pop_front();
            return std::unexpected(failure);
        }
        return {};
    }

    void close() override {
        ++log_->closeCalls;
        open_ = false;
    }

    bool isOpen() const override { return open_; }

    const FakeSessionLog& log() const { return *log_; }

private:
    std::shared_ptr<FakeSessionLog> log_;
    std::deque<TransferFailure> script_;
    std::string failingPath_;
    TransferFault failingFault_ = TransferFault::Other;
    bool open_ = true;
};

#endif // FAKE_TRANSFER_SESSION_HPP
