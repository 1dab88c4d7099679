#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace bgtransfer {

// In-memory SFTP double. Every connection created through
// newConnectionLike() shares the same remote state, so a test can seed files
// on the prototype and inspect what a gateway worker uploaded.
class MockSftpClient : public SftpClient {
public:
    struct RemoteState {
        std::mutex mtx;
        std::condition_variable cv;
        std::map<std::string, std::string> files; // path -> contents
        std::set<std::string> dirs{"/"};
        std::map<std::string, SftpErrorKind> failures; // injected per path
        int failConnects = 0;    // next N connects fail with Connection
        int connectAttempts = 0; // total connect() calls
        bool holdTransfers = false;
        int heldTransfers = 0; // transfers currently parked by the hold
        std::size_t chunkSize = 8;
    };

    MockSftpClient();
    explicit MockSftpClient(std::shared_ptr<RemoteState> state);

    bool connect(const SessionOptions &opt, std::string &err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }
    void interrupt() override;

    bool get(const std::string &remote, const std::string &local,
             std::string &err, ProgressCB progress = {},
             CancelCB shouldCancel = {}, bool resume = false) override;

    bool put(const std::string &local, const std::string &remote,
             std::string &err, ProgressCB progress = {},
             CancelCB shouldCancel = {}, bool resume = false) override;

    bool exists(const std::string &remote_path, bool &isDir,
                std::string &err) override;

    bool mkdir(const std::string &remote_dir, std::string &err,
               unsigned int mode = 0755) override;

    SftpErrorKind lastErrorKind() const override { return lastKind_; }

    std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions &opt,
                                                  std::string &err) override;

    // Test controls (thread-safe)
    void setRemoteFile(const std::string &path, const std::string &contents);
    std::optional<std::string> remoteFile(const std::string &path) const;
    void failPath(const std::string &path, SftpErrorKind kind);
    void failNextConnects(int n);
    int connectAttempts() const;
    void setChunkSize(std::size_t n);
    // While held, transfers park after opening their files until released,
    // canceled or interrupted.
    void setHoldTransfers(bool hold);
    // Waits until n transfers are parked; false on timeout.
    bool waitForHeldTransfers(int n, int timeoutMs) const;

    const std::shared_ptr<RemoteState> &state() const { return state_; }

private:
    bool connected_ = false;
    SessionOptions lastOpt_{};
    std::atomic<bool> interrupted_{false};
    SftpErrorKind lastKind_ = SftpErrorKind::None;
    std::shared_ptr<RemoteState> state_;

    bool fail(SftpErrorKind kind, const std::string &msg, std::string &err);
    // Blocks while transfers are held; false when the wait was abandoned.
    bool parkIfHeld(const CancelCB &shouldCancel);
    bool stopRequested(const CancelCB &shouldCancel) const;
};

} // namespace bgtransfer
