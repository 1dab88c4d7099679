// TransferGateway backed by SFTP. Each accepted request runs on its own
// worker thread with an isolated session created from a prototype client.
#pragma once
#include "TransferGateway.hpp"
#include "TransferSettings.hpp"
#include "TransferStore.hpp"
#include "bgtransfer/SftpClient.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace bgtransfer {

class SftpTransferGateway : public TransferGateway {
public:
    // prototype only creates connections (newConnectionLike) and must
    // outlive the gateway. base supplies credentials missing from URLs.
    SftpTransferGateway(SftpClient &prototype, TransferStore &store,
                        const TransferSettings &settings,
                        SessionOptions base = {});
    ~SftpTransferGateway() override;

    std::vector<TransferRequest> requests() const override;
    bool submit(const SubmitRequest &req, TransferObserver observer,
                TransferRequest *out, SubmitError *code = nullptr,
                QString *why = nullptr) override;
    std::optional<TransferRequest> find(const QString &requestId) const override;
    bool remove(const QString &requestId, QString *why = nullptr) override;
    void subscribe(const QString &requestId,
                   TransferObserver observer) override;
    void unsubscribe(const QString &requestId) override;

    // Disabled gateways reject submissions with SystemDisabled.
    void setEnabled(bool on) { enabled_ = on; }
    bool isEnabled() const { return enabled_.load(); }

    void setMaxRequests(int n);
    int maxRequests() const;

    // Waits until no worker is running; false on timeout.
    bool waitForIdle(int timeoutMs);

private:
    struct Entry {
        TransferRequest snapshot;  // guarded by mtx_
        TransferObserver observer; // guarded by dispatchMutex_
        std::shared_ptr<SftpClient> client; // live session, guarded by mtx_
        std::atomic<bool> canceled{false};
        std::atomic<bool> finished{false};
        std::thread worker;
    };
    using EntryPtr = std::shared_ptr<Entry>;

    SftpClient &prototype_;
    TransferStore &store_;
    TransferSettings settings_;
    SessionOptions base_;
    std::atomic<bool> enabled_{true};
    std::atomic<bool> closing_{false};

    mutable std::mutex mtx_;
    std::condition_variable idleCv_;
    std::map<QString, EntryPtr> requests_;
    std::vector<EntryPtr> retired_; // removed, worker possibly still running
    int maxRequests_ = TransferSettings::kSubsystemRequestLimit;

    std::recursive_mutex dispatchMutex_;
    std::mutex connFactoryMutex_;

    void run(const EntryPtr &e);
    std::unique_ptr<SftpClient> connectWithRetry(const EntryPtr &e,
                                                 const SessionOptions &opt,
                                                 SftpErrorKind &kind,
                                                 std::string &err);
    bool sessionOptionsFor(const QUrl &url, SessionOptions &opt,
                           QString *why) const;
    void publish(const EntryPtr &e, bool statusChange);
    void setStatus(const EntryPtr &e, ExternalStatus st, int code);
    void finish(const EntryPtr &e, bool ok, SftpErrorKind kind, bool resumed,
                const std::string &err);
    // Caller holds mtx_.
    void reapFinishedLocked(std::vector<EntryPtr> &toJoin);
    EntryPtr lookupLocked(const QString &requestId) const;
};

} // namespace bgtransfer
