// One logical upload or download tracked by the coordinator.
#pragma once
#include "TransferTypes.hpp"
#include <QString>
#include <QUrl>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace bgtransfer {

class TransferStore;

class TransferJob {
public:
    // (previous status, new status, job). Invoked on the thread that changed
    // the status, never with the job lock held.
    using StatusCallback =
        std::function<void(TransferStatus, TransferStatus, TransferJob &)>;

    explicit TransferJob(const QString &method = QStringLiteral("GET"));

    // Assigned by the repository on commit; 0 until then.
    quint64 id() const;
    void setId(quint64 id);
    // Correlation tag handed to the gateway.
    QString tag() const { return QString::number(id()); }

    QString method() const;
    void setMethod(const QString &method);
    TransferDirection direction() const;

    // Absolute URI of the remote resource. Rejected values leave the
    // current one untouched.
    QString remoteUrl() const;
    QUrl remoteUri() const;
    bool setRemoteUrl(const QString &url, QString *why = nullptr);

    // Normalized directory: leading '/', no trailing '/'.
    QString localPath() const;
    bool setLocalPath(const QString &path, QString *why = nullptr);

    QString filename() const;
    bool setFilename(const QString &name, QString *why = nullptr);

    // localPath + "/" + filename
    QString fullLocalPath() const;
    // Staging path used by the gateway: "shared/transfers" + fullLocalPath.
    QString transferLocation() const;

    QString externalRequestId() const;
    void setExternalRequestId(const QString &requestId);

    QString externalReference() const;
    void setExternalReference(const QString &ref);

    TransferStatus status() const;
    // Always notifies subscribers; entering Canceled resets progress.
    void setStatus(TransferStatus st);
    // Applies desired only when the current status is expected.
    bool compareAndSetStatus(TransferStatus expected, TransferStatus desired);

    qint64 totalBytes() const;
    qint64 transferredBytes() const;
    bool isIndeterminate() const;
    double progress() const; // 0..1, meaningful only when determinate

    // total == -1 means unknown.
    void updateProgress(qint64 transferred, qint64 total);
    void resetProgress();

    // Direction specific preparation, run just before submission.
    bool onBeforeAdmit(TransferStore &store, QString *why = nullptr);
    // Direction specific finalization after a successful transfer. Ends in
    // Completed or Failed.
    void onComplete(TransferStore &store);

    quint64 subscribe(StatusCallback cb);
    void unsubscribe(quint64 subscriptionId);

    static bool normalizeLocalPath(const QString &in, QString *out,
                                   QString *why = nullptr);
    static bool isValidFilename(const QString &name, QString *why = nullptr);
    static bool isValidRemoteUrl(const QString &url, QString *why = nullptr);

private:
    mutable std::mutex mtx_;
    quint64 id_ = 0;
    QString method_;
    QString remoteUrl_;
    QString localPath_;
    QString filename_;
    QString externalRequestId_;
    QString externalReference_;
    TransferStatus status_ = TransferStatus::None;
    qint64 totalBytes_ = -1;
    qint64 transferredBytes_ = 0;
    bool indeterminate_ = true;
    double progress_ = 0.0;

    quint64 nextSubscription_ = 1;
    std::map<quint64, StatusCallback> subscribers_;

    void resetProgressLocked();
    void notify(TransferStatus prev, TransferStatus cur);
    void finish(bool ok, const QString &why);
};

using TransferJobPtr = std::shared_ptr<TransferJob>;

} // namespace bgtransfer
