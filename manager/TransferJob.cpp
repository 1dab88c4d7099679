#include "TransferJob.hpp"
#include "TransferStore.hpp"
#include <QDir>
#include <QLoggingCategory>
#include <algorithm>
#include <vector>
Q_LOGGING_CATEGORY(bgJob, "bgtransfer.job")

namespace bgtransfer {

static const QString kTransferRoot = QStringLiteral("shared/transfers");

TransferJob::TransferJob(const QString &method) : method_(method.toUpper()) {}

quint64 TransferJob::id() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return id_;
}

void TransferJob::setId(quint64 id) {
    std::lock_guard<std::mutex> lk(mtx_);
    id_ = id;
}

QString TransferJob::method() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return method_;
}

void TransferJob::setMethod(const QString &method) {
    std::lock_guard<std::mutex> lk(mtx_);
    method_ = method.toUpper();
}

TransferDirection TransferJob::direction() const {
    return directionForMethod(method());
}

bool TransferJob::isValidRemoteUrl(const QString &url, QString *why) {
    const QUrl u(url, QUrl::StrictMode);
    if (url.trimmed().isEmpty() || !u.isValid()) {
        if (why)
            *why = QStringLiteral("Invalid URL: %1").arg(url);
        return false;
    }
    if (u.isRelative() || u.scheme().isEmpty()) {
        if (why)
            *why = QStringLiteral("URL must be absolute: %1").arg(url);
        return false;
    }
    return true;
}

QString TransferJob::remoteUrl() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return remoteUrl_;
}

QUrl TransferJob::remoteUri() const {
    return QUrl(remoteUrl(), QUrl::StrictMode);
}

bool TransferJob::setRemoteUrl(const QString &url, QString *why) {
    if (!isValidRemoteUrl(url, why))
        return false;
    std::lock_guard<std::mutex> lk(mtx_);
    remoteUrl_ = url;
    return true;
}

// Accepts "a/b", "/a/b/", "./a//b" and produces "/a/b". The root itself and
// anything that climbs above it are rejected.
bool TransferJob::normalizeLocalPath(const QString &in, QString *out,
                                     QString *why) {
    QString p = in.trimmed();
    auto reject = [&](const QString &msg) {
        if (why)
            *why = msg;
        return false;
    };
    if (p.isEmpty())
        return reject(QStringLiteral("Invalid path: empty"));
    if (p.contains('\\') || p.contains(QStringLiteral("://")))
        return reject(QStringLiteral("Invalid path: %1").arg(in));
    for (const QChar &ch : p) {
        const ushort u = ch.unicode();
        if (u < 0x20u || u == 0x7Fu)
            return reject(
                QStringLiteral("Invalid path: cannot contain control "
                               "characters."));
    }
    while (p.startsWith('/'))
        p.remove(0, 1);
    p = QDir::cleanPath(p);
    while (p.endsWith('/'))
        p.chop(1);
    if (p.isEmpty() || p == QStringLiteral("."))
        return reject(QStringLiteral("Invalid path: root is not allowed"));
    if (p == QStringLiteral("..") || p.startsWith(QStringLiteral("../")))
        return reject(QStringLiteral("Invalid path: escapes the root: %1")
                          .arg(in));
    if (out)
        *out = QStringLiteral("/") + p;
    return true;
}

QString TransferJob::localPath() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return localPath_;
}

bool TransferJob::setLocalPath(const QString &path, QString *why) {
    QString normalized;
    if (!normalizeLocalPath(path, &normalized, why))
        return false;
    std::lock_guard<std::mutex> lk(mtx_);
    localPath_ = normalized;
    return true;
}

bool TransferJob::isValidFilename(const QString &name, QString *why) {
    if (name.isEmpty()) {
        if (why)
            *why = QStringLiteral("Invalid name: empty.");
        return false;
    }
    if (name == "." || name == "..") {
        if (why)
            *why = QStringLiteral("Invalid name: cannot be '.' or '..'.");
        return false;
    }
    if (name.contains('/') || name.contains('\\')) {
        if (why)
            *why = QStringLiteral(
                "Invalid name: cannot contain separators ('/' or '\\').");
        return false;
    }
    for (const QChar &ch : name) {
        ushort u = ch.unicode();
        if (u < 0x20u || u == 0x7Fu) { // ASCII control characters
            if (why)
                *why = QStringLiteral(
                    "Invalid name: cannot contain control characters.");
            return false;
        }
    }
    return true;
}

QString TransferJob::filename() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return filename_;
}

bool TransferJob::setFilename(const QString &name, QString *why) {
    if (!isValidFilename(name, why))
        return false;
    std::lock_guard<std::mutex> lk(mtx_);
    filename_ = name;
    return true;
}

QString TransferJob::fullLocalPath() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return localPath_ + "/" + filename_;
}

QString TransferJob::transferLocation() const {
    return kTransferRoot + fullLocalPath();
}

QString TransferJob::externalRequestId() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return externalRequestId_;
}

void TransferJob::setExternalRequestId(const QString &requestId) {
    std::lock_guard<std::mutex> lk(mtx_);
    externalRequestId_ = requestId;
}

QString TransferJob::externalReference() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return externalReference_;
}

void TransferJob::setExternalReference(const QString &ref) {
    std::lock_guard<std::mutex> lk(mtx_);
    externalReference_ = ref;
}

TransferStatus TransferJob::status() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return status_;
}

void TransferJob::setStatus(TransferStatus st) {
    TransferStatus prev;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        prev = status_;
        status_ = st;
        if (st == TransferStatus::Canceled)
            resetProgressLocked();
    }
    notify(prev, st);
}

bool TransferJob::compareAndSetStatus(TransferStatus expected,
                                      TransferStatus desired) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (status_ != expected)
            return false;
        status_ = desired;
        if (desired == TransferStatus::Canceled)
            resetProgressLocked();
    }
    notify(expected, desired);
    return true;
}

void TransferJob::notify(TransferStatus prev, TransferStatus cur) {
    std::vector<StatusCallback> cbs;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        cbs.reserve(subscribers_.size());
        for (const auto &kv : subscribers_)
            cbs.push_back(kv.second);
    }
    for (const auto &cb : cbs)
        cb(prev, cur, *this);
}

qint64 TransferJob::totalBytes() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return totalBytes_;
}

qint64 TransferJob::transferredBytes() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return transferredBytes_;
}

bool TransferJob::isIndeterminate() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return indeterminate_;
}

double TransferJob::progress() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return progress_;
}

void TransferJob::updateProgress(qint64 transferred, qint64 total) {
    std::lock_guard<std::mutex> lk(mtx_);
    totalBytes_ = total;
    transferredBytes_ = transferred;
    indeterminate_ = total == -1 && status_ == TransferStatus::Transferring;
    if (total > 0) {
        progress_ = std::clamp(double(transferred) / double(total), 0.0, 1.0);
    } else {
        // No fraction without a known total.
        progress_ = 0.0;
    }
}

void TransferJob::resetProgress() {
    std::lock_guard<std::mutex> lk(mtx_);
    resetProgressLocked();
}

void TransferJob::resetProgressLocked() {
    transferredBytes_ = 0;
    indeterminate_ = true;
    progress_ = 0.0;
}

bool TransferJob::onBeforeAdmit(TransferStore &store, QString *why) {
    const QString staged = transferLocation();
    switch (direction()) {
    case TransferDirection::Download:
        return store.ensureDirectory(kTransferRoot + localPath(), why);
    case TransferDirection::Upload:
        if (!store.exists(fullLocalPath())) {
            if (why)
                *why = QStringLiteral("Upload source not found: %1")
                           .arg(fullLocalPath());
            return false;
        }
        if (!store.ensureDirectory(kTransferRoot + localPath(), why))
            return false;
        return store.copyFile(fullLocalPath(), staged, why);
    }
    return false;
}

void TransferJob::onComplete(TransferStore &store) {
    QString why;
    bool ok = false;
    switch (direction()) {
    case TransferDirection::Download: {
        const QString staged = transferLocation();
        const qint64 stagedSize = store.fileSize(staged);
        ok = store.ensureDirectory(localPath(), &why) &&
             store.moveIntoPlace(staged, fullLocalPath(), &why);
        if (ok && totalBytes() < 0 && stagedSize >= 0) {
            std::lock_guard<std::mutex> lk(mtx_);
            totalBytes_ = stagedSize;
        }
        break;
    }
    case TransferDirection::Upload:
        ok = store.removeFile(transferLocation(), &why);
        break;
    }
    finish(ok, why);
}

void TransferJob::finish(bool ok, const QString &why) {
    if (!ok) {
        qCWarning(bgJob) << "completion failed"
                         << "id=" << id() << "reason=" << why;
        setStatus(TransferStatus::Failed);
        return;
    }
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (totalBytes_ >= 0)
            transferredBytes_ = totalBytes_;
        indeterminate_ = false;
        progress_ = 1.0;
    }
    setStatus(TransferStatus::Completed);
}

quint64 TransferJob::subscribe(StatusCallback cb) {
    std::lock_guard<std::mutex> lk(mtx_);
    const quint64 sid = nextSubscription_++;
    subscribers_.emplace(sid, std::move(cb));
    return sid;
}

void TransferJob::unsubscribe(quint64 subscriptionId) {
    std::lock_guard<std::mutex> lk(mtx_);
    subscribers_.erase(subscriptionId);
}

} // namespace bgtransfer
