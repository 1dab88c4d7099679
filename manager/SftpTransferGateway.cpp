// SFTP gateway: admission checks, one worker per request, HTTP-style status
// codes for the status state machine.
#include "SftpTransferGateway.hpp"
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QStorageInfo>
#include <QUuid>
#include <chrono>
Q_LOGGING_CATEGORY(bgGateway, "bgtransfer.gateway")

namespace bgtransfer {

static int statusCodeForKind(SftpErrorKind kind) {
    switch (kind) {
    case SftpErrorKind::NotFound:
        return 404;
    case SftpErrorKind::PermissionDenied:
        return 403;
    case SftpErrorKind::LocalIo:
        return 400;
    case SftpErrorKind::Connection:
        return 503;
    case SftpErrorKind::Canceled:
    case SftpErrorKind::None:
        return 0;
    case SftpErrorKind::Remote:
        return 500;
    }
    return 500;
}

static TransferError errorForKind(SftpErrorKind kind) {
    switch (kind) {
    case SftpErrorKind::None:
        return TransferError::None;
    case SftpErrorKind::Canceled:
        return TransferError::Canceled;
    case SftpErrorKind::Connection:
        return TransferError::Network;
    case SftpErrorKind::LocalIo:
        return TransferError::LocalStorage;
    case SftpErrorKind::NotFound:
    case SftpErrorKind::PermissionDenied:
    case SftpErrorKind::Remote:
        return TransferError::Remote;
    }
    return TransferError::Remote;
}

SftpTransferGateway::SftpTransferGateway(SftpClient &prototype,
                                         TransferStore &store,
                                         const TransferSettings &settings,
                                         SessionOptions base)
    : prototype_(prototype), store_(store), settings_(settings),
      base_(std::move(base)) {}

SftpTransferGateway::~SftpTransferGateway() {
    closing_ = true;
    std::vector<EntryPtr> all;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto &kv : requests_)
            all.push_back(kv.second);
        for (auto &e : retired_)
            all.push_back(e);
        for (auto &e : all) {
            e->canceled = true;
            if (e->client)
                e->client->interrupt();
        }
    }
    {
        std::lock_guard<std::recursive_mutex> dl(dispatchMutex_);
        for (auto &e : all)
            e->observer = TransferObserver{};
    }
    for (auto &e : all) {
        if (e->worker.joinable())
            e->worker.join();
    }
    qCInfo(bgGateway) << "gateway stopped" << "requests=" << all.size();
}

void SftpTransferGateway::setMaxRequests(int n) {
    std::lock_guard<std::mutex> lk(mtx_);
    maxRequests_ = n < 1 ? 1 : n;
}

int SftpTransferGateway::maxRequests() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return maxRequests_;
}

std::vector<TransferRequest> SftpTransferGateway::requests() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<TransferRequest> out;
    out.reserve(requests_.size());
    for (const auto &kv : requests_)
        out.push_back(kv.second->snapshot);
    return out;
}

std::optional<TransferRequest>
SftpTransferGateway::find(const QString &requestId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = requests_.find(requestId);
    if (it == requests_.end())
        return std::nullopt;
    return it->second->snapshot;
}

bool SftpTransferGateway::sessionOptionsFor(const QUrl &url,
                                            SessionOptions &opt,
                                            QString *why) const {
    if (url.scheme().compare(QStringLiteral("sftp"), Qt::CaseInsensitive) !=
        0) {
        if (why)
            *why = QStringLiteral("Unsupported scheme: %1").arg(url.scheme());
        return false;
    }
    if (url.host().isEmpty()) {
        if (why)
            *why = QStringLiteral("URL has no host");
        return false;
    }
    if (url.path().isEmpty() || url.path() == QStringLiteral("/")) {
        if (why)
            *why = QStringLiteral("URL has no remote file path");
        return false;
    }
    opt = base_;
    opt.host = url.host().toStdString();
    opt.port = static_cast<std::uint16_t>(url.port(base_.port));
    if (!url.userName().isEmpty())
        opt.username = url.userName().toStdString();
    if (!url.password().isEmpty())
        opt.password = url.password().toStdString();
    settings_.applyTo(opt);
    if (opt.username.empty()) {
        if (why)
            *why = QStringLiteral("No user name for %1").arg(url.host());
        return false;
    }
    return true;
}

void SftpTransferGateway::reapFinishedLocked(std::vector<EntryPtr> &toJoin) {
    for (auto it = retired_.begin(); it != retired_.end();) {
        if ((*it)->finished.load()) {
            toJoin.push_back(*it);
            it = retired_.erase(it);
        } else {
            ++it;
        }
    }
}

bool SftpTransferGateway::submit(const SubmitRequest &req,
                                 TransferObserver observer,
                                 TransferRequest *out, SubmitError *code,
                                 QString *why) {
    auto reject = [&](SubmitError c, const QString &msg) {
        if (code)
            *code = c;
        if (why)
            *why = msg;
        qCWarning(bgGateway) << "submit rejected"
                             << "tag=" << req.tag
                             << "error=" << submitErrorName(c)
                             << "reason=" << msg;
        return false;
    };
    if (closing_.load() || !enabled_.load())
        return reject(SubmitError::SystemDisabled,
                      QStringLiteral("Background transfers are disabled"));

    SessionOptions parsed;
    QString urlWhy;
    if (!sessionOptionsFor(req.remoteUrl, parsed, &urlWhy))
        return reject(SubmitError::TransportError, urlWhy);

    if (settings_.minFreeBytes > 0) {
        const QStorageInfo storage(store_.root());
        if (storage.isValid() &&
            storage.bytesAvailable() < settings_.minFreeBytes)
            return reject(
                SubmitError::InsufficientStorage,
                QStringLiteral("Only %1 bytes free in %2")
                    .arg(storage.bytesAvailable())
                    .arg(store_.root()));
    }

    std::vector<EntryPtr> toJoin;
    EntryPtr e = std::make_shared<Entry>();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        reapFinishedLocked(toJoin);
        if (static_cast<int>(requests_.size()) >= maxRequests_)
            return reject(SubmitError::CapacityExceeded,
                          QStringLiteral("Request limit of %1 reached")
                              .arg(maxRequests_));
        for (const auto &kv : requests_) {
            const TransferRequest &other = kv.second->snapshot;
            if (other.tag == req.tag || other.location == req.location)
                return reject(SubmitError::DuplicateRequest,
                              QStringLiteral("Request already active for %1")
                                  .arg(req.location));
        }

        TransferRequest &s = e->snapshot;
        s.requestId = QUuid::createUuid().toString(QUuid::WithoutBraces);
        s.tag = req.tag;
        s.method = req.method.toUpper();
        s.remoteUrl = req.remoteUrl;
        s.location = req.location;
        s.preferences = req.preferences;
        s.status = ExternalStatus::Queued;
        e->observer = std::move(observer);
        requests_[s.requestId] = e;
        if (out)
            *out = s;
        if (code)
            *code = SubmitError::None;
        qCInfo(bgGateway) << "request accepted"
                          << "requestId=" << s.requestId << "tag=" << s.tag
                          << "url=" << redactedUrl(s.remoteUrl)
                          << "active=" << requests_.size();
        e->worker = std::thread([this, e]() { run(e); });
    }
    for (auto &j : toJoin) {
        if (j->worker.joinable())
            j->worker.join();
    }
    return true;
}

SftpTransferGateway::EntryPtr
SftpTransferGateway::lookupLocked(const QString &requestId) const {
    auto it = requests_.find(requestId);
    if (it != requests_.end())
        return it->second;
    for (const auto &e : retired_) {
        if (e->snapshot.requestId == requestId)
            return e;
    }
    return nullptr;
}

bool SftpTransferGateway::remove(const QString &requestId, QString *why) {
    std::vector<EntryPtr> toJoin;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = requests_.find(requestId);
        if (it == requests_.end()) {
            if (why)
                *why = QStringLiteral("Request has previously been removed");
            return false;
        }
        EntryPtr e = it->second;
        requests_.erase(it);
        reapFinishedLocked(toJoin);
        if (e->snapshot.status != ExternalStatus::Completed) {
            e->canceled = true;
            if (e->client)
                e->client->interrupt();
        }
        retired_.push_back(e);
        qCInfo(bgGateway) << "request removed"
                          << "requestId=" << requestId
                          << "status=" << externalStatusName(e->snapshot.status);
    }
    for (auto &j : toJoin) {
        if (j->worker.joinable())
            j->worker.join();
    }
    return true;
}

void SftpTransferGateway::subscribe(const QString &requestId,
                                    TransferObserver observer) {
    EntryPtr e;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        e = lookupLocked(requestId);
    }
    if (!e)
        return;
    std::lock_guard<std::recursive_mutex> dl(dispatchMutex_);
    e->observer = std::move(observer);
}

void SftpTransferGateway::unsubscribe(const QString &requestId) {
    EntryPtr e;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        e = lookupLocked(requestId);
    }
    if (!e)
        return;
    // Waits for a callback in progress.
    std::lock_guard<std::recursive_mutex> dl(dispatchMutex_);
    e->observer = TransferObserver{};
}

bool SftpTransferGateway::waitForIdle(int timeoutMs) {
    std::unique_lock<std::mutex> lk(mtx_);
    auto idle = [this]() {
        for (const auto &kv : requests_) {
            if (!kv.second->finished.load())
                return false;
        }
        for (const auto &e : retired_) {
            if (!e->finished.load())
                return false;
        }
        return true;
    };
    return idleCv_.wait_for(lk, std::chrono::milliseconds(timeoutMs), idle);
}

void SftpTransferGateway::publish(const EntryPtr &e, bool statusChange) {
    if (closing_.load())
        return;
    TransferRequest snap;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        snap = e->snapshot;
    }
    std::lock_guard<std::recursive_mutex> dl(dispatchMutex_);
    const auto &cb =
        statusChange ? e->observer.onStatusChanged : e->observer.onProgress;
    if (cb)
        cb(snap);
}

void SftpTransferGateway::setStatus(const EntryPtr &e, ExternalStatus st,
                                    int code) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        e->snapshot.status = st;
        e->snapshot.statusCode = code;
    }
    publish(e, true);
}

std::unique_ptr<SftpClient>
SftpTransferGateway::connectWithRetry(const EntryPtr &e,
                                      const SessionOptions &opt,
                                      SftpErrorKind &kind, std::string &err) {
    using namespace std::chrono_literals;
    kind = SftpErrorKind::Connection;
    for (int i = 0; i < 3; ++i) {
        if (e->canceled.load()) {
            kind = SftpErrorKind::Canceled;
            err = "Canceled";
            return nullptr;
        }
        std::unique_ptr<SftpClient> conn;
        {
            // One entry point for session creation across workers.
            std::lock_guard<std::mutex> lk(connFactoryMutex_);
            conn = prototype_.newConnectionLike(opt, err);
            if (!conn)
                kind = prototype_.lastErrorKind();
        }
        if (conn)
            return conn;
        qCWarning(bgGateway) << "connect attempt failed"
                             << "requestId=" << e->snapshot.requestId
                             << "attempt=" << (i + 1)
                             << "error=" << QString::fromStdString(err);
        if (i < 2) {
            // Server-side trouble: the request waits for a retry.
            setStatus(e, ExternalStatus::Waiting, 503);
            const auto backoff = std::chrono::milliseconds(500 * (1 << i));
            const auto until = std::chrono::steady_clock::now() + backoff;
            while (std::chrono::steady_clock::now() < until) {
                if (e->canceled.load())
                    break;
                std::this_thread::sleep_for(20ms);
            }
        }
    }
    if (kind == SftpErrorKind::None)
        kind = SftpErrorKind::Connection;
    return nullptr;
}

void SftpTransferGateway::run(const EntryPtr &e) {
    const QUrl url = e->snapshot.remoteUrl;
    const bool download =
        directionForMethod(e->snapshot.method) == TransferDirection::Download;
    const QString localAbs = store_.absolutePath(e->snapshot.location);
    const std::string remotePath =
        url.path(QUrl::FullyDecoded).toStdString();

    setStatus(e, ExternalStatus::Waiting, 0);

    SessionOptions opt;
    QString optWhy;
    if (!sessionOptionsFor(url, opt, &optWhy)) {
        finish(e, false, SftpErrorKind::Remote, false, optWhy.toStdString());
        return;
    }

    std::string err;
    SftpErrorKind kind = SftpErrorKind::None;
    std::shared_ptr<SftpClient> client = connectWithRetry(e, opt, kind, err);
    if (!client) {
        finish(e, false, kind, false, err);
        return;
    }
    {
        std::lock_guard<std::mutex> lk(mtx_);
        e->client = client;
    }
    if (e->canceled.load()) {
        client->disconnect();
        finish(e, false, SftpErrorKind::Canceled, false, "Canceled");
        return;
    }

    setStatus(e, ExternalStatus::Transferring, 0);

    auto progress = [this, e](std::size_t done, std::size_t total) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            e->snapshot.bytesTransferred = static_cast<qint64>(done);
            e->snapshot.totalBytes =
                total > 0 ? static_cast<qint64>(total) : -1;
        }
        publish(e, false);
    };
    auto shouldCancel = [e]() { return e->canceled.load(); };

    bool ok = false;
    bool resumed = false;
    if (download) {
        QDir().mkpath(QFileInfo(localAbs).absolutePath());
        // A partial staged file from an earlier attempt is continued.
        const QFileInfo staged(localAbs);
        resumed = staged.isFile() && staged.size() > 0;
        ok = client->get(remotePath, localAbs.toStdString(), err, progress,
                         shouldCancel, resumed);
    } else {
        ok = client->put(localAbs.toStdString(), remotePath, err, progress,
                         shouldCancel, false);
    }
    kind = ok ? SftpErrorKind::None : client->lastErrorKind();
    client->disconnect();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        e->client.reset();
    }
    finish(e, ok, kind, resumed, err);
}

void SftpTransferGateway::finish(const EntryPtr &e, bool ok,
                                 SftpErrorKind kind, bool resumed,
                                 const std::string &err) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        TransferRequest &s = e->snapshot;
        s.status = ExternalStatus::Completed;
        if (e->canceled.load() && (!ok || kind == SftpErrorKind::Canceled)) {
            // Removal wins over whatever the transport reported.
            s.statusCode = 0;
            s.error = TransferError::Canceled;
            s.errorMessage = QStringLiteral("The request has been canceled");
        } else if (ok) {
            s.statusCode = resumed ? 206 : 200;
            s.error = TransferError::None;
            s.errorMessage.clear();
        } else {
            s.statusCode = statusCodeForKind(kind);
            s.error = errorForKind(kind);
            s.errorMessage = QString::fromStdString(err);
        }
        qCInfo(bgGateway) << "request finished"
                          << "requestId=" << s.requestId
                          << "code=" << s.statusCode
                          << "error=" << transferErrorName(s.error)
                          << "kind=" << sftpErrorKindName(kind);
    }
    publish(e, true);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        e->finished = true;
    }
    idleCv_.notify_all();
}

} // namespace bgtransfer
