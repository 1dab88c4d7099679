// Queue coordinator: admission under one lock, slot accounting by external
// request id, report routing through the status state machine.
#include "TransferCoordinator.hpp"
#include "StatusStateMachine.hpp"
#include <QLoggingCategory>
#include <algorithm>
#include <optional>
Q_LOGGING_CATEGORY(bgCoord, "bgtransfer.coordinator")

namespace bgtransfer {

TransferCoordinator::TransferCoordinator(TransferGateway &gateway,
                                         TransferRepository &repository,
                                         TransferStore &store,
                                         const TransferSettings &settings,
                                         QObject *parent)
    : QObject(parent), gateway_(gateway), repository_(repository),
      store_(store), settings_(settings) {
    settings_.setMaxActiveRequests(settings.maxActiveRequests);
    try {
        reconcile();
    } catch (const UnhandledSuccessStatus &) {
        // The destructor will not run; observers must not outlive us.
        detachObservers();
        waitForCompletions();
        throw;
    }
}

TransferCoordinator::~TransferCoordinator() {
    detachObservers();
    waitForCompletions();
}

void TransferCoordinator::detachObservers() {
    std::vector<QString> ids;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        shuttingDown_ = true;
        ids.assign(observed_.begin(), observed_.end());
        observed_.clear();
    }
    for (const QString &id : ids)
        gateway_.unsubscribe(id);
}

void TransferCoordinator::reconcile() {
    const std::vector<TransferRequest> existing = gateway_.requests();
    {
        // Whatever the gateway still holds occupies a slot until removed.
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto &req : existing)
            admitted_.insert(req.requestId);
    }
    qCInfo(bgCoord) << "startup reconciliation"
                    << "gatewayRequests=" << existing.size();

    std::unordered_set<QString> trackedTags;
    std::vector<TransferJobPtr> dangling;
    for (const auto &req : existing) {
        TransferJobPtr job = repository_.findByCorrelationTag(req.tag);
        if (!job) {
            qCWarning(bgCoord) << "orphan request at startup"
                               << "requestId=" << req.requestId
                               << "tag=" << req.tag;
            removeExternalRequest(req.requestId);
            continue;
        }
        job->setExternalRequestId(req.requestId);
        {
            std::lock_guard<std::mutex> lk(mtx_);
            observed_.insert(req.requestId);
        }
        gateway_.subscribe(req.requestId, observerFor(job));
        // Reports sent between the listing and subscribe() reached nobody;
        // reconcile against the current state, not the listing.
        const std::optional<TransferRequest> current =
            gateway_.find(req.requestId);
        if (!current) {
            qCInfo(bgCoord) << "request vanished during reconciliation"
                            << "id=" << job->id()
                            << "requestId=" << req.requestId;
            removeExternalRequest(req.requestId);
            dangling.push_back(job);
            continue;
        }
        trackedTags.insert(req.tag);
        processTransfer(*current);
    }

    // Admitted earlier but unknown to the gateway now: start over, first.
    for (const auto &job : repository_.listAdmitted()) {
        if (trackedTags.count(job->tag()) == 0 &&
            std::find(dangling.begin(), dangling.end(), job) == dangling.end())
            dangling.push_back(job);
    }
    for (auto it = dangling.rbegin(); it != dangling.rend(); ++it) {
        qCInfo(bgCoord) << "requeue dangling job"
                        << "id=" << (*it)->id()
                        << "requestId=" << (*it)->externalRequestId();
        (*it)->setExternalRequestId(QString());
        pushFront(*it);
    }

    int loaded = 0;
    for (const auto &job : repository_.listNonTerminalPending()) {
        if (trackedTags.count(job->tag()) != 0)
            continue;
        std::lock_guard<std::mutex> lk(mtx_);
        if (std::find(queue_.begin(), queue_.end(), job) != queue_.end())
            continue;
        queue_.push_back(job);
        ++loaded;
    }
    qCInfo(bgCoord) << "startup queue loaded"
                    << "pending=" << loaded << "dangling=" << dangling.size();
    runAdmissionLoop();
}

bool TransferCoordinator::isAdmitted(const QString &requestId) const {
    if (requestId.isEmpty())
        return false;
    std::lock_guard<std::mutex> lk(mtx_);
    return admitted_.count(requestId) != 0;
}

bool TransferCoordinator::isScheduled(const TransferJobPtr &job) const {
    const QString requestId = job->externalRequestId();
    std::lock_guard<std::mutex> lk(mtx_);
    if (!requestId.isEmpty() && admitted_.count(requestId) != 0)
        return true;
    return std::find(queue_.begin(), queue_.end(), job) != queue_.end();
}

void TransferCoordinator::pushFront(const TransferJobPtr &job) {
    job->setStatus(TransferStatus::Queued);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        queue_.push_front(job);
    }
    emit queueChanged();
}

void TransferCoordinator::enqueue(const TransferJobPtr &job) {
    if (!job)
        return;
    // Status alone is not enough: WaitingForWiFi reports show as None.
    if (isTransient(job->status()) || isScheduled(job)) {
        qCWarning(bgCoord) << "enqueue ignored, already scheduled"
                           << "id=" << job->id()
                           << "status=" << statusName(job->status());
        return;
    }
    job->resetProgress();
    job->setExternalRequestId(QString());
    job->setStatus(TransferStatus::Queued);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        queue_.push_back(job);
    }
    emit queueChanged();
    runAdmissionLoop();
}

void TransferCoordinator::enqueueFront(const TransferJobPtr &job) {
    if (!job)
        return;
    if (isTransient(job->status()) || isScheduled(job)) {
        qCWarning(bgCoord) << "enqueueFront ignored, already scheduled"
                           << "id=" << job->id()
                           << "status=" << statusName(job->status());
        return;
    }
    job->setExternalRequestId(QString());
    pushFront(job);
    runAdmissionLoop();
}

void TransferCoordinator::enqueueBatch(const std::vector<TransferJobPtr> &jobs) {
    for (const auto &job : jobs) {
        if (!job)
            continue;
        job->resetProgress();
        enqueue(job);
    }
}

void TransferCoordinator::runAdmissionLoop() {
    std::vector<TransferJobPtr> failed;
    std::vector<TransferJobPtr> accepted;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (shuttingDown_)
            return;
        while (static_cast<int>(admitted_.size()) <
                   settings_.maxActiveRequests &&
               !queue_.empty()) {
            TransferJobPtr job = queue_.front();
            queue_.pop_front();
            changed = true;
            if (job->status() != TransferStatus::Queued) {
                qCInfo(bgCoord) << "skip job no longer queued"
                                << "id=" << job->id()
                                << "status=" << statusName(job->status());
                continue;
            }
            QString why;
            if (admit(job, &why)) {
                accepted.push_back(job);
            } else {
                qCWarning(bgCoord) << "admission failed"
                                   << "id=" << job->id() << "reason=" << why;
                failed.push_back(job);
            }
        }
    }
    // Outside the lock: status subscribers may call back into us. Neither
    // transition overrides a status set concurrently (cancel, first report).
    for (const auto &job : accepted)
        job->compareAndSetStatus(TransferStatus::Queued,
                                 TransferStatus::Waiting);
    for (const auto &job : failed)
        job->compareAndSetStatus(TransferStatus::Queued,
                                 TransferStatus::Failed);
    if (changed)
        emit queueChanged();
}

bool TransferCoordinator::admit(const TransferJobPtr &job, QString *why) {
    if (job->id() == 0) {
        if (why)
            *why = QStringLiteral("Job has not been persisted");
        return false;
    }
    if (!TransferJob::isValidRemoteUrl(job->remoteUrl(), why))
        return false;
    if (!TransferJob::normalizeLocalPath(job->localPath(), nullptr, why) ||
        !TransferJob::isValidFilename(job->filename(), why))
        return false;
    if (!job->onBeforeAdmit(store_, why))
        return false;

    SubmitRequest req;
    req.tag = job->tag();
    req.method = job->method();
    req.remoteUrl = job->remoteUri();
    req.location = job->transferLocation();
    req.preferences = settings_.preferences;

    TransferRequest accepted;
    SubmitError code = SubmitError::None;
    QString submitWhy;
    if (!gateway_.submit(req, observerFor(job), &accepted, &code,
                         &submitWhy)) {
        if (why)
            *why = QStringLiteral("%1: %2")
                       .arg(QString::fromLatin1(submitErrorName(code)),
                            submitWhy);
        return false;
    }
    job->setExternalRequestId(accepted.requestId);
    admitted_.insert(accepted.requestId);
    observed_.insert(accepted.requestId);
    qCInfo(bgCoord) << "admitted"
                    << "id=" << job->id()
                    << "requestId=" << accepted.requestId
                    << "method=" << req.method
                    << "url=" << redactedUrl(req.remoteUrl)
                    << "activeSlots=" << admitted_.size();
    return true;
}

void TransferCoordinator::removeExternalRequest(const QString &requestId) {
    if (requestId.isEmpty())
        return;
    {
        // The first caller removes the request and frees its slot.
        std::lock_guard<std::mutex> lk(mtx_);
        if (!removed_.insert(requestId).second)
            return;
    }
    if (gateway_.find(requestId).has_value()) {
        QString why;
        if (!gateway_.remove(requestId, &why))
            qCInfo(bgCoord) << "request already removed"
                            << "requestId=" << requestId << "reason=" << why;
    }
    // Gone from the gateway either way, so the slot is free again.
    bool released = false;
    int active = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        released = admitted_.erase(requestId) > 0;
        active = static_cast<int>(admitted_.size());
    }
    if (released) {
        qCInfo(bgCoord) << "slot released"
                        << "requestId=" << requestId
                        << "activeSlots=" << active;
        emit queueChanged();
    }
}

void TransferCoordinator::processTransfer(const TransferRequest &req) {
    TransferJobPtr job = repository_.findByCorrelationTag(req.tag);
    if (!job) {
        qCWarning(bgCoord) << "orphan report"
                           << "requestId=" << req.requestId
                           << "tag=" << req.tag
                           << "status=" << externalStatusName(req.status);
        removeExternalRequest(req.requestId);
        runAdmissionLoop();
        return;
    }

    const QString current = job->externalRequestId();
    if (!current.isEmpty() && current != req.requestId) {
        qCInfo(bgCoord) << "stale report ignored"
                        << "id=" << job->id()
                        << "requestId=" << req.requestId
                        << "current=" << current;
        if (req.status == ExternalStatus::Completed) {
            removeExternalRequest(req.requestId);
            runAdmissionLoop();
        }
        return;
    }

    if (req.status != ExternalStatus::Completed) {
        const auto next = transientStatus(req.status, req.statusCode);
        if (next.has_value() && job->status() != *next)
            job->setStatus(*next);
        return;
    }

    // Completed: free the slot and refill before touching the job.
    bool first = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        first = completed_.insert(req.requestId).second;
    }
    removeExternalRequest(req.requestId);
    runAdmissionLoop();

    if (!first || isTerminal(job->status())) {
        qCInfo(bgCoord) << "duplicate completion ignored"
                        << "id=" << job->id()
                        << "status=" << statusName(job->status());
        return;
    }

    CompletionOutcome outcome = CompletionOutcome::Failed;
    try {
        outcome = classifyCompletion(req.statusCode, req.error);
    } catch (const UnhandledSuccessStatus &e) {
        qCCritical(bgCoord) << "unhandled success status"
                            << "id=" << job->id()
                            << "code=" << e.statusCode();
        throw;
    }
    qCInfo(bgCoord) << "transfer completed"
                    << "id=" << job->id()
                    << "code=" << req.statusCode
                    << "error=" << transferErrorName(req.error)
                    << "outcome=" << completionOutcomeName(outcome);
    if (outcome == CompletionOutcome::Succeeded) {
        job->updateProgress(req.bytesTransferred, req.totalBytes);
        startCompletion(job);
        return;
    }
    if (!req.errorMessage.isEmpty())
        qCWarning(bgCoord) << "transfer error"
                           << "id=" << job->id()
                           << "message=" << req.errorMessage;
    job->setStatus(statusForOutcome(outcome));
}

void TransferCoordinator::cancel(const TransferJobPtr &job) {
    if (!job)
        return;
    const TransferStatus st = job->status();
    if (st == TransferStatus::Queued) {
        bool dequeued = false;
        QString requestId;
        {
            // Admission pops and submits under this lock, so a job missing
            // from the queue already carries its request id, if any.
            std::lock_guard<std::mutex> lk(mtx_);
            auto it = std::find(queue_.begin(), queue_.end(), job);
            if (it != queue_.end()) {
                queue_.erase(it);
                dequeued = true;
            }
            requestId = job->externalRequestId();
        }
        if (dequeued || requestId.isEmpty()) {
            job->setStatus(TransferStatus::Canceled);
            qCInfo(bgCoord) << "queued job canceled" << "id=" << job->id();
            if (dequeued)
                emit queueChanged();
            return;
        }
        // Admitted, first report not in yet: treat as in flight.
        qCInfo(bgCoord) << "cancel admitted job"
                        << "id=" << job->id() << "requestId=" << requestId;
        removeExternalRequest(requestId);
        runAdmissionLoop();
        return;
    }
    // A None job still holding a request was reported WaitingForWiFi.
    if (isTransient(st) || (st == TransferStatus::None &&
                            isAdmitted(job->externalRequestId()))) {
        qCInfo(bgCoord) << "cancel active job"
                        << "id=" << job->id()
                        << "requestId=" << job->externalRequestId();
        removeExternalRequest(job->externalRequestId());
        runAdmissionLoop();
    }
    // None and terminal statuses: nothing to cancel.
}

void TransferCoordinator::cancelAll() {
    std::vector<TransferJobPtr> queued = queuedJobs();
    for (const auto &job : queued)
        cancel(job);
    for (const auto &req : gateway_.requests()) {
        if (req.status == ExternalStatus::Completed)
            continue;
        TransferJobPtr job = repository_.findByCorrelationTag(req.tag);
        if (job)
            cancel(job);
    }
    qCInfo(bgCoord) << "cancelAll requested" << "queued=" << queued.size();
}

TransferObserver TransferCoordinator::observerFor(const TransferJobPtr &job) {
    std::weak_ptr<TransferJob> weak = job;
    TransferObserver obs;
    obs.onProgress = [weak](const TransferRequest &r) {
        if (auto j = weak.lock())
            j->updateProgress(r.bytesTransferred, r.totalBytes);
    };
    obs.onStatusChanged = [this](const TransferRequest &r) {
        processTransfer(r);
    };
    return obs;
}

void TransferCoordinator::startCompletion(const TransferJobPtr &job) {
    std::lock_guard<std::mutex> lk(completionsMutex_);
    // Reap workers that already finished.
    for (auto it = completions_.begin(); it != completions_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = completions_.erase(it);
        } else {
            ++it;
        }
    }
    auto done = std::make_shared<std::atomic<bool>>(false);
    Completion c;
    c.done = done;
    c.thread = std::thread([this, job, done]() {
        job->onComplete(store_);
        done->store(true);
    });
    completions_.push_back(std::move(c));
}

void TransferCoordinator::waitForCompletions() {
    for (;;) {
        std::vector<Completion> pending;
        {
            std::lock_guard<std::mutex> lk(completionsMutex_);
            pending.swap(completions_);
        }
        if (pending.empty())
            return;
        for (auto &c : pending) {
            if (c.thread.joinable())
                c.thread.join();
        }
    }
}

int TransferCoordinator::activeSlots() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<int>(admitted_.size());
}

std::vector<TransferJobPtr> TransferCoordinator::queuedJobs() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return std::vector<TransferJobPtr>(queue_.begin(), queue_.end());
}

} // namespace bgtransfer
