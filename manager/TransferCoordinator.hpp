// Admission-controlled queue in front of a TransferGateway. Keeps an
// unbounded FIFO of jobs, admits at most maxActiveRequests of them to the
// gateway and folds the gateway's asynchronous reports back into the jobs.
#pragma once
#include "TransferGateway.hpp"
#include "TransferJob.hpp"
#include "TransferRepository.hpp"
#include "TransferSettings.hpp"
#include "TransferStore.hpp"
#include <QObject>
#include <QString>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

namespace bgtransfer {

class TransferCoordinator : public QObject {
    Q_OBJECT
public:
    // Reconciles the requests the gateway already holds with the
    // repository, then runs one admission pass. Rethrows
    // UnhandledSuccessStatus from that reconciliation.
    TransferCoordinator(TransferGateway &gateway,
                        TransferRepository &repository, TransferStore &store,
                        const TransferSettings &settings,
                        QObject *parent = nullptr);
    ~TransferCoordinator() override;

    // Appends (prepends) the job with status Queued and runs admission.
    // enqueue() also resets the job progress.
    void enqueue(const TransferJobPtr &job);
    void enqueueFront(const TransferJobPtr &job);
    void enqueueBatch(const std::vector<TransferJobPtr> &jobs);

    // Queued jobs are dropped locally; in-flight ones are removed from the
    // gateway, which reports the cancellation asynchronously.
    void cancel(const TransferJobPtr &job);
    void cancelAll();

    void runAdmissionLoop();

    // Applies one gateway report. Observers installed by the coordinator
    // call it; throws UnhandledSuccessStatus for an unclassifiable success.
    void processTransfer(const TransferRequest &req);

    int activeSlots() const;
    std::vector<TransferJobPtr> queuedJobs() const;
    int maxActiveRequests() const { return settings_.maxActiveRequests; }

    // Joins the onComplete() workers started so far. Must not be called
    // from a job status callback running on such a worker.
    void waitForCompletions();

signals:
    // Queue contents or slot usage changed. Emitted from the calling thread,
    // which may be a gateway thread.
    void queueChanged();

private:
    struct Completion {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    TransferGateway &gateway_;
    TransferRepository &repository_;
    TransferStore &store_;
    TransferSettings settings_;

    mutable std::mutex mtx_;
    std::deque<TransferJobPtr> queue_;
    std::unordered_set<QString> admitted_; // size == active slots
    // Requests carrying our observer. Kept until teardown, where
    // unsubscribe() also waits for a callback still running.
    std::unordered_set<QString> observed_;
    // Requests whose Completed report was applied; later copies are dropped.
    std::unordered_set<QString> completed_;
    // Requests already handed to gateway remove().
    std::unordered_set<QString> removed_;
    bool shuttingDown_ = false;

    std::mutex completionsMutex_;
    std::vector<Completion> completions_;

    void reconcile();
    void detachObservers();
    // Caller holds mtx_.
    bool admit(const TransferJobPtr &job, QString *why);
    void removeExternalRequest(const QString &requestId);
    TransferObserver observerFor(const TransferJobPtr &job);
    void startCompletion(const TransferJobPtr &job);
    void pushFront(const TransferJobPtr &job);
    // Queued here, or holding an admitted request.
    bool isScheduled(const TransferJobPtr &job) const;
    bool isAdmitted(const QString &requestId) const;
};

} // namespace bgtransfer
