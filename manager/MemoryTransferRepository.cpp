#include "MemoryTransferRepository.hpp"
#include <algorithm>

namespace bgtransfer {

std::vector<TransferJobPtr>
MemoryTransferRepository::listNonTerminalPending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<TransferJobPtr> out;
    for (const auto &kv : jobs_) {
        if (kv.second->status() == TransferStatus::Queued)
            out.push_back(kv.second);
    }
    return out;
}

std::vector<TransferJobPtr> MemoryTransferRepository::listAdmitted() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<TransferJobPtr> out;
    for (const auto &kv : jobs_) {
        if (isTransient(kv.second->status()) &&
            !kv.second->externalRequestId().isEmpty())
            out.push_back(kv.second);
    }
    return out;
}

TransferJobPtr
MemoryTransferRepository::findByCorrelationTag(const QString &tag) const {
    bool ok = false;
    const quint64 id = tag.toULongLong(&ok);
    if (!ok || id == 0)
        return nullptr;
    return findById(id);
}

TransferJobPtr MemoryTransferRepository::findById(quint64 id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : it->second;
}

void MemoryTransferRepository::insert(const TransferJobPtr &job) {
    if (!job)
        return;
    std::lock_guard<std::mutex> lk(mtx_);
    pendingInserts_.push_back(job);
}

void MemoryTransferRepository::remove(const TransferJobPtr &job) {
    if (!job)
        return;
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = std::find(pendingInserts_.begin(), pendingInserts_.end(), job);
    if (it != pendingInserts_.end()) {
        pendingInserts_.erase(it);
        return;
    }
    pendingRemovals_.push_back(job);
}

bool MemoryTransferRepository::commit(QString *why) {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto &job : pendingRemovals_) {
        if (jobs_.count(job->id()) == 0) {
            if (why)
                *why = QStringLiteral("Unknown transfer id %1").arg(job->id());
            pendingRemovals_.clear();
            pendingInserts_.clear();
            return false;
        }
    }
    for (const auto &job : pendingRemovals_)
        jobs_.erase(job->id());
    pendingRemovals_.clear();
    for (const auto &job : pendingInserts_) {
        if (job->id() == 0)
            job->setId(nextId_++);
        else
            nextId_ = std::max(nextId_, job->id() + 1);
        jobs_[job->id()] = job;
    }
    pendingInserts_.clear();
    return true;
}

std::vector<TransferJobPtr> MemoryTransferRepository::all() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<TransferJobPtr> out;
    out.reserve(jobs_.size());
    for (const auto &kv : jobs_)
        out.push_back(kv.second);
    return out;
}

} // namespace bgtransfer
