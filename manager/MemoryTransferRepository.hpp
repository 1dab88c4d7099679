#pragma once
#include "TransferRepository.hpp"
#include <map>
#include <mutex>

namespace bgtransfer {

// Process-local repository. Good for tests and for the CLI, where records
// do not outlive the run.
class MemoryTransferRepository : public TransferRepository {
public:
    std::vector<TransferJobPtr> listNonTerminalPending() const override;
    std::vector<TransferJobPtr> listAdmitted() const override;
    TransferJobPtr findByCorrelationTag(const QString &tag) const override;
    TransferJobPtr findById(quint64 id) const override;
    void insert(const TransferJobPtr &job) override;
    void remove(const TransferJobPtr &job) override;
    bool commit(QString *why = nullptr) override;

    std::vector<TransferJobPtr> all() const;

private:
    mutable std::mutex mtx_;
    std::map<quint64, TransferJobPtr> jobs_; // id order == insertion order
    std::vector<TransferJobPtr> pendingInserts_;
    std::vector<TransferJobPtr> pendingRemovals_;
    quint64 nextId_ = 1;
};

} // namespace bgtransfer
