// Store of transfer records owned by the application.
#pragma once
#include "TransferJob.hpp"
#include <QString>
#include <vector>

namespace bgtransfer {

class TransferRepository {
public:
    virtual ~TransferRepository() = default;

    // Jobs waiting for admission (status Queued), in insertion order.
    virtual std::vector<TransferJobPtr> listNonTerminalPending() const = 0;
    // Jobs in a transient status that carry an external request id.
    virtual std::vector<TransferJobPtr> listAdmitted() const = 0;

    virtual TransferJobPtr findByCorrelationTag(const QString &tag) const = 0;
    virtual TransferJobPtr findById(quint64 id) const = 0;

    // insert/remove are staged until commit(). Commit assigns ids to new
    // jobs.
    virtual void insert(const TransferJobPtr &job) = 0;
    virtual void remove(const TransferJobPtr &job) = 0;
    virtual bool commit(QString *why = nullptr) = 0;
};

} // namespace bgtransfer
