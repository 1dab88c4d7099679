// Boundary to the external transfer subsystem: the service that actually
// moves bytes and accepts only a few concurrently active requests.
#pragma once
#include "TransferTypes.hpp"
#include <QString>
#include <QUrl>
#include <functional>
#include <optional>
#include <vector>

namespace bgtransfer {

// Snapshot of one external request as last reported by the subsystem.
struct TransferRequest {
    QString requestId;
    QString tag; // correlation tag (job id)
    QString method;
    QUrl remoteUrl;
    QString location; // staging path, relative to the store root
    ExternalStatus status = ExternalStatus::None;
    int statusCode = 0; // HTTP-style response code, 0 when not yet known
    TransferError error = TransferError::None;
    QString errorMessage;
    qint64 bytesTransferred = 0;
    qint64 totalBytes = -1;
    TransferPreferences preferences =
        TransferPreferences::AllowCellularAndBattery;
};

struct SubmitRequest {
    QString tag;
    QString method;
    QUrl remoteUrl;
    QString location;
    TransferPreferences preferences =
        TransferPreferences::AllowCellularAndBattery;
};

// Callbacks arrive on gateway threads. They are never invoked from inside
// submit() or remove(), so they may call back into the gateway.
struct TransferObserver {
    std::function<void(const TransferRequest &)> onProgress;
    std::function<void(const TransferRequest &)> onStatusChanged;
};

enum class SubmitError {
    None,
    CapacityExceeded,   // per-application request limit reached
    DuplicateRequest,   // same tag or same staging location already active
    SystemDisabled,     // background transfers disabled by the user/system
    InsufficientStorage,
    TransportError      // URL or transport rejected by the subsystem
};

inline const char *submitErrorName(SubmitError e) {
    switch (e) {
    case SubmitError::None:
        return "None";
    case SubmitError::CapacityExceeded:
        return "CapacityExceeded";
    case SubmitError::DuplicateRequest:
        return "DuplicateRequest";
    case SubmitError::SystemDisabled:
        return "SystemDisabled";
    case SubmitError::InsufficientStorage:
        return "InsufficientStorage";
    case SubmitError::TransportError:
        return "TransportError";
    }
    return "Unknown";
}

class TransferGateway {
public:
    virtual ~TransferGateway() = default;

    // Every request the subsystem still holds, completed ones included.
    virtual std::vector<TransferRequest> requests() const = 0;

    // On success fills out (when non-null) with the accepted request.
    virtual bool submit(const SubmitRequest &req, TransferObserver observer,
                        TransferRequest *out, SubmitError *code = nullptr,
                        QString *why = nullptr) = 0;

    virtual std::optional<TransferRequest>
    find(const QString &requestId) const = 0;

    // Returns false when the request was already removed. Removing a request
    // that has not completed yet produces one more Completed report with
    // TransferError::Canceled.
    virtual bool remove(const QString &requestId, QString *why = nullptr) = 0;

    // Replaces the observer attached to a request.
    virtual void subscribe(const QString &requestId,
                           TransferObserver observer) = 0;
    virtual void unsubscribe(const QString &requestId) = 0;
};

} // namespace bgtransfer
