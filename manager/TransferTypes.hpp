// Status taxonomy and small value types shared by the coordinator, the jobs
// and the gateways.
#pragma once
#include <QString>
#include <QUrl>

namespace bgtransfer {

// Application-level lifecycle of a transfer job.
enum class TransferStatus {
    None,
    Queued,
    Transferring,
    Waiting,
    WaitingForRetry,
    WaitingForWiFi,
    WaitingForExternalPower,
    WaitingForExternalPowerDueToBatterySaverMode,
    WaitingForNonVoiceBlockingNetwork,
    Paused,
    Completed,
    Failed,
    FailedServer,
    Canceled
};

// Status reported by the external transfer subsystem for one request.
enum class ExternalStatus {
    None,
    Queued,
    Transferring,
    Waiting,
    WaitingForWiFi,
    WaitingForExternalPower,
    WaitingForExternalPowerDueToBatterySaverMode,
    WaitingForNonVoiceBlockingNetwork,
    Paused,
    Completed,
    Unknown
};

// Error attached to a completed external request.
enum class TransferError {
    None,
    Canceled,     // request was removed before it finished
    Network,      // transport failure, see the status code
    Remote,       // server-side failure, see the status code
    LocalStorage  // local file could not be read or written
};

enum class TransferDirection { Download, Upload };

// Network/power conditions under which the subsystem may run a request.
enum class TransferPreferences {
    None,
    AllowBattery,
    AllowCellular,
    AllowCellularAndBattery
};

const char *statusName(TransferStatus st);
const char *externalStatusName(ExternalStatus st);
const char *transferErrorName(TransferError e);
const char *preferencesName(TransferPreferences p);

// Completed, Failed, FailedServer and Canceled.
bool isTerminal(TransferStatus st);

// Queued or a terminal state; everything else means a request is in flight.
inline bool isTransient(TransferStatus st) {
    return st != TransferStatus::None && st != TransferStatus::Queued &&
           !isTerminal(st);
}

// GET downloads, every other method uploads.
TransferDirection directionForMethod(const QString &method);

// URL suitable for logs: user info and query are dropped unless sensitive
// logging is enabled for this process.
QString redactedUrl(const QUrl &url);

} // namespace bgtransfer
