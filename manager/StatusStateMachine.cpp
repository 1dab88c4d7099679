#include "StatusStateMachine.hpp"

namespace bgtransfer {

const char *completionOutcomeName(CompletionOutcome o) {
    switch (o) {
    case CompletionOutcome::Succeeded:
        return "Succeeded";
    case CompletionOutcome::Canceled:
        return "Canceled";
    case CompletionOutcome::Failed:
        return "Failed";
    case CompletionOutcome::FailedServer:
        return "FailedServer";
    }
    return "Unknown";
}

std::optional<TransferStatus> transientStatus(ExternalStatus external,
                                              int statusCode) {
    switch (external) {
    case ExternalStatus::None:
        return TransferStatus::None;
    case ExternalStatus::Queued:
        // Accepted by the subsystem, not started. Application Queued is
        // reserved for jobs still waiting in the coordinator's queue.
        return TransferStatus::Waiting;
    case ExternalStatus::Transferring:
        return TransferStatus::Transferring;
    case ExternalStatus::Waiting:
        if (statusCode >= 500 && statusCode <= 599)
            return TransferStatus::WaitingForRetry;
        return TransferStatus::Waiting;
    case ExternalStatus::WaitingForWiFi:
        // Long-standing behavior: waiting for Wi-Fi is shown as None.
        return TransferStatus::None;
    case ExternalStatus::WaitingForExternalPower:
        return TransferStatus::WaitingForExternalPower;
    case ExternalStatus::WaitingForExternalPowerDueToBatterySaverMode:
        return TransferStatus::WaitingForExternalPowerDueToBatterySaverMode;
    case ExternalStatus::WaitingForNonVoiceBlockingNetwork:
        return TransferStatus::WaitingForNonVoiceBlockingNetwork;
    case ExternalStatus::Paused:
        return TransferStatus::Paused;
    case ExternalStatus::Completed:
    case ExternalStatus::Unknown:
        return std::nullopt;
    }
    return std::nullopt;
}

CompletionOutcome classifyCompletion(int statusCode, TransferError error) {
    if (error == TransferError::None) {
        if (statusCode == 200 || statusCode == 206)
            return CompletionOutcome::Succeeded;
        throw UnhandledSuccessStatus(statusCode);
    }
    if (error == TransferError::Canceled)
        return CompletionOutcome::Canceled;
    if (statusCode >= 500 && statusCode <= 599)
        return CompletionOutcome::FailedServer;
    // 4xx, 0 and anything unexpected
    return CompletionOutcome::Failed;
}

TransferStatus statusForOutcome(CompletionOutcome o) {
    switch (o) {
    case CompletionOutcome::Succeeded:
        return TransferStatus::Completed;
    case CompletionOutcome::Canceled:
        return TransferStatus::Canceled;
    case CompletionOutcome::Failed:
        return TransferStatus::Failed;
    case CompletionOutcome::FailedServer:
        return TransferStatus::FailedServer;
    }
    return TransferStatus::Failed;
}

} // namespace bgtransfer
