// Status mapping and completion classification (run via CTest).
#include "StatusStateMachine.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

using namespace bgtransfer;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

bool maps(ExternalStatus ext, int code, TransferStatus expected) {
    const auto st = transientStatus(ext, code);
    return st.has_value() && *st == expected;
}

void test_transient_mapping(TestContext &t) {
    t.check(maps(ExternalStatus::None, 0, TransferStatus::None), "None");
    t.check(maps(ExternalStatus::Queued, 0, TransferStatus::Waiting),
            "accepted but not started requests wait");
    t.check(maps(ExternalStatus::Transferring, 0,
                 TransferStatus::Transferring),
            "Transferring");
    t.check(maps(ExternalStatus::Paused, 0, TransferStatus::Paused), "Paused");
    t.check(maps(ExternalStatus::WaitingForExternalPower, 0,
                 TransferStatus::WaitingForExternalPower),
            "WaitingForExternalPower");
    t.check(maps(ExternalStatus::WaitingForExternalPowerDueToBatterySaverMode,
                 0,
                 TransferStatus::WaitingForExternalPowerDueToBatterySaverMode),
            "WaitingForExternalPowerDueToBatterySaverMode");
    t.check(maps(ExternalStatus::WaitingForNonVoiceBlockingNetwork, 0,
                 TransferStatus::WaitingForNonVoiceBlockingNetwork),
            "WaitingForNonVoiceBlockingNetwork");
    t.check(maps(ExternalStatus::WaitingForWiFi, 0, TransferStatus::None),
            "WaitingForWiFi maps to None");
    t.check(!transientStatus(ExternalStatus::Unknown, 0).has_value(),
            "Unknown is a no-op");
    t.check(!transientStatus(ExternalStatus::Completed, 200).has_value(),
            "Completed goes through classification");
}

void test_waiting_code_bands(TestContext &t) {
    t.check(maps(ExternalStatus::Waiting, 500,
                 TransferStatus::WaitingForRetry),
            "500 retries");
    t.check(maps(ExternalStatus::Waiting, 503,
                 TransferStatus::WaitingForRetry),
            "503 retries");
    t.check(maps(ExternalStatus::Waiting, 599,
                 TransferStatus::WaitingForRetry),
            "599 retries");
    t.check(maps(ExternalStatus::Waiting, 0, TransferStatus::Waiting),
            "no code waits");
    t.check(maps(ExternalStatus::Waiting, 499, TransferStatus::Waiting),
            "499 waits");
    t.check(maps(ExternalStatus::Waiting, 600, TransferStatus::Waiting),
            "600 waits");
}

void test_completion_classification(TestContext &t) {
    t.check(classifyCompletion(200, TransferError::None) ==
                CompletionOutcome::Succeeded,
            "200 succeeds");
    t.check(classifyCompletion(206, TransferError::None) ==
                CompletionOutcome::Succeeded,
            "206 succeeds");
    t.check(classifyCompletion(0, TransferError::Canceled) ==
                CompletionOutcome::Canceled,
            "cancel error cancels");
    t.check(classifyCompletion(503, TransferError::Canceled) ==
                CompletionOutcome::Canceled,
            "cancel error wins over the code");
    t.check(classifyCompletion(404, TransferError::Remote) ==
                CompletionOutcome::Failed,
            "404 fails");
    t.check(classifyCompletion(400, TransferError::LocalStorage) ==
                CompletionOutcome::Failed,
            "400 fails");
    t.check(classifyCompletion(500, TransferError::Remote) ==
                CompletionOutcome::FailedServer,
            "500 is a server failure");
    t.check(classifyCompletion(599, TransferError::Network) ==
                CompletionOutcome::FailedServer,
            "599 is a server failure");
    t.check(classifyCompletion(0, TransferError::Network) ==
                CompletionOutcome::Failed,
            "0 fails");
    t.check(classifyCompletion(302, TransferError::Network) ==
                CompletionOutcome::Failed,
            "anything else fails");
}

void test_unhandled_success_codes(TestContext &t) {
    for (int code : {201, 204, 301, 302, 0, 404}) {
        bool thrown = false;
        try {
            classifyCompletion(code, TransferError::None);
        } catch (const UnhandledSuccessStatus &e) {
            thrown = e.statusCode() == code;
        }
        t.check(thrown, "error-free completion with code " +
                            std::to_string(code) + " should throw");
    }
    bool isLogicError = false;
    try {
        classifyCompletion(204, TransferError::None);
    } catch (const std::logic_error &e) {
        isLogicError = std::string(e.what()).find("204") != std::string::npos;
    }
    t.check(isLogicError, "UnhandledSuccessStatus is a logic_error");
}

void test_outcome_statuses(TestContext &t) {
    t.check(statusForOutcome(CompletionOutcome::Succeeded) ==
                TransferStatus::Completed,
            "Succeeded -> Completed");
    t.check(statusForOutcome(CompletionOutcome::Canceled) ==
                TransferStatus::Canceled,
            "Canceled -> Canceled");
    t.check(statusForOutcome(CompletionOutcome::Failed) ==
                TransferStatus::Failed,
            "Failed -> Failed");
    t.check(statusForOutcome(CompletionOutcome::FailedServer) ==
                TransferStatus::FailedServer,
            "FailedServer -> FailedServer");
    t.check(std::string(completionOutcomeName(
                CompletionOutcome::FailedServer)) == "FailedServer",
            "outcome names");
}

void test_terminal_and_transient(TestContext &t) {
    t.check(isTerminal(TransferStatus::Completed) &&
                isTerminal(TransferStatus::Failed) &&
                isTerminal(TransferStatus::FailedServer) &&
                isTerminal(TransferStatus::Canceled),
            "four terminal states");
    t.check(!isTerminal(TransferStatus::Paused), "Paused is not terminal");
    t.check(!isTransient(TransferStatus::None) &&
                !isTransient(TransferStatus::Queued),
            "None and Queued are not in flight");
    t.check(isTransient(TransferStatus::WaitingForRetry) &&
                isTransient(TransferStatus::Transferring),
            "waiting and transferring are in flight");
    t.check(!isTransient(TransferStatus::Canceled),
            "terminal is not in flight");
}

} // namespace

int main() {
    TestContext t;
    test_transient_mapping(t);
    test_waiting_code_bands(t);
    test_completion_classification(t);
    test_unhandled_success_codes(t);
    test_outcome_statuses(t);
    test_terminal_and_transient(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] bgtransfer_status_tests\n";
    return EXIT_SUCCESS;
}
