// Pure mapping from external request reports to application statuses.
#pragma once
#include "TransferTypes.hpp"
#include <optional>
#include <stdexcept>
#include <string>

namespace bgtransfer {

// A completed request without error whose status code is neither 200 nor
// 206. There is no safe way to finish the job, so it is surfaced to the
// caller of the reconciliation.
class UnhandledSuccessStatus : public std::logic_error {
public:
    explicit UnhandledSuccessStatus(int statusCode)
        : std::logic_error("Unhandled success status code: " +
                           std::to_string(statusCode)),
          statusCode_(statusCode) {}
    int statusCode() const { return statusCode_; }

private:
    int statusCode_;
};

enum class CompletionOutcome { Succeeded, Canceled, Failed, FailedServer };

const char *completionOutcomeName(CompletionOutcome o);

// Status to apply for a non-completed report. nullopt means "leave the job
// as is" (Unknown reports and Completed, which goes through
// classifyCompletion()).
std::optional<TransferStatus> transientStatus(ExternalStatus external,
                                              int statusCode);

// Outcome of a Completed report. Throws UnhandledSuccessStatus for an
// error-free completion with a code other than 200/206.
CompletionOutcome classifyCompletion(int statusCode, TransferError error);

// Application status for a non-success outcome.
TransferStatus statusForOutcome(CompletionOutcome o);

} // namespace bgtransfer
