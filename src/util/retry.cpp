#include "util/retry.hpp"

namespace ingest {

AttemptClass ClassifyAttempt(const Result& r) {
    if (r.is_ok()) return AttemptClass::Ok;
    switch (r.kind) {
        case ErrorKind::TransientIo:
        case ErrorKind::TransientUpload:
            return AttemptClass::Transient;
        default:
            return AttemptClass::Terminal;
    }
}

RetryDecision DecideRetry(AttemptClass outcome, int attempt, const RetryPolicy& policy) {
    const int budget = policy.max_attempts > 0 ? policy.max_attempts : 1;
    switch (outcome) {
        case AttemptClass::Ok:
            return RetryDecision::Succeed;
        case AttemptClass::Terminal:
            return RetryDecision::GiveUp;
        case AttemptClass::Transient:
            return attempt < budget ? RetryDecision::RetryAgain : RetryDecision::Exhausted;
    }
    return RetryDecision::GiveUp;
}

} // namespace ingest
