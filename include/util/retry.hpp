#pragma once

#include "util/result.hpp"

#include <utility>

namespace ingest {

// Outcome of a single attempt, as seen by the retry loop.
enum class AttemptClass {
    Ok,
    Transient,
    Terminal,
};

enum class RetryDecision {
    Succeed,
    RetryAgain,
    GiveUp,    // terminal failure, budget not consulted
    Exhausted, // transient failure on the last allowed attempt
};

struct RetryPolicy {
    int max_attempts = 3;
};

AttemptClass ClassifyAttempt(const Result& r);

// Pure decision over the tagged outcome of attempt number `attempt` (1-based).
RetryDecision DecideRetry(AttemptClass outcome, int attempt, const RetryPolicy& policy);

struct RetryOutcome {
    Result result;
    int attempts = 0;
    bool exhausted = false;
};

// Runs attempt(n) until it succeeds, fails terminally or the budget runs out.
// on_retry(n, failed_result) is invoked before attempt n + 1.
template <typename AttemptFn, typename OnRetryFn>
RetryOutcome RunWithRetry(const RetryPolicy& policy, AttemptFn&& attempt, OnRetryFn&& on_retry) {
    RetryOutcome out;
    for (int n = 1;; ++n) {
        out.attempts = n;
        out.result = attempt(n);
        switch (DecideRetry(ClassifyAttempt(out.result), n, policy)) {
            case RetryDecision::Succeed:
            case RetryDecision::GiveUp:
                return out;
            case RetryDecision::Exhausted:
                out.exhausted = true;
                return out;
            case RetryDecision::RetryAgain:
                on_retry(n, std::as_const(out.result));
                break;
        }
    }
}

} // namespace ingest
