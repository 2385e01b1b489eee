#pragma once

/// @file retry_executor.hpp
/// @brief Retries an asynchronous operation with exponential backoff.

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <utility>

#include "rcache/foundation/async.hpp"
#include "rcache/foundation/cache_logger.hpp"
#include "rcache/foundation/metrics_sink.hpp"
#include "rcache/foundation/scheduler.hpp"
#include "rcache/reliability/retry_policy.hpp"

namespace rcache::reliability {

/// Runs an operation up to maxAttempts times.
///
/// Between attempts the executor hands the next try to the Scheduler with
/// postAfter(), so the waiting call holds no thread. Errors the policy
/// marks non-retryable are returned on first occurrence; when every attempt
/// fails the error of the last attempt is returned.
///
/// Metrics: rcache_retry_attempts_total per invocation of the operation,
/// rcache_retry_exhausted_total when attempts run out (label "operation").
///
/// A pending retry holds the scheduler and metrics sink, not the executor,
/// so the executor may be destroyed first. The scheduler and sink must
/// outlive every retry still pending.
///
/// Usage:
/// @code
///   RetryExecutor retry(scheduler, metrics);
///   retry.execute<Pet, FetchError>(policy,
///       [&api](auto done) { api.getPet(42, std::move(done)); },
///       [](Result<Pet, FetchError> r) { ... },
///       "get_pet");
/// @endcode
class RetryExecutor {
public:
    RetryExecutor(foundation::Scheduler& scheduler, foundation::MetricsSink& metrics)
        : scheduler_(scheduler), metrics_(metrics) {}

    /// Start @p op and deliver the final outcome to @p done.
    template <typename T, typename E>
    void execute(const RetryPolicy<E>& policy,
                 foundation::AsyncOperation<T, E> op,
                 foundation::Completion<T, E> done,
                 std::string operationName = "default") {
        auto run = std::make_shared<Run<T, E>>(Run<T, E>{
            scheduler_, metrics_, policy, std::move(op), std::move(done),
            foundation::MetricLabels{{"operation", operationName}},
            std::move(operationName), 0});
        attempt(std::move(run));
    }

    /// execute() bridged to a future, for callers that block.
    template <typename T, typename E>
    [[nodiscard]] std::future<Result<T, E>> executeFuture(
        const RetryPolicy<E>& policy, foundation::AsyncOperation<T, E> op,
        std::string operationName = "default") {
        auto promise = std::make_shared<std::promise<Result<T, E>>>();
        auto future = promise->get_future();
        execute<T, E>(policy, std::move(op),
                      [promise](Result<T, E> result) {
                          promise->set_value(std::move(result));
                      },
                      std::move(operationName));
        return future;
    }

private:
    template <typename T, typename E>
    struct Run {
        foundation::Scheduler& scheduler;
        foundation::MetricsSink& metrics;
        RetryPolicy<E> policy;
        foundation::AsyncOperation<T, E> op;
        foundation::Completion<T, E> done;
        foundation::MetricLabels labels;
        std::string name;
        uint32_t attempts;
    };

    template <typename T, typename E>
    static void attempt(std::shared_ptr<Run<T, E>> run) {
        ++run->attempts;
        run->metrics.record("rcache_retry_attempts_total", 1, run->labels);
        auto op = run->op;
        op([run](Result<T, E> result) { onResult(run, std::move(result)); });
    }

    template <typename T, typename E>
    static void onResult(const std::shared_ptr<Run<T, E>>& run, Result<T, E> result) {
        if (result.hasValue() || !run->policy.isRetryable(result.error())) {
            run->done(std::move(result));
            return;
        }

        const auto& config = run->policy.config();
        uint32_t maxAttempts = config.maxAttempts == 0 ? 1 : config.maxAttempts;
        if (run->attempts >= maxAttempts) {
            run->metrics.record("rcache_retry_exhausted_total", 1, run->labels);
            RCACHE_LOG_WARN(foundation::LogCategory::Retry,
                            run->name + ": giving up after " +
                                std::to_string(run->attempts) + " attempts");
            run->done(std::move(result));
            return;
        }

        auto delay = nextDelay(config, run->attempts);
        RCACHE_LOG_DEBUG(foundation::LogCategory::Retry,
                         run->name + ": attempt " + std::to_string(run->attempts) +
                             " failed, retrying in " +
                             std::to_string(std::chrono::duration_cast<
                                 std::chrono::milliseconds>(delay).count()) + "ms");

        auto posted = run->scheduler.postAfter(
            delay, [run] { attempt(run); });
        if (posted.hasError()) {
            RCACHE_LOG_ERROR(foundation::LogCategory::Retry,
                             run->name + ": could not schedule retry: " +
                                 std::string(posted.error().message()));
            run->done(std::move(result));
        }
    }

    foundation::Scheduler& scheduler_;
    foundation::MetricsSink& metrics_;
};

}  // namespace rcache::reliability
