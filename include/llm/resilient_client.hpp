#pragma once

#include "core/error.hpp"
#include "llm/invocation_outcome.hpp"
#include "llm/model_transport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>

namespace promptguard {

/**
 * @brief Backoff and budget for one invocation
 *
 * Delay before retry n (1-based) is min(base_backoff * 2^(n-1), max_backoff)
 * plus uniform jitter in [0, delay * jitter_ratio]. No retry is started
 * whose sleep would end past the deadline.
 */
struct RetryPolicy {
    uint32_t max_attempts = 3;
    std::chrono::milliseconds base_backoff{500};
    std::chrono::milliseconds max_backoff{8000};
    double jitter_ratio = 0.2;
    std::chrono::milliseconds deadline{30000};

    /// Delay before retry @p retry without jitter
    [[nodiscard]] std::chrono::milliseconds backoff_for(uint32_t retry) const;
};

/**
 * @brief Model invocation that survives flaky transports and sloppy output
 *
 * One invocation = transport call(s) with classified retry, then response
 * extraction, then JSON repair/parse when the request expects JSON, then
 * the optional payload validator. Any failure either becomes a fallback
 * outcome or propagates as InvocationError.
 *
 * Invocations share no retry or backoff state and may run concurrently;
 * only the stats counters are shared (atomics).
 */
class ResilientClient {
public:
    using PayloadValidator = std::function<bool(const nlohmann::json&)>;

    struct Config {
        std::string model_name = "gemini-1.5-flash";
        RetryPolicy retry;
    };

    ResilientClient(std::shared_ptr<IModelTransport> transport,
                    Config config,
                    PayloadValidator validator = {});

    /// Uses the configured retry policy and no cancellation
    [[nodiscard]] InvocationOutcome invoke(const ModelRequest& request, bool fallback_on_error);

    /// Configured policy with the attempt budget and base delay overridden
    [[nodiscard]] InvocationOutcome invoke(const ModelRequest& request,
                                           bool fallback_on_error,
                                           uint32_t max_attempts,
                                           std::chrono::milliseconds base_backoff);

    /**
     * @brief Full-control variant
     * @param stop caller cancellation; aborts the in-flight call and any backoff sleep
     * @throws InvocationError when the invocation fails and @p fallback_on_error is false
     */
    [[nodiscard]] InvocationOutcome invoke(const ModelRequest& request,
                                           bool fallback_on_error,
                                           const RetryPolicy& policy,
                                           std::stop_token stop);

    [[nodiscard]] const Config& config() const { return config_; }

    struct Stats {
        uint64_t invocations = 0;
        uint64_t attempts = 0;
        uint64_t retries = 0;
        uint64_t successes = 0;
        uint64_t failures = 0;
        uint64_t fallbacks = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] nlohmann::json send_with_retry(const ModelRequest& request,
                                                 const RetryPolicy& policy,
                                                 std::stop_token stop,
                                                 uint32_t& attempts);

    [[nodiscard]] nlohmann::json to_payload(const nlohmann::json& response,
                                            const ModelRequest& request) const;

    [[nodiscard]] static std::chrono::milliseconds jittered(std::chrono::milliseconds delay,
                                                            double jitter_ratio);

    /// @return false if @p stop was requested before @p delay elapsed
    [[nodiscard]] static bool sleep_for(std::chrono::milliseconds delay, std::stop_token stop);

    std::shared_ptr<IModelTransport> transport_;
    Config config_;
    PayloadValidator validator_;

    std::atomic<uint64_t> invocations_{0};
    std::atomic<uint64_t> attempts_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> successes_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> fallbacks_{0};
};

} // namespace promptguard
