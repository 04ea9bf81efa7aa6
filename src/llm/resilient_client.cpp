#include "llm/resilient_client.hpp"
#include "llm/fallback_synthesizer.hpp"
#include "llm/json_repair.hpp"
#include "llm/response_extractor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <random>

namespace promptguard {

using json = nlohmann::json;

// ============================================================================
// RetryPolicy
// ============================================================================

std::chrono::milliseconds RetryPolicy::backoff_for(uint32_t retry) const {
    if (retry == 0) return std::chrono::milliseconds{0};

    auto delay = base_backoff;
    for (uint32_t i = 1; i < retry && delay < max_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_backoff);
}

// ============================================================================
// Construction
// ============================================================================

ResilientClient::ResilientClient(std::shared_ptr<IModelTransport> transport,
                                 Config config,
                                 PayloadValidator validator)
    : transport_(std::move(transport)),
      config_(std::move(config)),
      validator_(std::move(validator)) {
    if (!transport_) {
        throw std::invalid_argument("ResilientClient requires a transport");
    }
}

// ============================================================================
// Invocation
// ============================================================================

InvocationOutcome ResilientClient::invoke(const ModelRequest& request, bool fallback_on_error) {
    return invoke(request, fallback_on_error, config_.retry, std::stop_token{});
}

InvocationOutcome ResilientClient::invoke(const ModelRequest& request,
                                          bool fallback_on_error,
                                          uint32_t max_attempts,
                                          std::chrono::milliseconds base_backoff) {
    RetryPolicy policy = config_.retry;
    policy.max_attempts = max_attempts;
    policy.base_backoff = base_backoff;
    return invoke(request, fallback_on_error, policy, std::stop_token{});
}

InvocationOutcome ResilientClient::invoke(const ModelRequest& request,
                                          bool fallback_on_error,
                                          const RetryPolicy& policy,
                                          std::stop_token stop) {
    invocations_.fetch_add(1, std::memory_order_relaxed);
    const utils::Timer timer;

    ModelRequest resolved = request;
    if (resolved.model.empty()) {
        resolved.model = config_.model_name;
    }

    uint32_t attempts = 0;
    try {
        const auto response = send_with_retry(resolved, policy, stop, attempts);

        InvocationOutcome outcome;
        outcome.payload = to_payload(response, resolved);
        outcome.success = true;
        outcome.model_debug.model_name = resolved.model;
        outcome.model_debug.latency_ms = timer.elapsed_ms_precise();
        outcome.model_debug.attempts = attempts;

        successes_.fetch_add(1, std::memory_order_relaxed);
        utils::log::info(std::format("Model invocation succeeded: model={} attempts={} latency={:.1f}ms",
                                     resolved.model, attempts, outcome.model_debug.latency_ms));
        return outcome;
    } catch (const InvocationError& e) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Model invocation failed: {} ({}) after {} attempt(s)",
                                     error_class_to_string(e.error_class()), e.what(), attempts));
        if (!fallback_on_error) {
            throw;
        }
        fallbacks_.fetch_add(1, std::memory_order_relaxed);
        return FallbackSynthesizer::synthesize(e.error_class(), timer.elapsed_ms_precise(), attempts);
    }
}

json ResilientClient::send_with_retry(const ModelRequest& request,
                                      const RetryPolicy& policy,
                                      std::stop_token stop,
                                      uint32_t& attempts) {
    const auto deadline = std::chrono::steady_clock::now() + policy.deadline;
    const uint32_t max_attempts = std::max<uint32_t>(1, policy.max_attempts);

    for (uint32_t attempt = 1;; ++attempt) {
        if (stop.stop_requested()) {
            throw InvocationError(ErrorClass::RETRIABLE_TRANSPORT, "invocation cancelled");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw InvocationError(ErrorClass::RETRIABLE_TRANSPORT, "deadline exceeded");
        }

        attempts = attempt;
        attempts_.fetch_add(1, std::memory_order_relaxed);

        try {
            return transport_->send(request, deadline, stop);
        } catch (const TransportError& e) {
            const auto failure = transport_failure_to_string(e.failure());
            if (e.error_class() != ErrorClass::RETRIABLE_TRANSPORT) {
                throw InvocationError(e.error_class(),
                    std::format("{} failure from {} transport", failure, transport_->name()));
            }
            if (e.failure() == TransportFailure::CANCELLED || stop.stop_requested()) {
                throw InvocationError(ErrorClass::RETRIABLE_TRANSPORT, "invocation cancelled");
            }
            if (attempt >= max_attempts) {
                throw InvocationError(ErrorClass::RETRIABLE_TRANSPORT,
                    std::format("retries exhausted after {} attempt(s), last failure: {}", attempt, failure));
            }

            const auto delay = jittered(policy.backoff_for(attempt), policy.jitter_ratio);
            if (std::chrono::steady_clock::now() + delay >= deadline) {
                throw InvocationError(ErrorClass::RETRIABLE_TRANSPORT,
                    std::format("deadline exceeded before retry {}, last failure: {}", attempt, failure));
            }

            utils::log::debug(std::format("Retrying after {} failure in {}ms (attempt {}/{})",
                                          failure, delay.count(), attempt + 1, max_attempts));
            retries_.fetch_add(1, std::memory_order_relaxed);
            if (!sleep_for(delay, stop)) {
                throw InvocationError(ErrorClass::RETRIABLE_TRANSPORT, "invocation cancelled during backoff");
            }
        } catch (const std::exception&) {
            throw InvocationError(ErrorClass::NON_RETRIABLE_TRANSPORT,
                std::format("unexpected transport failure from {}", transport_->name()));
        }
    }
}

json ResilientClient::to_payload(const json& response, const ModelRequest& request) const {
    auto text = ResponseExtractor::extract(response);
    if (text.is_error()) {
        throw InvocationError(text.error_class(), text.error_message());
    }

    json payload;
    if (request.expect_json) {
        auto parsed = JsonRepair::parse_structured(text.value());
        if (parsed.is_error()) {
            throw InvocationError(parsed.error_class(), parsed.error_message());
        }
        payload = std::move(parsed.value());
    } else {
        payload = text.value();
    }

    if (validator_) {
        bool accepted = false;
        try {
            accepted = validator_(payload);
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Payload validator threw: {}", e.what()));
        }
        if (!accepted) {
            throw InvocationError(ErrorClass::NON_RETRIABLE_TRANSPORT, "payload rejected by validator");
        }
    }
    return payload;
}

// ============================================================================
// Backoff helpers
// ============================================================================

std::chrono::milliseconds ResilientClient::jittered(std::chrono::milliseconds delay, double jitter_ratio) {
    if (jitter_ratio <= 0.0 || delay.count() <= 0) return delay;

    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, static_cast<double>(delay.count()) * jitter_ratio);
    return delay + std::chrono::milliseconds(static_cast<int64_t>(dist(rng)));
}

bool ResilientClient::sleep_for(std::chrono::milliseconds delay, std::stop_token stop) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

// ============================================================================
// Stats
// ============================================================================

ResilientClient::Stats ResilientClient::get_stats() const {
    return {
        invocations_.load(std::memory_order_relaxed),
        attempts_.load(std::memory_order_relaxed),
        retries_.load(std::memory_order_relaxed),
        successes_.load(std::memory_order_relaxed),
        failures_.load(std::memory_order_relaxed),
        fallbacks_.load(std::memory_order_relaxed),
    };
}

} // namespace promptguard
