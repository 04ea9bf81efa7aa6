#pragma once

#include "llm/model_transport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <variant>

namespace promptguard::testing {

/**
 * @brief Scripted transport: replays responses/failures in order
 *
 * When the script runs out, the last step repeats. A HANG step blocks until
 * the stop token fires (CANCELLED) or the deadline passes (TIMEOUT).
 */
class MockModelTransport : public IModelTransport {
public:
    struct Hang {};
    using Step = std::variant<nlohmann::json, TransportFailure, Hang>;

    MockModelTransport() = default;
    explicit MockModelTransport(std::deque<Step> script) : script_(std::move(script)) {}

    void push(Step step) {
        std::lock_guard lock(mutex_);
        script_.push_back(std::move(step));
    }

    [[nodiscard]] nlohmann::json send(const ModelRequest& request,
                                      Deadline deadline,
                                      std::stop_token stop) override {
        call_count_.fetch_add(1, std::memory_order_relaxed);

        Step step;
        {
            std::lock_guard lock(mutex_);
            last_request_ = request;
            if (script_.empty()) {
                throw TransportError(TransportFailure::INVALID_RESPONSE, "mock script empty");
            }
            step = script_.front();
            if (script_.size() > 1) script_.pop_front();
        }

        if (const auto* failure = std::get_if<TransportFailure>(&step)) {
            throw TransportError(*failure, std::string("mock ") + transport_failure_to_string(*failure));
        }
        if (std::holds_alternative<Hang>(step)) {
            std::mutex m;
            std::condition_variable_any cv;
            std::unique_lock lock(m);
            cv.wait_until(lock, stop, deadline, [] { return false; });
            if (stop.stop_requested()) {
                throw TransportError(TransportFailure::CANCELLED, "mock cancelled");
            }
            throw TransportError(TransportFailure::TIMEOUT, "mock deadline");
        }
        return std::get<nlohmann::json>(step);
    }

    [[nodiscard]] std::string_view name() const override { return "mock"; }

    [[nodiscard]] int call_count() const { return call_count_.load(std::memory_order_relaxed); }

    [[nodiscard]] ModelRequest last_request() const {
        std::lock_guard lock(mutex_);
        return last_request_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<Step> script_;
    ModelRequest last_request_;
    std::atomic<int> call_count_{0};
};

/// Gemini-shaped response carrying @p text as the first candidate's part
inline nlohmann::json gemini_response(const std::string& text) {
    return {
        {"candidates", nlohmann::json::array({
            {{"content", {{"parts", nlohmann::json::array({{{"text", text}}})}, {"role", "model"}}}},
        })},
    };
}

} // namespace promptguard::testing
