#pragma once
#include "core/Error.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

namespace WP {

/**
 * Write-once outcome of a task, shared between the worker that
 * produces it and every handle that observes it.
 *
 * Holds either a value (or nothing, for void) or an Error. Thread-safe:
 * multiple waiters are permitted and the first set wins; later sets return
 * false and leave the outcome untouched.
 */
template <typename T>
class ResultSlot {
public:
    using value_type = T;

    ResultSlot() = default;

    ResultSlot(ResultSlot const&)            = delete;
    ResultSlot& operator=(ResultSlot const&) = delete;

    [[nodiscard]] bool ready() const {
        std::scoped_lock<std::mutex> lg(mutex_);
        return outcome_.has_value();
    }

    void wait() const {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return outcome_.has_value(); });
    }

    bool wait_until(std::chrono::steady_clock::time_point deadline) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_until(lock, deadline, [&] { return outcome_.has_value(); });
    }

    template <typename... Args>
    bool setValue(Args&&... args) {
        return this->publish([&](std::optional<Expected<T>>& out) { out.emplace(std::in_place, std::forward<Args>(args)...); });
    }

    bool setError(Error error) {
        return this->publish([&](std::optional<Expected<T>>& out) { out.emplace(std::unexpect, std::move(error)); });
    }

    // Copy of the outcome, or nullopt if not ready yet.
    [[nodiscard]] auto peek() const -> std::optional<Expected<T>> {
        std::scoped_lock<std::mutex> lg(mutex_);
        return outcome_;
    }

    // Blocks until ready and returns a copy of the outcome.
    [[nodiscard]] auto get() const -> Expected<T> {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return outcome_.has_value(); });
        return *outcome_;
    }

    [[nodiscard]] auto errorCode() const -> std::optional<Error::Code> {
        std::scoped_lock<std::mutex> lg(mutex_);
        if (outcome_ && !outcome_->has_value())
            return outcome_->error().code;
        return std::nullopt;
    }

private:
    template <typename Writer>
    bool publish(Writer&& write) {
        {
            std::scoped_lock<std::mutex> lg(mutex_);
            if (outcome_.has_value())
                return false;
            write(outcome_);
        }
        cv_.notify_all();
        return true;
    }

    mutable std::mutex              mutex_;
    mutable std::condition_variable cv_;
    std::optional<Expected<T>>      outcome_;
};

} // namespace WP
