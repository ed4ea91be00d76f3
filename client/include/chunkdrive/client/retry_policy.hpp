#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>

#include "chunkdrive/error_codes.hpp"

namespace chunkdrive::client
{

    class DeliveryExhaustedError : public chunkdrive::Error
    {
    public:
        DeliveryExhaustedError(std::uint64_t chunk_index, std::uint32_t attempts, const std::string &last_error);

        std::uint64_t chunk_index() const noexcept { return chunk_index_; }
        std::uint32_t attempts() const noexcept { return attempts_; }

    private:
        std::uint64_t chunk_index_;
        std::uint32_t attempts_;
    };

    /// Bounded retries with pure exponential backoff: the wait after failed
    /// attempt i (0-based) is base_delay * 2^i, with no jitter and no cap.
    class RetryPolicy
    {
    public:
        using Sleeper = std::function<void(std::chrono::milliseconds)>;
        using ErrorObserver = std::function<void(const std::exception &, std::uint64_t)>;
        using RetryObserver = std::function<void(std::uint32_t, std::chrono::milliseconds, const std::exception &)>;

        static constexpr std::uint32_t kDefaultMaxRetries = 3;
        static constexpr std::uint32_t kMaxRetries = 32;

        /// Throws ConfigurationError when max_retries is zero or above kMaxRetries, when
        /// base_delay is negative, or when the longest backoff would not fit in milliseconds.
        explicit RetryPolicy(std::uint32_t max_retries = kDefaultMaxRetries,
                             std::chrono::milliseconds base_delay = std::chrono::seconds(1), Sleeper sleeper = {});

        /// Runs attempt up to max_retries times. When every attempt fails the
        /// error observer sees the last failure and DeliveryExhaustedError is thrown.
        void execute(std::uint64_t chunk_index, const std::function<void()> &attempt,
                     const ErrorObserver &on_error = {}, const RetryObserver &on_retry = {}) const;

        /// Throws std::out_of_range when attempt_index >= max_retries().
        std::chrono::milliseconds delay_for(std::uint32_t attempt_index) const;

        std::uint32_t max_retries() const noexcept { return max_retries_; }

    private:
        std::uint32_t max_retries_;
        std::chrono::milliseconds base_delay_;
        Sleeper sleeper_;
    };

} // namespace chunkdrive::client
