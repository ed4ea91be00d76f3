#include "chunkdrive/client/retry_policy.hpp"

#include <limits>
#include <stdexcept>
#include <thread>

namespace chunkdrive::client
{

    DeliveryExhaustedError::DeliveryExhaustedError(std::uint64_t chunk_index, std::uint32_t attempts,
                                                   const std::string &last_error)
        : Error(ErrorCode::ChunkDeliveryExhausted, "Chunk " + std::to_string(chunk_index) + " failed after " +
                                                       std::to_string(attempts) + " attempts: " + last_error),
          chunk_index_(chunk_index), attempts_(attempts) {}

    RetryPolicy::RetryPolicy(std::uint32_t max_retries, std::chrono::milliseconds base_delay, Sleeper sleeper)
        : max_retries_(max_retries), base_delay_(base_delay), sleeper_(std::move(sleeper))
    {
        if (max_retries_ == 0)
        {
            throw ConfigurationError("Retry count must be positive");
        }
        if (max_retries_ > kMaxRetries)
        {
            throw ConfigurationError("Retry count must not exceed " + std::to_string(kMaxRetries));
        }
        if (base_delay_.count() < 0)
        {
            throw ConfigurationError("Retry delay must not be negative");
        }
        const auto largest_factor = std::int64_t{1} << (max_retries_ - 1);
        if (base_delay_.count() > std::numeric_limits<std::chrono::milliseconds::rep>::max() / largest_factor)
        {
            throw ConfigurationError("Retry delay too large for " + std::to_string(max_retries_) + " attempts");
        }
        if (!sleeper_)
        {
            sleeper_ = [](std::chrono::milliseconds delay)
            { std::this_thread::sleep_for(delay); };
        }
    }

    std::chrono::milliseconds RetryPolicy::delay_for(std::uint32_t attempt_index) const
    {
        if (attempt_index >= max_retries_)
        {
            throw std::out_of_range("Retry attempt " + std::to_string(attempt_index) + " beyond the configured " +
                                    std::to_string(max_retries_));
        }
        return base_delay_ * (std::int64_t{1} << attempt_index);
    }

    void RetryPolicy::execute(std::uint64_t chunk_index, const std::function<void()> &attempt,
                              const ErrorObserver &on_error, const RetryObserver &on_retry) const
    {
        for (std::uint32_t attempt_index = 0; attempt_index < max_retries_; ++attempt_index)
        {
            try
            {
                attempt();
                return;
            }
            catch (const std::exception &ex)
            {
                if (attempt_index + 1 >= max_retries_)
                {
                    if (on_error)
                    {
                        on_error(ex, chunk_index);
                    }
                    throw DeliveryExhaustedError(chunk_index, max_retries_, ex.what());
                }
                const auto delay = delay_for(attempt_index);
                if (on_retry)
                {
                    on_retry(attempt_index, delay, ex);
                }
                sleeper_(delay);
            }
        }
    }

} // namespace chunkdrive::client
