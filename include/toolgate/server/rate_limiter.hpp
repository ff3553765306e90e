#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolgate::server
{

/// Outcome of one admission check, computed atomically with the decision itself
struct RateLimitDecision
{
    bool allowed{false};
    size_t limit{0};
    size_t remaining{0};
    std::chrono::system_clock::time_point reset_at{};
    std::chrono::seconds retry_after{0};

    /// Reset time as whole epoch seconds (X-RateLimit-Reset)
    long long reset_epoch_seconds() const
    {
        return std::chrono::duration_cast<std::chrono::seconds>(reset_at.time_since_epoch())
            .count();
    }
};

/// Per-client sliding-window rate limiter.
///
/// Each client key owns an increasing sequence of admission timestamps covering the
/// trailing window. A timestamp t is counted while t > now - window. Keys are spread over
/// independently locked shards; the prune/check/append sequence for one key always runs
/// under its shard's lock. Windows that prune to empty are erased on access and each shard
/// is swept periodically, so memory tracks recently active clients only.
///
/// Usage:
/// ```cpp
/// RateLimiter limiter(60);  // 60 requests per minute per client
/// auto decision = limiter.try_acquire("10.0.0.1:session-a");
/// if (!decision.allowed)
///     reject(decision.retry_after);
/// ```
class RateLimiter
{
  public:
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;
    using NowFn = std::function<TimePoint()>;

    struct Config
    {
        size_t requests_per_minute{60};
        std::chrono::milliseconds window{std::chrono::seconds(60)};
        size_t shard_count{16};
        size_t sweep_interval{256}; ///< Operations per shard between full sweeps

        Config() = default;
    };

    /// @param requests_per_minute Maximum admissions per client within the window (0 denies all)
    /// @param now Clock source; defaults to system_clock::now
    explicit RateLimiter(size_t requests_per_minute, NowFn now = nullptr);
    explicit RateLimiter(Config config, NowFn now = nullptr);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Admit or deny one request for key and report the resulting quota
    RateLimitDecision try_acquire(const std::string& key);

    bool is_allowed(const std::string& key)
    {
        return try_acquire(key).allowed;
    }

    /// Slots left for key in the current window (does not consume one)
    size_t remaining(const std::string& key);

    /// When the oldest counted request for key leaves the window; now + window if nothing is counted
    TimePoint reset_time(const std::string& key);

    /// Number of client keys currently holding a window
    size_t tracked_clients() const;

    /// Drop every window with no timestamp inside the trailing window
    /// @return number of client entries removed
    size_t sweep();

    /// Forget all state
    void reset();

    size_t limit() const
    {
        return config_.requests_per_minute;
    }
    std::chrono::milliseconds window() const
    {
        return config_.window;
    }

  private:
    using Window = std::deque<TimePoint>;

    struct Shard
    {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Window> windows;
        size_t operations{0};
    };

    Shard& shard_for(const std::string& key) const;
    static void prune(Window& window, TimePoint cutoff);
    static size_t sweep_locked(Shard& shard, TimePoint cutoff);
    void maybe_sweep_locked(Shard& shard, TimePoint cutoff) const;

    Config config_;
    NowFn now_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace toolgate::server
