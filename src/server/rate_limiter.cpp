#include "toolgate/server/rate_limiter.hpp"

#include "toolgate/exceptions.hpp"

#include <algorithm>

namespace toolgate::server
{

namespace
{
RateLimiter::Config config_with_rate(size_t requests_per_minute)
{
    RateLimiter::Config config;
    config.requests_per_minute = requests_per_minute;
    return config;
}

std::chrono::seconds floor_seconds(std::chrono::system_clock::duration d)
{
    if (d <= std::chrono::system_clock::duration::zero())
        return std::chrono::seconds(0);
    return std::chrono::duration_cast<std::chrono::seconds>(d);
}
} // namespace

RateLimiter::RateLimiter(size_t requests_per_minute, NowFn now)
    : RateLimiter(config_with_rate(requests_per_minute), std::move(now))
{
}

RateLimiter::RateLimiter(Config config, NowFn now) : config_(std::move(config)), now_(std::move(now))
{
    if (config_.window <= std::chrono::milliseconds::zero())
        throw ValidationError("rate limit window must be positive");
    if (config_.shard_count == 0)
        config_.shard_count = 1;
    if (!now_)
        now_ = [] { return Clock::now(); };

    shards_.reserve(config_.shard_count);
    for (size_t i = 0; i < config_.shard_count; ++i)
        shards_.push_back(std::make_unique<Shard>());
}

RateLimiter::Shard& RateLimiter::shard_for(const std::string& key) const
{
    return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

void RateLimiter::prune(Window& window, TimePoint cutoff)
{
    // Timestamps equal to the cutoff are expired
    while (!window.empty() && window.front() <= cutoff)
        window.pop_front();
}

size_t RateLimiter::sweep_locked(Shard& shard, TimePoint cutoff)
{
    size_t removed = 0;
    for (auto it = shard.windows.begin(); it != shard.windows.end();)
    {
        if (it->second.empty() || it->second.back() <= cutoff)
        {
            it = shard.windows.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

void RateLimiter::maybe_sweep_locked(Shard& shard, TimePoint cutoff) const
{
    if (config_.sweep_interval == 0)
        return;
    if (++shard.operations % config_.sweep_interval == 0)
        sweep_locked(shard, cutoff);
}

RateLimitDecision RateLimiter::try_acquire(const std::string& key)
{
    const auto now = now_();
    const auto cutoff = now - config_.window;

    RateLimitDecision decision;
    decision.limit = config_.requests_per_minute;

    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    maybe_sweep_locked(shard, cutoff);

    auto it = shard.windows.find(key);
    if (it != shard.windows.end())
    {
        prune(it->second, cutoff);
        if (it->second.empty())
        {
            shard.windows.erase(it);
            it = shard.windows.end();
        }
    }

    const size_t count = it == shard.windows.end() ? 0 : it->second.size();
    if (count >= config_.requests_per_minute)
    {
        decision.allowed = false;
        decision.remaining = 0;
        decision.reset_at = count > 0 ? it->second.front() + config_.window : now + config_.window;
        decision.retry_after = floor_seconds(decision.reset_at - now);
        return decision;
    }

    if (it == shard.windows.end())
        it = shard.windows.emplace(key, Window{}).first;

    auto& window = it->second;
    // Keep the sequence ordered even if the wall clock stepped backwards
    window.insert(std::upper_bound(window.begin(), window.end(), now), now);

    decision.allowed = true;
    decision.remaining = config_.requests_per_minute - window.size();
    decision.reset_at = window.front() + config_.window;
    return decision;
}

size_t RateLimiter::remaining(const std::string& key)
{
    const auto cutoff = now_() - config_.window;
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.windows.find(key);
    if (it == shard.windows.end())
        return config_.requests_per_minute;

    prune(it->second, cutoff);
    const size_t count = it->second.size();
    if (it->second.empty())
        shard.windows.erase(it);
    return count >= config_.requests_per_minute ? 0 : config_.requests_per_minute - count;
}

RateLimiter::TimePoint RateLimiter::reset_time(const std::string& key)
{
    const auto now = now_();
    const auto cutoff = now - config_.window;
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.windows.find(key);
    if (it == shard.windows.end())
        return now + config_.window;

    prune(it->second, cutoff);
    if (it->second.empty())
    {
        shard.windows.erase(it);
        return now + config_.window;
    }
    return it->second.front() + config_.window;
}

size_t RateLimiter::tracked_clients() const
{
    size_t total = 0;
    for (const auto& shard : shards_)
    {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->windows.size();
    }
    return total;
}

size_t RateLimiter::sweep()
{
    const auto cutoff = now_() - config_.window;
    size_t removed = 0;
    for (auto& shard : shards_)
    {
        std::lock_guard<std::mutex> lock(shard->mutex);
        removed += sweep_locked(*shard, cutoff);
    }
    return removed;
}

void RateLimiter::reset()
{
    for (auto& shard : shards_)
    {
        std::lock_guard<std::mutex> lock(shard->mutex);
        shard->windows.clear();
        shard->operations = 0;
    }
}

} // namespace toolgate::server
