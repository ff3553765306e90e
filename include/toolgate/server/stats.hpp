#pragma once
#include "toolgate/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace toolgate::server
{

/// Process-wide request counters, updated from the logging callback
class ServerStats
{
  public:
    ServerStats()
        : started_at_(std::chrono::system_clock::now()),
          started_steady_(std::chrono::steady_clock::now())
    {
    }

    void record(bool success)
    {
        requests_.fetch_add(1, std::memory_order_relaxed);
        if (!success)
            errors_.fetch_add(1, std::memory_order_relaxed);
    }

    std::uint64_t requests() const
    {
        return requests_.load(std::memory_order_relaxed);
    }
    std::uint64_t errors() const
    {
        return errors_.load(std::memory_order_relaxed);
    }

    std::chrono::system_clock::time_point started_at() const
    {
        return started_at_;
    }
    std::chrono::steady_clock::duration uptime() const
    {
        return std::chrono::steady_clock::now() - started_steady_;
    }

  private:
    std::chrono::system_clock::time_point started_at_;
    std::chrono::steady_clock::time_point started_steady_;
    std::atomic<std::uint64_t> requests_{0};
    std::atomic<std::uint64_t> errors_{0};
};

} // namespace toolgate::server
