/**
 * @file resource_pool.hpp
 * @brief Named counting resources that task bodies use to throttle themselves.
 *
 * The scheduler starts every eligible node at once. Tasks that need a scarce
 * resource (GPUs, memory-heavy slots, licenses) take an Allocation from a
 * ResourcePool shared through RunOptions and block until it is granted.
 */

#pragma once

#include "core/result.hpp"

#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>

namespace taskpipe {

/// Resource name -> count. Missing names count as zero.
using ResourceCounts = std::map<std::string, int64_t>;

/// `a <= b` for every name in `a`.
[[nodiscard]] bool fits_within(const ResourceCounts& a, const ResourceCounts& b);

[[nodiscard]] std::string to_string(const ResourceCounts& counts);

class ResourcePool;

/**
 * @brief Resources held by one task; returned to the pool on destruction.
 */
class Allocation {
public:
    Allocation(ResourcePool& pool, ResourceCounts acquired);
    ~Allocation();

    Allocation(const Allocation&) = delete;
    Allocation& operator=(const Allocation&) = delete;

    /// Acquire more resources. Two allocations growing this way can deadlock.
    Result<void> request(const ResourceCounts& more, std::stop_token stop = {});

    /// Return part of the allocation early.
    Result<void> release(const ResourceCounts& part);

    Result<void> release_all();

    [[nodiscard]] const ResourceCounts& acquired() const noexcept { return acquired_; }

private:
    ResourcePool& pool_;
    ResourceCounts acquired_;
};

class ResourcePool {
public:
    ResourcePool() = default;
    explicit ResourcePool(ResourceCounts available);

    ResourcePool(const ResourcePool&) = delete;
    ResourcePool& operator=(const ResourcePool&) = delete;

    /**
     * @brief Block until `requirement` is available, then take it.
     *
     * Fails immediately when the requirement exceeds the pool's total, and
     * with a Cancelled error when `stop` is requested while waiting.
     */
    Result<ResourceCounts> request(const ResourceCounts& requirement, std::stop_token stop = {});

    /// Give back resources previously requested.
    Result<void> release(const ResourceCounts& resources);

    /// Grow the total supply.
    void add(const ResourceCounts& resources);

    /// request() wrapped into an RAII Allocation.
    Result<std::unique_ptr<Allocation>> allocate(const ResourceCounts& requirement,
                                                 std::stop_token stop = {});

    [[nodiscard]] ResourceCounts available() const;
    [[nodiscard]] ResourceCounts used() const;
    [[nodiscard]] ResourceCounts total() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    ResourceCounts available_;
    ResourceCounts used_;
};

}  // namespace taskpipe
