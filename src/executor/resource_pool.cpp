/**
 * @file resource_pool.cpp
 * @brief ResourcePool and Allocation implementation.
 */

#include "executor/resource_pool.hpp"

#include <sstream>

namespace taskpipe {

namespace {

int64_t count_of(const ResourceCounts& counts, const std::string& name) {
    auto it = counts.find(name);
    return it == counts.end() ? 0 : it->second;
}

void add_to(ResourceCounts& into, const ResourceCounts& delta) {
    for (const auto& [name, n] : delta) into[name] += n;
}

void subtract_from(ResourceCounts& from, const ResourceCounts& delta) {
    for (const auto& [name, n] : delta) {
        from[name] -= n;
        if (from[name] == 0) from.erase(name);
    }
}

bool has_negative(const ResourceCounts& counts) {
    for (const auto& [_, n] : counts) {
        if (n < 0) return true;
    }
    return false;
}

}  // namespace

bool fits_within(const ResourceCounts& a, const ResourceCounts& b) {
    for (const auto& [name, n] : a) {
        if (n > count_of(b, name)) return false;
    }
    return true;
}

std::string to_string(const ResourceCounts& counts) {
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (const auto& [name, n] : counts) {
        oss << (first ? "" : ", ") << name << '=' << n;
        first = false;
    }
    oss << '}';
    return oss.str();
}

// ── ResourcePool ─────────────────────────────

ResourcePool::ResourcePool(ResourceCounts available) : available_(std::move(available)) {}

Result<ResourceCounts> ResourcePool::request(const ResourceCounts& requirement,
                                             std::stop_token stop) {
    if (has_negative(requirement)) {
        return Error{ErrorKind::Resource, "negative resource request " + to_string(requirement)};
    }

    std::unique_lock lock(mutex_);
    ResourceCounts total = available_;
    add_to(total, used_);
    if (!fits_within(requirement, total)) {
        return Error{ErrorKind::Resource, "requested incompatible resources: "
                     + to_string(requirement) + " exceeds " + to_string(total)};
    }

    if (!cv_.wait(lock, stop, [&] { return fits_within(requirement, available_); })) {
        return Error{ErrorKind::Cancelled,
                     "resource request " + to_string(requirement) + " cancelled"};
    }

    add_to(used_, requirement);
    subtract_from(available_, requirement);
    return requirement;
}

Result<void> ResourcePool::release(const ResourceCounts& resources) {
    if (has_negative(resources)) {
        return Error{ErrorKind::Resource, "negative resource release " + to_string(resources)};
    }
    {
        std::lock_guard lock(mutex_);
        if (!fits_within(resources, used_)) {
            return Error{ErrorKind::Resource, "returning resources not in use: "
                         + to_string(resources) + " exceeds " + to_string(used_)};
        }
        subtract_from(used_, resources);
        add_to(available_, resources);
    }
    cv_.notify_all();
    return {};
}

void ResourcePool::add(const ResourceCounts& resources) {
    {
        std::lock_guard lock(mutex_);
        add_to(available_, resources);
    }
    cv_.notify_all();
}

Result<std::unique_ptr<Allocation>> ResourcePool::allocate(const ResourceCounts& requirement,
                                                           std::stop_token stop) {
    auto granted = request(requirement, std::move(stop));
    if (!granted) return granted.error();
    return std::make_unique<Allocation>(*this, std::move(*granted));
}

ResourceCounts ResourcePool::available() const {
    std::lock_guard lock(mutex_);
    return available_;
}

ResourceCounts ResourcePool::used() const {
    std::lock_guard lock(mutex_);
    return used_;
}

ResourceCounts ResourcePool::total() const {
    std::lock_guard lock(mutex_);
    ResourceCounts out = available_;
    add_to(out, used_);
    return out;
}

// ── Allocation ───────────────────────────────

Allocation::Allocation(ResourcePool& pool, ResourceCounts acquired)
    : pool_(pool), acquired_(std::move(acquired)) {}

Allocation::~Allocation() {
    // Everything in acquired_ was granted by pool_, so this cannot fail.
    (void)release_all();
}

Result<void> Allocation::request(const ResourceCounts& more, std::stop_token stop) {
    auto granted = pool_.request(more, std::move(stop));
    if (!granted) return granted.error();
    add_to(acquired_, *granted);
    return {};
}

Result<void> Allocation::release(const ResourceCounts& part) {
    if (!fits_within(part, acquired_)) {
        return Error{ErrorKind::Resource, "releasing " + to_string(part)
                     + " not held by allocation " + to_string(acquired_)};
    }
    auto returned = pool_.release(part);
    if (!returned) return returned;
    subtract_from(acquired_, part);
    return {};
}

Result<void> Allocation::release_all() {
    if (acquired_.empty()) return {};
    auto all = acquired_;
    return release(all);
}

}  // namespace taskpipe
