/**
 * @file run_options.hpp
 * @brief Open-ended bag of named options forwarded to every task invocation.
 *
 * The scheduler never inspects these values. Callers use them to inject an
 * executor, a resource pool, credentials or limits into task bodies.
 */

#pragma once

#include "core/result.hpp"

#include <any>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace taskpipe {

class RunOptions {
public:
    RunOptions() = default;

    /// Insert or replace an option.
    template <typename T>
    RunOptions& set(std::string name, T value) {
        values_[std::move(name)] = std::any(std::move(value));
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& name) const {
        return values_.find(name) != values_.end();
    }

    /// Pointer to the stored value, nullptr when missing or of another type.
    template <typename T>
    [[nodiscard]] const T* find(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) return nullptr;
        return std::any_cast<T>(&it->second);
    }

    template <typename T>
    [[nodiscard]] Result<T> get(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) {
            return Error{ErrorKind::Config, "missing run option '" + name + "'"};
        }
        if (const T* value = std::any_cast<T>(&it->second)) {
            return *value;
        }
        return Error{ErrorKind::Config, "run option '" + name + "' has another type"};
    }

    template <typename T>
    [[nodiscard]] T get_or(const std::string& name, T fallback) const {
        if (const T* value = find<T>(name)) return *value;
        return fallback;
    }

    [[nodiscard]] std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(values_.size());
        for (const auto& [name, _] : values_) out.push_back(name);
        return out;
    }

    [[nodiscard]] size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

private:
    std::map<std::string, std::any> values_;
};

/// Option name under which the default start_run looks for a WorkerPool.
inline constexpr const char* kExecutorOption = "executor";

/// Option name conventionally used for a shared ResourcePool.
inline constexpr const char* kResourcesOption = "resources";

}  // namespace taskpipe
