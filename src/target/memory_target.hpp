/**
 * @file memory_target.hpp
 * @brief In-memory target: a single-assignment value slot.
 */

#pragma once

#include "core/result.hpp"
#include "target/target.hpp"

#include <any>
#include <mutex>
#include <string>
#include <typeinfo>

namespace taskpipe {

/**
 * @brief Thread-safe slot holding one value of any type.
 *
 * The slot can be set once, read any number of times and erased once. A
 * memory target never reports existence: its value does not outlive the
 * process, so the producing task always runs.
 */
class MemoryTarget final : public Target {
public:
    MemoryTarget() = default;

    [[nodiscard]] bool exists() const override { return false; }
    [[nodiscard]] std::string describe() const override;

    Result<void> set(std::any value);

    template <typename T>
    [[nodiscard]] Result<T> get() const {
        std::lock_guard lock(mutex_);
        if (!value_.has_value()) {
            return Error{ErrorKind::Target, "memory target read before it was set"};
        }
        if (const T* typed = std::any_cast<T>(&value_)) {
            return *typed;
        }
        return Error{ErrorKind::Target,
                     std::string{"memory target holds "} + value_.type().name()
                     + ", requested " + typeid(T).name()};
    }

    Result<void> erase();

    [[nodiscard]] bool has_value() const;

private:
    mutable std::mutex mutex_;
    std::any value_;
};

}  // namespace taskpipe
