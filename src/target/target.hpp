/**
 * @file target.hpp
 * @brief Target contract: an addressable artifact produced by a task.
 *
 * The scheduler only ever asks a target whether it exists. Richer behavior
 * (reading, atomic writes, in-memory slots) belongs to the concrete target
 * types.
 */

#pragma once

#include <memory>
#include <ostream>
#include <string>

namespace taskpipe {

class Target {
public:
    virtual ~Target() = default;

    [[nodiscard]] virtual bool exists() const = 0;
    [[nodiscard]] virtual std::string describe() const = 0;
};

using TargetPtr = std::shared_ptr<Target>;

/**
 * @brief Target of tasks that produce nothing. Never exists, so such tasks
 *        always run unless they override done().
 */
class NoTarget final : public Target {
public:
    [[nodiscard]] bool exists() const override { return false; }
    [[nodiscard]] std::string describe() const override { return "NoTarget"; }
};

inline std::ostream& operator<<(std::ostream& os, const Target& target) {
    return os << target.describe();
}

}  // namespace taskpipe
