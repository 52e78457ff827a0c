/**
 * @file stock_tasks.hpp
 * @brief Ready-made task kinds: external inputs and in-memory results.
 */

#pragma once

#include "target/local_target.hpp"
#include "target/memory_target.hpp"
#include "task/task.hpp"

#include <any>
#include <memory>
#include <string>
#include <stdexcept>
#include <tuple>

namespace taskpipe {

/**
 * @brief A file produced outside the pipeline.
 *
 * Done whenever the file exists. Being asked to run means the input is
 * missing, which fails the task and skips everything downstream.
 */
class ExternalTask final : public ValueTask<ExternalTask> {
public:
    static constexpr std::string_view kName = "ExternalTask";

    explicit ExternalTask(std::string path) : path_(std::move(path)) {}

    [[nodiscard]] auto fields() const { return std::tie(path_); }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    [[nodiscard]] TargetPtr output() const override;
    void run(const Inputs& inputs, const RunContext& ctx) const override;

private:
    std::string path_;
};

/**
 * @brief Base for tasks whose result lives in memory.
 *
 * Every instance owns its own MemoryTarget slot; the slot is not a declared
 * field, so equal records still collapse to a single node and dependents
 * read the slot of the instance the graph kept. Cleanup erases the slot.
 */
template <typename Derived>
class MemoryTask : public ValueTask<Derived> {
public:
    [[nodiscard]] TargetPtr output() const override { return memory_; }

    [[nodiscard]] bool has_cleanup() const noexcept override { return true; }

    void cleanup(const RunContext& /*ctx*/) const override {
        memory_->erase().value();
    }

    [[nodiscard]] const std::shared_ptr<MemoryTarget>& memory() const noexcept {
        return memory_;
    }

    template <typename T>
    [[nodiscard]] Result<T> get() const { return memory_->get<T>(); }

    Result<void> set(std::any value) const { return memory_->set(std::move(value)); }

private:
    std::shared_ptr<MemoryTarget> memory_ = std::make_shared<MemoryTarget>();
};

/// Value stored in a MemoryTarget input, or the error as an exception.
template <typename T>
[[nodiscard]] T memory_input(const TargetPtr& input) {
    auto memory = std::dynamic_pointer_cast<MemoryTarget>(input);
    if (!memory) {
        throw std::runtime_error("input " + (input ? input->describe() : std::string{"<null>"})
                                 + " is not a memory target");
    }
    return memory->get<T>().value();
}

}  // namespace taskpipe
