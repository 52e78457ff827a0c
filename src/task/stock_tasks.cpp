/**
 * @file stock_tasks.cpp
 * @brief ExternalTask implementation.
 */

#include "task/stock_tasks.hpp"

#include <stdexcept>

namespace taskpipe {

TargetPtr ExternalTask::output() const {
    return std::make_shared<LocalTarget>(path_);
}

void ExternalTask::run(const Inputs& /*inputs*/, const RunContext& /*ctx*/) const {
    throw std::runtime_error("external input " + path_ + " does not exist");
}

}  // namespace taskpipe
