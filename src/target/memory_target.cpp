/**
 * @file memory_target.cpp
 * @brief MemoryTarget implementation.
 */

#include "target/memory_target.hpp"

#include <sstream>

namespace taskpipe {

std::string MemoryTarget::describe() const {
    std::ostringstream oss;
    oss << "MemoryTarget@" << static_cast<const void*>(this);
    return oss.str();
}

Result<void> MemoryTarget::set(std::any value) {
    std::lock_guard lock(mutex_);
    if (value_.has_value()) {
        return Error{ErrorKind::Target, "memory target set twice"};
    }
    value_ = std::move(value);
    return {};
}

Result<void> MemoryTarget::erase() {
    std::lock_guard lock(mutex_);
    if (!value_.has_value()) {
        return Error{ErrorKind::Target, "memory target erased while unset"};
    }
    value_.reset();
    return {};
}

bool MemoryTarget::has_value() const {
    std::lock_guard lock(mutex_);
    return value_.has_value();
}

}  // namespace taskpipe
