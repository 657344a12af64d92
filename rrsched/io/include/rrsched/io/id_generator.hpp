#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

namespace rrsched::io {

/// @brief Thread-safe source of sequential task ids (`"task-1"`, `"task-2"`, ...).
/// @ingroup io
class IdGenerator {
public:
    explicit IdGenerator(std::string prefix = "task-")
        : prefix_(std::move(prefix)) {}

    [[nodiscard]] std::string next() { return prefix_ + std::to_string(++counter_); }

private:
    std::string prefix_;
    std::atomic<uint64_t> counter_{0};
};

} // namespace rrsched::io
