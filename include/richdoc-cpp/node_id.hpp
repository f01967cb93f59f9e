/// @file node_id.hpp
/// @brief Caller-supplied node id generation.

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace richdoc_cpp {

/// A source of node ids. Each call must return an id that is unique within
/// every document the generated nodes will be placed in.
///
/// The library keeps no process-wide counter: callers own the generator and
/// pass it wherever new nodes are built, which keeps id assignment
/// deterministic and testable.
using NodeIdGenerator = std::function<std::string()>;

/// Deterministic generator producing `prefix-0`, `prefix-1`, ...
///
/// @code
/// auto ids = SequentialNodeIds{"node"};
/// auto a = ids();  // "node-0"
/// auto b = ids();  // "node-1"
/// @endcode
class SequentialNodeIds {
public:
    explicit SequentialNodeIds(std::string prefix = "node", std::uint64_t first = 0)
        : prefix_{std::move(prefix)}, next_{first} {}

    auto operator()() -> std::string {
        return prefix_ + "-" + std::to_string(next_++);
    }

    /// The number that the next id will carry.
    auto peek() const -> std::uint64_t { return next_; }

private:
    std::string prefix_;
    std::uint64_t next_;
};

}  // namespace richdoc_cpp
