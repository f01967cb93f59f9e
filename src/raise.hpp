#pragma once

// Internal header — not installed. Report a failed call: log it, then throw.

#include <richdoc-cpp/error.hpp>

#include <plog/Log.h>

#include <string>
#include <utility>

namespace richdoc_cpp::detail {

[[noreturn]] inline void raise(ErrorKind kind, std::string message) {
    PLOGW << std::string{to_string_view(kind)} << ": " << message;
    throw Exception{kind, std::move(message)};
}

}  // namespace richdoc_cpp::detail
