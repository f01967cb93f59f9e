/// @file value.hpp
/// @brief Value types: ScalarValue, Metadata, and the Null tag.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace richdoc_cpp {

/// Represents an absent value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A closed set of primitive values carried by attributions and node
/// metadata.
///
/// Alternatives: Null, bool, int64_t, double, string.
using ScalarValue = std::variant<
    Null,
    bool,
    std::int64_t,
    double,
    std::string
>;

/// Extensible per-node properties (block hints, renderer options, ...).
///
/// Nodes are values, so a node's metadata can only change by deriving a new
/// node with DocumentNode::with_metadata().
using Metadata = std::map<std::string, ScalarValue>;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { std::printf("%s\n", s.c_str()); },
///     [](std::int64_t i) { std::printf("%lld\n", static_cast<long long>(i)); },
///     [](auto&&) { std::printf("other\n"); },
/// }, some_variant);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed scalar extraction helpers ------------------------------------------

/// Extract a typed scalar, or nullopt on type mismatch.
/// @code
/// auto url = get_scalar<std::string>(attribution.value);
/// @endcode
template <typename T>
auto get_scalar(const ScalarValue& v) -> std::optional<T> {
    if (const auto* t = std::get_if<T>(&v)) {
        return *t;
    }
    return std::nullopt;
}

/// Look up a metadata key and extract it as T.
template <typename T>
auto get_scalar(const Metadata& metadata, std::string_view key) -> std::optional<T> {
    auto it = metadata.find(std::string{key});
    if (it == metadata.end()) return std::nullopt;
    return get_scalar<T>(it->second);
}

/// Render a scalar for diagnostics (strings are quoted).
auto to_string(const ScalarValue& value) -> std::string;

/// Render a metadata map as `{key: value, ...}`.
auto to_string(const Metadata& metadata) -> std::string;

namespace detail {

// boost::hash_combine mixing step.
inline void hash_combine(std::size_t& seed, std::size_t h) noexcept {
    seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

}  // namespace detail

}  // namespace richdoc_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<richdoc_cpp::ScalarValue> {
    auto operator()(const richdoc_cpp::ScalarValue& v) const noexcept -> std::size_t {
        auto h = std::visit([](const auto& x) -> std::size_t {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, richdoc_cpp::Null>) {
                return 0;
            } else {
                return std::hash<T>{}(x);
            }
        }, v);
        richdoc_cpp::detail::hash_combine(h, v.index());
        return h;
    }
};

template <>
struct std::hash<richdoc_cpp::Metadata> {
    auto operator()(const richdoc_cpp::Metadata& m) const noexcept -> std::size_t {
        auto seed = m.size();
        for (const auto& [key, value] : m) {
            richdoc_cpp::detail::hash_combine(seed, std::hash<std::string>{}(key));
            richdoc_cpp::detail::hash_combine(seed, std::hash<richdoc_cpp::ScalarValue>{}(value));
        }
        return seed;
    }
};

/// @endcond
