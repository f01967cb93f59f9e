/// @file attribution.hpp
/// @brief Attribution type for rich text annotations.

#pragma once

#include <richdoc-cpp/value.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace richdoc_cpp {

/// A named tag applied to a range of an AttributedText.
///
/// Attributions annotate ranges with a style or semantic meaning
/// (e.g. "bold", "italics", "link"). The `id` names the kind of
/// attribution and the optional `value` parameterises it, so two links to
/// different URLs share the id "link" but are distinct attributions.
///
/// Equality is structural over both fields. can_merge_with() decides
/// whether two spans may coalesce; span normalisation requires it to be an
/// equivalence relation (reflexive, symmetric, transitive).
struct Attribution {
    std::string id;             ///< The attribution kind (e.g. "bold", "link").
    ScalarValue value{Null{}};  ///< Kind-specific payload (e.g. a link URL).

    /// Whether spans carrying this and `other` may be collapsed into one.
    auto can_merge_with(const Attribution& other) const -> bool {
        return *this == other;
    }

    auto operator<=>(const Attribution&) const = default;
    auto operator==(const Attribution&) const -> bool = default;
};

/// Built-in attributions for common inline styles.
namespace attributions {

/// A value-less attribution identified only by `id`.
inline auto named(std::string id) -> Attribution {
    return Attribution{.id = std::move(id), .value = Null{}};
}

inline auto bold() -> Attribution { return named("bold"); }
inline auto italics() -> Attribution { return named("italics"); }
inline auto underline() -> Attribution { return named("underline"); }
inline auto strikethrough() -> Attribution { return named("strikethrough"); }
inline auto code() -> Attribution { return named("code"); }

/// A hyperlink to `url`. Links to different URLs never merge.
inline auto link(std::string url) -> Attribution {
    return Attribution{.id = "link", .value = std::move(url)};
}

}  // namespace attributions

/// Render as `bold` or `link(https://...)`.
auto to_string(const Attribution& attribution) -> std::string;

}  // namespace richdoc_cpp

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<richdoc_cpp::Attribution> {
    auto operator()(const richdoc_cpp::Attribution& a) const noexcept -> std::size_t {
        auto h = std::hash<std::string>{}(a.id);
        richdoc_cpp::detail::hash_combine(h, std::hash<richdoc_cpp::ScalarValue>{}(a.value));
        return h;
    }
};

/// @endcond
