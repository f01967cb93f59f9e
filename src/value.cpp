#include <richdoc-cpp/attribution.hpp>
#include <richdoc-cpp/value.hpp>

#include <cstdio>
#include <string>

namespace richdoc_cpp {

auto to_string(const ScalarValue& value) -> std::string {
    return std::visit(overload{
        [](Null) -> std::string { return "null"; },
        [](bool b) -> std::string { return b ? "true" : "false"; },
        [](std::int64_t i) -> std::string { return std::to_string(i); },
        [](double d) -> std::string {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%g", d);
            return buf;
        },
        [](const std::string& s) -> std::string { return "\"" + s + "\""; },
    }, value);
}

auto to_string(const Metadata& metadata) -> std::string {
    auto out = std::string{"{"};
    auto first = true;
    for (const auto& [key, value] : metadata) {
        if (!first) out += ", ";
        first = false;
        out += key + ": " + to_string(value);
    }
    out += "}";
    return out;
}

auto to_string(const Attribution& attribution) -> std::string {
    if (std::holds_alternative<Null>(attribution.value)) {
        return attribution.id;
    }
    if (const auto* s = std::get_if<std::string>(&attribution.value)) {
        return attribution.id + "(" + *s + ")";
    }
    return attribution.id + "(" + to_string(attribution.value) + ")";
}

}  // namespace richdoc_cpp
