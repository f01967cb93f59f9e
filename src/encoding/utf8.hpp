#pragma once

// UTF-8 <-> code point conversion for AttributedText, on top of utf8proc.
// Text is stored as code points so that offsets count characters, not bytes.
// Internal header — not installed.

#include <utf8proc.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace richdoc_cpp::encoding {

inline constexpr char32_t replacement_char = 0xFFFD;

// -- Encode -------------------------------------------------------------------

// Append the UTF-8 encoding of one code point to output.
// Surrogates and values above U+10FFFF are written as U+FFFD.
inline void encode_utf8(char32_t cp, std::string& output) {
    auto value = static_cast<utf8proc_int32_t>(cp);
    if (cp > 0x10FFFF || !utf8proc_codepoint_valid(value)) {
        value = static_cast<utf8proc_int32_t>(replacement_char);
    }

    utf8proc_uint8_t buffer[4];
    const auto written = utf8proc_encode_char(value, buffer);
    output.append(reinterpret_cast<const char*>(buffer), static_cast<std::size_t>(written));
}

// Encode a code point string as UTF-8.
inline auto encode_utf8(std::u32string_view text) -> std::string {
    auto result = std::string{};
    result.reserve(text.size());
    for (auto cp : text) {
        encode_utf8(cp, result);
    }
    return result;
}

// -- Decode -------------------------------------------------------------------

// Decode UTF-8 into code points. Each byte utf8proc cannot start a valid
// sequence at becomes U+FFFD, and decoding resumes at the next byte.
inline auto decode_utf8(std::string_view input) -> std::u32string {
    auto result = std::u32string{};
    result.reserve(input.size());

    const auto* bytes = reinterpret_cast<const utf8proc_uint8_t*>(input.data());
    auto pos = std::size_t{0};
    while (pos < input.size()) {
        auto cp = utf8proc_int32_t{-1};
        const auto read = utf8proc_iterate(bytes + pos,
                                           static_cast<utf8proc_ssize_t>(input.size() - pos), &cp);
        if (read <= 0 || cp < 0) {
            result.push_back(replacement_char);
            ++pos;
            continue;
        }
        result.push_back(static_cast<char32_t>(cp));
        pos += static_cast<std::size_t>(read);
    }

    return result;
}

}  // namespace richdoc_cpp::encoding
