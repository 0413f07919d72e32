#pragma once
/**
 * @file common/utf8.hpp
 * @brief Minimal UTF-8 helpers shared by the sender and layout code.
 */

#include <string>
#include <string_view>

namespace kbtap::io::detail {

inline constexpr char32_t kReplacementCharacter = 0xFFFD;

/// Decode UTF-8 into code points. Malformed sequences decode to U+FFFD.
std::u32string decodeUtf8(std::string_view text);

/// Encode one code point as UTF-8.
std::string encodeUtf8(char32_t codepoint);

} // namespace kbtap::io::detail
