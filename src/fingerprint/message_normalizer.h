#pragma once

/// @file message_normalizer.h
/// @brief Rewrites error messages into stable grouping patterns

#include <cstddef>
#include <string>
#include <string_view>

namespace axonsentry::fingerprint {

/// Maximum length of a normalized message, in characters
inline constexpr size_t kMaxNormalizedMessageLength = 100;

/// Bytes of message text handed to the regex passes
inline constexpr size_t kMaxRegexInputBytes = 4096;

/// Normalize an error message by removing variable parts
///
/// Passes run in order on the current string:
/// 1. UUIDs (8-4-4-4-12 hex)      -> "{uuid}"
/// 2. integers and decimals       -> "{number}"
/// 3. double-quoted substrings    -> "{string}"
/// The result is then cut to kMaxNormalizedMessageLength characters
/// without splitting a UTF-8 sequence. Quoted spans are collapsed with a
/// linear scan over the whole message; the UUID and number passes see at
/// most kMaxRegexInputBytes of what remains.
///
/// Examples:
/// - "Account 123 not found" -> "Account {number} not found"
/// - "User \"bob\" invalid"  -> "User {string} invalid"
///
/// @throws std::regex_error if the regex engine gives up on the input
std::string NormalizeMessage(std::string_view message);

/// Cut `text` after `max_chars` UTF-8 characters
std::string TruncateUtf8(std::string_view text, size_t max_chars);

}  // namespace axonsentry::fingerprint
