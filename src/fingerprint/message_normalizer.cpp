/// @file message_normalizer.cpp
/// @brief Message normalization passes

#include "fingerprint/message_normalizer.h"

#include <regex>

namespace axonsentry::fingerprint {

namespace {

const std::regex& UuidPattern() {
    static const std::regex pattern(
        "[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}");
    return pattern;
}

const std::regex& NumberPattern() {
    static const std::regex pattern(R"(\b\d+(\.\d+)?\b)");
    return pattern;
}

// Collapses each "..." span to {string}, pairing quotes left to right.
// Equivalent to replacing "[^"]*" but linear, so spans of any length are
// safe. Unpaired trailing quotes are kept.
std::string ReplaceQuotedSpans(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t open = text.find('"', pos);
        if (open == std::string_view::npos) {
            break;
        }
        const size_t close = text.find('"', open + 1);
        if (close == std::string_view::npos) {
            break;
        }
        out.append(text.substr(pos, open - pos));
        out.append("{string}");
        pos = close + 1;
    }
    out.append(text.substr(pos));
    return out;
}

// Cut at most max_bytes without splitting a UTF-8 sequence.
std::string_view CapBytes(std::string_view text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

}  // namespace

std::string NormalizeMessage(std::string_view message) {
    if (message.empty()) {
        return std::string();
    }

    // Same result as collapsing quotes last: '"', '{', '}' are non-word and
    // non-hex. std::regex recurses per matched char, so its input is capped.
    const std::string collapsed = ReplaceQuotedSpans(message);
    std::string normalized(CapBytes(collapsed, kMaxRegexInputBytes));
    normalized = std::regex_replace(normalized, UuidPattern(), "{uuid}");
    normalized = std::regex_replace(normalized, NumberPattern(), "{number}");

    return TruncateUtf8(normalized, kMaxNormalizedMessageLength);
}

std::string TruncateUtf8(std::string_view text, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        // Continuation bytes (10xxxxxx) belong to the preceding character.
        const bool starts_char = (static_cast<unsigned char>(text[i]) & 0xC0) != 0x80;
        if (starts_char) {
            if (chars == max_chars) {
                return std::string(text.substr(0, i));
            }
            ++chars;
        }
    }
    return std::string(text);
}

}  // namespace axonsentry::fingerprint
