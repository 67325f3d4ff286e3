#pragma once

#include "hamgate/messages.hpp"
#include "hamgate/xml_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <variant>

namespace hamgate {

// ============================================================================
// Payload decoding: XML element tree -> typed Message.
//
// Rules:
// - Child elements are matched by exact name; unknown ones are ignored.
// - A missing or empty element keeps the member default.
// - Numeric, boolean and timestamp text that is present but unparsable
//   fails the whole decode.
// - Doubles accept ',' as the decimal separator.
// - Booleans accept true/false/1/0 in any case.
// ============================================================================

enum class DecodeError : std::uint8_t {
    MalformedXml,       // see DecodeFailure::xml_error
    InvalidInteger,
    InvalidNumber,
    InvalidBoolean,
    InvalidTimestamp,
};

constexpr std::string_view to_string(DecodeError e) noexcept {
    switch (e) {
        case DecodeError::MalformedXml:     return "malformed xml";
        case DecodeError::InvalidInteger:   return "invalid integer";
        case DecodeError::InvalidNumber:    return "invalid number";
        case DecodeError::InvalidBoolean:   return "invalid boolean";
        case DecodeError::InvalidTimestamp: return "invalid timestamp";
    }
    return "unknown";
}

struct DecodeFailure {
    DecodeError error;
    std::string_view field;              // offending element name (static storage); empty for MalformedXml
    XmlError xml_error = XmlError::EmptyInput;  // meaningful for MalformedXml only
};

using DecodeResult = std::variant<Message, DecodeFailure>;

// Decode an already-parsed root element as `kind`.
// The root's own name is not checked; the caller resolved it.
DecodeResult decode_message(PayloadKind kind, const XmlElement& root);

// Parse and decode in one step
DecodeResult decode_message(PayloadKind kind, std::span<const std::byte> payload);
DecodeResult decode_message(PayloadKind kind, std::string_view payload);

}  // namespace hamgate
