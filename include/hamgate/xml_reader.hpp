#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hamgate {

// ============================================================================
// Bounded XML reader for logger status messages.
//
// Supports the subset loggers actually emit: prolog (XML declaration,
// processing instructions, comments), elements, attributes, text, CDATA and
// the predefined/numeric character references. DOCTYPE declarations are
// rejected outright, so no entity expansion can occur.
//
// Invariants enforced:
// 1. Memory: document size, depth, element and attribute counts are capped.
// 2. CPU: single pass, no backtracking.
// ============================================================================

struct XmlLimits {
    static constexpr std::size_t kMaxDocumentBytes = 1024 * 1024;
    static constexpr std::size_t kMaxDepth = 16;
    static constexpr std::size_t kMaxElements = 2048;
    static constexpr std::size_t kMaxAttributes = 32;   // per element
    static constexpr std::size_t kMaxNameLen = 128;
};

// Drop reasons (explicit enum, never attacker-controlled text)
enum class XmlError : std::uint8_t {
    EmptyInput,          // nothing but whitespace
    InputTooLarge,       // exceeds kMaxDocumentBytes
    NoRootElement,       // prolog not followed by an element
    InvalidName,         // bad element/attribute name
    UnexpectedEnd,       // document ends inside markup
    MismatchedTag,       // </b> closes <a>
    InvalidEntity,       // unknown or malformed character reference
    InvalidAttribute,    // missing '=' or quotes
    DuplicateAttribute,  // same attribute twice on one element
    TooDeep,             // nesting beyond kMaxDepth
    TooManyElements,     // beyond kMaxElements
    TooManyAttributes,   // beyond kMaxAttributes
    UnsupportedDoctype,  // <!DOCTYPE ...>
    TrailingContent,     // markup or text after the root element
};

constexpr std::string_view to_string(XmlError e) noexcept {
    switch (e) {
        case XmlError::EmptyInput:         return "empty input";
        case XmlError::InputTooLarge:      return "input too large";
        case XmlError::NoRootElement:      return "no root element";
        case XmlError::InvalidName:        return "invalid name";
        case XmlError::UnexpectedEnd:      return "unexpected end of document";
        case XmlError::MismatchedTag:      return "mismatched closing tag";
        case XmlError::InvalidEntity:      return "invalid character reference";
        case XmlError::InvalidAttribute:   return "malformed attribute";
        case XmlError::DuplicateAttribute: return "duplicate attribute";
        case XmlError::TooDeep:            return "nesting too deep";
        case XmlError::TooManyElements:    return "too many elements";
        case XmlError::TooManyAttributes:  return "too many attributes";
        case XmlError::UnsupportedDoctype: return "DOCTYPE not supported";
        case XmlError::TrailingContent:    return "content after root element";
    }
    return "unknown";
}

struct XmlAttribute {
    std::string name;
    std::string value;   // references resolved
};

struct XmlElement {
    std::string name;
    std::string text;    // concatenated character data, references resolved
    std::vector<XmlAttribute> attributes;
    std::vector<XmlElement> children;

    // First child with exactly this name, or nullptr
    [[nodiscard]] const XmlElement* child(std::string_view child_name) const noexcept;

    [[nodiscard]] std::optional<std::string_view> attribute(std::string_view attr_name) const noexcept;
};

using XmlResult = std::variant<XmlElement, XmlError>;

// Lower-cased name of the root element
using RootTagResult = std::variant<std::string, XmlError>;

// Read only as far as the root element's name.
// Validates the prolog but nothing after the name.
RootTagResult read_root_tag(std::span<const std::byte> input);
RootTagResult read_root_tag(std::string_view input);

// Parse the whole document into an element tree.
XmlResult parse_xml(std::span<const std::byte> input);
XmlResult parse_xml(std::string_view input);

}  // namespace hamgate
