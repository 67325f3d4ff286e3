#include "hamgate/xml_reader.hpp"

#include <charconv>
#include <cstdint>
#include <optional>

namespace hamgate {

namespace {

// Single-pass recursive-descent reader.
//
// Grammar (subset of XML 1.0):
//   document = BOM? misc* element misc*
//   misc     = S | comment | pi
//   element  = '<' name attr* S? ( '/>' | '>' content '</' name S? '>' )
//   content  = ( chardata | reference | cdata | comment | pi | element )*
//   attr     = S name S? '=' S? ( '"' [^<"]* '"' | "'" [^<']* "'" )

class XmlParser {
public:
    explicit XmlParser(std::string_view input) noexcept
        : input_(input), pos_(0) {}

    RootTagResult root_tag() {
        if (auto err = prepare()) {
            return *err;
        }
        if (auto err = skip_misc()) {
            return *err;
        }
        if (at_end() || peek() != '<') {
            return XmlError::NoRootElement;
        }
        ++pos_;  // consume '<'

        auto name = parse_name();
        if (!name) {
            return name.error();
        }

        std::string lowered = std::move(*name);
        for (char& c : lowered) {
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
        }
        return lowered;
    }

    XmlResult document() {
        if (auto err = prepare()) {
            return *err;
        }
        if (auto err = skip_misc()) {
            return *err;
        }
        if (at_end() || peek() != '<') {
            return XmlError::NoRootElement;
        }

        XmlElement root;
        if (auto err = parse_element(root, 1)) {
            return *err;
        }

        // Only whitespace, comments and PIs may follow. Trailing NULs are
        // tolerated: some loggers send fixed-size, zero-padded datagrams.
        while (!at_end()) {
            if (is_space(peek()) || peek() == '\0') {
                ++pos_;
            } else if (starts_with("<!--")) {
                if (auto err = skip_comment()) {
                    return *err;
                }
            } else if (starts_with("<?")) {
                if (auto err = skip_pi()) {
                    return *err;
                }
            } else {
                return XmlError::TrailingContent;
            }
        }

        return root;
    }

private:
    std::string_view input_;
    std::size_t pos_;
    std::size_t element_count_ = 0;

    // Result type for name parsing
    template <typename T>
    struct Result {
        std::optional<T> value;
        XmlError error_reason;

        Result(T v) : value(std::move(v)), error_reason{} {}
        Result(XmlError e) : value(std::nullopt), error_reason(e) {}

        explicit operator bool() const { return value.has_value(); }
        T& operator*() { return *value; }
        XmlError error() const { return error_reason; }
    };

    bool at_end() const noexcept { return pos_ >= input_.size(); }
    char peek() const noexcept { return input_[pos_]; }

    bool starts_with(std::string_view prefix) const noexcept {
        return input_.substr(pos_).starts_with(prefix);
    }

    static bool is_space(char c) noexcept {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }

    static bool is_name_start(char c) noexcept {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               c == '_' || c == ':' || static_cast<unsigned char>(c) >= 0x80;
    }

    static bool is_name_char(char c) noexcept {
        return is_name_start(c) || (c >= '0' && c <= '9') || c == '-' || c == '.';
    }

    void skip_spaces() noexcept {
        while (!at_end() && is_space(peek())) {
            ++pos_;
        }
    }

    std::optional<XmlError> prepare() noexcept {
        if (input_.size() > XmlLimits::kMaxDocumentBytes) {
            return XmlError::InputTooLarge;
        }
        if (input_.starts_with("\xEF\xBB\xBF")) {
            pos_ = 3;
        }
        std::size_t p = pos_;
        while (p < input_.size() && (is_space(input_[p]) || input_[p] == '\0')) {
            ++p;
        }
        if (p >= input_.size()) {
            return XmlError::EmptyInput;
        }
        return std::nullopt;
    }

    // Prolog: whitespace, comments and processing instructions
    std::optional<XmlError> skip_misc() noexcept {
        for (;;) {
            skip_spaces();
            if (starts_with("<?")) {
                if (auto err = skip_pi()) {
                    return err;
                }
            } else if (starts_with("<!--")) {
                if (auto err = skip_comment()) {
                    return err;
                }
            } else if (starts_with("<!")) {
                return XmlError::UnsupportedDoctype;
            } else {
                return std::nullopt;
            }
        }
    }

    std::optional<XmlError> skip_until(std::string_view terminator) noexcept {
        auto end = input_.find(terminator, pos_);
        if (end == std::string_view::npos) {
            pos_ = input_.size();
            return XmlError::UnexpectedEnd;
        }
        pos_ = end + terminator.size();
        return std::nullopt;
    }

    std::optional<XmlError> skip_comment() noexcept {
        pos_ += 4;  // "<!--"
        return skip_until("-->");
    }

    std::optional<XmlError> skip_pi() noexcept {
        pos_ += 2;  // "<?"
        return skip_until("?>");
    }

    Result<std::string> parse_name() {
        if (at_end()) {
            return XmlError::UnexpectedEnd;
        }
        if (!is_name_start(peek())) {
            return XmlError::InvalidName;
        }

        std::size_t start = pos_;
        while (!at_end() && is_name_char(peek())) {
            ++pos_;
        }
        if (pos_ - start > XmlLimits::kMaxNameLen) {
            return XmlError::InvalidName;
        }
        return std::string(input_.substr(start, pos_ - start));
    }

    static void append_utf8(std::string& out, std::uint32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    // At '&': resolve one reference into `out`
    std::optional<XmlError> append_reference(std::string& out) {
        constexpr std::size_t kMaxReferenceLen = 12;  // "&#x10FFFF;" plus slack

        auto semi = input_.find(';', pos_);
        if (semi == std::string_view::npos || semi - pos_ > kMaxReferenceLen) {
            return XmlError::InvalidEntity;
        }
        std::string_view ref = input_.substr(pos_ + 1, semi - pos_ - 1);
        pos_ = semi + 1;

        if (ref == "lt")   { out.push_back('<');  return std::nullopt; }
        if (ref == "gt")   { out.push_back('>');  return std::nullopt; }
        if (ref == "amp")  { out.push_back('&');  return std::nullopt; }
        if (ref == "quot") { out.push_back('"');  return std::nullopt; }
        if (ref == "apos") { out.push_back('\''); return std::nullopt; }

        if (ref.size() < 2 || ref[0] != '#') {
            return XmlError::InvalidEntity;
        }

        int base = 10;
        std::string_view digits = ref.substr(1);
        if (digits[0] == 'x' || digits[0] == 'X') {
            base = 16;
            digits = digits.substr(1);
        }
        if (digits.empty()) {
            return XmlError::InvalidEntity;
        }

        std::uint32_t cp = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), cp, base);
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
            return XmlError::InvalidEntity;
        }
        if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return XmlError::InvalidEntity;
        }

        append_utf8(out, cp);
        return std::nullopt;
    }

    std::optional<XmlError> parse_attribute_value(std::string& out) {
        if (at_end()) {
            return XmlError::UnexpectedEnd;
        }
        const char quote = peek();
        if (quote != '"' && quote != '\'') {
            return XmlError::InvalidAttribute;
        }
        ++pos_;

        while (!at_end()) {
            char c = peek();
            if (c == quote) {
                ++pos_;
                return std::nullopt;
            }
            if (c == '<') {
                return XmlError::InvalidAttribute;
            }
            if (c == '&') {
                if (auto err = append_reference(out)) {
                    return err;
                }
                continue;
            }
            out.push_back(c);
            ++pos_;
        }
        return XmlError::UnexpectedEnd;
    }

    // At '<' of a start tag
    std::optional<XmlError> parse_element(XmlElement& out, std::size_t depth) {
        if (depth > XmlLimits::kMaxDepth) {
            return XmlError::TooDeep;
        }
        if (++element_count_ > XmlLimits::kMaxElements) {
            return XmlError::TooManyElements;
        }

        ++pos_;  // consume '<'
        auto name = parse_name();
        if (!name) {
            return name.error();
        }
        out.name = std::move(*name);

        // Attributes
        for (;;) {
            const std::size_t before = pos_;
            skip_spaces();
            if (at_end()) {
                return XmlError::UnexpectedEnd;
            }
            if (peek() == '/') {
                ++pos_;
                if (at_end()) {
                    return XmlError::UnexpectedEnd;
                }
                if (peek() != '>') {
                    return XmlError::InvalidName;
                }
                ++pos_;
                return std::nullopt;  // <name ... />
            }
            if (peek() == '>') {
                ++pos_;
                break;
            }
            if (pos_ == before) {
                return XmlError::InvalidAttribute;  // attributes need separating whitespace
            }

            if (out.attributes.size() >= XmlLimits::kMaxAttributes) {
                return XmlError::TooManyAttributes;
            }

            auto attr_name = parse_name();
            if (!attr_name) {
                return attr_name.error();
            }
            if (out.attribute(*attr_name)) {
                return XmlError::DuplicateAttribute;
            }

            skip_spaces();
            if (at_end() || peek() != '=') {
                return XmlError::InvalidAttribute;
            }
            ++pos_;
            skip_spaces();

            XmlAttribute attr;
            attr.name = std::move(*attr_name);
            if (auto err = parse_attribute_value(attr.value)) {
                return err;
            }
            out.attributes.push_back(std::move(attr));
        }

        // Content
        for (;;) {
            if (at_end()) {
                return XmlError::UnexpectedEnd;
            }

            const char c = peek();
            if (c == '&') {
                if (auto err = append_reference(out.text)) {
                    return err;
                }
                continue;
            }
            if (c != '<') {
                out.text.push_back(c);
                ++pos_;
                continue;
            }

            if (starts_with("</")) {
                pos_ += 2;
                auto closing = parse_name();
                if (!closing) {
                    return closing.error();
                }
                if (*closing != out.name) {
                    return XmlError::MismatchedTag;
                }
                skip_spaces();
                if (at_end()) {
                    return XmlError::UnexpectedEnd;
                }
                if (peek() != '>') {
                    return XmlError::InvalidName;
                }
                ++pos_;
                return std::nullopt;
            }

            if (starts_with("<![CDATA[")) {
                pos_ += 9;
                auto end = input_.find("]]>", pos_);
                if (end == std::string_view::npos) {
                    return XmlError::UnexpectedEnd;
                }
                out.text.append(input_.substr(pos_, end - pos_));
                pos_ = end + 3;
            } else if (starts_with("<!--")) {
                if (auto err = skip_comment()) {
                    return err;
                }
            } else if (starts_with("<?")) {
                if (auto err = skip_pi()) {
                    return err;
                }
            } else if (starts_with("<!")) {
                return XmlError::UnsupportedDoctype;
            } else {
                out.children.emplace_back();
                if (auto err = parse_element(out.children.back(), depth + 1)) {
                    return err;
                }
            }
        }
    }
};

std::string_view as_chars(std::span<const std::byte> input) noexcept {
    return {reinterpret_cast<const char*>(input.data()), input.size()};
}

}  // namespace

const XmlElement* XmlElement::child(std::string_view child_name) const noexcept {
    for (const auto& c : children) {
        if (c.name == child_name) {
            return &c;
        }
    }
    return nullptr;
}

std::optional<std::string_view> XmlElement::attribute(std::string_view attr_name) const noexcept {
    for (const auto& a : attributes) {
        if (a.name == attr_name) {
            return std::string_view(a.value);
        }
    }
    return std::nullopt;
}

RootTagResult read_root_tag(std::span<const std::byte> input) {
    return read_root_tag(as_chars(input));
}

RootTagResult read_root_tag(std::string_view input) {
    XmlParser parser(input);
    return parser.root_tag();
}

XmlResult parse_xml(std::span<const std::byte> input) {
    return parse_xml(as_chars(input));
}

XmlResult parse_xml(std::string_view input) {
    XmlParser parser(input);
    return parser.document();
}

}  // namespace hamgate
