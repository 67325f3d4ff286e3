#include "hamgate/xml_reader.hpp"

#include <cstdio>
#include <cstdlib>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace {

bool expect_error(std::string_view xml, hamgate::XmlError expected, const char* label) {
    auto result = hamgate::parse_xml(xml);
    const auto* err = std::get_if<hamgate::XmlError>(&result);
    if (!err) {
        std::printf("%s: expected error '%.*s', document parsed\n", label,
                    static_cast<int>(hamgate::to_string(expected).size()),
                    hamgate::to_string(expected).data());
        return false;
    }
    if (*err != expected) {
        std::printf("%s: expected '%.*s', got '%.*s'\n", label,
                    static_cast<int>(hamgate::to_string(expected).size()),
                    hamgate::to_string(expected).data(),
                    static_cast<int>(hamgate::to_string(*err).size()),
                    hamgate::to_string(*err).data());
        return false;
    }
    return true;
}

bool test_root_tag_lowercased() {
    auto result = hamgate::read_root_tag("<?xml version=\"1.0\"?>\n<!-- hi -->\n<AppInfo><app>N1MM</app></AppInfo>");
    auto* tag = std::get_if<std::string>(&result);
    if (!tag || *tag != "appinfo") {
        std::printf("Expected root tag 'appinfo'\n");
        return false;
    }
    return true;
}

bool test_root_tag_ignores_body() {
    // Only the prolog and the name are examined
    auto result = hamgate::read_root_tag("<contactinfo><call>K1ABC");
    auto* tag = std::get_if<std::string>(&result);
    if (!tag || *tag != "contactinfo") {
        std::printf("Unterminated body should not affect the root tag\n");
        return false;
    }
    return true;
}

bool test_root_tag_errors() {
    auto empty = hamgate::read_root_tag("  \r\n\t ");
    if (!std::holds_alternative<hamgate::XmlError>(empty) ||
        std::get<hamgate::XmlError>(empty) != hamgate::XmlError::EmptyInput) {
        std::printf("Whitespace-only input should be EmptyInput\n");
        return false;
    }
    auto text = hamgate::read_root_tag("hello");
    if (!std::holds_alternative<hamgate::XmlError>(text)) {
        std::printf("Plain text should have no root element\n");
        return false;
    }
    auto doctype = hamgate::read_root_tag("<!DOCTYPE x [<!ENTITY a \"b\">]><x/>");
    if (!std::holds_alternative<hamgate::XmlError>(doctype) ||
        std::get<hamgate::XmlError>(doctype) != hamgate::XmlError::UnsupportedDoctype) {
        std::printf("DOCTYPE should be rejected\n");
        return false;
    }
    return true;
}

bool test_bom_is_skipped() {
    auto result = hamgate::parse_xml("\xEF\xBB\xBF<spot><dxcall>DL1ABC</dxcall></spot>");
    auto* root = std::get_if<hamgate::XmlElement>(&result);
    if (!root || root->name != "spot") {
        std::printf("BOM should be skipped\n");
        return false;
    }
    return true;
}

bool test_tree_structure() {
    auto result = hamgate::parse_xml(
        "<dynamicresults>"
        "<class power=\"LOW\" assisted='NON'/>"
        "<qth><cqzone>5</cqzone></qth>"
        "<breakdown><qso band=\"20\" mode=\"CW\">12</qso><qso band=\"40\" mode=\"CW\">3</qso></breakdown>"
        "</dynamicresults>");
    auto* root = std::get_if<hamgate::XmlElement>(&result);
    if (!root) {
        std::printf("Document should parse\n");
        return false;
    }
    const auto* cls = root->child("class");
    if (!cls || cls->attribute("power") != std::optional<std::string_view>("LOW") ||
        cls->attribute("assisted") != std::optional<std::string_view>("NON")) {
        std::printf("Attributes not read\n");
        return false;
    }
    const auto* qth = root->child("qth");
    if (!qth || !qth->child("cqzone") || qth->child("cqzone")->text != "5") {
        std::printf("Nested text not read\n");
        return false;
    }
    const auto* breakdown = root->child("breakdown");
    if (!breakdown || breakdown->children.size() != 2 || breakdown->children[1].text != "3") {
        std::printf("Repeated children not kept in order\n");
        return false;
    }
    if (root->child("missing") != nullptr || cls->attribute("missing")) {
        std::printf("Missing lookups should be empty\n");
        return false;
    }
    return true;
}

bool test_references_resolved() {
    auto result = hamgate::parse_xml(
        "<x a=\"&quot;q&quot;\">&lt;tag&gt; &amp; &apos;s&apos; &#65;&#x42; &#xE9;</x>");
    auto* root = std::get_if<hamgate::XmlElement>(&result);
    if (!root) {
        std::printf("References should parse\n");
        return false;
    }
    if (root->text != "<tag> & 's' AB \xC3\xA9") {
        std::printf("Resolved text wrong: %s\n", root->text.c_str());
        return false;
    }
    if (root->attribute("a") != std::optional<std::string_view>("\"q\"")) {
        std::printf("Attribute reference not resolved\n");
        return false;
    }
    return true;
}

bool test_cdata_and_comments_in_content() {
    auto result = hamgate::parse_xml("<c>a<!-- skip -->b<![CDATA[<&>]]>c<?pi x?></c>");
    auto* root = std::get_if<hamgate::XmlElement>(&result);
    if (!root || root->text != "ab<&>c") {
        std::printf("CDATA/comment handling wrong\n");
        return false;
    }
    return true;
}

bool test_trailing_nul_and_whitespace() {
    std::string xml = "<AppInfo><app>N1MM</app></AppInfo>\r\n";
    xml.append(16, '\0');
    auto result = hamgate::parse_xml(xml);
    if (!std::holds_alternative<hamgate::XmlElement>(result)) {
        std::printf("Zero padding after the root should be accepted\n");
        return false;
    }
    return true;
}

bool test_malformed_documents() {
    return expect_error("<a><b></a>", hamgate::XmlError::MismatchedTag, "mismatch") &&
           expect_error("<a>text", hamgate::XmlError::UnexpectedEnd, "unterminated") &&
           expect_error("<a>&bogus;</a>", hamgate::XmlError::InvalidEntity, "unknown entity") &&
           expect_error("<a>&#0;</a>", hamgate::XmlError::InvalidEntity, "nul reference") &&
           expect_error("<a>&#xD800;</a>", hamgate::XmlError::InvalidEntity, "surrogate") &&
           expect_error("<a>&amp</a>", hamgate::XmlError::InvalidEntity, "unterminated entity") &&
           expect_error("<a x=1></a>", hamgate::XmlError::InvalidAttribute, "unquoted") &&
           expect_error("<a x=\"1\"y=\"2\"></a>", hamgate::XmlError::InvalidAttribute, "no separator") &&
           expect_error("<a x=\"1\" x=\"2\"></a>", hamgate::XmlError::DuplicateAttribute, "duplicate") &&
           expect_error("<a></a><b/>", hamgate::XmlError::TrailingContent, "second root") &&
           expect_error("<a></a>junk", hamgate::XmlError::TrailingContent, "trailing text") &&
           expect_error("<a><!DOCTYPE b></a>", hamgate::XmlError::UnsupportedDoctype, "inner doctype") &&
           expect_error("<1a/>", hamgate::XmlError::InvalidName, "bad name") &&
           expect_error("", hamgate::XmlError::EmptyInput, "empty");
}

bool test_depth_limit() {
    std::string ok;
    for (std::size_t i = 0; i < hamgate::XmlLimits::kMaxDepth; ++i) {
        ok += "<e>";
    }
    for (std::size_t i = 0; i < hamgate::XmlLimits::kMaxDepth; ++i) {
        ok += "</e>";
    }
    if (!std::holds_alternative<hamgate::XmlElement>(hamgate::parse_xml(ok))) {
        std::printf("Nesting at the limit should parse\n");
        return false;
    }
    return expect_error("<e>" + ok + "</e>", hamgate::XmlError::TooDeep, "too deep");
}

bool test_element_and_attribute_limits() {
    std::string many = "<r>";
    for (std::size_t i = 0; i < hamgate::XmlLimits::kMaxElements; ++i) {
        many += "<x/>";
    }
    many += "</r>";
    if (!expect_error(many, hamgate::XmlError::TooManyElements, "too many elements")) {
        return false;
    }

    std::string attrs = "<r";
    for (std::size_t i = 0; i <= hamgate::XmlLimits::kMaxAttributes; ++i) {
        attrs += " a" + std::to_string(i) + "=\"v\"";
    }
    attrs += "/>";
    return expect_error(attrs, hamgate::XmlError::TooManyAttributes, "too many attributes");
}

bool test_size_limit() {
    std::string big = "<r>";
    big.append(hamgate::XmlLimits::kMaxDocumentBytes, 'x');
    big += "</r>";
    return expect_error(big, hamgate::XmlError::InputTooLarge, "too large");
}

bool test_byte_span_overload() {
    const std::string xml = "<RadioInfo><Freq>1402500</Freq></RadioInfo>";
    auto bytes = std::as_bytes(std::span<const char>(xml.data(), xml.size()));
    auto result = hamgate::parse_xml(bytes);
    auto* root = std::get_if<hamgate::XmlElement>(&result);
    if (!root || root->name != "RadioInfo" || !root->child("Freq")) {
        std::printf("Span overload should parse the same document\n");
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!test_root_tag_lowercased()) {
        std::printf("test_root_tag_lowercased failed\n");
        return EXIT_FAILURE;
    }

    if (!test_root_tag_ignores_body()) {
        std::printf("test_root_tag_ignores_body failed\n");
        return EXIT_FAILURE;
    }

    if (!test_root_tag_errors()) {
        std::printf("test_root_tag_errors failed\n");
        return EXIT_FAILURE;
    }

    if (!test_bom_is_skipped()) {
        std::printf("test_bom_is_skipped failed\n");
        return EXIT_FAILURE;
    }

    if (!test_tree_structure()) {
        std::printf("test_tree_structure failed\n");
        return EXIT_FAILURE;
    }

    if (!test_references_resolved()) {
        std::printf("test_references_resolved failed\n");
        return EXIT_FAILURE;
    }

    if (!test_cdata_and_comments_in_content()) {
        std::printf("test_cdata_and_comments_in_content failed\n");
        return EXIT_FAILURE;
    }

    if (!test_trailing_nul_and_whitespace()) {
        std::printf("test_trailing_nul_and_whitespace failed\n");
        return EXIT_FAILURE;
    }

    if (!test_malformed_documents()) {
        std::printf("test_malformed_documents failed\n");
        return EXIT_FAILURE;
    }

    if (!test_depth_limit()) {
        std::printf("test_depth_limit failed\n");
        return EXIT_FAILURE;
    }

    if (!test_element_and_attribute_limits()) {
        std::printf("test_element_and_attribute_limits failed\n");
        return EXIT_FAILURE;
    }

    if (!test_size_limit()) {
        std::printf("test_size_limit failed\n");
        return EXIT_FAILURE;
    }

    if (!test_byte_span_overload()) {
        std::printf("test_byte_span_overload failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All xml_reader tests passed\n");
    return EXIT_SUCCESS;
}
