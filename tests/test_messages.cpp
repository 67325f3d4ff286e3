#include "hamgate/messages.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace {

using namespace std::chrono;

bool test_parse_timestamp_formats() {
    const sys_seconds expected = sys_days{year{2024} / 11 / 23} + hours{14} + minutes{5} + seconds{9};

    auto space = hamgate::parse_timestamp("2024-11-23 14:05:09");
    auto iso = hamgate::parse_timestamp("2024-11-23T14:05:09");
    if (!space || *space != expected) {
        std::printf("Space-separated timestamp not parsed\n");
        return false;
    }
    if (!iso || *iso != expected) {
        std::printf("T-separated timestamp not parsed\n");
        return false;
    }
    return true;
}

bool test_parse_timestamp_rejects() {
    const char* bad[] = {
        "",
        "2024-11-23",
        "2024-11-23 14:05",
        "2024-11-23 14:05:09Z",
        "2024/11/23 14:05:09",
        "2024-13-01 00:00:00",
        "2023-02-29 00:00:00",
        "2024-11-31 00:00:00",
        "2024-11-23 24:00:00",
        "2024-11-23 14:60:00",
        "2024-11-23 14:05:60",
        "2024-1a-23 14:05:09",
        " 2024-11-23 14:05:0",
    };
    for (const char* text : bad) {
        if (hamgate::parse_timestamp(text)) {
            std::printf("Expected rejection of '%s'\n", text);
            return false;
        }
    }
    // Leap day exists in 2024
    if (!hamgate::parse_timestamp("2024-02-29 23:59:59")) {
        std::printf("2024-02-29 should parse\n");
        return false;
    }
    return true;
}

bool test_format_timestamp() {
    if (hamgate::format_timestamp(std::nullopt) != "-") {
        std::printf("Unset timestamp should format as '-'\n");
        return false;
    }
    auto ts = hamgate::parse_timestamp("2025-01-02T03:04:05");
    if (hamgate::format_timestamp(ts) != "2025-01-02 03:04:05") {
        std::printf("Got %s\n", hamgate::format_timestamp(ts).c_str());
        return false;
    }
    return true;
}

bool test_default_tags_resolve() {
    auto registry = hamgate::TagRegistry::defaults();
    if (registry.size() != hamgate::kPayloadKindCount) {
        std::printf("Expected %zu default tags, got %zu\n", hamgate::kPayloadKindCount, registry.size());
        return false;
    }
    for (std::size_t i = 0; i < hamgate::kPayloadKindCount; ++i) {
        const auto kind = static_cast<hamgate::PayloadKind>(i);
        auto resolved = registry.resolve(hamgate::default_tag(kind));
        if (!resolved || *resolved != kind) {
            auto name = hamgate::to_string(kind);
            std::printf("Tag for %.*s does not resolve\n", static_cast<int>(name.size()), name.data());
            return false;
        }
    }
    if (registry.resolve("qsoinfo")) {
        std::printf("Unknown tag should not resolve\n");
        return false;
    }
    return true;
}

bool test_registry_set_lowercases() {
    auto registry = hamgate::TagRegistry::defaults();
    registry.set("QsoLogged", hamgate::PayloadKind::ContactInfo);
    auto resolved = registry.resolve("qsologged");
    if (!resolved || *resolved != hamgate::PayloadKind::ContactInfo) {
        std::printf("Registered tag should resolve lower-cased\n");
        return false;
    }

    // Replacing an existing mapping
    registry.set("spot", hamgate::PayloadKind::LookupInfo);
    if (registry.resolve("spot") != hamgate::PayloadKind::LookupInfo) {
        std::printf("set() should replace the mapping\n");
        return false;
    }
    return true;
}

bool test_kind_of_matches_alternative() {
    hamgate::Message spot = hamgate::Spot{};
    hamgate::Message replace{std::in_place_type<hamgate::ContactReplace>};
    hamgate::Message lookup{std::in_place_type<hamgate::LookupInfo>};
    if (hamgate::kind_of(spot) != hamgate::PayloadKind::Spot ||
        hamgate::kind_of(replace) != hamgate::PayloadKind::ContactReplace ||
        hamgate::kind_of(lookup) != hamgate::PayloadKind::LookupInfo) {
        std::printf("kind_of does not follow the variant index\n");
        return false;
    }
    return true;
}

bool test_describe() {
    hamgate::ContactReplace contact;
    contact.call = "K1ABC";
    contact.mode = "CW";
    contact.band = 14;
    contact.station_name = "PC1";
    contact.timestamp = hamgate::parse_timestamp("2024-11-23 14:05:09");

    const std::string line = hamgate::describe(hamgate::Message{std::in_place_type<hamgate::ContactReplace>, contact});
    if (line.rfind("contactreplace call=K1ABC mode=CW band=14", 0) != 0) {
        std::printf("Unexpected description: %s\n", line.c_str());
        return false;
    }
    if (line.find("at=2024-11-23 14:05:09") == std::string::npos) {
        std::printf("Timestamp missing from description: %s\n", line.c_str());
        return false;
    }

    hamgate::RadioInfo radio;
    radio.frequency = 1402500;
    radio.station_name = "PC1";
    const std::string radio_line = hamgate::describe(radio);
    if (radio_line.find("freq=1402500") == std::string::npos) {
        std::printf("Unexpected radio description: %s\n", radio_line.c_str());
        return false;
    }
    return true;
}

bool test_struct_defaults() {
    hamgate::RadioInfo radio;
    hamgate::ContactInfo contact;
    if (radio.aux_ant_selected != -1 || radio.is_connected || contact.timestamp) {
        std::printf("Unexpected defaults\n");
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!test_parse_timestamp_formats()) {
        std::printf("test_parse_timestamp_formats failed\n");
        return EXIT_FAILURE;
    }

    if (!test_parse_timestamp_rejects()) {
        std::printf("test_parse_timestamp_rejects failed\n");
        return EXIT_FAILURE;
    }

    if (!test_format_timestamp()) {
        std::printf("test_format_timestamp failed\n");
        return EXIT_FAILURE;
    }

    if (!test_default_tags_resolve()) {
        std::printf("test_default_tags_resolve failed\n");
        return EXIT_FAILURE;
    }

    if (!test_registry_set_lowercases()) {
        std::printf("test_registry_set_lowercases failed\n");
        return EXIT_FAILURE;
    }

    if (!test_kind_of_matches_alternative()) {
        std::printf("test_kind_of_matches_alternative failed\n");
        return EXIT_FAILURE;
    }

    if (!test_describe()) {
        std::printf("test_describe failed\n");
        return EXIT_FAILURE;
    }

    if (!test_struct_defaults()) {
        std::printf("test_struct_defaults failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All messages tests passed\n");
    return EXIT_SUCCESS;
}
