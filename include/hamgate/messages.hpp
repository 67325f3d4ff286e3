#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace hamgate {

// ============================================================================
// N1MM+ logger broadcast payloads.
//
// Each struct mirrors one root element. Member defaults are what a message
// that omits the element decodes to.
// ============================================================================

// Logger timestamps carry no zone; unset when the element was absent.
using Timestamp = std::optional<std::chrono::sys_seconds>;

// Accepts "yyyy-MM-dd HH:mm:ss" and "yyyy-MM-ddTHH:mm:ss" only
std::optional<std::chrono::sys_seconds> parse_timestamp(std::string_view text) noexcept;

// "yyyy-MM-dd HH:mm:ss", or "-" when unset
std::string format_timestamp(const Timestamp& ts);

// Payload type descriptor. Order matches the Message alternatives.
enum class PayloadKind : std::uint8_t {
    AppInfo = 0,
    ContactInfo = 1,
    ContactReplace = 2,
    ContactDelete = 3,
    LookupInfo = 4,
    Spot = 5,
    DynamicResults = 6,
    RadioInfo = 7,
};

inline constexpr std::size_t kPayloadKindCount = 8;

constexpr std::string_view to_string(PayloadKind kind) noexcept {
    switch (kind) {
        case PayloadKind::AppInfo:        return "AppInfo";
        case PayloadKind::ContactInfo:    return "ContactInfo";
        case PayloadKind::ContactReplace: return "ContactReplace";
        case PayloadKind::ContactDelete:  return "ContactDelete";
        case PayloadKind::LookupInfo:     return "LookupInfo";
        case PayloadKind::Spot:           return "Spot";
        case PayloadKind::DynamicResults: return "DynamicResults";
        case PayloadKind::RadioInfo:      return "RadioInfo";
    }
    return "unknown";
}

// <AppInfo>: sent when a logger opens or switches its database/contest
struct AppInfo {
    std::string app;
    std::string db_name;
    int contest_nr = 0;
    std::string contest_name;
    std::string station_name;
};

// <contactinfo>: a logged QSO
struct ContactInfo {
    std::string app;
    std::string contest_name;
    int contest_nr = 0;
    Timestamp timestamp;
    std::string my_call;
    double band = 0.0;
    int rx_freq = 0;           // 10 Hz units
    int tx_freq = 0;
    std::string operator_call; // <operator>
    std::string mode;
    std::string call;
    std::string country_prefix;
    std::string wpx_prefix;
    std::string station_prefix;
    std::string continent;
    std::string snt;
    int snt_nr = 0;
    std::string rcv;
    int rcv_nr = 0;
    std::string grid_square;
    std::string exchange_l;
    std::string section;
    std::string comment;
    std::string qth;
    std::string name;
    std::string power;
    std::string misc_text;
    int zone = 0;
    std::string prec;
    int ck = 0;
    std::string is_multiplier_l;
    int is_multiplier2 = 0;
    int is_multiplier3 = 0;
    std::string points;
    std::string radio_nr;
    std::string run1_run2;
    std::string rover_location;
    std::string radio_interfaced;
    int networked_comp_nr = 0;
    bool is_original = false;
    std::string netbios_name;
    int is_run_qso = 0;
    std::string station_name;
    std::string id;
    int is_claimed_qso = 0;
};

// <contactreplace>: an edited QSO, same fields as contactinfo
struct ContactReplace : ContactInfo {};

// <lookupinfo>: call lookup while typing, same fields as contactinfo
struct LookupInfo : ContactInfo {};

// <contactdelete>
struct ContactDelete {
    std::string app;
    Timestamp timestamp;
    std::string call;
    int contest_nr = 0;
    std::string station_name;
    std::string id;
};

// <spot>: cluster spot
struct Spot {
    std::string app;
    std::string station_name;
    std::string dx_call;
    double frequency = 0.0;   // kHz
    std::string spotter_call;
    Timestamp timestamp;
    std::string action;
    std::string mode;
    std::string comment;
    std::string status;
    std::string status_list;
};

// <class .../> attributes of a score report
struct ContestClass {
    std::string power;
    std::string assisted;
    std::string transmitter;
    std::string ops;
    std::string bands;
    std::string mode;
    std::string overlay;
};

// <qth>
struct Location {
    std::string dxcc_country;
    int cq_zone = 0;
    int iaru_zone = 0;
    std::string arrl_section;
    std::string state_province_other;   // <stprvoth>
    std::string grid6;
};

// <qso band=".." mode="..">count</qso>
struct QsoBreakdown {
    std::string band;
    std::string mode;
    int qso_count = 0;
};

// <point band=".." mode="..">count</point>
struct PointBreakdown {
    std::string band;
    std::string mode;
    int point_count = 0;
};

struct Breakdown {
    std::vector<QsoBreakdown> qsos;
    std::vector<PointBreakdown> points;
};

// <dynamicresults>: live score report
struct DynamicResults {
    std::string contest;
    std::string call;
    std::string ops;
    ContestClass contest_class;
    std::string club;
    Location location;
    Breakdown breakdown;
    int score = 0;
    Timestamp timestamp;
};

// <RadioInfo>: periodic radio status
struct RadioInfo {
    std::string app;
    std::string station_name;
    int radio_nr = 0;
    std::int64_t frequency = 0;   // 10 Hz units
    std::int64_t tx_frequency = 0;
    std::string mode;
    std::string op_call;
    bool is_running = false;
    int focus_entry = 0;
    int entry_window_hwnd = 0;
    int antenna = 0;
    std::string rotors;
    int focus_radio_nr = 0;
    bool is_stereo = false;
    bool is_split = false;
    int active_radio_nr = 0;
    bool is_transmitting = false;
    std::string function_key_caption;
    std::string radio_name;
    int aux_ant_selected = -1;
    std::string aux_ant_selected_name;
    bool is_connected = false;
};

// One decoded payload. Alternative index == PayloadKind value.
using Message = std::variant<
    AppInfo,
    ContactInfo,
    ContactReplace,
    ContactDelete,
    LookupInfo,
    Spot,
    DynamicResults,
    RadioInfo
>;

static_assert(std::variant_size_v<Message> == kPayloadKindCount);

inline PayloadKind kind_of(const Message& message) noexcept {
    return static_cast<PayloadKind>(message.index());
}

// Short single-line description for log lines ("contactinfo call=K1ABC ...")
std::string describe(const Message& message);

// ============================================================================
// TagRegistry
//
// Lower-cased root tag -> payload kind. Filled before the router is built
// and read-only afterwards.
// ============================================================================

class TagRegistry {
public:
    TagRegistry() = default;

    // The eight N1MM+ tags ("appinfo", "contactinfo", ...)
    static TagRegistry defaults();

    // Map `tag` (any case) to `kind`, replacing an existing mapping
    void set(std::string_view tag, PayloadKind kind);

    // `tag` must already be lower-cased
    [[nodiscard]] std::optional<PayloadKind> resolve(std::string_view tag) const;

    [[nodiscard]] std::size_t size() const noexcept { return tags_.size(); }

private:
    std::unordered_map<std::string, PayloadKind> tags_;
};

// Canonical lower-case tag for a kind
std::string_view default_tag(PayloadKind kind) noexcept;

}  // namespace hamgate
