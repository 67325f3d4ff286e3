#include "hamgate/messages.hpp"

#include <cstdio>
#include <type_traits>

namespace hamgate {

namespace {

bool read_digits(std::string_view text, std::size_t pos, std::size_t count, int& out) noexcept {
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        char c = text[i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

std::string to_lower(std::string_view text) {
    std::string out(text);
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

}  // namespace

// ============================================================================
// Timestamps
// ============================================================================

std::optional<std::chrono::sys_seconds> parse_timestamp(std::string_view text) noexcept {
    using namespace std::chrono;

    // 0123456789012345678
    // yyyy-MM-dd HH:mm:ss
    if (text.size() != 19 || text[4] != '-' || text[7] != '-' ||
        (text[10] != ' ' && text[10] != 'T') || text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!read_digits(text, 0, 4, y) || !read_digits(text, 5, 2, mo) ||
        !read_digits(text, 8, 2, d) || !read_digits(text, 11, 2, h) ||
        !read_digits(text, 14, 2, mi) || !read_digits(text, 17, 2, s)) {
        return std::nullopt;
    }

    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 59) {
        return std::nullopt;
    }

    return sys_days{ymd} + hours{h} + minutes{mi} + seconds{s};
}

std::string format_timestamp(const Timestamp& ts) {
    using namespace std::chrono;

    if (!ts) {
        return "-";
    }

    const sys_days day_point = floor<days>(*ts);
    const year_month_day ymd{day_point};
    const hh_mm_ss<seconds> tod{*ts - day_point};

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02d:%02d:%02d",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(tod.hours().count()),
                  static_cast<int>(tod.minutes().count()),
                  static_cast<int>(tod.seconds().count()));
    return buf;
}

// ============================================================================
// describe()
// ============================================================================

std::string describe(const Message& message) {
    char buf[256];
    const std::string_view tag = default_tag(kind_of(message));

    std::visit([&buf, tag](const auto& m) {
        using T = std::decay_t<decltype(m)>;

        if constexpr (std::is_same_v<T, AppInfo>) {
            std::snprintf(buf, sizeof(buf), "appinfo app=%s station=%s contest=%s",
                          m.app.c_str(), m.station_name.c_str(), m.contest_name.c_str());
        } else if constexpr (std::is_base_of_v<ContactInfo, T>) {
            std::snprintf(buf, sizeof(buf), "%.*s call=%s mode=%s band=%g station=%s operator=%s at=%s",
                          static_cast<int>(tag.size()), tag.data(),
                          m.call.c_str(), m.mode.c_str(), m.band,
                          m.station_name.c_str(), m.operator_call.c_str(),
                          format_timestamp(m.timestamp).c_str());
        } else if constexpr (std::is_same_v<T, ContactDelete>) {
            std::snprintf(buf, sizeof(buf), "contactdelete call=%s id=%s station=%s at=%s",
                          m.call.c_str(), m.id.c_str(), m.station_name.c_str(),
                          format_timestamp(m.timestamp).c_str());
        } else if constexpr (std::is_same_v<T, Spot>) {
            std::snprintf(buf, sizeof(buf), "spot dx=%s freq=%.1f spotter=%s action=%s",
                          m.dx_call.c_str(), m.frequency, m.spotter_call.c_str(),
                          m.action.c_str());
        } else if constexpr (std::is_same_v<T, DynamicResults>) {
            std::snprintf(buf, sizeof(buf), "dynamicresults contest=%s call=%s score=%d",
                          m.contest.c_str(), m.call.c_str(), m.score);
        } else {
            static_assert(std::is_same_v<T, RadioInfo>);
            std::snprintf(buf, sizeof(buf), "radioinfo station=%s radio=%d freq=%lld mode=%s tx=%d",
                          m.station_name.c_str(), m.radio_nr,
                          static_cast<long long>(m.frequency), m.mode.c_str(),
                          m.is_transmitting ? 1 : 0);
        }
    }, message);

    return buf;
}

// ============================================================================
// TagRegistry
// ============================================================================

std::string_view default_tag(PayloadKind kind) noexcept {
    switch (kind) {
        case PayloadKind::AppInfo:        return "appinfo";
        case PayloadKind::ContactInfo:    return "contactinfo";
        case PayloadKind::ContactReplace: return "contactreplace";
        case PayloadKind::ContactDelete:  return "contactdelete";
        case PayloadKind::LookupInfo:     return "lookupinfo";
        case PayloadKind::Spot:           return "spot";
        case PayloadKind::DynamicResults: return "dynamicresults";
        case PayloadKind::RadioInfo:      return "radioinfo";
    }
    return "unknown";
}

TagRegistry TagRegistry::defaults() {
    TagRegistry registry;
    for (std::size_t i = 0; i < kPayloadKindCount; ++i) {
        const auto kind = static_cast<PayloadKind>(i);
        registry.set(default_tag(kind), kind);
    }
    return registry;
}

void TagRegistry::set(std::string_view tag, PayloadKind kind) {
    tags_.insert_or_assign(to_lower(tag), kind);
}

std::optional<PayloadKind> TagRegistry::resolve(std::string_view tag) const {
    auto it = tags_.find(std::string(tag));
    if (it == tags_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace hamgate
