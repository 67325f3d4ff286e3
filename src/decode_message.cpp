#include "hamgate/decode_message.hpp"

#include <charconv>
#include <optional>
#include <string>

namespace hamgate {

namespace {

std::string_view trim(std::string_view s) noexcept {
    constexpr std::string_view kSpace = " \t\r\n";
    auto first = s.find_first_not_of(kSpace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(kSpace);
    return s.substr(first, last - first + 1);
}

template <typename Int>
bool parse_integer(std::string_view text, Int& out) noexcept {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    Int value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

bool parse_number(std::string_view text, double& out) {
    std::string normalized(text);
    for (char& c : normalized) {
        if (c == ',') {
            c = '.';
        }
    }
    std::string_view view = normalized;
    if (!view.empty() && view.front() == '+') {
        view.remove_prefix(1);
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(view.data(), view.data() + view.size(), value);
    if (ec != std::errc{} || ptr != view.data() + view.size()) {
        return false;
    }
    out = value;
    return true;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        char x = a[i];
        if (x >= 'A' && x <= 'Z') {
            x = static_cast<char>(x - 'A' + 'a');
        }
        if (x != b[i]) {
            return false;
        }
    }
    return true;
}

bool parse_boolean(std::string_view text, bool& out) noexcept {
    if (text == "1" || iequals(text, "true")) {
        out = true;
        return true;
    }
    if (text == "0" || iequals(text, "false")) {
        out = false;
        return true;
    }
    return false;
}

// Reads named children of one element into struct members.
// The first failure is kept and later reads become no-ops.
class FieldReader {
public:
    explicit FieldReader(const XmlElement& element) noexcept : element_(element) {}

    void text(std::string_view name, std::string& out) {
        if (const XmlElement* e = find(name)) {
            out = e->text;
        }
    }

    void integer(std::string_view name, int& out) { integral(name, out); }
    void integer(std::string_view name, std::int64_t& out) { integral(name, out); }

    void number(std::string_view name, double& out) {
        auto value = present(name);
        if (value && !parse_number(*value, out)) {
            fail(DecodeError::InvalidNumber, name);
        }
    }

    void boolean(std::string_view name, bool& out) {
        auto value = present(name);
        if (value && !parse_boolean(*value, out)) {
            fail(DecodeError::InvalidBoolean, name);
        }
    }

    void timestamp(std::string_view name, Timestamp& out) {
        auto value = present(name);
        if (!value) {
            return;
        }
        if (auto ts = parse_timestamp(*value)) {
            out = *ts;
        } else {
            fail(DecodeError::InvalidTimestamp, name);
        }
    }

    // Integer carried as the element's own text (<qso ...>12</qso>)
    void own_integer(std::string_view name, int& out) {
        if (failure_) {
            return;
        }
        std::string_view value = trim(element_.text);
        if (!value.empty() && !parse_integer(value, out)) {
            fail(DecodeError::InvalidInteger, name);
        }
    }

    void attribute(std::string_view name, std::string& out) {
        if (auto value = element_.attribute(name)) {
            out = std::string(*value);
        }
    }

    void fail(DecodeError error, std::string_view field) noexcept {
        if (!failure_) {
            failure_ = DecodeFailure{.error = error, .field = field};
        }
    }

    [[nodiscard]] const std::optional<DecodeFailure>& failure() const noexcept { return failure_; }

private:
    const XmlElement* find(std::string_view name) const noexcept {
        return failure_ ? nullptr : element_.child(name);
    }

    // Trimmed text of a present, non-empty element
    std::optional<std::string_view> present(std::string_view name) const noexcept {
        const XmlElement* e = find(name);
        if (!e) {
            return std::nullopt;
        }
        std::string_view value = trim(e->text);
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    }

    template <typename Int>
    void integral(std::string_view name, Int& out) {
        auto value = present(name);
        if (value && !parse_integer(*value, out)) {
            fail(DecodeError::InvalidInteger, name);
        }
    }

    const XmlElement& element_;
    std::optional<DecodeFailure> failure_;
};

// ============================================================================
// Per-payload field tables
// ============================================================================

void read_fields(FieldReader& r, AppInfo& m) {
    r.text("app", m.app);
    r.text("dbname", m.db_name);
    r.integer("contestnr", m.contest_nr);
    r.text("contestname", m.contest_name);
    r.text("StationName", m.station_name);
}

void read_fields(FieldReader& r, ContactInfo& m) {
    r.text("app", m.app);
    r.text("contestname", m.contest_name);
    r.integer("contestnr", m.contest_nr);
    r.timestamp("timestamp", m.timestamp);
    r.text("mycall", m.my_call);
    r.number("band", m.band);
    r.integer("rxfreq", m.rx_freq);
    r.integer("txfreq", m.tx_freq);
    r.text("operator", m.operator_call);
    r.text("mode", m.mode);
    r.text("call", m.call);
    r.text("countryprefix", m.country_prefix);
    r.text("wpxprefix", m.wpx_prefix);
    r.text("stationprefix", m.station_prefix);
    r.text("continent", m.continent);
    r.text("snt", m.snt);
    r.integer("sntnr", m.snt_nr);
    r.text("rcv", m.rcv);
    r.integer("rcvnr", m.rcv_nr);
    r.text("gridsquare", m.grid_square);
    r.text("exchangel", m.exchange_l);
    r.text("section", m.section);
    r.text("comment", m.comment);
    r.text("qth", m.qth);
    r.text("name", m.name);
    r.text("power", m.power);
    r.text("misctext", m.misc_text);
    r.integer("zone", m.zone);
    r.text("prec", m.prec);
    r.integer("ck", m.ck);
    r.text("ismultiplierl", m.is_multiplier_l);
    r.integer("ismultiplier2", m.is_multiplier2);
    r.integer("ismultiplier3", m.is_multiplier3);
    r.text("points", m.points);
    r.text("radionr", m.radio_nr);
    r.text("run1run2", m.run1_run2);
    r.text("RoverLocation", m.rover_location);
    r.text("RadioInterfaced", m.radio_interfaced);
    r.integer("NetworkedCompNr", m.networked_comp_nr);
    r.boolean("IsOriginal", m.is_original);
    r.text("NetBiosName", m.netbios_name);
    r.integer("IsRunQSO", m.is_run_qso);
    r.text("StationName", m.station_name);
    r.text("ID", m.id);
    r.integer("IsClaimedQso", m.is_claimed_qso);
}

void read_fields(FieldReader& r, ContactDelete& m) {
    r.text("app", m.app);
    r.timestamp("timestamp", m.timestamp);
    r.text("call", m.call);
    r.integer("contestnr", m.contest_nr);
    r.text("StationName", m.station_name);
    r.text("ID", m.id);
}

void read_fields(FieldReader& r, Spot& m) {
    r.text("app", m.app);
    r.text("StationName", m.station_name);
    r.text("dxcall", m.dx_call);
    r.number("frequency", m.frequency);
    r.text("spottercall", m.spotter_call);
    r.timestamp("timestamp", m.timestamp);
    r.text("action", m.action);
    r.text("mode", m.mode);
    r.text("comment", m.comment);
    r.text("status", m.status);
    r.text("statuslist", m.status_list);
}

void read_fields(FieldReader& r, RadioInfo& m) {
    r.text("app", m.app);
    r.text("StationName", m.station_name);
    r.integer("RadioNr", m.radio_nr);
    r.integer("Freq", m.frequency);
    r.integer("TXFreq", m.tx_frequency);
    r.text("Mode", m.mode);
    r.text("OpCall", m.op_call);
    r.boolean("IsRunning", m.is_running);
    r.integer("FocusEntry", m.focus_entry);
    r.integer("EntryWindowHwnd", m.entry_window_hwnd);
    r.integer("Antenna", m.antenna);
    r.text("Rotors", m.rotors);
    r.integer("FocusRadioNr", m.focus_radio_nr);
    r.boolean("IsStereo", m.is_stereo);
    r.boolean("IsSplit", m.is_split);
    r.integer("ActiveRadioNr", m.active_radio_nr);
    r.boolean("IsTransmitting", m.is_transmitting);
    r.text("FunctionKeyCaption", m.function_key_caption);
    r.text("RadioName", m.radio_name);
    r.integer("AuxAntSelected", m.aux_ant_selected);
    r.text("AuxAntSelectedName", m.aux_ant_selected_name);
    r.boolean("IsConnected", m.is_connected);
}

// <dynamicresults> nests three structures; each gets its own reader
std::optional<DecodeFailure> read_dynamic_results(const XmlElement& root, DynamicResults& m) {
    FieldReader r(root);
    r.text("contest", m.contest);
    r.text("call", m.call);
    r.text("ops", m.ops);
    r.text("club", m.club);
    r.integer("score", m.score);
    r.timestamp("timestamp", m.timestamp);
    if (r.failure()) {
        return r.failure();
    }

    if (const XmlElement* cls = root.child("class")) {
        FieldReader c(*cls);
        c.attribute("power", m.contest_class.power);
        c.attribute("assisted", m.contest_class.assisted);
        c.attribute("transmitter", m.contest_class.transmitter);
        c.attribute("ops", m.contest_class.ops);
        c.attribute("bands", m.contest_class.bands);
        c.attribute("mode", m.contest_class.mode);
        c.attribute("overlay", m.contest_class.overlay);
    }

    if (const XmlElement* qth = root.child("qth")) {
        FieldReader q(*qth);
        q.text("dxcccountry", m.location.dxcc_country);
        q.integer("cqzone", m.location.cq_zone);
        q.integer("iaruzone", m.location.iaru_zone);
        q.text("arrlsection", m.location.arrl_section);
        q.text("stprvoth", m.location.state_province_other);
        q.text("grid6", m.location.grid6);
        if (q.failure()) {
            return q.failure();
        }
    }

    if (const XmlElement* breakdown = root.child("breakdown")) {
        for (const XmlElement& entry : breakdown->children) {
            FieldReader e(entry);
            if (entry.name == "qso") {
                QsoBreakdown qso;
                e.attribute("band", qso.band);
                e.attribute("mode", qso.mode);
                e.own_integer("qso", qso.qso_count);
                m.breakdown.qsos.push_back(std::move(qso));
            } else if (entry.name == "point") {
                PointBreakdown point;
                e.attribute("band", point.band);
                e.attribute("mode", point.mode);
                e.own_integer("point", point.point_count);
                m.breakdown.points.push_back(std::move(point));
            }
            if (e.failure()) {
                return e.failure();
            }
        }
    }

    return std::nullopt;
}

template <typename T>
DecodeResult decode_flat(const XmlElement& root) {
    T message;
    FieldReader reader(root);
    read_fields(reader, message);
    if (reader.failure()) {
        return *reader.failure();
    }
    return Message{std::in_place_type<T>, std::move(message)};
}

}  // namespace

DecodeResult decode_message(PayloadKind kind, const XmlElement& root) {
    switch (kind) {
        case PayloadKind::AppInfo:        return decode_flat<AppInfo>(root);
        case PayloadKind::ContactInfo:    return decode_flat<ContactInfo>(root);
        case PayloadKind::ContactReplace: return decode_flat<ContactReplace>(root);
        case PayloadKind::ContactDelete:  return decode_flat<ContactDelete>(root);
        case PayloadKind::LookupInfo:     return decode_flat<LookupInfo>(root);
        case PayloadKind::Spot:           return decode_flat<Spot>(root);
        case PayloadKind::RadioInfo:      return decode_flat<RadioInfo>(root);
        case PayloadKind::DynamicResults: {
            DynamicResults message;
            if (auto failure = read_dynamic_results(root, message)) {
                return *failure;
            }
            return Message{std::in_place_type<DynamicResults>, std::move(message)};
        }
    }
    return DecodeFailure{.error = DecodeError::MalformedXml, .field = {}};
}

DecodeResult decode_message(PayloadKind kind, std::span<const std::byte> payload) {
    auto parsed = parse_xml(payload);
    if (auto* error = std::get_if<XmlError>(&parsed)) {
        return DecodeFailure{.error = DecodeError::MalformedXml, .field = {}, .xml_error = *error};
    }
    return decode_message(kind, std::get<XmlElement>(parsed));
}

DecodeResult decode_message(PayloadKind kind, std::string_view payload) {
    return decode_message(kind, std::as_bytes(std::span<const char>(payload.data(), payload.size())));
}

}  // namespace hamgate
