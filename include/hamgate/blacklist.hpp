#pragma once

#include "hamgate/ip_address.hpp"

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hamgate {

inline constexpr std::string_view kInternetMeasurementLabel = "internet-measurement.com";

// Built-in ranges of the internet-measurement.com scanners
std::vector<IpNetwork> internet_measurement_ranges();

// Labelled sets of CIDR ranges whose senders are dropped before any parsing.
//
// Read-mostly: ranges are added at startup, then queried concurrently by
// every listener. Labels are checked in insertion order.
//
// Thread safety: check() may run concurrently with add().
class Blacklist {
public:
    // Empty blacklist
    Blacklist() = default;

    // Blacklist seeded with the built-in abuse ranges
    static Blacklist with_defaults();

    Blacklist(Blacklist&& other) noexcept;
    Blacklist& operator=(Blacklist&&) = delete;
    Blacklist(const Blacklist&) = delete;
    Blacklist& operator=(const Blacklist&) = delete;

    // Register a labelled range set.
    // Returns false (and changes nothing) if the label is already present.
    bool add(std::string label, std::vector<IpNetwork> ranges);

    // Label of the first range set containing the address, or nullopt.
    // IPv4-mapped IPv6 addresses are tested in their IPv4 form.
    [[nodiscard]] std::optional<std::string> check(const IpAddress& address) const;

    [[nodiscard]] bool is_blacklisted(const IpAddress& address) const {
        return check(address).has_value();
    }

    [[nodiscard]] std::size_t label_count() const;
    [[nodiscard]] std::size_t range_count() const;

private:
    using Entry = std::pair<std::string, std::vector<IpNetwork>>;

    mutable std::shared_mutex mutex_;
    std::vector<Entry> entries_;
};

}  // namespace hamgate
