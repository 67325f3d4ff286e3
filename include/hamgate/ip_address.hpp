#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace hamgate {

enum class AddressFamily : std::uint8_t {
    V4,
    V6
};

// An IPv4 or IPv6 address stored in network byte order.
class IpAddress {
public:
    // 0.0.0.0
    IpAddress() noexcept = default;

    // host_order: IPv4 address in host byte order (0x7F000001 == 127.0.0.1)
    static IpAddress v4(std::uint32_t host_order) noexcept;
    static IpAddress v6(const std::array<std::uint8_t, 16>& bytes) noexcept;

    // Parse a dotted-quad or RFC 4291 textual address.
    // Returns nullopt for anything else (hostnames, zone ids, CIDR suffixes).
    static std::optional<IpAddress> parse(std::string_view text) noexcept;

    [[nodiscard]] AddressFamily family() const noexcept { return family_; }
    [[nodiscard]] bool is_v4() const noexcept { return family_ == AddressFamily::V4; }

    // ::ffff:a.b.c.d
    [[nodiscard]] bool is_v4_mapped() const noexcept;

    // IPv4-mapped IPv6 collapses to plain IPv4, everything else is unchanged
    [[nodiscard]] IpAddress normalized() const noexcept;

    // 4 bytes for V4, 16 for V6
    [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept {
        return {bytes_.data(), is_v4() ? std::size_t{4} : std::size_t{16}};
    }

    [[nodiscard]] std::string to_string() const;

    bool operator==(const IpAddress& other) const noexcept = default;

private:
    AddressFamily family_ = AddressFamily::V4;
    std::array<std::uint8_t, 16> bytes_{};
};

// A CIDR range ("87.236.176.0/24", "2a06:4880::/32").
class IpNetwork {
public:
    // Host bits beyond the prefix are cleared.
    // Returns nullopt for a malformed address or out-of-range prefix.
    static std::optional<IpNetwork> parse(std::string_view cidr);

    IpNetwork(IpAddress base, std::uint8_t prefix_length) noexcept;

    // False when families differ: callers normalize IPv4-mapped input first.
    [[nodiscard]] bool contains(const IpAddress& address) const noexcept;

    [[nodiscard]] const IpAddress& base() const noexcept { return base_; }
    [[nodiscard]] std::uint8_t prefix_length() const noexcept { return prefix_length_; }
    [[nodiscard]] std::string to_string() const;

private:
    IpAddress base_;
    std::uint8_t prefix_length_;
};

// Remote address and port of a sender
struct Endpoint {
    IpAddress address;
    std::uint16_t port = 0;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const Endpoint& other) const noexcept = default;
};

}  // namespace hamgate

template <>
struct std::hash<hamgate::IpAddress> {
    std::size_t operator()(const hamgate::IpAddress& a) const noexcept {
        // FNV-1a over family + address bytes
        std::uint64_t h = 1469598103934665603ULL;
        h = (h ^ static_cast<std::uint8_t>(a.family())) * 1099511628211ULL;
        for (std::uint8_t b : a.bytes()) {
            h = (h ^ b) * 1099511628211ULL;
        }
        return static_cast<std::size_t>(h);
    }
};
