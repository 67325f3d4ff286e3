#include "hamgate/ip_address.hpp"

#include <charconv>
#include <cstring>

// Platform headers
#include <arpa/inet.h>
#include <netinet/in.h>

namespace hamgate {

namespace {

constexpr std::array<std::uint8_t, 12> kV4MappedPrefix = {
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xFF, 0xFF
};

}  // namespace

IpAddress IpAddress::v4(std::uint32_t host_order) noexcept {
    IpAddress a;
    a.family_ = AddressFamily::V4;
    a.bytes_[0] = static_cast<std::uint8_t>(host_order >> 24);
    a.bytes_[1] = static_cast<std::uint8_t>(host_order >> 16);
    a.bytes_[2] = static_cast<std::uint8_t>(host_order >> 8);
    a.bytes_[3] = static_cast<std::uint8_t>(host_order);
    return a;
}

IpAddress IpAddress::v6(const std::array<std::uint8_t, 16>& bytes) noexcept {
    IpAddress a;
    a.family_ = AddressFamily::V6;
    a.bytes_ = bytes;
    return a;
}

std::optional<IpAddress> IpAddress::parse(std::string_view text) noexcept {
    // inet_pton needs a terminated string; longest IPv6 text is 45 chars
    if (text.empty() || text.size() >= INET6_ADDRSTRLEN) {
        return std::nullopt;
    }
    char buf[INET6_ADDRSTRLEN] = {};
    std::memcpy(buf, text.data(), text.size());

    in_addr v4{};
    if (inet_pton(AF_INET, buf, &v4) == 1) {
        return IpAddress::v4(ntohl(v4.s_addr));
    }

    in6_addr v6{};
    if (inet_pton(AF_INET6, buf, &v6) == 1) {
        std::array<std::uint8_t, 16> bytes{};
        std::memcpy(bytes.data(), v6.s6_addr, bytes.size());
        return IpAddress::v6(bytes);
    }

    return std::nullopt;
}

bool IpAddress::is_v4_mapped() const noexcept {
    return family_ == AddressFamily::V6 &&
           std::memcmp(bytes_.data(), kV4MappedPrefix.data(), kV4MappedPrefix.size()) == 0;
}

IpAddress IpAddress::normalized() const noexcept {
    if (!is_v4_mapped()) {
        return *this;
    }
    IpAddress a;
    a.family_ = AddressFamily::V4;
    std::memcpy(a.bytes_.data(), bytes_.data() + 12, 4);
    return a;
}

std::string IpAddress::to_string() const {
    char buf[INET6_ADDRSTRLEN] = {};
    if (is_v4()) {
        in_addr v4{};
        std::memcpy(&v4.s_addr, bytes_.data(), 4);
        inet_ntop(AF_INET, &v4, buf, sizeof(buf));
    } else {
        in6_addr v6{};
        std::memcpy(v6.s6_addr, bytes_.data(), 16);
        inet_ntop(AF_INET6, &v6, buf, sizeof(buf));
    }
    return buf;
}

// ============================================================================
// IpNetwork
// ============================================================================

IpNetwork::IpNetwork(IpAddress base, std::uint8_t prefix_length) noexcept
    : base_(base)
    , prefix_length_(prefix_length) {
    const std::size_t max_prefix = base.is_v4() ? 32 : 128;
    if (prefix_length_ > max_prefix) {
        prefix_length_ = static_cast<std::uint8_t>(max_prefix);
    }

    // Clear host bits so contains() can compare whole bytes
    auto raw = base_.bytes();
    std::array<std::uint8_t, 16> masked{};
    for (std::size_t i = 0; i < raw.size(); ++i) {
        const std::size_t bit = i * 8;
        std::uint8_t mask = 0;
        if (bit + 8 <= prefix_length_) {
            mask = 0xFF;
        } else if (bit < prefix_length_) {
            mask = static_cast<std::uint8_t>(0xFF << (8 - (prefix_length_ - bit)));
        }
        masked[i] = raw[i] & mask;
    }

    if (base_.is_v4()) {
        base_ = IpAddress::v4((static_cast<std::uint32_t>(masked[0]) << 24) |
                              (static_cast<std::uint32_t>(masked[1]) << 16) |
                              (static_cast<std::uint32_t>(masked[2]) << 8) |
                              static_cast<std::uint32_t>(masked[3]));
    } else {
        base_ = IpAddress::v6(masked);
    }
}

std::optional<IpNetwork> IpNetwork::parse(std::string_view cidr) {
    const auto slash = cidr.find('/');
    auto address = IpAddress::parse(cidr.substr(0, slash));
    if (!address) {
        return std::nullopt;
    }

    const unsigned max_prefix = address->is_v4() ? 32 : 128;
    unsigned prefix = max_prefix;

    if (slash != std::string_view::npos) {
        std::string_view digits = cidr.substr(slash + 1);
        if (digits.empty()) {
            return std::nullopt;
        }
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), prefix);
        if (ec != std::errc{} || ptr != digits.data() + digits.size() || prefix > max_prefix) {
            return std::nullopt;
        }
    }

    return IpNetwork(*address, static_cast<std::uint8_t>(prefix));
}

bool IpNetwork::contains(const IpAddress& address) const noexcept {
    if (address.family() != base_.family()) {
        return false;
    }

    auto want = base_.bytes();
    auto have = address.bytes();

    std::size_t full_bytes = prefix_length_ / 8;
    std::size_t rest_bits = prefix_length_ % 8;

    if (std::memcmp(want.data(), have.data(), full_bytes) != 0) {
        return false;
    }
    if (rest_bits == 0) {
        return true;
    }

    auto mask = static_cast<std::uint8_t>(0xFF << (8 - rest_bits));
    return (have[full_bytes] & mask) == want[full_bytes];
}

std::string IpNetwork::to_string() const {
    return base_.to_string() + "/" + std::to_string(prefix_length_);
}

std::string Endpoint::to_string() const {
    if (address.is_v4()) {
        return address.to_string() + ":" + std::to_string(port);
    }
    return "[" + address.to_string() + "]:" + std::to_string(port);
}

}  // namespace hamgate
