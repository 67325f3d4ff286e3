#include "hamgate/blacklist.hpp"

#include <algorithm>
#include <array>
#include <mutex>

namespace hamgate {

namespace {

constexpr std::array<std::string_view, 23> kInternetMeasurementCidrs = {
    "87.236.176.0/24",
    "193.163.125.0/24",
    "68.183.53.77/32",
    "104.248.203.191/32",
    "104.248.204.195/32",
    "142.93.191.98/32",
    "157.245.216.203/32",
    "165.22.39.64/32",
    "167.99.209.184/32",
    "188.166.26.88/32",
    "206.189.7.178/32",
    "209.97.152.248/32",
    "2a06:4880::/32",
    "2604:a880:800:10::c4b:f000/124",
    "2604:a880:800:10::c51:a000/124",
    "2604:a880:800:10::c52:d000/124",
    "2604:a880:800:10::c55:5000/124",
    "2604:a880:800:10::c56:b000/124",
    "2a03:b0c0:2:d0::153e:a000/124",
    "2a03:b0c0:2:d0::1576:8000/124",
    "2a03:b0c0:2:d0::1577:7000/124",
    "2a03:b0c0:2:d0::1579:e000/124",
    "2a03:b0c0:2:d0::157c:a000/124",
};

}  // namespace

std::vector<IpNetwork> internet_measurement_ranges() {
    std::vector<IpNetwork> ranges;
    ranges.reserve(kInternetMeasurementCidrs.size());
    for (std::string_view cidr : kInternetMeasurementCidrs) {
        if (auto net = IpNetwork::parse(cidr)) {
            ranges.push_back(*net);
        }
    }
    return ranges;
}

Blacklist Blacklist::with_defaults() {
    Blacklist blacklist;
    blacklist.add(std::string(kInternetMeasurementLabel), internet_measurement_ranges());
    return blacklist;
}

Blacklist::Blacklist(Blacklist&& other) noexcept {
    std::unique_lock<std::shared_mutex> lock(other.mutex_);
    entries_ = std::move(other.entries_);
}

bool Blacklist::add(std::string label, std::vector<IpNetwork> ranges) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.first == label; });
    if (it != entries_.end()) {
        return false;
    }

    entries_.emplace_back(std::move(label), std::move(ranges));
    return true;
}

std::optional<std::string> Blacklist::check(const IpAddress& address) const {
    const IpAddress normalized = address.normalized();

    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [label, ranges] : entries_) {
        for (const auto& range : ranges) {
            if (range.contains(normalized)) {
                return label;
            }
        }
    }
    return std::nullopt;
}

std::size_t Blacklist::label_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

std::size_t Blacklist::range_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& entry : entries_) {
        total += entry.second.size();
    }
    return total;
}

}  // namespace hamgate
