#pragma once

// Shared fixtures for the hamgate test executables.

#include "hamgate/ip_address.hpp"
#include "hamgate/log.hpp"
#include "hamgate/message_handler.hpp"
#include "hamgate/messages.hpp"
#include "hamgate/rate_limiter.hpp"

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace hamgate_test {

// Fake clock for testing
class FakeClock {
public:
    std::chrono::steady_clock::time_point now() const { return current_; }

    void advance(std::chrono::steady_clock::duration d) { current_ += d; }

    hamgate::Clock as_clock() {
        return [this]() { return this->now(); };
    }

private:
    std::chrono::steady_clock::time_point current_ =
        std::chrono::steady_clock::time_point{} + std::chrono::hours(1);
};

// Keeps every line for inspection
class CapturingLogger final : public hamgate::Logger {
public:
    void write(hamgate::Severity severity, std::string_view line) noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.emplace_back(severity, std::string(line));
    }

    [[nodiscard]] bool enabled(hamgate::Severity /*severity*/) const noexcept override { return true; }

    [[nodiscard]] bool contains(std::string_view needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : lines_) {
            if (entry.second.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] std::size_t count(hamgate::Severity severity) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& entry : lines_) {
            if (entry.first == severity) {
                ++n;
            }
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<hamgate::Severity, std::string>> lines_;
};

// Records which handler operation ran, with what, from whom
class RecordingHandler final : public hamgate::MessageHandler {
public:
    struct Call {
        hamgate::PayloadKind kind;
        hamgate::Endpoint source;
    };

    void handle_app_info(const hamgate::AppInfo& m, const hamgate::Endpoint& s, std::stop_token) override {
        record(hamgate::PayloadKind::AppInfo, s, [&] { last_app_info = m; });
    }
    void handle_contact_info(const hamgate::ContactInfo& m, const hamgate::Endpoint& s, std::stop_token) override {
        record(hamgate::PayloadKind::ContactInfo, s, [&] { last_contact = m; });
    }
    void handle_contact_replace(const hamgate::ContactReplace& m, const hamgate::Endpoint& s, std::stop_token) override {
        record(hamgate::PayloadKind::ContactReplace, s, [&] { last_contact = m; });
    }
    void handle_contact_delete(const hamgate::ContactDelete& m, const hamgate::Endpoint& s, std::stop_token) override {
        record(hamgate::PayloadKind::ContactDelete, s, [&] { last_delete = m; });
    }
    void handle_lookup_info(const hamgate::LookupInfo& m, const hamgate::Endpoint& s, std::stop_token) override {
        record(hamgate::PayloadKind::LookupInfo, s, [&] { last_contact = m; });
    }
    void handle_spot(const hamgate::Spot& m, const hamgate::Endpoint& s, std::stop_token) override {
        record(hamgate::PayloadKind::Spot, s, [&] { last_spot = m; });
    }
    void handle_dynamic_results(const hamgate::DynamicResults& m, const hamgate::Endpoint& s, std::stop_token) override {
        record(hamgate::PayloadKind::DynamicResults, s, [&] { last_results = m; });
    }
    void handle_radio_info(const hamgate::RadioInfo& m, const hamgate::Endpoint& s, std::stop_token) override {
        record(hamgate::PayloadKind::RadioInfo, s, [&] { last_radio = m; });
    }

    [[nodiscard]] std::size_t total() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    [[nodiscard]] std::size_t count(hamgate::PayloadKind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& c : calls_) {
            if (c.kind == kind) {
                ++n;
            }
        }
        return n;
    }

    [[nodiscard]] std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    // Block until at least `n` calls arrived or the timeout passed
    bool wait_for_total(std::size_t n, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return arrived_.wait_for(lock, timeout, [&] { return calls_.size() >= n; });
    }

    // Guarded by the handler mutex; read only after wait_for_total()
    hamgate::AppInfo last_app_info;
    hamgate::ContactInfo last_contact;
    hamgate::ContactDelete last_delete;
    hamgate::Spot last_spot;
    hamgate::DynamicResults last_results;
    hamgate::RadioInfo last_radio;

private:
    void record(hamgate::PayloadKind kind, const hamgate::Endpoint& source,
                const std::function<void()>& keep) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            keep();
            calls_.push_back(Call{.kind = kind, .source = source});
        }
        arrived_.notify_all();
    }

    mutable std::mutex mutex_;
    std::condition_variable arrived_;
    std::vector<Call> calls_;
};

// Poll `done` until it holds or the timeout passes
inline bool wait_until(const std::function<bool()>& done,
                       std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (done()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return done();
}

inline sockaddr_in loopback(std::uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    return addr;
}

// Client socket bound to 127.0.0.1; returns its local port through `port_out`
inline int udp_client(std::uint16_t* port_out = nullptr) {
    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        return -1;
    }
    sockaddr_in local = loopback(0);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
        ::close(fd);
        return -1;
    }
    if (port_out) {
        socklen_t len = sizeof(local);
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len);
        *port_out = ntohs(local.sin_port);
    }
    return fd;
}

inline bool udp_send(int fd, std::uint16_t port, std::string_view payload) {
    sockaddr_in dest = loopback(port);
    ssize_t n = ::sendto(fd, payload.data(), payload.size(), 0,
                         reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    return n == static_cast<ssize_t>(payload.size());
}

// Connect, send, half-close. Returns the connected fd (caller closes) or -1.
inline int tcp_send(std::uint16_t port, std::string_view payload, bool half_close = true) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }
    sockaddr_in dest = loopback(port);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&dest), sizeof(dest)) < 0) {
        ::close(fd);
        return -1;
    }
    std::size_t offset = 0;
    while (offset < payload.size()) {
        ssize_t n = ::send(fd, payload.data() + offset, payload.size() - offset, MSG_NOSIGNAL);
        if (n <= 0) {
            break;
        }
        offset += static_cast<std::size_t>(n);
    }
    if (half_close) {
        ::shutdown(fd, SHUT_WR);
    }
    return fd;
}

// True once the peer has closed the connection (recv returns 0 or fails)
inline bool wait_for_peer_close(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<long>(timeout.count() / 1000);
    tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    char byte = 0;
    ssize_t n = ::recv(fd, &byte, 1, 0);
    return n == 0 || (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK);
}

// A well-formed contact that passes the default validator
inline std::string sample_contact(std::string_view call = "K1ABC") {
    std::string xml = "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<contactinfo>";
    xml += "<app>N1MM</app><contestname>CQWWCW</contestname><contestnr>7</contestnr>";
    xml += "<timestamp>2024-11-23 14:05:09</timestamp>";
    xml += "<mycall>N0CALL</mycall><band>14</band><rxfreq>1402500</rxfreq><txfreq>1402500</txfreq>";
    xml += "<operator>N0OPR</operator><mode>CW</mode>";
    xml += "<call>" + std::string(call) + "</call>";
    xml += "<snt>599</snt><sntnr>12</sntnr><rcv>599</rcv><rcvnr>345</rcvnr>";
    xml += "<zone>5</zone><IsOriginal>True</IsOriginal>";
    xml += "<StationName>CONTEST-PC1</StationName><ID>abc123</ID>";
    xml += "</contactinfo>";
    return xml;
}

inline std::string sample_app_info() {
    return "<AppInfo><app>N1MM</app><dbname>contest.s3db</dbname><contestnr>3</contestnr>"
           "<contestname>ARRLDX</contestname><StationName>CONTEST-PC1</StationName></AppInfo>";
}

inline hamgate::Endpoint test_endpoint(std::uint16_t port = 50000) {
    return hamgate::Endpoint{.address = hamgate::IpAddress::v4(0xC0A80001), .port = port};  // 192.168.0.1
}

}  // namespace hamgate_test
