// Gateway Server Demo
//
// UDP and TCP listeners feeding one router; decoded messages are printed.
//
// Usage:
//   ./gateway_server [udp_port] [tcp_port] [--address A] [--rate N] [--verbose]
//
// Options:
//   udp_port  - UDP port to listen on (default: 12060, N1MM+ broadcast)
//   tcp_port  - TCP port to listen on (default: 12061, 0 disables TCP)
//   --address - Bind address (default: 127.0.0.1)
//   --rate    - Datagrams per minute per source (default: 60)
//   --verbose - Debug logging

#include "hamgate/blacklist.hpp"
#include "hamgate/config.hpp"
#include "hamgate/log.hpp"
#include "hamgate/message_handler.hpp"
#include "hamgate/message_router.hpp"
#include "hamgate/tcp_listener.hpp"
#include "hamgate/udp_listener.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace {

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

void signal_handler(int /*signum*/) {
    g_running = false;
}

// Prints one line per decoded message on stdout
class ConsoleMessageHandler final : public hamgate::MessageHandler {
public:
    void handle_app_info(const hamgate::AppInfo& m, const hamgate::Endpoint& source,
                         std::stop_token) override {
        print(source, hamgate::Message{m});
    }
    void handle_contact_info(const hamgate::ContactInfo& m, const hamgate::Endpoint& source,
                             std::stop_token) override {
        print(source, hamgate::Message{std::in_place_type<hamgate::ContactInfo>, m});
    }
    void handle_contact_replace(const hamgate::ContactReplace& m, const hamgate::Endpoint& source,
                                std::stop_token) override {
        print(source, hamgate::Message{std::in_place_type<hamgate::ContactReplace>, m});
    }
    void handle_contact_delete(const hamgate::ContactDelete& m, const hamgate::Endpoint& source,
                               std::stop_token) override {
        print(source, hamgate::Message{m});
    }
    void handle_lookup_info(const hamgate::LookupInfo& m, const hamgate::Endpoint& source,
                            std::stop_token) override {
        print(source, hamgate::Message{std::in_place_type<hamgate::LookupInfo>, m});
    }
    void handle_spot(const hamgate::Spot& m, const hamgate::Endpoint& source,
                     std::stop_token) override {
        print(source, hamgate::Message{m});
    }
    void handle_dynamic_results(const hamgate::DynamicResults& m, const hamgate::Endpoint& source,
                                std::stop_token) override {
        print(source, hamgate::Message{m});
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& qso : m.breakdown.qsos) {
            std::printf("    qsos %s/%s: %d\n", qso.band.c_str(), qso.mode.c_str(), qso.qso_count);
        }
        std::fflush(stdout);
    }
    void handle_radio_info(const hamgate::RadioInfo& m, const hamgate::Endpoint& source,
                           std::stop_token) override {
        print(source, hamgate::Message{m});
    }

    [[nodiscard]] std::uint64_t printed() const noexcept { return printed_.load(); }

private:
    void print(const hamgate::Endpoint& source, const hamgate::Message& message) {
        const std::string line = hamgate::describe(message);
        std::lock_guard<std::mutex> lock(mutex_);
        std::printf("[%s] %s\n", source.to_string().c_str(), line.c_str());
        std::fflush(stdout);
        ++printed_;
    }

    std::mutex mutex_;
    std::atomic<std::uint64_t> printed_{0};
};

void print_stats(const hamgate::MessageRouter& router,
                 const hamgate::UdpListener& udp,
                 const hamgate::TcpListener* tcp) {
    const auto u = udp.metrics();
    std::fprintf(stderr, "\n--- Stats ---\n");
    std::fprintf(stderr, "UDP received:     %lu\n", u.received);
    std::fprintf(stderr, "UDP blacklisted:  %lu\n", u.blacklisted);
    std::fprintf(stderr, "UDP rate limited: %lu\n", u.rate_limited);
    std::fprintf(stderr, "UDP oversized:    %lu\n", u.oversized);
    std::fprintf(stderr, "UDP queue drops:  %lu\n", u.queue_drops);
    std::fprintf(stderr, "Sources tracked:  %zu\n", udp.rate_limiter().tracked_count());
    if (tcp) {
        const auto t = tcp->metrics();
        std::fprintf(stderr, "TCP accepted:     %lu\n", t.accepted);
        std::fprintf(stderr, "TCP blacklisted:  %lu\n", t.blacklisted);
        std::fprintf(stderr, "TCP truncated:    %lu\n", t.truncated);
        std::fprintf(stderr, "TCP forwarded:    %lu\n", t.forwarded);
    }
    for (std::size_t i = 0; i < hamgate::kRouteOutcomeCount; ++i) {
        const auto outcome = static_cast<hamgate::RouteOutcome>(i);
        const auto name = hamgate::to_string(outcome);
        std::fprintf(stderr, "Router %-18.*s%lu\n",
                     static_cast<int>(name.size()), name.data(), router.count(outcome));
    }
    std::fprintf(stderr, "-------------\n\n");
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse arguments
    int udp_port = 12060;
    int tcp_port = 12061;
    std::string address = "127.0.0.1";
    std::uint32_t rate = 60;
    bool verbose = false;
    int positional = 0;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "--address") == 0 && i + 1 < argc) {
            address = argv[++i];
        } else if (std::strcmp(argv[i], "--rate") == 0 && i + 1 < argc) {
            rate = static_cast<std::uint32_t>(std::atoi(argv[++i]));
        } else if (positional == 0) {
            udp_port = std::atoi(argv[i]);
            ++positional;
        } else {
            tcp_port = std::atoi(argv[i]);
            ++positional;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    hamgate::StderrLogger logger("hamgate", verbose ? hamgate::Severity::Debug
                                                    : hamgate::Severity::Info);
    ConsoleMessageHandler handler;
    hamgate::MessageRouter router(handler, logger);
    const hamgate::Blacklist blacklist = hamgate::Blacklist::with_defaults();

    hamgate::ServerConfig udp_config;
    udp_config.address = address;
    udp_config.port = udp_port;
    udp_config.requests_per_minute_per_source = rate;

    auto udp_result = hamgate::UdpListener::create(udp_config, router, blacklist, logger);
    if (auto* error = std::get_if<hamgate::SetupError>(&udp_result)) {
        std::fprintf(stderr, "Failed to create UDP listener on %s:%d: %s\n",
                     address.c_str(), udp_port, std::string(hamgate::to_string(error->code)).c_str());
        return EXIT_FAILURE;
    }
    auto udp = std::move(std::get<std::unique_ptr<hamgate::UdpListener>>(udp_result));

    std::unique_ptr<hamgate::TcpListener> tcp;
    if (tcp_port != 0) {
        hamgate::ServerConfig tcp_config;
        tcp_config.address = address;
        tcp_config.port = tcp_port;

        auto tcp_result = hamgate::TcpListener::create(tcp_config, router, blacklist, logger);
        if (auto* error = std::get_if<hamgate::SetupError>(&tcp_result)) {
            std::fprintf(stderr, "Failed to create TCP listener on %s:%d: %s\n",
                         address.c_str(), tcp_port, std::string(hamgate::to_string(error->code)).c_str());
            return EXIT_FAILURE;
        }
        tcp = std::move(std::get<std::unique_ptr<hamgate::TcpListener>>(tcp_result));
    }

    // One cancellation signal shared by both listeners
    std::stop_source stop_source;

    if (auto r = udp->start(stop_source); r != hamgate::LifecycleResult::Ok) {
        std::fprintf(stderr, "UDP start failed: %s\n", std::string(hamgate::to_string(r)).c_str());
        return EXIT_FAILURE;
    }
    if (tcp) {
        if (auto r = tcp->start(stop_source); r != hamgate::LifecycleResult::Ok) {
            std::fprintf(stderr, "TCP start failed: %s\n", std::string(hamgate::to_string(r)).c_str());
            return EXIT_FAILURE;
        }
    }

    std::fprintf(stderr, "Gateway ready (%zu blacklisted ranges). Press Ctrl+C to stop.\n",
                 blacklist.range_count());

    auto last_stats_time = std::chrono::steady_clock::now();
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        auto now = std::chrono::steady_clock::now();
        if (now - last_stats_time >= std::chrono::seconds(10)) {
            print_stats(router, *udp, tcp.get());
            last_stats_time = now;
        }
    }

    std::fprintf(stderr, "\nShutting down...\n");
    if (udp->stop() != hamgate::LifecycleResult::Ok) {
        std::fprintf(stderr, "UDP listener was not running\n");
    }
    if (tcp && tcp->stop() != hamgate::LifecycleResult::Ok) {
        std::fprintf(stderr, "TCP listener was not running\n");
    }
    udp->dispose();
    if (tcp) {
        tcp->dispose();
    }

    print_stats(router, *udp, tcp.get());
    std::fprintf(stderr, "Printed %lu messages. Goodbye.\n", handler.printed());
    return EXIT_SUCCESS;
}
