#include "hamgate/udp_listener.hpp"

#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>

#include <unistd.h>

namespace {

using hamgate::PayloadKind;
using hamgate_test::CapturingLogger;
using hamgate_test::RecordingHandler;
using hamgate_test::wait_until;

hamgate::ServerConfig loopback_config(int port) {
    hamgate::ServerConfig config;
    config.address = "127.0.0.1";
    config.port = port;
    config.worker_threads = 2;
    return config;
}

std::unique_ptr<hamgate::UdpListener> make_listener(const hamgate::ServerConfig& config,
                                                    hamgate::MessageRouter& router,
                                                    const hamgate::Blacklist& blacklist,
                                                    hamgate::Logger& logger,
                                                    hamgate::Clock clock = hamgate::default_clock) {
    auto result = hamgate::UdpListener::create(config, router, blacklist, logger, std::move(clock));
    if (auto* error = std::get_if<hamgate::SetupError>(&result)) {
        auto text = hamgate::to_string(error->code);
        std::printf("create() failed on port %d: %.*s (errno %d)\n", config.port,
                    static_cast<int>(text.size()), text.data(), error->sys_errno);
        return nullptr;
    }
    return std::move(std::get<std::unique_ptr<hamgate::UdpListener>>(result));
}

// Closes the client socket on scope exit
struct ClientSocket {
    int fd = -1;
    std::uint16_t port = 0;
    ClientSocket() { fd = hamgate_test::udp_client(&port); }
    ~ClientSocket() {
        if (fd >= 0) {
            ::close(fd);
        }
    }
};

bool test_datagram_reaches_handler() {
    RecordingHandler handler;
    hamgate::NullLogger logger;
    hamgate::MessageRouter router(handler, logger);
    hamgate::Blacklist blacklist = hamgate::Blacklist::with_defaults();

    auto listener = make_listener(loopback_config(47201), router, blacklist, logger);
    if (!listener || listener->start() != hamgate::LifecycleResult::Ok) {
        return false;
    }

    ClientSocket client;
    if (!hamgate_test::udp_send(client.fd, 47201, hamgate_test::sample_contact("DL1ABC"))) {
        std::printf("sendto failed\n");
        return false;
    }
    if (!handler.wait_for_total(1, std::chrono::seconds(3))) {
        std::printf("Datagram never reached the handler\n");
        return false;
    }

    auto calls = handler.calls();
    const hamgate::Endpoint expected{.address = hamgate::IpAddress::v4(0x7F000001), .port = client.port};
    if (calls[0].kind != PayloadKind::ContactInfo || !(calls[0].source == expected)) {
        std::printf("Wrong kind or source (%s)\n", calls[0].source.to_string().c_str());
        return false;
    }
    if (handler.last_contact.call != "DL1ABC") {
        std::printf("Decoded call wrong\n");
        return false;
    }

    (void)listener->stop();
    listener->dispose();
    const auto m = listener->metrics();
    if (m.received != 1 || m.queued != 1) {
        std::printf("Expected 1 received / 1 queued, got %lu / %lu\n", m.received, m.queued);
        return false;
    }
    return true;
}

bool test_rate_limit_drops_61st() {
    RecordingHandler handler;
    CapturingLogger logger;
    hamgate::MessageRouter router(handler, logger);
    hamgate::Blacklist blacklist;

    auto config = loopback_config(47202);
    config.requests_per_minute_per_source = 60;
    auto listener = make_listener(config, router, blacklist, logger);
    if (!listener || listener->start() != hamgate::LifecycleResult::Ok) {
        return false;
    }

    ClientSocket client;
    const std::string xml = hamgate_test::sample_app_info();
    for (int i = 0; i < 61; ++i) {
        if (!hamgate_test::udp_send(client.fd, 47202, xml)) {
            std::printf("sendto #%d failed\n", i);
            return false;
        }
    }

    if (!wait_until([&] { return listener->metrics().received == 61; })) {
        std::printf("Expected 61 datagrams received, got %lu\n", listener->metrics().received);
        return false;
    }
    if (!handler.wait_for_total(60, std::chrono::seconds(3))) {
        std::printf("Expected 60 handled, got %zu\n", handler.total());
        return false;
    }
    listener->dispose();

    if (handler.total() != 60 || listener->metrics().rate_limited != 1) {
        std::printf("Expected 60 handled / 1 rate limited, got %zu / %lu\n",
                    handler.total(), listener->metrics().rate_limited);
        return false;
    }
    if (!logger.contains("rate limit exceeded")) {
        std::printf("Rate limit drop should be logged\n");
        return false;
    }
    return true;
}

bool test_blacklisted_sender_dropped() {
    RecordingHandler handler;
    CapturingLogger logger;
    hamgate::MessageRouter router(handler, logger);
    hamgate::Blacklist blacklist;
    blacklist.add("loopback-lab", {*hamgate::IpNetwork::parse("127.0.0.0/8")});

    auto listener = make_listener(loopback_config(47203), router, blacklist, logger);
    if (!listener || listener->start() != hamgate::LifecycleResult::Ok) {
        return false;
    }

    ClientSocket client;
    (void)hamgate_test::udp_send(client.fd, 47203, hamgate_test::sample_app_info());

    if (!wait_until([&] { return listener->metrics().blacklisted == 1; })) {
        std::printf("Datagram should be counted as blacklisted\n");
        return false;
    }
    listener->dispose();

    if (handler.total() != 0) {
        std::printf("Blacklisted datagram must not reach the handler\n");
        return false;
    }
    // Blacklisted senders never get rate limiter state
    if (listener->rate_limiter().tracked_count() != 0) {
        std::printf("Blacklisted sender should not be tracked\n");
        return false;
    }
    if (!logger.contains("loopback-lab")) {
        std::printf("Blacklist label should be logged\n");
        return false;
    }
    return true;
}

bool test_empty_and_oversized_dropped() {
    RecordingHandler handler;
    hamgate::NullLogger logger;
    hamgate::MessageRouter router(handler, logger);
    hamgate::Blacklist blacklist;

    auto config = loopback_config(47204);
    config.buffer_size = 256;
    auto listener = make_listener(config, router, blacklist, logger);
    if (!listener || listener->start() != hamgate::LifecycleResult::Ok) {
        return false;
    }
    if (listener->buffer_size() != 256) {
        std::printf("Configured buffer size not applied\n");
        return false;
    }

    ClientSocket client;
    std::string big = "<AppInfo><app>" + std::string(400, 'x') + "</app></AppInfo>";
    (void)hamgate_test::udp_send(client.fd, 47204, "");
    (void)hamgate_test::udp_send(client.fd, 47204, big);
    (void)hamgate_test::udp_send(client.fd, 47204, hamgate_test::sample_app_info());

    if (!handler.wait_for_total(1, std::chrono::seconds(3))) {
        std::printf("Small datagram should still be handled\n");
        return false;
    }
    if (!wait_until([&] { return listener->metrics().received == 3; })) {
        return false;
    }
    listener->dispose();

    const auto m = listener->metrics();
    if (m.empty != 1 || m.oversized != 1 || handler.total() != 1) {
        std::printf("Expected 1 empty / 1 oversized / 1 handled, got %lu / %lu / %zu\n",
                    m.empty, m.oversized, handler.total());
        return false;
    }
    return true;
}

bool test_idle_sources_swept() {
    RecordingHandler handler;
    hamgate::NullLogger logger;
    hamgate::MessageRouter router(handler, logger);
    hamgate::Blacklist blacklist;

    // Shifted clock shared with the receive loop thread
    std::atomic<std::int64_t> offset_minutes{0};
    hamgate::Clock clock = [&offset_minutes] {
        return std::chrono::steady_clock::now() + std::chrono::minutes(offset_minutes.load());
    };

    auto listener = make_listener(loopback_config(47205), router, blacklist, logger, clock);
    if (!listener || listener->start() != hamgate::LifecycleResult::Ok) {
        return false;
    }

    ClientSocket client;
    (void)hamgate_test::udp_send(client.fd, 47205, hamgate_test::sample_app_info());
    if (!wait_until([&] { return listener->rate_limiter().tracked_count() == 1; })) {
        std::printf("Sender should be tracked\n");
        return false;
    }

    offset_minutes = 20;
    if (!wait_until([&] { return listener->rate_limiter().tracked_count() == 0; })) {
        std::printf("Idle sender should be swept by the receive loop\n");
        return false;
    }
    listener->dispose();
    return true;
}

bool test_stop_then_restart() {
    RecordingHandler handler;
    hamgate::NullLogger logger;
    hamgate::MessageRouter router(handler, logger);
    hamgate::Blacklist blacklist;

    auto listener = make_listener(loopback_config(47206), router, blacklist, logger);
    if (!listener) {
        return false;
    }
    if (listener->start() != hamgate::LifecycleResult::Ok ||
        listener->stop() != hamgate::LifecycleResult::Ok ||
        listener->start() != hamgate::LifecycleResult::Ok) {
        std::printf("start/stop/start should succeed\n");
        return false;
    }

    ClientSocket client;
    (void)hamgate_test::udp_send(client.fd, 47206, hamgate_test::sample_app_info());
    if (!handler.wait_for_total(1, std::chrono::seconds(3))) {
        std::printf("Restarted listener should receive\n");
        return false;
    }

    listener->dispose();
    listener->dispose();
    if (listener->state() != hamgate::LifecycleState::Disposed ||
        listener->start() != hamgate::LifecycleResult::Disposed) {
        std::printf("Disposed listener must not restart\n");
        return false;
    }
    return true;
}

bool test_loop_survives_fault() {
    RecordingHandler handler;
    CapturingLogger logger;
    hamgate::MessageRouter router(handler, logger);
    hamgate::Blacklist blacklist;

    // Fails the next N readings, taken on the receive loop thread
    std::atomic<int> failures_left{0};
    hamgate::Clock clock = [&failures_left] {
        if (failures_left.load() > 0) {
            --failures_left;
            throw std::runtime_error("clock source lost");
        }
        return std::chrono::steady_clock::now();
    };

    auto listener = make_listener(loopback_config(47208), router, blacklist, logger, clock);
    if (!listener || listener->start() != hamgate::LifecycleResult::Ok) {
        return false;
    }

    failures_left = 1;
    if (!wait_until([&] { return listener->metrics().loop_faults == 1; })) {
        std::printf("Fault inside the loop should be counted\n");
        return false;
    }
    if (!logger.contains("clock source lost") || !listener->is_running()) {
        std::printf("Fault should be logged and the listener keep running\n");
        return false;
    }

    ClientSocket client;
    (void)hamgate_test::udp_send(client.fd, 47208, hamgate_test::sample_app_info());
    if (!handler.wait_for_total(1, std::chrono::seconds(3))) {
        std::printf("Loop should keep receiving after a fault\n");
        return false;
    }
    listener->dispose();
    return true;
}

bool test_create_rejects_bad_config() {
    RecordingHandler handler;
    hamgate::NullLogger logger;
    hamgate::MessageRouter router(handler, logger);
    hamgate::Blacklist blacklist;

    auto config = loopback_config(47207);
    config.requests_per_minute_per_source = 0;
    auto result = hamgate::UdpListener::create(config, router, blacklist, logger);
    const auto* error = std::get_if<hamgate::SetupError>(&result);
    if (!error || error->code != hamgate::SetupErrorCode::InvalidRateLimit) {
        std::printf("Zero rate should fail at create()\n");
        return false;
    }

    config = loopback_config(0);
    result = hamgate::UdpListener::create(config, router, blacklist, logger);
    error = std::get_if<hamgate::SetupError>(&result);
    if (!error || error->code != hamgate::SetupErrorCode::InvalidPort) {
        std::printf("Port 0 should fail at create()\n");
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!test_datagram_reaches_handler()) {
        std::printf("test_datagram_reaches_handler failed\n");
        return EXIT_FAILURE;
    }

    if (!test_rate_limit_drops_61st()) {
        std::printf("test_rate_limit_drops_61st failed\n");
        return EXIT_FAILURE;
    }

    if (!test_blacklisted_sender_dropped()) {
        std::printf("test_blacklisted_sender_dropped failed\n");
        return EXIT_FAILURE;
    }

    if (!test_empty_and_oversized_dropped()) {
        std::printf("test_empty_and_oversized_dropped failed\n");
        return EXIT_FAILURE;
    }

    if (!test_idle_sources_swept()) {
        std::printf("test_idle_sources_swept failed\n");
        return EXIT_FAILURE;
    }

    if (!test_stop_then_restart()) {
        std::printf("test_stop_then_restart failed\n");
        return EXIT_FAILURE;
    }

    if (!test_loop_survives_fault()) {
        std::printf("test_loop_survives_fault failed\n");
        return EXIT_FAILURE;
    }

    if (!test_create_rejects_bad_config()) {
        std::printf("test_create_rejects_bad_config failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All udp_listener tests passed\n");
    return EXIT_SUCCESS;
}
