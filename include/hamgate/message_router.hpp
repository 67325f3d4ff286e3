#pragma once

#include "hamgate/ip_address.hpp"
#include "hamgate/log.hpp"
#include "hamgate/message_handler.hpp"
#include "hamgate/messages.hpp"
#include "hamgate/validate_message.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stop_token>
#include <string_view>

namespace hamgate {

// Where a message left the pipeline
enum class RouteOutcome : std::uint8_t {
    Dispatched = 0,        // handler operation returned
    MalformedTag = 1,      // root element name unreadable
    UnknownTag = 2,        // no kind registered for the tag
    DecodeFailed = 3,      // XML or field decoding failed
    ValidationFailed = 4,  // validator rejected the payload
    HandlerFailed = 5,     // handler threw
    Faulted = 6,           // unexpected exception elsewhere (e.g. allocation)
};

inline constexpr std::size_t kRouteOutcomeCount = 7;

constexpr std::string_view to_string(RouteOutcome outcome) noexcept {
    switch (outcome) {
        case RouteOutcome::Dispatched:       return "dispatched";
        case RouteOutcome::MalformedTag:     return "malformed tag";
        case RouteOutcome::UnknownTag:       return "unknown tag";
        case RouteOutcome::DecodeFailed:     return "decode failed";
        case RouteOutcome::ValidationFailed: return "validation failed";
        case RouteOutcome::HandlerFailed:    return "handler failed";
        case RouteOutcome::Faulted:          return "faulted";
    }
    return "unknown";
}

// ============================================================================
// MessageRouter
//
// Raw bytes -> tag -> kind -> decode -> validate -> dispatch, with an early
// exit at each stage.
//
// Invariants enforced:
// - route() never throws; every drop is logged and counted
// - Each kind reaches exactly one handler operation
// - Tag and validator registries are fixed at construction
//
// Thread safety: route() may be called concurrently.
// ============================================================================

class MessageRouter {
public:
    // Default tags, default validators
    MessageRouter(MessageHandler& handler, Logger& logger);

    MessageRouter(MessageHandler& handler,
                  ValidatorRegistry validators,
                  Logger& logger,
                  TagRegistry tags = TagRegistry::defaults());

    MessageRouter(const MessageRouter&) = delete;
    MessageRouter& operator=(const MessageRouter&) = delete;

    // Process one message from `source`.
    RouteOutcome route(std::span<const std::byte> payload,
                       const Endpoint& source,
                       std::stop_token stop = {}) noexcept;

    // Convenience overload for string_view
    RouteOutcome route(std::string_view payload,
                       const Endpoint& source,
                       std::stop_token stop = {}) noexcept;

    [[nodiscard]] std::optional<PayloadKind> resolve(std::string_view tag) const {
        return tags_.resolve(tag);
    }

    // Metrics
    [[nodiscard]] std::uint64_t count(RouteOutcome outcome) const noexcept {
        return counts_[static_cast<std::size_t>(outcome)].load();
    }
    [[nodiscard]] std::uint64_t total_routed() const noexcept;

private:
    RouteOutcome run_pipeline(std::span<const std::byte> payload,
                              const Endpoint& source,
                              std::stop_token stop);

    void dispatch(const Message& message, const Endpoint& source, std::stop_token stop);

    RouteOutcome finish(RouteOutcome outcome) noexcept {
        ++counts_[static_cast<std::size_t>(outcome)];
        return outcome;
    }

    MessageHandler& handler_;
    Logger& logger_;
    const ValidatorRegistry validators_;
    const TagRegistry tags_;

    std::array<std::atomic<std::uint64_t>, kRouteOutcomeCount> counts_{};
};

}  // namespace hamgate
