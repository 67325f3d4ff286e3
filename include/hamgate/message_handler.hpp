#pragma once

#include "hamgate/ip_address.hpp"
#include "hamgate/messages.hpp"

#include <atomic>
#include <cstdint>
#include <stop_token>

namespace hamgate {

// ============================================================================
// MessageHandler Interface
//
// Consumer of decoded and validated payloads. Exactly one operation exists
// per payload kind; the router never calls more than one per message.
//
// Contract:
// - Called from worker threads, possibly concurrently
// - Must not block indefinitely; `stop` is requested when the listener stops
// - May throw std::exception; the router logs it and moves on
// ============================================================================

class MessageHandler {
public:
    virtual ~MessageHandler() = default;

    virtual void handle_app_info(const AppInfo& message, const Endpoint& source, std::stop_token stop) = 0;
    virtual void handle_contact_info(const ContactInfo& message, const Endpoint& source, std::stop_token stop) = 0;
    virtual void handle_contact_replace(const ContactReplace& message, const Endpoint& source, std::stop_token stop) = 0;
    virtual void handle_contact_delete(const ContactDelete& message, const Endpoint& source, std::stop_token stop) = 0;
    virtual void handle_lookup_info(const LookupInfo& message, const Endpoint& source, std::stop_token stop) = 0;
    virtual void handle_spot(const Spot& message, const Endpoint& source, std::stop_token stop) = 0;
    virtual void handle_dynamic_results(const DynamicResults& message, const Endpoint& source, std::stop_token stop) = 0;
    virtual void handle_radio_info(const RadioInfo& message, const Endpoint& source, std::stop_token stop) = 0;
};

// ============================================================================
// NullMessageHandler: Counts and discards (for testing/benchmarking)
// ============================================================================

class NullMessageHandler final : public MessageHandler {
public:
    void handle_app_info(const AppInfo&, const Endpoint&, std::stop_token) override { ++count_; }
    void handle_contact_info(const ContactInfo&, const Endpoint&, std::stop_token) override { ++count_; }
    void handle_contact_replace(const ContactReplace&, const Endpoint&, std::stop_token) override { ++count_; }
    void handle_contact_delete(const ContactDelete&, const Endpoint&, std::stop_token) override { ++count_; }
    void handle_lookup_info(const LookupInfo&, const Endpoint&, std::stop_token) override { ++count_; }
    void handle_spot(const Spot&, const Endpoint&, std::stop_token) override { ++count_; }
    void handle_dynamic_results(const DynamicResults&, const Endpoint&, std::stop_token) override { ++count_; }
    void handle_radio_info(const RadioInfo&, const Endpoint&, std::stop_token) override { ++count_; }

    [[nodiscard]] std::uint64_t handled_count() const noexcept { return count_.load(); }

private:
    std::atomic<std::uint64_t> count_{0};
};

}  // namespace hamgate
