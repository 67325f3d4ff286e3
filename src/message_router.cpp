#include "hamgate/message_router.hpp"

#include "hamgate/decode_message.hpp"
#include "hamgate/xml_reader.hpp"

#include <exception>
#include <string>
#include <utility>
#include <variant>

namespace hamgate {

namespace {

// Payload type -> handler operation. One overload per Message alternative;
// a missing overload fails to compile.
struct DispatchTable {
    MessageHandler& handler;
    const Endpoint& source;
    std::stop_token stop;

    void operator()(const AppInfo& m) const        { handler.handle_app_info(m, source, stop); }
    void operator()(const ContactInfo& m) const    { handler.handle_contact_info(m, source, stop); }
    void operator()(const ContactReplace& m) const { handler.handle_contact_replace(m, source, stop); }
    void operator()(const ContactDelete& m) const  { handler.handle_contact_delete(m, source, stop); }
    void operator()(const LookupInfo& m) const     { handler.handle_lookup_info(m, source, stop); }
    void operator()(const Spot& m) const           { handler.handle_spot(m, source, stop); }
    void operator()(const DynamicResults& m) const { handler.handle_dynamic_results(m, source, stop); }
    void operator()(const RadioInfo& m) const      { handler.handle_radio_info(m, source, stop); }
};

}  // namespace

MessageRouter::MessageRouter(MessageHandler& handler, Logger& logger)
    : MessageRouter(handler, ValidatorRegistry::defaults(), logger) {}

MessageRouter::MessageRouter(MessageHandler& handler,
                             ValidatorRegistry validators,
                             Logger& logger,
                             TagRegistry tags)
    : handler_(handler)
    , logger_(logger)
    , validators_(std::move(validators))
    , tags_(std::move(tags)) {}

RouteOutcome MessageRouter::route(std::span<const std::byte> payload,
                                  const Endpoint& source,
                                  std::stop_token stop) noexcept {
    try {
        return run_pipeline(payload, source, std::move(stop));
    } catch (const std::exception& ex) {
        logf(logger_, Severity::Error, "error processing message from %s: %s",
             source.to_string().c_str(), ex.what());
        return finish(RouteOutcome::Faulted);
    } catch (...) {
        logf(logger_, Severity::Error, "error processing message from %s: unknown exception",
             source.to_string().c_str());
        return finish(RouteOutcome::Faulted);
    }
}

RouteOutcome MessageRouter::route(std::string_view payload,
                                  const Endpoint& source,
                                  std::stop_token stop) noexcept {
    return route(std::as_bytes(std::span<const char>(payload.data(), payload.size())),
                 source, std::move(stop));
}

std::uint64_t MessageRouter::total_routed() const noexcept {
    std::uint64_t total = 0;
    for (const auto& c : counts_) {
        total += c.load();
    }
    return total;
}

RouteOutcome MessageRouter::run_pipeline(std::span<const std::byte> payload,
                                         const Endpoint& source,
                                         std::stop_token stop) {
    // =========================================================================
    // Stage 1: Tag extraction
    // =========================================================================

    auto tag_result = read_root_tag(payload);
    if (auto* error = std::get_if<XmlError>(&tag_result)) {
        logf(logger_, Severity::Warn, "unreadable message from %s: %.*s",
             source.to_string().c_str(),
             static_cast<int>(to_string(*error).size()), to_string(*error).data());
        return finish(RouteOutcome::MalformedTag);
    }
    const std::string& tag = std::get<std::string>(tag_result);

    // =========================================================================
    // Stage 2: Type resolution
    // =========================================================================

    auto kind = tags_.resolve(tag);
    if (!kind) {
        logf(logger_, Severity::Warn, "unknown message type '%s' from %s",
             tag.c_str(), source.to_string().c_str());
        return finish(RouteOutcome::UnknownTag);
    }

    // =========================================================================
    // Stage 3: Decode
    // =========================================================================

    auto decoded = decode_message(*kind, payload);
    if (auto* failure = std::get_if<DecodeFailure>(&decoded)) {
        if (failure->error == DecodeError::MalformedXml) {
            logf(logger_, Severity::Warn, "cannot decode %s from %s: %.*s",
                 tag.c_str(), source.to_string().c_str(),
                 static_cast<int>(to_string(failure->xml_error).size()),
                 to_string(failure->xml_error).data());
        } else {
            logf(logger_, Severity::Warn, "cannot decode %s from %s: %.*s in <%.*s>",
                 tag.c_str(), source.to_string().c_str(),
                 static_cast<int>(to_string(failure->error).size()),
                 to_string(failure->error).data(),
                 static_cast<int>(failure->field.size()), failure->field.data());
        }
        return finish(RouteOutcome::DecodeFailed);
    }
    const Message& message = std::get<Message>(decoded);

    // =========================================================================
    // Stage 4: Validate
    // =========================================================================

    if (!validators_.validate(message)) {
        logf(logger_, Severity::Warn, "invalid message from %s: %s",
             source.to_string().c_str(), describe(message).c_str());
        return finish(RouteOutcome::ValidationFailed);
    }

    // =========================================================================
    // Stage 5: Dispatch
    // =========================================================================

    try {
        dispatch(message, source, std::move(stop));
    } catch (const std::exception& ex) {
        logf(logger_, Severity::Error, "handler failed for %s from %s: %s",
             tag.c_str(), source.to_string().c_str(), ex.what());
        return finish(RouteOutcome::HandlerFailed);
    } catch (...) {
        logf(logger_, Severity::Error, "handler failed for %s from %s: unknown exception",
             tag.c_str(), source.to_string().c_str());
        return finish(RouteOutcome::HandlerFailed);
    }

    if (logger_.enabled(Severity::Debug)) {
        logf(logger_, Severity::Debug, "dispatched %s from %s",
             tag.c_str(), source.to_string().c_str());
    }
    return finish(RouteOutcome::Dispatched);
}

void MessageRouter::dispatch(const Message& message, const Endpoint& source, std::stop_token stop) {
    std::visit(DispatchTable{.handler = handler_, .source = source, .stop = std::move(stop)}, message);
}

}  // namespace hamgate
