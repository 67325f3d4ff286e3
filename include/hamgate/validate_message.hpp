#pragma once

#include "hamgate/messages.hpp"

#include <array>
#include <functional>

namespace hamgate {

// ============================================================================
// Semantic validation of decoded payloads.
//
// A kind without a registered predicate is always valid.
// ============================================================================

using Validator = std::function<bool(const Message&)>;

// Bare minimum for a usable QSO: a call, someone who logged it (station
// name or operator), a timestamp and a mode.
bool contact_has_bare_minimum(const ContactInfo& contact) noexcept;

class ValidatorRegistry {
public:
    ValidatorRegistry() = default;

    // Only ContactInfo is checked (contact_has_bare_minimum)
    static ValidatorRegistry defaults();

    void set(PayloadKind kind, Validator validator);
    void clear(PayloadKind kind);

    [[nodiscard]] bool has(PayloadKind kind) const noexcept;

    // True if no predicate is registered for the message's kind.
    // A throwing predicate propagates to the caller.
    [[nodiscard]] bool validate(const Message& message) const;

private:
    std::array<Validator, kPayloadKindCount> validators_;
};

}  // namespace hamgate
