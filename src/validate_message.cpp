#include "hamgate/validate_message.hpp"

#include <utility>

namespace hamgate {

namespace {

bool is_blank(const std::string& s) noexcept {
    for (char c : s) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            return false;
        }
    }
    return true;
}

std::size_t slot(PayloadKind kind) noexcept {
    return static_cast<std::size_t>(kind);
}

}  // namespace

bool contact_has_bare_minimum(const ContactInfo& contact) noexcept {
    if (is_blank(contact.call)) {
        return false;
    }
    if (is_blank(contact.station_name) && is_blank(contact.operator_call)) {
        return false;
    }
    if (!contact.timestamp) {
        return false;
    }
    return !is_blank(contact.mode);
}

ValidatorRegistry ValidatorRegistry::defaults() {
    ValidatorRegistry registry;
    registry.set(PayloadKind::ContactInfo, [](const Message& message) {
        const auto* contact = std::get_if<ContactInfo>(&message);
        return contact != nullptr && contact_has_bare_minimum(*contact);
    });
    return registry;
}

void ValidatorRegistry::set(PayloadKind kind, Validator validator) {
    validators_[slot(kind)] = std::move(validator);
}

void ValidatorRegistry::clear(PayloadKind kind) {
    validators_[slot(kind)] = nullptr;
}

bool ValidatorRegistry::has(PayloadKind kind) const noexcept {
    return static_cast<bool>(validators_[slot(kind)]);
}

bool ValidatorRegistry::validate(const Message& message) const {
    const auto& validator = validators_[slot(kind_of(message))];
    if (!validator) {
        return true;
    }
    return validator(message);
}

}  // namespace hamgate
