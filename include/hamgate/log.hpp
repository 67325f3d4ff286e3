#pragma once

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace hamgate {

enum class Severity : std::uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

constexpr std::string_view severity_to_string(Severity s) noexcept {
    switch (s) {
        case Severity::Debug: return "debug";
        case Severity::Info:  return "info";
        case Severity::Warn:  return "warn";
        case Severity::Error: return "error";
    }
    return "unknown";
}

// ============================================================================
// Logger Interface
//
// Destination for diagnostic lines from listeners and the router.
// Implementations must tolerate concurrent calls from the receive loop and
// from worker threads.
// ============================================================================

class Logger {
public:
    virtual ~Logger() = default;

    // Write one complete line (no trailing newline).
    // Contract: must not throw, should not block for long.
    virtual void write(Severity severity, std::string_view line) noexcept = 0;

    // Cheap pre-check so callers can skip formatting
    [[nodiscard]] virtual bool enabled(Severity /*severity*/) const noexcept { return true; }
};

// ============================================================================
// NullLogger: Discards everything
// ============================================================================

class NullLogger final : public Logger {
public:
    void write(Severity /*severity*/, std::string_view /*line*/) noexcept override {}

    [[nodiscard]] bool enabled(Severity /*severity*/) const noexcept override { return false; }
};

// ============================================================================
// StderrLogger: "HH:MM:SS warn  [udp] message" lines on stderr
// ============================================================================

class StderrLogger final : public Logger {
public:
    explicit StderrLogger(std::string component, Severity min_severity = Severity::Info)
        : component_(std::move(component))
        , min_severity_(min_severity) {}

    void write(Severity severity, std::string_view line) noexcept override;

    [[nodiscard]] bool enabled(Severity severity) const noexcept override {
        return static_cast<std::uint8_t>(severity) >= static_cast<std::uint8_t>(min_severity_);
    }

private:
    std::string component_;
    Severity min_severity_;
    std::mutex mutex_;  // keeps lines from interleaving
};

// Longest formatted line; longer output is truncated
inline constexpr std::size_t kMaxLogLineBytes = 512;

// printf-style formatting into a bounded stack buffer.
// Never allocates, never throws.
void logf(Logger& logger, Severity severity, const char* format, ...) noexcept
    __attribute__((format(printf, 3, 4)));

}  // namespace hamgate
