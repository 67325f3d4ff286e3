#include "hamgate/validate_config.hpp"

#include "hamgate/ip_address.hpp"

namespace hamgate {

std::optional<SetupErrorCode> validate_server_config(
    const ServerConfig& config,
    bool rate_limited
) noexcept {
    if (!IpAddress::parse(config.address)) {
        return SetupErrorCode::InvalidAddress;
    }

    if (!validate_port(config.port)) {
        return SetupErrorCode::InvalidPort;
    }

    if (config.buffer_size && *config.buffer_size > kMaxBufferSize) {
        return SetupErrorCode::InvalidBufferSize;
    }

    if (config.worker_threads == 0 || config.max_pending_tasks == 0) {
        return SetupErrorCode::InvalidWorkerCount;
    }

    if (rate_limited) {
        if (config.requests_per_minute_per_source == 0 ||
            config.rate_limiter.window.count() <= 0 ||
            config.rate_limiter.shard_count == 0) {
            return SetupErrorCode::InvalidRateLimit;
        }
    }

    return std::nullopt;
}

}  // namespace hamgate
