#include "hamgate/log.hpp"

#include <cstdarg>
#include <ctime>

namespace hamgate {

void StderrLogger::write(Severity severity, std::string_view line) noexcept {
    if (!enabled(severity)) {
        return;
    }

    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    char stamp[16] = {};
    std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &local);

    const std::string_view level = severity_to_string(severity);

    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "%s %-5.*s [%s] %.*s\n",
                 stamp,
                 static_cast<int>(level.size()), level.data(),
                 component_.c_str(),
                 static_cast<int>(line.size()), line.data());
}

void logf(Logger& logger, Severity severity, const char* format, ...) noexcept {
    if (!logger.enabled(severity)) {
        return;
    }

    char buf[kMaxLogLineBytes];

    va_list args;
    va_start(args, format);
    int n = std::vsnprintf(buf, sizeof(buf), format, args);
    va_end(args);

    if (n < 0) {
        return;
    }

    std::size_t len = static_cast<std::size_t>(n);
    if (len >= sizeof(buf)) {
        len = sizeof(buf) - 1;  // truncated
    }

    logger.write(severity, std::string_view(buf, len));
}

}  // namespace hamgate
