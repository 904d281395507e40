#pragma once
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
inline constexpr std::string_view DEFAULT_ADAPTER = "hci0";

// Scan duration bounds (seconds, inclusive)
constexpr int SCAN_DURATION_MIN     = 1;
constexpr int SCAN_DURATION_MAX     = 60;
constexpr int SCAN_DURATION_DEFAULT = 5;

// Session ticker: the longest the scan loop waits on the bus before re-checking time
constexpr int SCAN_TICK_MS = 100;

[[maybe_unused]] static std::string adapter_name()
{
    if (const char *a = std::getenv("BTCTL_ADAPTER"); a && *a)
        return std::string(a);
    return std::string(DEFAULT_ADAPTER);
}

[[maybe_unused]] static int default_scan_duration()
{
    const char *e = std::getenv("BTCTL_SCAN_DURATION");
    if (!e || !*e)
        return SCAN_DURATION_DEFAULT;
    char *p = nullptr;
    long  v = std::strtol(e, &p, 10);
    if (p && *p == '\0' && v >= SCAN_DURATION_MIN && v <= SCAN_DURATION_MAX)
        return static_cast<int>(v);
    LOG_WARN("Ignoring invalid BTCTL_SCAN_DURATION='%s' (expect %d..%d)", e, SCAN_DURATION_MIN,
             SCAN_DURATION_MAX);
    return SCAN_DURATION_DEFAULT;
}

}  // namespace constants
