#pragma once
#include <string>
#include <utility>

namespace btctl
{

enum class ErrorKind
{
    None = 0,
    AdapterUnavailable,
    DiscoveryStartFailed,
    DiscoveryStopFailed,
    DeviceNotFound,
    ConnectFailed,
    DisconnectFailed,
    RemoveFailed,
    InvalidProjection,
    InvalidDuration,
    InvalidSelectionInput,
    Io
};

// Filled by operations that return bool, like an sd_bus_error out-param.
struct Error
{
    ErrorKind   kind = ErrorKind::None;
    std::string reason;

    void set(ErrorKind k, std::string why)
    {
        kind   = k;
        reason = std::move(why);
    }
    void clear()
    {
        kind = ErrorKind::None;
        reason.clear();
    }
    explicit operator bool() const { return kind != ErrorKind::None; }
};

inline const char *error_kind_name(ErrorKind k)
{
    switch (k)
    {
        case ErrorKind::None:
            return "None";
        case ErrorKind::AdapterUnavailable:
            return "AdapterUnavailable";
        case ErrorKind::DiscoveryStartFailed:
            return "DiscoveryStartFailed";
        case ErrorKind::DiscoveryStopFailed:
            return "DiscoveryStopFailed";
        case ErrorKind::DeviceNotFound:
            return "DeviceNotFound";
        case ErrorKind::ConnectFailed:
            return "ConnectFailed";
        case ErrorKind::DisconnectFailed:
            return "DisconnectFailed";
        case ErrorKind::RemoveFailed:
            return "RemoveFailed";
        case ErrorKind::InvalidProjection:
            return "InvalidProjection";
        case ErrorKind::InvalidDuration:
            return "InvalidDuration";
        case ErrorKind::InvalidSelectionInput:
            return "InvalidSelectionInput";
        case ErrorKind::Io:
            return "Io";
    }
    return "?";
}

// "<reason>" when present, else the kind name
inline std::string describe(const Error &e)
{
    if (!e.reason.empty())
        return e.reason;
    return error_kind_name(e.kind);
}

}  // namespace btctl
