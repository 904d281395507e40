#pragma once
#include <atomic>
#include <chrono>
#include <functional>

#include "bus/ibus_client.hpp"
#include "core/device_registry.hpp"
#include "util/constants.hpp"
#include "util/error.hpp"

namespace core
{

enum class SessionState
{
    Idle,
    Scanning,
    Draining,
    Closed
};

const char *session_state_name(SessionState s);

struct SessionConfig
{
    int                       duration_s = constants::SCAN_DURATION_DEFAULT;
    std::chrono::milliseconds tick{constants::SCAN_TICK_MS};
    // steady_clock::now unless a test injects its own clock
    std::function<std::chrono::steady_clock::time_point()> now{};
};

struct SessionResult
{
    ScanSnapshot snapshot;
    bool         cancelled   = false;
    bool         stop_failed = false;  // DiscoveryStopFailed, logged, snapshot still valid
    btctl::Error stop_error;
};

// InvalidDuration unless SCAN_DURATION_MIN <= seconds <= SCAN_DURATION_MAX
bool validate_duration(int seconds, btctl::Error &err);

// One bounded scan: Idle -> Scanning -> Draining -> Closed.
// A session runs once; a re-scan uses a fresh session.
class DiscoverySession
{
  public:
    DiscoverySession(bus::IBusClient &bus, SessionConfig cfg, const std::atomic_bool *cancel = nullptr);

    // false only when nothing was scanned (validation, subscribe or start failure)
    bool run(SessionResult &out, btctl::Error &err);

    SessionState          state() const { return state_; }
    const DeviceRegistry &registry() const { return registry_; }

  private:
    bus::IBusClient        &bus_;
    SessionConfig           cfg_;
    const std::atomic_bool *cancel_;
    SessionState            state_ = SessionState::Idle;
    DeviceRegistry          registry_;

    std::chrono::steady_clock::time_point now() const;
    bool                                  cancel_requested() const;
};

}  // namespace core
