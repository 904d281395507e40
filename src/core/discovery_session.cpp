/* ======================================================================
 * Discovery session
 *
 *  Idle
 *    └─ validate duration (InvalidDuration, bus untouched)
 *    └─ subscribe_device_events ─────────────▶ InterfacesAdded / PropertiesChanged
 *    └─ start_discovery ─────────────────────▶ Adapter1.StartDiscovery   (fail -> Closed, fatal)
 *  Scanning
 *    └─ seed registry with list_known_devices
 *    └─ loop: stream.next(min(tick, remaining)) -> registry.fold
 *             exits on deadline, cancel flag, or a lost subscription
 *  Draining
 *    └─ stop_discovery ──────────────────────▶ Adapter1.StopDiscovery    (fail -> logged, degraded)
 *    └─ stream.close
 *  Closed
 *    └─ snapshot
 * ====================================================================== */

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "core/discovery_session.hpp"
#include "util/log.hpp"

namespace core
{

const char *session_state_name(SessionState s)
{
    switch (s)
    {
        case SessionState::Idle:
            return "Idle";
        case SessionState::Scanning:
            return "Scanning";
        case SessionState::Draining:
            return "Draining";
        case SessionState::Closed:
            return "Closed";
    }
    return "?";
}

bool validate_duration(int seconds, btctl::Error &err)
{
    if (seconds < constants::SCAN_DURATION_MIN || seconds > constants::SCAN_DURATION_MAX)
    {
        err.set(btctl::ErrorKind::InvalidDuration,
                "scan duration must be " + std::to_string(constants::SCAN_DURATION_MIN) + ".." +
                    std::to_string(constants::SCAN_DURATION_MAX) + " seconds, got " +
                    std::to_string(seconds));
        return false;
    }
    return true;
}

DiscoverySession::DiscoverySession(bus::IBusClient        &bus,
                                   SessionConfig           cfg,
                                   const std::atomic_bool *cancel)
    : bus_(bus), cfg_(std::move(cfg)), cancel_(cancel)
{
    if (cfg_.tick.count() <= 0)
        cfg_.tick = std::chrono::milliseconds(constants::SCAN_TICK_MS);
}

std::chrono::steady_clock::time_point DiscoverySession::now() const
{
    return cfg_.now ? cfg_.now() : std::chrono::steady_clock::now();
}

bool DiscoverySession::cancel_requested() const
{
    return cancel_ && cancel_->load(std::memory_order_relaxed);
}

// ======================================================================
// Function: DiscoverySession::run
// - In: Idle session
// - Out: true with the final snapshot in out (also on cancel / stop failure)
// - Note: once Scanning is entered, Draining always runs
// ======================================================================
bool DiscoverySession::run(SessionResult &out, btctl::Error &err)
{
    using namespace std::chrono;

    if (state_ != SessionState::Idle)
    {
        err.set(btctl::ErrorKind::DiscoveryStartFailed,
                std::string("session already ") + session_state_name(state_));
        return false;
    }
    if (!validate_duration(cfg_.duration_s, err))
    {
        state_ = SessionState::Closed;
        return false;
    }

    auto stream = bus_.subscribe_device_events(err);
    if (!stream)
    {
        LOG_ERROR("[SCAN] cannot subscribe to device signals: %s", btctl::describe(err).c_str());
        state_ = SessionState::Closed;
        return false;
    }
    if (!bus_.start_discovery(err))
    {
        if (!err)
            err.set(btctl::ErrorKind::DiscoveryStartFailed, "StartDiscovery failed");
        LOG_ERROR("[SCAN] discovery did not start: %s", btctl::describe(err).c_str());
        stream->close();
        state_ = SessionState::Closed;
        return false;
    }

    state_ = SessionState::Scanning;
    LOG_INFO("[SCAN] scanning for %ds", cfg_.duration_s);

    std::vector<bus::RawDeviceProps> known;
    btctl::Error                     lerr;
    if (bus_.list_known_devices(known, lerr))
        registry_.seed(known);
    else
        LOG_WARN("[SCAN] known devices unavailable, continuing with signals only: %s",
                 btctl::describe(lerr).c_str());

    const auto deadline = now() + seconds(cfg_.duration_s);
    size_t     folded   = 0;
    while (true)
    {
        if (cancel_requested())
        {
            out.cancelled = true;
            LOG_INFO("[SCAN] cancelled");
            break;
        }
        const auto t = now();
        if (t >= deadline)
            break;

        const auto      remaining = duration_cast<milliseconds>(deadline - t);
        const auto      wait      = std::max(milliseconds(1), std::min(cfg_.tick, remaining));
        bus::DeviceEvent ev;
        if (stream->next(ev, wait))
        {
            registry_.fold(ev);
            ++folded;
            continue;
        }
        if (!stream->is_open())
        {
            LOG_WARN("[SCAN] device subscription lost, ending scan early");
            break;
        }
    }

    state_ = SessionState::Draining;
    btctl::Error serr;
    if (!bus_.stop_discovery(serr))
    {
        out.stop_failed = true;
        out.stop_error  = serr;
        LOG_WARN("[SCAN] StopDiscovery failed, returning partial results: %s",
                 btctl::describe(serr).c_str());
    }
    stream->close();
    stream.reset();

    state_       = SessionState::Closed;
    out.snapshot = registry_.snapshot();
    LOG_INFO("[SCAN] done: %zu device(s), %zu event(s) folded", out.snapshot.size(), folded);
    return true;
}

}  // namespace core
