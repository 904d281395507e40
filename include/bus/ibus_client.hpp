#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "util/error.hpp"

namespace bus
{

// Typed view of one org.bluez.Device1 property bag. Only fields present on
// the bus are set; a partial bag is what a PropertiesChanged signal carries.
struct RawDeviceProps
{
    std::string                 address;  // "AA:BB:CC:DD:EE:FF", always set
    std::optional<std::string>  alias;
    std::optional<int16_t>      rssi;
    std::optional<bool>         connected;
    std::optional<bool>         trusted;
    std::optional<bool>         bonded;
    std::optional<bool>         paired;
    std::optional<std::uint8_t> battery;  // org.bluez.Battery1.Percentage
    bool                        rssi_invalidated = false;  // PropertiesChanged dropped RSSI
};

enum class EventKind
{
    Added,   // InterfacesAdded: full property bag
    Changed  // PropertiesChanged: partial property bag
};

struct DeviceEvent
{
    EventKind      kind = EventKind::Added;
    RawDeviceProps props;
};

// Notification stream scoped to one discovery session.
struct IDeviceEventStream
{
    // Waits up to `timeout` for the next event. false on timeout or once closed.
    virtual bool next(DeviceEvent &out, std::chrono::milliseconds timeout) = 0;
    // Drops the bus subscription. Safe to call more than once.
    virtual void close()             = 0;
    virtual bool is_open() const     = 0;
    virtual ~IDeviceEventStream()    = default;
};

// Transport to the adapter and its device objects. Every call blocks until
// the bus replies or times out.
struct IBusClient
{
    virtual bool list_known_devices(std::vector<RawDeviceProps> &out, btctl::Error &err) = 0;

    // Idempotent. stop_discovery without an active discovery is a no-op.
    virtual bool start_discovery(btctl::Error &err) = 0;
    virtual bool stop_discovery(btctl::Error &err)  = 0;

    // Tears down any previous stream handed out by this client first.
    virtual std::unique_ptr<IDeviceEventStream> subscribe_device_events(btctl::Error &err) = 0;

    virtual bool get_adapter_power(bool &powered, btctl::Error &err) = 0;
    virtual bool set_adapter_power(bool powered, btctl::Error &err)  = 0;

    virtual bool connect(const std::string &address, btctl::Error &err)       = 0;
    virtual bool disconnect(const std::string &address, btctl::Error &err)    = 0;
    virtual bool remove_device(const std::string &address, btctl::Error &err) = 0;

    virtual std::string name() const { return ""; }
    virtual ~IBusClient() = default;
};

}  // namespace bus
