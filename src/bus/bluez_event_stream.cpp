#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>
#include <utility>

// clang-format off
#include "bus/bluez_client.hpp"
#include "bus/bluez_client_impl.hpp"
#include "bus/bluez_dbus_util.hpp"
#include "bus/bluez_signal_handlers.hpp"
#include "util/log.hpp"
// clang-format on

#include <systemd/sd-bus.h>

namespace
{
// TU-local wrapper to unref and null a slot ptr
inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}
}  // namespace

namespace bus
{

// ======================================================================
// Function: bluez_on_iface_added
// - In: InterfacesAdded "oa{sa{sv}}", userdata = BluezEventStream
// - Out: queues an Added event for device objects under our adapter
// ======================================================================
int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *self = static_cast<BluezEventStream *>(userdata);

    const char *obj = nullptr;
    int         r   = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    std::string mac;
    if (!dev_path_to_mac(obj, self->adapter_path(), mac))
        return 0;

    DeviceEvent ev;
    ev.kind         = EventKind::Added;
    bool has_device = false;
    if ((r = read_device_interfaces(m, ev.props, has_device)) < 0)
    {
        LOG_WARN("[BLUEZ] malformed InterfacesAdded for %s: %s", obj, std::strerror(-r));
        return 0;
    }
    if (!has_device)
        return 0;
    if (ev.props.address.empty())
        ev.props.address = mac;

    LOG_DEBUG("[BLUEZ] InterfacesAdded %s alias=%s", ev.props.address.c_str(),
              ev.props.alias ? ev.props.alias->c_str() : "-");
    self->push(std::move(ev));
    return 0;
}

// ======================================================================
// Function: bluez_on_props_changed
// - In: PropertiesChanged "sa{sv}as" already filtered to org.bluez.Device1
// - Out: queues a Changed event carrying only the changed keys, plus
//        an invalidated RSSI
// - Note: the address comes from the object path, the bag has none
// ======================================================================
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self = static_cast<BluezEventStream *>(userdata);
    const char *path = sd_bus_message_get_path(m);

    std::string mac;
    if (!path || !dev_path_to_mac(path, self->adapter_path(), mac))
        return 0;

    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;
    if (!iface || std::strcmp(iface, "org.bluez.Device1") != 0)
        return 0;

    DeviceEvent ev;
    ev.kind = EventKind::Changed;
    if ((r = read_device1_props(m, ev.props)) < 0)
    {
        LOG_WARN("[BLUEZ] malformed PropertiesChanged on %s: %s", path, std::strerror(-r));
        return 0;
    }
    if ((r = read_invalidated_props(m, ev.props)) < 0)
    {
        LOG_WARN("[BLUEZ] malformed invalidated list on %s: %s", path, std::strerror(-r));
        return 0;
    }
    ev.props.address = mac;

    LOG_DEBUG("[BLUEZ] PropertiesChanged %s%s%s", mac.c_str(), ev.props.rssi ? " (rssi)" : "",
              ev.props.rssi_invalidated ? " (rssi gone)" : "");
    self->push(std::move(ev));
    return 0;
}

BluezEventStream::BluezEventStream(BluezClient &owner, sd_bus *bus, std::string adapter_path)
    : owner_(&owner), bus_(bus), adapter_path_(std::move(adapter_path))
{
}

BluezEventStream::~BluezEventStream()
{
    close();
}

bool BluezEventStream::subscribe(btctl::Error &err)
{
    int r = sd_bus_match_signal(bus_, &added_slot_, "org.bluez", "/",
                                "org.freedesktop.DBus.ObjectManager", "InterfacesAdded",
                                bluez_on_iface_added, this);
    if (r < 0)
    {
        err.set(btctl::ErrorKind::AdapterUnavailable,
                std::string("subscribe to InterfacesAdded failed: ") + std::strerror(-r));
        LOG_ERROR("[BLUEZ] %s", err.reason.c_str());
        return false;
    }

    // any device object under the adapter, Device1 only
    const std::string rule = "type='signal',sender='org.bluez',"
                             "interface='org.freedesktop.DBus.Properties',"
                             "member='PropertiesChanged',arg0='org.bluez.Device1',"
                             "path_namespace='" +
                             adapter_path_ + "'";
    r = sd_bus_add_match(bus_, &props_slot_, rule.c_str(), bluez_on_props_changed, this);
    if (r < 0)
    {
        unref_slot(added_slot_);
        err.set(btctl::ErrorKind::AdapterUnavailable,
                std::string("subscribe to PropertiesChanged failed: ") + std::strerror(-r));
        LOG_ERROR("[BLUEZ] %s", err.reason.c_str());
        return false;
    }

    open_ = true;
    LOG_INFO("[BLUEZ] subscribed to InterfacesAdded/PropertiesChanged under %s",
             adapter_path_.c_str());
    return true;
}

void BluezEventStream::push(DeviceEvent ev)
{
    if (open_)
        pending_.push_back(std::move(ev));
}

// ======================================================================
// Function: BluezEventStream::next
// - In: timeout, the longest we block in sd_bus_wait
// - Out: true with one event; false on timeout, EINTR or closed stream
// - Note: queued events are handed out before the bus is pumped again
// ======================================================================
bool BluezEventStream::next(DeviceEvent &out, std::chrono::milliseconds timeout)
{
    using namespace std::chrono;
    if (!open_)
        return false;

    const auto deadline = steady_clock::now() + timeout;
    while (true)
    {
        if (!pending_.empty())
        {
            out = std::move(pending_.front());
            pending_.pop_front();
            return true;
        }

        int r = sd_bus_process(bus_, nullptr);
        if (r < 0)
        {
            LOG_ERROR("[BLUEZ] sd_bus_process failed: %s", std::strerror(-r));
            close();
            return false;
        }
        if (r > 0)
            continue;  // dispatched something, maybe an event

        const auto now = steady_clock::now();
        if (now >= deadline)
            return false;
        const uint64_t usec = (uint64_t)duration_cast<microseconds>(deadline - now).count();
        r                   = sd_bus_wait(bus_, usec);
        if (r == -EINTR)
            return false;  // let the caller look at its cancel flag
        if (r < 0)
        {
            LOG_ERROR("[BLUEZ] sd_bus_wait failed: %s", std::strerror(-r));
            close();
            return false;
        }
    }
}

void BluezEventStream::close()
{
    if (!open_ && !added_slot_ && !props_slot_ && !owner_)
        return;
    unref_slot(added_slot_);
    unref_slot(props_slot_);
    if (open_)
        LOG_DEBUG("[BLUEZ] device subscription closed (%zu queued event(s) dropped)",
                  pending_.size());
    pending_.clear();
    open_ = false;
    if (owner_)
    {
        owner_->release_stream(this);
        owner_ = nullptr;
    }
    bus_ = nullptr;
}

}  // namespace bus
