/* ======================================================================
 * BlueZ client, one invocation
 *
 *  Caller (core/app)                  BluezClient                         BlueZ/DBus
 *  -----------------                  -----------                         ----------
 *  open()
 *    └─ sd_bus_open_system ──────────────────────────────────────────────▶  system bus
 *
 *  list_known_devices()
 *    └─ walk a{oa{sa{sv}}} ──────────────────────────────────────────────▶  ObjectManager.GetManagedObjects
 *
 *  subscribe_device_events()  (BluezEventStream, see bluez_event_stream.cpp)
 *    └─ add matches ─────────────────────────────────────────────────────▶  InterfacesAdded / PropertiesChanged
 *  start_discovery() ────────────────────────────────────────────────────▶  Adapter1.StartDiscovery
 *  stream.next() pumps sd_bus_process/sd_bus_wait
 *  stop_discovery() ─────────────────────────────────────────────────────▶  Adapter1.StopDiscovery
 *  stream.close() drops the matches
 *
 *  connect / disconnect ─────────────────────────────────────────────────▶  Device1.Connect / Device1.Disconnect
 *  remove_device ────────────────────────────────────────────────────────▶  Adapter1.RemoveDevice(o)
 *  get/set_adapter_power ────────────────────────────────────────────────▶  Adapter1.Powered
 *
 *  Single thread: every call blocks until the reply (or the sd-bus default
 *  timeout). Nothing about the adapter is cached across invocations.
 * ====================================================================== */

#include <cstring>
#include <string>
#include <utility>
#include <vector>

// clang-format off
#include "bus/bluez_client.hpp"
#include "bus/bluez_client_impl.hpp"
#include "bus/bluez_dbus_util.hpp"
#include "util/log.hpp"
// clang-format on

#include <systemd/sd-bus.h>

namespace bus
{
BluezClient::BluezClient(BluezConfig cfg) : cfg_(std::move(cfg)), impl_(std::make_unique<Impl>())
{
    impl_->adapter_path = "/org/bluez/" + cfg_.adapter;
}

BluezClient::~BluezClient()
{
    close();
}

const std::string &BluezClient::adapter_path() const
{
    return impl_->adapter_path;
}

std::string BluezClient::device_path(const std::string &address) const
{
    return mac_to_dev_path(impl_->adapter_path, address);
}

std::string BluezClient::name() const
{
    return "bluez";
}

bool BluezClient::open(btctl::Error &err)
{
    if (impl_->bus)
        return true;

    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0 || !impl_->bus)
    {
        impl_->bus = nullptr;
        err.set(btctl::ErrorKind::AdapterUnavailable,
                std::string("cannot connect to the system bus: ") + std::strerror(-r));
        LOG_ERROR("[BLUEZ] failed to connect system bus: %d", r);
        return false;
    }
    LOG_DEBUG("[BLUEZ] system bus open, adapter=%s", impl_->adapter_path.c_str());
    return true;
}

// ======================================================================
// Function: BluezClient::close
// - In: may be called anytime
// - Out: active stream closed, discovery stopped if we started it, bus released
// ======================================================================
void BluezClient::close()
{
    if (!impl_ || !impl_->bus)
        return;

    if (impl_->active_stream)
        impl_->active_stream->close();

    if (impl_->discovery_on)
    {
        btctl::Error err;
        if (!stop_discovery(err))
            LOG_WARN("[BLUEZ] StopDiscovery on close failed: %s", btctl::describe(err).c_str());
    }

    sd_bus_flush_close_unref(impl_->bus);
    impl_->bus = nullptr;
}

void BluezClient::release_stream(BluezEventStream *s)
{
    if (impl_ && impl_->active_stream == s)
        impl_->active_stream = nullptr;
}

// ======================================================================
// Function: BluezClient::list_known_devices
// - In: bus open
// - Out: one RawDeviceProps per /org/bluez/<adapter>/dev_* object
// - Note: does not start discovery
// ======================================================================
bool BluezClient::list_known_devices(std::vector<RawDeviceProps> &out, btctl::Error &err)
{
    out.clear();
    if (!impl_->bus)
    {
        err.set(btctl::ErrorKind::AdapterUnavailable, "bus not open");
        return false;
    }

    sd_bus_message *reply = nullptr;
    sd_bus_error    berr  = SD_BUS_ERROR_NULL;
    int r = sd_bus_call_method(impl_->bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &berr, &reply, "");
    if (r < 0)
    {
        btctl::ErrorKind kind = map_bus_error(&berr, btctl::ErrorKind::AdapterUnavailable);
        if (kind == btctl::ErrorKind::DeviceNotFound)
            kind = btctl::ErrorKind::AdapterUnavailable;
        err.set(kind, bus_error_reason(&berr, r));
        LOG_WARN("[BLUEZ] GetManagedObjects failed: %s", err.reason.c_str());
        sd_bus_error_free(&berr);
        if (reply)
            sd_bus_message_unref(reply);
        return false;
    }

    // =========================
    // Hierarchy:
    // Object path (o)
    // |- Interfaces (a{sa{sv}})
    //     |- Properties ({sv})
    // =========================
    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        goto out;
    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            goto out;

        std::string mac;
        if (!obj || !dev_path_to_mac(obj, impl_->adapter_path, mac))
        {
            // only /org/bluez/<adapter>/dev_* objects
            if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0)
                goto out;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;
            continue;
        }

        RawDeviceProps props;
        bool           has_device = false;
        if ((r = read_device_interfaces(reply, props, has_device)) < 0)
            goto out;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // {oa{sa{sv}}}

        if (!has_device)
            continue;
        if (props.address.empty())
            props.address = mac;
        out.push_back(std::move(props));
    }
    if (r < 0)
        goto out;
    r = sd_bus_message_exit_container(reply);

out:
    if (reply)
        sd_bus_message_unref(reply);
    sd_bus_error_free(&berr);
    if (r < 0)
    {
        err.set(btctl::ErrorKind::AdapterUnavailable,
                std::string("malformed GetManagedObjects reply: ") + std::strerror(-r));
        LOG_ERROR("[BLUEZ] %s", err.reason.c_str());
        out.clear();
        return false;
    }
    LOG_DEBUG("[BLUEZ] %zu device object(s) under %s", out.size(), impl_->adapter_path.c_str());
    return true;
}

// ======================================================================
// Function: BluezClient::start_discovery
// - In: bus open
// - Out: true if discovery is on after the call
// - Note: safe to call repeatedly, InProgress counts as on
// ======================================================================
bool BluezClient::start_discovery(btctl::Error &err)
{
    if (!impl_->bus)
    {
        err.set(btctl::ErrorKind::AdapterUnavailable, "bus not open");
        return false;
    }
    if (impl_->discovery_on)
        return true;

    sd_bus_error    berr = SD_BUS_ERROR_NULL;
    sd_bus_message *rep  = nullptr;
    int r = sd_bus_call_method(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                               "org.bluez.Adapter1", "StartDiscovery", &berr, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        if (berr.name && std::strcmp(berr.name, "org.bluez.Error.InProgress") == 0)
        {
            impl_->discovery_on = true;
            LOG_INFO("[BLUEZ] StartDiscovery already in progress on %s",
                     impl_->adapter_path.c_str());
            sd_bus_error_free(&berr);
            return true;
        }
        btctl::ErrorKind kind = map_bus_error(&berr, btctl::ErrorKind::DiscoveryStartFailed);
        if (kind == btctl::ErrorKind::DeviceNotFound)
            kind = btctl::ErrorKind::AdapterUnavailable;  // the adapter object is missing
        err.set(kind, bus_error_reason(&berr, r));
        LOG_WARN("[BLUEZ] StartDiscovery failed: %s", err.reason.c_str());
        sd_bus_error_free(&berr);
        return false;
    }
    sd_bus_error_free(&berr);
    impl_->discovery_on = true;
    LOG_INFO("[BLUEZ] StartDiscovery OK on %s", impl_->adapter_path.c_str());
    return true;
}

// ======================================================================
// Function: BluezClient::stop_discovery
// - In: bus open or not
// - Out: true when discovery is off; false only if StopDiscovery itself failed
// - Note: clears discovery_on even if StopDiscovery fails
// ======================================================================
bool BluezClient::stop_discovery(btctl::Error &err)
{
    if (!impl_->discovery_on)
    {
        LOG_DEBUG("[BLUEZ] StopDiscovery skipped, not discovering");
        return true;
    }
    if (!impl_->bus)
    {
        impl_->discovery_on = false;
        return true;
    }

    sd_bus_error    berr = SD_BUS_ERROR_NULL;
    sd_bus_message *rep  = nullptr;
    int r = sd_bus_call_method(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                               "org.bluez.Adapter1", "StopDiscovery", &berr, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    impl_->discovery_on = false;
    if (r < 0)
    {
        err.set(btctl::ErrorKind::DiscoveryStopFailed, bus_error_reason(&berr, r));
        LOG_WARN("[BLUEZ] StopDiscovery failed (treat as off): %s", err.reason.c_str());
        sd_bus_error_free(&berr);
        return false;
    }
    sd_bus_error_free(&berr);
    LOG_INFO("[BLUEZ] StopDiscovery OK");
    return true;
}

std::unique_ptr<IDeviceEventStream> BluezClient::subscribe_device_events(btctl::Error &err)
{
    if (!impl_->bus)
    {
        err.set(btctl::ErrorKind::AdapterUnavailable, "bus not open");
        return nullptr;
    }
    if (impl_->active_stream)
    {
        LOG_WARN("[BLUEZ] tearing down a stale device subscription");
        impl_->active_stream->close();
    }

    auto stream = std::make_unique<BluezEventStream>(*this, impl_->bus, impl_->adapter_path);
    if (!stream->subscribe(err))
        return nullptr;
    impl_->active_stream = stream.get();
    return stream;
}

bool BluezClient::get_adapter_power(bool &powered, btctl::Error &err)
{
    if (!impl_->bus)
    {
        err.set(btctl::ErrorKind::AdapterUnavailable, "bus not open");
        return false;
    }
    sd_bus_error berr = SD_BUS_ERROR_NULL;
    int          b    = 0;
    int r = sd_bus_get_property_trivial(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                                        "org.bluez.Adapter1", "Powered", &berr, 'b', &b);
    if (r < 0)
    {
        err.set(btctl::ErrorKind::AdapterUnavailable, bus_error_reason(&berr, r));
        LOG_WARN("[BLUEZ] read %s Powered failed: %s", impl_->adapter_path.c_str(),
                 err.reason.c_str());
        sd_bus_error_free(&berr);
        return false;
    }
    sd_bus_error_free(&berr);
    powered = (b != 0);
    return true;
}

bool BluezClient::set_adapter_power(bool powered, btctl::Error &err)
{
    if (!impl_->bus)
    {
        err.set(btctl::ErrorKind::AdapterUnavailable, "bus not open");
        return false;
    }
    sd_bus_error berr = SD_BUS_ERROR_NULL;
    int r = sd_bus_set_property(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                                "org.bluez.Adapter1", "Powered", &berr, "b", (int)powered);
    if (r < 0)
    {
        err.set(btctl::ErrorKind::AdapterUnavailable, bus_error_reason(&berr, r));
        LOG_WARN("[BLUEZ] set %s Powered=%d failed: %s", impl_->adapter_path.c_str(),
                 (int)powered, err.reason.c_str());
        sd_bus_error_free(&berr);
        return false;
    }
    sd_bus_error_free(&berr);
    LOG_INFO("[BLUEZ] %s Powered=%d", impl_->adapter_path.c_str(), (int)powered);
    return true;
}

bool BluezClient::call_device_method(const std::string &address,
                                     const char        *method,
                                     btctl::ErrorKind   fail_kind,
                                     btctl::Error      &err)
{
    if (!impl_->bus)
    {
        err.set(btctl::ErrorKind::AdapterUnavailable, "bus not open");
        return false;
    }
    const std::string path = device_path(address);

    sd_bus_error    berr = SD_BUS_ERROR_NULL;
    sd_bus_message *rep  = nullptr;
    int r = sd_bus_call_method(impl_->bus, "org.bluez", path.c_str(), "org.bluez.Device1", method,
                               &berr, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        err.set(map_bus_error(&berr, fail_kind), bus_error_reason(&berr, r));
        LOG_WARN("[BLUEZ] Device1.%s(%s) failed: %s: %s", method, path.c_str(),
                 berr.name ? berr.name : "?", err.reason.c_str());
        sd_bus_error_free(&berr);
        return false;
    }
    sd_bus_error_free(&berr);
    LOG_INFO("[BLUEZ] Device1.%s(%s) OK", method, path.c_str());
    return true;
}

bool BluezClient::connect(const std::string &address, btctl::Error &err)
{
    return call_device_method(address, "Connect", btctl::ErrorKind::ConnectFailed, err);
}

bool BluezClient::disconnect(const std::string &address, btctl::Error &err)
{
    return call_device_method(address, "Disconnect", btctl::ErrorKind::DisconnectFailed, err);
}

// ======================================================================
// Function: BluezClient::remove_device
// - In: address of a device object under our adapter
// - Out: true once the adapter forgot the device
// - Note: DoesNotExist maps to DeviceNotFound
// ======================================================================
bool BluezClient::remove_device(const std::string &address, btctl::Error &err)
{
    if (!impl_->bus)
    {
        err.set(btctl::ErrorKind::AdapterUnavailable, "bus not open");
        return false;
    }
    const std::string path = device_path(address);

    sd_bus_error    berr = SD_BUS_ERROR_NULL;
    sd_bus_message *rep  = nullptr;
    int r = sd_bus_call_method(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                               "org.bluez.Adapter1", "RemoveDevice", &berr, &rep, "o",
                               path.c_str());
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        err.set(map_bus_error(&berr, btctl::ErrorKind::RemoveFailed), bus_error_reason(&berr, r));
        LOG_WARN("[BLUEZ] RemoveDevice(%s) failed: %s", path.c_str(), err.reason.c_str());
        sd_bus_error_free(&berr);
        return false;
    }
    sd_bus_error_free(&berr);
    LOG_INFO("[BLUEZ] RemoveDevice(%s) OK", path.c_str());
    return true;
}

}  // namespace bus
