// include/bus/bluez_dbus_util.hpp
#pragma once
#include "bus/ibus_client.hpp"

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>

#include <systemd/sd-bus.h>

static inline std::string upper(std::string s)
{
    for (auto &c : s)
        c = (char)std::toupper((unsigned char)c);
    return s;
}

// "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF" -> "AA:BB:CC:DD:EE:FF"
// false when the path is not a direct device child of adapter_path
[[maybe_unused]] static inline bool dev_path_to_mac(const std::string &obj_path,
                                                    const std::string &adapter_path,
                                                    std::string       &mac)
{
    const std::string prefix = adapter_path + "/dev_";
    if (obj_path.rfind(prefix, 0) != 0)
        return false;
    std::string tail = obj_path.substr(prefix.size());
    if (tail.size() != 17 || tail.find('/') != std::string::npos)
        return false;
    for (auto &c : tail)
        if (c == '_')
            c = ':';
    mac = upper(std::move(tail));
    return true;
}

// "AA:BB:CC:DD:EE:FF" -> "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF"
[[maybe_unused]] static inline std::string mac_to_dev_path(const std::string &adapter_path,
                                                           const std::string &mac)
{
    std::string tail = upper(mac);
    for (auto &c : tail)
        if (c == ':')
            c = '_';
    return adapter_path + "/dev_" + tail;
}

[[maybe_unused]] static inline int read_var_s(sd_bus_message *m, std::string &out)
{
    // read variant "s"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "s");
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, "s", &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_i16(sd_bus_message *m, int16_t &out)
{
    // read variant "n" (int16)
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "n");
    if (r < 0)
        return r;
    r      = sd_bus_message_read(m, "n", &out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_b(sd_bus_message *m, bool &out)
{
    // read variant "b"; sd-bus stores booleans as int
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "b");
    if (r < 0)
        return r;
    int b  = 0;
    r      = sd_bus_message_read(m, "b", &b);
    out    = (b != 0);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_y(sd_bus_message *m, uint8_t &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "y");
    if (r < 0)
        return r;
    r      = sd_bus_message_read(m, "y", &out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

// ======================================================================
// Function: read_device1_props
// - In: m positioned at an org.bluez.Device1 a{sv}
// - Out: known keys copied into props, the rest skipped; <0 on parse error
// ======================================================================
[[maybe_unused]] static inline int read_device1_props(sd_bus_message      *m,
                                                      bus::RawDeviceProps &props)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;

        if (key && std::strcmp(key, "Address") == 0)
        {
            std::string addr;
            if ((r = read_var_s(m, addr)) < 0)
                return r;
            props.address = upper(std::move(addr));
        }
        else if (key && std::strcmp(key, "Alias") == 0)
        {
            std::string alias;
            if ((r = read_var_s(m, alias)) < 0)
                return r;
            props.alias = std::move(alias);
        }
        else if (key && std::strcmp(key, "RSSI") == 0)
        {
            int16_t rssi = 0;
            if ((r = read_var_i16(m, rssi)) < 0)
                return r;
            props.rssi = rssi;
        }
        else if (key && (std::strcmp(key, "Connected") == 0 || std::strcmp(key, "Trusted") == 0 ||
                         std::strcmp(key, "Bonded") == 0 || std::strcmp(key, "Paired") == 0))
        {
            bool v = false;
            if ((r = read_var_b(m, v)) < 0)
                return r;
            if (key[0] == 'C')
                props.connected = v;
            else if (key[0] == 'T')
                props.trusted = v;
            else if (key[0] == 'B')
                props.bonded = v;
            else
                props.paired = v;
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "v")) < 0)
                return r;
        }

        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;  // dict-entry
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);  // a{sv}
}

// PropertiesChanged trailing "as": names whose values were dropped
[[maybe_unused]] static inline int read_invalidated_props(sd_bus_message      *m,
                                                          bus::RawDeviceProps &props)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0)
        return r;
    const char *name = nullptr;
    while ((r = sd_bus_message_read(m, "s", &name)) > 0)
    {
        if (name && std::strcmp(name, "RSSI") == 0)
            props.rssi_invalidated = true;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);  // as
}

[[maybe_unused]] static inline int read_battery1_props(sd_bus_message      *m,
                                                       bus::RawDeviceProps &props)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;
        if (key && std::strcmp(key, "Percentage") == 0)
        {
            uint8_t pct = 0;
            if ((r = read_var_y(m, pct)) < 0)
                return r;
            props.battery = pct;
        }
        else if ((r = sd_bus_message_skip(m, "v")) < 0)
            return r;
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

// ======================================================================
// Function: read_device_interfaces
// - In: m positioned at a{sa{sv}} (InterfacesAdded / GetManagedObjects body)
// - Out: Device1 and Battery1 folded into props, has_device set when Device1 seen
// ======================================================================
[[maybe_unused]] static inline int read_device_interfaces(sd_bus_message      *m,
                                                          bus::RawDeviceProps &props,
                                                          bool                &has_device)
{
    has_device = false;
    int r      = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
    {
        const char *iface = nullptr;
        if ((r = sd_bus_message_read(m, "s", &iface)) < 0)
            return r;

        if (iface && std::strcmp(iface, "org.bluez.Device1") == 0)
        {
            has_device = true;
            if ((r = read_device1_props(m, props)) < 0)
                return r;
        }
        else if (iface && std::strcmp(iface, "org.bluez.Battery1") == 0)
        {
            if ((r = read_battery1_props(m, props)) < 0)
                return r;
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "a{sv}")) < 0)
                return r;
        }

        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;  // {sa{sv}}
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);  // a{sa{sv}}
}

// Maps a BlueZ / D-Bus error name onto our taxonomy
[[maybe_unused]] static inline btctl::ErrorKind map_bus_error(const sd_bus_error *e,
                                                              btctl::ErrorKind    fallback)
{
    const char *name = (e && e->name) ? e->name : "";
    if (std::strcmp(name, "org.freedesktop.DBus.Error.UnknownObject") == 0 ||
        std::strcmp(name, "org.freedesktop.DBus.Error.UnknownMethod") == 0 ||
        std::strcmp(name, "org.bluez.Error.DoesNotExist") == 0)
        return btctl::ErrorKind::DeviceNotFound;
    if (std::strcmp(name, "org.bluez.Error.NotReady") == 0 ||
        std::strcmp(name, "org.freedesktop.DBus.Error.ServiceUnknown") == 0 ||
        std::strcmp(name, "org.freedesktop.DBus.Error.NoServer") == 0)
        return btctl::ErrorKind::AdapterUnavailable;
    return fallback;
}

[[maybe_unused]] static inline std::string bus_error_reason(const sd_bus_error *e, int r)
{
    if (e && e->message && *e->message)
        return e->message;
    if (e && e->name)
        return e->name;
    return std::strerror(-r);
}
