#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace core
{

enum class Origin
{
    Known,      // already registered with the adapter when the session began
    Discovered  // first seen through a discovery signal
};

struct DeviceRecord
{
    std::string                 address;  // canonical uppercase MAC, identity key
    std::string                 alias;    // explicit alias or the dash-formatted address
    std::optional<int16_t>      rssi;     // only while broadcasting
    bool                        connected = false;
    bool                        trusted   = false;
    bool                        bonded    = false;
    bool                        paired    = false;
    std::optional<std::uint8_t> battery;
    Origin                      origin = Origin::Known;

    bool operator==(const DeviceRecord &o) const
    {
        return address == o.address && alias == o.alias && rssi == o.rssi &&
               connected == o.connected && trusted == o.trusted && bonded == o.bonded &&
               paired == o.paired && battery == o.battery && origin == o.origin;
    }
    bool operator!=(const DeviceRecord &o) const { return !(*this == o); }
};

// Ordered by first observation
using ScanSnapshot = std::vector<DeviceRecord>;

// "AA:BB:CC:DD:EE:FF" -> "AA-BB-CC-DD-EE-FF"
std::string dash_address(const std::string &address);

// explicit alias when non-empty, else the dash-formatted address
std::string alias_for(const std::string &explicit_alias, const std::string &address);
std::string alias_for(const DeviceRecord &rec);

// uppercase, ':' separated, 6 hex octets
bool        is_valid_mac(const std::string &mac);
std::string normalize_mac(std::string mac);

const char *origin_name(Origin o);

}  // namespace core
