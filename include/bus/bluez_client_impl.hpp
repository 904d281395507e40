// include/bus/bluez_client_impl.hpp
#pragma once
#include <chrono>
#include <deque>
#include <string>

#include "bus/bluez_client.hpp"

struct sd_bus;
struct sd_bus_slot;

namespace bus
{

struct BluezClient::Impl
{
    sd_bus          *bus = nullptr;
    std::string      adapter_path;  // "/org/bluez/hci0"
    bool             discovery_on{false};
    BluezEventStream *active_stream{nullptr};  // at most one per client
};

// Device signals for one discovery session. Owns its match slots; the
// callbacks only queue events, next() drains them while pumping the bus.
class BluezEventStream final : public IDeviceEventStream
{
  public:
    BluezEventStream(BluezClient &owner, sd_bus *bus, std::string adapter_path);
    ~BluezEventStream() override;

    bool subscribe(btctl::Error &err);

    bool next(DeviceEvent &out, std::chrono::milliseconds timeout) override;
    void close() override;
    bool is_open() const override { return open_; }

    // callback side
    void               push(DeviceEvent ev);
    const std::string &adapter_path() const { return adapter_path_; }

  private:
    BluezClient            *owner_;
    sd_bus                 *bus_;
    std::string             adapter_path_;
    sd_bus_slot            *added_slot_ = nullptr;  // ObjectManager.InterfacesAdded
    sd_bus_slot            *props_slot_ = nullptr;  // Properties.PropertiesChanged (Device1)
    std::deque<DeviceEvent> pending_;
    bool                    open_ = false;
};

}  // namespace bus
