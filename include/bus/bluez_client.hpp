#pragma once
#include <memory>
#include <string>
#include <vector>

#include "bus/ibus_client.hpp"
#include "util/constants.hpp"

struct sd_bus;

namespace bus
{

struct BluezConfig
{
    std::string adapter = std::string(constants::DEFAULT_ADAPTER);
};

class BluezEventStream;

class BluezClient final : public IBusClient
{
  public:
    explicit BluezClient(BluezConfig cfg);
    ~BluezClient() override;

    BluezClient(const BluezClient &)            = delete;
    BluezClient &operator=(const BluezClient &) = delete;

    // Connects to the system bus. AdapterUnavailable when the bus is unreachable.
    bool open(btctl::Error &err);
    void close();

    bool list_known_devices(std::vector<RawDeviceProps> &out, btctl::Error &err) override;
    bool start_discovery(btctl::Error &err) override;
    bool stop_discovery(btctl::Error &err) override;
    std::unique_ptr<IDeviceEventStream> subscribe_device_events(btctl::Error &err) override;
    bool get_adapter_power(bool &powered, btctl::Error &err) override;
    bool set_adapter_power(bool powered, btctl::Error &err) override;
    bool connect(const std::string &address, btctl::Error &err) override;
    bool disconnect(const std::string &address, btctl::Error &err) override;
    bool remove_device(const std::string &address, btctl::Error &err) override;
    std::string name() const override;

    const std::string &adapter_path() const;
    std::string        device_path(const std::string &address) const;

    // called by a stream when it closes
    void release_stream(BluezEventStream *s);

  private:
    BluezConfig cfg_;

    struct Impl;
    std::unique_ptr<Impl> impl_;

    bool call_device_method(const std::string &address,
                            const char        *method,
                            btctl::ErrorKind   fail_kind,
                            btctl::Error      &err);
};

}  // namespace bus
