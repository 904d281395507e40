// include/bus/bluez_signal_handlers.hpp
#pragma once
#include <systemd/sd-bus.h>

namespace bus
{

// Discovery-session DBus callbacks, userdata is the BluezEventStream
int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);

}  // namespace bus
