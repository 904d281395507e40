#pragma once
#include <string>
#include <vector>

#include "bus/ibus_client.hpp"
#include "util/error.hpp"

namespace app
{

// A resolved (or unresolved) user choice. Empty address = did not resolve.
struct Target
{
    std::string label;  // what the user typed or picked, usually the alias
    std::string address;
};

enum class OutcomeKind
{
    Succeeded,
    Failed,
    DisconnectedNotRemoved  // force: disconnect ok, RemoveDevice failed
};

enum class Operation
{
    Connect,
    Disconnect
};

struct Outcome
{
    Operation    op = Operation::Connect;
    Target       target;
    OutcomeKind  kind    = OutcomeKind::Failed;
    bool         removed = false;  // force and RemoveDevice succeeded
    btctl::Error error;
};

// One or two '\n' terminated lines for the user
std::string describe_outcome(const Outcome &o);

// false if any outcome is not a plain success
bool all_succeeded(const std::vector<Outcome> &outcomes);

// Drives connect / disconnect / forced removal. Never aborts a batch on a
// per-device failure; outcomes come back in input order.
class ConnectionOrchestrator
{
  public:
    explicit ConnectionOrchestrator(bus::IBusClient &bus) : bus_(bus) {}

    Outcome              connect_one(const Target &t);
    std::vector<Outcome> disconnect_many(const std::vector<Target> &targets, bool force);

  private:
    bus::IBusClient &bus_;

    Outcome disconnect_one(const Target &t, bool force);
};

}  // namespace app
