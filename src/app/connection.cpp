#include "app/connection.hpp"
#include "util/log.hpp"

namespace app
{

namespace
{
// a failing bus call that forgot to say why still gets a kind
void ensure_kind(btctl::Error &err, btctl::ErrorKind fallback, const char *what)
{
    if (!err)
        err.set(fallback, what);
}

bool not_found(const Target &t, Outcome &o)
{
    if (!t.address.empty())
        return false;
    o.kind = OutcomeKind::Failed;
    o.error.set(btctl::ErrorKind::DeviceNotFound, "device not found: " + t.label);
    LOG_WARN("[CONN] %s", o.error.reason.c_str());
    return true;
}
}  // namespace

std::string describe_outcome(const Outcome &o)
{
    const std::string &label = o.target.label;
    if (o.kind == OutcomeKind::Failed && o.error.kind == btctl::ErrorKind::DeviceNotFound &&
        o.target.address.empty())
        return "device not found: " + label + "\n";

    switch (o.kind)
    {
        case OutcomeKind::Succeeded:
            if (o.op == Operation::Connect)
                return "connected to device: " + label + "\n";
            if (o.removed)
                return "disconnected from device " + label + "\nremoved device " + label +
                       " (forced)\n";
            return "disconnected from device " + label + "\n";
        case OutcomeKind::DisconnectedNotRemoved:
            return "disconnected from device " + label +
                   " but could not remove it: " + btctl::describe(o.error) + "\n";
        case OutcomeKind::Failed:
            break;
    }
    return std::string("failed to ") + (o.op == Operation::Connect ? "connect" : "disconnect") +
           " " + label + ": " + btctl::describe(o.error) + "\n";
}

bool all_succeeded(const std::vector<Outcome> &outcomes)
{
    for (const auto &o : outcomes)
        if (o.kind != OutcomeKind::Succeeded)
            return false;
    return true;
}

Outcome ConnectionOrchestrator::connect_one(const Target &t)
{
    Outcome o;
    o.op     = Operation::Connect;
    o.target = t;
    if (not_found(t, o))
        return o;

    LOG_INFO("[CONN] connecting %s (%s)", t.label.c_str(), t.address.c_str());
    if (!bus_.connect(t.address, o.error))
    {
        ensure_kind(o.error, btctl::ErrorKind::ConnectFailed, "Connect failed");
        LOG_ERROR("[CONN] connect %s failed: %s", t.address.c_str(),
                  btctl::describe(o.error).c_str());
        return o;
    }
    o.kind = OutcomeKind::Succeeded;
    return o;
}

// ======================================================================
// Function: ConnectionOrchestrator::disconnect_one
// - In: target, force
// - Out: Succeeded / Failed / DisconnectedNotRemoved
// - Note: RemoveDevice only runs after a successful Disconnect
// ======================================================================
Outcome ConnectionOrchestrator::disconnect_one(const Target &t, bool force)
{
    Outcome o;
    o.op     = Operation::Disconnect;
    o.target = t;
    if (not_found(t, o))
        return o;

    LOG_INFO("[CONN] disconnecting %s (%s)%s", t.label.c_str(), t.address.c_str(),
             force ? " +remove" : "");
    if (!bus_.disconnect(t.address, o.error))
    {
        ensure_kind(o.error, btctl::ErrorKind::DisconnectFailed, "Disconnect failed");
        LOG_ERROR("[CONN] disconnect %s failed: %s", t.address.c_str(),
                  btctl::describe(o.error).c_str());
        return o;
    }
    if (!force)
    {
        o.kind = OutcomeKind::Succeeded;
        return o;
    }

    if (!bus_.remove_device(t.address, o.error))
    {
        ensure_kind(o.error, btctl::ErrorKind::RemoveFailed, "RemoveDevice failed");
        LOG_WARN("[CONN] %s disconnected but not removed: %s", t.address.c_str(),
                 btctl::describe(o.error).c_str());
        o.kind = OutcomeKind::DisconnectedNotRemoved;
        return o;
    }
    o.kind    = OutcomeKind::Succeeded;
    o.removed = true;
    return o;
}

std::vector<Outcome> ConnectionOrchestrator::disconnect_many(const std::vector<Target> &targets,
                                                             bool                       force)
{
    std::vector<Outcome> out;
    out.reserve(targets.size());
    for (const auto &t : targets)
        out.push_back(disconnect_one(t, force));
    return out;
}

}  // namespace app
