#include <istream>
#include <ostream>
#include <utility>

#include "app/commands.hpp"
#include "app/connection.hpp"
#include "app/selection.hpp"
#include "core/device_registry.hpp"
#include "core/discovery_session.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace app
{

namespace
{

int fail(CommandContext &ctx, const btctl::Error &e)
{
    ctx.err << "error: " << btctl::describe(e) << "\n";
    return exit_code_for(e);
}

// known devices from the adapter, no scan
bool known_snapshot(CommandContext &ctx, core::ScanSnapshot &out, btctl::Error &err)
{
    std::vector<bus::RawDeviceProps> raw;
    if (!ctx.bus.list_known_devices(raw, err))
        return false;
    core::DeviceRegistry reg;
    reg.seed(raw);
    out = reg.snapshot();
    return true;
}

bool connected_snapshot(CommandContext &ctx, core::ScanSnapshot &out, btctl::Error &err)
{
    core::ScanSnapshot all;
    if (!known_snapshot(ctx, all, err))
        return false;
    out = filter_by_status(all, {Column::Connected});
    return true;
}

// One discovery session. false only when the session could not start.
bool scan_once(CommandContext &ctx, int duration_s, core::SessionResult &res, btctl::Error &err)
{
    core::SessionConfig cfg;
    cfg.duration_s = duration_s;
    cfg.now        = ctx.now;
    core::DiscoverySession session(ctx.bus, cfg, ctx.cancel);
    if (!session.run(res, err))
        return false;
    if (res.stop_failed)
        ctx.err << "warning: could not stop discovery: " << btctl::describe(res.stop_error)
                << "\n";
    return true;
}

bool interrupted(const CommandContext &ctx)
{
    return ctx.cancel && ctx.cancel->load();
}

void print_outcomes(CommandContext &ctx, const std::vector<Outcome> &outcomes)
{
    for (const auto &o : outcomes)
        ctx.out << describe_outcome(o);
    ctx.out.flush();
}

}  // namespace

std::vector<Column> default_list_columns()
{
    return {Column::Alias,   Column::Address, Column::Connected,
            Column::Trusted, Column::Bonded,  Column::Paired};
}

std::vector<Column> default_scan_columns()
{
    return {Column::Alias, Column::Address, Column::Rssi};
}

int exit_code_for(const btctl::Error &e)
{
    switch (e.kind)
    {
        case btctl::ErrorKind::None:
            return exitc::ok;
        case btctl::ErrorKind::AdapterUnavailable:
            return exitc::adapter_unavailable;
        case btctl::ErrorKind::InvalidProjection:
        case btctl::ErrorKind::InvalidDuration:
        case btctl::ErrorKind::InvalidSelectionInput:
            return exitc::bad_args;
        default:
            return exitc::failure;
    }
}

// ======================================================================
// Function: cmd_status
// - Out: "bluetooth: enabled|disabled", then one line per connected device
// ======================================================================
int cmd_status(CommandContext &ctx)
{
    btctl::Error err;
    bool         powered = false;
    if (!ctx.bus.get_adapter_power(powered, err))
        return fail(ctx, err);

    core::ScanSnapshot connected;
    if (!connected_snapshot(ctx, connected, err))
        return fail(ctx, err);

    ctx.out << "bluetooth: " << (powered ? "enabled" : "disabled") << "\nconnected devices: ";
    for (const auto &d : connected)
    {
        ctx.out << "\n" << d.alias << "/" << d.address;
        if (d.battery)
            ctx.out << " (batt: %" << static_cast<unsigned>(*d.battery) << ")";
    }
    ctx.out << "\n";
    return exitc::ok;
}

int cmd_toggle(CommandContext &ctx)
{
    btctl::Error err;
    bool         powered = false;
    if (!ctx.bus.get_adapter_power(powered, err))
        return fail(ctx, err);
    if (!ctx.bus.set_adapter_power(!powered, err))
        return fail(ctx, err);
    LOG_INFO("adapter power %d -> %d", powered, !powered);
    ctx.out << "bluetooth: " << (!powered ? "enabled" : "disabled") << "\n";
    return exitc::ok;
}

int cmd_list_devices(CommandContext &ctx, const ListOptions &opt)
{
    btctl::Error       err;
    core::ScanSnapshot known;
    if (!known_snapshot(ctx, known, err))
        return fail(ctx, err);
    ctx.out << format(filter_by_status(known, opt.status), opt.columns, opt.mode);
    return exitc::ok;
}

int cmd_scan(CommandContext &ctx, const ScanOptions &opt)
{
    btctl::Error        err;
    core::SessionResult res;
    if (!scan_once(ctx, opt.duration_s, res, err))
        return fail(ctx, err);

    core::ScanSnapshot visible;
    for (const auto &d : res.snapshot)
        if (d.rssi)
            visible.push_back(d);
    ctx.out << format(visible, opt.columns, opt.mode);
    return res.cancelled ? exitc::interrupted : exitc::ok;
}

// ======================================================================
// Function: cmd_connect
// - In: alias set -> known devices only, matched whole; unset -> scan + prompt
// - Note: a re-scan keeps the duration and name filter
// ======================================================================
int cmd_connect(CommandContext &ctx, const ConnectOptions &opt)
{
    btctl::Error err;
    if (!core::validate_duration(opt.duration_s, err))
        return fail(ctx, err);

    ConnectionOrchestrator orch(ctx.bus);
    Target                 target;

    if (opt.alias)
    {
        if (opt.alias->empty())
        {
            err.set(btctl::ErrorKind::InvalidSelectionInput, "no alias given");
            return fail(ctx, err);
        }
        core::ScanSnapshot known;
        if (!known_snapshot(ctx, known, err))
            return fail(ctx, err);
        target = resolve_alias(*opt.alias, known);
    }
    else
    {
        core::SessionResult res;
        if (!scan_once(ctx, opt.duration_s, res, err))
            return fail(ctx, err);
        if (res.cancelled)
            return exitc::interrupted;

        PromptConfig pc;
        pc.projection  = default_scan_columns();
        pc.question    = "Select the device you wish to connect";
        pc.name_filter = opt.name_filter;
        RefreshFn refresh = [&](core::ScanSnapshot &snap, btctl::Error &e) {
            core::SessionResult again;
            if (!scan_once(ctx, opt.duration_s, again, e))
                return false;
            if (again.cancelled)
            {
                e.set(btctl::ErrorKind::Io, "scan interrupted");
                return false;
            }
            snap = std::move(again.snapshot);
            return true;
        };

        SelectionPrompt     prompt(ctx.out, ctx.in, pc, refresh);
        std::vector<Target> chosen;
        bool                aborted = false;
        if (!prompt.run(std::move(res.snapshot), chosen, aborted, err))
            return interrupted(ctx) ? exitc::interrupted : fail(ctx, err);
        ctx.out << "\n";
        if (aborted)
        {
            ctx.out << "aborted\n";
            return exitc::ok;
        }
        target = chosen.front();
    }

    const Outcome o = orch.connect_one(target);
    print_outcomes(ctx, {o});
    return o.kind == OutcomeKind::Succeeded ? exitc::ok : exit_code_for(o.error);
}

int cmd_disconnect(CommandContext &ctx, const DisconnectOptions &opt)
{
    btctl::Error        err;
    std::vector<Target> targets;

    if (opt.aliases)
    {
        const auto aliases = split_aliases(*opt.aliases);
        if (aliases.empty())
        {
            err.set(btctl::ErrorKind::InvalidSelectionInput, "no alias given");
            return fail(ctx, err);
        }
        core::ScanSnapshot known;
        if (!known_snapshot(ctx, known, err))
            return fail(ctx, err);
        targets = resolve_aliases(aliases, known);
    }
    else
    {
        core::ScanSnapshot connected;
        if (!connected_snapshot(ctx, connected, err))
            return fail(ctx, err);
        if (connected.empty())
        {
            ctx.out << "there are no connected devices to disconnect\n";
            return exitc::ok;
        }

        PromptConfig pc;
        pc.projection = {Column::Alias, Column::Address};
        pc.question   = "Select the device(s) you wish to disconnect";
        pc.multi      = true;
        RefreshFn refresh = [&](core::ScanSnapshot &snap, btctl::Error &e) {
            return connected_snapshot(ctx, snap, e);
        };

        SelectionPrompt prompt(ctx.out, ctx.in, pc, refresh);
        bool            aborted = false;
        if (!prompt.run(std::move(connected), targets, aborted, err))
            return fail(ctx, err);
        ctx.out << "\n";
        if (aborted)
        {
            ctx.out << "aborted\n";
            return exitc::ok;
        }
    }

    ConnectionOrchestrator orch(ctx.bus);
    const auto             outcomes = orch.disconnect_many(targets, opt.force);
    print_outcomes(ctx, outcomes);
    return all_succeeded(outcomes) ? exitc::ok : exitc::failure;
}

}  // namespace app
