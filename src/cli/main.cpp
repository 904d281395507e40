#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <signal.h>
#include <string>
#include <unordered_map>
#include <vector>

#include "app/commands.hpp"
#include "bus/bluez_client.hpp"
#include "core/discovery_session.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

std::atomic_bool g_cancel{false};

void on_signal(int)
{
    g_cancel.store(true);
}

// no SA_RESTART: sd_bus_wait must return EINTR so the scan loop sees the flag
void install_signal_handlers()
{
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
void print_usage()
{
    std::fprintf(stderr,
                 "Usage:\n"
                 "  btctl [--adapter <name>] [command] [args]\n"
                 "\n"
                 "Commands:\n"
                 "  status                                   adapter power and connected devices "
                 "(default)\n"
                 "  toggle                                   flip adapter power\n"
                 "  list-devices|ls [-c COLS] [-v COLS] [-s STATUS[,STATUS]]\n"
                 "  scan|sc [-d SECS] [-c COLS] [-v COLS]\n"
                 "  connect|c [-d SECS] [-n NAME] [ALIAS]\n"
                 "  disconnect|d [-f] [ALIAS[,ALIAS...]]\n"
                 "\n"
                 "Columns: alias,address,connected,trusted,bonded,paired,rssi\n"
                 "  -c COLS  table output     -v COLS  terse output (-c wins)\n"
                 "  -s       keep devices whose listed statuses are all true\n"
                 "  -d SECS  scan duration, %d..%d (default %d, env BTCTL_SCAN_DURATION)\n"
                 "  -n NAME  only list devices whose alias contains NAME\n"
                 "  -f       remove the device after disconnecting\n"
                 "\n"
                 "Environment: BTCTL_ADAPTER (hci0), BTCTL_LOG_LEVEL (warn), "
                 "BTCTL_SCAN_DURATION\n",
                 constants::SCAN_DURATION_MIN, constants::SCAN_DURATION_MAX,
                 constants::SCAN_DURATION_DEFAULT);
}

int bad_args(const std::string &why)
{
    std::fprintf(stderr, "error: %s\n", why.c_str());
    return exitc::bad_args;
}

// Small cursor over a command's arguments
struct ArgCursor
{
    const std::vector<std::string> &args;
    size_t                          i = 1;  // args[0] is the command

    bool done() const { return i >= args.size(); }
    std::string        take() { return args[i++]; }
    bool               value(std::string &out)
    {
        if (done())
            return false;
        out = take();
        return true;
    }
};

bool is_flag(const std::string &a, const char *s, const char *l)
{
    return a == s || a == l;
}

bool parse_duration(const std::string &s, int &out, btctl::Error &err)
{
    char *p = nullptr;
    long  v = std::strtol(s.c_str(), &p, 10);
    if (s.empty() || !p || *p != '\0' || v < INT32_MIN || v > INT32_MAX)
    {
        err.set(btctl::ErrorKind::InvalidDuration, "scan duration is not a number: " + s);
        return false;
    }
    if (!core::validate_duration(static_cast<int>(v), err))
        return false;
    out = static_cast<int>(v);
    return true;
}

// -c wins over -v; neither keeps the defaults
bool resolve_projection(const std::string &table_cols, const std::string &terse_cols,
                        std::vector<app::Column> &columns, app::OutputMode &mode,
                        btctl::Error &err)
{
    if (!table_cols.empty())
    {
        mode = app::OutputMode::Table;
        return app::parse_columns(table_cols, columns, err);
    }
    if (!terse_cols.empty())
    {
        mode = app::OutputMode::Terse;
        return app::parse_columns(terse_cols, columns, err);
    }
    return true;
}

// Parsed command, ready to run against a bus
using Runner = std::function<int(app::CommandContext &)>;

// ======================================================================
// Function: parse_cmd
// - In: args[0] = command (already aliased), args[1..] its flags
// - Out: runner, or an exit code in rc when parsing failed
// - Note: every validation error happens here, before the bus is opened
// ======================================================================
bool parse_cmd(const std::vector<std::string> &args, Runner &runner, int &rc)
{
    const std::string &cmd = args[0];
    ArgCursor          cur{args};
    btctl::Error       err;

    auto fail = [&](const std::string &why) {
        rc = bad_args(why);
        return false;
    };
    auto fail_err = [&](const btctl::Error &e) {
        rc = bad_args(btctl::describe(e));
        return false;
    };

    std::unordered_map<std::string, std::function<bool()>> cmd_map = {
        {"status",
         [&]() -> bool {
             if (!cur.done())
                 return fail("status takes no arguments");
             runner = [](app::CommandContext &ctx) { return app::cmd_status(ctx); };
             return true;
         }},
        {"toggle",
         [&]() -> bool {
             if (!cur.done())
                 return fail("toggle takes no arguments");
             runner = [](app::CommandContext &ctx) { return app::cmd_toggle(ctx); };
             return true;
         }},
        {"list-devices",
         [&]() -> bool {
             app::ListOptions opt;
             std::string      cols, terse, status;
             while (!cur.done())
             {
                 std::string a = cur.take();
                 if (is_flag(a, "-c", "--columns") && cur.value(cols))
                     continue;
                 if (is_flag(a, "-v", "--values") && cur.value(terse))
                     continue;
                 if (is_flag(a, "-s", "--status") && cur.value(status))
                     continue;
                 return fail("list-devices: unexpected argument '" + a + "'");
             }
             if (!resolve_projection(cols, terse, opt.columns, opt.mode, err))
                 return fail_err(err);
             if (!status.empty() && !app::parse_status_flags(status, opt.status, err))
                 return fail_err(err);
             runner = [opt](app::CommandContext &ctx) { return app::cmd_list_devices(ctx, opt); };
             return true;
         }},
        {"scan",
         [&]() -> bool {
             app::ScanOptions opt;
             opt.duration_s = constants::default_scan_duration();
             std::string cols, terse, secs;
             while (!cur.done())
             {
                 std::string a = cur.take();
                 if (is_flag(a, "-d", "--duration") && cur.value(secs))
                 {
                     if (!parse_duration(secs, opt.duration_s, err))
                         return fail_err(err);
                     continue;
                 }
                 if (is_flag(a, "-c", "--columns") && cur.value(cols))
                     continue;
                 if (is_flag(a, "-v", "--values") && cur.value(terse))
                     continue;
                 return fail("scan: unexpected argument '" + a + "'");
             }
             if (!resolve_projection(cols, terse, opt.columns, opt.mode, err))
                 return fail_err(err);
             runner = [opt](app::CommandContext &ctx) { return app::cmd_scan(ctx, opt); };
             return true;
         }},
        {"connect",
         [&]() -> bool {
             app::ConnectOptions opt;
             opt.duration_s = constants::default_scan_duration();
             std::string secs;
             while (!cur.done())
             {
                 std::string a = cur.take();
                 if (is_flag(a, "-d", "--duration") && cur.value(secs))
                 {
                     if (!parse_duration(secs, opt.duration_s, err))
                         return fail_err(err);
                     continue;
                 }
                 if (is_flag(a, "-n", "--contains-name") && cur.value(opt.name_filter))
                     continue;
                 if (a.empty() || a[0] == '-' || opt.alias)
                     return fail("connect: unexpected argument '" + a + "'");
                 opt.alias = a;
             }
             runner = [opt](app::CommandContext &ctx) { return app::cmd_connect(ctx, opt); };
             return true;
         }},
        {"disconnect",
         [&]() -> bool {
             app::DisconnectOptions opt;
             while (!cur.done())
             {
                 std::string a = cur.take();
                 if (is_flag(a, "-f", "--force"))
                 {
                     opt.force = true;
                     continue;
                 }
                 if (a.empty() || a[0] == '-')
                     return fail("disconnect: unexpected argument '" + a + "'");
                 // "A,B" or "A B"
                 opt.aliases = opt.aliases ? *opt.aliases + "," + a : a;
             }
             runner = [opt](app::CommandContext &ctx) { return app::cmd_disconnect(ctx, opt); };
             return true;
         }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        rc = exitc::bad_args;
        return false;
    }
    LOG_DEBUG("Parsing command: %s", cmd.c_str());
    return it->second();
}

std::string canonical_command(const std::string &c)
{
    static const std::unordered_map<std::string, std::string> aliases = {
        {"ls", "list-devices"}, {"sc", "scan"}, {"c", "connect"}, {"d", "disconnect"}};
    auto it = aliases.find(c);
    return it == aliases.end() ? c : it->second;
}

}  // namespace

int main(int argc, char **argv)
{
    btctl::set_log_level_by_name(std::getenv("BTCTL_LOG_LEVEL"));

    // env first, --adapter overrides
    bus::BluezConfig cfg;
    cfg.adapter = constants::adapter_name();

    std::vector<std::string> args;
    args.reserve(argc > 1 ? argc - 1 : 0);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (args.empty() && a == "--adapter")
        {
            if (i + 1 >= argc)
                return bad_args("--adapter needs a value");
            cfg.adapter = argv[++i];
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
        args.push_back("status");
    args[0] = canonical_command(args[0]);

    Runner runner;
    int    rc = exitc::ok;
    if (!parse_cmd(args, runner, rc))
        return rc;

    bus::BluezClient client(cfg);
    btctl::Error     err;
    if (!client.open(err))
    {
        std::fprintf(stderr, "error: %s\n", btctl::describe(err).c_str());
        return app::exit_code_for(err);
    }

    install_signal_handlers();
    app::CommandContext ctx{client, std::cout, std::cin, std::cerr, &g_cancel};
    rc = runner(ctx);
    std::cout.flush();
    client.close();

    if (rc == exitc::ok && g_cancel.load())
        rc = exitc::interrupted;
    LOG_DEBUG("exit %d", rc);
    return rc;
}
