#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "app/output_format.hpp"
#include "bus/ibus_client.hpp"
#include "util/constants.hpp"
#include "util/error.hpp"

namespace app
{

// Everything a command touches. Commands return an exitc:: code.
struct CommandContext
{
    bus::IBusClient        &bus;
    std::ostream           &out;  // tables, outcome lines, prompts
    std::istream           &in;   // interactive answers
    std::ostream           &err;  // "error: ..." lines
    const std::atomic_bool *cancel = nullptr;
    // scan clock, steady_clock::now when empty
    std::function<std::chrono::steady_clock::time_point()> now{};
};

std::vector<Column> default_list_columns();  // alias,address,connected,trusted,bonded,paired
std::vector<Column> default_scan_columns();  // alias,address,rssi

struct ListOptions
{
    std::vector<Column> columns = default_list_columns();
    OutputMode          mode    = OutputMode::Table;
    std::vector<Column> status;  // empty = no filter
};

struct ScanOptions
{
    int                 duration_s = constants::SCAN_DURATION_DEFAULT;
    std::vector<Column> columns    = default_scan_columns();
    OutputMode          mode       = OutputMode::Table;
};

struct ConnectOptions
{
    int                        duration_s = constants::SCAN_DURATION_DEFAULT;
    std::string                name_filter;
    std::optional<std::string> alias;  // set: no scan, resolve against known devices
};

struct DisconnectOptions
{
    bool                       force = false;
    std::optional<std::string> aliases;  // "A,B"; unset: interactive
};

int exit_code_for(const btctl::Error &e);

int cmd_status(CommandContext &ctx);
int cmd_toggle(CommandContext &ctx);
int cmd_list_devices(CommandContext &ctx, const ListOptions &opt);
int cmd_scan(CommandContext &ctx, const ScanOptions &opt);
int cmd_connect(CommandContext &ctx, const ConnectOptions &opt);
int cmd_disconnect(CommandContext &ctx, const DisconnectOptions &opt);

}  // namespace app
