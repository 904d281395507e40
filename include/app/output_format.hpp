#pragma once
#include <string>
#include <vector>

#include "core/device_record.hpp"
#include "util/error.hpp"

namespace app
{

enum class Column
{
    Alias,
    Address,
    Connected,
    Trusted,
    Bonded,
    Paired,
    Rssi
};

enum class OutputMode
{
    Table,
    Terse
};

// "alias,connected" -> {Alias, Connected}. Unknown names fail with InvalidProjection.
bool parse_columns(const std::string &csv, std::vector<Column> &out, btctl::Error &err);

// Like parse_columns, but only boolean columns (connected, trusted, bonded, paired)
bool parse_status_flags(const std::string &csv, std::vector<Column> &out, btctl::Error &err);

bool        is_status_column(Column c);
const char *column_name(Column c);    // "alias"
std::string column_header(Column c);  // "ALIAS"
std::string cell_value(const core::DeviceRecord &rec, Column c);

// Generic renderers over already projected cells.
// Table: uppercase headers, left aligned, two spaces between columns.
// Terse: cells joined with '/', no header.
std::string format_table(const std::vector<std::string>              &headers,
                         const std::vector<std::vector<std::string>> &rows);
std::string format_terse(const std::vector<std::vector<std::string>> &rows);

std::string format(const core::ScanSnapshot &records, const std::vector<Column> &projection,
                   OutputMode mode);

// Keeps records where every flag in `flags` is true. Display columns are independent.
core::ScanSnapshot filter_by_status(const core::ScanSnapshot &records,
                                    const std::vector<Column> &flags);

}  // namespace app
