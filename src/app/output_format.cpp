#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

#include "app/output_format.hpp"
#include "util/log.hpp"

namespace app
{

namespace
{
struct ColumnName
{
    const char *name;
    Column      col;
};

constexpr ColumnName kColumns[] = {
    {"alias", Column::Alias},         {"address", Column::Address}, {"connected", Column::Connected},
    {"trusted", Column::Trusted},     {"bonded", Column::Bonded},   {"paired", Column::Paired},
    {"rssi", Column::Rssi},
};

std::string trim(const std::string &s)
{
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos)
        return "";
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

bool lookup(const std::string &name, Column &out)
{
    for (const auto &c : kColumns)
    {
        if (name == c.name)
        {
            out = c.col;
            return true;
        }
    }
    return false;
}

std::string known_names()
{
    std::string s;
    for (const auto &c : kColumns)
    {
        if (!s.empty())
            s += ",";
        s += c.name;
    }
    return s;
}

bool flag_of(const core::DeviceRecord &rec, Column c)
{
    switch (c)
    {
        case Column::Connected:
            return rec.connected;
        case Column::Trusted:
            return rec.trusted;
        case Column::Bonded:
            return rec.bonded;
        case Column::Paired:
            return rec.paired;
        default:
            return false;
    }
}

}  // namespace

bool parse_columns(const std::string &csv, std::vector<Column> &out, btctl::Error &err)
{
    out.clear();
    std::stringstream ss(csv);
    std::string       item;
    while (std::getline(ss, item, ','))
    {
        const std::string name = trim(item);
        Column            c;
        if (!lookup(name, c))
        {
            err.set(btctl::ErrorKind::InvalidProjection,
                    "unknown column '" + name + "' (expected one of " + known_names() + ")");
            LOG_DEBUG("%s", err.reason.c_str());
            out.clear();
            return false;
        }
        out.push_back(c);
    }
    if (out.empty())
    {
        err.set(btctl::ErrorKind::InvalidProjection, "no columns given");
        return false;
    }
    return true;
}

bool parse_status_flags(const std::string &csv, std::vector<Column> &out, btctl::Error &err)
{
    if (!parse_columns(csv, out, err))
        return false;
    for (Column c : out)
    {
        if (!is_status_column(c))
        {
            err.set(btctl::ErrorKind::InvalidProjection,
                    std::string("'") + column_name(c) +
                        "' is not a status (expected connected,trusted,bonded,paired)");
            out.clear();
            return false;
        }
    }
    return true;
}

bool is_status_column(Column c)
{
    return c == Column::Connected || c == Column::Trusted || c == Column::Bonded ||
           c == Column::Paired;
}

const char *column_name(Column c)
{
    for (const auto &k : kColumns)
        if (k.col == c)
            return k.name;
    return "?";
}

std::string column_header(Column c)
{
    std::string h = column_name(c);
    std::transform(h.begin(), h.end(), h.begin(), [](unsigned char ch) { return (char)std::toupper(ch); });
    return h;
}

std::string cell_value(const core::DeviceRecord &rec, Column c)
{
    switch (c)
    {
        case Column::Alias:
            return rec.alias;
        case Column::Address:
            return rec.address;
        case Column::Rssi:
            return rec.rssi ? std::to_string(*rec.rssi) : "-";
        default:
            return flag_of(rec, c) ? "true" : "false";
    }
}

// ======================================================================
// Function: format_table
// - In: header row + cell rows, every row as wide as headers
// - Out: one line per row, '\n' terminated
// - Note: width = max(header, cells); the last column is not padded
// ======================================================================
std::string format_table(const std::vector<std::string>              &headers,
                         const std::vector<std::vector<std::string>> &rows)
{
    std::vector<size_t> width(headers.size(), 0);
    for (size_t i = 0; i < headers.size(); ++i)
        width[i] = headers[i].size();
    for (const auto &row : rows)
        for (size_t i = 0; i < row.size() && i < width.size(); ++i)
            width[i] = std::max(width[i], row[i].size());

    std::string out;
    auto        emit = [&](const std::vector<std::string> &cells) {
        for (size_t i = 0; i < width.size(); ++i)
        {
            const std::string &v = i < cells.size() ? cells[i] : std::string();
            out += v;
            if (i + 1 < width.size())
                out.append(width[i] - v.size() + 2, ' ');
        }
        out += '\n';
    };

    emit(headers);
    for (const auto &row : rows)
        emit(row);
    return out;
}

std::string format_terse(const std::vector<std::vector<std::string>> &rows)
{
    std::string out;
    for (const auto &row : rows)
    {
        for (size_t i = 0; i < row.size(); ++i)
        {
            if (i)
                out += '/';
            out += row[i];
        }
        out += '\n';
    }
    return out;
}

std::string format(const core::ScanSnapshot &records, const std::vector<Column> &projection,
                   OutputMode mode)
{
    std::vector<std::vector<std::string>> rows;
    rows.reserve(records.size());
    for (const auto &rec : records)
    {
        std::vector<std::string> row;
        row.reserve(projection.size());
        for (Column c : projection)
            row.push_back(cell_value(rec, c));
        rows.push_back(std::move(row));
    }

    if (mode == OutputMode::Terse)
        return format_terse(rows);

    std::vector<std::string> headers;
    headers.reserve(projection.size());
    for (Column c : projection)
        headers.push_back(column_header(c));
    return format_table(headers, rows);
}

core::ScanSnapshot filter_by_status(const core::ScanSnapshot &records,
                                    const std::vector<Column> &flags)
{
    core::ScanSnapshot out;
    for (const auto &rec : records)
    {
        bool keep = true;
        for (Column f : flags)
        {
            if (!flag_of(rec, f))
            {
                keep = false;
                break;
            }
        }
        if (keep)
            out.push_back(rec);
    }
    return out;
}

}  // namespace app
