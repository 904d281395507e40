#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <sstream>
#include <utility>

#include "app/selection.hpp"
#include "util/log.hpp"

namespace app
{

namespace
{
std::string trim(const std::string &s)
{
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool parse_index(const std::string &s, std::size_t &out)
{
    if (s.empty() || s.size() > 9)
        return false;
    for (char c : s)
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    out = static_cast<std::size_t>(std::stoul(s));
    return true;
}
}  // namespace

Selection::Selection(const core::ScanSnapshot &snapshot)
{
    entries_.reserve(snapshot.size());
    for (const auto &rec : snapshot)
        entries_.push_back(Target{rec.alias, rec.address});
}

std::string render(const core::ScanSnapshot &snapshot, const std::vector<Column> &projection)
{
    std::vector<std::string> headers{"IDX"};
    for (Column c : projection)
        headers.push_back(column_header(c));

    std::vector<std::vector<std::string>> rows;
    rows.reserve(snapshot.size());
    for (std::size_t i = 0; i < snapshot.size(); ++i)
    {
        std::vector<std::string> row{"(" + std::to_string(i) + ")"};
        for (Column c : projection)
            row.push_back(cell_value(snapshot[i], c));
        rows.push_back(std::move(row));
    }
    return format_table(headers, rows);
}

// ======================================================================
// Function: resolve_indices
// - In: user line, number of listed devices
// - Out: indices in the order typed, each once
// - Note: any bad token rejects the whole line
// ======================================================================
bool resolve_indices(const std::string &input, std::size_t len, std::vector<std::size_t> &out,
                     btctl::Error &err)
{
    out.clear();
    std::stringstream ss(input);
    std::string       tok;
    while (std::getline(ss, tok, ','))
    {
        tok = trim(tok);
        std::size_t idx = 0;
        if (!parse_index(tok, idx))
        {
            err.set(btctl::ErrorKind::InvalidSelectionInput,
                    "'" + tok + "' is not a device index");
            out.clear();
            return false;
        }
        if (idx >= len)
        {
            err.set(btctl::ErrorKind::InvalidSelectionInput,
                    "index " + tok + " is out of range (0.." +
                        (len ? std::to_string(len - 1) : std::string("none")) + ")");
            out.clear();
            return false;
        }
        if (std::find(out.begin(), out.end(), idx) == out.end())
            out.push_back(idx);
    }
    if (out.empty())
    {
        err.set(btctl::ErrorKind::InvalidSelectionInput, "no device index given");
        return false;
    }
    return true;
}

std::vector<std::string> split_aliases(const std::string &csv)
{
    std::vector<std::string> out;
    std::stringstream        ss(csv);
    std::string              alias;
    while (std::getline(ss, alias, ','))
    {
        if (alias.empty())
            continue;
        if (std::find(out.begin(), out.end(), alias) != out.end())
            continue;
        out.push_back(alias);
    }
    return out;
}

Target resolve_alias(const std::string &alias, const core::ScanSnapshot &snapshot)
{
    Target t{alias, ""};
    for (const auto &rec : snapshot)
    {
        if (rec.alias == alias)
        {
            t.address = rec.address;
            break;
        }
    }
    if (t.address.empty())
        LOG_DEBUG("[SEL] alias '%s' matches no device", alias.c_str());
    return t;
}

std::vector<Target> resolve_aliases(const std::vector<std::string> &aliases,
                                    const core::ScanSnapshot       &snapshot)
{
    std::vector<Target> out;
    out.reserve(aliases.size());
    for (const auto &alias : aliases)
        out.push_back(resolve_alias(alias, snapshot));
    return out;
}

core::ScanSnapshot apply_name_filter(const core::ScanSnapshot &snapshot,
                                     const std::string        &substring)
{
    if (substring.empty())
        return snapshot;
    core::ScanSnapshot out;
    for (const auto &rec : snapshot)
        if (rec.alias.find(substring) != std::string::npos)
            out.push_back(rec);
    return out;
}

SelectionPrompt::SelectionPrompt(std::ostream &out, std::istream &in, PromptConfig cfg,
                                 RefreshFn refresh)
    : out_(out), in_(in), cfg_(std::move(cfg)), refresh_(std::move(refresh))
{
}

bool SelectionPrompt::run(core::ScanSnapshot snapshot, std::vector<Target> &chosen, bool &aborted,
                          btctl::Error &err)
{
    chosen.clear();
    aborted = false;

    while (true)
    {
        const core::ScanSnapshot shown = apply_name_filter(snapshot, cfg_.name_filter);
        const Selection          sel(shown);

        if (sel.empty())
            out_ << "no devices found\n";
        else
            out_ << render(shown, cfg_.projection);
        out_ << "\n"
             << cfg_.question << (cfg_.multi ? " (idx[,idx...]" : " (idx")
             << (refresh_ ? ", r: re-scan" : "") << ", q: quit): ";
        out_.flush();

        std::string line;
        if (!std::getline(in_, line))
        {
            err.set(btctl::ErrorKind::Io, "no selection read from input");
            return false;
        }
        line = trim(line);

        if (line == "q")
        {
            aborted = true;
            return true;
        }
        if (line == "r")
        {
            if (!refresh_)
            {
                err.set(btctl::ErrorKind::InvalidSelectionInput, "re-scan is not available here");
                return false;
            }
            core::ScanSnapshot fresh;
            if (!refresh_(fresh, err))
                return false;
            ++refreshes_;
            snapshot = std::move(fresh);
            continue;
        }

        std::vector<std::size_t> idx;
        if (!resolve_indices(line, sel.size(), idx, err))
            return false;
        if (!cfg_.multi && idx.size() > 1)
        {
            err.set(btctl::ErrorKind::InvalidSelectionInput, "select exactly one device");
            return false;
        }
        for (std::size_t i : idx)
            chosen.push_back(sel.at(i));
        return true;
    }
}

}  // namespace app
