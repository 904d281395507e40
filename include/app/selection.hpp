#pragma once
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

#include "app/connection.hpp"
#include "app/output_format.hpp"
#include "core/device_record.hpp"
#include "util/error.hpp"

namespace app
{

// Index -> address mapping for one prompt. Rebuilt on every re-scan.
class Selection
{
  public:
    Selection() = default;
    explicit Selection(const core::ScanSnapshot &snapshot);

    std::size_t size() const { return entries_.size(); }
    bool        empty() const { return entries_.empty(); }
    const Target &at(std::size_t idx) const { return entries_.at(idx); }

  private:
    std::vector<Target> entries_;
};

// Table with a leading IDX column rendered as "(N)"
std::string render(const core::ScanSnapshot &snapshot, const std::vector<Column> &projection);

// "0" / "0,2" -> indices in first-occurrence order, duplicates collapsed.
// Each index must be in [0, len).
bool resolve_indices(const std::string &input, std::size_t len, std::vector<std::size_t> &out,
                     btctl::Error &err);

// "Dev1,,Dev2" -> {"Dev1", "Dev2"}: empty items and repeats dropped
std::vector<std::string> split_aliases(const std::string &csv);

// Exact, case-sensitive match of one alias; commas are part of the name.
// No match -> Target with an empty address, reported later as not found.
Target resolve_alias(const std::string &alias, const core::ScanSnapshot &snapshot);

// resolve_alias applied to each entry in order
std::vector<Target> resolve_aliases(const std::vector<std::string> &aliases,
                                    const core::ScanSnapshot       &snapshot);

// Case-sensitive alias substring match; empty substring keeps everything
core::ScanSnapshot apply_name_filter(const core::ScanSnapshot &snapshot,
                                     const std::string        &substring);

struct PromptConfig
{
    std::vector<Column> projection;
    std::string         question;  // "Select the device you wish to connect"
    std::string         name_filter;
    bool                multi = false;
};

// Produces a fresh, unfiltered snapshot for a re-scan request
using RefreshFn = std::function<bool(core::ScanSnapshot &, btctl::Error &)>;

// Interactive pick over a snapshot: indices, 'r' to refresh, 'q' to abort.
class SelectionPrompt
{
  public:
    SelectionPrompt(std::ostream &out, std::istream &in, PromptConfig cfg, RefreshFn refresh);

    // true with chosen targets, or with aborted set when the user quits
    bool run(core::ScanSnapshot snapshot, std::vector<Target> &chosen, bool &aborted,
             btctl::Error &err);

    std::size_t refreshes() const { return refreshes_; }

  private:
    std::ostream &out_;
    std::istream &in_;
    PromptConfig  cfg_;
    RefreshFn     refresh_;
    std::size_t   refreshes_ = 0;
};

}  // namespace app
