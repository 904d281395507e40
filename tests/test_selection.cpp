#include <gtest/gtest.h>
#include <sstream>

#include "app/selection.hpp"

using namespace app;

namespace
{
core::DeviceRecord rec(const std::string &addr, const std::string &alias, int16_t rssi)
{
    core::DeviceRecord r;
    r.address = addr;
    r.alias   = alias;
    r.rssi    = rssi;
    return r;
}

core::ScanSnapshot three()
{
    return {rec("AA:AA:AA:AA:AA:01", "Headphones", -40), rec("AA:AA:AA:AA:AA:02", "Keyboard", -60),
            rec("AA:AA:AA:AA:AA:03", "Headset", -70)};
}
}  // namespace

TEST(Selection, RenderAddsIndexColumn)
{
    core::ScanSnapshot snap = {rec("AA:AA:AA:AA:AA:01", "Pad", -40)};
    EXPECT_EQ(render(snap, {Column::Alias, Column::Rssi}), "IDX  ALIAS  RSSI\n"
                                                           "(0)  Pad    -40\n");
}

TEST(Selection, ResolveIndicesCollapsesDuplicates)
{
    std::vector<size_t> idx;
    btctl::Error        err;
    ASSERT_TRUE(resolve_indices("2, 0,2", 3, idx, err));
    ASSERT_EQ(idx.size(), 2u);
    EXPECT_EQ(idx[0], 2u);
    EXPECT_EQ(idx[1], 0u);
}

TEST(Selection, ResolveIndicesRejectsBadInput)
{
    std::vector<size_t> idx;
    btctl::Error        err;
    EXPECT_FALSE(resolve_indices("3", 3, idx, err));
    EXPECT_EQ(err.kind, btctl::ErrorKind::InvalidSelectionInput);

    for (const char *bad : {"", "a", "-1", "1,,2", "0 1", "1.5"})
    {
        err.clear();
        EXPECT_FALSE(resolve_indices(bad, 3, idx, err)) << bad;
        EXPECT_EQ(err.kind, btctl::ErrorKind::InvalidSelectionInput) << bad;
        EXPECT_TRUE(idx.empty());
    }
}

TEST(Selection, SplitAliasesDropsEmptyAndRepeats)
{
    EXPECT_EQ(split_aliases("Keyboard,,Headset,Keyboard"),
              (std::vector<std::string>{"Keyboard", "Headset"}));
    EXPECT_TRUE(split_aliases(",").empty());
    EXPECT_TRUE(split_aliases("").empty());
}

TEST(Selection, ResolveAliasMatchesWholeName)
{
    core::ScanSnapshot snap = three();
    snap[0].alias           = "Foo, Inc";
    const Target hit        = resolve_alias("Foo, Inc", snap);
    EXPECT_EQ(hit.address, snap[0].address);
    EXPECT_TRUE(resolve_alias("Foo", snap).address.empty());
}

TEST(Selection, ResolveAliasesReportsUnmatched)
{
    auto targets = resolve_aliases(split_aliases("Keyboard,keyboard,Headset"), three());
    ASSERT_EQ(targets.size(), 3u);
    EXPECT_EQ(targets[0].address, "AA:AA:AA:AA:AA:02");
    EXPECT_EQ(targets[1].label, "keyboard");
    EXPECT_TRUE(targets[1].address.empty());  // case-sensitive
    EXPECT_EQ(targets[2].address, "AA:AA:AA:AA:AA:03");
}

TEST(Selection, NameFilterIsCaseSensitiveSubstring)
{
    auto f = apply_name_filter(three(), "Head");
    ASSERT_EQ(f.size(), 2u);
    EXPECT_EQ(f[0].alias, "Headphones");
    EXPECT_EQ(f[1].alias, "Headset");

    EXPECT_TRUE(apply_name_filter(three(), "head").empty());
    EXPECT_EQ(apply_name_filter(three(), "").size(), 3u);
}

TEST(SelectionPrompt, PicksOneIndex)
{
    std::ostringstream out;
    std::istringstream in("1\n");
    PromptConfig       pc{{Column::Alias}, "Pick", "", false};
    SelectionPrompt    p(out, in, pc, nullptr);

    std::vector<Target> chosen;
    bool                aborted = true;
    btctl::Error        err;
    ASSERT_TRUE(p.run(three(), chosen, aborted, err));
    EXPECT_FALSE(aborted);
    ASSERT_EQ(chosen.size(), 1u);
    EXPECT_EQ(chosen[0].label, "Keyboard");
    EXPECT_EQ(chosen[0].address, "AA:AA:AA:AA:AA:02");
    EXPECT_NE(out.str().find("(2)  Headset"), std::string::npos);
    EXPECT_NE(out.str().find("Pick (idx, q: quit): "), std::string::npos);
}

TEST(SelectionPrompt, IndicesReferToFilteredList)
{
    std::ostringstream out;
    std::istringstream in("1\n");
    PromptConfig       pc{{Column::Alias}, "Pick", "Head", false};
    SelectionPrompt    p(out, in, pc, nullptr);

    std::vector<Target> chosen;
    bool                aborted = false;
    btctl::Error        err;
    ASSERT_TRUE(p.run(three(), chosen, aborted, err));
    ASSERT_EQ(chosen.size(), 1u);
    EXPECT_EQ(chosen[0].label, "Headset");
    EXPECT_EQ(out.str().find("Keyboard"), std::string::npos);
}

TEST(SelectionPrompt, MultiSelectKeepsTypedOrder)
{
    std::ostringstream out;
    std::istringstream in("2,0\n");
    PromptConfig       pc{{Column::Alias}, "Pick", "", true};
    SelectionPrompt    p(out, in, pc, nullptr);

    std::vector<Target> chosen;
    bool                aborted = false;
    btctl::Error        err;
    ASSERT_TRUE(p.run(three(), chosen, aborted, err));
    ASSERT_EQ(chosen.size(), 2u);
    EXPECT_EQ(chosen[0].label, "Headset");
    EXPECT_EQ(chosen[1].label, "Headphones");
}

TEST(SelectionPrompt, SingleSelectRejectsList)
{
    std::ostringstream out;
    std::istringstream in("0,1\n");
    SelectionPrompt    p(out, in, PromptConfig{{Column::Alias}, "Pick", "", false}, nullptr);

    std::vector<Target> chosen;
    bool                aborted = false;
    btctl::Error        err;
    EXPECT_FALSE(p.run(three(), chosen, aborted, err));
    EXPECT_EQ(err.kind, btctl::ErrorKind::InvalidSelectionInput);
    EXPECT_TRUE(chosen.empty());
}

TEST(SelectionPrompt, RescanRebuildsSelectionAndKeepsFilter)
{
    std::ostringstream out;
    std::istringstream in("r\n0\n");
    int                refreshes = 0;
    RefreshFn          refresh   = [&](core::ScanSnapshot &snap, btctl::Error &) {
        ++refreshes;
        snap = {rec("AA:AA:AA:AA:AA:09", "Mouse", -30), rec("AA:AA:AA:AA:AA:03", "Headset", -65)};
        return true;
    };
    SelectionPrompt p(out, in, PromptConfig{{Column::Alias}, "Pick", "Head", false}, refresh);

    std::vector<Target> chosen;
    bool                aborted = false;
    btctl::Error        err;
    ASSERT_TRUE(p.run(three(), chosen, aborted, err));
    EXPECT_EQ(refreshes, 1);
    EXPECT_EQ(p.refreshes(), 1u);
    ASSERT_EQ(chosen.size(), 1u);
    // index 0 of the fresh, filtered list
    EXPECT_EQ(chosen[0].label, "Headset");
    EXPECT_EQ(chosen[0].address, "AA:AA:AA:AA:AA:03");
    EXPECT_NE(out.str().find("r: re-scan"), std::string::npos);
}

TEST(SelectionPrompt, RescanFailurePropagates)
{
    std::ostringstream out;
    std::istringstream in("r\n");
    RefreshFn          refresh = [](core::ScanSnapshot &, btctl::Error &e) {
        e.set(btctl::ErrorKind::AdapterUnavailable, "adapter gone");
        return false;
    };
    SelectionPrompt p(out, in, PromptConfig{{Column::Alias}, "Pick", "", false}, refresh);

    std::vector<Target> chosen;
    bool                aborted = false;
    btctl::Error        err;
    EXPECT_FALSE(p.run(three(), chosen, aborted, err));
    EXPECT_EQ(err.kind, btctl::ErrorKind::AdapterUnavailable);
}

TEST(SelectionPrompt, QuitAndEndOfInput)
{
    std::vector<Target> chosen;
    bool                aborted = false;
    btctl::Error        err;

    std::ostringstream out;
    std::istringstream quit("q\n");
    SelectionPrompt    p1(out, quit, PromptConfig{{Column::Alias}, "Pick", "", false}, nullptr);
    ASSERT_TRUE(p1.run(three(), chosen, aborted, err));
    EXPECT_TRUE(aborted);
    EXPECT_TRUE(chosen.empty());

    std::istringstream eof("");
    SelectionPrompt    p2(out, eof, PromptConfig{{Column::Alias}, "Pick", "", false}, nullptr);
    EXPECT_FALSE(p2.run(three(), chosen, aborted, err));
    EXPECT_EQ(err.kind, btctl::ErrorKind::Io);
}

TEST(SelectionPrompt, EmptyListSaysSo)
{
    std::ostringstream out;
    std::istringstream in("q\n");
    SelectionPrompt    p(out, in, PromptConfig{{Column::Alias}, "Pick", "zzz", false}, nullptr);

    std::vector<Target> chosen;
    bool                aborted = false;
    btctl::Error        err;
    ASSERT_TRUE(p.run(three(), chosen, aborted, err));
    EXPECT_NE(out.str().find("no devices found"), std::string::npos);
}
