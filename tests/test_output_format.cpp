#include <gtest/gtest.h>

#include "app/output_format.hpp"

using namespace app;

namespace
{
core::DeviceRecord dev1()
{
    core::DeviceRecord r;
    r.address   = "AA:BB:CC:DD:EE:FF";
    r.alias     = "Dev1";
    r.connected = false;
    r.trusted   = true;
    r.bonded    = false;
    r.paired    = false;
    return r;
}
}  // namespace

TEST(OutputFormat, TableRendersProjectedColumns)
{
    std::string out = format({dev1()}, {Column::Alias, Column::Connected}, OutputMode::Table);
    EXPECT_EQ(out, "ALIAS  CONNECTED\n"
                   "Dev1   false\n");
}

TEST(OutputFormat, TerseJoinsWithSlash)
{
    std::string out = format({dev1()}, {Column::Alias, Column::Connected}, OutputMode::Terse);
    EXPECT_EQ(out, "Dev1/false\n");
}

TEST(OutputFormat, WidthIsMaxOfHeaderAndCells)
{
    core::DeviceRecord longer = dev1();
    longer.alias              = "Living Room Speaker";
    longer.rssi               = -42;

    std::string out = format({dev1(), longer}, {Column::Alias, Column::Rssi, Column::Address},
                             OutputMode::Table);
    EXPECT_EQ(out, "ALIAS                RSSI  ADDRESS\n"
                   "Dev1                 -     AA:BB:CC:DD:EE:FF\n"
                   "Living Room Speaker  -42   AA:BB:CC:DD:EE:FF\n");
}

TEST(OutputFormat, EmptyRecordsStillPrintHeader)
{
    EXPECT_EQ(format({}, {Column::Alias, Column::Address}, OutputMode::Table), "ALIAS  ADDRESS\n");
    EXPECT_EQ(format({}, {Column::Alias}, OutputMode::Terse), "");
}

TEST(OutputFormat, ParseColumnsKeepsOrder)
{
    std::vector<Column> cols;
    btctl::Error        err;
    ASSERT_TRUE(parse_columns("rssi,alias, paired", cols, err));
    ASSERT_EQ(cols.size(), 3u);
    EXPECT_EQ(cols[0], Column::Rssi);
    EXPECT_EQ(cols[1], Column::Alias);
    EXPECT_EQ(cols[2], Column::Paired);
}

TEST(OutputFormat, UnknownColumnIsRejected)
{
    std::vector<Column> cols;
    btctl::Error        err;
    EXPECT_FALSE(parse_columns("alias,name", cols, err));
    EXPECT_EQ(err.kind, btctl::ErrorKind::InvalidProjection);
    EXPECT_NE(err.reason.find("name"), std::string::npos);
    EXPECT_TRUE(cols.empty());

    err.clear();
    EXPECT_FALSE(parse_columns("", cols, err));
    EXPECT_EQ(err.kind, btctl::ErrorKind::InvalidProjection);
}

TEST(OutputFormat, StatusFlagsMustBeBoolean)
{
    std::vector<Column> flags;
    btctl::Error        err;
    EXPECT_TRUE(parse_status_flags("trusted,paired", flags, err));
    EXPECT_EQ(flags.size(), 2u);

    EXPECT_FALSE(parse_status_flags("trusted,rssi", flags, err));
    EXPECT_EQ(err.kind, btctl::ErrorKind::InvalidProjection);
}

TEST(OutputFormat, FilterByUndisplayedFlag)
{
    core::DeviceRecord untrusted = dev1();
    untrusted.alias              = "Dev2";
    untrusted.address            = "11:22:33:44:55:66";
    untrusted.trusted            = false;

    auto kept = filter_by_status({dev1(), untrusted}, {Column::Trusted});
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].alias, "Dev1");

    // trusted is not among the displayed columns
    EXPECT_EQ(format(kept, {Column::Alias, Column::Connected}, OutputMode::Terse), "Dev1/false\n");
}

TEST(OutputFormat, FilterRequiresEveryFlag)
{
    core::DeviceRecord both = dev1();
    both.paired             = true;

    auto kept = filter_by_status({dev1(), both}, {Column::Trusted, Column::Paired});
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_TRUE(kept[0].paired);

    EXPECT_EQ(filter_by_status({dev1(), both}, {}).size(), 2u);
}
