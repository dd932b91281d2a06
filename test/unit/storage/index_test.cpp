#include <gtest/gtest.h>
#include "fluxdb/storage/index.h"
#include "fluxdb/storage/schema_catalog.h"
#include "fluxdb/storage/series.h"

namespace fluxdb {
namespace storage {
namespace {

core::Point CpuPoint(const std::string& host, core::Timestamp time, double value) {
    return core::Point("cpu", {{"host", host}}, {{"value", value}}, time);
}

TEST(SeriesTest, ReadIsAscendingAndInclusive) {
    Series series(1, "cpu,host=a", "cpu", {{"host", "a"}});
    series.write(30, {{"value", 3.0}});
    series.write(10, {{"value", 1.0}});
    series.write(20, {{"value", 2.0}});

    auto all = series.read(core::kMinTimestamp, core::kMaxTimestamp);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].time, 10);
    EXPECT_EQ(all[2].time, 30);

    auto window = series.read(10, 20);
    ASSERT_EQ(window.size(), 2u);
    EXPECT_EQ(window[1].time, 20);

    EXPECT_TRUE(series.read(31, 40).empty());
    EXPECT_TRUE(series.read(20, 10).empty());
}

TEST(SeriesTest, SameTimestampMergesFieldsLastWriteWins) {
    Series series(1, "cpu", "cpu", {});
    series.write(10, {{"value", 1.0}, {"load", int64_t(5)}});
    series.write(10, {{"value", 2.0}});

    auto records = series.read(10, 10);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(std::get<double>(records[0].fields.at("value")), 2.0);
    EXPECT_EQ(std::get<int64_t>(records[0].fields.at("load")), 5);
    EXPECT_EQ(series.num_records(), 1u);
}

TEST(IndexTest, GetOrCreateReusesSeries) {
    Index index;
    Series* a = index.get_or_create(CpuPoint("a", 1, 1.0));
    Series* again = index.get_or_create(CpuPoint("a", 2, 2.0));
    Series* b = index.get_or_create(CpuPoint("b", 1, 1.0));

    EXPECT_EQ(a, again);
    EXPECT_NE(a, b);
    EXPECT_NE(a->id(), b->id());
    EXPECT_EQ(index.num_series(), 2u);
    EXPECT_EQ(a->key(), "cpu,host=a");
}

TEST(IndexTest, SeriesForKeepsCreationOrder) {
    Index index;
    index.get_or_create(CpuPoint("z", 1, 1.0));
    index.get_or_create(CpuPoint("a", 1, 1.0));

    auto series = index.series_for("cpu");
    ASSERT_EQ(series.size(), 2u);
    EXPECT_EQ(series[0]->tags().at("host"), "z");
    EXPECT_EQ(series[1]->tags().at("host"), "a");
    EXPECT_TRUE(index.series_for("mem").empty());
}

TEST(IndexTest, TagDiscovery) {
    Index index;
    index.get_or_create(core::Point("cpu", {{"host", "b"}, {"region", "us"}}, {{"v", 1.0}}, 0));
    index.get_or_create(core::Point("cpu", {{"host", "a"}}, {{"v", 1.0}}, 0));
    index.get_or_create(core::Point("mem", {{"host", "c"}}, {{"v", 1.0}}, 0));

    EXPECT_EQ(index.tag_values("cpu", "host"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(index.tag_values("cpu", "region"), (std::vector<std::string>{"us"}));
    EXPECT_TRUE(index.tag_values("cpu", "missing").empty());
    EXPECT_EQ(index.measurements(), (std::vector<std::string>{"cpu", "mem"}));
}

TEST(IndexTest, RemoveMeasurement) {
    Index index;
    index.get_or_create(CpuPoint("a", 1, 1.0));
    index.get_or_create(CpuPoint("b", 1, 1.0));
    index.get_or_create(core::Point("mem", {}, {{"v", 1.0}}, 0));

    EXPECT_EQ(index.remove_measurement("cpu"), 2u);
    EXPECT_FALSE(index.has_measurement("cpu"));
    EXPECT_TRUE(index.has_measurement("mem"));
    EXPECT_EQ(index.num_series(), 1u);
    EXPECT_TRUE(index.series_for("cpu").empty());
    EXPECT_EQ(index.remove_measurement("cpu"), 0u);

    // Re-creating after removal starts a fresh series
    Series* fresh = index.get_or_create(CpuPoint("a", 5, 5.0));
    EXPECT_EQ(fresh->num_records(), 0u);
}

TEST(SchemaCatalogTest, ObserveAndDeclare) {
    SchemaCatalog catalog;
    catalog.observe(core::Point("cpu", {{"host", "a"}}, {{"value", 1.0}}, 0));
    catalog.observe(core::Point("cpu", {{"region", "us"}}, {{"load", 1.0}, {"value", 2.0}}, 0));
    catalog.declare("disk", {"path"}, {"used", "free"});

    EXPECT_EQ(catalog.measurements(), (std::vector<std::string>{"cpu", "disk"}));
    EXPECT_EQ(catalog.tag_keys("cpu"), (std::vector<std::string>{"host", "region"}));
    EXPECT_EQ(catalog.field_names("cpu"), (std::vector<std::string>{"value", "load"}));
    EXPECT_EQ(catalog.field_names("disk"), (std::vector<std::string>{"used", "free"}));
    EXPECT_TRUE(catalog.tag_keys("mem").empty());
}

} // namespace
} // namespace storage
} // namespace fluxdb
