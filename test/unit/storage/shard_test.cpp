#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>
#include "fluxdb/storage/shard.h"
#include "test_util/temp_dir.h"

namespace fluxdb {
namespace storage {
namespace {

class ShardTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = testutil::MakeUniqueTestDir("fluxdb_shard").string();
        config_ = core::StoreConfig::Default();
        shard_ = std::make_unique<Shard>(1, "db", "rp", test_dir_, config_);
        ASSERT_TRUE(shard_->Open().ok());
    }

    void TearDown() override {
        shard_.reset();
        std::filesystem::remove_all(test_dir_);
    }

    void Reopen() {
        ASSERT_TRUE(shard_->Close().ok());
        shard_ = std::make_unique<Shard>(1, "db", "rp", test_dir_, config_);
        ASSERT_TRUE(shard_->Open().ok());
    }

    static core::Point Cpu(const std::string& host, core::Timestamp time, double value) {
        return core::Point("cpu", {{"host", host}}, {{"value", value}}, time);
    }

    std::string test_dir_;
    core::StoreConfig config_;
    std::unique_ptr<Shard> shard_;
};

TEST_F(ShardTest, WriteAndScan) {
    ASSERT_TRUE(shard_->WritePoints({Cpu("a", 20, 2.0), Cpu("a", 10, 1.0), Cpu("b", 10, 5.0)}).ok());

    auto scanned = shard_->Scan("cpu");
    ASSERT_TRUE(scanned.ok());
    ASSERT_EQ(scanned.value().size(), 2u);
    const auto& a = scanned.value()[0];
    EXPECT_EQ(a.measurement, "cpu");
    EXPECT_EQ(a.tags.at("host"), "a");
    ASSERT_EQ(a.records.size(), 2u);
    EXPECT_EQ(a.records[0].time, 10);
    EXPECT_EQ(a.records[1].time, 20);
    EXPECT_EQ(shard_->SeriesCount(), 2u);
}

TEST_F(ShardTest, ScanFiltersByTimeAndTags) {
    ASSERT_TRUE(shard_->WritePoints({Cpu("a", 10, 1.0), Cpu("a", 20, 2.0), Cpu("b", 20, 3.0)}).ok());

    ScanOptions options;
    options.min_time = 15;
    options.tag_filters = {{"host", "a"}};
    auto scanned = shard_->Scan("cpu", options);
    ASSERT_TRUE(scanned.ok());
    ASSERT_EQ(scanned.value().size(), 1u);
    ASSERT_EQ(scanned.value()[0].records.size(), 1u);
    EXPECT_EQ(scanned.value()[0].records[0].time, 20);

    EXPECT_TRUE(shard_->Scan("mem").value().empty());
}

TEST_F(ShardTest, SameTimestampKeepsLatestValue) {
    ASSERT_TRUE(shard_->WritePoints({Cpu("a", 10, 1.0)}).ok());
    ASSERT_TRUE(shard_->WritePoints({Cpu("a", 10, 7.0)}).ok());

    auto scanned = shard_->Scan("cpu");
    ASSERT_EQ(scanned.value()[0].records.size(), 1u);
    EXPECT_EQ(std::get<double>(scanned.value()[0].records[0].fields.at("value")), 7.0);
}

TEST_F(ShardTest, InvalidPointRejectsWholeBatch) {
    core::Point bad("", {}, {{"value", 1.0}}, 0);
    auto result = shard_->WritePoints({Cpu("a", 10, 1.0), bad});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.code(), core::Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(shard_->SeriesCount(), 0u);
}

TEST_F(ShardTest, EmptyBatchIsNoop) {
    EXPECT_TRUE(shard_->WritePoints({}).ok());
    EXPECT_EQ(shard_->SeriesCount(), 0u);
}

TEST_F(ShardTest, Discovery) {
    ASSERT_TRUE(shard_->WritePoints({
        core::Point("cpu", {{"host", "b"}, {"region", "us"}}, {{"value", 1.0}}, 1),
        core::Point("cpu", {{"host", "a"}}, {{"load", int64_t(3)}}, 2),
        core::Point("mem", {}, {{"free", int64_t(10)}}, 1)}).ok());

    EXPECT_EQ(shard_->TagKeys("cpu").value(), (std::vector<std::string>{"host", "region"}));
    EXPECT_EQ(shard_->FieldKeys("cpu").value(), (std::vector<std::string>{"value", "load"}));
    EXPECT_EQ(shard_->TagValues("cpu", "host").value(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(shard_->Measurements().value(), (std::vector<std::string>{"cpu", "mem"}));

    auto keys = shard_->SeriesKeys("cpu");
    ASSERT_TRUE(keys.ok());
    ASSERT_EQ(keys.value().size(), 2u);
    EXPECT_EQ(keys.value()[0].first, "cpu,host=b,region=us");
    EXPECT_EQ(keys.value()[1].second.at("host"), "a");
}

TEST_F(ShardTest, DropSeriesKeepsSchema) {
    ASSERT_TRUE(shard_->WritePoints({Cpu("a", 10, 1.0), core::Point("mem", {}, {{"v", 1.0}}, 1)}).ok());
    ASSERT_TRUE(shard_->DropSeries("cpu").ok());

    EXPECT_TRUE(shard_->Scan("cpu").value().empty());
    EXPECT_TRUE(shard_->TagValues("cpu", "host").value().empty());
    EXPECT_EQ(shard_->Measurements().value(), (std::vector<std::string>{"mem"}));
    EXPECT_EQ(shard_->TagKeys("cpu").value(), (std::vector<std::string>{"host"}));
    EXPECT_EQ(shard_->SchemaMeasurements().value(), (std::vector<std::string>{"cpu", "mem"}));

    // Dropping an unknown measurement succeeds
    EXPECT_TRUE(shard_->DropSeries("disk").ok());
}

TEST_F(ShardTest, SurvivesReopenWithSnapshot) {
    ASSERT_TRUE(shard_->WritePoints({Cpu("a", 10, 1.0), Cpu("b", 20, 2.0)}).ok());
    ASSERT_TRUE(shard_->DropSeries("cpu").ok());
    ASSERT_TRUE(shard_->WritePoints({Cpu("c", 30, 3.0)}).ok());
    Reopen();

    EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(test_dir_) / "snapshot.dat"));
    auto scanned = shard_->Scan("cpu");
    ASSERT_EQ(scanned.value().size(), 1u);
    EXPECT_EQ(scanned.value()[0].tags.at("host"), "c");
    EXPECT_EQ(shard_->TagKeys("cpu").value(), (std::vector<std::string>{"host"}));
}

TEST_F(ShardTest, SurvivesReopenFromLogOnly) {
    shard_.reset();
    std::filesystem::remove_all(test_dir_);
    config_.compact_on_close = false;
    shard_ = std::make_unique<Shard>(1, "db", "rp", test_dir_, config_);
    ASSERT_TRUE(shard_->Open().ok());

    ASSERT_TRUE(shard_->WritePoints({Cpu("a", 10, 1.0)}).ok());
    ASSERT_TRUE(shard_->DropSeries("cpu").ok());
    Reopen();

    EXPECT_FALSE(std::filesystem::exists(std::filesystem::path(test_dir_) / "snapshot.dat"));
    EXPECT_TRUE(shard_->Scan("cpu").value().empty());
    EXPECT_EQ(shard_->TagKeys("cpu").value(), (std::vector<std::string>{"host"}));
}

TEST_F(ShardTest, ClosedShardRejectsOperations) {
    ASSERT_TRUE(shard_->Close().ok());
    EXPECT_FALSE(shard_->IsOpen());

    auto written = shard_->WritePoints({Cpu("a", 1, 1.0)});
    ASSERT_FALSE(written.ok());
    EXPECT_EQ(written.code(), core::Error::Code::CLOSED);
    EXPECT_EQ(shard_->Scan("cpu").code(), core::Error::Code::CLOSED);
    EXPECT_EQ(shard_->DropSeries("cpu").code(), core::Error::Code::CLOSED);

    // Reopening restores access
    ASSERT_TRUE(shard_->Open().ok());
    EXPECT_TRUE(shard_->WritePoints({Cpu("a", 1, 1.0)}).ok());
}

TEST_F(ShardTest, CorruptLogFailsOpen) {
    ASSERT_TRUE(shard_->WritePoints({Cpu("a", 10, 1.0)}).ok());
    shard_.reset();

    // Overwrite the only snapshot with a well-framed but undecodable record
    {
        std::ofstream out(std::filesystem::path(test_dir_) / "snapshot.dat",
                          std::ios::binary | std::ios::trunc);
        const char frame[] = {2, 0, 0, 0, 0x7f, 0x00};
        out.write(frame, sizeof(frame));
    }
    Shard shard(1, "db", "rp", test_dir_, config_);
    auto opened = shard.Open();
    ASSERT_FALSE(opened.ok());
    EXPECT_EQ(opened.code(), core::Error::Code::IO_FAILURE);
    EXPECT_FALSE(shard.IsOpen());
}

TEST_F(ShardTest, ConcurrentBatchesAreAtomic) {
    constexpr int kWriters = 4;
    constexpr int kBatches = 50;
    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};

    // Each batch writes the same timestamp to two series; readers must see both or neither
    std::thread reader([&] {
        while (!stop.load()) {
            auto scanned = shard_->Scan("pair");
            if (!scanned.ok()) {
                continue;
            }
            size_t left = 0, right = 0;
            for (const auto& series : scanned.value()) {
                (series.tags.at("side") == "left" ? left : right) += series.records.size();
            }
            if (left != right) {
                torn++;
            }
        }
    });

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&, w] {
            for (int i = 0; i < kBatches; ++i) {
                core::Timestamp ts = w * kBatches + i;
                auto result = shard_->WritePoints({
                    core::Point("pair", {{"side", "left"}}, {{"v", int64_t(i)}}, ts),
                    core::Point("pair", {{"side", "right"}}, {{"v", int64_t(i)}}, ts)});
                EXPECT_TRUE(result.ok());
            }
        });
    }
    for (auto& t : writers) {
        t.join();
    }
    stop = true;
    reader.join();

    EXPECT_EQ(torn.load(), 0);
    auto scanned = shard_->Scan("pair");
    ASSERT_EQ(scanned.value().size(), 2u);
    EXPECT_EQ(scanned.value()[0].records.size(), static_cast<size_t>(kWriters * kBatches));
}

} // namespace
} // namespace storage
} // namespace fluxdb
