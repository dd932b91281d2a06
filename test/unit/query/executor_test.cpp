#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "fluxdb/meta/memory_meta_store.h"
#include "fluxdb/query/executor.h"
#include "fluxdb/query/json.h"
#include "test_util/temp_dir.h"
#include "test_util/test_meta_store.h"

namespace fluxdb {
namespace query {
namespace {

std::unique_ptr<Statement> SelectAll(const std::string& measurement) {
    auto stmt = std::make_unique<SelectStatement>();
    stmt->fields = {"*"};
    stmt->source.measurement = measurement;
    return stmt;
}

std::unique_ptr<Statement> DropSeries(const std::string& measurement) {
    auto stmt = std::make_unique<DropSeriesStatement>();
    stmt->source.measurement = measurement;
    return stmt;
}

std::unique_ptr<Statement> ShowTagKeysFrom(const std::string& measurement) {
    auto stmt = std::make_unique<ShowTagKeysStatement>();
    stmt->source = Source{"", "", measurement};
    return stmt;
}

std::shared_ptr<const Query> MakeQuery(std::vector<std::unique_ptr<Statement>> statements) {
    auto query = std::make_shared<Query>();
    query->statements = std::move(statements);
    return query;
}

std::shared_ptr<const Query> MakeQuery(std::unique_ptr<Statement> statement) {
    std::vector<std::unique_ptr<Statement>> statements;
    statements.push_back(std::move(statement));
    return MakeQuery(std::move(statements));
}

core::Point Cpu(const std::string& host, core::Timestamp time, double value) {
    return core::Point("cpu", {{"host", host}}, {{"value", value}}, time);
}

const char kCpuSeries[] =
    R"([{"series":[{"name":"cpu","tags":{"host":"server"},"columns":["time","value"],)"
    R"("values":[["1970-01-01T00:00:01.000000002Z",1],["1970-01-01T00:00:02.000000003Z",1]]}]}])";

class QueryExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = testutil::MakeUniqueTestDir("fluxdb_executor").string();
        meta_ = std::make_shared<testutil::TestMetaStore>();
        OpenStore();
        ASSERT_TRUE(store_->CreateShard("foo", "bar", testutil::TestMetaStore::kShardID).ok());
        executor_ = std::make_unique<QueryExecutor>(store_, config_);
        executor_->set_meta_store(meta_);
    }

    void TearDown() override {
        executor_.reset();
        store_.reset();
        std::filesystem::remove_all(test_dir_);
    }

    void OpenStore() {
        store_ = std::make_shared<storage::Store>(test_dir_);
        ASSERT_TRUE(store_->Open().ok());
    }

    void ReopenStore() {
        ASSERT_TRUE(store_->Close().ok());
        OpenStore();
        executor_->set_store(store_);
    }

    void Write(const std::vector<core::Point>& points) {
        auto result = store_->WriteToShard(testutil::TestMetaStore::kShardID, points);
        ASSERT_TRUE(result.ok()) << result.error();
    }

    std::vector<Result> Run(std::shared_ptr<const Query> query, int chunk_size = 20,
                            const std::string& database = "foo",
                            const meta::UserInfo* user = nullptr) {
        auto stream = executor_->ExecuteQuery(std::move(query), database, chunk_size, user);
        EXPECT_TRUE(stream.ok());
        if (!stream.ok()) {
            return {};
        }
        return stream.value()->Collect();
    }

    std::string RunJSON(std::shared_ptr<const Query> query, int chunk_size = 20) {
        return MarshalResults(Run(std::move(query), chunk_size));
    }

    std::string test_dir_;
    core::QueryConfig config_ = core::QueryConfig::Default();
    std::shared_ptr<testutil::TestMetaStore> meta_;
    std::shared_ptr<storage::Store> store_;
    std::unique_ptr<QueryExecutor> executor_;
};

TEST_F(QueryExecutorTest, WritePointsAndSelect) {
    Write({Cpu("server", core::MakeTimestamp(1, 2), 1.0)});
    Write({Cpu("server", core::MakeTimestamp(2, 3), 1.0)});

    EXPECT_EQ(RunJSON(MakeQuery(SelectAll("cpu"))), kCpuSeries);

    ReopenStore();
    EXPECT_EQ(RunJSON(MakeQuery(SelectAll("cpu"))), kCpuSeries);
}

TEST_F(QueryExecutorTest, DropSeriesKeepsTagKeys) {
    Write({Cpu("server", core::MakeTimestamp(1, 2), 1.0)});

    EXPECT_EQ(RunJSON(MakeQuery(DropSeries("cpu"))), "[{}]");

    const std::string tag_keys = R"([{"series":[{"name":"cpu","columns":["tagKey"],"values":[["host"]]}]}])";
    EXPECT_EQ(RunJSON(MakeQuery(SelectAll("cpu"))), "[{}]");
    EXPECT_EQ(RunJSON(MakeQuery(ShowTagKeysFrom("cpu"))), tag_keys);

    ReopenStore();
    EXPECT_EQ(RunJSON(MakeQuery(SelectAll("cpu"))), "[{}]");
    EXPECT_EQ(RunJSON(MakeQuery(ShowTagKeysFrom("cpu"))), tag_keys);
}

TEST_F(QueryExecutorTest, CreateUserAllowedWhileNoUsersExist) {
    auto create = std::make_unique<CreateUserStatement>();
    create->name = "susy";
    create->password = "pass";
    create->admin = true;
    auto query = MakeQuery(std::move(create));

    meta_->set_user_count(0);
    EXPECT_TRUE(executor_->Authorize(nullptr, *query, "foo").ok());

    meta_->set_user_count(1);
    auto denied = executor_->Authorize(nullptr, *query, "foo");
    ASSERT_FALSE(denied.ok());
    EXPECT_EQ(denied.code(), core::Error::Code::AUTHORIZATION_DENIED);
}

TEST_F(QueryExecutorTest, SelectUnknownMeasurementIsEmpty) {
    EXPECT_EQ(RunJSON(MakeQuery(SelectAll("mem"))), "[{}]");
}

TEST_F(QueryExecutorTest, SelectMissingFieldRendersNull) {
    Write({Cpu("server", 10, 1.0),
           core::Point("cpu", {{"host", "server"}}, {{"load", int64_t(4)}}, 20)});

    auto results = Run(MakeQuery(SelectAll("cpu")));
    ASSERT_EQ(results.size(), 1u);
    ASSERT_EQ(results[0].series.size(), 1u);
    const Row& row = results[0].series[0];
    EXPECT_EQ(row.columns, (std::vector<std::string>{"time", "value", "load"}));
    ASSERT_EQ(row.values.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(row.values[0][2]));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(row.values[1][1]));
    EXPECT_EQ(std::get<int64_t>(row.values[1][2]), 4);
}

TEST_F(QueryExecutorTest, SelectNamedFieldSkipsRowsWithoutIt) {
    Write({Cpu("server", 10, 1.0),
           core::Point("cpu", {{"host", "server"}}, {{"load", int64_t(4)}}, 20)});

    auto select = std::make_unique<SelectStatement>();
    select->fields = {"value"};
    select->source.measurement = "cpu";
    auto results = Run(MakeQuery(std::move(select)));
    ASSERT_EQ(results[0].series.size(), 1u);
    EXPECT_EQ(results[0].series[0].values.size(), 1u);
}

TEST_F(QueryExecutorTest, SelectTagFilterAndLimit) {
    Write({Cpu("a", 1, 1.0), Cpu("a", 2, 2.0), Cpu("a", 3, 3.0), Cpu("b", 1, 9.0)});

    auto select = std::make_unique<SelectStatement>();
    select->fields = {"value"};
    select->source.measurement = "cpu";
    select->tag_filters = {{"host", "a"}};
    select->limit = 2;
    auto results = Run(MakeQuery(std::move(select)));
    ASSERT_EQ(results[0].series.size(), 1u);
    const Row& row = results[0].series[0];
    EXPECT_EQ(row.tags.at("host"), "a");
    ASSERT_EQ(row.values.size(), 2u);
    EXPECT_EQ(std::get<double>(row.values[1][1]), 2.0);
}

TEST_F(QueryExecutorTest, SeriesLimitExceeded) {
    config_.max_series_per_query = 1;
    executor_ = std::make_unique<QueryExecutor>(store_, config_);
    executor_->set_meta_store(meta_);
    Write({Cpu("a", 1, 1.0), Cpu("b", 1, 1.0)});

    auto results = Run(MakeQuery(SelectAll("cpu")));
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].ok());
    EXPECT_EQ(results[0].error_code, core::Error::Code::RESOURCE_EXHAUSTED);
}

TEST_F(QueryExecutorTest, ChunksLargeResults) {
    std::vector<core::Point> points;
    for (int i = 0; i < 5; ++i) {
        points.push_back(Cpu("server", i + 1, static_cast<double>(i)));
    }
    Write(points);

    auto results = Run(MakeQuery(SelectAll("cpu")), 2);
    ASSERT_EQ(results.size(), 3u);
    size_t total = 0;
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].statement_id, 0u);
        EXPECT_EQ(results[i].partial, i + 1 < results.size());
        ASSERT_EQ(results[i].series.size(), 1u);
        EXPECT_EQ(results[i].series[0].name, "cpu");
        total += results[i].series[0].values.size();
    }
    EXPECT_EQ(total, 5u);
    EXPECT_EQ(results[2].series[0].values.size(), 1u);

    auto unchunked = Run(MakeQuery(SelectAll("cpu")), 0);
    ASSERT_EQ(unchunked.size(), 1u);
    EXPECT_FALSE(unchunked[0].partial);
    EXPECT_EQ(unchunked[0].series[0].values.size(), 5u);
}

TEST_F(QueryExecutorTest, ChunksSplitAcrossSeries) {
    Write({Cpu("a", 1, 1.0), Cpu("a", 2, 2.0), Cpu("a", 3, 3.0), Cpu("b", 1, 4.0), Cpu("b", 2, 5.0)});

    // Rows of every chunk, flattened with the host they belong to
    using TaggedRow = std::pair<std::string, std::vector<Value>>;
    auto flatten = [](const std::vector<Result>& results) {
        std::vector<TaggedRow> rows;
        for (const auto& result : results) {
            for (const auto& series : result.series) {
                EXPECT_EQ(series.columns, (std::vector<std::string>{"time", "value"}));
                for (const auto& values : series.values) {
                    rows.emplace_back(series.tags.at("host"), values);
                }
            }
        }
        return rows;
    };

    auto chunked = Run(MakeQuery(SelectAll("cpu")), 2);
    ASSERT_EQ(chunked.size(), 3u);
    EXPECT_TRUE(chunked[0].partial);
    EXPECT_TRUE(chunked[1].partial);
    EXPECT_FALSE(chunked[2].partial);

    // The middle chunk ends series a and starts series b
    ASSERT_EQ(chunked[1].series.size(), 2u);
    EXPECT_EQ(chunked[1].series[0].tags.at("host"), "a");
    EXPECT_EQ(chunked[1].series[0].values.size(), 1u);
    EXPECT_EQ(chunked[1].series[1].tags.at("host"), "b");
    EXPECT_EQ(chunked[1].series[1].values.size(), 1u);

    auto unchunked = Run(MakeQuery(SelectAll("cpu")), 0);
    ASSERT_EQ(unchunked.size(), 1u);
    ASSERT_EQ(unchunked[0].series.size(), 2u);

    auto rows = flatten(chunked);
    EXPECT_EQ(rows.size(), 5u);
    EXPECT_TRUE(rows == flatten(unchunked));
}

TEST_F(QueryExecutorTest, FailedStatementDoesNotStopLaterOnes) {
    Write({Cpu("server", core::MakeTimestamp(1, 2), 1.0)});

    std::vector<std::unique_ptr<Statement>> statements;
    statements.push_back(SelectAll(""));
    statements.push_back(SelectAll("cpu"));
    auto results = Run(MakeQuery(std::move(statements)));

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].statement_id, 0u);
    EXPECT_FALSE(results[0].ok());
    EXPECT_EQ(results[0].error_code, core::Error::Code::INVALID_STATEMENT);
    EXPECT_EQ(results[1].statement_id, 1u);
    EXPECT_TRUE(results[1].ok());
    EXPECT_EQ(results[1].series.size(), 1u);
}

TEST_F(QueryExecutorTest, MissingDatabaseIsReportedPerStatement) {
    auto results = Run(MakeQuery(SelectAll("cpu")), 20, "");
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].error_code, core::Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(MarshalResults(results), R"([{"error":"database name required"}])");
}

TEST_F(QueryExecutorTest, ClosedStoreIsReportedPerStatement) {
    ASSERT_TRUE(store_->Close().ok());
    auto results = Run(MakeQuery(SelectAll("cpu")));
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].error_code, core::Error::Code::CLOSED);
}

TEST_F(QueryExecutorTest, RejectsNullQueryAndMissingMetaStore) {
    auto null_query = executor_->ExecuteQuery(nullptr, "foo", 20);
    ASSERT_FALSE(null_query.ok());
    EXPECT_EQ(null_query.code(), core::Error::Code::INVALID_ARGUMENT);

    QueryExecutor bare(store_);
    auto no_meta = bare.ExecuteQuery(MakeQuery(SelectAll("cpu")), "foo", 20);
    ASSERT_FALSE(no_meta.ok());
    EXPECT_EQ(no_meta.code(), core::Error::Code::INTERNAL);
}

TEST_F(QueryExecutorTest, CancelStopsProducer) {
    config_.result_buffer_size = 1;
    executor_ = std::make_unique<QueryExecutor>(store_, config_);
    executor_->set_meta_store(meta_);

    std::vector<core::Point> points;
    for (int i = 0; i < 100; ++i) {
        points.push_back(Cpu("server", i + 1, 1.0));
    }
    Write(points);

    auto stream = executor_->ExecuteQuery(MakeQuery(SelectAll("cpu")), "foo", 1);
    ASSERT_TRUE(stream.ok());
    auto first = stream.value()->Next();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->partial);

    stream.value()->Cancel();
    EXPECT_FALSE(stream.value()->Next().has_value());
    // Destroying the stream joins the producer
}

TEST_F(QueryExecutorTest, DroppingStreamEarlyIsSafe) {
    Write({Cpu("server", 1, 1.0), Cpu("server", 2, 1.0), Cpu("server", 3, 1.0)});
    for (int i = 0; i < 10; ++i) {
        auto stream = executor_->ExecuteQuery(MakeQuery(SelectAll("cpu")), "foo", 1);
        ASSERT_TRUE(stream.ok());
    }
}

TEST_F(QueryExecutorTest, ShowStatements) {
    Write({core::Point("cpu", {{"host", "b"}, {"region", "us"}}, {{"value", 1.0}}, 1),
           core::Point("cpu", {{"host", "a"}}, {{"value", 1.0}}, 1),
           core::Point("mem", {{"host", "a"}}, {{"free", int64_t(1)}}, 1)});

    EXPECT_EQ(RunJSON(MakeQuery(std::make_unique<ShowMeasurementsStatement>())),
              R"([{"series":[{"name":"measurements","columns":["name"],"values":[["cpu"],["mem"]]}]}])");

    auto tag_values = std::make_unique<ShowTagValuesStatement>();
    tag_values->source = Source{"", "", "cpu"};
    tag_values->key = "host";
    EXPECT_EQ(RunJSON(MakeQuery(std::move(tag_values))),
              R"([{"series":[{"name":"cpu","columns":["key","value"],"values":[["host","a"],["host","b"]]}]}])");

    EXPECT_EQ(RunJSON(MakeQuery(std::make_unique<ShowTagKeysStatement>())),
              R"([{"series":[{"name":"cpu","columns":["tagKey"],"values":[["host"],["region"]]},)"
              R"({"name":"mem","columns":["tagKey"],"values":[["host"]]}]}])");

    auto series = std::make_unique<ShowSeriesStatement>();
    series->source = Source{"", "", "cpu"};
    EXPECT_EQ(RunJSON(MakeQuery(std::move(series))),
              R"([{"series":[{"name":"cpu","columns":["_key","host","region"],)"
              R"("values":[["cpu,host=b,region=us","b","us"],["cpu,host=a","a",""]]}]}])");

    EXPECT_EQ(RunJSON(MakeQuery(std::make_unique<ShowDatabasesStatement>())),
              R"([{"series":[{"name":"databases","columns":["name"],"values":[["foo"]]}]}])");
}

// Runs against the in-memory metadata service with authorization switched on
class AuthorizedExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = testutil::MakeUniqueTestDir("fluxdb_executor_auth").string();
        store_ = std::make_shared<storage::Store>(test_dir_);
        ASSERT_TRUE(store_->Open().ok());
        ASSERT_TRUE(store_->CreateShard("foo", "bar", 1).ok());

        meta_ = std::make_shared<meta::MemoryMetaStore>();
        ASSERT_TRUE(meta_->CreateDatabase("foo").ok());
        meta::RetentionPolicyInfo rp;
        rp.name = "bar";
        ASSERT_TRUE(meta_->CreateRetentionPolicy("foo", rp, true).ok());
        ASSERT_TRUE(meta_->CreateShardGroup("foo", "bar", 0, core::MakeTimestamp(3600), {1}).ok());

        config_.auth_enabled = true;
        executor_ = std::make_unique<QueryExecutor>(store_, config_);
        executor_->set_meta_store(meta_);

        ASSERT_TRUE(store_->WriteToShard(1, {Cpu("server", core::MakeTimestamp(1, 2), 1.0),
                                             Cpu("server", core::MakeTimestamp(2, 3), 1.0)}).ok());
    }

    void TearDown() override {
        executor_.reset();
        store_.reset();
        std::filesystem::remove_all(test_dir_);
    }

    std::vector<Result> Run(std::shared_ptr<const Query> query, const meta::UserInfo* user) {
        auto stream = executor_->ExecuteQuery(std::move(query), "foo", 20, user);
        EXPECT_TRUE(stream.ok());
        if (!stream.ok()) {
            return {};
        }
        return stream.value()->Collect();
    }

    std::string test_dir_;
    core::QueryConfig config_ = core::QueryConfig::Default();
    std::shared_ptr<storage::Store> store_;
    std::shared_ptr<meta::MemoryMetaStore> meta_;
    std::unique_ptr<QueryExecutor> executor_;
};

TEST_F(AuthorizedExecutorTest, BootstrapAdminThenQuery) {
    auto denied = Run(MakeQuery(SelectAll("cpu")), nullptr);
    ASSERT_EQ(denied.size(), 1u);
    EXPECT_EQ(denied[0].error_code, core::Error::Code::AUTHORIZATION_DENIED);

    auto create = std::make_unique<CreateUserStatement>();
    create->name = "susy";
    create->password = "pass";
    create->admin = true;
    EXPECT_EQ(MarshalResults(Run(MakeQuery(std::move(create)), nullptr)), "[{}]");
    EXPECT_EQ(meta_->UserCount().value(), 1);

    auto susy = meta_->Authenticate("susy", "pass");
    ASSERT_TRUE(susy.ok());
    EXPECT_EQ(MarshalResults(Run(MakeQuery(SelectAll("cpu")), &susy.value())), kCpuSeries);
}

TEST_F(AuthorizedExecutorTest, DeniedStatementDoesNotStopOthers) {
    ASSERT_TRUE(meta_->CreateUser("susy", "pass", true).ok());
    ASSERT_TRUE(meta_->CreateUser("bob", "pass", false).ok());
    ASSERT_TRUE(meta_->SetPrivilege("bob", "foo", meta::Privilege::READ).ok());
    auto bob = meta_->User("bob").take_value();

    std::vector<std::unique_ptr<Statement>> statements;
    statements.push_back(DropSeries("cpu"));
    statements.push_back(SelectAll("cpu"));
    auto results = Run(MakeQuery(std::move(statements)), &bob);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].error_code, core::Error::Code::AUTHORIZATION_DENIED);
    EXPECT_TRUE(results[1].ok());
    ASSERT_EQ(results[1].series.size(), 1u);
    EXPECT_EQ(results[1].series[0].values.size(), 2u);
}

TEST_F(AuthorizedExecutorTest, TimeBoundedSelectUsesOverlappingGroups) {
    ASSERT_TRUE(meta_->CreateUser("susy", "pass", true).ok());
    auto susy = meta_->User("susy").take_value();

    auto select = std::make_unique<SelectStatement>();
    select->fields = {"value"};
    select->source.measurement = "cpu";
    select->min_time = core::MakeTimestamp(2);
    auto results = Run(MakeQuery(std::move(select)), &susy);
    ASSERT_EQ(results.size(), 1u);
    ASSERT_EQ(results[0].series.size(), 1u);
    ASSERT_EQ(results[0].series[0].values.size(), 1u);
    EXPECT_EQ(std::get<TimeValue>(results[0].series[0].values[0][0]).nanos, core::MakeTimestamp(2, 3));

    // No group covers this window
    auto later = std::make_unique<SelectStatement>();
    later->fields = {"value"};
    later->source.measurement = "cpu";
    later->min_time = core::MakeTimestamp(7200);
    EXPECT_EQ(MarshalResults(Run(MakeQuery(std::move(later)), &susy)), "[{}]");
}

TEST_F(AuthorizedExecutorTest, UserManagement) {
    ASSERT_TRUE(meta_->CreateUser("susy", "pass", true).ok());
    auto susy = meta_->User("susy").take_value();

    auto create = std::make_unique<CreateUserStatement>();
    create->name = "bob";
    create->password = "secret";
    EXPECT_EQ(MarshalResults(Run(MakeQuery(std::move(create)), &susy)), "[{}]");
    EXPECT_TRUE(meta_->Authenticate("bob", "secret").ok());

    auto drop = std::make_unique<DropUserStatement>();
    drop->name = "bob";
    EXPECT_EQ(MarshalResults(Run(MakeQuery(std::move(drop)), &susy)), "[{}]");
    EXPECT_EQ(meta_->User("bob").code(), core::Error::Code::NOT_FOUND);

    auto again = std::make_unique<DropUserStatement>();
    again->name = "bob";
    auto results = Run(MakeQuery(std::move(again)), &susy);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].error_code, core::Error::Code::NOT_FOUND);
}

} // namespace
} // namespace query
} // namespace fluxdb
