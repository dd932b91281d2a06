#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "fluxdb/query/json.h"

namespace fluxdb {
namespace query {
namespace {

Row CpuRow() {
    Row row;
    row.name = "cpu";
    row.tags = {{"host", "server"}};
    row.columns = {"time", "value"};
    row.values.push_back({TimeValue{core::MakeTimestamp(1, 2)}, Value(1.0)});
    row.values.push_back({TimeValue{core::MakeTimestamp(2, 3)}, Value(1.0)});
    return row;
}

TEST(JsonTest, SeriesResult) {
    Result result;
    result.series.push_back(CpuRow());
    EXPECT_EQ(MarshalResults({result}),
              R"([{"series":[{"name":"cpu","tags":{"host":"server"},"columns":["time","value"],)"
              R"("values":[["1970-01-01T00:00:01.000000002Z",1],["1970-01-01T00:00:02.000000003Z",1]]}]}])");
}

TEST(JsonTest, EmptyResultIsEmptyObject) {
    EXPECT_EQ(MarshalResult(Result()), "{}");
    EXPECT_EQ(MarshalResults({Result()}), "[{}]");
    EXPECT_EQ(MarshalResults({}), "[]");
}

TEST(JsonTest, ErrorResult) {
    auto result = Result::Error(0, "database foo not found", core::Error::Code::NOT_FOUND);
    EXPECT_EQ(MarshalResult(result), R"({"error":"database foo not found"})");
}

TEST(JsonTest, OmitsEmptyTagsAndValues) {
    Row row;
    row.name = "cpu";
    row.columns = {"tagKey"};
    Result result;
    result.series.push_back(row);
    EXPECT_EQ(MarshalResult(result), R"({"series":[{"name":"cpu","columns":["tagKey"]}]})");
}

TEST(JsonTest, PartialChunk) {
    Result result;
    result.series.push_back(CpuRow());
    result.partial = true;
    std::string json = MarshalResult(result);
    EXPECT_NE(json.find(R"("partial":true)"), std::string::npos);
}

TEST(JsonTest, CellTypes) {
    Row row;
    row.name = "m";
    row.columns = {"a", "b", "c", "d", "e", "f", "g"};
    row.values.push_back({Value(), Value(2.5), Value(int64_t(-7)), Value(true), Value(std::string("x\"y")),
                          Value(std::numeric_limits<double>::quiet_NaN()),
                          Value(std::numeric_limits<double>::infinity())});
    Result result;
    result.series.push_back(row);
    EXPECT_EQ(MarshalResult(result),
              R"({"series":[{"name":"m","columns":["a","b","c","d","e","f","g"],)"
              R"("values":[[null,2.5,-7,true,"x\"y",null,null]]}]})");
}

} // namespace
} // namespace query
} // namespace fluxdb
