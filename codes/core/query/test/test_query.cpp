// =============================================================================
//  Traffic Probe - Query Module
//  文件: test_query.cpp
//  描述: 查询单元测试
//  版权: Copyright (c) 2026
// =============================================================================

#include <gtest/gtest.h>
#include <vector>
#include "query/query_engine.hpp"
#include "test/test_helpers.hpp"

namespace traffic_probe {
namespace query {

using record::BodyEncoding;
using record::Record;
using utils::ErrorCode;

class QueryTest : public ::testing::Test {
protected:
    void SetUp() override {
        add(test::make_record("GET", "https://api.example.com/users", 200, 10));
        add(test::make_record("POST", "https://api.example.com/users", 201, 30));
        add(test::make_record("GET", "http://example.com/missing", 404, 5));
        add(test::make_partial("GET", "https://cdn.other.org/app.js", "connection reset"));
        add(test::make_record("DELETE", "https://notexample.com/item", 500, 50));

        records_[1].request_body = test::text_body("{\"name\":\"Alice\"}");
        records_[2].response_headers["X-Trace"] = "needle-123";
        records_[4].response_body.data = "bmVlZGxl";   // base64("needle")
        records_[4].response_body.encoding = BodyEncoding::BASE64;
        records_[4].response_body.size = 6;
    }

    void add(Record rec) {
        rec.id = records_.size() + 1;
        records_.push_back(rec);
    }

    static std::vector<uint64_t> ids(const std::vector<Record>& records) {
        std::vector<uint64_t> result;
        for (const Record& rec : records) {
            result.push_back(rec.id);
        }
        return result;
    }

    std::vector<Record> records_;
};

// =============================================================================
// 状态码条件解析
// =============================================================================

TEST(StatusFilterTest, Forms) {
    auto exact = parse_status_filter("404");
    ASSERT_TRUE(exact.is_ok());
    EXPECT_EQ(exact.value().low, 404);
    EXPECT_EQ(exact.value().high, 404);

    auto cls = parse_status_filter("4XX");
    ASSERT_TRUE(cls.is_ok());
    EXPECT_EQ(cls.value().low, 400);
    EXPECT_EQ(cls.value().high, 499);

    auto range = parse_status_filter(" 200 - 299 ");
    ASSERT_TRUE(range.is_ok());
    EXPECT_EQ(range.value().low, 200);
    EXPECT_EQ(range.value().high, 299);
}

TEST(StatusFilterTest, Invalid) {
    for (const char* text : {"", "abc", "4x", "0xx", "1000", "500-400", "-1", "2xx-3xx"}) {
        auto ret = parse_status_filter(text);
        EXPECT_TRUE(ret.is_err()) << text;
        EXPECT_EQ(ret.error_code(), ErrorCode::INVALID_ARGUMENT) << text;
    }
}

// =============================================================================
// list
// =============================================================================

TEST_F(QueryTest, NoFilterReturnsEverything) {
    ListResult result = list(records_, RecordFilter(), Page());
    EXPECT_EQ(result.total, 5u);
    EXPECT_EQ(ids(result.records), (std::vector<uint64_t>{1, 2, 3, 4, 5}));
}

TEST_F(QueryTest, Pagination) {
    Page page;
    page.offset = 1;
    page.has_limit = true;
    page.limit = 2;
    ListResult result = list(records_, RecordFilter(), page);
    EXPECT_EQ(result.total, 5u);
    EXPECT_EQ(ids(result.records), (std::vector<uint64_t>{2, 3}));

    page.offset = 10;
    EXPECT_TRUE(list(records_, RecordFilter(), page).records.empty());

    page.offset = 0;
    page.limit = 0;
    EXPECT_TRUE(list(records_, RecordFilter(), page).records.empty());
}

TEST_F(QueryTest, HostExactOrSuffix) {
    RecordFilter filter;
    filter.has_host = true;
    filter.host = "EXAMPLE.com";
    // notexample.com 不是子域名
    EXPECT_EQ(ids(list(records_, filter, Page()).records), (std::vector<uint64_t>{1, 2, 3}));

    filter.host = "api.example.com";
    EXPECT_EQ(ids(list(records_, filter, Page()).records), (std::vector<uint64_t>{1, 2}));
}

TEST_F(QueryTest, MethodCaseInsensitive) {
    RecordFilter filter;
    filter.has_method = true;
    filter.method = "get";
    EXPECT_EQ(ids(list(records_, filter, Page()).records), (std::vector<uint64_t>{1, 3, 4}));
}

TEST_F(QueryTest, StatusNeverMatchesPartial) {
    RecordFilter filter;
    filter.has_status = true;
    filter.status = StatusRange(0, 999);
    EXPECT_EQ(ids(list(records_, filter, Page()).records), (std::vector<uint64_t>{1, 2, 3, 5}));

    filter.status = parse_status_filter("4xx").value();
    EXPECT_EQ(ids(list(records_, filter, Page()).records), (std::vector<uint64_t>{3}));
}

TEST_F(QueryTest, CombinedFilters) {
    RecordFilter filter;
    filter.has_host = true;
    filter.host = "example.com";
    filter.has_method = true;
    filter.method = "GET";
    filter.has_url_contains = true;
    filter.url_contains = "USERS";
    ListResult result = list(records_, filter, Page());
    EXPECT_EQ(result.total, 1u);
    EXPECT_EQ(ids(result.records), (std::vector<uint64_t>{1}));
}

TEST_F(QueryTest, FilterRecordsMatchesList) {
    RecordFilter filter;
    filter.has_method = true;
    filter.method = "GET";
    EXPECT_EQ(ids(filter_records(records_, filter)), ids(list(records_, filter, Page()).records));
}

// =============================================================================
// get_one / search
// =============================================================================

TEST_F(QueryTest, GetOne) {
    auto rec = get_one(records_, 3);
    ASSERT_TRUE(rec.is_ok());
    EXPECT_EQ(rec.value().status, 404);

    auto missing = get_one(records_, 99);
    EXPECT_EQ(missing.error_code(), ErrorCode::RECORD_NOT_FOUND);
}

TEST_F(QueryTest, SearchLocations) {
    auto hits = search(records_, "alice");
    ASSERT_TRUE(hits.is_ok());
    ASSERT_EQ(hits.value().size(), 1u);
    EXPECT_EQ(hits.value()[0].record.id, 2u);
    EXPECT_EQ(hits.value()[0].found_in, (std::vector<std::string>{"request_body"}));

    auto header_hits = search(records_, "NEEDLE");
    ASSERT_TRUE(header_hits.is_ok());
    // 记录5的base64消息体不参与匹配
    ASSERT_EQ(header_hits.value().size(), 1u);
    EXPECT_EQ(header_hits.value()[0].record.id, 3u);
    EXPECT_EQ(header_hits.value()[0].found_in, (std::vector<std::string>{"response_headers"}));

    auto url_hits = search(records_, "users");
    ASSERT_TRUE(url_hits.is_ok());
    ASSERT_EQ(url_hits.value().size(), 2u);
    EXPECT_EQ(url_hits.value()[0].found_in[0], "url");

    auto agent_hits = search(records_, "probe-test");
    ASSERT_TRUE(agent_hits.is_ok());
    EXPECT_EQ(agent_hits.value().size(), 5u);
}

TEST_F(QueryTest, SearchRejectsEmptyText) {
    auto hits = search(records_, "");
    EXPECT_EQ(hits.error_code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_TRUE(search(std::vector<Record>(), "x").value().empty());
}

// =============================================================================
// stats
// =============================================================================

TEST_F(QueryTest, Stats) {
    TrafficStats s = stats(records_);
    EXPECT_EQ(s.total, 5u);
    EXPECT_EQ(s.partial, 1u);
    EXPECT_EQ(s.by_host["api.example.com"], 2u);
    EXPECT_EQ(s.by_host["cdn.other.org"], 1u);
    EXPECT_EQ(s.by_method["GET"], 3u);
    EXPECT_EQ(s.by_method["DELETE"], 1u);
    EXPECT_EQ(s.by_status_class["2xx"], 2u);
    EXPECT_EQ(s.by_status_class["4xx"], 1u);
    EXPECT_EQ(s.by_status_class["5xx"], 1u);
    EXPECT_EQ(s.by_status_class["none"], 1u);

    EXPECT_EQ(s.with_duration, 4u);
    EXPECT_EQ(s.min_duration_ms, 5u);
    EXPECT_EQ(s.max_duration_ms, 50u);
    EXPECT_DOUBLE_EQ(s.avg_duration_ms, (10.0 + 30.0 + 5.0 + 50.0) / 4.0);

    EXPECT_EQ(s.request_bytes, 16u);
    EXPECT_EQ(s.response_bytes, 6u);
}

TEST_F(QueryTest, StatsOfEmptySet) {
    TrafficStats s = stats(std::vector<Record>());
    EXPECT_EQ(s.total, 0u);
    EXPECT_EQ(s.with_duration, 0u);
    EXPECT_DOUBLE_EQ(s.avg_duration_ms, 0.0);
}

TEST(StatusClassTest, Classes) {
    Record rec = test::make_record("GET", "http://x/", 302);
    EXPECT_EQ(status_class(rec), "3xx");
    rec.status = 101;
    EXPECT_EQ(status_class(rec), "other");
    rec.status = 999;
    EXPECT_EQ(status_class(rec), "other");
    rec.has_status = false;
    EXPECT_EQ(status_class(rec), "none");
}

} // namespace query
} // namespace traffic_probe
