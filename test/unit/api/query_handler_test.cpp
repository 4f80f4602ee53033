#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include "tsquery/api/query_handler.h"
#include "tsquery/command/describe.h"
#include "tsquery/command/profiling_command.h"
#include "tsquery/command/select.h"
#include "tsquery/core/error.h"
#include "test_util/mock_backends.h"
#include <limits>
#include <stdexcept>

namespace tsquery {
namespace api {
namespace {

using testutil::FakeMetricMetadata;
using testutil::FakeTimeseriesStorage;

class FixedCommand : public command::Command {
public:
    explicit FixedCommand(command::Result result) : result_(std::move(result)) {}

    command::Result Execute(const command::ExecutionContext&) const override { return result_; }
    std::string Name() const override { return "fixed"; }

private:
    command::Result result_;
};

class FailingCommand : public command::Command {
public:
    command::Result Execute(const command::ExecutionContext&) const override {
        throw core::BackendError("storage unavailable");
    }
    std::string Name() const override { return "failing"; }
};

class QueryHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_ = std::make_shared<FakeTimeseriesStorage>(1000);
        metadata_ = std::make_shared<FakeMetricMetadata>();
        metadata_->AddSeries("cpu.user", core::TagSet{{"host", "web1"}});
        metadata_->AddSeries("cpu.idle", core::TagSet{{"host", "web2"}});

        core::QueryConfig config = core::QueryConfig::Default();
        handler_ = std::make_unique<QueryHandler>(
            command::MakeExecutionContext(config, storage_, metadata_),
            [](const std::string& query) -> command::CommandPtr {
                if (query == "describe all") {
                    return std::make_shared<command::DescribeAllCommand>("");
                }
                if (query == "profile describe all") {
                    return std::make_shared<command::ProfilingCommand>(
                        std::make_shared<command::DescribeAllCommand>(""), nullptr);
                }
                if (query == "select cpu.user from 0 to 2000") {
                    return std::make_shared<command::SelectCommand>(
                        nullptr,
                        std::vector<function::ExpressionPtr>{
                            std::make_shared<function::MetricFetchExpression>("cpu.user", nullptr)},
                        command::SelectContext{0, 2000, 1000});
                }
                if (query == "fail") {
                    return std::make_shared<FailingCommand>();
                }
                throw core::ParseError("unexpected token in '" + query + "'");
            });
    }

    static rapidjson::Document Parse(const std::string& body) {
        rapidjson::Document document;
        document.Parse(body.c_str());
        EXPECT_FALSE(document.HasParseError()) << body;
        return document;
    }

    std::shared_ptr<FakeTimeseriesStorage> storage_;
    std::shared_ptr<FakeMetricMetadata> metadata_;
    std::unique_ptr<QueryHandler> handler_;
};

TEST_F(QueryHandlerTest, DescribeAll) {
    HttpResponse response = handler_->Handle("describe all");
    EXPECT_EQ(response.status, 200);

    rapidjson::Document document = Parse(response.body);
    EXPECT_TRUE(document["success"].GetBool());
    EXPECT_STREQ(document["name"].GetString(), "describe all");
    const auto& body = document["body"];
    ASSERT_TRUE(body.IsArray());
    ASSERT_EQ(body.Size(), 2u);
    EXPECT_STREQ(body[0u].GetString(), "cpu.idle");
    EXPECT_STREQ(body[1u].GetString(), "cpu.user");
    EXPECT_EQ(document["metadata"]["count"].GetInt64(), 2);
}

TEST_F(QueryHandlerTest, Select) {
    HttpResponse response = handler_->Handle("select cpu.user from 0 to 2000");
    ASSERT_EQ(response.status, 200) << response.body;

    rapidjson::Document document = Parse(response.body);
    const auto& result = document["body"][0u];
    EXPECT_STREQ(result["type"].GetString(), "series");
    EXPECT_STREQ(result["name"].GetString(), "cpu.user");
    const auto& series = result["series"][0u];
    EXPECT_EQ(series["values"].Size(), 3u);
    EXPECT_DOUBLE_EQ(series["values"][0u].GetDouble(), 1.0);
    EXPECT_STREQ(series["tagset"]["host"].GetString(), "web1");
    EXPECT_EQ(result["timerange"]["resolution"].GetInt64(), 1000);
    EXPECT_EQ(result["timerange"]["end"].GetInt64(), 2000);

    const auto& metadata = document["metadata"];
    EXPECT_EQ(metadata["resolution"].GetInt64(), 1000);
    EXPECT_TRUE(metadata["notes"].IsArray());
    EXPECT_STREQ(metadata["description"]["host"][0u].GetString(), "web1");
}

TEST_F(QueryHandlerTest, ProfileMetadata) {
    HttpResponse response = handler_->Handle("profile describe all");
    ASSERT_EQ(response.status, 200);
    rapidjson::Document document = Parse(response.body);
    const auto& profiles = document["metadata"]["profile"];
    ASSERT_TRUE(profiles.IsArray());
    ASSERT_EQ(profiles.Size(), 1u);
    EXPECT_STREQ(profiles[0u]["name"].GetString(), "describe all.Execute");
    EXPECT_GE(profiles[0u]["duration_us"].GetInt64(), 0);
    EXPECT_GE(profiles[0u]["finish"].GetInt64(), profiles[0u]["start"].GetInt64());
}

TEST_F(QueryHandlerTest, ParseFailureIsBadRequest) {
    HttpResponse response = handler_->Handle("selec cpu");
    EXPECT_EQ(response.status, 400);
    rapidjson::Document document = Parse(response.body);
    EXPECT_FALSE(document["success"].GetBool());
    EXPECT_STREQ(document["message"].GetString(), "unexpected token in 'selec cpu'");
}

TEST(QueryHandlerParseTest, AnyParserExceptionIsBadRequest) {
    QueryHandler handler(command::ExecutionContext{}, [](const std::string& query) -> command::CommandPtr {
        if (query == "range") {
            throw std::out_of_range("duration out of range");
        }
        throw std::runtime_error("lexer failed");
    });

    HttpResponse response = handler.Handle("select cpu from");
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(response.body, "{\"success\":false,\"message\":\"lexer failed\"}");

    EXPECT_EQ(handler.Handle("range").status, 400);
}

TEST_F(QueryHandlerTest, ExecutionFailureIsServerError) {
    HttpResponse response = handler_->Handle("fail");
    EXPECT_EQ(response.status, 500);
    rapidjson::Document document = Parse(response.body);
    EXPECT_FALSE(document["success"].GetBool());
    EXPECT_STREQ(document["message"].GetString(), "storage unavailable");
}

TEST_F(QueryHandlerTest, UnencodableErrorMessage) {
    // the parse error quotes the query, which is not valid UTF-8
    HttpResponse response = handler_->Handle("describe all where \xff");
    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(response.body, "{\"success\":false, \"message\":\"failed to encode error message\"}");
}

TEST(QueryHandlerEncodingTest, UnencodableResult) {
    command::Result result;
    result.body = std::vector<core::MetricKey>{"cpu\xc3"};
    auto handler = QueryHandler(command::ExecutionContext{}, [result](const std::string&) -> command::CommandPtr {
        return std::make_shared<FixedCommand>(result);
    });
    HttpResponse response = handler.Handle("anything");
    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(response.body, "{\"success\":false, \"message\":\"failed to encode result message\"}");
}

TEST(QueryHandlerEncodingTest, MissingValuesBecomeNull) {
    command::QueryResult query_result;
    query_result.query = "cpu";
    query_result.name = "cpu";
    query_result.type = "series";
    query_result.series.push_back(core::Timeseries{{1.5, std::numeric_limits<double>::quiet_NaN()}, core::TagSet()});
    command::Result result;
    result.body = std::vector<command::QueryResult>{query_result};

    std::string encoded = QueryHandler::EncodeResult(result, "select");
    rapidjson::Document document;
    document.Parse(encoded.c_str());
    ASSERT_FALSE(document.HasParseError());
    const auto& values = document["body"][0u]["series"][0u]["values"];
    EXPECT_DOUBLE_EQ(values[0u].GetDouble(), 1.5);
    EXPECT_TRUE(values[1u].IsNull());
    EXPECT_FALSE(document.HasMember("metadata"));
}

TEST(QueryHandlerEncodingTest, ScalarResults) {
    command::QueryResult query_result;
    query_result.query = "3";
    query_result.name = "3";
    query_result.type = "scalars";
    query_result.scalars.push_back(core::TaggedScalar{core::TagSet{{"dc", "east"}}, 3.0});
    command::Result result;
    result.body = std::vector<command::QueryResult>{query_result};

    rapidjson::Document document;
    document.Parse(QueryHandler::EncodeResult(result, "select").c_str());
    const auto& scalar = document["body"][0u]["scalars"][0u];
    EXPECT_DOUBLE_EQ(scalar["value"].GetDouble(), 3.0);
    EXPECT_STREQ(scalar["tagset"]["dc"].GetString(), "east");
    EXPECT_FALSE(document["body"][0u].HasMember("series"));
}

TEST(QueryHandlerEncodingTest, EncodeError) {
    EXPECT_EQ(QueryHandler::EncodeError("bad"), "{\"success\":false,\"message\":\"bad\"}");
    EXPECT_THROW(QueryHandler::EncodeError("bad \xff"), core::EncodingError);
}

} // namespace
} // namespace api
} // namespace tsquery
