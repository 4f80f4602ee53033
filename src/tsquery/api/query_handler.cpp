#include "tsquery/api/query_handler.h"
#include "tsquery/common/logger.h"
#include "tsquery/core/error.h"
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <chrono>
#include <cmath>

namespace tsquery {
namespace api {

namespace {

const char kResultEncodingFailure[] = "{\"success\":false, \"message\":\"failed to encode result message\"}";
const char kErrorEncodingFailure[] = "{\"success\":false, \"message\":\"failed to encode error message\"}";

// SAX writer that throws EncodingError on the first rejected token
// (invalid UTF-8 in keys or strings, unbalanced structure).
class JsonWriter {
public:
    JsonWriter() : writer_(buffer_) {}

    void StartObject() { Check(writer_.StartObject()); }
    void EndObject() { Check(writer_.EndObject()); }
    void StartArray() { Check(writer_.StartArray()); }
    void EndArray() { Check(writer_.EndArray()); }
    void Key(const std::string& key) {
        Check(writer_.Key(key.c_str(), static_cast<rapidjson::SizeType>(key.size())));
    }
    void String(const std::string& value) {
        Check(writer_.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size())));
    }
    void Bool(bool value) { Check(writer_.Bool(value)); }
    void Int64(int64_t value) { Check(writer_.Int64(value)); }
    // Missing samples are NaN; JSON has no NaN, so they become null.
    void Double(double value) {
        if (std::isnan(value) || std::isinf(value)) {
            Check(writer_.Null());
            return;
        }
        Check(writer_.Double(value));
    }

    std::string Finish() {
        if (!writer_.IsComplete()) {
            throw core::EncodingError("incomplete JSON document");
        }
        return std::string(buffer_.GetString(), buffer_.GetSize());
    }

private:
    void Check(bool ok) {
        if (!ok) {
            throw core::EncodingError("value cannot be encoded as JSON");
        }
    }

    rapidjson::StringBuffer buffer_;
    rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
                      rapidjson::CrtAllocator, rapidjson::kWriteValidateEncodingFlag> writer_;
};

void WriteTagSet(JsonWriter& json, const core::TagSet& tagset) {
    json.StartObject();
    for (const auto& [key, value] : tagset) {
        json.Key(key);
        json.String(value);
    }
    json.EndObject();
}

void WriteStrings(JsonWriter& json, const std::vector<std::string>& values) {
    json.StartArray();
    for (const auto& value : values) {
        json.String(value);
    }
    json.EndArray();
}

void WriteTagValues(JsonWriter& json, const command::TagValues& tag_values) {
    json.StartObject();
    for (const auto& [key, values] : tag_values) {
        json.Key(key);
        WriteStrings(json, values);
    }
    json.EndObject();
}

void WriteTimerange(JsonWriter& json, const core::Timerange& timerange) {
    json.StartObject();
    json.Key("start");
    json.Int64(timerange.Start());
    json.Key("end");
    json.Int64(timerange.End());
    json.Key("resolution");
    json.Int64(timerange.Resolution());
    json.EndObject();
}

void WriteQueryResult(JsonWriter& json, const command::QueryResult& result) {
    json.StartObject();
    json.Key("query");
    json.String(result.query);
    json.Key("name");
    json.String(result.name);
    json.Key("type");
    json.String(result.type);
    if (result.type == "series") {
        json.Key("series");
        json.StartArray();
        for (const auto& series : result.series) {
            json.StartObject();
            json.Key("values");
            json.StartArray();
            for (double value : series.values) {
                json.Double(value);
            }
            json.EndArray();
            json.Key("tagset");
            WriteTagSet(json, series.tagset);
            json.EndObject();
        }
        json.EndArray();
        if (result.timerange) {
            json.Key("timerange");
            WriteTimerange(json, *result.timerange);
        }
    } else {
        json.Key("scalars");
        json.StartArray();
        for (const auto& scalar : result.scalars) {
            json.StartObject();
            json.Key("tagset");
            WriteTagSet(json, scalar.tagset);
            json.Key("value");
            json.Double(scalar.value);
            json.EndObject();
        }
        json.EndArray();
    }
    json.EndObject();
}

int64_t EpochMillis(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

void WriteProfiles(JsonWriter& json, const std::vector<query::Profile>& profiles) {
    json.StartArray();
    for (const auto& profile : profiles) {
        json.StartObject();
        json.Key("name");
        json.String(profile.name);
        json.Key("start");
        json.Int64(EpochMillis(profile.start));
        json.Key("finish");
        json.Int64(EpochMillis(profile.finish));
        json.Key("duration_us");
        json.Int64(profile.DurationMicros());
        json.EndObject();
    }
    json.EndArray();
}

void WriteBody(JsonWriter& json, const command::ResultBody& body) {
    if (std::holds_alternative<command::TagValues>(body)) {
        WriteTagValues(json, std::get<command::TagValues>(body));
    } else if (std::holds_alternative<std::vector<core::MetricKey>>(body)) {
        WriteStrings(json, std::get<std::vector<core::MetricKey>>(body));
    } else if (std::holds_alternative<std::vector<command::QueryResult>>(body)) {
        json.StartArray();
        for (const auto& result : std::get<std::vector<command::QueryResult>>(body)) {
            WriteQueryResult(json, result);
        }
        json.EndArray();
    } else {
        json.StartObject();
        json.EndObject();
    }
}

void WriteMetadataValue(JsonWriter& json, const command::MetadataValue& value) {
    if (std::holds_alternative<int64_t>(value)) {
        json.Int64(std::get<int64_t>(value));
    } else if (std::holds_alternative<command::TagValues>(value)) {
        WriteTagValues(json, std::get<command::TagValues>(value));
    } else if (std::holds_alternative<std::vector<std::string>>(value)) {
        WriteStrings(json, std::get<std::vector<std::string>>(value));
    } else {
        WriteProfiles(json, std::get<std::vector<query::Profile>>(value));
    }
}

} // namespace

QueryHandler::QueryHandler(command::ExecutionContext context, CommandParser parser)
    : context_(std::move(context)), parser_(std::move(parser)) {}

HttpResponse QueryHandler::Handle(const std::string& query) const {
    TSQUERY_INFO("query: {}", query);

    command::CommandPtr cmd;
    try {
        cmd = parser_(query);
    } catch (const std::exception& e) {
        TSQUERY_WARN("failed to parse query '{}': {}", query, e.what());
        return ErrorResponse(400, e.what());
    }
    if (!cmd) {
        return ErrorResponse(400, "query did not produce a command");
    }

    command::Result result;
    try {
        result = cmd->Execute(context_);
    } catch (const std::exception& e) {
        TSQUERY_ERROR("{} failed: {}", cmd->Name(), e.what());
        return ErrorResponse(500, e.what());
    }

    try {
        return HttpResponse{200, EncodeResult(result, cmd->Name())};
    } catch (const core::EncodingError& e) {
        TSQUERY_ERROR("failed to encode {} result: {}", cmd->Name(), e.what());
        return HttpResponse{500, kResultEncodingFailure};
    }
}

HttpResponse QueryHandler::ErrorResponse(int status, const std::string& message) const {
    try {
        return HttpResponse{status, EncodeError(message)};
    } catch (const core::EncodingError& e) {
        TSQUERY_ERROR("failed to encode error message: {}", e.what());
        return HttpResponse{500, kErrorEncodingFailure};
    }
}

std::string QueryHandler::EncodeResult(const command::Result& result, const std::string& name) {
    JsonWriter json;
    json.StartObject();
    json.Key("success");
    json.Bool(true);
    json.Key("name");
    json.String(name);
    json.Key("body");
    WriteBody(json, result.body);
    if (!result.metadata.empty()) {
        json.Key("metadata");
        json.StartObject();
        for (const auto& [key, value] : result.metadata) {
            json.Key(key);
            WriteMetadataValue(json, value);
        }
        json.EndObject();
    }
    json.EndObject();
    return json.Finish();
}

std::string QueryHandler::EncodeError(const std::string& message) {
    JsonWriter json;
    json.StartObject();
    json.Key("success");
    json.Bool(false);
    json.Key("message");
    json.String(message);
    json.EndObject();
    return json.Finish();
}

} // namespace api
} // namespace tsquery
