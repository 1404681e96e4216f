#include "mediagate/event_json.hpp"

#include <memory>

#include <json/writer.h>

namespace mediagate {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

Json::Value optionalValue(const std::optional<double>& value) {
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

Json::Value optionalValue(const std::optional<std::int64_t>& value) {
    return value ? Json::Value(static_cast<Json::Int64>(*value)) : Json::Value(Json::nullValue);
}

} // namespace

Json::Value toJson(const ProgressEvent& event) {
    Json::Value json(Json::objectValue);
    json["status"] = statusName(event);

    std::visit(Overloaded{
                   [&](const DownloadingEvent& e) {
                       json["percent"] = e.percent;
                       json["downloaded"] = static_cast<Json::UInt64>(e.downloaded);
                       json["total"] = static_cast<Json::UInt64>(e.total);
                       json["speed"] = optionalValue(e.speed);
                       json["eta"] = optionalValue(e.eta);
                   },
                   [&](const ProcessingEvent& e) { json["message"] = e.message; },
                   [](const WaitingEvent&) {},
                   [&](const CompleteEvent& e) {
                       json["download_id"] = e.id;
                       json["filename"] = e.filename;
                       json["file_size"] = static_cast<Json::UInt64>(e.size);
                   },
                   [&](const ErrorEvent& e) {
                       json["kind"] = errorKindName(e.kind);
                       json["message"] = e.message;
                       json["retryable"] = e.retryable;
                   },
               },
               event);
    return json;
}

std::string toJsonString(const ProgressEvent& event) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, toJson(event));
}

std::string toSseFrame(const ProgressEvent& event) {
    return "data: " + toJsonString(event) + "\n\n";
}

} // namespace mediagate
