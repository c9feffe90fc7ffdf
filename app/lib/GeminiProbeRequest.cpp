#include "GeminiProbeRequest.hpp"
#include "AppException.hpp"
#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

namespace {
constexpr const char* kModelPlaceholder = "{model}";
constexpr const char* kProbePrompt = "hi";
}


GeminiProbeRequest::GeminiProbeRequest(std::string endpoint_template,
                                       std::string model,
                                       long timeout_seconds)
    : endpoint_(build_endpoint(endpoint_template, model)),
      payload_(make_payload()),
      timeout_seconds_(timeout_seconds)
{
    if (model.empty()) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_INVALID, "Model name is empty");
    }
    if (endpoint_.rfind("https://", 0) != 0 && endpoint_.rfind("http://", 0) != 0) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_INVALID, "Endpoint is not an HTTP(S) URL: " + endpoint_);
    }
    if (timeout_seconds_ < 1) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_INVALID,
                        "Timeout must be at least 1 second, got " + std::to_string(timeout_seconds_));
    }
}


std::string GeminiProbeRequest::build_endpoint(const std::string& endpoint_template,
                                               const std::string& model)
{
    std::string endpoint = endpoint_template;
    const std::string placeholder = kModelPlaceholder;
    std::size_t pos = 0;
    while ((pos = endpoint.find(placeholder, pos)) != std::string::npos) {
        endpoint.replace(pos, placeholder.size(), model);
        pos += model.size();
    }
    return endpoint;
}


std::string GeminiProbeRequest::make_payload()
{
    Json::Value part;
    part["text"] = kProbePrompt;

    Json::Value content;
    content["parts"] = Json::Value(Json::arrayValue);
    content["parts"].append(part);

    Json::Value root;
    root["contents"] = Json::Value(Json::arrayValue);
    root["contents"].append(content);

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, root);
}


HttpRequest GeminiProbeRequest::build_for_key(const std::string& api_key) const
{
    HttpRequest request;
    request.url = endpoint_;
    request.headers = {
        "x-goog-api-key: " + api_key,
        "Content-Type: application/json"
    };
    request.body = payload_;
    request.timeout_seconds = timeout_seconds_;
    return request;
}
