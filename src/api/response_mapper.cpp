#include "zatca/api/response_mapper.h"
#include "zatca/api/wire_types.h"

namespace zatca::api {

namespace {

std::string textField(const Json::Value& item, const char* name, const char* fallback) {
    const Json::Value& v = item[name];
    return v.isString() ? v.asString() : fallback;
}

} // namespace

ApiMessage transportFailureMessage(const TransportResult& result) {
    ApiMessage msg;
    msg.type = MessageType::FETCH_ERROR;
    msg.code = result.timedOut ? "TIMEOUT" : "NETWORK";
    msg.category = "NETWORK";
    msg.message = result.error.empty() ? "No response from server" : result.error;
    msg.status = "ERROR";
    return msg;
}

std::vector<ApiMessage> httpErrorMessages(const HttpResponse& response) {
    std::vector<ApiMessage> messages;

    if (auto json = parseJson(response.body)) {
        if (json->isObject() && json->isMember("validationResults")) {
            messages = ValidationResults::fromJson((*json)["validationResults"]).errorMessages;
        }
        // CSID endpoints report {"errors": [...]} outside validationResults
        if (messages.empty() && json->isObject() && (*json)["errors"].isArray()) {
            for (const auto& item : (*json)["errors"]) {
                if (!item.isObject()) continue;
                ApiMessage msg;
                msg.type = MessageType::API;
                msg.code = textField(item, "code", "");
                msg.category = textField(item, "category", "API");
                msg.message = textField(item, "message", "");
                msg.status = "ERROR";
                messages.push_back(std::move(msg));
            }
        }
    }

    if (messages.empty()) {
        ApiMessage msg;
        msg.type = MessageType::HTTP;
        msg.code = "HTTP_" + std::to_string(response.statusCode);
        msg.category = "HTTP";
        msg.message = "Request failed with HTTP status " + std::to_string(response.statusCode);
        msg.status = "ERROR";
        messages.push_back(std::move(msg));
    }
    return messages;
}

ApiMessage invalidResponseMessage(const std::string& detail) {
    ApiMessage msg;
    msg.type = MessageType::API;
    msg.code = "INVALID_RESPONSE";
    msg.category = "API";
    msg.message = detail;
    msg.status = "ERROR";
    return msg;
}

ApiMessage credentialExpiredMessage() {
    ApiMessage msg;
    msg.type = MessageType::VALIDATION;
    msg.code = "CREDENTIAL_EXPIRED";
    msg.category = "AUTHENTICATION";
    msg.message = "CSID credential has expired; request a new one";
    msg.status = "ERROR";
    return msg;
}

} // namespace zatca::api
