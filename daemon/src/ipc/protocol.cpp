/**
 * @file protocol.cpp
 * @brief JSON-RPC request parsing and response serialization
 */

#include "dailyd/ipc/protocol.h"
#include "dailyd/logger.h"

namespace dailyd {

std::optional<Request> Request::parse(const std::string& raw) {
    json j = json::parse(raw, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_DEBUG("Protocol", "Request is not a JSON object");
        return std::nullopt;
    }

    auto method = j.find("method");
    if (method == j.end() || !method->is_string() || method->get<std::string>().empty()) {
        LOG_DEBUG("Protocol", "Request has no method");
        return std::nullopt;
    }

    Request request;
    request.method = method->get<std::string>();

    auto params = j.find("params");
    if (params == j.end() || params->is_null()) {
        request.params = json::object();
    } else if (params->is_object()) {
        request.params = *params;
    } else {
        LOG_DEBUG("Protocol", "Request params must be an object");
        return std::nullopt;
    }

    auto id = j.find("id");
    if (id != j.end()) {
        if (id->is_string()) {
            request.id = id->get<std::string>();
        } else if (id->is_number_integer()) {
            request.id = std::to_string(id->get<int64_t>());
        }
    }
    return request;
}

std::string Request::to_json() const {
    json j = {
        {"method", method},
        {"params", params}
    };
    if (id) {
        j["id"] = *id;
    }
    return j.dump();
}

std::string Response::to_json() const {
    json j = {{"success", success}};
    if (success) {
        j["result"] = result;
    } else {
        j["error"] = {
            {"code", error_code},
            {"message", error}
        };
        if (!details.is_null()) {
            j["error"]["details"] = details;
        }
    }
    return j.dump();
}

Response Response::ok(json result) {
    Response r;
    r.success = true;
    r.result = std::move(result);
    return r;
}

Response Response::err(const std::string& message, int code, json details) {
    Response r;
    r.success = false;
    r.error = message;
    r.error_code = code;
    r.details = std::move(details);
    return r;
}

} // namespace dailyd
