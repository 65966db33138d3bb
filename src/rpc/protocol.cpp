/**
 * @file protocol.cpp
 * @brief JSON-RPC codec implementation
 */

#include "remindd/rpc/protocol.h"
#include "remindd/logger.h"
#include <limits>

namespace remindd {

json RequestId::to_json() const {
    if (const auto* s = std::get_if<std::string>(&value_)) {
        return *s;
    }
    return std::get<int64_t>(value_);
}

std::optional<RequestId> RequestId::from_json(const json& j) {
    if (j.is_string()) {
        return RequestId(j.get<std::string>());
    }
    if (j.is_number_integer()) {
        // Ids past INT64_MAX cannot be echoed back unchanged
        if (j.is_number_unsigned() &&
            j.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return RequestId(j.get<int64_t>());
    }
    return std::nullopt;
}

std::string RequestId::to_string() const {
    if (const auto* s = std::get_if<std::string>(&value_)) {
        return "\"" + *s + "\"";
    }
    return std::to_string(std::get<int64_t>(value_));
}

std::string Request::to_json() const {
    json j;
    j["jsonrpc"] = JSONRPC_VERSION;
    if (id) {
        j["id"] = id->to_json();
    }
    j["method"] = method;
    j["params"] = params;
    return j.dump();
}

json ErrorObject::to_json() const {
    json j = {
        {"code", code},
        {"message", message}
    };
    if (data) {
        j["data"] = *data;
    }
    return j;
}

Response Response::success(std::optional<RequestId> id, json result) {
    Response resp;
    resp.id_ = std::move(id);
    resp.result_ = std::move(result);
    return resp;
}

Response Response::failure(std::optional<RequestId> id, ErrorObject error) {
    Response resp;
    resp.id_ = std::move(id);
    resp.error_ = std::move(error);
    return resp;
}

Response Response::failure(std::optional<RequestId> id, int code, const std::string& message,
                           std::optional<json> data) {
    ErrorObject error;
    error.code = code;
    error.message = message;
    error.data = std::move(data);
    return failure(std::move(id), std::move(error));
}

json Response::to_json() const {
    json j;
    j["jsonrpc"] = JSONRPC_VERSION;
    j["id"] = id_ ? id_->to_json() : json(nullptr);
    if (result_) {
        j["result"] = *result_;
    } else {
        j["error"] = error_->to_json();
    }
    return j;
}

std::string Response::serialize() const {
    // Replace invalid UTF-8 instead of throwing mid-write
    return to_json().dump(-1, ' ', false, json::error_handler_t::replace);
}

DecodeResult Codec::decode(const std::string& frame) {
    DecodeResult out;

    json j;
    try {
        j = json::parse(frame);
    } catch (const json::parse_error& e) {
        LOG_WARN("Protocol", "JSON parse error: " + std::string(e.what()));
        out.error = Response::failure(std::nullopt, ErrorCodes::PARSE_ERROR, "Parse error");
        return out;
    }

    if (!j.is_object()) {
        LOG_WARN("Protocol", "Request is not a JSON object");
        out.error = Response::failure(std::nullopt, ErrorCodes::INVALID_REQUEST,
                                      "Invalid Request: expected a JSON object");
        return out;
    }

    // Recover the id first so envelope errors can be correlated
    std::optional<RequestId> id;
    bool has_id = j.contains("id");
    if (has_id) {
        id = RequestId::from_json(j["id"]);
        if (!id) {
            out.error = Response::failure(std::nullopt, ErrorCodes::INVALID_REQUEST,
                                          "Invalid Request: id must be a string or an integer");
            return out;
        }
    }

    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        out.error = Response::failure(id, ErrorCodes::INVALID_REQUEST,
                                      "Invalid Request: jsonrpc must be \"2.0\"");
        return out;
    }

    auto method = j.find("method");
    if (method == j.end() || !method->is_string()) {
        LOG_WARN("Protocol", "Request missing 'method' field");
        out.error = Response::failure(id, ErrorCodes::INVALID_REQUEST,
                                      "Invalid Request: method must be a string");
        return out;
    }

    Request req;
    req.id = id;
    req.method = method->get<std::string>();

    auto params = j.find("params");
    if (params != j.end() && !params->is_null()) {
        if (!params->is_object()) {
            if (!has_id) {
                // Notifications are never answered, not even with an error
                LOG_WARN("Protocol", "Dropping notification '" + req.method + "' with non-object params");
                return out;
            }
            out.error = Response::failure(id, ErrorCodes::INVALID_PARAMS,
                                          "Invalid params: expected an object");
            return out;
        }
        req.params = *params;
    }

    out.request = std::move(req);
    return out;
}

std::string Codec::encode(const Request& request) {
    return request.to_json();
}

std::string Codec::encode(const Response& response) {
    return response.serialize();
}

} // namespace remindd
