/**
 * @file protocol.h
 * @brief JSON-RPC 2.0 envelopes and codec
 */

#pragma once

#include <string>
#include <optional>
#include <variant>
#include <cstdint>
#include "remindd/common.h"

namespace remindd {

/**
 * @brief Wire error codes
 */
namespace ErrorCodes {
    // JSON-RPC standard errors
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;

    // Application errors
    constexpr int ACCESS_DENIED = -32001;
    constexpr int NOT_FOUND = -32002;
    constexpr int NOT_READY = -32003;
    constexpr int PROVIDER_UNAVAILABLE = -32004;
}

/**
 * @brief Reserved method names
 */
namespace Methods {
    constexpr const char* INITIALIZE = "initialize";
    constexpr const char* INITIALIZED = "notifications/initialized";
    constexpr const char* PING = "ping";
    constexpr const char* TOOLS_LIST = "tools/list";
    constexpr const char* TOOLS_CALL = "tools/call";
    constexpr const char* HEALTH = "daemon/health";
}

/**
 * @brief Caller-chosen request id, integer or string
 */
class RequestId {
public:
    RequestId(int64_t value) : value_(value) {}
    RequestId(std::string value) : value_(std::move(value)) {}
    RequestId(const char* value) : value_(std::string(value)) {}

    bool is_string() const { return std::holds_alternative<std::string>(value_); }
    bool is_integer() const { return std::holds_alternative<int64_t>(value_); }

    json to_json() const;

    /**
     * @brief Accept only strings and integers
     */
    static std::optional<RequestId> from_json(const json& j);

    std::string to_string() const;

    bool operator==(const RequestId& other) const { return value_ == other.value_; }
    bool operator!=(const RequestId& other) const { return !(*this == other); }
    bool operator<(const RequestId& other) const { return value_ < other.value_; }

private:
    std::variant<int64_t, std::string> value_;
};

/**
 * @brief Inbound call; a request without id is a notification
 */
struct Request {
    std::optional<RequestId> id;
    std::string method;
    json params = json::object();

    bool is_notification() const { return !id.has_value(); }

    std::string to_json() const;

    bool operator==(const Request& other) const {
        return id == other.id && method == other.method && params == other.params;
    }
};

struct ErrorObject {
    int code = ErrorCodes::INTERNAL_ERROR;
    std::string message;
    std::optional<json> data;

    json to_json() const;
};

/**
 * @brief Outbound reply carrying either a result or an error
 *
 * Only the success()/failure() factories construct a Response, so exactly
 * one of result and error is always populated.
 */
class Response {
public:
    static Response success(std::optional<RequestId> id, json result);
    static Response failure(std::optional<RequestId> id, ErrorObject error);
    static Response failure(std::optional<RequestId> id, int code, const std::string& message,
                            std::optional<json> data = std::nullopt);

    const std::optional<RequestId>& id() const { return id_; }
    bool is_success() const { return result_.has_value(); }
    bool is_error() const { return error_.has_value(); }
    const json& result() const { return *result_; }
    const ErrorObject& error() const { return *error_; }

    json to_json() const;
    std::string serialize() const;

private:
    Response() = default;

    std::optional<RequestId> id_;  // nullopt serializes as null
    std::optional<json> result_;
    std::optional<ErrorObject> error_;
};

/**
 * @brief Frame decoding outcome: a request, the error reply it deserves,
 * or neither when a broken notification is dropped
 */
struct DecodeResult {
    std::optional<Request> request;
    std::optional<Response> error;

    bool ok() const { return request.has_value(); }
};

class Codec {
public:
    /**
     * @brief Decode one frame
     *
     * Invalid JSON yields Parse Error with a null id. Envelope problems yield
     * Invalid Request keyed to the id when one could be read.
     */
    static DecodeResult decode(const std::string& frame);

    static std::string encode(const Request& request);
    static std::string encode(const Response& response);
};

} // namespace remindd
