/**
 * @file handlers.cpp
 * @brief JSON-RPC handler implementations
 */

#include "remindd/rpc/handlers.h"
#include "remindd/rpc/schema.h"
#include "remindd/logger.h"

namespace remindd {

namespace {

// Returns the session to UNINITIALIZED unless initialization finished,
// including when the provider throws
class InitializeGuard {
public:
    explicit InitializeGuard(Session& session) : session_(session) {}
    ~InitializeGuard() {
        if (!finished_) {
            session_.finish_initialize(false);
        }
    }

    void finish(bool ready) {
        session_.finish_initialize(ready);
        finished_ = true;
    }

private:
    Session& session_;
    bool finished_ = false;
};

} // namespace

void Handlers::register_all(
    Dispatcher& dispatcher,
    Session& session,
    AuthorizationGate& gate,
    const ToolRegistry& tools,
    HealthSource health) {

    dispatcher.register_handler(Methods::INITIALIZE, [&session, &gate, &tools](const Request& req) {
        return handle_initialize(req, session, gate, tools);
    });

    dispatcher.register_handler(Methods::INITIALIZED, [](const Request& req) {
        return handle_initialized(req);
    });

    dispatcher.register_handler(Methods::PING, [](const Request& req) {
        return handle_ping(req);
    });

    dispatcher.register_handler(Methods::TOOLS_LIST, [&session, &tools](const Request& req) {
        return handle_tools_list(req, session, tools);
    });

    dispatcher.register_handler(Methods::TOOLS_CALL, [&session, &tools](const Request& req) {
        return handle_tools_call(req, session, tools);
    });

    dispatcher.register_handler(Methods::HEALTH, [&session, health](const Request& req) {
        return handle_health(req, session, health);
    });

    LOG_INFO("Handlers", "Registered 6 JSON-RPC handlers");
}

int Handlers::error_code_for(ProviderError error) {
    switch (error) {
        case ProviderError::ACCESS_DENIED: return ErrorCodes::ACCESS_DENIED;
        case ProviderError::NOT_FOUND: return ErrorCodes::NOT_FOUND;
        case ProviderError::UNAVAILABLE: return ErrorCodes::PROVIDER_UNAVAILABLE;
        case ProviderError::INVALID:
        default:
            return ErrorCodes::INTERNAL_ERROR;
    }
}

const char* Handlers::error_message_for(ProviderError error) {
    switch (error) {
        case ProviderError::ACCESS_DENIED: return "Access to reminders denied";
        case ProviderError::NOT_FOUND: return "Not found";
        case ProviderError::UNAVAILABLE: return "Reminder store unavailable";
        case ProviderError::INVALID:
        default:
            return "Internal error";
    }
}

json Handlers::initialize_result(const Session& session, const ToolRegistry& tools) {
    return {
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities", {
            {"tools", {{"listChanged", false}}}
        }},
        {"serverInfo", {
            {"name", NAME},
            {"version", VERSION}
        }},
        {"tools", tools.descriptors_json()},
        {"authorization", to_string(session.authorization())}
    };
}

Response Handlers::handle_initialize(const Request& req, Session& session,
                                     AuthorizationGate& gate, const ToolRegistry& tools) {
    if (req.params.contains("clientInfo") && req.params["clientInfo"].is_object()) {
        LOG_INFO("Handlers", "Initialize from client " +
                 req.params["clientInfo"].value("name", std::string("unknown")));
    }

    switch (session.begin_initialize()) {
        case Session::BeginResult::IN_PROGRESS:
            return Response::failure(req.id, ErrorCodes::NOT_READY, "Initialization already in progress");

        case Session::BeginResult::ALREADY_READY: {
            // Idempotent; a denied session asks the provider again
            if (session.authorization() == AuthorizationStatus::DENIED) {
                auto auth = gate.resolve();
                if (!auth) {
                    return Response::failure(req.id, error_code_for(auth.error()),
                                             error_message_for(auth.error()));
                }
            }
            return Response::success(req.id, initialize_result(session, tools));
        }

        case Session::BeginResult::STARTED:
        default:
            break;
    }

    InitializeGuard guard(session);

    // Blocks until the provider answers; tool calls meanwhile see NOT_READY
    auto auth = gate.resolve();
    if (!auth) {
        guard.finish(false);
        return Response::failure(req.id, error_code_for(auth.error()), error_message_for(auth.error()));
    }

    guard.finish(true);
    LOG_INFO("Handlers", std::string("Session ready, authorization ") + to_string(auth.value()));
    return Response::success(req.id, initialize_result(session, tools));
}

Response Handlers::handle_initialized(const Request& req) {
    LOG_DEBUG("Handlers", "Client confirmed initialization");
    return Response::success(req.id, json::object());
}

Response Handlers::handle_ping(const Request& req) {
    return Response::success(req.id, json::object());
}

Response Handlers::handle_tools_list(const Request& req, const Session& session, const ToolRegistry& tools) {
    if (session.phase() != SessionPhase::READY) {
        return Response::failure(req.id, ErrorCodes::NOT_READY, "Session not initialized");
    }
    return Response::success(req.id, {{"tools", tools.descriptors_json()}});
}

Response Handlers::handle_tools_call(const Request& req, const Session& session, const ToolRegistry& tools) {
    SessionSnapshot snap = session.snapshot();
    if (snap.phase != SessionPhase::READY) {
        return Response::failure(req.id, ErrorCodes::NOT_READY, "Session not initialized");
    }
    if (snap.authorization == AuthorizationStatus::DENIED) {
        return Response::failure(req.id, ErrorCodes::ACCESS_DENIED, "Access to reminders denied");
    }
    if (snap.authorization != AuthorizationStatus::GRANTED) {
        return Response::failure(req.id, ErrorCodes::NOT_READY, "Authorization pending");
    }

    auto name_it = req.params.find("name");
    if (name_it == req.params.end() || !name_it->is_string()) {
        return Response::failure(req.id, ErrorCodes::INVALID_PARAMS, "Invalid params: 'name' must be a string");
    }
    std::string name = name_it->get<std::string>();

    json arguments = json::object();
    auto args_it = req.params.find("arguments");
    if (args_it != req.params.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            return Response::failure(req.id, ErrorCodes::INVALID_PARAMS,
                                     "Invalid params: 'arguments' must be an object");
        }
        arguments = *args_it;
    }

    const Tool* tool = tools.find(name);
    if (!tool) {
        return Response::failure(req.id, ErrorCodes::INVALID_PARAMS, "Unknown tool: " + name);
    }

    std::string violation = SchemaValidator::validate(tool->descriptor.input_schema, arguments);
    if (!violation.empty()) {
        LOG_DEBUG("Handlers", "Rejected " + name + " arguments: " + violation);
        return Response::failure(req.id, ErrorCodes::INVALID_PARAMS, "Invalid params: " + violation,
                                 json{{"tool", name}, {"detail", violation}});
    }

    auto result = tool->handler(arguments);
    if (!result) {
        if (result.error() == ProviderError::INVALID) {
            LOG_ERROR("Handlers", "Provider rejected validated input for " + name + ": " + result.message());
        } else {
            LOG_WARN("Handlers", "Tool " + name + " failed (" + to_string(result.error()) + "): " + result.message());
        }
        std::string message = result.error() == ProviderError::NOT_FOUND
            ? tool->descriptor.not_found_message
            : error_message_for(result.error());
        return Response::failure(req.id, error_code_for(result.error()), message);
    }

    return Response::success(req.id, {
        {"content", json::array({
            {{"type", "text"}, {"text", result.value().dump()}}
        })},
        {"structuredContent", result.value()},
        {"isError", false}
    });
}

Response Handlers::handle_health(const Request& req, const Session& session, const HealthSource& health) {
    if (health) {
        return Response::success(req.id, health());
    }
    return Response::success(req.id, session.snapshot().to_json());
}

} // namespace remindd
