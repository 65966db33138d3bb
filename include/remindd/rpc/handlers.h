/**
 * @file handlers.h
 * @brief JSON-RPC method handlers
 */

#pragma once

#include <functional>
#include "remindd/rpc/dispatcher.h"
#include "remindd/rpc/protocol.h"
#include "remindd/rpc/tools.h"
#include "remindd/core/session.h"

namespace remindd {

/**
 * @brief JSON-RPC request handlers
 */
class Handlers {
public:
    using HealthSource = std::function<json()>;

    /**
     * @brief Register all handlers with the dispatcher
     *
     * Session, gate and registry must outlive the dispatcher.
     */
    static void register_all(
        Dispatcher& dispatcher,
        Session& session,
        AuthorizationGate& gate,
        const ToolRegistry& tools,
        HealthSource health = nullptr
    );

    /**
     * @brief Wire code for a provider failure
     */
    static int error_code_for(ProviderError error);

    /**
     * @brief Client-facing message for a provider failure
     */
    static const char* error_message_for(ProviderError error);

private:
    static Response handle_initialize(const Request& req, Session& session,
                                      AuthorizationGate& gate, const ToolRegistry& tools);
    static Response handle_initialized(const Request& req);
    static Response handle_ping(const Request& req);
    static Response handle_tools_list(const Request& req, const Session& session, const ToolRegistry& tools);
    static Response handle_tools_call(const Request& req, const Session& session, const ToolRegistry& tools);
    static Response handle_health(const Request& req, const Session& session, const HealthSource& health);

    static json initialize_result(const Session& session, const ToolRegistry& tools);
};

} // namespace remindd
