#pragma once

#include <string>

#include "config/config_schema.hpp"
#include "gateway/app_context.hpp"
#include "nlohmann/json.hpp"
#include "session/session_types.hpp"

namespace httplib {
class Server;
}

namespace codebox::gateway {

struct Reply {
    int status = 200;
    nlohmann::json body = nlohmann::json::object();
};

// "execution_options" of a request body layered over the configured defaults.
// Throws ValidationRejected on wrongly typed fields.
session::ResourceOptions ParseExecutionOptions(const nlohmann::json& options,
                                               const config::ExecutionDefaults& defaults);
nlohmann::json ResultToJson(const session::Result& result);
nlohmann::json SessionToJson(const session::SessionInfo& info);

Reply HandleCreateSession(AppContext& context, const std::string& body);
Reply HandleListSessions(AppContext& context);
Reply HandleGetSession(AppContext& context, const std::string& session_id);
Reply HandleDeleteSession(AppContext& context, const std::string& session_id);
Reply HandleExecute(AppContext& context, const std::string& body);
Reply HandleStatus(AppContext& context, const std::string& request_id);
Reply HandleResults(AppContext& context, const std::string& request_id);
Reply HandleListRules(AppContext& context);

void RegisterRoutes(httplib::Server& server, AppContext& context);

}  // namespace codebox::gateway
