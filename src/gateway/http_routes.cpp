#include "gateway/http_routes.hpp"

#include <vector>

#include "httplib.h"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace codebox::gateway {
namespace {

constexpr const char* kStartupFailureMessage = "could not start execution environment";

Reply Detail(int status, const std::string& message) {
    return Reply{status, {{"detail", message}}};
}

nlohmann::json ParseBody(const std::string& body) {
    if (utils::Trim(body).empty()) {
        return nlohmann::json::object();
    }
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw ValidationRejected("Request body must be a JSON object");
    }
    return json;
}

std::vector<std::string> StringList(const nlohmann::json& json, const char* key) {
    std::vector<std::string> items;
    if (!json.contains(key) || json[key].is_null()) {
        return items;
    }
    if (!json[key].is_array()) {
        throw ValidationRejected(std::string("Field '") + key + "' must be a list of strings");
    }
    for (const auto& item : json[key]) {
        if (!item.is_string()) {
            throw ValidationRejected(std::string("Field '") + key + "' must be a list of strings");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

std::string StringField(const nlohmann::json& json, const char* key, const std::string& fallback) {
    if (!json.contains(key) || json[key].is_null()) {
        return fallback;
    }
    if (!json[key].is_string()) {
        throw ValidationRejected(std::string("Field '") + key + "' must be a string");
    }
    return json[key].get<std::string>();
}

nlohmann::json OptionalTime(const std::optional<std::chrono::system_clock::time_point>& tp) {
    return tp ? nlohmann::json(utils::ToIso(*tp)) : nlohmann::json(nullptr);
}

void Send(httplib::Response& res, const Reply& reply) {
    res.status = reply.status;
    res.set_content(reply.body.dump(2), "application/json");
}

}  // namespace

session::ResourceOptions ParseExecutionOptions(const nlohmann::json& options,
                                               const config::ExecutionDefaults& defaults) {
    session::ResourceOptions parsed;
    parsed.timeout_s = defaults.timeout_s;
    parsed.memory_limit = defaults.memory_limit;
    parsed.cpu_limit = defaults.cpu_limit;
    if (options.is_null()) {
        return parsed;
    }
    if (!options.is_object()) {
        throw ValidationRejected("Field 'execution_options' must be an object");
    }
    if (options.contains("timeout") && !options["timeout"].is_null()) {
        if (!options["timeout"].is_number_integer()) {
            throw ValidationRejected("Field 'timeout' must be an integer");
        }
        parsed.timeout_s = options["timeout"].get<int>();
    }
    parsed.memory_limit = StringField(options, "memory_limit", parsed.memory_limit);
    parsed.cpu_limit = StringField(options, "cpu_limit", parsed.cpu_limit);
    if (options.contains("environment_variables") && !options["environment_variables"].is_null()) {
        const auto& env = options["environment_variables"];
        if (!env.is_object()) {
            throw ValidationRejected("Field 'environment_variables' must be an object");
        }
        for (auto it = env.begin(); it != env.end(); ++it) {
            if (!it.value().is_string()) {
                throw ValidationRejected("Environment variable " + it.key() + " must be a string");
            }
            parsed.environment[it.key()] = it.value().get<std::string>();
        }
    }
    if (options.contains("mount_points") && !options["mount_points"].is_null()) {
        if (!options["mount_points"].is_array()) {
            throw ValidationRejected("Field 'mount_points' must be a list");
        }
        for (const auto& item : options["mount_points"]) {
            if (!item.is_object()) {
                throw ValidationRejected("Each mount point must be an object");
            }
            session::MountPoint mount;
            mount.host_path = StringField(item, "host_path", "");
            mount.container_path = StringField(item, "container_path", "");
            if (item.contains("read_only") && item["read_only"].is_boolean()) {
                mount.read_only = item["read_only"].get<bool>();
            }
            parsed.mount_points.push_back(std::move(mount));
        }
    }
    return parsed;
}

nlohmann::json ResultToJson(const session::Result& result) {
    nlohmann::json outputs = nlohmann::json::array();
    for (const auto& output : result.outputs) {
        nlohmann::json item = {{"type", output.type}, {"content", output.content}};
        if (!output.name.empty()) {
            item["name"] = output.name;
        }
        if (!output.mime_type.empty()) {
            item["mime_type"] = output.mime_type;
        }
        outputs.push_back(std::move(item));
    }
    nlohmann::json files = nlohmann::json::array();
    for (const auto& file : result.files) {
        files.push_back({{"type", file.mime_type}, {"data", file.data}});
    }
    nlohmann::json error = nullptr;
    if (result.error) {
        error = {
            {"name", result.error->name},
            {"value", result.error->message},
            {"traceback", result.error->traceback}
        };
    }
    return {
        {"status", session::ToString(result.status)},
        {"output", outputs},
        {"error", error},
        {"files", files},
        {"completed_at", utils::ToIso(result.completed_at)}
    };
}

nlohmann::json SessionToJson(const session::SessionInfo& info) {
    return {
        {"session_id", info.id},
        {"created_at", utils::ToIso(info.created_at)},
        {"last_used", utils::ToIso(info.last_used_at)},
        {"dependencies", info.dependencies},
        {"executing", info.executing}
    };
}

Reply HandleCreateSession(AppContext& context, const std::string& body) {
    try {
        const auto json = ParseBody(body);
        const auto dependencies = StringList(json, "dependencies");
        const auto verdict = context.Validator().ValidatePackages(dependencies);
        if (!verdict.ok) {
            return Detail(400, verdict.message);
        }
        const auto options = ParseExecutionOptions(
            json.contains("execution_options") ? json["execution_options"] : nlohmann::json(nullptr),
            context.Service().Defaults());
        const auto session_id = context.Service().CreateSession(dependencies, options);
        const auto info = context.Service().GetSession(session_id);
        Reply reply{200, {{"session_id", session_id}, {"status", "created"}}};
        reply.body["created_at"] = info ? utils::ToIso(info->created_at) : utils::NowIso();
        return reply;
    } catch (const ValidationRejected& ex) {
        return Detail(400, ex.what());
    } catch (const DependencyInstallFailure& ex) {
        return Detail(400, ex.what());
    } catch (const IsolationStartupFailure& ex) {
        utils::LogError("gateway", std::string("session startup failed: ") + ex.what());
        return Detail(503, kStartupFailureMessage);
    }
}

Reply HandleListSessions(AppContext& context) {
    nlohmann::json sessions = nlohmann::json::array();
    for (const auto& info : context.Service().ListSessions()) {
        sessions.push_back(SessionToJson(info));
    }
    return Reply{200, {{"sessions", sessions}}};
}

Reply HandleGetSession(AppContext& context, const std::string& session_id) {
    const auto info = context.Service().GetSession(session_id);
    if (!info) {
        return Detail(404, "Session " + session_id + " not found");
    }
    return Reply{200, SessionToJson(*info)};
}

Reply HandleDeleteSession(AppContext& context, const std::string& session_id) {
    context.Service().CleanupSession(session_id);
    return Reply{200, {{"session_id", session_id}, {"status", "deleted"}}};
}

Reply HandleExecute(AppContext& context, const std::string& body) {
    try {
        const auto json = ParseBody(body);
        const auto code = StringField(json, "code", "");
        const auto session_id = StringField(json, "session_id", "");
        const auto language = StringField(json, "language", "python");
        if (language != "python") {
            return Detail(400, "Unsupported language: " + language);
        }
        const auto disabled_rules = StringList(json, "disabled_rules");

        const auto verdict = context.Validator().Validate(code, disabled_rules);
        if (!verdict.ok) {
            return Detail(400, verdict.message);
        }
        const auto request_id = context.Service().CreateExecutionRequest(code, session_id, disabled_rules);
        if (!context.Queue().Submit(request_id)) {
            context.Service().AbandonRequest(request_id, "execution service is shutting down");
            return Detail(503, "execution service is shutting down");
        }

        const auto status = context.Service().GetStatus(request_id);
        Reply reply{200, {{"request_id", request_id}, {"status", "queued"}, {"session_id", session_id}}};
        reply.body["created_at"] = status ? utils::ToIso(status->created_at) : utils::NowIso();
        return reply;
    } catch (const SessionNotFound& ex) {
        return Detail(404, ex.what());
    } catch (const ValidationRejected& ex) {
        return Detail(400, ex.what());
    }
}

Reply HandleStatus(AppContext& context, const std::string& request_id) {
    const auto status = context.Service().GetStatus(request_id);
    if (!status) {
        return Detail(404, "Request not found");
    }
    return Reply{200, {
        {"request_id", request_id},
        {"status", session::ToString(status->status)},
        {"created_at", utils::ToIso(status->created_at)},
        {"completed_at", OptionalTime(status->completed_at)}
    }};
}

Reply HandleResults(AppContext& context, const std::string& request_id) {
    const auto result = context.Service().GetResult(request_id);
    if (!result) {
        return Detail(404, "Results not available");
    }
    return Reply{200, ResultToJson(*result)};
}

Reply HandleListRules(AppContext& context) {
    nlohmann::json rules = nlohmann::json::array();
    for (const auto& rule : context.Validator().Rules()) {
        rules.push_back({{"name", rule.name}, {"description", rule.description}, {"enabled", rule.enabled}});
    }
    return Reply{200, {{"rules", rules}}};
}

void RegisterRoutes(httplib::Server& server, AppContext& context) {
    server.Post("/sessions", [&context](const httplib::Request& req, httplib::Response& res) {
        Send(res, HandleCreateSession(context, req.body));
    });
    server.Get("/sessions", [&context](const httplib::Request&, httplib::Response& res) {
        Send(res, HandleListSessions(context));
    });
    server.Get(R"(/sessions/([^/]+))", [&context](const httplib::Request& req, httplib::Response& res) {
        Send(res, HandleGetSession(context, req.matches[1]));
    });
    server.Delete(R"(/sessions/([^/]+))", [&context](const httplib::Request& req, httplib::Response& res) {
        Send(res, HandleDeleteSession(context, req.matches[1]));
    });
    server.Post("/execute", [&context](const httplib::Request& req, httplib::Response& res) {
        Send(res, HandleExecute(context, req.body));
    });
    server.Get(R"(/execute/([^/]+)/status)", [&context](const httplib::Request& req, httplib::Response& res) {
        Send(res, HandleStatus(context, req.matches[1]));
    });
    server.Get(R"(/execute/([^/]+)/results)", [&context](const httplib::Request& req, httplib::Response& res) {
        Send(res, HandleResults(context, req.matches[1]));
    });
    server.Get("/validation/rules", [&context](const httplib::Request&, httplib::Response& res) {
        Send(res, HandleListRules(context));
    });
}

}  // namespace codebox::gateway
