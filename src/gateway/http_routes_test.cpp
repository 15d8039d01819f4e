#include "gateway/http_routes.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "testing/fakes.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

using codebox::gateway::AppContext;
using codebox::gateway::Reply;

class HttpRoutesTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<codebox::testing::FakeIsolationBackend>();
        codebox::config::Config config;
        config.execution.workers = 1;
        context_ = std::make_unique<AppContext>(config, backend_);
        context_->Startup();
    }

    void TearDown() override { context_->Shutdown(); }

    std::string CreateSession(const std::string& body = "{}") {
        const auto reply = codebox::gateway::HandleCreateSession(*context_, body);
        EXPECT_EQ(reply.status, 200) << reply.body.dump();
        return reply.body.value("session_id", "");
    }

    Reply WaitForResults(const std::string& request_id) {
        Reply reply;
        for (int i = 0; i < 200; ++i) {
            reply = codebox::gateway::HandleResults(*context_, request_id);
            if (reply.status == 200) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return reply;
    }

    std::shared_ptr<codebox::testing::FakeIsolationBackend> backend_;
    std::unique_ptr<AppContext> context_;
};

// NOLINTNEXTLINE
TEST_F(HttpRoutesTest, CreateSessionAppliesExecutionOptions) {
    const auto reply = codebox::gateway::HandleCreateSession(
        *context_, R"({"execution_options": {"timeout": 15, "memory_limit": "512m", "environment_variables": {"A": "1"}}})");
    ASSERT_EQ(reply.status, 200);
    EXPECT_EQ(reply.body["status"], "created");
    EXPECT_TRUE(reply.body.contains("created_at"));
    EXPECT_EQ(backend_->LastOptions().timeout_s, 15);
    EXPECT_EQ(backend_->LastOptions().memory_limit, "512m");
    EXPECT_EQ(backend_->LastOptions().environment.at("A"), "1");

    const auto listed = codebox::gateway::HandleListSessions(*context_);
    ASSERT_EQ(listed.body["sessions"].size(), 1u);
    EXPECT_EQ(listed.body["sessions"][0]["session_id"], reply.body["session_id"]);
}

// NOLINTNEXTLINE
TEST_F(HttpRoutesTest, DeniedDependencyNeverReachesBackend) {
    const auto reply = codebox::gateway::HandleCreateSession(*context_, R"({"dependencies": ["crypto"]})");
    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(reply.body["detail"], "Package not allowed: crypto");
    EXPECT_EQ(backend_->Creates(), 0);
}

// NOLINTNEXTLINE
TEST_F(HttpRoutesTest, BadTimeoutIsClientError) {
    const auto reply = codebox::gateway::HandleCreateSession(*context_, R"({"execution_options": {"timeout": 0}})");
    EXPECT_EQ(reply.status, 400);
    EXPECT_THAT(reply.body["detail"].get<std::string>(), HasSubstr("Timeout must be between"));

    const auto typed = codebox::gateway::HandleCreateSession(*context_, R"({"execution_options": {"timeout": "5"}})");
    EXPECT_EQ(typed.status, 400);
    EXPECT_EQ(backend_->Creates(), 0);
}

// NOLINTNEXTLINE
TEST_F(HttpRoutesTest, StartupFailureHidesDetails) {
    backend_->SetFailCreate(true);
    const auto reply = codebox::gateway::HandleCreateSession(*context_, "{}");
    EXPECT_EQ(reply.status, 503);
    EXPECT_EQ(reply.body["detail"], "could not start execution environment");
}

// NOLINTNEXTLINE
TEST_F(HttpRoutesTest, ExecuteAgainstUnknownSessionIsNotFound) {
    const auto reply = codebox::gateway::HandleExecute(*context_, R"json({"code": "print(1)", "session_id": "nope"})json");
    EXPECT_EQ(reply.status, 404);
    EXPECT_EQ(reply.body["detail"], "Session nope not found, must create a session first");
}

// NOLINTNEXTLINE
TEST_F(HttpRoutesTest, RejectedCodeIsNotQueued) {
    const auto session_id = CreateSession();
    const auto reply = codebox::gateway::HandleExecute(
        *context_, R"({"code": "import subprocess", "session_id": ")" + session_id + R"("})");
    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(reply.body["detail"], "Forbidden import: subprocess");
    EXPECT_TRUE(backend_->Channel(session_id)->Codes().empty());
}

// NOLINTNEXTLINE
TEST_F(HttpRoutesTest, UnsupportedLanguage) {
    const auto session_id = CreateSession();
    const auto reply = codebox::gateway::HandleExecute(
        *context_, R"({"code": "1", "language": "ruby", "session_id": ")" + session_id + R"("})");
    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(reply.body["detail"], "Unsupported language: ruby");
}

// NOLINTNEXTLINE
TEST_F(HttpRoutesTest, ExecuteThenFetchResults) {
    const auto session_id = CreateSession();
    const auto queued = codebox::gateway::HandleExecute(
        *context_, R"json({"code": "print('hi')", "session_id": ")json" + session_id + R"("})");
    ASSERT_EQ(queued.status, 200);
    EXPECT_EQ(queued.body["status"], "queued");
    const auto request_id = queued.body["request_id"].get<std::string>();

    const auto results = WaitForResults(request_id);
    ASSERT_EQ(results.status, 200);
    EXPECT_EQ(results.body["status"], "completed");
    EXPECT_TRUE(results.body["error"].is_null());
    ASSERT_EQ(results.body["output"].size(), 1u);
    EXPECT_EQ(results.body["output"][0]["content"], "print('hi')");

    const auto status = codebox::gateway::HandleStatus(*context_, request_id);
    EXPECT_EQ(status.body["status"], "completed");
    EXPECT_FALSE(status.body["completed_at"].is_null());
}

// NOLINTNEXTLINE
TEST_F(HttpRoutesTest, UnknownRequestAndSession) {
    EXPECT_EQ(codebox::gateway::HandleStatus(*context_, "missing").status, 404);
    EXPECT_EQ(codebox::gateway::HandleResults(*context_, "missing").body["detail"], "Results not available");
    EXPECT_EQ(codebox::gateway::HandleGetSession(*context_, "missing").status, 404);
}

// NOLINTNEXTLINE
TEST_F(HttpRoutesTest, DeleteSessionIsIdempotent) {
    const auto session_id = CreateSession();
    EXPECT_EQ(codebox::gateway::HandleDeleteSession(*context_, session_id).body["status"], "deleted");
    EXPECT_EQ(codebox::gateway::HandleDeleteSession(*context_, session_id).status, 200);
    EXPECT_THAT(backend_->Destroyed(), ElementsAre(session_id));
    EXPECT_EQ(codebox::gateway::HandleGetSession(*context_, session_id).status, 404);
}

// NOLINTNEXTLINE
TEST_F(HttpRoutesTest, RulesListing) {
    const auto reply = codebox::gateway::HandleListRules(*context_);
    ASSERT_EQ(reply.body["rules"].size(), 5u);
    EXPECT_EQ(reply.body["rules"][0]["name"], "jupyter_commands");
    EXPECT_TRUE(reply.body["rules"][0]["enabled"].get<bool>());
}

// NOLINTNEXTLINE
TEST(HttpRoutes, ResultShape) {
    codebox::session::Result result;
    result.status = codebox::session::ExecutionStatus::kFailed;
    result.outputs.push_back({"stream", "partial\n", "stdout", ""});
    result.files.push_back({"image/png", "iVBORw0KGgo="});
    result.error = codebox::session::ExecutionError{"ZeroDivisionError", "division by zero", {"line 1"}};
    result.completed_at = codebox::utils::Now();

    const auto json = codebox::gateway::ResultToJson(result);
    EXPECT_EQ(json["status"], "failed");
    EXPECT_EQ(json["output"][0]["name"], "stdout");
    EXPECT_FALSE(json["output"][0].contains("mime_type"));
    EXPECT_EQ(json["files"][0]["type"], "image/png");
    EXPECT_EQ(json["error"]["name"], "ZeroDivisionError");
    EXPECT_EQ(json["error"]["value"], "division by zero");
    EXPECT_EQ(json["error"]["traceback"][0], "line 1");
}

// NOLINTNEXTLINE
TEST(HttpRoutes, ExecutionOptionsFallBackToDefaults) {
    codebox::config::ExecutionDefaults defaults;
    defaults.timeout_s = 42;
    const auto parsed = codebox::gateway::ParseExecutionOptions(nullptr, defaults);
    EXPECT_EQ(parsed.timeout_s, 42);
    EXPECT_EQ(parsed.memory_limit, "2G");

    nlohmann::json options = nlohmann::json::object();
    options["mount_points"] = nlohmann::json::array();
    options["mount_points"].push_back({{"host_path", "/data"}, {"container_path", "/mnt/data"}, {"read_only", false}});
    const auto mounts = codebox::gateway::ParseExecutionOptions(options, defaults);
    ASSERT_EQ(mounts.mount_points.size(), 1u);
    EXPECT_EQ(mounts.mount_points[0].container_path, "/mnt/data");
    EXPECT_FALSE(mounts.mount_points[0].read_only);

    EXPECT_THROW(codebox::gateway::ParseExecutionOptions({{"environment_variables", {{"A", 1}}}}, defaults),
                 codebox::ValidationRejected);
}

}  // namespace
