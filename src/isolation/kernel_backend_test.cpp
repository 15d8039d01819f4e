#include "isolation/kernel_backend.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "kernel/connection_info.hpp"
#include "testing/fakes.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::SizeIs;

using codebox::IsolationStartupFailure;
using codebox::isolation::KernelBackend;
using codebox::isolation::KernelHandle;
using codebox::testing::FakeContainerEngine;
using codebox::testing::FakeKernelChannel;

std::size_t FileCount(const std::filesystem::path& dir) {
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        (void)entry;
        ++count;
    }
    return count;
}

class KernelBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / ("codebox-backend-" + codebox::utils::GenerateUuid());
        std::filesystem::create_directories(dir_);
        config_.connection_dir = dir_.string();
        config_.startup_interval_ms = 0;
        engine_ = std::make_shared<FakeContainerEngine>();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    KernelBackend MakeBackend() {
        return KernelBackend(config_, engine_, [this](const codebox::kernel::ConnectionInfo& info) {
            last_info_ = info;
            auto channel = std::make_unique<FakeKernelChannel>();
            channel->SetFailReady(fail_ready_);
            last_channel_ = channel.get();
            return std::unique_ptr<codebox::kernel::KernelChannel>(std::move(channel));
        });
    }

    std::string StartupFailure(KernelBackend& backend) {
        try {
            backend.Create("s1", {});
        } catch (const IsolationStartupFailure& ex) {
            return ex.what();
        }
        return {};
    }

    std::filesystem::path dir_;
    codebox::config::IsolationConfig config_;
    std::shared_ptr<FakeContainerEngine> engine_;
    codebox::kernel::ConnectionInfo last_info_;
    FakeKernelChannel* last_channel_ = nullptr;
    bool fail_ready_ = false;
};

// NOLINTNEXTLINE
TEST_F(KernelBackendTest, CreateStartsContainerAndChannel) {
    auto backend = MakeBackend();
    codebox::session::ResourceOptions options;
    options.environment = {{"MPLBACKEND", "Agg"}};
    options.mount_points.push_back({dir_.string(), "/data", false});

    const auto handle = backend.Create("s1", options);
    EXPECT_EQ(handle->session_id, "s1");
    EXPECT_EQ(handle->container_id, "container-1");
    ASSERT_NE(last_channel_, nullptr);
    EXPECT_TRUE(last_channel_->Started());
    EXPECT_TRUE(std::filesystem::exists(handle->kernel_file));
    EXPECT_TRUE(std::filesystem::exists(handle->client_file));

    const auto kernel_side = codebox::kernel::ReadConnectionFile(handle->kernel_file);
    EXPECT_EQ(kernel_side.ip, "0.0.0.0");
    EXPECT_EQ(kernel_side.key, last_info_.key);
    EXPECT_EQ(last_info_.ip, "127.0.0.1");

    ASSERT_THAT(engine_->specs, SizeIs(1));
    const auto& spec = engine_->specs[0];
    EXPECT_EQ(spec.name, "codebox-s1");
    EXPECT_EQ(spec.image, config_.image);
    EXPECT_EQ(spec.command.back(), "/opt/connection/kernel.json");
    EXPECT_EQ(spec.environment.at("PYTHONPATH"), "/opt/kernel");
    EXPECT_EQ(spec.environment.at("MPLBACKEND"), "Agg");
    ASSERT_THAT(spec.mounts, SizeIs(2));
    EXPECT_EQ(spec.mounts[0].host_path, handle->kernel_file.string());
    EXPECT_EQ(spec.mounts[0].container_path, "/opt/connection/kernel.json");
    EXPECT_TRUE(spec.mounts[0].read_only);
    EXPECT_EQ(spec.mounts[1].container_path, "/data");
    EXPECT_FALSE(spec.mounts[1].read_only);
    EXPECT_EQ(spec.ports, last_info_.Ports());
    EXPECT_EQ(spec.memory_bytes, 2147483648LL);
    EXPECT_EQ(spec.nano_cpus, 1000000000LL);
    EXPECT_EQ(spec.pids_limit, 100);
}

// NOLINTNEXTLINE
TEST_F(KernelBackendTest, ContainerNeverRunningIsRemovedOnce) {
    engine_->statuses = {"created", "exited"};
    auto backend = MakeBackend();

    EXPECT_EQ(StartupFailure(backend), "Kernel container failed to start: exited");
    EXPECT_EQ(engine_->Count("status "), 3);
    EXPECT_EQ(engine_->Count("logs "), 1);
    EXPECT_EQ(engine_->Count("remove "), 1);
    EXPECT_EQ(last_channel_, nullptr);
    EXPECT_EQ(FileCount(dir_), 0u);
}

// NOLINTNEXTLINE
TEST_F(KernelBackendTest, CreateFailureLeavesNothingBehind) {
    engine_->fail_create = true;
    auto backend = MakeBackend();

    EXPECT_EQ(StartupFailure(backend), "Kernel container failed to start: not started");
    EXPECT_EQ(engine_->Count("remove "), 0);
    EXPECT_EQ(FileCount(dir_), 0u);
}

// NOLINTNEXTLINE
TEST_F(KernelBackendTest, KernelNeverReadyIsTornDown) {
    fail_ready_ = true;
    auto backend = MakeBackend();

    EXPECT_THAT(StartupFailure(backend), HasSubstr("Kernel did not become ready"));
    ASSERT_NE(last_channel_, nullptr);
    EXPECT_EQ(engine_->Count("stop "), 1);
    EXPECT_EQ(engine_->Count("remove "), 1);
    EXPECT_EQ(FileCount(dir_), 0u);
}

// NOLINTNEXTLINE
TEST_F(KernelBackendTest, TeardownRunsEveryStepDespiteFailures) {
    auto backend = MakeBackend();
    auto handle = backend.Create("s1", {});
    engine_->fail_teardown = true;
    std::filesystem::remove(handle->kernel_file);

    EXPECT_NO_THROW(backend.Destroy(*handle));
    EXPECT_EQ(last_channel_->StopCalls(), 1);
    EXPECT_EQ(engine_->Count("stop "), 1);
    EXPECT_EQ(engine_->Count("remove "), 1);
    EXPECT_FALSE(std::filesystem::exists(handle->client_file));
}

// NOLINTNEXTLINE
TEST_F(KernelBackendTest, EnsureImageWithoutBuildContext) {
    engine_->image_exists = false;
    auto backend = MakeBackend();
    try {
        backend.EnsureImage();
        FAIL() << "expected IsolationStartupFailure";
    } catch (const IsolationStartupFailure& ex) {
        EXPECT_THAT(std::string(ex.what()), HasSubstr("not found and no build context configured"));
    }
    EXPECT_EQ(engine_->Count("build "), 0);
}

// NOLINTNEXTLINE
TEST_F(KernelBackendTest, EnsureImageBuildsWhenMissing) {
    engine_->image_exists = false;
    config_.build_context = "/srv/codebox";
    auto backend = MakeBackend();
    backend.EnsureImage();
    ASSERT_EQ(engine_->Count("build "), 1);
    EXPECT_EQ(engine_->calls.back(),
              "build codebox-jupyter-base:latest /srv/codebox/Dockerfile.base_image /srv/codebox");

    engine_->fail_build = true;
    EXPECT_THROW(backend.EnsureImage(), IsolationStartupFailure);
}

// NOLINTNEXTLINE
TEST_F(KernelBackendTest, ShutdownKeepsConfiguredDirectory) {
    auto backend = MakeBackend();
    backend.Shutdown();
    EXPECT_TRUE(std::filesystem::exists(dir_));
}

// NOLINTNEXTLINE
TEST(KernelBackend, OwnedDirectoryRemovedOnShutdown) {
    codebox::config::IsolationConfig config;
    KernelBackend backend(config, std::make_shared<FakeContainerEngine>(), {});
    const auto dir = backend.ConnectionDir();
    EXPECT_TRUE(std::filesystem::exists(dir));
    EXPECT_THAT(dir.filename().string(), HasSubstr("codebox-"));
    backend.Shutdown();
    EXPECT_FALSE(std::filesystem::exists(dir));
}

}  // namespace
