#include "security/mount_policy.hpp"

#include <filesystem>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "utils/common.hpp"
#include "utils/errors.hpp"

namespace {

using ::testing::HasSubstr;

using codebox::ValidationRejected;
using codebox::security::IsWithin;
using codebox::security::ValidateMount;

std::string RejectionFor(const std::string& host, const std::string& container) {
    try {
        ValidateMount(host, container);
    } catch (const ValidationRejected& ex) {
        return ex.what();
    }
    return {};
}

class MountPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / ("codebox-mount-" + codebox::utils::GenerateUuid());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

// NOLINTNEXTLINE
TEST(MountPolicy, IsWithin) {
    EXPECT_TRUE(IsWithin("/etc", "/etc"));
    EXPECT_TRUE(IsWithin("/etc/passwd", "/etc"));
    EXPECT_FALSE(IsWithin("/etcetera", "/etc"));
    EXPECT_FALSE(IsWithin("/", "/etc"));
}

// NOLINTNEXTLINE
TEST_F(MountPolicyTest, AcceptsOrdinaryDirectory) {
    EXPECT_EQ(RejectionFor(dir_.string(), "/data"), "");
}

// NOLINTNEXTLINE
TEST_F(MountPolicyTest, RejectsRelativeContainerPath) {
    EXPECT_THAT(RejectionFor(dir_.string(), "data"), HasSubstr("Container path must be absolute"));
}

// NOLINTNEXTLINE
TEST_F(MountPolicyTest, RejectsSystemContainerPath) {
    EXPECT_THAT(RejectionFor(dir_.string(), "/var/run/docker.sock"), HasSubstr("Container path not allowed"));
    EXPECT_THAT(RejectionFor(dir_.string(), "/data/../etc"), HasSubstr("Container path not allowed"));
}

// NOLINTNEXTLINE
TEST_F(MountPolicyTest, RejectsKernelContainerPaths) {
    EXPECT_THAT(RejectionFor(dir_.string(), "/"), HasSubstr("Container path not allowed"));
    EXPECT_THAT(RejectionFor(dir_.string(), "/opt"), HasSubstr("Container path not allowed"));
    EXPECT_THAT(RejectionFor(dir_.string(), "/opt/connection"), HasSubstr("Container path not allowed"));
    EXPECT_THAT(RejectionFor(dir_.string(), "/opt/kernel/"), HasSubstr("Container path not allowed"));
    EXPECT_THAT(RejectionFor(dir_.string(), "/opt/kernel/lib"), HasSubstr("Container path not allowed"));
    EXPECT_EQ(RejectionFor(dir_.string(), "/opt/data"), "");
}

// NOLINTNEXTLINE
TEST_F(MountPolicyTest, RejectsMissingHostPath) {
    EXPECT_THAT(RejectionFor((dir_ / "missing").string(), "/data"), HasSubstr("Host path does not exist"));
}

// NOLINTNEXTLINE
TEST_F(MountPolicyTest, RejectsSystemHostPath) {
    EXPECT_THAT(RejectionFor("/etc", "/data"), HasSubstr("Host path not allowed"));
    EXPECT_THAT(RejectionFor("/", "/data"), HasSubstr("Host path not allowed"));
    EXPECT_THAT(RejectionFor(dir_.string() + "/../../etc", "/data"), HasSubstr("Host path not allowed"));
}

// NOLINTNEXTLINE
TEST_F(MountPolicyTest, RejectsSymlinkIntoSystemDirectory) {
    const auto link = dir_ / "link";
    std::filesystem::create_directory_symlink("/etc", link);
    EXPECT_THAT(RejectionFor(link.string(), "/data"), HasSubstr("Host path not allowed"));
}

}  // namespace
