#include "kernel/connection_info.hpp"

#include <filesystem>
#include <set>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "utils/common.hpp"

namespace {

using ::testing::Each;
using ::testing::Gt;
using ::testing::SizeIs;

using codebox::kernel::ConnectionInfo;

// NOLINTNEXTLINE
TEST(ConnectionInfo, FreshDescriptorHasDistinctPortsAndKey) {
    const auto info = codebox::kernel::NewConnectionInfo();
    const auto ports = info.Ports();
    EXPECT_THAT(ports, SizeIs(5));
    EXPECT_THAT(ports, Each(Gt(0)));
    EXPECT_EQ(std::set<int>(ports.begin(), ports.end()).size(), 5u);
    EXPECT_THAT(info.key, SizeIs(36));
    EXPECT_EQ(info.signature_scheme, "hmac-sha256");
}

// NOLINTNEXTLINE
TEST(ConnectionInfo, Endpoint) {
    ConnectionInfo info;
    EXPECT_EQ(info.Endpoint(5555), "tcp://127.0.0.1:5555");
}

// NOLINTNEXTLINE
TEST(ConnectionInfo, FileRoundTrip) {
    auto info = codebox::kernel::NewConnectionInfo();
    info.ip = "0.0.0.0";
    const auto path = std::filesystem::temp_directory_path() / ("codebox-conn-" + codebox::utils::GenerateUuid());
    codebox::kernel::WriteConnectionFile(path, info);
    const auto read = codebox::kernel::ReadConnectionFile(path);
    std::filesystem::remove(path);

    EXPECT_EQ(read.ToJson(), info.ToJson());
}

// NOLINTNEXTLINE
TEST(ConnectionInfo, MissingFileThrows) {
    EXPECT_THROW(codebox::kernel::ReadConnectionFile("/nonexistent/codebox/kernel.json"), std::runtime_error);
}

}  // namespace
