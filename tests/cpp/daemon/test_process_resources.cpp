#include "daemon/app/process_resources.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

namespace fs = std::filesystem;

class ProcessResourcesTest : public ::testing::Test {
   protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("castgrid_resources_test_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        options_.pidFilePath = (dir_ / "run" / "castgrid.pid").string();
        options_.statsFilePath = (dir_ / "stats" / "castgrid_stats.json").string();
        options_.controlEndpoint = "ipc://" + (dir_ / "sock" / "castgrid.sock").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    daemon_app::ProcessResources::Options options_;
};

TEST_F(ProcessResourcesTest, RuntimeDirectoriesAreDeduplicated) {
    options_.statsFilePath = (dir_ / "run" / "stats.json").string();
    auto dirs = daemon_app::ProcessResources::runtimeDirectories(options_);
    ASSERT_EQ(dirs.size(), 2u);
    EXPECT_EQ(dirs[0], (dir_ / "run").string());
    EXPECT_EQ(dirs[1], (dir_ / "sock").string());

    options_.controlEndpoint = "tcp://127.0.0.1:5555";
    EXPECT_EQ(daemon_app::ProcessResources::runtimeDirectories(options_).size(), 1u);
}

TEST_F(ProcessResourcesTest, AcquireCreatesDirectoriesAndClearsStaleStats) {
    fs::create_directories(dir_ / "stats");
    std::ofstream(options_.statsFilePath) << "{\"stale\":true}";

    {
        auto resources = daemon_app::ProcessResources::acquire(options_);
        ASSERT_TRUE(resources.has_value());
        EXPECT_TRUE(fs::is_directory(dir_ / "run"));
        EXPECT_TRUE(fs::is_directory(dir_ / "sock"));
        EXPECT_TRUE(fs::exists(options_.pidFilePath));
        EXPECT_FALSE(fs::exists(options_.statsFilePath));
        EXPECT_EQ(resources->pidLock().path(), options_.pidFilePath);

        // The control plane writes through its own StatsFile on the same path
        daemon_metrics::StatsFile writer(resources->statsFile().path());
        std::string error;
        ASSERT_TRUE(writer.write({{"devices", 0}}, error)) << error;
        EXPECT_TRUE(fs::exists(options_.statsFilePath));
    }

    // Released with the process resources
    EXPECT_FALSE(fs::exists(options_.pidFilePath));
    EXPECT_FALSE(fs::exists(options_.statsFilePath));
}

TEST_F(ProcessResourcesTest, MovedResourcesCleanUpOnce) {
    auto resources = daemon_app::ProcessResources::acquire(options_);
    ASSERT_TRUE(resources.has_value());

    auto moved = std::move(*resources);
    resources.reset();
    EXPECT_TRUE(fs::exists(options_.pidFilePath));
    EXPECT_EQ(moved.statsFile().path(), options_.statsFilePath);
}
