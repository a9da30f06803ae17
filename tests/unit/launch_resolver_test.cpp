/**
 * @file launch_resolver_test.cpp
 * @brief Unit tests for development and bundled launch resolution
 */

#include "sidecar/launch_resolver.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

#include "helpers/temp_dir.hpp"

using namespace tether::sidecar;
using namespace tether::tests;
using ::testing::HasSubstr;

class LaunchResolverTest : public ::testing::Test {
protected:
    LaunchResolverTest() : root_("launch_resolver") {}

    SidecarConfig development_config() {
        SidecarConfig config;
        config.mode = LaunchMode::DEVELOPMENT;
        config.project_root = root_.path().string();
        return config;
    }

    SidecarConfig bundled_config() {
        SidecarConfig config;
        config.mode = LaunchMode::BUNDLED;
        config.bundle_dir = (root_.path() / "bin").string();
        std::filesystem::create_directories(config.bundle_dir);
        return config;
    }

    std::string normal(const std::filesystem::path &p) { return p.lexically_normal().string(); }

    TempDir root_;
};

TEST_F(LaunchResolverTest, DevelopmentResolvesVenvInterpreter) {
    root_.write_file("sidecar/main.py", "print('PORT:1')\n");
    root_.write_script("sidecar/.venv/bin/python3", "exit 0\n");

    LaunchSpec spec;
    std::string error;
    ASSERT_TRUE(resolve_launch(development_config(), spec, error)) << error;

    EXPECT_EQ(spec.executable, normal(root_.path() / "sidecar/.venv/bin/python3"));
    EXPECT_EQ(spec.args, (std::vector<std::string>{"-u", "main.py"}));
    EXPECT_EQ(spec.working_directory, normal(root_.path() / "sidecar"));
}

TEST_F(LaunchResolverTest, DevelopmentAppendsExtraArgs) {
    root_.write_file("sidecar/main.py", "");
    root_.write_script("sidecar/.venv/bin/python3", "exit 0\n");

    auto config = development_config();
    config.args = {"--reload", "--log-level=debug"};

    LaunchSpec spec;
    std::string error;
    ASSERT_TRUE(resolve_launch(config, spec, error)) << error;
    EXPECT_EQ(spec.args, (std::vector<std::string>{"-u", "main.py", "--reload", "--log-level=debug"}));
}

TEST_F(LaunchResolverTest, DevelopmentLooksUpBareInterpreterOnPath) {
    root_.write_file("sidecar/main.py", "");

    auto config = development_config();
    config.interpreter = "sh";
    config.interpreter_args.clear();

    LaunchSpec spec;
    std::string error;
    ASSERT_TRUE(resolve_launch(config, spec, error)) << error;
    EXPECT_EQ(std::filesystem::path(spec.executable).filename().string(), "sh");
    EXPECT_TRUE(std::filesystem::path(spec.executable).is_absolute());
    EXPECT_EQ(spec.args, (std::vector<std::string>{"main.py"}));
}

TEST_F(LaunchResolverTest, DevelopmentMissingDirectoryFails) {
    LaunchSpec spec;
    std::string error;
    EXPECT_FALSE(resolve_launch(development_config(), spec, error));
    EXPECT_THAT(error, HasSubstr("Sidecar directory not found"));
}

TEST_F(LaunchResolverTest, DevelopmentMissingScriptFails) {
    std::filesystem::create_directories(root_.path() / "sidecar");

    LaunchSpec spec;
    std::string error;
    EXPECT_FALSE(resolve_launch(development_config(), spec, error));
    EXPECT_THAT(error, HasSubstr("Sidecar script not found"));
}

TEST_F(LaunchResolverTest, DevelopmentMissingInterpreterFails) {
    root_.write_file("sidecar/main.py", "");

    LaunchSpec spec;
    std::string error;
    EXPECT_FALSE(resolve_launch(development_config(), spec, error));
    EXPECT_THAT(error, HasSubstr("Executable not found"));
    EXPECT_THAT(error, HasSubstr(".venv/bin/python3"));
}

TEST_F(LaunchResolverTest, DevelopmentUnknownBareInterpreterFails) {
    root_.write_file("sidecar/main.py", "");

    auto config = development_config();
    config.interpreter = "tether-no-such-interpreter";

    LaunchSpec spec;
    std::string error;
    EXPECT_FALSE(resolve_launch(config, spec, error));
    EXPECT_THAT(error, HasSubstr("Interpreter not found on PATH: tether-no-such-interpreter"));
}

TEST_F(LaunchResolverTest, BundledResolvesPlainBinary) {
    auto config = bundled_config();
    root_.write_script("bin/sidecar", "exit 0\n");

    LaunchSpec spec;
    std::string error;
    ASSERT_TRUE(resolve_launch(config, spec, error)) << error;
    EXPECT_EQ(spec.executable, normal(root_.path() / "bin/sidecar"));
    EXPECT_TRUE(spec.args.empty());
    EXPECT_EQ(spec.working_directory, normal(root_.path() / "bin"));
}

TEST_F(LaunchResolverTest, BundledFallsBackToTripleSuffix) {
    auto config = bundled_config();
    config.target_triple = "aarch64-unknown-linux-gnu";
    root_.write_script("bin/sidecar-aarch64-unknown-linux-gnu", "exit 0\n");

    LaunchSpec spec;
    std::string error;
    ASSERT_TRUE(resolve_launch(config, spec, error)) << error;
    EXPECT_EQ(spec.executable, normal(root_.path() / "bin/sidecar-aarch64-unknown-linux-gnu"));
}

TEST_F(LaunchResolverTest, BundledMissingBinaryNamesBothCandidates) {
    auto config = bundled_config();

    LaunchSpec spec;
    std::string error;
    EXPECT_FALSE(resolve_launch(config, spec, error));
    EXPECT_THAT(error, HasSubstr("Executable not found"));
    EXPECT_THAT(error, HasSubstr("sidecar-x86_64-unknown-linux-gnu"));
}

TEST_F(LaunchResolverTest, BundledNonExecutableFileIsNotAccepted) {
    auto config = bundled_config();
    root_.write_file("bin/sidecar", "not a program");

    LaunchSpec spec;
    std::string error;
    EXPECT_FALSE(resolve_launch(config, spec, error));
}

TEST(LaunchHelpersTest, CurrentExecutableDirExists) {
    auto dir = current_executable_dir();
    ASSERT_FALSE(dir.empty());
    EXPECT_TRUE(std::filesystem::is_directory(dir));
}

TEST(LaunchHelpersTest, FindInPathMissesUnknownCommand) {
    EXPECT_FALSE(find_in_path("tether-no-such-command").has_value());
    EXPECT_FALSE(find_in_path("").has_value());
}
