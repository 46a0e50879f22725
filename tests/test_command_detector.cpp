#include <gtest/gtest.h>
#include <runs/command_detector.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using CommandDetector::Command;

class CommandDetectorTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   ("toolsight_detect_test_" +
                    std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void touch(const std::string& name) {
        std::ofstream(test_dir / name) << "";
    }
};

TEST_F(CommandDetectorTest, EmptyDirectory) {
    EXPECT_FALSE(CommandDetector::build_command(test_dir).has_value());
    EXPECT_FALSE(CommandDetector::test_command(test_dir).has_value());
}

TEST_F(CommandDetectorTest, MissingDirectory) {
    EXPECT_FALSE(CommandDetector::build_command(test_dir / "nope").has_value());
}

TEST_F(CommandDetectorTest, Cargo) {
    touch("Cargo.toml");
    EXPECT_EQ(CommandDetector::build_command(test_dir), (Command{"cargo", "build"}));
    EXPECT_EQ(CommandDetector::test_command(test_dir), (Command{"cargo", "test"}));
}

TEST_F(CommandDetectorTest, SwiftWinsOverMakefile) {
    touch("Makefile");
    touch("Package.swift");
    EXPECT_EQ(CommandDetector::build_command(test_dir), (Command{"swift", "build"}));
    EXPECT_EQ(CommandDetector::test_command(test_dir), (Command{"swift", "test"}));
}

TEST_F(CommandDetectorTest, NpmPassesWithNoTests) {
    touch("package.json");
    EXPECT_EQ(CommandDetector::build_command(test_dir), (Command{"npm", "run", "build"}));
    EXPECT_EQ(CommandDetector::test_command(test_dir),
              (Command{"npm", "test", "--", "--passWithNoTests"}));
}

TEST_F(CommandDetectorTest, GoIsTestOnly) {
    touch("go.mod");
    EXPECT_FALSE(CommandDetector::build_command(test_dir).has_value());
    EXPECT_EQ(CommandDetector::test_command(test_dir), (Command{"go", "test", "./..."}));
}

TEST_F(CommandDetectorTest, PythonMarkers) {
    touch("pyproject.toml");
    EXPECT_FALSE(CommandDetector::build_command(test_dir).has_value());
    EXPECT_EQ(CommandDetector::test_command(test_dir),
              (Command{"python", "-m", "pytest", "--tb=short", "-q"}));
}

TEST_F(CommandDetectorTest, LowercaseMakefile) {
    touch("makefile");
    EXPECT_EQ(CommandDetector::build_command(test_dir), (Command{"make"}));
    EXPECT_EQ(CommandDetector::test_command(test_dir), (Command{"make", "test"}));
}

TEST(CommandDetector, ToDisplay) {
    EXPECT_EQ(CommandDetector::to_display({"npm", "test", "--", "--passWithNoTests"}),
              "npm test -- --passWithNoTests");
    EXPECT_EQ(CommandDetector::to_display({}), "");
}
