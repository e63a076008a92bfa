#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "options.hpp"
#include "test_util.hpp"

namespace alternating {
namespace test {

class OptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = CreateTestDir();
    }

    void TearDown() override {
        RemoveTestDir(test_dir_);
    }

    std::filesystem::path WriteFile(const std::string& name, const std::string& contents) {
        auto path = std::filesystem::path(test_dir_) / name;
        std::ofstream out(path);
        out << contents;
        return path;
    }

    std::string test_dir_;
};

TEST_F(OptionsTest, Defaults) {
    Options options = Options::FromJson(nlohmann::json::object());
    EXPECT_EQ(options.mode, Mode::kAlternate);
    EXPECT_FALSE(options.fuse);
    EXPECT_EQ(options.max_gaps, 1u);
    EXPECT_EQ(options.log.min_level, logger::Level::kWarning);
    EXPECT_FALSE(options.log.use_stdout);
    EXPECT_FALSE(options.log.use_stderr);
}

TEST_F(OptionsTest, ParsesAllFields) {
    auto j = nlohmann::json::parse(R"({
        "mode": "no_remainder",
        "fuse": true,
        "max_gaps": 3,
        "log": {"log_dir": "/tmp/elsewhere", "use_stdout": true, "use_stderr": true, "min_level": "debug"},
        "unrelated": 42
    })");

    Options options = Options::FromJson(j);
    EXPECT_EQ(options.mode, Mode::kNoRemainder);
    EXPECT_TRUE(options.fuse);
    EXPECT_EQ(options.max_gaps, 3u);
    EXPECT_EQ(options.log.log_dir, "/tmp/elsewhere");
    EXPECT_TRUE(options.log.use_stdout);
    EXPECT_TRUE(options.log.use_stderr);
    EXPECT_EQ(options.log.min_level, logger::Level::kDebug);
}

TEST_F(OptionsTest, ModeNamesRoundTrip) {
    for (Mode mode : {Mode::kAlternate, Mode::kAlternateAll, Mode::kNoRemainder}) {
        EXPECT_EQ(ParseMode(ModeName(mode)), mode);
    }
}

TEST_F(OptionsTest, RejectsBadValues) {
    EXPECT_THROW(Options::FromJson(nlohmann::json::array()), std::invalid_argument);
    EXPECT_THROW(Options::FromJson(nlohmann::json{{"mode", "zigzag"}}), std::invalid_argument);
    EXPECT_THROW(Options::FromJson(nlohmann::json{{"mode", 3}}), std::invalid_argument);
    EXPECT_THROW(Options::FromJson(nlohmann::json{{"fuse", "yes"}}), std::invalid_argument);
    EXPECT_THROW(Options::FromJson(nlohmann::json{{"max_gaps", 0}}), std::invalid_argument);
    EXPECT_THROW(Options::FromJson(nlohmann::json{{"max_gaps", -2}}), std::invalid_argument);
    EXPECT_THROW(Options::FromJson(nlohmann::json{{"log", 1}}), std::invalid_argument);
    EXPECT_THROW(Options::FromJson(nlohmann::json::parse(R"({"log": {"min_level": "loud"}})")),
                 std::invalid_argument);
}

TEST_F(OptionsTest, FromFile) {
    auto path = WriteFile("options.json", R"({"mode": "all", "max_gaps": 2})");
    Options options = Options::FromFile(path);
    EXPECT_EQ(options.mode, Mode::kAlternateAll);
    EXPECT_EQ(options.max_gaps, 2u);
}

TEST_F(OptionsTest, FromFileErrors) {
    EXPECT_THROW(Options::FromFile(std::filesystem::path(test_dir_) / "missing.json"), std::runtime_error);

    auto path = WriteFile("broken.json", "{\"mode\": ");
    EXPECT_THROW(Options::FromFile(path), nlohmann::json::parse_error);
}

}  // namespace test
}  // namespace alternating
