#include "livestore/util/Logger.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace livestore::util;

namespace {

std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "livestore_logger_test.log";
        std::remove(path_.c_str());
        ASSERT_TRUE(logger().setFile(path_));
        logger().setLevel(LogLevel::Info);
        logger().setFormatJson(false);
    }

    void TearDown() override {
        logger().setFile("");
        logger().setLevel(LogLevel::Info);
        logger().setFormatJson(false);
        std::remove(path_.c_str());
    }

    std::string path_;
};

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(parseLevel("TRACE"), LogLevel::Trace);
    EXPECT_EQ(parseLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLevel("Warning"), LogLevel::Warn);
    EXPECT_EQ(parseLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLevel("bogus"), LogLevel::Info);
    EXPECT_STREQ(levelName(LogLevel::Warn), "WARN");
}

TEST_F(LoggerTest, PlainLineCarriesLevelMessageAndFields) {
    logger().log(LogLevel::Info, "hello", {{"k", "v"}, {"n", "2"}});
    const std::string out = slurp(path_);
    EXPECT_NE(out.find("] INFO  hello k=v n=2\n"), std::string::npos) << out;
}

TEST_F(LoggerTest, BelowThresholdIsDropped) {
    logger().setLevel(LogLevel::Warn);
    EXPECT_FALSE(logger().enabled(LogLevel::Info));
    logger().log(LogLevel::Info, "quiet");
    logger().log(LogLevel::Error, "loud");
    const std::string out = slurp(path_);
    EXPECT_EQ(out.find("quiet"), std::string::npos);
    EXPECT_NE(out.find("ERROR loud"), std::string::npos);
}

TEST_F(LoggerTest, JsonEscapesSpecialCharacters) {
    logger().setFormatJson(true);
    logger().log(LogLevel::Warn, "say \"hi\"\n", {{"path", "a\\b"}});
    const std::string out = slurp(path_);
    EXPECT_NE(out.find("\"lvl\":\"WARN\""), std::string::npos) << out;
    EXPECT_NE(out.find("\"msg\":\"say \\\"hi\\\"\\n\""), std::string::npos) << out;
    EXPECT_NE(out.find("\"path\":\"a\\\\b\""), std::string::npos) << out;
}

TEST_F(LoggerTest, ScopedFieldsAttachAndRestore) {
    {
        Logger::Scoped outer(std::vector<Field>{{"store", "1"}});
        {
            Logger::Scoped inner({{"store", "2"}, {"op", "get"}});
            logger().log(LogLevel::Info, "inner");
        }
        logger().log(LogLevel::Info, "outer");
    }
    logger().log(LogLevel::Info, "bare");

    std::istringstream lines(slurp(path_));
    std::string innerLine, outerLine, bareLine;
    std::getline(lines, innerLine);
    std::getline(lines, outerLine);
    std::getline(lines, bareLine);

    EXPECT_NE(innerLine.find("op=get"), std::string::npos);
    EXPECT_NE(innerLine.find("store=2"), std::string::npos);
    EXPECT_NE(outerLine.find("store=1"), std::string::npos);
    EXPECT_EQ(outerLine.find("op="), std::string::npos);
    EXPECT_EQ(bareLine.find("store="), std::string::npos);
}

TEST_F(LoggerTest, UnopenableFileFallsBackToStdout) {
    EXPECT_FALSE(logger().setFile("/nonexistent-dir/livestore/x.log"));
    logger().log(LogLevel::Info, "to stdout");
    EXPECT_EQ(slurp(path_).find("to stdout"), std::string::npos);
}
