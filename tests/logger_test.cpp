#include <gtest/gtest.h>
#include <tabula/Logger.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace tabula;

TEST(Logger, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_FALSE(parseLogLevel("trace").has_value());
    EXPECT_STREQ(toString(LogLevel::Warn), "WARN");
}

TEST(Logger, FiltersBelowLevel) {
    std::ostringstream console;
    Logger log{LogLevel::Warn, &console};

    log.debug("hidden");
    log.info("hidden too");
    log.warn("shown");
    log.error("also shown");

    const std::string text = console.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[WARN] shown\n"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] also shown\n"), std::string::npos);

    log.setLevel(LogLevel::Debug);
    EXPECT_EQ(log.level(), LogLevel::Debug);
    log.debug("now visible");
    EXPECT_NE(console.str().find("[DEBUG] now visible"), std::string::npos);
}

TEST(Logger, AppendsToFile) {
    const auto file = std::filesystem::temp_directory_path() / "tabula-logger-test.log";
    std::filesystem::remove(file);
    {
        Logger log{LogLevel::Info, nullptr, file.string()};
        log.info("first");
    }
    {
        Logger log{LogLevel::Info, nullptr, file.string()};
        log.info("second");
    }

    std::ifstream in(file);
    std::ostringstream buf;
    buf << in.rdbuf();
    const std::string text = buf.str();
    const auto first = text.find("[INFO] first");
    const auto second = text.find("[INFO] second");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
    std::filesystem::remove(file);
}
