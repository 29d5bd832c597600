#include <gtest/gtest.h>
#include "vellum/core/logger.hpp"

using namespace vellum;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logging::shutdown();
        auto sink = std::make_unique<MemorySink>();
        m_sink = sink.get();
        std::vector<std::unique_ptr<LogSink>> sinks;
        sinks.push_back(std::move(sink));
        logging::init(std::move(sinks));
        logging::set_level(LogLevel::Trace);
    }

    void TearDown() override {
        logging::shutdown();
        logging::set_level(LogLevel::Info);
    }

    MemorySink* m_sink{nullptr};
};

TEST(FormatMessageTest, SubstitutesPlaceholdersInOrder) {
    EXPECT_EQ(format_message("{} of {} loaded", 3, "five"), "3 of five loaded");
}

TEST(FormatMessageTest, ExtraArgumentsAreIgnored) {
    EXPECT_EQ(format_message("done", 1, 2), "done");
}

TEST(FormatMessageTest, MissingArgumentsLeavePlaceholders) {
    EXPECT_EQ(format_message("{} and {}", 1), "1 and {}");
}

TEST_F(LoggerTest, MacroWritesThroughDefaultLogger) {
    VELLUM_LOG_WARN("pool nearly full");

    ASSERT_EQ(m_sink->lines().size(), 1u);
    EXPECT_EQ(m_sink->lines()[0], "[WARN] [vellum] pool nearly full");
}

TEST_F(LoggerTest, NamedLoggerFormats) {
    logging::get("cache").info_fmt("evicted {} ({} bytes)", "atlas", 4096);

    EXPECT_TRUE(m_sink->contains("[INFO] [cache] evicted atlas (4096 bytes)"));
}

TEST_F(LoggerTest, GlobalLevelFilters) {
    logging::set_level(LogLevel::Error);

    VELLUM_LOG_INFO("hidden");
    VELLUM_LOG_ERROR("shown");

    ASSERT_EQ(m_sink->lines().size(), 1u);
    EXPECT_TRUE(m_sink->contains("shown"));
}

TEST_F(LoggerTest, PerLoggerLevelFilters) {
    auto& logger = logging::get("loader");
    logger.set_level(LogLevel::Warn);

    logger.debug("retry scheduled");
    logger.warn("retry exhausted");

    EXPECT_FALSE(m_sink->contains("retry scheduled"));
    EXPECT_TRUE(m_sink->contains("retry exhausted"));
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("WARN"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_EQ(to_string(LogLevel::Error), "ERROR");
}

TEST_F(LoggerTest, MemorySinkClear) {
    auto& logger = logging::get("batch");
    logger.set_level(LogLevel::Info);

    logger.debug_fmt("skipped {}", 1);
    logger.info_fmt("flushed {} batches", 3);

    ASSERT_EQ(m_sink->lines().size(), 1u);
    EXPECT_EQ(m_sink->lines()[0], "[INFO] [batch] flushed 3 batches");

    m_sink->clear();
    EXPECT_TRUE(m_sink->lines().empty());
}
