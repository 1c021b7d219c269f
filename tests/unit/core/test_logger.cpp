#include <gtest/gtest.h>
#include "folio/core/logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace folio;

// ============================================================================
// Logger Tests
// ============================================================================

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
        logging::set_level(LogLevel::Warn);
        m_sink = nullptr;
    }

    MemorySink* m_sink{nullptr};
};

TEST_F(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("WARN"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_log_level("verbose"), std::nullopt);
}

TEST_F(LoggerTest, NamedLoggerWritesToSink) {
    auto& log = logging::get("folio.test");
    log.info("hello");

    auto entries = m_sink->entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Info);
    EXPECT_EQ(entries[0].logger_name, "folio.test");
    EXPECT_EQ(entries[0].message, "hello");
}

TEST_F(LoggerTest, GetReturnsSameLogger) {
    auto& a = logging::get("folio.same");
    auto& b = logging::get("folio.same");
    EXPECT_EQ(&a, &b);
}

TEST_F(LoggerTest, GlobalLevelFilters) {
    logging::set_level(LogLevel::Warn);
    auto& log = logging::get("folio.test");

    log.debug("dropped");
    log.warn("kept");

    auto entries = m_sink->entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "kept");
}

TEST_F(LoggerTest, LoggerLevelFilters) {
    auto& log = logging::get("folio.quiet");
    log.set_level(LogLevel::Error);

    log.info("dropped");
    log.error("kept");
    log.set_level(LogLevel::Trace);

    auto entries = m_sink->entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Error);
}

TEST_F(LoggerTest, FormatPlaceholders) {
    auto& log = logging::get("folio.test");
    log.debug_fmt("{} recoveries in <{}>", 2, "ac:layout");

    auto entries = m_sink->entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "2 recoveries in <ac:layout>");
}

TEST_F(LoggerTest, DefaultLoggerMacros) {
    FOLIO_LOG_INFO("from macro");
    FOLIO_LOG_WARN_FMT("value={}", 7);

    auto entries = m_sink->entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].logger_name, "folio");
    EXPECT_EQ(entries[1].message, "value=7");
}

TEST_F(LoggerTest, FileSinkAppendsRecords) {
    auto path = std::filesystem::temp_directory_path() / "folio_logger_test.log";
    std::filesystem::remove(path);

    {
        auto sink = std::make_unique<FileSink>(path.string().c_str());
        ASSERT_TRUE(sink->is_open());
        logging::add_sink(std::move(sink));

        logging::get("folio.file").warn("written to disk");
        // Closes the file
        logging::shutdown();
        m_sink = nullptr;
    }

    std::ifstream file(path);
    std::stringstream contents;
    contents << file.rdbuf();
    auto text = contents.str();

    EXPECT_NE(text.find("[folio.file] written to disk"), std::string::npos);
    std::filesystem::remove(path);
}

TEST_F(LoggerTest, FileSinkReportsUnopenablePath) {
    FileSink sink("/nonexistent-folio-dir/log.txt");
    EXPECT_FALSE(sink.is_open());
}
