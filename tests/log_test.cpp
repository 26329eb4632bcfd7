//! # Logger Unit Tests
//!
//! LogFilter parsing, sink output, command-line log options and the
//! logging macros.

#include "log/log.hpp"
#include "test_tree.hpp"

#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace doclink::log;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("plan=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "plan"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "plan"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "scan"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "scan"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("scan=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "scan"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "apply"));
}

TEST_F(LogFilterTest, BareModuleNameMeansTrace) {
    filter.parse("table");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "table"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "nav"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("scan=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, EmptyFilterDefaultsToInfo) {
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "anything"));
}

TEST(LogLevelTest, ParseAndName) {
    EXPECT_EQ(parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_level("WARN"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_STREQ(level_name(LogLevel::Error), "ERROR");
}

// ============================================================================
// Helper: Capture sink that stores records in memory
// ============================================================================

class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        records.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    std::vector<Entry> records;
};

// ============================================================================
// Formatting and FileSink
// ============================================================================

static LogRecord make_record(LogLevel level, std::string_view module, std::string message) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.file = __FILE__;
    record.line = __LINE__;
    record.timestamp_ms = 1234567890;
    return record;
}

TEST(LogFormatTest, TextContainsLevelAndModule) {
    std::string line = format_text(make_record(LogLevel::Warn, "apply", "conflict in b.md"));
    EXPECT_NE(line.find("WARN"), std::string::npos);
    EXPECT_NE(line.find("[apply]"), std::string::npos);
    EXPECT_NE(line.find("conflict in b.md"), std::string::npos);
}

TEST(LogFormatTest, JsonEscapesSpecialCharacters) {
    std::string line =
        format_json(make_record(LogLevel::Error, "scan", "line1\nline2\t\"quoted\"\\"));
    EXPECT_NE(line.find("{\"ts\":1234567890"), std::string::npos);
    EXPECT_NE(line.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(line.find("\"module\":\"scan\""), std::string::npos);
    EXPECT_NE(line.find("\\n"), std::string::npos);
    EXPECT_NE(line.find("\\t"), std::string::npos);
    EXPECT_NE(line.find("\\\"quoted\\\""), std::string::npos);
    EXPECT_NE(line.find("\\\\"), std::string::npos);
}

class FileSinkTest : public TempTreeTest {};

TEST_F(FileSinkTest, CreatesAndAppends) {
    std::string log_path = (root / "migrate.log").string();
    {
        FileSink sink(log_path, false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "plan", "first"));
    }
    {
        FileSink sink(log_path, true);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Info, "apply", "second"));
    }

    std::string content = read("migrate.log");
    EXPECT_NE(content.find("[plan] first"), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"second\""), std::string::npos);
}

TEST(MultiSinkTest, FansOutToEverySink) {
    MultiSink multi;
    auto first = std::make_unique<CaptureSink>();
    auto second = std::make_unique<CaptureSink>();
    auto* first_ptr = first.get();
    auto* second_ptr = second.get();
    multi.add(std::move(first));
    multi.add(std::move(second));
    EXPECT_EQ(multi.size(), 2u);

    multi.write(make_record(LogLevel::Info, "cli", "hello"));
    EXPECT_EQ(first_ptr->records.size(), 1u);
    EXPECT_EQ(second_ptr->records.size(), 1u);
}

// ============================================================================
// Command-Line Options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    LogConfig parse(std::vector<std::string> args) {
        args.insert(args.begin(), "migrate-links");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_log_options(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, VerbosityCounts) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv", "--root", "docs"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"--verbose"}).level, LogLevel::Info);
}

TEST_F(LogOptionsTest, ExplicitLevelWinsOverVerbosity) {
    EXPECT_EQ(parse({"-vvv", "--log-level=error"}).level, LogLevel::Error);
    EXPECT_EQ(parse({"-v", "--quiet"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, FilterFileAndFormat) {
    auto config = parse({"--log-filter=plan=trace", "--log-file=run.log", "--log-format=json"});
    EXPECT_EQ(config.filter_spec, "plan=trace");
    EXPECT_EQ(config.log_file, "run.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST(LogOptionRecognitionTest, IsLogOption) {
    EXPECT_TRUE(is_log_option("-v"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_TRUE(is_log_option("-q"));
    EXPECT_FALSE(is_log_option("--root"));
    EXPECT_FALSE(is_log_option("-h"));
    EXPECT_FALSE(is_log_option("-vx"));
}

// ============================================================================
// Logger and Macros
// ============================================================================

TEST(LoggerTest, MacrosRespectLevel) {
    auto& logger = Logger::instance();
    logger.clear_sinks();
    auto capture = std::make_unique<CaptureSink>();
    auto* capture_ptr = capture.get();
    logger.add_sink(std::move(capture));
    logger.set_level(LogLevel::Info);

    DOCLINK_LOG_DEBUG("plan", "hidden " << 1);
    DOCLINK_LOG_INFO("plan", "planned " << 3 << " edits");
    DOCLINK_LOG_ERROR("apply", "failed");

    ASSERT_EQ(capture_ptr->records.size(), 2u);
    EXPECT_EQ(capture_ptr->records[0].module, "plan");
    EXPECT_EQ(capture_ptr->records[0].message, "planned 3 edits");
    EXPECT_EQ(capture_ptr->records[1].level, LogLevel::Error);

    logger.clear_sinks();
    logger.set_level(LogLevel::Warn);
}

TEST(LoggerTest, ConcurrentLogging) {
    auto& logger = Logger::instance();
    logger.clear_sinks();
    auto capture = std::make_unique<CaptureSink>();
    auto* capture_ptr = capture.get();
    logger.add_sink(std::move(capture));
    logger.set_level(LogLevel::Trace);

    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < messages_per_thread; i++) {
                logger.log(LogLevel::Info, "scan",
                           "thread-" + std::to_string(t) + "-msg-" + std::to_string(i), __FILE__,
                           __LINE__);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(capture_ptr->records.size()), num_threads * messages_per_thread);

    logger.clear_sinks();
    logger.set_level(LogLevel::Warn);
}
