//! # Logger Tests
//!
//! Module filters, record formatting, command-line options, and the warnings
//! the loader and profile store emit for skipped inputs.

#include "tplid/loader/class_loader.hpp"
#include "tplid/log/log.hpp"
#include "tplid/serialize/profile_serialize.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace tplid::log;
namespace fs = std::filesystem;

// ============================================================================
// LogFilter
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ModuleAndDefault) {
    filter.parse("match=debug,*=warn");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "match"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "match"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "loader"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "loader"));
    EXPECT_EQ(filter.min_level(), LogLevel::Debug);
}

TEST_F(LogFilterTest, BareModuleEnablesTrace) {
    filter.parse("loader");
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "loader"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "corpus"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("corpus=off");
    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "corpus"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "profile"));
}

TEST(LogLevelTest, ParseAndName) {
    EXPECT_EQ(parse_level("TRACE"), LogLevel::Trace);
    EXPECT_EQ(parse_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_level("loud"), LogLevel::Info);
    EXPECT_STREQ(level_name(LogLevel::Error), "ERROR");
}

// ============================================================================
// Formatting
// ============================================================================

TEST(FormatRecordTest, JsonEscapes) {
    LogRecord record;
    record.level = LogLevel::Warn;
    record.module = "loader";
    record.message = "Skipping \"a\\b.class\"\n";
    record.file = __FILE__;
    record.line = __LINE__;
    record.timestamp_ms = 42;

    EXPECT_EQ(format_record(record, LogFormat::JSON),
              "{\"ts\":42,\"level\":\"WARN\",\"module\":\"loader\","
              "\"msg\":\"Skipping \\\"a\\\\b.class\\\"\\n\"}");
}

TEST(FormatRecordTest, TextHasLevelAndModule) {
    LogRecord record;
    record.level = LogLevel::Info;
    record.module = "profile";
    record.message = "Process library: okhttp 3.12.0";
    record.file = __FILE__;
    record.line = __LINE__;
    record.timestamp_ms = epoch_ms();

    auto line = format_record(record, LogFormat::Text);
    EXPECT_NE(line.find("INFO  [profile] Process library: okhttp 3.12.0"), std::string::npos);
}

// ============================================================================
// Command-Line Options
// ============================================================================

namespace {

auto parse_args(std::vector<std::string> args) -> LogConfig {
    std::vector<char*> argv;
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    return parse_log_options(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(LogOptionsTest, Verbosity) {
    EXPECT_EQ(parse_args({"tplid", "match", "-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse_args({"tplid", "match", "-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse_args({"tplid", "match", "-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse_args({"tplid", "match", "-q"}).level, LogLevel::Error);
}

TEST(LogOptionsTest, ExplicitOptions) {
    auto config = parse_args({"tplid", "profile", "--log-level=debug", "--log-filter=loader=trace",
                              "--log-format=json", "--log-file=/tmp/tplid.log"});
    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.filter_spec, "loader=trace");
    EXPECT_EQ(config.format, LogFormat::JSON);
    EXPECT_EQ(config.log_file, "/tmp/tplid.log");
}

TEST(LogOptionsTest, LevelOptionBeatsVerbosity) {
    EXPECT_EQ(parse_args({"tplid", "-vvv", "--log-level=error"}).level, LogLevel::Error);
}

// ============================================================================
// Logger
// ============================================================================

class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex);
        records.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    std::mutex mutex;
    std::vector<Entry> records;
};

class LoggerCaptureTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_filter("");
        auto sink = std::make_unique<CaptureSink>();
        capture = sink.get();
        logger.add_sink(std::move(sink));
        logger.set_level(LogLevel::Warn);

        dir = fs::temp_directory_path() / "tplid_log_test";
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_filter("");
        logger.set_level(LogLevel::Warn);
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    auto count(LogLevel level, const std::string& module) const -> size_t {
        size_t n = 0;
        for (const auto& r : capture->records) {
            if (r.level == level && r.module == module)
                ++n;
        }
        return n;
    }

    CaptureSink* capture = nullptr;
    fs::path dir;
};

TEST_F(LoggerCaptureTest, MacrosRespectLevel) {
    TPLID_LOG_INFO("match", "hidden " << 1);
    TPLID_LOG_WARN("match", "shown " << 2);
    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].message, "shown 2");
}

TEST_F(LoggerCaptureTest, FilterLowersModuleLevel) {
    Logger::instance().set_filter("match=debug,*=warn");
    TPLID_LOG_DEBUG("match", "visible");
    TPLID_LOG_DEBUG("loader", "hidden");
    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].module, "match");
}

TEST_F(LoggerCaptureTest, UnreadableClassFileWarned) {
    {
        std::ofstream out(dir / "Bad.class", std::ios::binary);
        out << "garbage";
    }
    tplid::loader::ClassHierarchyLoader class_loader;
    auto loaded = class_loader.load_directory(dir);
    EXPECT_EQ(loaded.errors.size(), 1u);
    EXPECT_EQ(count(LogLevel::Warn, "loader"), 1u);
}

TEST_F(LoggerCaptureTest, UnreadableProfileWarned) {
    {
        std::ofstream out(dir / "bad_1.lib", std::ios::binary);
        out << "garbage";
    }
    auto load = tplid::serialize::load_corpus(dir);
    EXPECT_EQ(load.skipped, 1u);
    EXPECT_EQ(count(LogLevel::Warn, "corpus"), 1u);
}

TEST_F(LoggerCaptureTest, ConcurrentLogging) {
    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([=]() {
            for (int i = 0; i < messages_per_thread; i++) {
                TPLID_LOG_WARN("match", "thread-" << t << "-msg-" << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(static_cast<int>(capture->records.size()), num_threads * messages_per_thread);
}
