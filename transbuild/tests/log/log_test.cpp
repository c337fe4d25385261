//! # Logger Unit Tests
//!
//! Filter parsing, record formatting, module scopes, file output, the
//! environment fallback for the configured level, and concurrent logging.

#include "common.hpp"
#include "log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace transbuild::log;
namespace stdfs = std::filesystem;

namespace {

class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        records.push_back({record.level, std::string(record.component),
                           std::string(record.subject), record.message});
    }
    void flush() override {}

    struct Entry {
        LogLevel level;
        std::string component;
        std::string subject;
        std::string message;
    };

    std::vector<Entry> records;
};

auto make_record(LogLevel level, std::string_view component, std::string message,
                 std::string_view subject = {}) -> LogRecord {
    LogRecord record;
    record.level = level;
    record.component = component;
    record.subject = subject;
    record.message = std::move(message);
    record.timestamp_ms = 1700000000123;
    return record;
}

} // namespace

// ============================================================================
// LogFilter
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ModuleLevelsAndDefault) {
    filter.parse("paths=trace,sched=debug,*=warn");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "paths"));
    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "sched"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "sched"));

    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "convert"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "convert"));
}

TEST_F(LogFilterTest, BareModuleNameEnablesEverything) {
    filter.parse("expand");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "expand"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "allowlist"));
}

TEST_F(LogFilterTest, OffDisablesModule) {
    filter.parse("mixed=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "mixed"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "config"));
}

TEST_F(LogFilterTest, UnknownLevelsSkipped) {
    EXPECT_FALSE(filter.parse("paths=loud,sched=debug"));

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "sched"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "paths"));
}

TEST_F(LogFilterTest, MinLevelCoversOverrides) {
    filter.parse("codegen=trace,*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

// ============================================================================
// Level Helpers
// ============================================================================

TEST(LogLevelHelpersTest, NamesRoundTrip) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                       LogLevel::Error, LogLevel::Fatal, LogLevel::Off}) {
        EXPECT_EQ(parse_level(level_name(level)), level);
    }
}

TEST(LogLevelHelpersTest, AnyCase) {
    EXPECT_EQ(parse_level("Debug"), LogLevel::Debug);
    EXPECT_EQ(parse_level("warn"), LogLevel::Warn);
}

TEST(LogLevelHelpersTest, UnknownLevel) {
    EXPECT_FALSE(parse_level("verbose").has_value());
    EXPECT_FALSE(parse_level("").has_value());
}

// ============================================================================
// Formatting
// ============================================================================

TEST(LogFormatTest, TextLayout) {
    auto text = format_text(make_record(LogLevel::Warn, "paths", "boundary at x/y"));

    // Clock part depends on the local time zone
    ASSERT_GT(text.size(), 13u);
    EXPECT_EQ(text.substr(8, 5), ".123 ");
    EXPECT_EQ(text.substr(13), "WARN  [paths] boundary at x/y");
}

TEST(LogFormatTest, TextNamesSubject) {
    auto text = format_text(make_record(LogLevel::Debug, "expand", "missing", "libfoo"));
    EXPECT_NE(text.find("DEBUG [expand] libfoo: missing"), std::string::npos);
}

TEST(LogFormatTest, JsonEscapesQuotesAndNewlines) {
    auto json = format_json(make_record(LogLevel::Error, "config", "bad \"key\"\nat line 3"));

    EXPECT_EQ(json, "{\"ts\":1700000000123,\"level\":\"ERROR\",\"component\":\"config\","
                    "\"msg\":\"bad \\\"key\\\"\\nat line 3\"}");
}

TEST(LogFormatTest, JsonSubject) {
    auto json = format_json(make_record(LogLevel::Info, "mixed", "queued", "fg"));
    EXPECT_NE(json.find("\"component\":\"mixed\",\"subject\":\"fg\",\"msg\""),
              std::string::npos);
}

// ============================================================================
// ModuleScope
// ============================================================================

TEST(ModuleScopeTest, NestsAndRestores) {
    EXPECT_TRUE(current_module().empty());
    {
        ModuleScope outer("libfoo");
        EXPECT_EQ(current_module(), "libfoo");
        {
            ModuleScope inner("libbar");
            EXPECT_EQ(current_module(), "libbar");
        }
        EXPECT_EQ(current_module(), "libfoo");
    }
    EXPECT_TRUE(current_module().empty());
}

TEST(ModuleScopeTest, PerThread) {
    ModuleScope scope("main");
    std::string seen = "unset";
    std::thread worker([&seen]() { seen = std::string(current_module()); });
    worker.join();

    EXPECT_TRUE(seen.empty());
    EXPECT_EQ(current_module(), "main");
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    stdfs::path temp_file;

    void SetUp() override {
        temp_file = stdfs::temp_directory_path() / "transbuild_log_test.log";
        stdfs::remove(temp_file);
    }

    void TearDown() override {
        stdfs::remove(temp_file);
    }

    std::string read_file() {
        std::ifstream f(temp_file);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }
};

TEST_F(FileSinkTest, WritesTextLines) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "sched", "phase deps finished"));
        sink.flush();
    }

    auto content = read_file();
    EXPECT_NE(content.find("[sched]"), std::string::npos);
    EXPECT_NE(content.find("phase deps finished"), std::string::npos);
}

TEST_F(FileSinkTest, AppendKeepsEarlierRecords) {
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "convert", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "convert", "second"));
    }

    auto content = read_file();
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormat) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Error, "codegen", "cannot write"));
    }

    auto content = read_file();
    EXPECT_EQ(content.rfind("{\"ts\":", 0), 0u);
    EXPECT_NE(content.find("\"msg\":\"cannot write\"}"), std::string::npos);
}

// ============================================================================
// MultiSink / NullSink
// ============================================================================

TEST(MultiSinkTest, FansOutToChildren) {
    MultiSink multi;
    auto first = std::make_unique<CaptureSink>();
    auto second = std::make_unique<CaptureSink>();
    auto* first_ptr = first.get();
    auto* second_ptr = second.get();
    multi.add(std::move(first));
    multi.add(std::make_unique<NullSink>());
    multi.add(std::move(second));

    multi.write(make_record(LogLevel::Info, "mixed", "queued"));

    EXPECT_EQ(multi.size(), 3u);
    ASSERT_EQ(first_ptr->records.size(), 1u);
    ASSERT_EQ(second_ptr->records.size(), 1u);
    EXPECT_EQ(second_ptr->records[0].message, "queued");
}

// ============================================================================
// Environment Fallback
// ============================================================================

class LogEnvTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("TRANSBUILD_LOG");
    }
};

TEST_F(LogEnvTest, LevelFromEnvironment) {
    setenv("TRANSBUILD_LOG", "debug", 1);
    LogConfig config;
    apply_env_overrides(config, false);

    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_TRUE(config.filter_spec.empty());
}

TEST_F(LogEnvTest, FilterFromEnvironment) {
    setenv("TRANSBUILD_LOG", "paths=trace,*=warn", 1);
    LogConfig config;
    apply_env_overrides(config, false);

    EXPECT_EQ(config.filter_spec, "paths=trace,*=warn");
}

TEST_F(LogEnvTest, UnknownLevelIgnored) {
    setenv("TRANSBUILD_LOG", "chatty", 1);
    LogConfig config;
    apply_env_overrides(config, false);

    EXPECT_EQ(config.level, LogLevel::Warn);
}

TEST_F(LogEnvTest, ExplicitLevelWins) {
    setenv("TRANSBUILD_LOG", "trace", 1);
    LogConfig config;
    config.level = LogLevel::Error;
    apply_env_overrides(config, true);

    EXPECT_EQ(config.level, LogLevel::Error);
}

// ============================================================================
// Logger
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    CaptureSink* capture = nullptr;

    void SetUp() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        auto sink = std::make_unique<CaptureSink>();
        capture = sink.get();
        logger.add_sink(std::move(sink));
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.add_sink(std::make_unique<ConsoleSink>(false));
        logger.set_filter("");
        logger.set_level(LogLevel::Warn);
    }
};

TEST_F(LoggerTest, MacroRespectsLevel) {
    Logger::instance().set_level(LogLevel::Info);

    TRANSBUILD_LOG_DEBUG("sched", "hidden");
    TRANSBUILD_LOG_INFO("sched", "phase " << "convert" << " started");

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].level, LogLevel::Info);
    EXPECT_EQ(capture->records[0].component, "sched");
    EXPECT_EQ(capture->records[0].message, "phase convert started");
    EXPECT_TRUE(capture->records[0].subject.empty());
}

TEST_F(LoggerTest, RecordsCarryModuleScope) {
    Logger::instance().set_level(LogLevel::Debug);

    {
        ModuleScope scope("libfoo");
        TRANSBUILD_LOG_DEBUG("expand", "resolved :bar");
    }
    TRANSBUILD_LOG_DEBUG("expand", "outside");

    ASSERT_EQ(capture->records.size(), 2u);
    EXPECT_EQ(capture->records[0].subject, "libfoo");
    EXPECT_TRUE(capture->records[1].subject.empty());
}

TEST_F(LoggerTest, FilterOverridesPerModule) {
    auto& logger = Logger::instance();
    logger.set_level(LogLevel::Warn);
    logger.set_filter("paths=trace");

    TRANSBUILD_LOG_TRACE("paths", "visible");
    TRANSBUILD_LOG_INFO("convert", "hidden");

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].message, "visible");
}

TEST_F(LoggerTest, ConcurrentLogging) {
    auto& logger = Logger::instance();
    logger.set_level(LogLevel::Trace);

    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < messages_per_thread; i++) {
                std::ostringstream oss;
                oss << "worker-" << t << "-module-" << i;
                logger.log(LogLevel::Info, "sched", oss.str());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(capture->records.size()), num_threads * messages_per_thread);
}

TEST(FatalTest, AbortsWithMessage) {
    EXPECT_DEATH(transbuild::fatal("sched", "broken phase order"), "broken phase order");
}
