// STARKMOAT - Logging Tests
// Copyright (c) 2024 STARKMOAT Developers
// MIT License

#include <gtest/gtest.h>

#include <starkmoat/util/logging.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <unistd.h>

namespace starkmoat {
namespace util {
namespace {

std::string ReadAll(const std::string& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Reset();
        dir_ = std::filesystem::temp_directory_path() /
               ("starkmoat_log_test_" + std::to_string(getpid()));
        std::filesystem::create_directories(dir_);
    }
    
    void TearDown() override {
        Reset();
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }
    
    static void Reset() {
        auto& logger = Logger::Instance();
        logger.ClearSinks();
        logger.SetLevel(LogLevel::Info);
        logger.EnableAllCategories();
    }
    
    std::shared_ptr<CallbackSink> Capture() {
        auto sink = std::make_shared<CallbackSink>([this](const LogEntry& entry) {
            captured_.push_back(entry);
        });
        Logger::Instance().AddSink(sink);
        return sink;
    }
    
    std::filesystem::path dir_;
    std::vector<LogEntry> captured_;
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
    EXPECT_STREQ(LogLevelToString(LogLevel::Off), "OFF");
}

TEST_F(LoggingTest, ParseLogLevel) {
    EXPECT_EQ(ParseLogLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(ParseLogLevel("Info"), LogLevel::Info);
    EXPECT_EQ(ParseLogLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(ParseLogLevel("off"), LogLevel::Off);
    EXPECT_FALSE(ParseLogLevel("loud").has_value());
    EXPECT_FALSE(ParseLogLevel("").has_value());
}

TEST_F(LoggingTest, LoggerSingleton) {
    EXPECT_EQ(&Logger::Instance(), &Logger::Instance());
}

TEST_F(LoggingTest, LoggerAddRemoveSink) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);
    
    auto sink = std::make_shared<ConsoleSink>();
    logger.AddSink(sink);
    EXPECT_EQ(logger.SinkCount(), 1u);
    
    logger.RemoveSink(sink);
    EXPECT_EQ(logger.SinkCount(), 0u);
}

TEST_F(LoggingTest, LoggerWillLog) {
    auto& logger = Logger::Instance();
    
    EXPECT_FALSE(logger.WillLog(LogLevel::Debug, LogCategory::DEFAULT));
    EXPECT_TRUE(logger.WillLog(LogLevel::Info, LogCategory::DEFAULT));
    EXPECT_TRUE(logger.WillLog(LogLevel::Error, LogCategory::REGISTRY));
    
    logger.SetLevel(LogLevel::Trace);
    EXPECT_FALSE(logger.WillLog(LogLevel::Off, LogCategory::DEFAULT));
    
    logger.SetLevel(LogLevel::Off);
    EXPECT_FALSE(logger.WillLog(LogLevel::Fatal, LogCategory::DEFAULT));
}

TEST_F(LoggingTest, CategoryFiltering) {
    auto& logger = Logger::Instance();
    Capture();
    
    logger.EnableCategory(LogCategory::REGISTRY);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::REGISTRY));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::SIGNAL));
    
    LOG_INFO(LogCategory::SIGNAL) << "dropped";
    LOG_INFO(LogCategory::REGISTRY) << "kept";
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "kept");
    
    logger.DisableCategory(LogCategory::REGISTRY);
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::REGISTRY));
    
    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::SIGNAL));
}

TEST_F(LoggingTest, StreamMacroCapturesLocation) {
    Capture();
    
    LOG_WARN(LogCategory::NULLIFIER) << "reserved " << 3 << " times";
    
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].level, LogLevel::Warn);
    EXPECT_EQ(captured_[0].category, LogCategory::NULLIFIER);
    EXPECT_EQ(captured_[0].message, "reserved 3 times");
    EXPECT_NE(captured_[0].file.find("test_logging.cpp"), std::string::npos);
    EXPECT_GT(captured_[0].line, 0);
}

TEST_F(LoggingTest, FilteredStreamIsNotEvaluated) {
    Capture();
    int evaluations = 0;
    auto expensive = [&]() { ++evaluations; return "x"; };
    
    LOG_DEBUG(LogCategory::DEFAULT) << expensive();
    
    EXPECT_EQ(evaluations, 0);
    EXPECT_TRUE(captured_.empty());
}

TEST_F(LoggingTest, PrintfMacro) {
    Capture();
    
    LogInfoF(LogCategory::DB, "opened %s with %d keys", "registry", 7);
    LogDebugF(LogCategory::DB, "hidden %d", 1);
    
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "opened registry with 7 keys");
}

TEST_F(LoggingTest, SinkLevel) {
    auto sink = Capture();
    sink->SetLevel(LogLevel::Error);
    
    LogInfo() << "info";
    LogError() << "error";
    
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "error");
}

TEST_F(LoggingTest, FormatLogEntry) {
    LogEntry entry;
    entry.level = LogLevel::Warn;
    entry.category = LogCategory::REGISTRY;
    entry.message = "root rejected";
    entry.file = "/src/registry/rootregistry.cpp";
    entry.line = 42;
    
    LogFormat format{false, true, true, true};
    EXPECT_EQ(FormatLogEntry(entry, format),
              "[WARN ] [registry] rootregistry.cpp:42 root rejected");
    
    format = LogFormat{false, false, false, false};
    EXPECT_EQ(FormatLogEntry(entry, format), "root rejected");
    
    entry.category = LogCategory::DEFAULT;
    format = LogFormat{false, true, true, false};
    EXPECT_EQ(FormatLogEntry(entry, format), "[WARN ] root rejected");
}

TEST_F(LoggingTest, FileSinkWrites) {
    FileSink::Config config;
    config.path = (dir_ / "debug.log").string();
    config.autoFlush = true;
    config.format = LogFormat{false, true, true, false};
    
    auto sink = std::make_shared<FileSink>(config);
    ASSERT_TRUE(sink->IsOpen());
    EXPECT_EQ(sink->GetPath(), config.path);
    Logger::Instance().AddSink(sink);
    
    LOG_INFO(LogCategory::CLI) << "hello";
    
    EXPECT_EQ(ReadAll(config.path), "[INFO ] [cli] hello\n");
}

TEST_F(LoggingTest, FileSinkRotates) {
    FileSink::Config config;
    config.path = (dir_ / "rotate.log").string();
    config.autoFlush = true;
    config.maxSize = 32;
    config.maxFiles = 2;
    config.format = LogFormat{false, false, false, false};
    
    auto sink = std::make_shared<FileSink>(config);
    Logger::Instance().AddSink(sink);
    
    LogInfo() << std::string(20, 'a');
    LogInfo() << std::string(20, 'b');
    LogInfo() << std::string(20, 'c');
    LogInfo() << std::string(20, 'd');
    sink->Flush();
    
    EXPECT_EQ(ReadAll(config.path), std::string(20, 'd') + "\n");
    EXPECT_EQ(ReadAll(config.path + ".1"), std::string(20, 'c') + "\n");
    EXPECT_EQ(ReadAll(config.path + ".2"), std::string(20, 'b') + "\n");
    EXPECT_FALSE(std::filesystem::exists(config.path + ".3"));
}

TEST_F(LoggingTest, FileSinkBadPath) {
    FileSink::Config config;
    config.path = (dir_ / "missing" / "dir" / "x.log").string();
    FileSink sink(config);
    EXPECT_FALSE(sink.IsOpen());
}

TEST_F(LoggingTest, SetupLogging) {
    LogSettings settings;
    settings.level = LogLevel::Debug;
    settings.printToConsole = false;
    settings.logFile = (dir_ / "setup.log").string();
    
    EXPECT_TRUE(SetupLogging(settings));
    EXPECT_EQ(Logger::Instance().GetLevel(), LogLevel::Debug);
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
    
    settings.printToConsole = true;
    settings.logFile.clear();
    EXPECT_TRUE(SetupLogging(settings));
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
}

TEST_F(LoggingTest, SetupLoggingBadFile) {
    LogSettings settings;
    settings.printToConsole = false;
    settings.logFile = (dir_ / "missing" / "x.log").string();
    
    EXPECT_FALSE(SetupLogging(settings));
    EXPECT_EQ(Logger::Instance().SinkCount(), 0u);
}

} // namespace
} // namespace util
} // namespace starkmoat
