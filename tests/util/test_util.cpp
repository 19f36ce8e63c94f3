// ETHWALLET - Util Module Tests
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include <gtest/gtest.h>

#include <ethwallet/util/logging.h>
#include <ethwallet/util/time.h>
#include <ethwallet/util/fs.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace ethwallet {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Trace);
        sink_ = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { entries_.push_back(entry); }, LogLevel::Trace);
        Logger::Instance().AddSink(sink_);
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> entries_;
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Off), "OFF");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("WARNING"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("bogus"), LogLevel::Info);
}

TEST_F(LoggingTest, StreamMacroReachesSink) {
    LOG_INFO(LogCategory::WALLET) << "connected to chain " << 5;

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].category, LogCategory::WALLET);
    EXPECT_EQ(entries_[0].message, "connected to chain 5");
    EXPECT_GT(entries_[0].line, 0);
}

TEST_F(LoggingTest, PrintfMacro) {
    LogWarnF(LogCategory::KEYSTORE, "bad %s after %d tries", "password", 3);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Warn);
    EXPECT_EQ(entries_[0].message, "bad password after 3 tries");
}

TEST_F(LoggingTest, GlobalLevelFilters) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    EXPECT_FALSE(Logger::Instance().WillLog(LogLevel::Info));
    EXPECT_TRUE(Logger::Instance().WillLog(LogLevel::Error));

    LOG_DEBUG(LogCategory::RPC) << "dropped";
    LOG_ERROR(LogCategory::RPC) << "kept";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "kept");
}

TEST_F(LoggingTest, SinkLevelFilters) {
    sink_->SetLevel(LogLevel::Error);
    LOG_WARN(LogCategory::AUTH) << "below sink level";
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggingTest, AddRemoveSink) {
    size_t before = Logger::Instance().SinkCount();
    auto extra = std::make_shared<CallbackSink>([](const LogEntry&) {});
    Logger::Instance().AddSink(extra);
    EXPECT_EQ(Logger::Instance().SinkCount(), before + 1);
    Logger::Instance().RemoveSink(extra);
    EXPECT_EQ(Logger::Instance().SinkCount(), before);
}

TEST_F(LoggingTest, ScopedTimerLogsAtDebug) {
    {
        ETHWALLET_LOG_TIMER(LogCategory::KEYSTORE, "scrypt");
    }
    // One line on entry, one on exit
    ASSERT_EQ(entries_.size(), 2u);
    EXPECT_EQ(entries_[0].level, LogLevel::Debug);
    EXPECT_EQ(entries_[0].message, "Starting: scrypt");
    EXPECT_EQ(entries_[1].message.find("Completed: scrypt in "), 0u);
}

TEST_F(LoggingTest, FileSinkWritesLines) {
    fs::TempDirectory dir;
    fs::Path logPath = dir.GetPath() / "wallet.log";
    {
        auto fileSink = std::make_shared<FileSink>(logPath.String());
        ASSERT_TRUE(fileSink->IsOpen());
        Logger::Instance().AddSink(fileSink);
        LOG_INFO(LogCategory::DISPATCH) << "sent transfer";
        Logger::Instance().Flush();
        Logger::Instance().RemoveSink(fileSink);
    }
    std::string content = fs::ReadFile(logPath);
    EXPECT_NE(content.find("[dispatch]"), std::string::npos);
    EXPECT_NE(content.find("sent transfer"), std::string::npos);
}

TEST_F(LoggingTest, Helpers) {
    EXPECT_EQ(FixedWidth("INFO", 5), "INFO ");
    EXPECT_EQ(FixedWidth("LONGER", 3), "LON");
    EXPECT_EQ(GetBasename("/a/b/c.cpp"), "c.cpp");
    EXPECT_EQ(LogAddress("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"), "0x5aAe...eAed");
    EXPECT_EQ(LogAddress("short"), "short");
}

// ============================================================================
// Time Tests
// ============================================================================

class TimeTest : public ::testing::Test {
protected:
    void TearDown() override {
        DisableMockTime();
    }
};

TEST_F(TimeTest, FormatISO8601Millis) {
    EXPECT_EQ(FormatISO8601Millis(int64_t{1705314600000}), "2024-01-15T10:30:00.000Z");
    EXPECT_EQ(FormatISO8601Millis(int64_t{1705314600123}), "2024-01-15T10:30:00.123Z");
    EXPECT_EQ(FormatISO8601Millis(int64_t{0}), "1970-01-01T00:00:00.000Z");
}

TEST_F(TimeTest, ParseISO8601) {
    EXPECT_EQ(ParseISO8601("2024-01-15T10:30:00.000Z"), 1705314600000);
    EXPECT_EQ(ParseISO8601("2024-01-15T10:30:00Z"), 1705314600000);
    EXPECT_EQ(ParseISO8601("2024-01-15T10:30:00.5Z"), 1705314600500);
    EXPECT_EQ(ParseISO8601("2024-01-15T10:30:00.123456Z"), 1705314600123);
}

TEST_F(TimeTest, ParseISO8601Rejects) {
    EXPECT_FALSE(ParseISO8601("").has_value());
    EXPECT_FALSE(ParseISO8601("yesterday").has_value());
    EXPECT_FALSE(ParseISO8601("2024-01-15T10:30:00").has_value());
    EXPECT_FALSE(ParseISO8601("2024-01-15T10:30:00+02:00").has_value());
    EXPECT_FALSE(ParseISO8601("2024-01-15T10:30:00.Z").has_value());
    EXPECT_FALSE(ParseISO8601("2024-01-15T10:30:00Zjunk").has_value());
}

TEST_F(TimeTest, FormatParseRoundTrip) {
    int64_t now = GetTimeMillis();
    EXPECT_EQ(ParseISO8601(FormatISO8601Millis(now)), now);
}

TEST_F(TimeTest, MockTime) {
    EnableMockTime();
    SetMockTimeMillis(1705314600000);
    EXPECT_TRUE(IsMockTimeEnabled());
    EXPECT_EQ(GetTimeMillis(), 1705314600000);
    EXPECT_EQ(GetTime(), 1705314600);

    AdvanceMockTime(Milliseconds{1500});
    EXPECT_EQ(GetTimeMillis(), 1705314601500);

    // Sleeping advances the mock clock instead of blocking
    SleepMillis(250);
    EXPECT_EQ(GetMockTimeMillis(), 1705314601750);
    EXPECT_EQ(ToUnixTimeMillis(GetSystemTime()), 1705314601750);

    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_GT(GetTimeMillis(), 1705314601750);
}

// ============================================================================
// Filesystem Tests
// ============================================================================

TEST(FsTest, PathManipulation) {
    fs::Path p("/var/lib/ethwallet/keystore.json");
    EXPECT_TRUE(p.IsAbsolute());
    EXPECT_EQ(p.Filename(), "keystore.json");
    EXPECT_EQ(p.Extension(), ".json");
    EXPECT_EQ(p.Parent().String(), "/var/lib/ethwallet");
    EXPECT_EQ((fs::Path("a") / "b").String(), "a/b");
    EXPECT_FALSE(fs::Path("relative/x").IsAbsolute());
}

TEST(FsTest, SecureWriteAndRead) {
    fs::TempDirectory dir;
    ASSERT_TRUE(dir.IsValid());

    fs::Path file = dir.GetPath() / "secret.json";
    ASSERT_TRUE(fs::SecureWriteFile(file, "{\"k\":1}"));
    EXPECT_TRUE(fs::IsRegularFile(file));
    EXPECT_EQ(fs::ReadFile(file), "{\"k\":1}");
    EXPECT_EQ(fs::FileSize(file), 7u);
    EXPECT_EQ(fs::FilePermissions(file) & 0777, 0600);

    // Overwrite replaces the content
    ASSERT_TRUE(fs::SecureWriteFile(file, "x"));
    EXPECT_EQ(fs::ReadFile(file), "x");

    EXPECT_TRUE(fs::RemoveFile(file));
    EXPECT_FALSE(fs::Exists(file));
    EXPECT_EQ(fs::ReadFile(file), "");
}

TEST(FsTest, CreateDirectoriesAndList) {
    fs::TempDirectory dir;
    fs::Path nested = dir.GetPath() / "a" / "b" / "c";
    ASSERT_TRUE(fs::CreateDirectories(nested));
    EXPECT_TRUE(fs::IsDirectory(nested));
    // Existing directories are fine
    EXPECT_TRUE(fs::CreateDirectories(nested));

    ASSERT_TRUE(fs::SecureWriteFile(dir.GetPath() / "a" / "f.txt", "1"));
    auto children = fs::ListDirectory(dir.GetPath() / "a");
    EXPECT_EQ(children.size(), 2u);
}

TEST(FsTest, TempDirectoryRemovedOnDestruction) {
    fs::Path path;
    {
        fs::TempDirectory dir("ethwallet_test_");
        path = dir.GetPath();
        ASSERT_TRUE(fs::SecureWriteFile(path / "x", "data"));
        EXPECT_TRUE(fs::Exists(path));
    }
    EXPECT_FALSE(fs::Exists(path));
}

TEST(FsTest, TempDirectoryRelease) {
    fs::Path path;
    {
        fs::TempDirectory dir;
        path = dir.Release();
    }
    EXPECT_TRUE(fs::IsDirectory(path));
    EXPECT_TRUE(fs::RemoveAll(path));
    EXPECT_FALSE(fs::Exists(path));
}

TEST(FsTest, ExpandUser) {
    fs::Path home = fs::HomeDirectory();
    ASSERT_FALSE(home.Empty());
    EXPECT_EQ(fs::ExpandUser("~"), home);
    EXPECT_EQ(fs::ExpandUser("/abs/path"), fs::Path("/abs/path"));
}

} // namespace
} // namespace util
} // namespace ethwallet
