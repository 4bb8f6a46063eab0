/**
 * @file test_Logger.cpp
 * @brief Unit tests for the Logger, its environment configuration and helpers
 */

#include <gtest/gtest.h>
#include "ShMesh/Core/Logger.h"
#include "ShMesh/Core/ShMeshComm.h"

#include <mpi.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace shmesh {
namespace test {

namespace {

int world_rank() {
    int rank = -1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    return rank;
}

} // namespace

// Captures records through a handler with console output switched off
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::instance();
        saved_ = logger.config();
        LogConfig quiet = saved_;
        quiet.level = LogLevel::INFO;
        quiet.console = false;
        quiet.file.clear();
        logger.configure(quiet);
        logger.add_handler([this](const LogRecord& record) { captured_.push_back(record); });
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_handlers();
        logger.configure(saved_);
    }

    std::vector<LogRecord> captured_;
    LogConfig saved_;
};

TEST_F(LoggerTest, HandlerReceivesRecord) {
    SHMESH_LOG_INFO("grid built");
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].level, LogLevel::INFO);
    EXPECT_EQ(captured_[0].message, "grid built");
    EXPECT_NE(captured_[0].file.find("test_Logger.cpp"), std::string::npos);
    EXPECT_GT(captured_[0].line, 0);
    EXPECT_EQ(captured_[0].rank, world_rank());
}

TEST_F(LoggerTest, LevelFiltering) {
    Logger::instance().set_level(LogLevel::WARNING);
    SHMESH_LOG_INFO("dropped");
    SHMESH_LOG_WARNING("kept");
    SHMESH_LOG_ERROR("kept too");
    ASSERT_EQ(captured_.size(), 2u);
    EXPECT_EQ(captured_[0].level, LogLevel::WARNING);
    EXPECT_EQ(captured_[1].level, LogLevel::ERROR);

    EXPECT_FALSE(Logger::instance().is_enabled(LogLevel::INFO));
    EXPECT_TRUE(Logger::instance().is_enabled(LogLevel::ERROR));
    EXPECT_EQ(Logger::instance().config().level, LogLevel::WARNING);
}

TEST_F(LoggerTest, OffSuppressesEverything) {
    Logger::instance().set_level(LogLevel::OFF);
    SHMESH_LOG_ERROR("silent");
    EXPECT_TRUE(captured_.empty());
    EXPECT_FALSE(Logger::instance().is_enabled(LogLevel::ERROR));
}

TEST_F(LoggerTest, TimedMessage) {
    Logger::instance().log_timed(LogLevel::INFO, "build", 0.25);
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "build (elapsed: 0.250s)");
}

TEST_F(LoggerTest, MpiStatsLoggedOnRootOnly) {
    const ShMeshComm world = ShMeshComm::world();
    log_mpi_stats(world, "particles", static_cast<double>(world.rank() + 1));
    if (world.rank() == 0) {
        ASSERT_EQ(captured_.size(), 1u);
        std::ostringstream expected;
        expected << "particles over " << world.size() << " ranks: min=1, max=" << world.size();
        EXPECT_EQ(captured_[0].message.rfind(expected.str(), 0), 0u);
    } else {
        EXPECT_TRUE(captured_.empty());
    }
}

TEST_F(LoggerTest, FileOutputPerRank) {
    const std::string base = ::testing::TempDir() + "shmesh_logger_test.log";
    const std::string path = log_file_for_rank(base, world_rank());
    std::remove(path.c_str());

    LogConfig with_file = Logger::instance().config();
    with_file.file = base;
    with_file.show_time = false;
    with_file.show_rank = false;
    Logger::instance().configure(with_file);
    SHMESH_LOG_WARNING("written to file");

    LogConfig without_file = with_file;
    without_file.file.clear();
    Logger::instance().configure(without_file);

    std::ifstream in(path);
    ASSERT_TRUE(in.is_open());
    std::string line;
    std::getline(in, line);
    EXPECT_NE(line.find("WARN"), std::string::npos);
    EXPECT_NE(line.find("written to file"), std::string::npos);
    in.close();
    std::remove(path.c_str());
}

TEST(LoggerUtilTest, ParseLogLevel) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("WARN", level));
    EXPECT_EQ(level, LogLevel::WARNING);
    EXPECT_TRUE(parse_log_level("Error", level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_TRUE(parse_log_level("off", level));
    EXPECT_EQ(level, LogLevel::OFF);

    EXPECT_FALSE(parse_log_level("verbose", level));
    EXPECT_EQ(level, LogLevel::OFF);
}

TEST(LoggerUtilTest, ConfigFromEnvironment) {
    setenv("SHMESH_LOG_LEVEL", "error", 1);
    setenv("SHMESH_LOG_FILE", "run.log", 1);
    setenv("SHMESH_LOG_CONSOLE", "off", 1);
    setenv("SHMESH_LOG_SHOW_RANK", "0", 1);
    setenv("SHMESH_LOG_SHOW_TIME", "yes", 1);

    LogConfig config = LogConfig::from_environment();
    EXPECT_EQ(config.level, LogLevel::ERROR);
    EXPECT_EQ(config.file, "run.log");
    EXPECT_FALSE(config.console);
    EXPECT_FALSE(config.show_rank);
    EXPECT_TRUE(config.show_time);

    setenv("SHMESH_LOG_LEVEL", "chatty", 1);
    unsetenv("SHMESH_LOG_FILE");
    unsetenv("SHMESH_LOG_CONSOLE");
    unsetenv("SHMESH_LOG_SHOW_RANK");
    unsetenv("SHMESH_LOG_SHOW_TIME");

    config = LogConfig::from_environment();
    EXPECT_EQ(config.level, LogLevel::INFO);
    EXPECT_TRUE(config.file.empty());
    EXPECT_TRUE(config.console);
    EXPECT_TRUE(config.show_rank);

    unsetenv("SHMESH_LOG_LEVEL");
}

TEST(LoggerUtilTest, LogFileForRank) {
    EXPECT_EQ(log_file_for_rank("run.log", 3), "run_rank3.log");
    EXPECT_EQ(log_file_for_rank("/tmp/out/run.log", 0), "/tmp/out/run_rank0.log");
    EXPECT_EQ(log_file_for_rank("run", 2), "run_rank2");
    EXPECT_EQ(log_file_for_rank("./logs/run", 1), "./logs/run_rank1");
    EXPECT_EQ(log_file_for_rank("logs.d/run", 1), "logs.d/run_rank1");
    EXPECT_EQ(log_file_for_rank(".hidden", 4), ".hidden_rank4");
}

TEST(LoggerUtilTest, FormatMemorySize) {
    EXPECT_EQ(format_memory_size(512), "512 B");
    EXPECT_EQ(format_memory_size(1536), "1.50 KB");
    EXPECT_EQ(format_memory_size(2u * 1024u * 1024u), "2.00 MB");
}

TEST(LoggerUtilTest, TimerRunsFromConstruction) {
    Timer timer;
    const double first = timer.elapsed();
    EXPECT_GE(first, 0.0);
    EXPECT_GE(timer.elapsed(), first);
    EXPECT_GE(timer.elapsed_ms(), 1000.0 * first);

    timer.restart();
    EXPECT_LT(timer.elapsed(), 60.0);
}

} // namespace test
} // namespace shmesh
