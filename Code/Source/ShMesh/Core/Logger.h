/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef SHMESH_LOGGER_H
#define SHMESH_LOGGER_H

/**
 * @file Logger.h
 * @brief Rank-aware logging for the shared mesh library
 *
 * One process-wide Logger writes level-filtered lines to the console, an
 * optional per-rank file and any registered handlers. Its LogConfig is read
 * from the SHMESH_LOG_* environment variables before main() runs.
 */

#include "ShMeshConfig.h"
#include <chrono>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace shmesh {

class ShMeshComm;

enum class LogLevel : int {
    DEBUG   = 0,
    INFO    = 1,
    WARNING = 2,
    ERROR   = 3,
    OFF     = 4
};

const char* log_level_name(LogLevel level);

/**
 * @brief Parse a level name, case-insensitive ("warn" is accepted)
 * @return false, leaving level untouched, if the name is unknown
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * @brief Output settings of the Logger
 *
 * Environment variables read by from_environment():
 *   SHMESH_LOG_LEVEL      DEBUG | INFO | WARNING | ERROR | OFF
 *   SHMESH_LOG_FILE       base file name, one file per rank
 *   SHMESH_LOG_CONSOLE    0/off/false disables console output
 *   SHMESH_LOG_SHOW_RANK  0/off/false drops the rank prefix
 *   SHMESH_LOG_SHOW_TIME  0/off/false drops the time prefix
 * Unset or unparsable variables keep the defaults below.
 */
struct LogConfig {
    LogLevel level = LogLevel::INFO;
    bool console = true;
    bool show_rank = true;
    bool show_time = true;
    std::string file;

    static LogConfig from_environment();
};

/**
 * @brief "run.log" on rank 3 becomes "run_rank3.log"; no extension gets a suffix
 */
std::string log_file_for_rank(const std::string& base, int rank);

/**
 * @brief Wall-clock stopwatch, running from construction
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;

    Timer() : start_(Clock::now()) {}

    void restart() { start_ = Clock::now(); }

    /// Seconds since construction or the last restart()
    double elapsed() const {
        return std::chrono::duration<double>(Clock::now() - start_).count();
    }

    double elapsed_ms() const { return 1000.0 * elapsed(); }

private:
    Clock::time_point start_;
};

struct LogRecord {
    LogLevel level = LogLevel::INFO;
    std::string message;
    std::string file;
    int line = 0;
    int rank = -1;  // MPI_COMM_WORLD rank, -1 outside MPI_Init/MPI_Finalize
};

class Logger {
public:
    using Handler = std::function<void(const LogRecord&)>;

    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Replace the output settings
     *
     * The log file is opened right away when MPI is initialized, otherwise
     * with the first message logged after MPI_Init.
     */
    void configure(const LogConfig& config);
    LogConfig config() const;

    void set_level(LogLevel level);
    bool is_enabled(LogLevel level) const;

    void log(LogLevel level, const std::string& message,
             const char* file = "", int line = 0);

    /// Appends " (elapsed: <s>s)" with millisecond precision
    void log_timed(LogLevel level, const std::string& message, double elapsed_seconds);

    /// Handlers see every record that passes the level filter, console on or off
    void add_handler(Handler handler);
    void clear_handlers();

    void flush();

private:
    Logger() = default;

    void open_file_locked(int rank);
    std::string format_locked(const LogRecord& record) const;

    mutable std::mutex mutex_;
    LogConfig config_;
    bool file_pending_ = false;
    std::ofstream file_;
    std::vector<Handler> handlers_;
};

/**
 * @brief "1.50 MB" style byte count
 */
std::string format_memory_size(size_t bytes);

/**
 * @brief Log min/max/avg of a per-rank value on rank 0 of comm (collective)
 */
void log_mpi_stats(const ShMeshComm& comm, const std::string& context, double local_value);

#define SHMESH_LOG(level, message) \
    shmesh::Logger::instance().log(level, message, __FILE__, __LINE__)

#if SHMESH_DEBUG_MODE
    #define SHMESH_LOG_DEBUG(message) SHMESH_LOG(shmesh::LogLevel::DEBUG, message)
#else
    #define SHMESH_LOG_DEBUG(message) ((void)0)
#endif

#define SHMESH_LOG_INFO(message) SHMESH_LOG(shmesh::LogLevel::INFO, message)
#define SHMESH_LOG_WARNING(message) SHMESH_LOG(shmesh::LogLevel::WARNING, message)
#define SHMESH_LOG_ERROR(message) SHMESH_LOG(shmesh::LogLevel::ERROR, message)

} // namespace shmesh

#endif // SHMESH_LOGGER_H
