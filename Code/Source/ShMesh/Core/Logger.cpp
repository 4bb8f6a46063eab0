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

/**
 * @file Logger.cpp
 * @brief Logger output, formatting and environment configuration
 */

#include "Logger.h"
#include "ShMeshComm.h"
#include "ShMeshException.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace shmesh {

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

void read_flag(const char* variable, bool& flag) {
    if (const char* value = std::getenv(variable)) {
        const std::string v = to_upper(value);
        flag = !(v == "0" || v == "OFF" || v == "FALSE" || v == "NO");
    }
}

// Applies SHMESH_LOG_* before main(); the file itself opens after MPI_Init
struct EnvironmentConfig {
    EnvironmentConfig() { Logger::instance().configure(LogConfig::from_environment()); }
};

const EnvironmentConfig environment_config;

} // anonymous namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::OFF:     return "OFF";
    }
    return "?";
}

bool parse_log_level(const std::string& name, LogLevel& level) {
    const std::string s = to_upper(name);
    if (s == "DEBUG") {
        level = LogLevel::DEBUG;
    } else if (s == "INFO") {
        level = LogLevel::INFO;
    } else if (s == "WARNING" || s == "WARN") {
        level = LogLevel::WARNING;
    } else if (s == "ERROR") {
        level = LogLevel::ERROR;
    } else if (s == "OFF") {
        level = LogLevel::OFF;
    } else {
        return false;
    }
    return true;
}

LogConfig LogConfig::from_environment() {
    LogConfig config;
    if (const char* level = std::getenv("SHMESH_LOG_LEVEL")) {
        parse_log_level(level, config.level);
    }
    if (const char* file = std::getenv("SHMESH_LOG_FILE")) {
        config.file = file;
    }
    read_flag("SHMESH_LOG_CONSOLE", config.console);
    read_flag("SHMESH_LOG_SHOW_RANK", config.show_rank);
    read_flag("SHMESH_LOG_SHOW_TIME", config.show_time);
    return config;
}

std::string log_file_for_rank(const std::string& base, int rank) {
    const std::string suffix = "_rank" + std::to_string(rank);
    const size_t slash = base.rfind('/');
    const size_t dot = base.rfind('.');
    if (dot == std::string::npos || dot == 0 ||
        (slash != std::string::npos && dot < slash + 2)) {
        return base + suffix;
    }
    return base.substr(0, dot) + suffix + base.substr(dot);
}

// ----------------------------------------------------------------------------
// Logger
// ----------------------------------------------------------------------------

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::configure(const LogConfig& config) {
    const int rank = detail::initialized_world_rank();
    std::lock_guard<std::mutex> lock(mutex_);
    const bool reopen = config.file != config_.file || !file_.is_open();
    config_ = config;
    if (reopen) {
        if (file_.is_open()) {
            file_.close();
        }
        file_pending_ = !config_.file.empty();
        if (file_pending_ && rank >= 0) {
            open_file_locked(rank);
        }
    }
}

LogConfig Logger::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.level = level;
}

bool Logger::is_enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.level != LogLevel::OFF && level >= config_.level;
}

void Logger::open_file_locked(int rank) {
    file_pending_ = false;
    const std::string name = log_file_for_rank(config_.file, rank);
    file_.open(name, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "[ShMesh] cannot open log file " << name << std::endl;
    }
}

void Logger::log(LogLevel level, const std::string& message, const char* file, int line) {
    if (level == LogLevel::OFF || !is_enabled(level)) {
        return;
    }

    LogRecord record;
    record.level = level;
    record.message = message;
    record.file = file;
    record.line = line;
    record.rank = detail::initialized_world_rank();

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_pending_ && record.rank >= 0) {
        open_file_locked(record.rank);
    }

    const std::string line_text = format_locked(record);
    if (config_.console) {
        (level >= LogLevel::WARNING ? std::cerr : std::cout) << line_text << std::flush;
    }
    if (file_.is_open()) {
        file_ << line_text << std::flush;
    }
    for (const auto& handler : handlers_) {
        handler(record);
    }
}

void Logger::log_timed(LogLevel level, const std::string& message, double elapsed_seconds) {
    std::ostringstream oss;
    oss << message << " (elapsed: " << std::fixed << std::setprecision(3) << elapsed_seconds << "s)";
    log(level, oss.str());
}

void Logger::add_handler(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
}

void Logger::clear_handlers() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
    std::cerr.flush();
    if (file_.is_open()) {
        file_.flush();
    }
}

std::string Logger::format_locked(const LogRecord& record) const {
    std::ostringstream oss;

    if (config_.show_time) {
        const auto now = std::chrono::system_clock::now();
        const std::time_t t = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;
        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);
        oss << std::put_time(&tm_buf, "%H:%M:%S") << "." << std::setfill('0') << std::setw(3)
            << ms << std::setfill(' ') << " ";
    }
    if (config_.show_rank && record.rank >= 0) {
        oss << "[R" << record.rank << "] ";
    }
    oss << std::left << std::setw(5) << log_level_name(record.level) << " " << record.message;

    #if SHMESH_DEBUG_MODE
    if (record.level >= LogLevel::WARNING && !record.file.empty()) {
        oss << "  [" << record.file << ":" << record.line << "]";
    }
    #endif

    oss << "\n";
    return oss.str();
}

// ----------------------------------------------------------------------------
// Helpers
// ----------------------------------------------------------------------------

std::string format_memory_size(size_t bytes) {
    static const char* const units[] = {"B", "KB", "MB", "GB", "TB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    double size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        size /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}

void log_mpi_stats(const ShMeshComm& comm, const std::string& context, double local_value) {
    const double min_val = comm.allreduce_min(local_value);
    const double max_val = comm.allreduce_max(local_value);
    const double avg_val = comm.allreduce_sum(local_value) / comm.size();

    if (comm.rank() != 0) {
        return;
    }

    std::ostringstream msg;
    msg << context << " over " << comm.size() << " ranks: min=" << min_val
        << ", max=" << max_val << ", avg=" << avg_val;
    if (avg_val > 0.0) {
        msg << " (imbalance " << std::fixed << std::setprecision(1)
            << 100.0 * (max_val - avg_val) / avg_val << "%)";
    }
    SHMESH_LOG_INFO(msg.str());
}

} // namespace shmesh
