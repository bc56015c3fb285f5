#include "../include/logger.hpp"

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace tracked {
namespace logger {

namespace {

constexpr size_t kMessageBufferSize = 1024;

// Trims the directory part of __FILE__ so records stay readable.
const char* BaseName(const char* path) {
    const char* base = path;
    for (const char* p = path; *p != '\0'; ++p) {
        if (*p == '/') {
            base = p + 1;
        }
    }
    return base;
}

}  // namespace

const char* LevelName(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO: return "INFO";
        case Level::WARNING: return "WARNING";
        case Level::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Init();
    }
    if (config_.async_mode) {
        StartAsyncThread();
    }
}

Logger::~Logger() {
    StopAsyncThread();
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::Configure(const LogConfig& config) {
    // The writer thread takes mutex_ for every record, so it has to be
    // stopped before the configuration lock is held.
    StopAsyncThread();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_stream_) {
            file_stream_->close();
            file_stream_.reset();
        }
        config_ = config;
        Init();
    }
    if (config.async_mode) {
        StartAsyncThread();
    }
}

LogConfig Logger::Config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

bool Logger::ShouldLog(Level level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= config_.min_level && init_success_;
}

void Logger::Log(Level level, const char* file, const char* func, int line, const char* fmt, ...) {
    if (!ShouldLog(level)) return;

    char buffer[kMessageBufferSize];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    auto record = FormatRecord(level, file, func, line, buffer);

    bool async = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        async = config_.async_mode;
    }
    if (async) {
        Enqueue(std::move(record));
    } else {
        WriteRecord(record);
    }
}

void Logger::Flush() {
    if (async_thread_.joinable()) {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        queue_cv_.notify_one();
        drained_cv_.wait(lock, [this] { return log_queue_.empty() && in_flight_ == 0; });
    } else {
        DrainQueue();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.use_stdout) {
        std::cout.flush();
    } else if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

std::filesystem::path Logger::CurrentLogPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_log_path_;
}

// Requires mutex_.
void Logger::Init() {
    namespace fs = std::filesystem;

    current_log_path_.clear();
    if (config_.use_stdout) {
        init_success_ = true;
        return;
    }

    std::error_code ec;
    if (!fs::exists(config_.log_dir, ec)) {
        fs::create_directories(config_.log_dir, ec);
    }
    if (ec) {
        init_success_ = false;
        std::cerr << "Logger initialization failed: " << ec.message() << std::endl;
        return;
    }

    OpenNewLogFile();
    if (!init_success_) {
        std::cerr << "Logger initialization failed: cannot open "
                  << current_log_path_.string() << std::endl;
        return;
    }
    RotateLogFiles();
}

// Requires mutex_.
void Logger::RotateLogFiles() {
    namespace fs = std::filesystem;

    if (!file_stream_) return;

    file_stream_->flush();
    std::error_code ec;
    auto size = fs::file_size(current_log_path_, ec);
    if (ec || size < config_.max_file_size) {
        return;
    }

    file_stream_->close();

    // Shift <pid>.log.N to <pid>.log.N+1, dropping the oldest one. A limit
    // of 0 keeps no history, the same as 1.
    const size_t max_files = std::max<size_t>(config_.max_files, 1);
    for (size_t i = max_files; i-- > 0;) {
        auto old_path = LogPath(i);
        if (!fs::exists(old_path, ec)) continue;
        if (i + 1 == max_files) {
            fs::remove(old_path, ec);
        } else {
            fs::rename(old_path, LogPath(i + 1), ec);
        }
    }

    OpenNewLogFile();
}

std::filesystem::path Logger::LogPath(size_t index) const {
    namespace fs = std::filesystem;
    auto base_name = std::to_string(getpid()) + ".log";
    if (index == 0) return fs::path(config_.log_dir) / base_name;
    return fs::path(config_.log_dir) / (base_name + "." + std::to_string(index));
}

// Requires mutex_.
void Logger::OpenNewLogFile() {
    current_log_path_ = LogPath(0);
    file_stream_ = std::make_unique<std::ofstream>(
        current_log_path_, std::ios::out | std::ios::app);
    init_success_ = file_stream_->is_open();
}

std::string Logger::FormatRecord(Level level, const char* file, const char* func, int line,
                                 const char* message) const {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&t, &local_tm);
    char time_str[20];
    std::strftime(time_str, sizeof(time_str), "%Y%m%d%H%M%S", &local_tm);

    std::ostringstream oss;
    oss << "[" << time_str << "] "
        << "[" << LevelName(level) << "] "
        << "[" << getpid() << "] "
        << "[" << BaseName(file) << ":" << func << ":" << line << "] "
        << message << "\n";
    return oss.str();
}

void Logger::WriteRecord(const std::string& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_.use_stdout) {
        std::cout << record;
        return;
    }

    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << record;
        file_stream_->flush();
        RotateLogFiles();
    }
}

void Logger::Enqueue(std::string record) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        log_queue_.push(std::move(record));
    }
    queue_cv_.notify_one();
}

void Logger::StartAsyncThread() {
    stop_flag_ = false;
    async_thread_ = std::thread([this] { AsyncLoop(); });
}

void Logger::StopAsyncThread() {
    if (!async_thread_.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_flag_ = true;
    }
    queue_cv_.notify_one();
    async_thread_.join();
    stop_flag_ = false;

    // Records enqueued after the writer's last pass.
    DrainQueue();
}

void Logger::AsyncLoop() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (true) {
        queue_cv_.wait_for(lock,
            std::chrono::milliseconds(config_.flush_interval_ms),
            [this] { return !log_queue_.empty() || stop_flag_; });

        std::vector<std::string> batch;
        while (!log_queue_.empty()) {
            batch.push_back(std::move(log_queue_.front()));
            log_queue_.pop();
        }
        in_flight_ = batch.size();

        lock.unlock();
        for (const auto& record : batch) {
            WriteRecord(record);
        }
        lock.lock();

        in_flight_ = 0;
        drained_cv_.notify_all();

        if (stop_flag_ && log_queue_.empty()) {
            break;
        }
    }
}

void Logger::DrainQueue() {
    std::vector<std::string> batch;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        while (!log_queue_.empty()) {
            batch.push_back(std::move(log_queue_.front()));
            log_queue_.pop();
        }
    }
    for (const auto& record : batch) {
        WriteRecord(record);
    }
}

}  // namespace logger
}  // namespace tracked
