#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace tracked {
namespace logger {

enum class Level {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

/**
 * @brief Returns the upper-case name printed for a level.
 */
const char* LevelName(Level level);

struct LogConfig {
    std::string log_dir = "/tmp/.tracked_map_log";
    bool use_stdout = false;
    Level min_level = Level::INFO;
    size_t max_file_size = 10 * 1024 * 1024;  // 10MB
    size_t max_files = 5;
    bool async_mode = true;
    size_t flush_interval_ms = 1000;
};

/**
 * @brief Process-wide leveled logger.
 *
 * Records go either to stdout or to `<log_dir>/<pid>.log`, which is rotated
 * once it grows past `max_file_size`. In async mode a background thread
 * drains a queue of formatted records; otherwise records are written inline.
 *
 * Configure() is expected to run before other threads start logging.
 */
class Logger {
public:
    static Logger& Instance();

    /**
     * @brief Replaces the active configuration.
     *
     * Pending async records are flushed under the old configuration before
     * the new one takes effect.
     */
    void Configure(const LogConfig& config);

    LogConfig Config() const;

    /**
     * @brief Whether a record at the given level would be emitted.
     */
    bool ShouldLog(Level level) const;

    /**
     * @brief Formats and emits a printf-style record.
     *
     * Messages longer than the internal buffer are truncated.
     */
    void Log(Level level, const char* file, const char* func, int line, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 6, 7)))
#endif
        ;

    /**
     * @brief Blocks until every queued record has been written.
     */
    void Flush();

    /**
     * @brief Path of the file currently written, empty in stdout mode.
     */
    std::filesystem::path CurrentLogPath() const;

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();

    void Init();
    void RotateLogFiles();
    std::filesystem::path LogPath(size_t index) const;
    void OpenNewLogFile();
    std::string FormatRecord(Level level, const char* file, const char* func, int line,
                             const char* message) const;
    void WriteRecord(const std::string& record);
    void Enqueue(std::string record);
    void StartAsyncThread();
    void StopAsyncThread();
    void AsyncLoop();
    void DrainQueue();

    LogConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    std::atomic<bool> init_success_{false};
    mutable std::mutex mutex_;
    std::filesystem::path current_log_path_;

    // Async writer state
    std::queue<std::string> log_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable drained_cv_;
    size_t in_flight_ = 0;
    std::thread async_thread_;
    std::atomic<bool> stop_flag_{false};
};

}  // namespace logger
}  // namespace tracked

#define TRACKED_LOG_DEBUG(fmt, ...) \
    ::tracked::logger::Logger::Instance().Log(::tracked::logger::Level::DEBUG, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)

#define TRACKED_LOG_INFO(fmt, ...) \
    ::tracked::logger::Logger::Instance().Log(::tracked::logger::Level::INFO, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)

#define TRACKED_LOG_WARNING(fmt, ...) \
    ::tracked::logger::Logger::Instance().Log(::tracked::logger::Level::WARNING, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)

#define TRACKED_LOG_ERROR(fmt, ...) \
    ::tracked::logger::Logger::Instance().Log(::tracked::logger::Level::ERROR, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)
