// logger.hpp
#pragma once
#include <string>
#include <mutex>
#include <fstream>
#include <chrono>
#include <thread>
#include <cstdint>
#include <nlohmann/json.hpp>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Err = 3 };

// Parses "debug" / "info" / "warn" / "error" (case-insensitive).
// Returns false and leaves `out` untouched for anything else.
bool parse_log_level(const std::string& text, LogLevel& out);

struct LoggerOptions {
    std::string log_file_path = "logs/server.log"; // "-" writes to stderr
    LogLevel log_level = LogLevel::Info;
    std::uint64_t max_size_bytes = 10ull * 1024 * 1024; // 10MB
    int rotate_count = 5;
    std::string service_name = "activities_server";
};

class Logger {
public:
    static Logger& instance();

    // init should be called once at startup; the first log() call without it
    // falls back to the defaults above.
    void init(const LoggerOptions& options);

    void log(LogLevel log_level, const std::string& log_message, const nlohmann::json& extra = nlohmann::json());

    void debug(const std::string& log_message, const nlohmann::json& extra = nlohmann::json());
    void info(const std::string& log_message, const nlohmann::json& extra = nlohmann::json());
    void warn(const std::string& log_message, const nlohmann::json& extra = nlohmann::json());
    void error(const std::string& log_message, const nlohmann::json& extra = nlohmann::json());

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void init_locked(const LoggerOptions& options);
    std::string level_to_string(LogLevel log_level) const;
    std::string timestamp_iso() const;
    void rotate_if_needed_locked();
    bool writes_to_stderr() const;

    std::mutex file_mutex_;
    std::ofstream log_file_stream_;
    LoggerOptions options_;
    bool is_initialized_;
};
