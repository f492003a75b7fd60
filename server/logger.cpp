// logger.cpp
#include "logger.hpp"
#include <filesystem>
#include <functional>
#include <iomanip>
#include <sstream>
#include <cstdio>
#include <cctype>
#include <ctime>

namespace fs = std::filesystem;

bool parse_log_level(const std::string& text, LogLevel& out) {
    std::string level_string(text);
    for (auto &c: level_string) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (level_string == "debug") out = LogLevel::Debug;
    else if (level_string == "info") out = LogLevel::Info;
    else if (level_string == "warn" || level_string == "warning") out = LogLevel::Warn;
    else if (level_string == "error") out = LogLevel::Err;
    else return false;
    return true;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : is_initialized_(false) {
    // leave stream closed until init or first write
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (log_file_stream_.is_open()) log_file_stream_.close();
}

void Logger::init(const LoggerOptions& options) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    init_locked(options);
}

void Logger::init_locked(const LoggerOptions& options) {
    options_ = options;
    if (log_file_stream_.is_open()) log_file_stream_.close();
    is_initialized_ = true;
    if (writes_to_stderr()) return;

    fs::path dir = fs::path(options_.log_file_path).parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            std::fprintf(stderr, "logger: cannot create %s: %s\n", dir.string().c_str(), ec.message().c_str());
        }
    }
    log_file_stream_.open(options_.log_file_path, std::ios::app);
}

bool Logger::writes_to_stderr() const {
    return options_.log_file_path.empty() || options_.log_file_path == "-";
}

std::string Logger::level_to_string(LogLevel log_level) const {
    switch (log_level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Err: return "error";
        default: return "info";
    }
}

std::string Logger::timestamp_iso() const {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::time_t current_time = system_clock::to_time_t(now);
    std::tm tm;
    gmtime_r(&current_time, &tm);
    std::ostringstream time_stream;
    time_stream << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    time_stream << '.' << std::setw(3) << std::setfill('0') << ms.count() << "Z";
    return time_stream.str();
}

void Logger::rotate_if_needed_locked() {
    if (writes_to_stderr()) return;
    if (!log_file_stream_.is_open()) {
        log_file_stream_.open(options_.log_file_path, std::ios::app);
        if (!log_file_stream_.is_open()) return;
    }

    std::error_code ec;
    auto sz = fs::file_size(options_.log_file_path, ec);
    if (ec || sz < options_.max_size_bytes) return;

    log_file_stream_.close();

    // file -> file.1, file.1 -> file.2, ... keeping rotate_count files
    const std::string& path = options_.log_file_path;
    for (int i = options_.rotate_count - 1; i >= 0; --i) {
        fs::path src = (i == 0) ? fs::path(path) : fs::path(path + "." + std::to_string(i));
        fs::path dst = fs::path(path + "." + std::to_string(i + 1));
        if (!fs::exists(src, ec)) continue;
        if (fs::exists(dst, ec)) fs::remove(dst, ec);
        fs::rename(src, dst, ec);
        if (ec) {
            std::fprintf(stderr, "logger: rotate %s failed: %s\n", src.string().c_str(), ec.message().c_str());
        }
    }
    if (options_.rotate_count <= 0) fs::remove(path, ec);

    log_file_stream_.open(path, std::ios::app);
}

void Logger::log(LogLevel log_level, const std::string& log_message, const nlohmann::json& extra) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (!is_initialized_) init_locked(options_);
    if (static_cast<int>(log_level) < static_cast<int>(options_.log_level)) return;

    rotate_if_needed_locked();

    nlohmann::json log_entry;
    log_entry["timestamp"] = timestamp_iso();
    log_entry["log_level"] = level_to_string(log_level);
    log_entry["service"] = options_.service_name;
    log_entry["thread_id"] = std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    log_entry["log_message"] = log_message;
    if (!extra.is_null()) log_entry["extra"] = extra;

    // invalid UTF-8 in request data must not take the logger down
    const std::string line = log_entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (log_file_stream_.is_open()) {
        log_file_stream_ << line << "\n";
        log_file_stream_.flush();
    } else {
        std::fprintf(stderr, "%s\n", line.c_str());
    }
}

void Logger::debug(const std::string& log_message, const nlohmann::json& extra) { log(LogLevel::Debug, log_message, extra); }
void Logger::info(const std::string& log_message, const nlohmann::json& extra)  { log(LogLevel::Info,  log_message, extra); }
void Logger::warn(const std::string& log_message, const nlohmann::json& extra)  { log(LogLevel::Warn,  log_message, extra); }
void Logger::error(const std::string& log_message, const nlohmann::json& extra) { log(LogLevel::Err, log_message, extra); }
