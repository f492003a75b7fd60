// config.cpp
#include "config.hpp"
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <thread>

bool parse_bool(const std::string& text, bool& out) {
    std::string s(text);
    for (auto &c: s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "1" || s == "true" || s == "yes" || s == "on") { out = true; return true; }
    if (s == "0" || s == "false" || s == "no" || s == "off") { out = false; return true; }
    return false;
}

static std::uint64_t parse_unsigned(const char* name, const std::string& value, std::uint64_t max_value) {
    std::size_t used = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + ": not a number: '" + value + "'");
    }
    if (used != value.size() || value[0] == '-' || parsed > max_value) {
        throw std::invalid_argument(std::string(name) + ": out of range: '" + value + "'");
    }
    return parsed;
}

ServerConfig ServerConfig::from_env(int argc, char** argv) {
    return from_lookup([](const char* name) { return std::getenv(name); }, argc, argv);
}

ServerConfig ServerConfig::from_lookup(const std::function<const char*(const char*)>& getenv_fn,
                                       int argc, char** argv) {
    ServerConfig cfg;
    auto env = [&](const char* name) -> const char* {
        const char* v = getenv_fn(name);
        return (v && *v) ? v : nullptr;
    };

    if (const char* v = env("BIND_ADDRESS")) cfg.bind_address = v;
    if (const char* v = env("PORT")) {
        cfg.port = static_cast<unsigned short>(parse_unsigned("PORT", v, std::numeric_limits<unsigned short>::max()));
    }
    if (argc > 1) {
        cfg.port = static_cast<unsigned short>(parse_unsigned("port argument", argv[1], std::numeric_limits<unsigned short>::max()));
    }
    if (const char* v = env("IO_THREADS")) {
        cfg.io_threads = static_cast<std::size_t>(parse_unsigned("IO_THREADS", v, 1024));
    }
    if (const char* v = env("STATIC_DIR")) cfg.static_dir = v;
    if (const char* v = env("ACTIVITIES_FILE")) cfg.activities_file = v;
    if (const char* v = env("ENFORCE_CAPACITY")) {
        if (!parse_bool(v, cfg.enforce_capacity)) {
            throw std::invalid_argument(std::string("ENFORCE_CAPACITY: not a boolean: '") + v + "'");
        }
    }
    if (const char* v = env("REQUEST_TIMEOUT_SECONDS")) {
        cfg.request_timeout_seconds = static_cast<int>(parse_unsigned("REQUEST_TIMEOUT_SECONDS", v, 3600));
        if (cfg.request_timeout_seconds == 0) {
            throw std::invalid_argument("REQUEST_TIMEOUT_SECONDS: must be positive");
        }
    }

    if (const char* v = env("LOG_FILE")) cfg.logging.log_file_path = v;
    if (const char* v = env("LOG_LEVEL")) {
        if (!parse_log_level(v, cfg.logging.log_level)) {
            throw std::invalid_argument(std::string("LOG_LEVEL: unknown level: '") + v + "'");
        }
    }
    if (const char* v = env("LOG_MAX_SIZE")) {
        cfg.logging.max_size_bytes = parse_unsigned("LOG_MAX_SIZE", v, std::numeric_limits<std::uint64_t>::max());
    }
    if (const char* v = env("LOG_ROTATE_COUNT")) {
        cfg.logging.rotate_count = static_cast<int>(parse_unsigned("LOG_ROTATE_COUNT", v, 100));
    }
    if (const char* v = env("SERVICE_NAME")) cfg.logging.service_name = v;
    return cfg;
}

std::size_t ServerConfig::effective_io_threads() const {
    if (io_threads > 0) return io_threads;
    std::size_t thread_count = std::thread::hardware_concurrency();
    return thread_count < 2 ? 2 : thread_count;
}
