// config.hpp
#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include "logger.hpp"

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    unsigned short port = 8000;
    std::size_t io_threads = 0; // 0: hardware concurrency, at least 2
    std::string static_dir = "static";
    std::string activities_file; // empty: built-in activities
    bool enforce_capacity = false;
    int request_timeout_seconds = 30;
    LoggerOptions logging;

    // Reads the variables listed in the README; argv[1], when given,
    // overrides the port. Throws std::invalid_argument on a malformed value.
    static ServerConfig from_env(int argc, char** argv);

    // Same, with an injectable lookup so tests need not touch the environment.
    static ServerConfig from_lookup(const std::function<const char*(const char*)>& getenv_fn,
                                    int argc, char** argv);

    std::size_t effective_io_threads() const;
};

bool parse_bool(const std::string& text, bool& out);
