#include <boost/asio.hpp>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>
#include "activity_api.hpp"
#include "activity_registry.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "seed_activities.hpp"
#include "server.hpp"
#include "static_files.hpp"

int main(int argc, char** argv) {
    ServerConfig config;
    try {
        config = ServerConfig::from_env(argc, argv);
    } catch (const std::exception& ex) {
        std::fprintf(stderr, "activities_server: configuration error: %s\n", ex.what());
        return 1;
    }

    Logger::instance().init(config.logging);
    Logger::instance().info("Logger initialized", { {"log_file", config.logging.log_file_path} });

    try {
        std::vector<Activity> seed = config.activities_file.empty()
            ? default_activities()
            : load_activities_file(config.activities_file);
        ActivityRegistry registry(std::move(seed), config.enforce_capacity);

        std::shared_ptr<const StaticFiles> static_files;
        std::error_code ec;
        if (std::filesystem::is_directory(config.static_dir, ec)) {
            static_files = std::make_shared<StaticFiles>(config.static_dir);
        } else {
            Logger::instance().warn("Static directory missing, /static disabled", { {"static_dir", config.static_dir} });
        }
        ActivityApi api(registry, static_files);

        boost::asio::io_context ioc;
        boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::make_address(config.bind_address), config.port);
        Server server(ioc, endpoint, api, std::chrono::seconds(config.request_timeout_seconds));
        server.run_accept();

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&server](const boost::system::error_code& sig_ec, int signal_number) {
            if (sig_ec) return;
            Logger::instance().info("Shutdown signal received", { {"signal", signal_number} });
            server.stop();
        });

        // run io_context on multiple threads (reactor threads)
        std::size_t thread_count = config.effective_io_threads();
        std::vector<std::thread> io_threads;
        for (std::size_t thread_index = 0; thread_index < thread_count; ++thread_index) {
            io_threads.emplace_back([&ioc, thread_index]() {
                try {
                    ioc.run();
                    Logger::instance().debug("Thread exit normally", { {"id", thread_index} });
                } catch (const std::exception& ex) {
                    Logger::instance().error("Thread exception", { {"id", thread_index}, {"what", ex.what()} });
                }
            });
        }
        Logger::instance().info("Server listening", { {"address", config.bind_address}, {"port", server.port()}, {"thread_count", static_cast<uint64_t>(thread_count)} });

        for (auto& thread_obj : io_threads) thread_obj.join();
        Logger::instance().info("All threads joined, exiting");
    } catch (const std::exception& ex) {
        Logger::instance().error("Startup failed", { {"what", ex.what()} });
        std::fprintf(stderr, "activities_server: %s\n", ex.what());
        return 1;
    }
    return 0;
}
