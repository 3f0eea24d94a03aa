//========================================================================================
// BaseLoadMain.cpp
// - Main executable entry point
// - Includes ConfigManager.hpp for pipeline logic
// - Handles signal handling and CLI parsing
// - Optional CLI: baseload [runSeconds] [configPath]  (first arg treated as config if not numeric)
//========================================================================================

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "Module/ConfigManager.hpp"

using namespace baseload;

//========================================================================================
// Signal handling + main
//========================================================================================
static std::atomic<bool> g_shutdown_flag{false};
static void signal_handler(int) {
    g_shutdown_flag.store(true, std::memory_order_relaxed);
}

int main(int argc, char* argv[]) {
    // Register signals
    std::signal(SIGINT,  signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Logging
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    // Context
    Context ctx;
    ctx.tm = std::make_shared<ThreadManager>();

    // CLI: [runSeconds] [configPath]  (first arg treated as config if not numeric)
    double runSeconds = 0.0;
    bool runFromCli = false;
    std::string configPath = "baseload.json";
    if (argc > 1) {
        try {
            size_t pos = 0;
            runSeconds = std::stod(argv[1], &pos);
            if (pos != std::string(argv[1]).size()) {
                throw std::invalid_argument(argv[1]);
            }
            runFromCli = true;
            if (runSeconds <= 0.0) {
                spdlog::warn("Non-positive runtime provided ({}). Running until signalled.", argv[1]);
                runSeconds = 0.0;
            }
        } catch (const std::logic_error&) {
            configPath = argv[1];
            spdlog::info("Interpreting first arg as config path: {}", configPath);
        }
    }
    if (argc > 2) {
        configPath = argv[2];
    }

    try {
        ConfigManager manager(configPath, ctx);
        spdlog::set_level(spdlog::level::from_str(manager.engineConfig().logLevel));
        manager.buildPipeline();

        // No CLI runtime: config value, 0 = until signalled
        if (!runFromCli) {
            const json jSys = jobject_or_empty(manager.config(), "SystemBehavior");
            runSeconds = jvalue<double>(jSys, "run_duration_sec", 0.0);
        }
        if (runSeconds > 0.0) {
            spdlog::info("Run duration set to {} seconds", runSeconds);
        } else {
            spdlog::info("Running until SIGINT/SIGTERM");
        }

        // Validate
        if (!manager.validateAll()) {
            spdlog::critical("Validation failed.");
            return EXIT_FAILURE;
        }

        // Start
        manager.startAll();

        // Bridge signal flag into context so the loop can stop early
        std::atomic<bool> bridgeDone{false};
        std::thread signalBridge([&]() {
            while (!bridgeDone.load(std::memory_order_relaxed)) {
                if (g_shutdown_flag.load(std::memory_order_relaxed)) {
                    spdlog::warn("Shutdown signal received, requesting graceful stop.");
                    ctx.shutdown_flag.store(true, std::memory_order_relaxed);
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });

        // Main loop (time-bounded unless signal arrives)
        try {
            manager.runLoop(runSeconds);
        } catch (const std::exception&) {
            bridgeDone.store(true, std::memory_order_relaxed);
            signalBridge.join();
            manager.stopAll();
            throw;
        }

        // Teardown
        bridgeDone.store(true, std::memory_order_relaxed);
        ctx.shutdown_flag.store(true, std::memory_order_relaxed);
        if (signalBridge.joinable()) signalBridge.join();

        manager.stopAll();

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("baseload finished.");
    return EXIT_SUCCESS;
}
