#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <chrono>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <string>
#include <thread>

#include "config.hpp"
#include "http_gateway.hpp"
#include "logger.hpp"
#include "presigner.hpp"
#include "readiness.hpp"
#include "s3_client.hpp"

namespace {

std::string ConfigPath(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) return argv[i + 1];
    }
    const char* env = std::getenv("BUCKETBRIDGE_CONFIG");
    if (env != nullptr && *env != '\0') return env;
    return "config.json";
}

} // namespace

int main(int argc, char** argv) {
    // Block termination signals before any thread starts so only the waiter below sees them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::string config_path = ConfigPath(argc, argv);
    try {
        Config::Instance().Load(config_path, Config::Role::Bridge);
    } catch (const std::exception& e) {
        Logger::Fatal(std::string("Invalid configuration: ") + e.what(), "Config");
        return EXIT_FAILURE;
    }
    const auto& config = Config::Instance().Get();
    Logger::SetLevel(Logger::ParseLevel(config.log_level));

    std::unique_ptr<S3Client> store;
    std::unique_ptr<Presigner> presigner;
    try {
        Logger::Info("Initializing S3 Client (" + config.s3_endpoint + ", bucket " + config.s3_bucket + ")...");
        store = std::make_unique<S3Client>(config);
        presigner = std::make_unique<Presigner>(config);
    } catch (const std::exception& e) {
        Logger::Fatal(std::string("Failed to initialize storage client: ") + e.what());
        return EXIT_FAILURE;
    }

    httplib::Server svr;
    RegisterRoutes(svr, *store, *presigner, config);

    // Started before the startup gate so a stop request during it is honored.
    ShutdownLatch shutdown;
    std::atomic<bool> server_done{false};
    std::thread signal_waiter([&svr, &shutdown, &server_done, signals]() {
        int received = 0;
        sigwait(&signals, &received);
        if (server_done.load()) return;
        Logger::Info(std::string("Received ") + (received == SIGTERM ? "SIGTERM" : "SIGINT") + ", shutting down");
        shutdown.Trigger();
        // stop() is a no-op until listen() is running, so keep asking until it has returned.
        while (!server_done.load()) {
            svr.stop();
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    auto finish = [&](int code) {
        server_done = true;
        // Wake the waiter if no signal has arrived.
        if (!shutdown.Triggered()) pthread_kill(signal_waiter.native_handle(), SIGTERM);
        signal_waiter.join();
        return code;
    };

    RetryPolicy gate;
    gate.max_attempts = config.health_retries;
    gate.interval = std::chrono::milliseconds(config.health_backoff_ms);
    ReadinessResult ready = WaitUntilReady(
        [&store] { return store->Ping(); }, gate, "Startup",
        [&shutdown](std::chrono::milliseconds duration) { shutdown.SleepFor(duration); },
        [&shutdown] { return shutdown.Triggered(); });
    if (ready.state == ReadyState::Cancelled) {
        Logger::Info("Shutdown requested before the object store became ready", "Startup");
        return finish(EXIT_SUCCESS);
    }
    if (!ready.Ready()) {
        Logger::Fatal("Object store health check failed after " + std::to_string(ready.attempts) + " attempts", "Startup");
        return finish(EXIT_FAILURE);
    }
    if (shutdown.Triggered()) return finish(EXIT_SUCCESS);

    bool served = RunHTTPServer(svr, config);
    return finish(served ? EXIT_SUCCESS : EXIT_FAILURE);
}
