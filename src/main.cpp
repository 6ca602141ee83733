#include <iostream>
#include <thread>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <filesystem>

#include "platform.hpp"
#include "engine/config.hpp"
#include "engine/document_store.hpp"
#include "engine/model_cache.hpp"
#include "engine/index_registry.hpp"
#include "engine/query_engine.hpp"
#include "engine/service.hpp"

// Global stop signal
std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    std::cout << "\n[SemSearch] Interrupt signal (" << signum << ") received. Shutting down...\n";
    g_running = false;
}

namespace {

    void apply_environment(semsearch::engine::Config& config) {
        if (const char* dir = std::getenv("SEMSEARCH_DATA_DIR")) config.data_dir = dir;
        if (const char* endpoint = std::getenv("SEMSEARCH_OLLAMA_ENDPOINT")) config.ollama_endpoint = endpoint;
    }

}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "[SemSearch] Starting daemon (v0.1.0)...\n";

    // Setup Config Directory
    auto config_dir = semsearch::platform::system::get_config_dir();
    if (!config_dir.empty()) {
        std::filesystem::create_directories(config_dir);
    }
    auto config_path = argc > 1 ? std::filesystem::path(argv[1]) : config_dir / "config.json";
    std::cout << "[SemSearch] Config path: " << config_path << "\n";

    semsearch::engine::Config config;
    try {
        config = semsearch::engine::Config::load(config_path);
        apply_environment(config);

        auto base_dir = semsearch::platform::system::get_data_dir();
        if (base_dir.empty()) base_dir = std::filesystem::current_path(); // Fallback
        config.resolve_paths(base_dir);

        config.validate();
        std::filesystem::create_directories(config.data_dir);
        std::filesystem::create_directories(config.store_dir);
    } catch (const semsearch::Error& e) {
        std::cerr << "[SemSearch] Invalid configuration: " << e.what() << "\n";
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[SemSearch] Cannot create directories: " << e.what() << "\n";
        return 1;
    }
    std::cout << "[SemSearch] Documents: " << config.data_dir << "\n";
    std::cout << "[SemSearch] Index store: " << config.store_dir << "\n";
    std::cout << "[SemSearch] Embedding runtime: " << config.embedding_runtime << "\n";

    if (semsearch::platform::system::is_daemon_running(config.socket_name)) {
        std::cerr << "[SemSearch] Another daemon is already listening on " << config.socket_name << ".\n";
        return 1;
    }

    semsearch::engine::DirectoryDocumentStore documents(config.data_dir);

    semsearch::engine::RuntimeOptions runtime_options;
    runtime_options.models_dir = config.models_dir;
    runtime_options.ollama_endpoint = config.ollama_endpoint;
    semsearch::engine::ModelCache models(runtime_options);

    std::unique_ptr<semsearch::engine::IndexRegistry> registry;
    try {
        registry = std::make_unique<semsearch::engine::IndexRegistry>(
            semsearch::engine::RegistryOptions::from_config(config), documents, models);
        registry->scan();
    } catch (const semsearch::Error& e) {
        std::cerr << "[SemSearch] Failed to open index store: " << e.what() << "\n";
        return 1;
    }

    semsearch::engine::QueryEngine queries(*registry, models);
    semsearch::engine::Service service(config, documents, *registry, queries, models);
    service.set_shutdown_callback([]() { g_running = false; });

    auto bridge = semsearch::platform::Bridge::create();
    if (!bridge) return 1;
    bridge->set_workers(config.workers);
    bridge->set_handler([&service](const std::string& request) { return service.handle(request); });

    if (!bridge->listen(config.socket_name)) {
        return 1;
    }
    std::cout << "[SemSearch] Ready.\n";

    std::thread bridge_thread([&bridge]() { bridge->run(); });

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // Shutdown
    bridge->stop();
    if (bridge_thread.joinable()) bridge_thread.join();
    std::cout << "[SemSearch] Stopped.\n";

    return 0;
}
