#include <atomic>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "rag_api/config.hpp"
#include "rag_api/routes.hpp"
#include "rag_api/server.hpp"
#include "rag_core/async/service_provider.hpp"
#include "rag_core/async/worker_pool.hpp"
#include "rag_core/config/rag_config.hpp"
#include "rag_core/db/database_manager.hpp"
#include "rag_core/db/dataset_repo.hpp"
#include "rag_core/db/task_repo.hpp"
#include "rag_core/resolver/component_registry.hpp"
#include "rag_core/resolver/strategy_resolver.hpp"
#include "rag_core/services/dataset_service.hpp"
#include "rag_core/services/query_service.hpp"
#include "rag_core/services/task_service.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main(int argc, char* argv[]) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "rag_server.json";
    rag_api::ServerConfig config = rag_api::ServerConfig::from_file(config_path);

    std::cout << "Starting RAG server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Metadata DB Path: " << config.metadata_db_path << std::endl;
    std::cout << "RAG Config: " << config.rag_config_path << std::endl;
    std::cout << "Data Directory: " << config.data_dir << std::endl;
    std::cout << "Workers: " << config.num_workers
              << ", files per task: " << config.max_concurrent_files
              << ", HTTP threads: " << config.http_threads << std::endl;

    // --- 1. INITIALIZE CORE COMPONENTS ---
    std::filesystem::create_directories(config.data_dir);
    const std::filesystem::path db_path(config.metadata_db_path);
    if (db_path.has_parent_path()) {
      std::filesystem::create_directories(db_path.parent_path());
    }
    // Connections open on demand; the cap covers every thread that can hold one.
    const int pool_cap = config.http_threads + config.num_workers * config.max_concurrent_files;
    rag_core::DatabaseManager db_manager(db_path, pool_cap);

    rag_core::RagConfig rag_config = rag_core::RagConfig::from_file(config.rag_config_path);
    auto resolver = std::make_shared<rag_core::StrategyResolver>(
        rag_config, rag_core::ComponentRegistry::with_builtins(), &db_manager);
    std::cout << "Validating data processing strategies and databases..." << std::endl;
    resolver->validate_all();

    auto task_repo = std::make_shared<rag_core::IngestionTaskRepo>(db_manager);
    auto dataset_repo = std::make_shared<rag_core::DatasetRepo>(db_manager);

    auto dataset_service = std::make_shared<rag_core::DatasetService>(dataset_repo, task_repo,
                                                                      resolver, config.data_dir);
    auto query_service = std::make_shared<rag_core::QueryService>(resolver);
    auto task_service = std::make_shared<rag_core::TaskService>(task_repo);
    auto services = std::make_shared<rag_core::ServiceProvider>(
        task_repo, dataset_repo, resolver, static_cast<size_t>(config.max_concurrent_files));
    auto worker_pool = std::make_shared<rag_core::async::WorkerPool>(
        static_cast<size_t>(config.num_workers), services,
        std::chrono::milliseconds(config.worker_poll_ms));

    const int requeued = task_repo->requeue_interrupted_tasks();
    if (requeued > 0) {
      std::cout << "Requeued " << requeued << " tasks interrupted by the last shutdown" << std::endl;
    }
    const size_t created = dataset_service->create_declared_datasets();
    std::cout << "Declared datasets created: " << created << std::endl;

    rag_api::Server server({config.host(), config.port(), config.http_threads});
    rag_api::Routes routes(dataset_service, query_service, task_service, resolver);
    routes.register_routes(server);

    // --- 2. START BACKGROUND SERVICES ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.app().signal_clear();

    worker_pool->start();
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/4] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/4] Stopping worker pool to finish running tasks..." << std::endl;
    worker_pool->stop();
    worker_pool.reset();

    std::cout << "[3/4] Releasing vector stores..." << std::endl;
    resolver->clear();

    std::cout << "[4/4] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
