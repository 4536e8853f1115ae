#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include "docchat_api/config.hpp"
#include "docchat_api/routes.hpp"
#include "docchat_api/server.hpp"
#include "docchat_core/embedding_client.hpp"
#include "docchat_core/generation_pipeline.hpp"
#include "docchat_core/llm/provider_factory.hpp"
#include "docchat_core/retrieval_pipeline.hpp"
#include "docchat_core/services/rag_service.hpp"
#include "docchat_core/vector_store.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main(int argc, char *argv[]) {
  try {
    std::string config_path = argc > 1 ? argv[1] : "docchatrc.json";
    Config config = Config::from_file(config_path);

    std::cout << "Starting docchat API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Provider: " << config.provider << " at " << config.provider_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Chat Model: " << config.chat_model << std::endl;
    std::cout << "Chunking: " << config.chunk_size << " chars, " << config.chunk_overlap
              << " overlap" << std::endl;

    // Initialize core components
    docchat_core::Providers providers = docchat_core::make_providers(config.provider_settings());
    auto vector_store = std::make_shared<docchat_core::VectorStore>();
    auto embedding_client = std::make_shared<docchat_core::EmbeddingClient>(
        providers.embedding, config.embedding_limits());
    auto retrieval_pipeline = std::make_shared<docchat_core::RetrievalPipeline>(
        vector_store, embedding_client, config.chunking());
    auto generation_pipeline = std::make_shared<docchat_core::GenerationPipeline>(
        providers.generation, config.chat_model);
    auto rag_service =
        std::make_shared<docchat_core::RagService>(retrieval_pipeline, generation_pipeline);

    std::string host = config.api_base_url.substr(0, config.api_base_url.find(':'));
    int port = std::stoi(config.api_base_url.substr(config.api_base_url.find(':') + 1));
    docchat_api::Server server(host, port, config.num_threads);
    docchat_api::Routes routes(rag_service, config);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "Stopping API server..." << std::endl;
    server.stop();
    std::cout << "Shutdown complete. Discarded " << rag_service->stats().chunks
              << " indexed chunks." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
