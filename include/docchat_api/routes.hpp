#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>

#include "chat_session.hpp"
#include "config.hpp"
#include "server.hpp"

// Forward declarations
namespace docchat_core {
class RagService;
}  // namespace docchat_core

namespace docchat_api {

class Routes {
 public:
  Routes(std::shared_ptr<docchat_core::RagService> rag_service, const Config &config);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_ingest_document(const crow::request &req);
  crow::response handle_list_documents(const crow::request &req);
  crow::response handle_delete_document(const crow::request &req, const std::string &document_id);
  crow::response handle_chat(const crow::request &req);

  // Websocket chat: one session per connection
  void open_chat_session(crow::websocket::connection &conn);
  void handle_chat_message(crow::websocket::connection &conn, const std::string &data);
  void close_chat_session(crow::websocket::connection &conn);
  size_t open_chat_sessions();

  // Maps the error taxonomy onto HTTP status codes
  static int status_code_for(const std::exception &e);

 private:
  std::shared_ptr<docchat_core::RagService> rag_service_;
  Config config_;

  std::mutex sessions_mutex_;
  std::map<crow::websocket::connection *, std::unique_ptr<ChatSession>> sessions_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  crow::response create_exception_response(const std::string &handler, const std::exception &e);
};

}  // namespace docchat_api
