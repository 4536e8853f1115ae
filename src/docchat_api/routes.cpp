#include "docchat_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "docchat_core/errors.hpp"
#include "docchat_core/services/rag_service.hpp"

namespace docchat_api {
Routes::Routes(std::shared_ptr<docchat_core::RagService> rag_service, const Config &config)
    : rag_service_(rag_service), config_(config) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/api/health")
  ([this](const crow::request &req) { return handle_health_check(req); });

  // Document indexing endpoint
  CROW_ROUTE(app, "/api/documents")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_ingest_document(req); });

  // List indexed documents endpoint
  CROW_ROUTE(app, "/api/documents")
      .methods(crow::HTTPMethod::GET)(
          [this](const crow::request &req) { return handle_list_documents(req); });

  // Delete document endpoint
  CROW_ROUTE(app, "/api/documents/<string>")
      .methods(crow::HTTPMethod::DELETE)(
          [this](const crow::request &req, const std::string &document_id) {
            return handle_delete_document(req, document_id);
          });

  // Streaming chat endpoint
  CROW_WEBSOCKET_ROUTE(app, "/api/chat/stream")
      .onopen([this](crow::websocket::connection &conn) { open_chat_session(conn); })
      .onmessage([this](crow::websocket::connection &conn, const std::string &data, bool) {
        handle_chat_message(conn, data);
      })
      .onclose([this](crow::websocket::connection &conn, const std::string &reason, auto &&...) {
        std::cout << "Chat connection closed: " << reason << std::endl;
        close_chat_session(conn);
      });

  // Buffered chat endpoint for clients without websockets
  CROW_ROUTE(app, "/api/chat").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_chat(req);
  });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  docchat_core::RagStats stats = rag_service_->stats();
  nlohmann::json response;
  response["status"] = "ok";
  response["indexed_documents"] = stats.documents;
  response["indexed_chunks"] = stats.chunks;
  return create_json_response(response);
}

crow::response Routes::handle_ingest_document(const crow::request &req) {
  try {
    auto json_body = parse_json_body(req.body);
    std::string document_id = json_body.value("document_id", "");
    std::string text = json_body.value("text", "");
    std::string api_key = json_body.value("api_key", "");
    std::cout << "Indexing document: " << document_id << " (" << text.size() << " bytes)"
              << std::endl;

    size_t chunk_count =
        rag_service_->ingest(document_id, text, config_.call_options(api_key));

    nlohmann::json response = create_success_response("Successfully indexed " + document_id);
    response["chunks_created"] = chunk_count;
    response["document_id"] = document_id;
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_exception_response("handle_ingest_document", e);
  }
}

crow::response Routes::handle_list_documents(const crow::request &req) {
  try {
    nlohmann::json documents = nlohmann::json::array();
    for (const docchat_core::DocumentRecord &record : rag_service_->list_documents()) {
      nlohmann::json document_json;
      document_json["document_id"] = record.document_id;
      document_json["chunk_count"] = record.chunk_count;
      document_json["content_hash"] = record.content_hash;
      documents.push_back(document_json);
    }
    nlohmann::json response = create_success_response("Documents retrieved successfully");
    response["data"]["documents"] = documents;
    response["data"]["count"] = documents.size();
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_exception_response("handle_list_documents", e);
  }
}

crow::response Routes::handle_delete_document(const crow::request &req,
                                              const std::string &document_id) {
  try {
    std::cout << "Deleting document: " << document_id << std::endl;
    rag_service_->delete_document(document_id);
    return create_json_response(create_success_response("Document deleted successfully"));
  } catch (const std::exception &e) {
    return create_exception_response("handle_delete_document", e);
  }
}

// Crow sends the body once the handler returns, so fragments are collected
// here and the end reason travels in the X-Generation-Status header.
crow::response Routes::handle_chat(const crow::request &req) {
  try {
    auto json_body = parse_json_body(req.body);
    std::string developer_message = json_body.value("developer_message", "");
    std::string user_message = json_body.value("user_message", "");
    std::string model = json_body.value("model", "");
    std::string api_key = json_body.value("api_key", "");
    int top_k = json_body.value("top_k", config_.top_k);

    docchat_core::TokenStream stream = rag_service_->retrieve_and_generate(
        developer_message, user_message, top_k, model, config_.call_options(api_key));

    std::string answer;
    std::string status;
    try {
      while (std::optional<std::string> fragment = stream.next()) {
        answer += *fragment;
      }
      status = docchat_core::to_string(stream.end_reason());
    } catch (const docchat_core::GenerationProviderError &e) {
      std::cerr << "Generation failed after " << answer.size() << " bytes: " << e.what()
                << std::endl;
      if (answer.empty()) {
        throw;
      }
      status = docchat_core::to_string(docchat_core::StreamEnd::Failed);
    }

    crow::response resp(200, answer);
    resp.add_header("Content-Type", "text/plain; charset=utf-8");
    resp.add_header("X-Generation-Status", status);
    return resp;
  } catch (const std::exception &e) {
    return create_exception_response("handle_chat", e);
  }
}

void Routes::open_chat_session(crow::websocket::connection &conn) {
  auto session = std::make_unique<ChatSession>(
      rag_service_, config_, [&conn](const std::string &frame) { conn.send_text(frame); });
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  sessions_[&conn] = std::move(session);
}

void Routes::handle_chat_message(crow::websocket::connection &conn, const std::string &data) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto it = sessions_.find(&conn);
  if (it == sessions_.end()) {
    std::cerr << "Chat message on a connection without a session" << std::endl;
    return;
  }
  it->second->start(data);
}

// The session is destroyed outside the lock; its destructor cancels the
// answer and joins the relay thread.
void Routes::close_chat_session(crow::websocket::connection &conn) {
  std::unique_ptr<ChatSession> session;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(&conn);
    if (it == sessions_.end()) {
      return;
    }
    session = std::move(it->second);
    sessions_.erase(it);
  }
  session->cancel();
}

size_t Routes::open_chat_sessions() {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

int Routes::status_code_for(const std::exception &e) {
  if (dynamic_cast<const docchat_core::InvalidArgumentError *>(&e) ||
      dynamic_cast<const docchat_core::ConfigurationError *>(&e) ||
      dynamic_cast<const nlohmann::json::exception *>(&e)) {
    return 400;
  }
  if (dynamic_cast<const docchat_core::NotFoundError *>(&e)) {
    return 404;
  }
  if (dynamic_cast<const docchat_core::DimensionMismatchError *>(&e)) {
    return 409;
  }
  if (dynamic_cast<const docchat_core::EmbeddingProviderError *>(&e) ||
      dynamic_cast<const docchat_core::GenerationProviderError *>(&e)) {
    return 502;
  }
  return 500;
}

crow::response Routes::create_exception_response(const std::string &handler,
                                                 const std::exception &e) {
  int status_code = status_code_for(e);
  std::cerr << "Exception in " << handler << ": " << e.what() << std::endl;
  return create_json_response(create_error_response(e.what()), status_code);
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

}  // namespace docchat_api
