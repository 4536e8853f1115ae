#include "docchat_api/server.hpp"

namespace docchat_api {
Server::Server(const std::string &host, int port, int num_threads)
    : host_(host), port_(port), num_threads_(num_threads), running_(false) {}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  server_thread_future_ = std::async(std::launch::async, [this] {
    app_.port(port_).bindaddr(host_).concurrency(num_threads_).run();
  });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
  running_ = false;
}
}  // namespace docchat_api
