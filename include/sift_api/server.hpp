#pragma once
#include <crow.h>

#include <future>
#include <string>

namespace sift_api {
class Server {
 public:
  Server(const std::string &host, int port, unsigned int threads = 2);
  ~Server();

  // crow::SimpleApp is neither copyable nor movable
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  // Runs the app on a background thread; returns once the listener is up.
  void start();

  void stop();

  bool is_running() const {
    return running_;
  }

  const std::string &host() const {
    return host_;
  }
  int port() const {
    return port_;
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  unsigned int threads_;
  std::future<void> server_thread_future_;
  bool running_ = false;
};
}  // namespace sift_api
