#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "cbridge/router.hpp"
#include "cbridge/session_hub.hpp"

namespace cbridge {

struct web_options {
  std::string address{"127.0.0.1"};
  unsigned short port{8765};  // 0 picks a free port
  int max_connections{16};
  std::chrono::milliseconds heartbeat{std::chrono::seconds{15}};
  // A keep-alive connection with no request for this long is closed.
  std::chrono::milliseconds idle_timeout{std::chrono::seconds{30}};
};

// Sockets owned by connection workers.  stop() shuts them down so workers
// blocked in a read return.
class connection_set {
 public:
  void add(int fd);
  void remove(int fd);
  void shutdown_all();

 private:
  std::mutex mutex_;
  std::set<int> fds_;
};

// What a connection worker needs from the server.
struct web_context {
  router* rpc;
  session_hub* hub;
  std::chrono::milliseconds heartbeat;
  std::chrono::milliseconds idle_timeout;
  const std::atomic<bool>* stopping;
  connection_set* live;
};

// Handle a single Beast HTTP connection. Declared here so web_handlers.cpp
// can provide the implementation that the server loop calls.
void handle_connection(int socket_fd, const web_context& ctx);

// Thread-per-connection HTTP server.  The listening socket is bound on
// construction, so port() is valid before run().
class web_server {
 public:
  web_server(router& rpc, session_hub& hub, const web_options& opts);

  web_server(const web_server&) = delete;
  web_server(web_server&&) = delete;
  web_server& operator=(const web_server&) = delete;
  web_server& operator=(web_server&&) = delete;
  ~web_server();

  unsigned short port() const { return port_; }

  // Accept connections until stop().  Joins the workers before returning.
  void run();
  // Safe to call from any thread.
  void stop();

  // Worker threads not yet joined.
  std::size_t tracked_workers() const { return tracked_.load(); }

 private:
  struct worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  // Join the workers whose connection has ended.
  void reap_workers();

  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  web_context ctx_;
  int max_connections_;
  unsigned short port_;
  std::atomic<bool> stopping_{false};
  std::atomic<int> active_{0};
  std::atomic<std::size_t> tracked_{0};
  connection_set live_;
  std::vector<worker> workers_;
};

}  // namespace cbridge
