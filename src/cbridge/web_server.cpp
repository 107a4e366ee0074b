#include "web_server.hpp"

#include <sys/socket.h>

#include <boost/asio/connect.hpp>
#include <boost/system/error_code.hpp>

#include "../libcbridge/logger.hpp"

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace cbridge {

/// connection_set

void connection_set::add(int fd) {
  std::lock_guard<std::mutex> lock{mutex_};
  fds_.insert(fd);
}

void connection_set::remove(int fd) {
  std::lock_guard<std::mutex> lock{mutex_};
  fds_.erase(fd);
}

void connection_set::shutdown_all() {
  std::lock_guard<std::mutex> lock{mutex_};
  for (int fd : fds_) ::shutdown(fd, SHUT_RDWR);
}

/// web_server

web_server::web_server(
    router& rpc, session_hub& hub, const web_options& opts)
    : acceptor_{ioc_},
      ctx_{&rpc, &hub, opts.heartbeat, opts.idle_timeout, &stopping_, &live_},
      max_connections_{opts.max_connections < 1 ? 1 : opts.max_connections},
      port_{} {
  tcp::endpoint endpoint{net::ip::make_address(opts.address), opts.port};
  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(net::socket_base::reuse_address{true});
  acceptor_.bind(endpoint);
  acceptor_.listen();
  port_ = acceptor_.local_endpoint().port();
}

web_server::~web_server() {
  stop();
  for (auto& w : workers_) {
    if (w.thread.joinable()) w.thread.join();
  }
}

void web_server::reap_workers() {
  std::erase_if(workers_, [](worker& w) {
    if (!w.done->load()) return false;
    w.thread.join();
    return true;
  });
  tracked_ = workers_.size();
}

void web_server::run() {
  LOG_INFO("listening on {}:{}", acceptor_.local_endpoint().address().to_string(), port_);

  for (;;) {
    tcp::socket socket{ioc_};
    boost::system::error_code ec;
    acceptor_.accept(socket, ec);
    if (ec || stopping_.load()) break;
    reap_workers();

    // Simple back-pressure: spin until a slot opens.
    while (active_.load() >= max_connections_ && !stopping_.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds{5});
      reap_workers();
    }

    boost::system::error_code ec2;
    auto remote = socket.remote_endpoint(ec2);
    LOG_DEBUG(
        "connection from {}:{}", ec2 ? "?" : remote.address().to_string(),
        ec2 ? 0 : remote.port());
    ++active_;
    // Transfer socket ownership into the thread via native handle.
    int fd = socket.release();
    auto done = std::make_shared<std::atomic<bool>>(false);
    workers_.push_back({std::thread{[fd, done, this]() {
                          handle_connection(fd, ctx_);
                          --active_;
                          *done = true;
                        }},
                        done});
    tracked_ = workers_.size();
  }

  boost::system::error_code ec;
  acceptor_.close(ec);
  for (auto& w : workers_) {
    if (w.thread.joinable()) w.thread.join();
  }
  workers_.clear();
  tracked_ = 0;
  LOG_INFO("web server stopped");
}

void web_server::stop() {
  if (stopping_.exchange(true)) return;
  // Wake the blocking accept() with a throwaway connection, and any worker
  // blocked on its socket.
  live_.shutdown_all();
  net::io_context ioc;
  tcp::socket poke{ioc};
  boost::system::error_code ec;
  poke.connect({net::ip::make_address("127.0.0.1"), port_}, ec);
  if (ec) LOG_DEBUG("stop: wake-up connect failed: {}", ec.message());
}

}  // namespace cbridge
