#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "../libcbridge/logger.hpp"
#include "web_server.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace json = boost::json;

namespace cbridge {

namespace {

using request_t = http::request<http::string_body>;
using response_t = http::response<http::string_body>;

// ── Helpers ───────────────────────────────────────────────────────────────

std::string_view to_sv(beast::string_view s) { return {s.data(), s.size()}; }

response_t make_json_response(
    http::status status_code, const json::value& body,
    unsigned int http_version, bool keep_alive) {
  response_t res{status_code, http_version};
  res.set(http::field::content_type, "application/json");
  res.keep_alive(keep_alive);
  res.body() = json::serialize(body);
  res.prepare_payload();
  return res;
}

response_t make_error(
    http::status status_code, std::string_view message,
    unsigned int http_version, bool keep_alive) {
  json::object obj;
  obj["error"] = message;
  return make_json_response(status_code, obj, http_version, keep_alive);
}

std::string decode_uri(std::string_view s) {
  auto hex = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '+') {
      out += ' ';
      continue;
    }
    if (s[i] == '%' && i + 2 < s.size()) {
      int hi = hex(s[i + 1]), lo = hex(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out += static_cast<char>(hi * 16 + lo);
        i += 2;
        continue;
      }
    }
    out += s[i];
  }
  return out;
}

std::string_view target_path(std::string_view target) {
  return target.substr(0, target.find('?'));
}

std::optional<std::string> query_session_id(std::string_view target) {
  auto qpos = target.find('?');
  if (qpos == std::string_view::npos) return std::nullopt;
  auto query = target.substr(qpos + 1);
  for (std::string_view key : {"sessionId", "session_id", "mcpSessionId"}) {
    std::string_view rest = query;
    while (!rest.empty()) {
      auto amp = rest.find('&');
      auto kv = rest.substr(0, amp);
      if (kv.size() > key.size() && kv.starts_with(key) &&
          kv[key.size()] == '=') {
        auto value = decode_uri(kv.substr(key.size() + 1));
        if (!value.empty()) return value;
      }
      if (amp == std::string_view::npos) break;
      rest.remove_prefix(amp + 1);
    }
  }
  return std::nullopt;
}

std::optional<std::string> header_session_id(const request_t& req) {
  // Field lookup is case-insensitive, so MCP-Session-Id matches too.
  auto it = req.find("Mcp-Session-Id");
  if (it == req.end() || it->value().empty()) return std::nullopt;
  return std::string{to_sv(it->value())};
}

// ── Request dispatch ──────────────────────────────────────────────────────

response_t handle_post(const request_t& req, const web_context& ctx) {
  const auto version = req.version();
  const bool keep_alive = req.keep_alive();

  json::value payload = json::object{};
  if (!req.body().empty()) {
    std::error_code ec;
    payload = json::parse(req.body(), ec);
    if (ec)
      return make_json_response(
          http::status::bad_request,
          make_jsonrpc_error(nullptr, -32700, "Parse error"), version,
          keep_alive);
  }

  auto session_id = header_session_id(req).value_or(make_session_id());
  auto reply = ctx.rpc->handle(payload, session_id);

  response_t res;
  if (!reply) {
    res = response_t{http::status::accepted, version};
    res.set(http::field::content_type, "application/json");
    res.keep_alive(keep_alive);
    res.prepare_payload();
  } else {
    res = make_json_response(http::status::ok, *reply, version, keep_alive);
  }
  res.set("Mcp-Session-Id", session_id);
  return res;
}

response_t handle_delete(const request_t& req, const web_context& ctx) {
  auto session_id = header_session_id(req);
  if (!session_id) session_id = query_session_id(to_sv(req.target()));
  if (session_id && ctx.hub->close(*session_id))
    LOG_INFO("session {} deleted", *session_id);

  json::object obj;
  obj["ok"] = true;
  auto res = make_json_response(
      http::status::ok, obj, req.version(), req.keep_alive());
  if (session_id) res.set("Mcp-Session-Id", *session_id);
  return res;
}

response_t dispatch(const request_t& req, const web_context& ctx) {
  const auto version = req.version();
  const bool keep_alive = req.keep_alive();
  const auto path = target_path(to_sv(req.target()));

  // ── GET /health ──────────────────────────────────────────
  if (req.method() == http::verb::get && path == "/health") {
    json::object obj;
    obj["status"] = "ok";
    return make_json_response(http::status::ok, obj, version, keep_alive);
  }

  if (path == "/mcp") {
    switch (req.method()) {
      case http::verb::post:
        return handle_post(req, ctx);
      case http::verb::delete_:
        return handle_delete(req, ctx);
      case http::verb::get:
        return make_error(
            http::status::method_not_allowed, "Use POST /mcp for JSON-RPC",
            version, keep_alive);
      default:
        break;
    }
  }

  return make_error(http::status::not_found, "Not Found", version, keep_alive);
}

bool wants_event_stream(const request_t& req) {
  if (req.method() != http::verb::get) return false;
  if (target_path(to_sv(req.target())) != "/mcp") return false;
  return to_sv(req[http::field::accept]).find("text/event-stream") !=
         std::string_view::npos;
}

// ── Server-Sent Events ────────────────────────────────────────────────────

// Streams the session's channel until it is closed, the client goes away
// or the server stops.
void serve_events(
    beast::tcp_stream& stream, const request_t& req, const web_context& ctx) {
  auto session_id = query_session_id(to_sv(req.target()))
                        .or_else([&] { return header_session_id(req); })
                        .value_or(make_session_id());
  auto chan = ctx.hub->open(session_id);
  LOG_INFO("event stream open for {}", session_id);

  http::response<http::empty_body> res{http::status::ok, req.version()};
  res.set(http::field::content_type, "text/event-stream");
  res.set(http::field::cache_control, "no-cache");
  res.set("Mcp-Session-Id", session_id);
  res.keep_alive(true);
  res.chunked(true);
  http::response_serializer<http::empty_body> sr{res};

  boost::system::error_code ec;
  http::write_header(stream, sr, ec);
  auto send = [&](std::string_view text) {
    net::write(stream, http::make_chunk(net::buffer(text)), ec);
    return !ec;
  };

  bool alive = send(": open\n\n");
  std::string msg;
  while (alive && !ctx.stopping->load()) {
    auto st = chan->wait_pop(msg, ctx.heartbeat);
    if (st == channel::pop_status::closed) break;
    alive = st == channel::pop_status::message
                ? send("event: message\ndata: " + msg + "\n\n")
                : send(": ping\n\n");
  }
  if (alive)
    net::write(stream, http::make_chunk_last(), ec);
  else
    LOG_DEBUG("event stream for {} lost: {}", session_id, ec.message());
  // An abandoned stream ends its session.
  ctx.hub->release(session_id, chan);
  LOG_INFO("event stream closed for {}", session_id);
}

// Wait for the next request to start arriving.  False when the peer stays
// silent for the idle timeout.
bool await_request(int fd, std::chrono::milliseconds idle_timeout) {
  pollfd pfd{fd, POLLIN, 0};
  int n = ::poll(&pfd, 1, static_cast<int>(idle_timeout.count()));
  return n > 0 && (pfd.revents & POLLIN) != 0;
}

// Keeps the socket in the server's connection_set while the worker owns it.
struct live_registration {
  connection_set* live;
  int fd;
  live_registration(connection_set* l, int f) : live{l}, fd{f} { live->add(fd); }
  live_registration(const live_registration&) = delete;
  live_registration& operator=(const live_registration&) = delete;
  ~live_registration() { live->remove(fd); }
};

}  // namespace

// ── Connection handler ────────────────────────────────────────────────────

void handle_connection(int socket_fd, const web_context& ctx) {
  // Each worker thread owns its own io_context for purely synchronous use.
  net::io_context ioc;
  net::ip::tcp::socket raw_sock{ioc};
  boost::system::error_code ec;
  raw_sock.assign(net::ip::tcp::v4(), socket_fd, ec);
  if (ec) {
    ::close(socket_fd);
    return;
  }

  beast::tcp_stream stream{std::move(raw_sock)};
  // Declared after the stream so it is removed before the socket closes.
  live_registration reg{ctx.live, socket_fd};
  beast::flat_buffer buffer;

  while (!ctx.stopping->load()) {
    if (buffer.size() == 0 && !await_request(socket_fd, ctx.idle_timeout)) {
      LOG_DEBUG("closing idle connection");
      break;
    }
    request_t req;
    http::read(stream, buffer, req, ec);
    if (ec == http::error::end_of_stream || ec) break;

    LOG_INFO("{} {}", to_sv(req.method_string()), to_sv(req.target()));
    if (wants_event_stream(req)) {
      serve_events(stream, req, ctx);
      break;
    }

    response_t res;
    try {
      res = dispatch(req, ctx);
    } catch (const std::exception& e) {
      LOG_ERROR("request failed: {}", e.what());
      res = make_error(
          http::status::internal_server_error, e.what(), req.version(),
          false);
    }
    LOG_INFO("→ {}", static_cast<unsigned>(res.result_int()));
    http::write(stream, res, ec);
    if (ec || !res.keep_alive()) break;
  }

  stream.socket().shutdown(net::ip::tcp::socket::shutdown_send, ec);
}

}  // namespace cbridge
