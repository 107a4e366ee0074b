#pragma once

#include <boost/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "cbridge/tools.hpp"

namespace cbridge {

inline constexpr std::string_view mcp_protocol_version = "2024-11-05";
inline constexpr std::string_view server_name = "conductor-bridge";
inline constexpr std::string_view server_version = "0.1.0";

/// Envelope helpers

inline boost::json::object make_result(
    const boost::json::value& id, boost::json::value result) {
  boost::json::object msg{};
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["result"] = std::move(result);
  return msg;
}

inline boost::json::object make_jsonrpc_error(
    const boost::json::value& id, int code, std::string_view message) {
  boost::json::object err{};
  err["code"] = code;
  err["message"] = message;
  boost::json::object msg{};
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["error"] = std::move(err);
  return msg;
}

// Delivers a server-initiated message to a session's push channel.
using notifier = std::function<void(
    const std::string& session_id, const boost::json::object& msg)>;

/// The MCP method router.  Transport agnostic: both the stdio loop and the
/// HTTP handlers feed it decoded payloads and serialize what comes back.
class router {
 public:
  explicit router(bridge& b, notifier notify = {});

  // A single request, a legacy `{method, params}` call or a batch.  Returns
  // nullopt when nothing should be sent back (notifications, or a batch of
  // notifications only).
  std::optional<boost::json::value> handle(
      const boost::json::value& payload, const std::string& session_id);

 private:
  std::optional<boost::json::value> handle_one(
      const boost::json::value& payload, const std::string& session_id);
  boost::json::object handle_legacy(const boost::json::object& req);
  boost::json::object call_tool(
      const boost::json::value& id, const boost::json::object& params,
      const std::string& session_id);
  void send_progress(
      const std::string& session_id, const boost::json::value& request_id,
      std::string_view tool, std::string_view status,
      std::optional<long long> elapsed_ms = std::nullopt);

  bridge* bridge_;
  notifier notify_;
};

}  // namespace cbridge
