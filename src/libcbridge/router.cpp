#include "cbridge/router.hpp"

#include <chrono>
#include <exception>
#include <typeinfo>
#include <utility>

#include "json_helpers.hpp"
#include "logger.hpp"

namespace cbridge {

namespace {

using steady = std::chrono::steady_clock;

long long duration_ms(steady::time_point t0) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             steady::now() - t0)
      .count();
}

json::object as_text_result(const json::object& payload) {
  json::object block;
  block["type"] = "text";
  block["text"] = pretty_print(payload);
  json::array content;
  content.push_back(std::move(block));
  json::object res;
  res["content"] = std::move(content);
  return res;
}

json::object initialize_result(const json::object& params) {
  json::value version = json::string{mcp_protocol_version};
  if (const auto* v = params.if_contains("protocolVersion");
      v && v->is_string() && !v->get_string().empty())
    version = *v;

  json::object flags;
  flags["listChanged"] = false;
  json::object capabilities;
  capabilities["tools"] = flags;
  capabilities["resources"] = flags;
  capabilities["prompts"] = flags;

  json::object server_info;
  server_info["name"] = server_name;
  server_info["version"] = server_version;

  json::object res;
  res["protocolVersion"] = std::move(version);
  res["capabilities"] = std::move(capabilities);
  res["serverInfo"] = std::move(server_info);
  return res;
}

json::object empty_list(std::string_view key) {
  json::object res;
  res[key] = json::array();
  return res;
}

}  // namespace

router::router(bridge& b, notifier notify)
    : bridge_{&b}, notify_{std::move(notify)} {}

std::optional<json::value> router::handle(
    const json::value& payload, const std::string& session_id) {
  const auto* batch = payload.if_array();
  if (!batch) return handle_one(payload, session_id);

  if (batch->empty()) return make_jsonrpc_error(nullptr, -32600, "Empty batch");

  json::array responses;
  for (const auto& item : *batch)
    if (auto r = handle_one(item, session_id)) responses.push_back(std::move(*r));
  if (responses.empty()) return std::nullopt;
  return responses;
}

std::optional<json::value> router::handle_one(
    const json::value& payload, const std::string& session_id) {
  const auto* req = payload.if_object();
  if (!req) return make_jsonrpc_error(nullptr, -32600, "Invalid Request");

  const auto* version = req->if_contains("jsonrpc");
  if (!version || !version->is_string() || version->get_string() != "2.0") {
    if (req->contains("method")) return handle_legacy(*req);
    return make_jsonrpc_error(nullptr, -32600, "Invalid Request");
  }

  const bool is_notification = !req->contains("id");
  json::value id = is_notification ? json::value(nullptr) : req->at("id");

  json::object empty_params{};
  const json::object* params = &empty_params;
  if (const auto* p = req->if_contains("params"); p && p->is_object())
    params = &p->get_object();

  auto respond = [&](json::object msg) -> std::optional<json::value> {
    if (is_notification) return std::nullopt;
    return msg;
  };

  const auto* m = req->if_contains("method");
  if (!m || !m->is_string() || m->get_string().empty())
    return respond(make_jsonrpc_error(id, -32600, "Missing method"));
  std::string_view method = m->get_string();

  LOG_DEBUG("rpc {} ({})", method, session_id);
  try {
    if (method == "initialize")
      return respond(make_result(id, initialize_result(*params)));
    if (method == "notifications/initialized") return std::nullopt;
    if (method == "ping") return respond(make_result(id, json::object{}));
    if (method == "tools/list") {
      json::object res;
      res["tools"] = bridge_->tools_list();
      return respond(make_result(id, std::move(res)));
    }
    if (method == "tools/call")
      return respond(call_tool(id, *params, session_id));
    if (method == "resources/list")
      return respond(make_result(id, empty_list("resources")));
    if (method == "prompts/list")
      return respond(make_result(id, empty_list("prompts")));
    return respond(make_jsonrpc_error(
        id, -32601, fmt::format("Method not found: {}", method)));
  } catch (const std::exception& e) {
    LOG_ERROR("{} failed: {}", method, e.what());
    return respond(make_jsonrpc_error(id, -32603, e.what()));
  }
}

json::object router::handle_legacy(const json::object& req) {
  json::object res;
  const auto* m = req.at("method").if_string();
  json::object args{};
  if (const auto* p = req.if_contains("params"); p && p->is_object())
    args = p->get_object();
  try {
    if (!m) throw std::invalid_argument{"'method' must be a string"};
    res["result"] = bridge_->call_tool(*m, args);
  } catch (const std::exception& e) {
    LOG_WARN("legacy call failed: {}", e.what());
    res["error"] = e.what();
  }
  return res;
}

json::object router::call_tool(
    const json::value& id, const json::object& params,
    const std::string& session_id) {
  const auto* name = params.if_contains("name");
  if (!name || !name->is_string() || name->get_string().empty())
    return make_jsonrpc_error(id, -32602, "Missing params.name");

  json::object arguments{};
  if (const auto* a = params.if_contains("arguments"); a && !a->is_null()) {
    if (!a->is_object())
      return make_jsonrpc_error(
          id, -32602, "params.arguments must be an object");
    arguments = a->get_object();
  }

  std::string_view tool = name->get_string();
  send_progress(session_id, id, tool, "running");
  auto t0 = steady::now();
  try {
    auto res = bridge_->call_tool(tool, arguments);
    send_progress(session_id, id, tool, "done", duration_ms(t0));
    return make_result(id, as_text_result(res));
  } catch (const unknown_tool_error& e) {
    send_progress(session_id, id, tool, "error", duration_ms(t0));
    return make_jsonrpc_error(id, -32602, e.what());
  } catch (const std::exception& e) {
    LOG_ERROR(
        "tool {} threw {}: {}", tool, utils::demangle_symbol(typeid(e).name()),
        e.what());
    send_progress(session_id, id, tool, "error", duration_ms(t0));
    return make_jsonrpc_error(id, -32603, e.what());
  }
}

void router::send_progress(
    const std::string& session_id, const json::value& request_id,
    std::string_view tool, std::string_view status,
    std::optional<long long> elapsed_ms) {
  if (!notify_) return;
  json::object data{};
  data["request_id"] = request_id;
  data["tool"] = tool;
  data["status"] = status;
  if (elapsed_ms) data["elapsed_ms"] = *elapsed_ms;
  json::object params{};
  params["level"] = status == "error" ? "error" : "info";
  params["logger"] = server_name;
  params["data"] = std::move(data);
  json::object msg{};
  msg["jsonrpc"] = "2.0";
  msg["method"] = "notifications/message";
  msg["params"] = std::move(params);
  notify_(session_id, msg);
}

}  // namespace cbridge
