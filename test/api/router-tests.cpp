#include <doctest/doctest.h>

#include <boost/json.hpp>
#include <string>
#include <utility>
#include <vector>

#include "cbridge/router.hpp"
#include "scratch.hpp"

namespace json = boost::json;
using cbridge::router;

namespace {

struct fixture {
  scratch_dir tmp;
  cbridge::state_store store{tmp.path};
  cbridge::bridge bridge{store, cbridge::bridge_config{}, cbridge::run_command};
  std::vector<std::pair<std::string, json::object>> pushed;
  router rpc{bridge, [this](const std::string& sid, const json::object& msg) {
               pushed.emplace_back(sid, msg);
             }};

  json::value call(std::string_view text) {
    auto res = rpc.handle(json::parse(text), "sess");
    REQUIRE(res.has_value());
    return *res;
  }
};

json::value tool_payload(const json::value& response) {
  const auto& content = response.at("result").at("content").as_array();
  REQUIRE(content.size() == 1);
  CHECK(content[0].at("type").as_string() == "text");
  return json::parse(content[0].at("text").as_string());
}

}  // namespace

TEST_CASE("router-initialize") {
  fixture f;
  auto r = f.call(
      R"({"jsonrpc":"2.0","id":1,"method":"initialize",
          "params":{"protocolVersion":"2025-03-26"}})");
  CHECK(r.at("jsonrpc").as_string() == "2.0");
  CHECK(r.at("id").as_int64() == 1);
  const auto& res = r.at("result");
  CHECK(res.at("protocolVersion").as_string() == "2025-03-26");
  CHECK(res.at("serverInfo").at("version").as_string() == "0.1.0");
  CHECK_FALSE(res.at("capabilities").at("tools").at("listChanged").as_bool());

  auto plain = f.call(R"({"jsonrpc":"2.0","id":2,"method":"initialize"})");
  CHECK(plain.at("result").at("protocolVersion").as_string() == "2024-11-05");
}

TEST_CASE("router-notifications-get-no-reply") {
  fixture f;
  CHECK_FALSE(f.rpc
                  .handle(
                      json::parse(
                          R"({"jsonrpc":"2.0","method":"notifications/initialized"})"),
                      "sess")
                  .has_value());
  CHECK_FALSE(
      f.rpc.handle(json::parse(R"({"jsonrpc":"2.0","method":"ping"})"), "sess")
          .has_value());
  CHECK_FALSE(
      f.rpc.handle(json::parse(R"({"jsonrpc":"2.0"})"), "sess").has_value());
}

TEST_CASE("router-batches") {
  fixture f;
  auto r = f.call(
      R"([{"jsonrpc":"2.0","id":1,"method":"ping"},
          {"jsonrpc":"2.0","method":"notifications/initialized"},
          {"jsonrpc":"2.0","id":2,"method":"resources/list"}])");
  const auto& arr = r.as_array();
  REQUIRE(arr.size() == 2);
  CHECK(arr[0].at("id").as_int64() == 1);
  CHECK(arr[0].at("result").as_object().empty());
  CHECK(arr[1].at("result").at("resources").as_array().empty());

  auto empty = f.call("[]");
  CHECK(empty.at("error").at("code").as_int64() == -32600);
  CHECK(empty.at("id").is_null());

  CHECK_FALSE(
      f.rpc
          .handle(
              json::parse(R"([{"jsonrpc":"2.0","method":"ping"}])"), "sess")
          .has_value());
}

TEST_CASE("router-error-codes") {
  fixture f;
  auto missing = f.call(R"({"jsonrpc":"2.0","id":3,"method":"nope"})");
  CHECK(missing.at("error").at("code").as_int64() == -32601);
  CHECK(missing.at("error").at("message").as_string() == "Method not found: nope");

  auto invalid = f.call("42");
  CHECK(invalid.at("error").at("code").as_int64() == -32600);
  CHECK(invalid.at("id").is_null());

  auto no_method = f.call(R"({"jsonrpc":"2.0","id":4})");
  CHECK(no_method.at("error").at("code").as_int64() == -32600);
  CHECK(no_method.at("id").as_int64() == 4);

  auto unknown_tool = f.call(
      R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"nope"}})");
  CHECK(unknown_tool.at("error").at("code").as_int64() == -32602);
  CHECK(unknown_tool.at("error").at("message").as_string() == "Unknown tool: nope");

  auto no_name = f.call(
      R"({"jsonrpc":"2.0","id":6,"method":"tools/call","params":{}})");
  CHECK(no_name.at("error").at("message").as_string() == "Missing params.name");

  auto bad_args = f.call(
      R"({"jsonrpc":"2.0","id":7,"method":"tools/call",
          "params":{"name":"ping","arguments":[1]}})");
  CHECK(bad_args.at("error").at("code").as_int64() == -32602);

  auto failing = f.call(
      R"({"jsonrpc":"2.0","id":8,"method":"tools/call",
          "params":{"name":"set_state",
                    "arguments":{"partial_update":{"phase":"bogus"}}}})");
  CHECK(failing.at("error").at("code").as_int64() == -32603);
}

TEST_CASE("router-tools-call-wraps-text") {
  fixture f;
  auto r = f.call(
      R"({"jsonrpc":"2.0","id":"a","method":"tools/call",
          "params":{"name":"ping","arguments":null}})");
  CHECK(r.at("id").as_string() == "a");
  auto payload = tool_payload(r);
  CHECK(payload.at("status").as_string() == "ok");
  CHECK(payload.at("message").as_string() == "conductor-bridge is running");

  auto listed = f.call(R"({"jsonrpc":"2.0","id":9,"method":"tools/list"})");
  bool found = false;
  for (const auto& t : listed.at("result").at("tools").as_array()) {
    if (t.at("name").as_string() != "write_artifact") continue;
    found = true;
    const auto& schema = t.at("inputSchema");
    CHECK(schema.at("type").as_string() == "object");
    CHECK_FALSE(schema.at("additionalProperties").as_bool());
    CHECK(schema.at("required").as_array().size() == 2);
  }
  CHECK(found);
}

TEST_CASE("router-progress-notifications") {
  fixture f;
  f.call(
      R"({"jsonrpc":"2.0","id":11,"method":"tools/call",
          "params":{"name":"get_state"}})");
  REQUIRE(f.pushed.size() == 2);
  CHECK(f.pushed[0].first == "sess");
  const auto& first = f.pushed[0].second;
  CHECK(first.at("method").as_string() == "notifications/message");
  CHECK(first.at("params").at("level").as_string() == "info");
  CHECK(first.at("params").at("logger").as_string() == "conductor-bridge");
  CHECK(first.at("params").at("data").at("status").as_string() == "running");
  CHECK(first.at("params").at("data").at("request_id").as_int64() == 11);
  CHECK(first.at("params").at("data").at("tool").as_string() == "get_state");
  const auto& last = f.pushed[1].second;
  CHECK(last.at("params").at("data").at("status").as_string() == "done");
  CHECK(last.at("params").at("data").at("elapsed_ms").is_int64());

  f.pushed.clear();
  f.call(
      R"({"jsonrpc":"2.0","id":12,"method":"tools/call",
          "params":{"name":"nope"}})");
  REQUIRE(f.pushed.size() == 2);
  CHECK(f.pushed[1].second.at("params").at("level").as_string() == "error");
}

TEST_CASE("router-legacy-calls") {
  fixture f;
  auto ok = f.call(R"({"method":"ping"})");
  CHECK(ok.at("result").at("status").as_string() == "ok");

  auto bad = f.call(R"({"method":"nope","params":{}})");
  CHECK(bad.at("error").as_string() == "Unknown tool: nope");
  CHECK_FALSE(bad.as_object().contains("jsonrpc"));
}
