#include <doctest/doctest.h>

#include <boost/json.hpp>
#include <sstream>
#include <string>

#include "cbridge/jsonrpc.hpp"
#include "cbridge/router.hpp"
#include "scratch.hpp"
#include "stdio.hpp"

namespace json = boost::json;
using cbridge::framing;
using cbridge::read_frame;

TEST_CASE("frame-read-lsp-and-line") {
  std::string body = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";
  std::stringstream in;
  in << "\r\n"
     << "content-length: " << body.size() << "\r\n"
     << "Content-Type: application/vscode-jsonrpc\r\n\r\n"
     << body << "\n"
     << R"({"jsonrpc":"2.0","id":2,"method":"ping"})" << "\n";

  auto f1 = read_frame(in);
  REQUIRE(f1.has_value());
  CHECK(f1->kind == framing::lsp);
  CHECK(f1->payload.at("id").as_int64() == 1);

  auto f2 = read_frame(in);
  REQUIRE(f2.has_value());
  CHECK(f2->kind == framing::line);
  CHECK(f2->payload.at("id").as_int64() == 2);

  CHECK_FALSE(read_frame(in).has_value());
}

TEST_CASE("frame-errors-leave-stream-usable") {
  std::stringstream in;
  in << "{not json\n"
     << "Content-Length: x\r\n\r\n"
     << R"({"ok":true})" << "\n";
  CHECK_THROWS_AS(read_frame(in), cbridge::frame_error);
  CHECK_THROWS_AS(read_frame(in), cbridge::frame_error);
  auto f = read_frame(in);
  REQUIRE(f.has_value());
  CHECK(f->payload.at("ok").as_bool());
}

TEST_CASE("frame-truncated-body-is-eof") {
  std::stringstream in;
  in << "Content-Length: 50\r\n\r\n{\"short\":1}";
  CHECK_FALSE(read_frame(in).has_value());
}

TEST_CASE("frame-oversized-length-is-dropped") {
  std::stringstream in;
  in << "Content-Length: 9223372036854775807\r\n\r\n"
     << "Content-Length: " << cbridge::max_frame_bytes + 1 << "\r\n\r\n"
     << R"({"ok":true})" << "\n";
  CHECK_THROWS_AS(read_frame(in), cbridge::frame_error);
  CHECK_THROWS_AS(read_frame(in), cbridge::frame_error);
  auto f = read_frame(in);
  REQUIRE(f.has_value());
  CHECK(f->payload.at("ok").as_bool());

  scratch_dir tmp;
  cbridge::state_store store{tmp.path};
  cbridge::bridge b{store, cbridge::bridge_config{}, cbridge::run_command};
  cbridge::router rpc{b};
  std::stringstream requests;
  requests << "Content-Length: 99999999999\r\n\r\n"
           << R"({"jsonrpc":"2.0","id":7,"method":"ping"})" << "\n";
  std::stringstream out;
  cbridge::run_stdio_server(rpc, requests, out);

  std::stringstream replies{out.str()};
  auto r = read_frame(replies);
  REQUIRE(r.has_value());
  CHECK(r->payload.at("id").as_int64() == 7);
  CHECK_FALSE(read_frame(replies).has_value());
}

TEST_CASE("frame-encode") {
  json::value msg = json::parse(R"({"a":1})");
  CHECK(cbridge::encode_frame(msg, framing::line) == "{\"a\":1}\n");
  CHECK(
      cbridge::encode_frame(msg, framing::lsp) ==
      "Content-Length: 7\r\n\r\n{\"a\":1}");
}

TEST_CASE("stdio-server-answers-in-arrival-framing") {
  scratch_dir tmp;
  cbridge::state_store store{tmp.path};
  cbridge::bridge b{store, cbridge::bridge_config{}, cbridge::run_command};
  cbridge::router rpc{b};

  std::string init =
      R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})";
  std::stringstream in;
  in << "Content-Length: " << init.size() << "\r\n\r\n" << init;
  in << R"({"jsonrpc":"2.0","method":"notifications/initialized"})" << "\n";
  in << "garbage that is not json\n";
  in << R"({"jsonrpc":"2.0","id":"two","method":"tools/list"})" << "\n";
  std::stringstream out;

  cbridge::run_stdio_server(rpc, in, out);

  std::stringstream replies{out.str()};
  auto r1 = read_frame(replies);
  REQUIRE(r1.has_value());
  CHECK(r1->kind == framing::lsp);
  CHECK(r1->payload.at("id").as_int64() == 1);
  CHECK(
      r1->payload.at("result").at("serverInfo").at("name").as_string() ==
      "conductor-bridge");

  auto r2 = read_frame(replies);
  REQUIRE(r2.has_value());
  CHECK(r2->kind == framing::line);
  CHECK(r2->payload.at("id").as_string() == "two");
  CHECK(r2->payload.at("result").at("tools").as_array().size() == 22);

  CHECK_FALSE(read_frame(replies).has_value());
}
