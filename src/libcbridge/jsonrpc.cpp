// SPDX-License-Identifier: MIT
#include "cbridge/jsonrpc.hpp"

#include <fmt/format.h>
#include <re2/re2.h>

#include <system_error>

#include "logger.hpp"
#include "utils.hpp"

namespace cbridge {

namespace json = boost::json;

namespace {

json::value parse_payload(std::string_view text) {
  std::error_code ec;
  auto jv = json::parse(text, ec);
  if (ec) utils::throwf<frame_error>("invalid JSON: {}", ec.message());
  return jv;
}

bool starts_content_length(std::string_view line) {
  static const RE2 header_re{R"((?i)^\s*content-length\s*:)"};
  return RE2::PartialMatch(line, header_re);
}

}  // namespace

std::optional<frame> read_frame(std::istream& in) {
  std::string line;
  for (;;) {
    if (!std::getline(in, line)) return std::nullopt;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") != std::string::npos) break;
  }

  if (!starts_content_length(line)) {
    LOG_TRACE("line frame: {}", utils::tail(line, 200));
    return frame{framing::line, parse_payload(line)};
  }

  // Header block, up to the blank line
  long long content_length{-1};
  do {
    static const RE2 content_length_re{
      R"((?i)^\s*content-length\s*:\s*(\d+)\s*$)"};
    long long length{};
    if (RE2::FullMatch(line, content_length_re, &length))
      content_length = length;
    if (!std::getline(in, line)) return std::nullopt;
    if (!line.empty() && line.back() == '\r') line.pop_back();
  } while (!line.empty());

  if (content_length < 0)
    throw frame_error{"Missing or malformed Content-Length header"};
  if (content_length > max_frame_bytes)
    utils::throwf<frame_error>(
        "Content-Length {} exceeds the {} byte limit", content_length,
        max_frame_bytes);

  std::string body(static_cast<std::size_t>(content_length), '\0');
  if (!in.read(body.data(), static_cast<std::streamsize>(content_length)))
    return std::nullopt;
  LOG_TRACE("lsp frame: {} bytes", content_length);
  return frame{framing::lsp, parse_payload(body)};
}

std::string encode_frame(const json::value& msg, framing kind) {
  std::string text{json::serialize(msg)};
  if (kind == framing::line) return text + "\n";
  return fmt::format("Content-Length: {}\r\n\r\n{}", text.size(), text);
}

}  // namespace cbridge
