// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file jsonrpc.hpp
 * @brief JSONRPC 2.0 message framing over blocking byte streams.
 *
 * Two framings are understood and detected per message.  LSP framing puts a
 * header block of the form @c "Content-Length: N\r\n\r\n" before exactly
 * @c N bytes of UTF-8 JSON text.  Line framing carries one JSON document
 * per line.  A reply is encoded in the framing of the request it answers,
 * so every decoded message carries its framing tag along.
 */

#include <boost/json.hpp>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>

namespace cbridge {

enum class framing { lsp, line };

// Largest LSP body read_frame will allocate for.
inline constexpr long long max_frame_bytes = 256LL * 1024 * 1024;

struct frame {
  framing kind;
  boost::json::value payload;
};

// A message was read off the stream but could not be decoded.  The stream
// is positioned after it, so the reader may carry on.
class frame_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/** @brief Read one framed JSONRPC message from @p in.
 *
 * Blank lines between messages are skipped.  A first line starting with
 * @c Content-Length: selects LSP framing; anything else is taken as one
 * line of JSON.  Returns an empty optional when @p in reaches EOF before a
 * complete message, and throws frame_error for a message that is complete
 * but malformed (bad header block, a body longer than max_frame_bytes,
 * invalid JSON).
 */
std::optional<frame> read_frame(std::istream& in);

/** @brief Serialise @p msg in the given framing.
 *
 * LSP framing prepends the @c Content-Length header; line framing appends
 * a single newline.
 */
std::string encode_frame(const boost::json::value& msg, framing kind);

}  // namespace cbridge
