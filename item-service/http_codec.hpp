// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "item.hpp"

#include <caf/byte_span.hpp>
#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/net/http/status.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace item_service {

using http_status = caf::net::http::status;

constexpr std::string_view json_mime_type = "application/json";

constexpr std::string_view text_mime_type = "text/plain";

/// Body of the 404 response for unknown item IDs.
constexpr std::string_view item_not_found_text = "Item not found";

/// Body of the response to a delete request.
constexpr std::string_view item_deleted_text = "Item deleted";

/// A complete HTTP response, decoupled from the connection that sends it.
struct http_reply {
  http_status status = http_status::ok;
  std::string_view content_type = text_mime_type;
  std::string body;

  /// Sends this reply with a responder promise. Replies without content
  /// type go out without body and without `Content-Type` header.
  template <class Promise>
  void send(Promise& out) const {
    if (content_type.empty())
      out.respond(status);
    else
      out.respond(status, content_type, body);
  }
};

// -- identifiers --------------------------------------------------------------

/// Generates a new random (version 4) item ID in canonical form.
std::string make_item_id();

/// Parses `str` as UUID and returns its canonical (lowercase) form.
/// @returns `std::nullopt` if `str` is not a valid UUID.
std::optional<std::string> normalize_item_id(std::string_view str);

// -- request decoding ---------------------------------------------------------

/// Decodes a JSON object with the string fields "name" and "description".
/// @returns `ec::invalid_payload` on any parse or type error.
caf::expected<item_request> parse_item_request(std::string_view str);

/// Checks that `payload` is valid UTF-8 and decodes it as item request.
caf::expected<item_request> parse_item_request(caf::const_byte_span payload);

// -- reply construction -------------------------------------------------------

http_reply make_json_reply(http_status status, const item& value);

http_reply make_json_reply(http_status status, const std::vector<item>& values);

http_reply make_text_reply(http_status status, std::string_view text);

/// Creates a reply without content type and body.
http_reply make_status_reply(http_status status);

/// Maps `ec::no_such_item` to 404 and everything else to 500.
http_reply make_error_reply(const caf::error& reason);

} // namespace item_service
