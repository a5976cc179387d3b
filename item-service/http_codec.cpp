// (c) 2024, Interance GmbH & Co KG.

#include "http_codec.hpp"

#include "ec.hpp"
#include "log.hpp"

#include <caf/json_object.hpp>
#include <caf/json_value.hpp>
#include <caf/json_writer.hpp>
#include <caf/net/actor_shell.hpp>
#include <caf/net/http/responder.hpp>
#include <caf/uuid.hpp>

namespace item_service {

namespace {

template <class T>
http_reply make_json_reply_impl(http_status status, const T& value) {
  caf::json_writer writer;
  writer.skip_object_type_annotation(true);
  if (!writer.apply(value)) {
    log::error("failed to serialize a reply: {}", writer.get_error());
    return make_status_reply(http_status::internal_server_error);
  }
  return http_reply{status, json_mime_type, std::string{writer.str()}};
}

} // namespace

std::string make_item_id() {
  return to_string(caf::uuid::random());
}

std::optional<std::string> normalize_item_id(std::string_view str) {
  auto id = caf::make_uuid(str);
  if (!id)
    return std::nullopt;
  return to_string(*id);
}

caf::expected<item_request> parse_item_request(std::string_view str) {
  auto maybe_jval = caf::json_value::parse(str);
  if (!maybe_jval || !maybe_jval->is_object())
    return caf::make_error(ec::invalid_payload, "expected a JSON object");
  auto obj = maybe_jval->to_object();
  auto name = obj.value("name");
  auto description = obj.value("description");
  if (!name.is_string() || !description.is_string())
    return caf::make_error(ec::invalid_payload,
                           "name and description must be strings");
  return item_request{std::string{name.to_string()},
                      std::string{description.to_string()}};
}

caf::expected<item_request> parse_item_request(caf::const_byte_span payload) {
  if (!caf::is_valid_utf8(payload))
    return caf::make_error(ec::invalid_payload, "payload is not valid UTF-8");
  return parse_item_request(caf::to_string_view(payload));
}

http_reply make_json_reply(http_status status, const item& value) {
  return make_json_reply_impl(status, value);
}

http_reply make_json_reply(http_status status,
                           const std::vector<item>& values) {
  return make_json_reply_impl(status, values);
}

http_reply make_text_reply(http_status status, std::string_view text) {
  return http_reply{status, text_mime_type, std::string{text}};
}

http_reply make_status_reply(http_status status) {
  return http_reply{status, std::string_view{}, std::string{}};
}

http_reply make_error_reply(const caf::error& reason) {
  if (reason == ec::no_such_item)
    return make_text_reply(http_status::not_found, item_not_found_text);
  return make_status_reply(http_status::internal_server_error);
}

} // namespace item_service
