// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "database_pool.hpp"
#include "http_codec.hpp"
#include "item_handler.hpp"
#include "log.hpp"

#include <caf/net/actor_shell.hpp>
#include <caf/net/http/responder.hpp>

#include <string>
#include <utility>

namespace item_service {

/// Bridges between HTTP requests and the item handler.
///
/// Path IDs and request bodies are validated here, before any request reaches
/// the database. A malformed ID wins over a malformed body.
///
/// `Responder` is usually `caf::net::http::responder`. It must provide
/// `payload()`, `self()` and `to_promise() &&`; the promise must provide
/// `respond(status)` and `respond(status, content_type, body)`.
class http_server {
public:
  using responder = caf::net::http::responder;

  explicit http_server(database_pool_ptr pool) : handler_(std::move(pool)) {
    // nop
  }

  /// POST /items
  template <class Responder>
  void create(Responder& res) {
    auto req = parse_item_request(res.payload());
    if (!req) {
      log::debug("rejected POST /items: {}", req.error());
      reply_now(res, make_status_reply(http_status::bad_request));
      return;
    }
    auto* self = res.self();
    handler_.create(self, std::move(*req), reply_later(res));
  }

  /// GET /items
  template <class Responder>
  void list(Responder& res) {
    auto* self = res.self();
    handler_.list(self, reply_later(res));
  }

  /// GET /items/<id>
  template <class Responder>
  void get(Responder& res, const std::string& key) {
    auto id = normalize_item_id(key);
    if (!id) {
      reply_now(res, make_text_reply(http_status::not_found,
                                     item_not_found_text));
      return;
    }
    auto* self = res.self();
    handler_.get(self, std::move(*id), reply_later(res));
  }

  /// PUT /items/<id>
  template <class Responder>
  void update(Responder& res, const std::string& key) {
    auto id = normalize_item_id(key);
    if (!id) {
      reply_now(res, make_text_reply(http_status::not_found,
                                     item_not_found_text));
      return;
    }
    auto req = parse_item_request(res.payload());
    if (!req) {
      log::debug("rejected PUT /items/{}: {}", key, req.error());
      reply_now(res, make_status_reply(http_status::bad_request));
      return;
    }
    auto* self = res.self();
    handler_.update(self, std::move(*id), std::move(*req), reply_later(res));
  }

  /// DELETE /items/<id>
  template <class Responder>
  void del(Responder& res, const std::string& key) {
    auto id = normalize_item_id(key);
    if (!id) {
      reply_now(res, make_text_reply(http_status::not_found,
                                     item_not_found_text));
      return;
    }
    auto* self = res.self();
    handler_.del(self, std::move(*id), reply_later(res));
  }

private:
  // Returns a continuation that sends the reply via `res` once it is ready.
  template <class Responder>
  static auto reply_later(Responder& res) {
    return [prom = std::move(res).to_promise()](
             const http_reply& reply) mutable { reply.send(prom); };
  }

  template <class Responder>
  static void reply_now(Responder& res, const http_reply& reply) {
    reply_later(res)(reply);
  }

  item_handler handler_;
};

} // namespace item_service
