// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "database_pool.hpp"
#include "http_codec.hpp"
#include "item.hpp"
#include "types.hpp"

#include <caf/error.hpp>
#include <caf/timespan.hpp>

#include <string>
#include <utility>
#include <vector>

namespace item_service {

/// Implements the item routes on top of a connection pool. Each member
/// function sends exactly one request to a database actor and passes the
/// resulting `http_reply` to the continuation `k`.
///
/// `Self` may be any actor type that can issue asynchronous requests, e.g.,
/// the actor shell of an HTTP responder or an event-based actor.
class item_handler {
public:
  explicit item_handler(database_pool_ptr pool) : pool_(std::move(pool)) {
    // nop
  }

  /// Stores a new item with a freshly generated ID.
  template <class Self, class Continuation>
  void create(Self* self, item_request req, Continuation k) {
    auto value = item{make_item_id(), std::move(req.name),
                      std::move(req.description)};
    self->request(pool_->next(), caf::infinite, create_atom_v, value)
      .then(
        [value, k]() mutable {
          k(make_json_reply(http_status::created, value));
        },
        [k](const caf::error& what) mutable { k(make_error_reply(what)); });
  }

  template <class Self, class Continuation>
  void list(Self* self, Continuation k) {
    self->request(pool_->next(), caf::infinite, list_atom_v)
      .then(
        [k](const std::vector<item>& values) mutable {
          k(make_json_reply(http_status::ok, values));
        },
        [k](const caf::error& what) mutable { k(make_error_reply(what)); });
  }

  /// @pre `id` is in canonical form.
  template <class Self, class Continuation>
  void get(Self* self, std::string id, Continuation k) {
    self->request(pool_->next(), caf::infinite, get_atom_v, std::move(id))
      .then(
        [k](const item& value) mutable {
          k(make_json_reply(http_status::ok, value));
        },
        [k](const caf::error& what) mutable { k(make_error_reply(what)); });
  }

  /// Responds with the ID and the client-supplied fields, regardless of
  /// whether a row with that ID existed.
  /// @pre `id` is in canonical form.
  template <class Self, class Continuation>
  void update(Self* self, std::string id, item_request req, Continuation k) {
    auto value = item{std::move(id), std::move(req.name),
                      std::move(req.description)};
    self->request(pool_->next(), caf::infinite, update_atom_v, value)
      .then(
        [value, k]() mutable { k(make_json_reply(http_status::ok, value)); },
        [k](const caf::error& what) mutable { k(make_error_reply(what)); });
  }

  /// Responds with "Item deleted", regardless of whether a row with that ID
  /// existed.
  /// @pre `id` is in canonical form.
  template <class Self, class Continuation>
  void del(Self* self, std::string id, Continuation k) {
    self->request(pool_->next(), caf::infinite, delete_atom_v, std::move(id))
      .then(
        [k]() mutable {
          k(make_text_reply(http_status::ok, item_deleted_text));
        },
        [k](const caf::error& what) mutable { k(make_error_reply(what)); });
  }

private:
  database_pool_ptr pool_;
};

} // namespace item_service
