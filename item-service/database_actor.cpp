// (c) 2024, Interance GmbH & Co KG.

#include "database_actor.hpp"

#include "ec.hpp"
#include "item.hpp"
#include "log.hpp"
#include "types.hpp"

#include <caf/actor_from_state.hpp>
#include <caf/actor_system.hpp>
#include <caf/error.hpp>

namespace item_service {

namespace {

struct database_actor_state {
  database_actor_state(database_actor::pointer self_ptr, database_ptr db_ptr)
    : self(self_ptr), db(std::move(db_ptr)) {
    // nop
  }

  database_actor::behavior_type make_behavior();

  database_actor::pointer self;
  database_ptr db;
};

database_actor::behavior_type database_actor_state::make_behavior() {
  return {
    [this](create_atom, const item& value) -> caf::result<void> {
      if (auto err = db->insert(value); err != ec::nil) {
        log::warning("failed to insert item {}: {}", value.id, err);
        return {caf::make_error(err)};
      }
      return caf::unit;
    },
    [this](list_atom) -> caf::result<std::vector<item>> {
      auto values = db->list();
      if (!values) {
        log::warning("failed to list items: {}", values.error());
        return {std::move(values.error())};
      }
      return {std::move(*values)};
    },
    [this](get_atom, const std::string& id) -> caf::result<item> {
      auto value = db->get(id);
      if (!value) {
        if (value.error() != ec::no_such_item)
          log::warning("failed to read item {}: {}", id, value.error());
        return {std::move(value.error())};
      }
      return {std::move(*value)};
    },
    [this](update_atom, const item& value) -> caf::result<void> {
      auto count = db->update(value);
      if (!count) {
        log::warning("failed to update item {}: {}", value.id, count.error());
        return {std::move(count.error())};
      }
      if (*count == 0)
        log::debug("update matched no item with ID {}", value.id);
      return caf::unit;
    },
    [this](delete_atom, const std::string& id) -> caf::result<void> {
      auto count = db->del(id);
      if (!count) {
        log::warning("failed to delete item {}: {}", id, count.error());
        return {std::move(count.error())};
      }
      if (*count == 0)
        log::debug("delete matched no item with ID {}", id);
      return caf::unit;
    },
  };
}

} // namespace

database_actor spawn_database_actor(caf::actor_system& sys, database_ptr db) {
  // Note: the actor uses a blocking API (SQLite3) and thus should run in its
  //       own thread.
  using caf::actor_from_state;
  using caf::detached;
  return sys.spawn<detached>(actor_from_state<database_actor_state>,
                             std::move(db));
}

} // namespace item_service
