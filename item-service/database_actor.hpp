// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "database.hpp"
#include "item.hpp"
#include "types.hpp"

#include <caf/fwd.hpp>
#include <caf/result.hpp>
#include <caf/typed_actor.hpp>

#include <string>
#include <vector>

namespace item_service {

// --(database-actor-begin)--
struct database_trait {
  using signatures = caf::type_list<
    // Inserts a new item.
    caf::result<void>(create_atom, item),
    // Retrieves all items.
    caf::result<std::vector<item>>(list_atom),
    // Retrieves a single item by ID.
    caf::result<item>(get_atom, std::string),
    // Overwrites name and description of an item. Succeeds even if no row
    // matches the ID.
    caf::result<void>(update_atom, item),
    // Deletes an item. Succeeds even if no row matches the ID.
    caf::result<void>(delete_atom, std::string)>;
};

using database_actor = caf::typed_actor<database_trait>;
// --(database-actor-end)--

/// Spawns a detached actor that owns `db`. The connection must be open.
database_actor spawn_database_actor(caf::actor_system& sys, database_ptr db);

} // namespace item_service
