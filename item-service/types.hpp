// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include <caf/type_id.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace item_service {

struct item;
enum class ec : uint8_t;

} // namespace item_service

CAF_BEGIN_TYPE_ID_BLOCK(item_service, first_custom_type_id)

  CAF_ADD_TYPE_ID(item_service, (item_service::ec))
  CAF_ADD_TYPE_ID(item_service, (item_service::item))
  CAF_ADD_TYPE_ID(item_service, (std::vector<item_service::item>))

  // Used to insert a new item.
  CAF_ADD_ATOM(item_service, item_service, create_atom)

  // Used to fetch all items.
  CAF_ADD_ATOM(item_service, item_service, list_atom)

  // Used to fetch a single item by its ID.
  CAF_ADD_ATOM(item_service, item_service, get_atom)

  // Used to overwrite name and description of an item.
  CAF_ADD_ATOM(item_service, item_service, update_atom)

  // Used to remove an item.
  CAF_ADD_ATOM(item_service, item_service, delete_atom)

CAF_END_TYPE_ID_BLOCK(item_service)
