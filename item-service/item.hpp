// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include <string>

namespace item_service {

/// A single row of the `items` table.
struct item {
  /// Canonical UUID string, e.g., "6f1c3b7e-4a0d-4c8e-9d0a-2b6f1e3c5a7d".
  std::string id;
  std::string name;
  std::string description;
};

template <class Inspector>
bool inspect(Inspector& f, item& x) {
  return f.object(x).fields(f.field("id", x.id), f.field("name", x.name),
                            f.field("description", x.description));
}

/// The client-supplied part of an item for create and update requests.
struct item_request {
  std::string name;
  std::string description;
};

template <class Inspector>
bool inspect(Inspector& f, item_request& x) {
  return f.object(x).fields(f.field("name", x.name),
                            f.field("description", x.description));
}

} // namespace item_service
