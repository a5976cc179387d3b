// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "ec.hpp"
#include "item.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

extern "C" {

struct sqlite3;

} // extern "C"

namespace item_service {

/// A single connection to the SQLite database that stores the items.
class database {
public:
  /// Milliseconds a statement waits for a lock held by another connection.
  static constexpr int busy_timeout_ms = 5'000;

  /// @param url Either a file path, `sqlite://<path>`, `sqlite:<path>` or an
  ///            SQLite `file:` URI.
  explicit database(std::string url);

  database(const database&) = delete;

  database& operator=(const database&) = delete;

  ~database();

  /// Returns the filename or URI that SQLite receives for `url`.
  static std::string_view to_filename(std::string_view url) noexcept;

  /// Opens the connection and creates the table if it does not exist.
  /// @returns `caf::error{}` on success, an error code otherwise.
  [[nodiscard]] caf::error open();

  /// Retrieves an item from the database.
  /// @returns the item if found, `ec::no_such_item` if no row matches or
  ///          `ec::database_inaccessible` if the query failed.
  [[nodiscard]] caf::expected<item> get(const std::string& id);

  /// Retrieves all items in unspecified order.
  [[nodiscard]] caf::expected<std::vector<item>> list();

  /// Inserts a new item into the database.
  /// @returns `ec::nil` on success, an error code otherwise.
  [[nodiscard]] ec insert(const item& new_item);

  /// Overwrites name and description of the item with the same ID.
  /// @returns the number of updated rows (0 or 1).
  [[nodiscard]] caf::expected<size_t> update(const item& value);

  /// Deletes an item from the database.
  /// @returns the number of deleted rows (0 or 1).
  [[nodiscard]] caf::expected<size_t> del(const std::string& id);

private:
  std::string url_;
  sqlite3* db_ = nullptr;
};

/// A smart pointer to an item database.
using database_ptr = std::shared_ptr<database>;

} // namespace item_service
