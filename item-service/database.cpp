// (c) 2024, Interance GmbH & Co KG.

#include "database.hpp"

#include <caf/error.hpp>

#include <sqlite3.h>

namespace item_service {

namespace {

struct stmt_deleter {
  void operator()(sqlite3_stmt* stmt) const noexcept {
    sqlite3_finalize(stmt);
  }
};

using stmt_ptr = std::unique_ptr<sqlite3_stmt, stmt_deleter>;

stmt_ptr prepare(sqlite3* db, const char* query) {
  if (db == nullptr)
    return nullptr;
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db, query, -1, &stmt, nullptr) != SQLITE_OK) {
    sqlite3_finalize(stmt);
    return nullptr;
  }
  return stmt_ptr{stmt};
}

bool bind_text(sqlite3_stmt* stmt, int index, const std::string& str) {
  return sqlite3_bind_text(stmt, index, str.data(),
                           static_cast<int>(str.size()), SQLITE_STATIC)
         == SQLITE_OK;
}

// Columns are NOT NULL, but a pre-existing table may not enforce that.
std::string column_text(sqlite3_stmt* stmt, int column) {
  auto str = sqlite3_column_text(stmt, column);
  if (str == nullptr)
    return {};
  auto len = sqlite3_column_bytes(stmt, column);
  return std::string{reinterpret_cast<const char*>(str),
                     static_cast<size_t>(len)};
}

item read_item(sqlite3_stmt* stmt) {
  item result;
  result.id = column_text(stmt, 0);
  result.name = column_text(stmt, 1);
  result.description = column_text(stmt, 2);
  return result;
}

} // namespace

database::database(std::string url) : url_(std::move(url)) {
  // nop
}

database::~database() {
  if (db_ != nullptr)
    sqlite3_close(db_);
}

std::string_view database::to_filename(std::string_view url) noexcept {
  using namespace std::literals;
  // Note: check the longer prefix first since it contains the shorter one.
  for (auto prefix : {"sqlite://"sv, "sqlite:"sv}) {
    if (url.substr(0, prefix.size()) == prefix)
      return url.substr(prefix.size());
  }
  return url;
}

caf::error database::open() {
  // Open the database file (or URI).
  auto filename = std::string{to_filename(url_)};
  if (filename.empty())
    return caf::make_error(ec::invalid_argument, "empty database URL");
  auto flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI;
  if (sqlite3_open_v2(filename.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    auto msg = db_ != nullptr ? std::string{sqlite3_errmsg(db_)}
                              : std::string{"out of memory"};
    sqlite3_close(db_);
    db_ = nullptr;
    return caf::make_error(ec::database_inaccessible, std::move(msg));
  }
  sqlite3_busy_timeout(db_, busy_timeout_ms);
  // Create the table if it does not exist. IDs are UUIDs and compare without
  // regard to case.
  const char* create_table = "CREATE TABLE IF NOT EXISTS items ("
                             "id TEXT PRIMARY KEY NOT NULL COLLATE NOCASE,"
                             "name TEXT NOT NULL,"
                             "description TEXT NOT NULL)";
  char* err_msg = nullptr;
  if (sqlite3_exec(db_, create_table, nullptr, nullptr, &err_msg)
      != SQLITE_OK) {
    auto msg = err_msg != nullptr ? std::string{err_msg}
                                  : std::string{sqlite3_errmsg(db_)};
    sqlite3_free(err_msg);
    return caf::make_error(ec::database_inaccessible, std::move(msg));
  }
  return caf::error{};
}

caf::expected<item> database::get(const std::string& id) {
  const char* get_query = R"_(
    SELECT id, name, description
    FROM items WHERE id = ? COLLATE NOCASE
  )_";
  auto stmt = prepare(db_, get_query);
  if (!stmt || !bind_text(stmt.get(), 1, id))
    return caf::make_error(ec::database_inaccessible);
  switch (sqlite3_step(stmt.get())) {
    case SQLITE_ROW:
      return read_item(stmt.get());
    case SQLITE_DONE:
      return caf::make_error(ec::no_such_item);
    default:
      return caf::make_error(ec::database_inaccessible,
                             std::string{sqlite3_errmsg(db_)});
  }
}

caf::expected<std::vector<item>> database::list() {
  const char* list_query = "SELECT id, name, description FROM items";
  auto stmt = prepare(db_, list_query);
  if (!stmt)
    return caf::make_error(ec::database_inaccessible);
  std::vector<item> result;
  for (;;) {
    switch (sqlite3_step(stmt.get())) {
      case SQLITE_ROW:
        result.emplace_back(read_item(stmt.get()));
        break;
      case SQLITE_DONE:
        return result;
      default:
        return caf::make_error(ec::database_inaccessible,
                               std::string{sqlite3_errmsg(db_)});
    }
  }
}

ec database::insert(const item& new_item) {
  const char* insert_query = R"_(
    INSERT INTO items (id, name, description)
    VALUES (?, ?, ?)
  )_";
  auto stmt = prepare(db_, insert_query);
  if (!stmt)
    return ec::database_inaccessible;
  if (!bind_text(stmt.get(), 1, new_item.id)
      || !bind_text(stmt.get(), 2, new_item.name)
      || !bind_text(stmt.get(), 3, new_item.description))
    return ec::database_inaccessible;
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    if (sqlite3_errcode(db_) == SQLITE_CONSTRAINT)
      return ec::key_already_exists;
    return ec::database_inaccessible;
  }
  return ec::nil;
}

caf::expected<size_t> database::update(const item& value) {
  const char* update_query = R"_(
    UPDATE items
    SET name = ?, description = ?
    WHERE id = ? COLLATE NOCASE
  )_";
  auto stmt = prepare(db_, update_query);
  if (!stmt)
    return caf::make_error(ec::database_inaccessible);
  if (!bind_text(stmt.get(), 1, value.name)
      || !bind_text(stmt.get(), 2, value.description)
      || !bind_text(stmt.get(), 3, value.id))
    return caf::make_error(ec::database_inaccessible);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    return caf::make_error(ec::database_inaccessible,
                           std::string{sqlite3_errmsg(db_)});
  return static_cast<size_t>(sqlite3_changes(db_));
}

caf::expected<size_t> database::del(const std::string& id) {
  const char* del_query = "DELETE FROM items WHERE id = ? COLLATE NOCASE";
  auto stmt = prepare(db_, del_query);
  if (!stmt || !bind_text(stmt.get(), 1, id))
    return caf::make_error(ec::database_inaccessible);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    return caf::make_error(ec::database_inaccessible,
                           std::string{sqlite3_errmsg(db_)});
  return static_cast<size_t>(sqlite3_changes(db_));
}

} // namespace item_service
