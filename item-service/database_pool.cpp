// (c) 2024, Interance GmbH & Co KG.

#include "database_pool.hpp"

#include "ec.hpp"
#include "log.hpp"

#include <caf/actor_system.hpp>
#include <caf/exit_reason.hpp>
#include <caf/send.hpp>

namespace item_service {

database_pool::database_pool(std::vector<database_actor> workers)
  : workers_(std::move(workers)) {
  // nop
}

const database_actor& database_pool::next() noexcept {
  auto index = next_.fetch_add(1, std::memory_order_relaxed);
  return workers_[index % workers_.size()];
}

void database_pool::shutdown() {
  for (auto& worker : workers_)
    caf::anon_send_exit(worker, caf::exit_reason::user_shutdown);
}

caf::expected<database_pool_ptr>
make_database_pool(caf::actor_system& sys, const std::string& url,
                   size_t size) {
  if (size == 0)
    return caf::make_error(ec::invalid_argument, "pool size must be positive");
  // Open all connections first to avoid spawning actors for a broken URL.
  std::vector<database_ptr> connections;
  connections.reserve(size);
  for (size_t i = 0; i < size; ++i) {
    auto db = std::make_shared<database>(url);
    if (auto err = db->open()) {
      log::error("failed to open connection {} of {}: {}", i + 1, size, err);
      return err;
    }
    connections.emplace_back(std::move(db));
  }
  std::vector<database_actor> workers;
  workers.reserve(size);
  for (auto& db : connections)
    workers.emplace_back(spawn_database_actor(sys, std::move(db)));
  log::info("opened {} database connection(s)", size);
  return database_pool_ptr{new database_pool(std::move(workers))};
}

} // namespace item_service
