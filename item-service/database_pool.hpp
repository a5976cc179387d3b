// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "database_actor.hpp"

#include <caf/expected.hpp>
#include <caf/fwd.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace item_service {

class database_pool;

/// A smart pointer to a connection pool.
using database_pool_ptr = std::shared_ptr<database_pool>;

/// A fixed set of database actors, each owning one connection. Every request
/// goes to the next actor in round-robin order. Only `make_database_pool`
/// creates instances, so a pool is never empty.
class database_pool {
public:
  /// Default number of connections.
  static constexpr size_t default_size = 5;

  database_pool(const database_pool&) = delete;

  database_pool& operator=(const database_pool&) = delete;

  /// Returns the actor for the next request. Safe to call concurrently.
  const database_actor& next() noexcept;

  size_t size() const noexcept {
    return workers_.size();
  }

  const std::vector<database_actor>& workers() const noexcept {
    return workers_;
  }

  /// Terminates all database actors, closing their connections.
  void shutdown();

private:
  friend caf::expected<database_pool_ptr>
  make_database_pool(caf::actor_system&, const std::string&, size_t);

  explicit database_pool(std::vector<database_actor> workers);

  std::vector<database_actor> workers_;
  std::atomic<size_t> next_{0};
};

/// Opens `size` connections to `url` and spawns one database actor for each.
/// Fails if `size` is 0 or if any connection cannot be opened.
caf::expected<database_pool_ptr>
make_database_pool(caf::actor_system& sys, const std::string& url,
                   size_t size = database_pool::default_size);

} // namespace item_service
