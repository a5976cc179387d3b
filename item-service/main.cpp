// (c) 2024, Interance GmbH & Co KG.

#include "config.hpp"
#include "database_pool.hpp"
#include "http_server.hpp"
#include "log.hpp"
#include "types.hpp"

#include <caf/actor_system.hpp>
#include <caf/actor_system_config.hpp>
#include <caf/caf_main.hpp>
#include <caf/net/http/with.hpp>
#include <caf/net/middleman.hpp>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <string>
#include <string_view>
#include <thread>

using namespace std::literals;

namespace http = caf::net::http;

namespace {

std::atomic<bool> shutdown_flag;

void set_shutdown_flag(int) {
  shutdown_flag = true;
}

} // namespace

int caf_main(caf::actor_system& sys, const item_service::config& cfg) {
  namespace is = item_service;
  namespace log = item_service::log;
  // Do a regular shutdown for CTRL+C and SIGTERM.
  signal(SIGTERM, set_shutdown_flag);
  signal(SIGINT, set_shutdown_flag);
  // Pick up DATABASE_URL from the .env file unless already set.
  auto env_file = caf::get_or(cfg, "env-file", is::default_env_file);
  if (auto loaded = is::load_env_file(env_file); !loaded)
    log::warning("stopped reading {}: {}", env_file, loaded.error());
  else if (*loaded > 0)
    log::info("read {} variable(s) from {}", *loaded, env_file);
  auto db_url = is::read_database_url();
  if (!db_url) {
    sys.println("*** {}", db_url.error());
    return EXIT_FAILURE;
  }
  // Database setup.
  auto pool_size = caf::get_or(cfg, "pool-size", is::database_pool::default_size);
  auto pool = is::make_database_pool(sys, *db_url, pool_size);
  if (!pool) {
    sys.println("*** failed to create the connection pool: {}", pool.error());
    return EXIT_FAILURE;
  }
  // Read the configuration for the web server.
  auto port = caf::get_or(cfg, "http-port", is::default_port);
  auto addr = caf::get_or(cfg, "bind-address", is::default_bind_address);
  auto max_connections = caf::get_or(cfg, "max-connections",
                                     is::default_max_connections);
  auto max_request_size = caf::get_or(cfg, "max-request-size",
                                      is::default_max_request_size);
  // Start the HTTP server.
  auto impl = std::make_shared<is::http_server>(*pool);
  auto server
    = http::with(sys)
        // Bind to the user-defined address and port.
        .accept(port, std::string{addr})
        // Limit how many clients may be connected at any given time.
        .max_connections(max_connections)
        // Limit the maximum request size.
        .max_request_size(max_request_size)
        // Route for adding a new item. The payload must be a JSON object with
        // the string fields "name" and "description".
        .route("/items", http::method::post,
               [impl](http::responder& res) {
                 log::debug("POST /items, body: {}", res.body());
                 impl->create(res);
               })
        // Route for retrieving all items.
        .route("/items", http::method::get,
               [impl](http::responder& res) {
                 log::debug("GET /items");
                 impl->list(res);
               })
        // Route for retrieving a single item.
        .route("/items/<arg>", http::method::get,
               [impl](http::responder& res, std::string key) {
                 log::debug("GET /items/{}", key);
                 impl->get(res, key);
               })
        // Route for overwriting name and description of an item.
        .route("/items/<arg>", http::method::put,
               [impl](http::responder& res, std::string key) {
                 log::debug("PUT /items/{}, body: {}", key, res.body());
                 impl->update(res, key);
               })
        // Route for deleting an item.
        .route("/items/<arg>", http::method::del,
               [impl](http::responder& res, std::string key) {
                 log::debug("DELETE /items/{}", key);
                 impl->del(res, key);
               })
        // Start the server.
        .start();
  // Report any error to the user.
  if (!server) {
    sys.println("*** unable to run at {}:{}: {}", addr, port, server.error());
    (*pool)->shutdown();
    return EXIT_FAILURE;
  }
  // Wait for CTRL+C or SIGTERM and shut down the server.
  sys.println("*** running at {}:{}, press CTRL+C to terminate the server",
              addr, port);
  while (!shutdown_flag)
    std::this_thread::sleep_for(250ms);
  sys.println("*** shutting down");
  server->dispose();
  (*pool)->shutdown();
  return EXIT_SUCCESS;
}

CAF_MAIN(caf::id_block::item_service, caf::net::middleman)
