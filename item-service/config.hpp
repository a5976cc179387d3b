// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include <caf/actor_system_config.hpp>
#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace item_service {

/// Name of the environment variable with the database URL.
constexpr std::string_view database_url_variable = "DATABASE_URL";

constexpr std::string_view default_env_file = ".env";

constexpr std::string_view default_bind_address = "127.0.0.1";

constexpr auto default_port = uint16_t{8080};

constexpr auto default_max_connections = size_t{128};

constexpr auto default_max_request_size = uint32_t{65'536};

/// Command line and config file options of the item service.
struct config : caf::actor_system_config {
  config();
};

/// Loads `KEY=VALUE` lines from `path` into the environment without
/// overriding variables that are already set. A missing file is not an error.
/// @returns the number of lines read or `ec::invalid_argument` for the first
///          malformed line.
caf::expected<size_t> load_env_file(const std::string& path);

/// Reads the database URL from the environment.
/// @returns `ec::missing_configuration` if the variable is unset or empty.
caf::expected<std::string> read_database_url();

} // namespace item_service
