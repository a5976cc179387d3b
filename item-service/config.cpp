// (c) 2024, Interance GmbH & Co KG.

#include "config.hpp"

#include "ec.hpp"

#include <cstdlib>
#include <fstream>

namespace item_service {

namespace {

constexpr std::string_view whitespace = " \t\r";

std::string_view trim(std::string_view str) {
  auto first = str.find_first_not_of(whitespace);
  if (first == std::string_view::npos)
    return {};
  auto last = str.find_last_not_of(whitespace);
  return str.substr(first, last - first + 1);
}

// Removes one pair of matching single or double quotes.
std::string_view unquote(std::string_view str) {
  if (str.size() >= 2 && (str.front() == '"' || str.front() == '\'')
      && str.back() == str.front())
    return str.substr(1, str.size() - 2);
  return str;
}

} // namespace

config::config() {
  opt_group{custom_options_, "global"}
    .add<uint16_t>("http-port,p", "port to listen for HTTP connections")
    .add<std::string>("bind-address,b", "address for the HTTP server")
    .add<size_t>("pool-size,s", "number of database connections")
    .add<size_t>("max-connections,m", "limit for concurrent clients")
    .add<size_t>("max-request-size,r", "limit for single request size")
    .add<std::string>("env-file,e", "file with environment variables");
}

caf::expected<size_t> load_env_file(const std::string& path) {
  std::ifstream in{path};
  if (!in)
    return size_t{0};
  size_t count = 0;
  size_t line_no = 0;
  std::string line;
  while (std::getline(in, line)) {
    ++line_no;
    auto str = trim(line);
    if (str.empty() || str.front() == '#')
      continue;
    if (str.substr(0, 7) == "export ")
      str = trim(str.substr(7));
    auto sep = str.find('=');
    if (sep == std::string_view::npos || sep == 0)
      return caf::make_error(ec::invalid_argument,
                             path + ":" + std::to_string(line_no)
                               + ": expected KEY=VALUE");
    auto key = std::string{trim(str.substr(0, sep))};
    auto value = std::string{unquote(trim(str.substr(sep + 1)))};
    ++count;
    // Variables from the process environment take precedence.
    if (setenv(key.c_str(), value.c_str(), 0) != 0)
      return caf::make_error(ec::invalid_argument,
                             path + ":" + std::to_string(line_no)
                               + ": invalid variable name");
  }
  return count;
}

caf::expected<std::string> read_database_url() {
  auto name = std::string{database_url_variable};
  auto* value = std::getenv(name.c_str());
  if (value == nullptr || *value == '\0')
    return caf::make_error(ec::missing_configuration,
                           name + " must be set");
  return std::string{value};
}

} // namespace item_service
