#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include <charity/config/error.hpp>
#include <charity/pot/pot.hpp>
#include <charity/protocol/account.hpp>
#include <charity/protocol/call.hpp>
#include <charity/protocol/origin.hpp>

namespace charity::config {

struct genesis_balance
{
  protocol::account account{};
  std::uint64_t amount = 0;
};

struct genesis
{
  std::uint64_t existential_deposit = 1;
  pot::identifier pot_identifier    = pot::default_identifier;
  bool initialize_pot               = true;
  std::vector< genesis_balance > balances;
};

// A 33 byte account in hex
result< protocol::account > parse_account( std::string_view sv );

// "root" or "privileged", "system", or a hex account for a signed origin
result< protocol::origin > parse_origin( std::string_view sv );

// Exactly eight characters
result< pot::identifier > parse_identifier( std::string_view sv );

result< genesis > parse_genesis( const YAML::Node& node );
result< genesis > load_genesis( const std::filesystem::path& p );

result< std::vector< protocol::call > > parse_calls( const YAML::Node& node );
result< std::vector< protocol::call > > load_calls( const std::filesystem::path& p );

} // namespace charity::config
