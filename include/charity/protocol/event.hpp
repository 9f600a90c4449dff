#pragma once

#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

#include <charity/protocol/account.hpp>

namespace charity::protocol {

struct donation_received
{
  account donor{};
  std::uint64_t amount      = 0;
  std::uint64_t pot_balance = 0;

  bool operator==( const donation_received& ) const = default;
};

struct imbalance_absorbed
{
  std::uint64_t amount      = 0;
  std::uint64_t pot_balance = 0;

  bool operator==( const imbalance_absorbed& ) const = default;
};

struct funds_allocated
{
  account dest{};
  std::uint64_t amount      = 0;
  std::uint64_t pot_balance = 0;

  bool operator==( const funds_allocated& ) const = default;
};

using event_data = std::variant< donation_received, imbalance_absorbed, funds_allocated >;

struct event
{
  std::uint32_t sequence = 0;
  account source{};
  event_data data;
  std::vector< account > impacted;
};

std::string_view event_name( const event_data& data ) noexcept;

} // namespace charity::protocol
