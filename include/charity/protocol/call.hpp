#pragma once

#include <cstdint>
#include <string_view>
#include <variant>

#include <charity/protocol/account.hpp>
#include <charity/protocol/origin.hpp>

namespace charity::protocol {

struct donate_call
{
  origin caller;
  std::uint64_t amount = 0;
};

struct allocate_call
{
  origin caller;
  account dest{};
  std::uint64_t amount = 0;
};

// Slashed stake routed to the pot instead of being burned.
struct slash_call
{
  account target{};
  std::uint64_t amount = 0;
};

// Fee withdrawn from a payer and routed to the pot.
struct charge_fee_call
{
  account payer{};
  std::uint64_t amount = 0;
};

using call = std::variant< donate_call, allocate_call, slash_call, charge_fee_call >;

std::string_view call_name( const call& c ) noexcept;

} // namespace charity::protocol
