#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>

#include <charity/chronicler/chronicler.hpp>
#include <charity/currency/imbalance.hpp>
#include <charity/currency/ledger_interface.hpp>
#include <charity/pot/error.hpp>
#include <charity/protocol/account.hpp>
#include <charity/protocol/event.hpp>
#include <charity/protocol/origin.hpp>

namespace charity::pot {

constexpr std::size_t identifier_length = 8;

using identifier = std::array< std::byte, identifier_length >;

constexpr identifier make_identifier( const char ( &str )[ identifier_length + 1 ] ) noexcept
{
  identifier id{};
  for( std::size_t i = 0; i < identifier_length; ++i )
    id[ i ] = static_cast< std::byte >( str[ i ] );
  return id;
}

constexpr identifier default_identifier = make_identifier( "Charity!" );

/**
 * The keyless account holding the pot for an identifier.
 */
protocol::account account_id( const identifier& id = default_identifier ) noexcept;

/**
 * A pot of funds held by a keyless account.
 *
 * Anyone can donate to the pot and the runtime can route imbalances into it,
 * but only a privileged origin can allocate funds out of it. The balance
 * itself lives on the currency ledger, this class keeps no copy of it.
 *
 * Every successful operation records exactly one event carrying the pot
 * balance after the operation. A failed operation changes no balance and
 * records nothing.
 */
class ledger final
{
public:
  ledger( currency::ledger_interface& currency, chronicler& events, const identifier& id = default_identifier );
  ledger( const ledger& ) = delete;
  ledger( ledger&& )      = delete;
  ~ledger()               = default;

  ledger& operator=( const ledger& ) = delete;
  ledger& operator=( ledger&& )      = delete;

  const protocol::account& account_id() const noexcept;
  std::uint64_t pot() const noexcept;

  /**
   * Create the pot at genesis by topping it up to the ledger minimum balance.
   */
  std::error_code initialize();

  std::error_code donate( const protocol::origin& origin, std::uint64_t amount );

  /**
   * Allocate funds from the pot to dest. Requires a privileged origin.
   *
   * The whole balance may be allocated. A pot left below the ledger minimum
   * balance is reaped.
   */
  std::error_code allocate( const protocol::origin& origin, const protocol::account& dest, std::uint64_t amount );

  /**
   * Absorb an imbalance from elsewhere in the runtime. Only reachable from
   * trusted runtime code, so there is no origin to check. Zero imbalances are
   * ignored.
   */
  std::error_code absorb( currency::negative_imbalance&& imbalance );

private:
  void deposit_event( protocol::event_data&& data, std::vector< protocol::account >&& impacted );

  currency::ledger_interface& _currency;
  chronicler& _chronicler;
  protocol::account _account;
};

} // namespace charity::pot
