#pragma once

#include <charity/chronicler/chronicler.hpp>
#include <charity/config/genesis.hpp>
#include <charity/controller/error.hpp>
#include <charity/currency/balances.hpp>
#include <charity/pot/pot.hpp>
#include <charity/protocol.hpp>

#include <cstdint>
#include <memory>
#include <system_error>
#include <vector>

namespace charity::controller {

class controller
{
public:
  controller();
  controller( const controller& ) = delete;
  controller( controller&& )      = delete;
  ~controller();

  controller& operator=( const controller& ) = delete;
  controller& operator=( controller&& )      = delete;

  std::error_code open( const config::genesis& data );
  void close();

  /**
   * Apply a call against the ledger.
   *
   * Slashes and fees are only taken from an account when the pot can receive
   * them, so a failed call never debits anyone.
   */
  std::error_code apply( const protocol::call& call );

  protocol::account pot_account() const noexcept;
  std::uint64_t pot_balance() const noexcept;
  std::uint64_t free_balance( const protocol::account& account ) const noexcept;
  std::uint64_t total_issuance() const noexcept;

  const std::vector< protocol::event >& events() const noexcept;

private:
  std::error_code apply( const protocol::slash_call& slash );
  std::error_code apply( const protocol::charge_fee_call& fee );
  std::error_code ensure_absorbable( std::uint64_t value ) const;

  chronicler _chronicler;
  std::unique_ptr< currency::balances > _balances;
  std::unique_ptr< pot::ledger > _pot;
  pot::identifier _identifier = pot::default_identifier;
};

} // namespace charity::controller
