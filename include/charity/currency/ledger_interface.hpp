#pragma once

#include <cstdint>
#include <system_error>

#include <charity/currency/error.hpp>
#include <charity/currency/imbalance.hpp>
#include <charity/protocol/account.hpp>

namespace charity::currency {

enum class existence_requirement : std::uint8_t
{
  keep_alive,
  allow_death
};

/**
 * The balance ledger that accounts, including the pot, live on.
 *
 * All mutating calls are all-or-nothing: when they return an error no
 * balance has changed.
 */
struct ledger_interface
{
  ledger_interface()                          = default;
  ledger_interface( const ledger_interface& ) = delete;
  ledger_interface( ledger_interface&& )      = delete;
  virtual ~ledger_interface()                 = default;

  ledger_interface& operator=( const ledger_interface& ) = delete;
  ledger_interface& operator=( ledger_interface&& )      = delete;

  // The smallest balance an account may hold and still exist.
  virtual std::uint64_t minimum_balance() const noexcept = 0;
  virtual std::uint64_t total_issuance() const noexcept  = 0;

  virtual std::uint64_t free_balance( const protocol::account& account ) const noexcept = 0;
  virtual bool exists( const protocol::account& account ) const noexcept               = 0;

  virtual std::error_code transfer( const protocol::account& from,
                                    const protocol::account& to,
                                    std::uint64_t value,
                                    existence_requirement requirement ) = 0;

  virtual std::error_code ensure_minimum_balance( const protocol::account& account, std::uint64_t value ) = 0;

  virtual std::error_code deposit_creating( const protocol::account& account, std::uint64_t value ) = 0;

  /**
   * Credit an imbalance to an account, creating the account if needed.
   *
   * The imbalance is consumed whether or not the credit succeeds.
   */
  virtual std::error_code resolve_creating( const protocol::account& account, negative_imbalance&& imbalance ) = 0;

  virtual result< negative_imbalance >
  withdraw( const protocol::account& account, std::uint64_t value, existence_requirement requirement ) = 0;

  /**
   * Remove up to value from an account. Never fails, the returned imbalance
   * holds what was actually taken.
   */
  virtual negative_imbalance slash( const protocol::account& account, std::uint64_t value ) = 0;

protected:
  static std::uint64_t consume( negative_imbalance& imbalance ) noexcept
  {
    return imbalance.release();
  }
};

} // namespace charity::currency
