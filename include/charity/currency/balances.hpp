#pragma once

#include <cstdint>
#include <map>

#include <charity/currency/ledger_interface.hpp>

namespace charity::currency {

/**
 * In memory balance ledger.
 *
 * An account exists while it holds a non-zero balance of at least the
 * existential deposit. An account that would fall below it is reaped and its
 * remaining dust is burned. Total issuance is always the sum of all balances.
 */
class balances final: public ledger_interface
{
public:
  explicit balances( std::uint64_t existential_deposit = 0 ) noexcept;
  balances( const balances& ) = delete;
  balances( balances&& )      = delete;
  ~balances() override        = default;

  balances& operator=( const balances& ) = delete;
  balances& operator=( balances&& )      = delete;

  std::uint64_t minimum_balance() const noexcept override;
  std::uint64_t total_issuance() const noexcept override;

  std::uint64_t free_balance( const protocol::account& account ) const noexcept override;
  bool exists( const protocol::account& account ) const noexcept override;

  std::error_code transfer( const protocol::account& from,
                            const protocol::account& to,
                            std::uint64_t value,
                            existence_requirement requirement ) override;

  std::error_code ensure_minimum_balance( const protocol::account& account, std::uint64_t value ) override;
  std::error_code deposit_creating( const protocol::account& account, std::uint64_t value ) override;
  std::error_code resolve_creating( const protocol::account& account, negative_imbalance&& imbalance ) override;

  result< negative_imbalance >
  withdraw( const protocol::account& account, std::uint64_t value, existence_requirement requirement ) override;

  negative_imbalance slash( const protocol::account& account, std::uint64_t value ) override;

  std::size_t account_count() const noexcept;

private:
  bool can_exist( std::uint64_t value ) const noexcept;
  void set_balance( const protocol::account& account, std::uint64_t value );

  std::map< protocol::account, std::uint64_t > _accounts;
  std::uint64_t _existential_deposit;
  std::uint64_t _total_issuance = 0;
};

} // namespace charity::currency
