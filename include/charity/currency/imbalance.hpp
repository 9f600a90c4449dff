#pragma once

#include <cstdint>
#include <system_error>

namespace charity::currency {

struct ledger_interface;

/**
 * Value that has been taken out of the ledger and is owed to some account.
 *
 * A negative imbalance is produced when funds leave an account without being
 * credited anywhere (a fee, a slash) and must be resolved into an account to
 * keep the total issuance consistent. Imbalances can only be moved, never
 * copied. An imbalance that is dropped unresolved is burned.
 */
class negative_imbalance
{
public:
  negative_imbalance() noexcept = default;
  explicit negative_imbalance( std::uint64_t value ) noexcept;
  negative_imbalance( const negative_imbalance& ) = delete;
  negative_imbalance( negative_imbalance&& other ) noexcept;
  ~negative_imbalance() = default;

  negative_imbalance& operator=( const negative_imbalance& ) = delete;
  negative_imbalance& operator=( negative_imbalance&& other ) noexcept;

  std::uint64_t peek() const noexcept;

  /**
   * Absorb another imbalance into this one. On overflow both imbalances are
   * left untouched.
   */
  std::error_code merge( negative_imbalance&& other ) noexcept;

private:
  friend struct ledger_interface;

  std::uint64_t release() noexcept;

  std::uint64_t _value = 0;
};

} // namespace charity::currency
