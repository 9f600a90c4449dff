#pragma once

#include <expected>
#include <system_error>

namespace charity::currency {

enum class currency_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  insufficient_balance,
  keep_alive,
  existential_deposit,
  overflow
};

const std::error_category& currency_category() noexcept;

std::error_code make_error_code( currency_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace charity::currency

template<>
struct std::is_error_code_enum< charity::currency::currency_errc >: public std::true_type
{};
