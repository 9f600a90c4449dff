#pragma once

#include <system_error>

namespace charity::pot {

enum class pot_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  insufficient_funds,
  insufficient_pot_funds
};

const std::error_category& pot_category() noexcept;

std::error_code make_error_code( pot_errc e );

} // namespace charity::pot

template<>
struct std::is_error_code_enum< charity::pot::pot_errc >: public std::true_type
{};
