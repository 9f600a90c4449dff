#pragma once

#include <expected>
#include <system_error>

namespace charity::config {

enum class config_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  unreadable_file,
  malformed_document,
  missing_field,
  invalid_account,
  invalid_identifier,
  invalid_origin,
  unknown_call
};

const std::error_category& config_category() noexcept;

std::error_code make_error_code( config_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace charity::config

template<>
struct std::is_error_code_enum< charity::config::config_errc >: public std::true_type
{};
